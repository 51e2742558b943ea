#ifndef AGENTCHAT_ERRORS_HPP
#define AGENTCHAT_ERRORS_HPP

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace agentchat
{

// Base exception
class AgentChatError : public std::runtime_error
{
  public:
    explicit AgentChatError(const std::string& message) : std::runtime_error(message) {}
};

// Agent binary missing, not allow-listed, or failing its integrity check
class AgentNotInstalledError : public AgentChatError
{
  public:
    explicit AgentNotInstalledError(const std::string& message) : AgentChatError(message) {}
};

// Connection error
class AgentConnectionError : public AgentChatError
{
  public:
    explicit AgentConnectionError(const std::string& message) : AgentChatError(message) {}
};

// Process error
class ProcessError : public AgentChatError
{
  public:
    ProcessError(const std::string& message, int exit_code)
        : AgentChatError(message), exit_code_(exit_code)
    {
    }

    int exit_code() const
    {
        return exit_code_;
    }

  private:
    int exit_code_;
};

// Agent rejected the run because the user is not logged in
class LoginRequiredError : public ProcessError
{
  public:
    LoginRequiredError(const std::string& message, int exit_code)
        : ProcessError(message, exit_code)
    {
    }
};

// Another conversation currently owns the agent process
class SchedulerBusyError : public AgentChatError
{
  public:
    explicit SchedulerBusyError(const std::string& message) : AgentChatError(message) {}
};

// JSON decode error
class JSONDecodeError : public AgentChatError
{
  public:
    explicit JSONDecodeError(const std::string& message) : AgentChatError(message) {}
};

// Message parse error
class MessageParseError : public AgentChatError
{
  public:
    explicit MessageParseError(const std::string& message)
        : AgentChatError(message), data_(nullptr) {}

    MessageParseError(const std::string& message, const nlohmann::json& data)
        : AgentChatError(message), data_(std::make_shared<nlohmann::json>(data)) {}

    // Get the optional data associated with the parse error
    const nlohmann::json* data() const
    {
        return data_.get();
    }

  private:
    std::shared_ptr<nlohmann::json> data_;
};

// Categories reported on the supervisor's error channel
enum class ErrorCategory
{
    AgentNotInstalled,
    LoginRequired,
    ProcessError
};

const char* to_string(ErrorCategory category);

/**
 * A run failure delivered as a value across the reader thread boundary.
 *
 * `message` is the diagnostic text forwarded verbatim (possibly empty for an
 * unexpected close). `hint` carries the advisory shown for permission friction
 * when auto-approve is off.
 */
struct SessionError
{
    ErrorCategory category = ErrorCategory::ProcessError;
    std::string message;
    int exit_code = 0;
    std::optional<std::string> hint;
};

// Classify diagnostic text captured from the agent's stderr
SessionError classify_diagnostic(const std::string& diagnostic, int exit_code, bool auto_approve);

// Rethrow a SessionError as the matching exception type
void throw_session_error(const SessionError& error);

} // namespace agentchat

#endif // AGENTCHAT_ERRORS_HPP
