#ifndef AGENTCHAT_TRANSCRIPT_HPP
#define AGENTCHAT_TRANSCRIPT_HPP

#include <agentchat/types.hpp>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace agentchat
{

/**
 * One persisted conversation log record: {"type", "data", "timestamp"}.
 *
 * Live turns and restored conversations both feed the reducer with these,
 * so replaying a stored log rebuilds exactly the transcript seen live.
 * Recognized types: userInput, output, thinking, toolUse, toolResult,
 * updateTokens, error; sessionInfo, compacting and compactBoundary are kept
 * in the log but produce no transcript entry.
 */
struct LogEntry
{
    std::string type;
    json data;
    std::string timestamp;

    json to_json() const;

    // Accepts "messageType" as an alias of "type"
    static LogEntry from_json(const json& j);
};

// Build a log entry stamped with the current time
LogEntry make_log_entry(const std::string& type, json data);

enum class ToolStatus
{
    Executing,
    Completed,
    Failed
};

const char* to_string(ToolStatus status);

struct UserEntry
{
    std::string text;
};

struct AssistantEntry
{
    std::string content;
    bool streaming = false;
    std::optional<UsageInfo> usage;
};

struct ThinkingEntry
{
    std::string content;
};

struct ToolUseEntry
{
    std::string tool_use_id;
    std::string tool_name;
    json input;
    ToolStatus status = ToolStatus::Executing;
    std::optional<long long> duration_ms;
    std::optional<long long> tokens;
};

struct ToolResultEntry
{
    std::string tool_use_id;
    std::string tool_name;
    std::string content;
    bool is_error = false;
};

struct ErrorEntry
{
    std::string message;
};

using EntryBody =
    std::variant<UserEntry, AssistantEntry, ThinkingEntry, ToolUseEntry, ToolResultEntry, ErrorEntry>;

struct ConversationEntry
{
    std::string id;
    std::string timestamp;
    EntryBody body;
};

using Transcript = std::vector<ConversationEntry>;

json entry_to_json(const ConversationEntry& entry);
json transcript_to_json(const Transcript& transcript);

/**
 * Folds log entries into a transcript.
 *
 * At most one assistant entry is "open" (streaming) at a time; any
 * non-assistant entry closes it. Tool results are paired with their tool-use
 * entry by invocation id, and a tool-use status leaves Executing at most once.
 * Entry ids are derived from arrival order, so applying the same sequence
 * always yields the same transcript.
 */
class ConversationReducer
{
  public:
    void apply(const LogEntry& entry);

    // End of stream: close any still-open assistant entry
    void finish();

    void reset();

    const Transcript& transcript() const
    {
        return entries_;
    }

    bool has_open_assistant() const
    {
        return open_assistant_.has_value();
    }

    // Run a fresh reducer over a stored log
    static Transcript replay(const std::vector<LogEntry>& log);

  private:
    void on_user_input(const LogEntry& entry);
    void on_output(const LogEntry& entry);
    void on_thinking(const LogEntry& entry);
    void on_tool_use(const LogEntry& entry);
    void on_tool_result(const LogEntry& entry);
    void on_token_usage(const LogEntry& entry);
    void on_error(const LogEntry& entry);

    void close_open_assistant();
    AssistantEntry* open_entry();
    size_t append(const LogEntry& source, EntryBody body);

    Transcript entries_;
    std::optional<size_t> open_assistant_;
    std::optional<UsageInfo> pending_usage_;
    std::map<std::string, size_t> tool_index_;
    size_t next_id_ = 0;
};

} // namespace agentchat

#endif // AGENTCHAT_TRANSCRIPT_HPP
