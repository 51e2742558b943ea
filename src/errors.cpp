#include <agentchat/errors.hpp>

namespace agentchat
{

namespace
{
bool contains_any(const std::string& text, std::initializer_list<const char*> needles)
{
    for (const char* needle : needles)
        if (text.find(needle) != std::string::npos)
            return true;
    return false;
}
} // namespace

const char* to_string(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::AgentNotInstalled:
        return "agent_not_installed";
    case ErrorCategory::LoginRequired:
        return "login_required";
    case ErrorCategory::ProcessError:
        return "process_error";
    }
    return "process_error";
}

SessionError classify_diagnostic(const std::string& diagnostic, int exit_code, bool auto_approve)
{
    SessionError error;
    error.message = diagnostic;
    error.exit_code = exit_code;

    if (contains_any(diagnostic, {"ENOENT", "command not found"}))
    {
        error.category = ErrorCategory::AgentNotInstalled;
    }
    else if (contains_any(diagnostic, {"authentication", "login", "API key", "unauthorized", "401"}))
    {
        error.category = ErrorCategory::LoginRequired;
    }
    else
    {
        error.category = ErrorCategory::ProcessError;
        if (!auto_approve && contains_any(diagnostic, {"permission", "denied"}))
            error.hint = "Tip: Enable YOLO mode in Settings to skip permission prompts.";
    }

    return error;
}

void throw_session_error(const SessionError& error)
{
    switch (error.category)
    {
    case ErrorCategory::AgentNotInstalled:
        throw AgentNotInstalledError(error.message);
    case ErrorCategory::LoginRequired:
        throw LoginRequiredError(error.message, error.exit_code);
    case ErrorCategory::ProcessError:
        break;
    }
    throw ProcessError(error.message, error.exit_code);
}

} // namespace agentchat
