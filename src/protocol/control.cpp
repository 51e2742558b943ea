#include <agentchat/permissions.hpp>
#include <agentchat/protocol/control.hpp>

namespace agentchat
{
namespace protocol
{

const std::set<std::string> APPROVAL_EXEMPT_TOOLS = {"AskUserQuestion"};

PendingControlRequest ControlChannel::register_request(const ControlRequestEvent& event)
{
    PendingControlRequest request;
    request.request_id = event.request_id;
    request.tool_name = event.tool_name;
    request.input = event.input;
    request.tool_use_id = event.tool_use_id;
    request.suggestions = event.permission_suggestions;
    request.decision_reason = event.decision_reason;
    request.blocked_path = event.blocked_path;

    if (event.tool_name == "Bash" && event.input.is_object() && event.input.contains("command") &&
        event.input["command"].is_string())
    {
        request.pattern = generalize_command(event.input["command"].get<std::string>());
    }

    std::lock_guard<std::mutex> lock(requests_mutex_);
    pending_requests_[request.request_id] = request;
    return request;
}

std::optional<PendingControlRequest> ControlChannel::take(const std::string& request_id)
{
    std::lock_guard<std::mutex> lock(requests_mutex_);

    auto it = pending_requests_.find(request_id);
    if (it == pending_requests_.end())
        return std::nullopt;

    PendingControlRequest request = std::move(it->second);
    pending_requests_.erase(it);
    return request;
}

bool ControlChannel::is_pending(const std::string& request_id) const
{
    std::lock_guard<std::mutex> lock(requests_mutex_);
    return pending_requests_.count(request_id) > 0;
}

size_t ControlChannel::pending_count() const
{
    std::lock_guard<std::mutex> lock(requests_mutex_);
    return pending_requests_.size();
}

std::vector<PendingControlRequest> ControlChannel::pending() const
{
    std::lock_guard<std::mutex> lock(requests_mutex_);

    std::vector<PendingControlRequest> result;
    for (const auto& [id, request] : pending_requests_)
        result.push_back(request);
    return result;
}

void ControlChannel::discard_all()
{
    std::lock_guard<std::mutex> lock(requests_mutex_);
    pending_requests_.clear();
}

bool ControlChannel::requires_explicit_decision(const std::string& tool_name)
{
    return APPROVAL_EXEMPT_TOOLS.count(tool_name) > 0;
}

std::string ControlChannel::build_response_message(const PendingControlRequest& request,
                                                   bool approved, bool always_allow)
{
    json decision;
    if (approved)
    {
        decision = {{"behavior", "allow"}, {"updatedInput", request.input}};
        if (always_allow && !request.suggestions.is_null())
            decision["updatedPermissions"] = request.suggestions;
    }
    else
    {
        decision = {
            {"behavior", "deny"}, {"message", "User denied permission"}, {"interrupt", true}};
    }
    decision["toolUseID"] = request.tool_use_id;

    json msg = {{"type", "control_response"},
                {"response",
                 {{"subtype", "success"},
                  {"request_id", request.request_id},
                  {"response", decision}}}};

    return msg.dump() + "\n";
}

} // namespace protocol
} // namespace agentchat
