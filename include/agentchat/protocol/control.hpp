#ifndef AGENTCHAT_PROTOCOL_CONTROL_HPP
#define AGENTCHAT_PROTOCOL_CONTROL_HPP

#include <agentchat/types.hpp>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace agentchat
{
namespace protocol
{

// Tools that always need an explicit human decision, even in auto-approve mode
extern const std::set<std::string> APPROVAL_EXEMPT_TOOLS;

// A can_use_tool request awaiting a decision
struct PendingControlRequest
{
    std::string request_id;
    std::string tool_name;
    json input;
    std::string tool_use_id;
    json suggestions; // Agent's permission suggestions; null when absent
    std::optional<std::string> decision_reason;
    std::optional<std::string> blocked_path;
    // Generalized pattern offered for "always allow" (Bash only)
    std::optional<std::string> pattern;
};

// Control channel - correlates agent permission requests with decisions
class ControlChannel
{
  public:
    ControlChannel() = default;

    // No copy
    ControlChannel(const ControlChannel&) = delete;
    ControlChannel& operator=(const ControlChannel&) = delete;

    // Record an incoming request; returns the pending entry
    PendingControlRequest register_request(const ControlRequestEvent& event);

    // Remove and return a pending request; nothing when unknown
    std::optional<PendingControlRequest> take(const std::string& request_id);

    bool is_pending(const std::string& request_id) const;
    size_t pending_count() const;
    std::vector<PendingControlRequest> pending() const;

    // Process ended: forget every request without answering
    void discard_all();

    static bool requires_explicit_decision(const std::string& tool_name);

    // Build the control_response line (JSON + newline) for a decision
    static std::string build_response_message(const PendingControlRequest& request,
                                              bool approved, bool always_allow);

  private:
    mutable std::mutex requests_mutex_;
    std::map<std::string, PendingControlRequest> pending_requests_;
};

} // namespace protocol
} // namespace agentchat

#endif // AGENTCHAT_PROTOCOL_CONTROL_HPP
