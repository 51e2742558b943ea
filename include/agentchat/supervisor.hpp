#ifndef AGENTCHAT_SUPERVISOR_HPP
#define AGENTCHAT_SUPERVISOR_HPP

#include <agentchat/errors.hpp>
#include <agentchat/permissions.hpp>
#include <agentchat/protocol/control.hpp>
#include <agentchat/transport.hpp>
#include <agentchat/types.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace agentchat
{

/**
 * Outbound notifications of a ProcessSupervisor, consumed by one subscriber.
 *
 * All callbacks run on the supervisor's reader thread, except on_error and
 * on_end for a spawn failure, which run on the thread that called send().
 * For a failed run on_error fires once, immediately before on_end.
 * Nothing fires after stop().
 */
struct SupervisorChannels
{
    std::function<void(const ProtocolEvent&)> on_message;
    std::function<void(const protocol::PendingControlRequest&)> on_control_request;
    std::function<void(const SessionError&)> on_error;
    std::function<void()> on_end;
};

// Agent command line for one turn
std::vector<std::string> build_arguments(const SendOptions& options);

// The structured input record (JSON + newline) carrying one user turn
std::string build_turn_record(const TurnPayload& payload,
                              const std::optional<std::string>& session_id);

/**
 * Owns the agent process lifecycle, one process per turn.
 *
 * send() spawns the agent with protocol flags, writes the turn and starts a
 * reader thread that routes events: permission requests go through the
 * control channel (answered automatically when auto-approve or a stored
 * pattern allows it), everything else to on_message. Input is closed after the
 * terminal result event.
 */
class ProcessSupervisor
{
  public:
    ProcessSupervisor(const AgentOptions& options, SupervisorChannels channels,
                      std::shared_ptr<PermissionPatternCache> patterns = nullptr,
                      TransportFactory transport_factory = {});
    ~ProcessSupervisor();

    // No copy
    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    /**
     * Start a turn.
     * Throws AgentChatError when a run is already active. Spawn failures are
     * not thrown; they are reported on on_error (AgentNotInstalled) + on_end.
     */
    void send(const TurnPayload& payload, const SendOptions& options);

    /**
     * Abort the current run: discards pending permission requests and stops
     * the process group. Emits no notification. Safe to call when idle.
     */
    void stop();

    /**
     * Answer a pending permission request.
     * Returns false (and writes nothing) when the id is unknown, e.g. after
     * stop() or process exit. "always allow" on an approval stores the
     * request's generalized pattern.
     */
    bool respond_to_control(const std::string& request_id, bool approved,
                            bool always_allow = false);

    bool is_running() const;

    std::vector<protocol::PendingControlRequest> pending_requests() const;

    std::shared_ptr<PermissionPatternCache> patterns() const;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace agentchat

#endif // AGENTCHAT_SUPERVISOR_HPP
