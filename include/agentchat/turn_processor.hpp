#ifndef AGENTCHAT_TURN_PROCESSOR_HPP
#define AGENTCHAT_TURN_PROCESSOR_HPP

#include <agentchat/session_state.hpp>
#include <agentchat/transcript.hpp>
#include <agentchat/types.hpp>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace agentchat
{

// Tools whose successful results are recorded but not shown
extern const std::set<std::string> HIDDEN_RESULT_TOOLS;

/**
 * Translates decoded protocol events into conversation log entries and
 * keeps the owning conversation's SessionState current.
 *
 * The returned entries are what gets persisted and fed to the
 * ConversationReducer, in order.
 */
class TurnProcessor
{
  public:
    std::vector<LogEntry> process(const ProtocolEvent& event, SessionState& state);

    // Forget per-turn bookkeeping (streamed fragments, tool names)
    void reset();

  private:
    std::vector<LogEntry> on_system_init(const SystemInitEvent& event, SessionState& state);
    std::vector<LogEntry> on_status(const SystemStatusEvent& event);
    std::vector<LogEntry> on_compact_boundary(const CompactBoundaryEvent& event,
                                              SessionState& state);
    std::vector<LogEntry> on_assistant(const AssistantEvent& event, SessionState& state);
    std::vector<LogEntry> on_delta(const AssistantDeltaEvent& event, SessionState& state);
    std::vector<LogEntry> on_user(const UserEvent& event, SessionState& state);
    std::vector<LogEntry> on_result(const ResultEvent& event, SessionState& state);

    // Tool names by invocation id, for pairing results
    std::map<std::string, std::string> tool_names_;
    bool streamed_text_ = false;
};

} // namespace agentchat

#endif // AGENTCHAT_TURN_PROCESSOR_HPP
