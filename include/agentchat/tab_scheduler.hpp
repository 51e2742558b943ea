#ifndef AGENTCHAT_TAB_SCHEDULER_HPP
#define AGENTCHAT_TAB_SCHEDULER_HPP

#include <agentchat/permissions.hpp>
#include <agentchat/session_state.hpp>
#include <agentchat/storage.hpp>
#include <agentchat/supervisor.hpp>
#include <agentchat/transcript.hpp>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentchat
{

// Notifications to the host UI; may run on the supervisor's reader thread
struct SchedulerListener
{
    std::function<void(const std::string& conversation_id)> on_transcript_changed;
    std::function<void(const std::string& conversation_id,
                       const protocol::PendingControlRequest& request)>
        on_permission_request;
    std::function<void(const std::string& conversation_id, const SessionError& error)> on_error;
    std::function<void(const std::string& conversation_id)> on_turn_complete;
};

/**
 * Multiplexes open conversations over one ProcessSupervisor.
 *
 * At most one conversation owns the supervisor at a time. Ownership is taken
 * by try_send() and released when the run ends or is stopped; supervisor
 * events are routed to the owner only. Operations on conversations that do
 * not own the supervisor never touch it.
 */
class TabScheduler
{
  public:
    explicit TabScheduler(const AgentOptions& options,
                          std::shared_ptr<PermissionPatternCache> patterns = nullptr,
                          std::shared_ptr<ConversationStore> store = nullptr,
                          TransportFactory transport_factory = {});
    ~TabScheduler();

    // No copy
    TabScheduler(const TabScheduler&) = delete;
    TabScheduler& operator=(const TabScheduler&) = delete;

    void set_listener(SchedulerListener listener);

    std::string open_conversation(const std::string& title = "New Chat");

    // Closing the owner stops its run first
    void close_conversation(const std::string& conversation_id);

    /**
     * Start a turn for a conversation.
     * Returns false when another turn is in flight. When options carry no
     * session id, the conversation's agent session is resumed.
     * Throws AgentChatError for an unknown conversation.
     */
    bool try_send(const std::string& conversation_id, const TurnPayload& payload,
                  SendOptions options = SendOptions{});

    // As try_send(), throwing SchedulerBusyError instead of returning false
    void send(const std::string& conversation_id, const TurnPayload& payload,
              SendOptions options = SendOptions{});

    // Stop the in-flight turn, if any, and release ownership
    void stop();

    // Answer a permission request raised by the owning conversation
    bool respond(const std::string& request_id, bool approved, bool always_allow = false);

    /**
     * Copy a conversation up to and including the responses to its
     * user_input_index-th user input (0-based) into a new conversation
     * titled "<title> (fork)". The fork starts without an agent session.
     */
    std::string fork_conversation(const std::string& conversation_id, size_t user_input_index);

    /**
     * Drop the user_input_index-th user input and everything after it, then
     * rebuild the transcript. The agent session is reset. Returns the text of
     * the dropped input.
     */
    std::string rewind_conversation(const std::string& conversation_id,
                                    size_t user_input_index);

    // Clear the conversation and start over with a new agent session
    void new_session(const std::string& conversation_id);

    // Open (or refresh) a conversation from the store; returns its id
    std::string load_conversation(const std::string& record_id);

    void save_conversation(const std::string& conversation_id);

    Transcript transcript(const std::string& conversation_id) const;
    std::vector<LogEntry> log(const std::string& conversation_id) const;
    SessionState session_state(const std::string& conversation_id) const;
    std::string title(const std::string& conversation_id) const;

    std::optional<std::string> owner() const;
    bool is_in_flight() const;
    std::vector<std::string> conversation_ids() const;

    std::vector<protocol::PendingControlRequest> pending_requests() const;

  private:
    struct Conversation;

    Conversation& find_locked(const std::string& conversation_id) const;
    std::string next_id_locked();
    ConversationRecord make_record_locked(const Conversation& conversation) const;
    void persist(const ConversationRecord& record);
    void append_locked(Conversation& conversation, const LogEntry& entry);

    // Supervisor channels
    void handle_message(const ProtocolEvent& event);
    void handle_control_request(const protocol::PendingControlRequest& request);
    void handle_error(const SessionError& error);
    void handle_end();

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Conversation>> conversations_;
    std::optional<std::string> owner_;
    bool stopping_ = false;
    size_t next_conversation_ = 1;

    std::shared_ptr<ConversationStore> store_;
    SchedulerListener listener_;

    // Destroyed first; its callbacks use the members above
    std::unique_ptr<ProcessSupervisor> supervisor_;
};

} // namespace agentchat

#endif // AGENTCHAT_TAB_SCHEDULER_HPP
