#include <agentchat/tab_scheduler.hpp>
#include <agentchat/turn_processor.hpp>
#include <iostream>

namespace agentchat
{

struct TabScheduler::Conversation
{
    std::string id;
    std::string title;
    SessionState state;
    ConversationReducer reducer;
    TurnProcessor processor;
    std::vector<LogEntry> log;
};

namespace
{

// Position in the log of the n-th (0-based) userInput entry
std::optional<size_t> user_input_position(const std::vector<LogEntry>& log, size_t n)
{
    size_t seen = 0;
    for (size_t i = 0; i < log.size(); ++i)
    {
        if (log[i].type != "userInput")
            continue;
        if (seen++ == n)
            return i;
    }
    return std::nullopt;
}

std::string user_input_text(const LogEntry& entry)
{
    if (entry.data.is_string())
        return entry.data.get<std::string>();
    if (entry.data.is_object() && entry.data.contains("text") && entry.data["text"].is_string())
        return entry.data["text"].get<std::string>();
    return "";
}

std::string error_text(const SessionError& error)
{
    std::string text = error.message;
    if (text.empty())
        text = "Agent process ended unexpectedly (exit code " + std::to_string(error.exit_code) + ")";
    if (error.hint)
        text += "\n\n" + *error.hint;
    return text;
}

// Rebuild transcript and token totals from the conversation's log
void rebuild(ConversationReducer& reducer, SessionState& state, const std::vector<LogEntry>& log)
{
    reducer.reset();
    for (const auto& entry : log)
    {
        reducer.apply(entry);

        if (entry.type == "updateTokens" && entry.data.is_object() && entry.data.contains("usage"))
            state.add_token_usage(usage_from_json(entry.data["usage"]));
        else if (entry.type == "compactBoundary")
            state.reset_token_counts();
    }
    reducer.finish();
}

} // namespace

TabScheduler::TabScheduler(const AgentOptions& options,
                           std::shared_ptr<PermissionPatternCache> patterns,
                           std::shared_ptr<ConversationStore> store,
                           TransportFactory transport_factory)
    : store_(store ? std::move(store) : std::make_shared<MemoryConversationStore>())
{
    SupervisorChannels channels;
    channels.on_message = [this](const ProtocolEvent& event) { handle_message(event); };
    channels.on_control_request = [this](const protocol::PendingControlRequest& request)
    { handle_control_request(request); };
    channels.on_error = [this](const SessionError& error) { handle_error(error); };
    channels.on_end = [this]() { handle_end(); };

    if (!patterns)
        patterns = std::make_shared<PermissionPatternCache>(nullptr);

    supervisor_ = std::make_unique<ProcessSupervisor>(options, std::move(channels),
                                                      std::move(patterns),
                                                      std::move(transport_factory));
}

TabScheduler::~TabScheduler()
{
    supervisor_.reset();
}

void TabScheduler::set_listener(SchedulerListener listener)
{
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

// ============================================================================
// Conversations
// ============================================================================

TabScheduler::Conversation& TabScheduler::find_locked(const std::string& conversation_id) const
{
    auto it = conversations_.find(conversation_id);
    if (it == conversations_.end())
        throw AgentChatError("Unknown conversation: " + conversation_id);
    return *it->second;
}

std::string TabScheduler::next_id_locked()
{
    std::string id;
    do
    {
        id = "conversation-" + std::to_string(next_conversation_++);
    } while (conversations_.count(id) > 0);
    return id;
}

ConversationRecord TabScheduler::make_record_locked(const Conversation& conversation) const
{
    ConversationRecord record;
    record.id = conversation.id;
    record.title = conversation.title;
    record.session_id = conversation.state.session_id();
    record.total_cost = conversation.state.total_cost();
    record.total_tokens_input = conversation.state.total_tokens_input();
    record.total_tokens_output = conversation.state.total_tokens_output();
    record.entries = conversation.log;
    return record;
}

void TabScheduler::persist(const ConversationRecord& record)
{
    try
    {
        store_->save(record);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Warning: failed to save conversation " << record.id << ": " << e.what()
                  << std::endl;
    }
}

void TabScheduler::append_locked(Conversation& conversation, const LogEntry& entry)
{
    conversation.log.push_back(entry);
    conversation.reducer.apply(entry);
}

std::string TabScheduler::open_conversation(const std::string& title)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto conversation = std::make_unique<Conversation>();
    conversation->id = next_id_locked();
    conversation->title = title;

    std::string id = conversation->id;
    conversations_[id] = std::move(conversation);
    return id;
}

void TabScheduler::close_conversation(const std::string& conversation_id)
{
    if (owner() == conversation_id)
        stop();

    std::lock_guard<std::mutex> lock(mutex_);
    find_locked(conversation_id);
    conversations_.erase(conversation_id);
}

// ============================================================================
// Turns
// ============================================================================

bool TabScheduler::try_send(const std::string& conversation_id, const TurnPayload& payload,
                            SendOptions options)
{
    SchedulerListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Conversation& conversation = find_locked(conversation_id);

        if (owner_ || stopping_)
            return false;

        owner_ = conversation_id;
        conversation.state.set_processing(true);
        conversation.state.set_selected_model(options.model);
        conversation.processor.reset();

        json data = {{"text", payload.text}};
        if (!payload.images.empty())
            data["imageCount"] = payload.images.size();
        append_locked(conversation, make_log_entry("userInput", data));

        if (!options.session_id)
            options.session_id = conversation.state.session_id();

        listener = listener_;
    }

    if (listener.on_transcript_changed)
        listener.on_transcript_changed(conversation_id);

    try
    {
        supervisor_->send(payload, options);
    }
    catch (const std::exception&)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (owner_ == conversation_id)
        {
            owner_.reset();
            find_locked(conversation_id).state.set_processing(false);
        }
        throw;
    }

    return true;
}

void TabScheduler::send(const std::string& conversation_id, const TurnPayload& payload,
                        SendOptions options)
{
    if (!try_send(conversation_id, payload, std::move(options)))
    {
        auto current = owner();
        throw SchedulerBusyError("Conversation '" + current.value_or("") +
                                 "' is already running a turn");
    }
}

void TabScheduler::stop()
{
    std::string id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!owner_ || stopping_)
            return;
        id = *owner_;
        stopping_ = true;
    }

    // Ownership is kept until the process is gone, so no other turn can start
    supervisor_->stop();

    std::optional<ConversationRecord> record;
    SchedulerListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = false;
        if (owner_ != id)
            return; // Run ended on its own meanwhile

        owner_.reset();
        auto it = conversations_.find(id);
        if (it != conversations_.end())
        {
            Conversation& conversation = *it->second;
            conversation.reducer.finish();
            conversation.processor.reset();
            conversation.state.set_processing(false);
            record = make_record_locked(conversation);
        }
        listener = listener_;
    }

    if (!record)
        return;

    persist(*record);
    if (listener.on_transcript_changed)
        listener.on_transcript_changed(id);
}

bool TabScheduler::respond(const std::string& request_id, bool approved, bool always_allow)
{
    return supervisor_->respond_to_control(request_id, approved, always_allow);
}

std::vector<protocol::PendingControlRequest> TabScheduler::pending_requests() const
{
    return supervisor_->pending_requests();
}

// ============================================================================
// Supervisor channels
// ============================================================================

void TabScheduler::handle_message(const ProtocolEvent& event)
{
    std::string id;
    SchedulerListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!owner_)
            return;

        auto it = conversations_.find(*owner_);
        if (it == conversations_.end())
            return;

        Conversation& conversation = *it->second;
        auto entries = conversation.processor.process(event, conversation.state);
        if (entries.empty())
            return;

        for (const auto& entry : entries)
            append_locked(conversation, entry);

        id = *owner_;
        listener = listener_;
    }

    if (listener.on_transcript_changed)
        listener.on_transcript_changed(id);
}

void TabScheduler::handle_control_request(const protocol::PendingControlRequest& request)
{
    std::string id;
    SchedulerListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!owner_)
            return;
        id = *owner_;
        listener = listener_;
    }

    if (listener.on_permission_request)
        listener.on_permission_request(id, request);
}

void TabScheduler::handle_error(const SessionError& error)
{
    std::string id;
    SchedulerListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!owner_)
            return;

        auto it = conversations_.find(*owner_);
        if (it == conversations_.end())
            return;

        Conversation& conversation = *it->second;
        append_locked(conversation, make_log_entry("error", {{"message", error_text(error)},
                                                            {"category", to_string(error.category)},
                                                            {"exitCode", error.exit_code}}));
        conversation.state.set_processing(false);

        id = *owner_;
        listener = listener_;
    }

    if (listener.on_error)
        listener.on_error(id, error);
    if (listener.on_transcript_changed)
        listener.on_transcript_changed(id);
}

void TabScheduler::handle_end()
{
    std::string id;
    std::optional<ConversationRecord> record;
    SchedulerListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!owner_)
            return;

        id = *owner_;
        owner_.reset();

        auto it = conversations_.find(id);
        if (it != conversations_.end())
        {
            Conversation& conversation = *it->second;
            conversation.reducer.finish();
            conversation.processor.reset();
            conversation.state.set_processing(false);
            record = make_record_locked(conversation);
        }
        listener = listener_;
    }

    if (record)
        persist(*record);

    if (listener.on_transcript_changed)
        listener.on_transcript_changed(id);
    if (listener.on_turn_complete)
        listener.on_turn_complete(id);
}

// ============================================================================
// History operations
// ============================================================================

std::string TabScheduler::fork_conversation(const std::string& conversation_id,
                                            size_t user_input_index)
{
    std::lock_guard<std::mutex> lock(mutex_);
    Conversation& source = find_locked(conversation_id);

    if (!user_input_position(source.log, user_input_index))
        throw AgentChatError("User input index out of range: " +
                             std::to_string(user_input_index));

    // Keep the chosen input and its responses, up to the next input
    auto end = user_input_position(source.log, user_input_index + 1);
    size_t count = end ? *end : source.log.size();

    auto fork = std::make_unique<Conversation>();
    fork->id = next_id_locked();
    fork->title = source.title + " (fork)";
    fork->log.assign(source.log.begin(), source.log.begin() + count);
    fork->state.set_selected_model(source.state.selected_model());
    rebuild(fork->reducer, fork->state, fork->log);

    std::string id = fork->id;
    conversations_[id] = std::move(fork);
    return id;
}

std::string TabScheduler::rewind_conversation(const std::string& conversation_id,
                                              size_t user_input_index)
{
    if (owner() == conversation_id)
        stop();

    std::optional<ConversationRecord> record;
    std::string text;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Conversation& conversation = find_locked(conversation_id);

        auto position = user_input_position(conversation.log, user_input_index);
        if (!position)
            throw AgentChatError("User input index out of range: " +
                                 std::to_string(user_input_index));

        text = user_input_text(conversation.log[*position]);
        conversation.log.erase(conversation.log.begin() + *position, conversation.log.end());

        conversation.state.reset_session();
        conversation.processor.reset();
        rebuild(conversation.reducer, conversation.state, conversation.log);
        record = make_record_locked(conversation);
    }

    persist(*record);
    return text;
}

void TabScheduler::new_session(const std::string& conversation_id)
{
    if (owner() == conversation_id)
        stop();

    std::lock_guard<std::mutex> lock(mutex_);
    Conversation& conversation = find_locked(conversation_id);
    conversation.log.clear();
    conversation.reducer.reset();
    conversation.processor.reset();
    conversation.state.reset_session();
}

std::string TabScheduler::load_conversation(const std::string& record_id)
{
    auto record = store_->load(record_id);
    if (!record)
        throw AgentChatError("Conversation not found: " + record_id);

    if (owner() == record->id)
        stop();

    std::lock_guard<std::mutex> lock(mutex_);

    auto conversation = std::make_unique<Conversation>();
    conversation->id = record->id;
    conversation->title = record->title;
    conversation->log = record->entries;
    rebuild(conversation->reducer, conversation->state, conversation->log);
    conversation->state.restore_from_conversation(record->total_cost, record->total_tokens_input,
                                                  record->total_tokens_output,
                                                  record->session_id);

    conversations_[record->id] = std::move(conversation);
    return record->id;
}

void TabScheduler::save_conversation(const std::string& conversation_id)
{
    ConversationRecord record;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        record = make_record_locked(find_locked(conversation_id));
    }
    store_->save(record);
}

// ============================================================================
// Accessors
// ============================================================================

Transcript TabScheduler::transcript(const std::string& conversation_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return find_locked(conversation_id).reducer.transcript();
}

std::vector<LogEntry> TabScheduler::log(const std::string& conversation_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return find_locked(conversation_id).log;
}

SessionState TabScheduler::session_state(const std::string& conversation_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return find_locked(conversation_id).state;
}

std::string TabScheduler::title(const std::string& conversation_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return find_locked(conversation_id).title;
}

std::optional<std::string> TabScheduler::owner() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return owner_;
}

bool TabScheduler::is_in_flight() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return owner_.has_value();
}

std::vector<std::string> TabScheduler::conversation_ids() const
{
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> ids;
    for (const auto& [id, conversation] : conversations_)
        ids.push_back(id);
    return ids;
}

} // namespace agentchat
