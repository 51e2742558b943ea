#include <agentchat/supervisor.hpp>
#include <atomic>
#include <iostream>
#include <mutex>
#include <thread>

namespace agentchat
{

namespace
{
std::string trim(const std::string& s)
{
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos)
        return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}
} // namespace

std::vector<std::string> build_arguments(const SendOptions& options)
{
    std::vector<std::string> args = {"--output-format", "stream-json", "--input-format",
                                     "stream-json", "--verbose"};

    if (!options.effort.empty())
    {
        args.push_back("--effort");
        args.push_back(options.effort);
    }

    // Permission modes are mutually exclusive
    if (options.auto_approve)
    {
        args.push_back("--dangerously-skip-permissions");
    }
    else
    {
        args.push_back("--permission-prompt-tool");
        args.push_back("stdio");
        if (options.plan_mode)
        {
            args.push_back("--permission-mode");
            args.push_back("plan");
        }
    }

    if (!options.mcp_config.empty())
    {
        args.push_back("--mcp-config");
        args.push_back(options.mcp_config);
    }

    if (!options.model.empty() && options.model != "default")
    {
        args.push_back("--model");
        args.push_back(options.model);
    }

    for (const auto& tool : options.allowed_tools)
    {
        args.push_back("--allowedTools");
        args.push_back(tool);
    }
    for (const auto& tool : options.disallowed_tools)
    {
        args.push_back("--disallowedTools");
        args.push_back(tool);
    }

    if (options.max_turns > 0)
    {
        args.push_back("--max-turns");
        args.push_back(std::to_string(options.max_turns));
    }

    if (options.include_partial_messages)
        args.push_back("--include-partial-messages");

    if (options.session_id && !options.session_id->empty())
    {
        if (options.continue_conversation)
            args.push_back("--continue");
        args.push_back("--resume");
        args.push_back(*options.session_id);
    }

    return args;
}

std::string build_turn_record(const TurnPayload& payload,
                              const std::optional<std::string>& session_id)
{
    json content = json::array();
    if (!payload.text.empty())
        content.push_back({{"type", "text"}, {"text", payload.text}});

    for (const auto& image : payload.images)
    {
        content.push_back({{"type", "image"},
                           {"source",
                            {{"type", "base64"},
                             {"media_type", image.media_type},
                             {"data", image.data}}}});
    }

    json record = {{"type", "user"},
                   {"session_id", session_id.value_or("")},
                   {"message", {{"role", "user"}, {"content", content}}},
                   {"parent_tool_use_id", nullptr}};

    // Invalid UTF-8 in user text becomes U+FFFD instead of failing the turn
    return record.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

// ============================================================================
// ProcessSupervisor::Impl
// ============================================================================

class ProcessSupervisor::Impl
{
  public:
    AgentOptions options_;
    SupervisorChannels channels_;
    std::shared_ptr<PermissionPatternCache> patterns_;
    TransportFactory transport_factory_;
    protocol::ControlChannel control_;

    // Guards transport_, reader_thread_ and active_
    mutable std::mutex mutex_;
    std::shared_ptr<Transport> transport_;
    std::thread reader_thread_;
    bool active_ = false;
    // One flag per run, so a reader outliving stop() stays silent
    std::shared_ptr<std::atomic<bool>> stopped_ = std::make_shared<std::atomic<bool>>(false);

    Impl(const AgentOptions& options, SupervisorChannels channels,
         std::shared_ptr<PermissionPatternCache> patterns, TransportFactory factory)
        : options_(options), channels_(std::move(channels)), patterns_(std::move(patterns)),
          transport_factory_(std::move(factory))
    {
    }

    ~Impl()
    {
        stop();
        release_reader_thread();
    }

    // Join a finished reader; a reader cannot join itself
    void release_reader_thread()
    {
        std::thread finished;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            finished = std::move(reader_thread_);
        }

        if (!finished.joinable())
            return;
        if (finished.get_id() == std::this_thread::get_id())
            finished.detach();
        else
            finished.join();
    }

    std::unique_ptr<Transport> make_transport(const std::vector<std::string>& args)
    {
        if (transport_factory_)
            return transport_factory_(options_, args);
        return create_subprocess_transport(options_, args);
    }

    void send(const TurnPayload& payload, const SendOptions& options)
    {
        std::shared_ptr<std::atomic<bool>> stopped;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (active_)
                throw AgentChatError("A turn is already running");
            active_ = true;
            stopped_ = std::make_shared<std::atomic<bool>>(false);
            stopped = stopped_;
            transport_.reset();
        }

        release_reader_thread();
        control_.discard_all();

        std::string turn_record;
        try
        {
            turn_record = build_turn_record(payload, options.session_id);
        }
        catch (const std::exception& e)
        {
            fail_before_start(stopped, ErrorCategory::ProcessError,
                              std::string("Could not encode turn: ") + e.what());
            return;
        }

        std::shared_ptr<Transport> transport;
        try
        {
            transport = make_transport(build_arguments(options));
            transport->connect();
        }
        catch (const std::exception& e)
        {
            fail_before_start(stopped, ErrorCategory::AgentNotInstalled,
                              std::string("Error running agent: ") + e.what());
            return;
        }

        try
        {
            transport->write(turn_record);
        }
        catch (const AgentConnectionError& e)
        {
            // The reader observes the exit and reports it
            std::cerr << "Warning: could not write turn to agent: " << e.what() << std::endl;
        }
        catch (const std::exception& e)
        {
            // The agent would wait on stdin forever; the reader reports the exit
            std::cerr << "Warning: could not write turn to agent: " << e.what() << std::endl;
            transport->end_input();
            transport->terminate();
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (*stopped)
        {
            // stop() ran while the process was starting
            transport->terminate();
            return;
        }
        transport_ = transport;
        reader_thread_ = std::thread(&Impl::reader_loop, this, transport, options, stopped);
    }

    // Ends a run that never got a reader thread
    void fail_before_start(const std::shared_ptr<std::atomic<bool>>& stopped,
                           ErrorCategory category, const std::string& message)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            active_ = false;
            if (*stopped)
                return;
        }
        SessionError error;
        error.category = category;
        error.message = message;
        emit_error(error);
        emit_end();
    }

    void stop()
    {
        std::shared_ptr<Transport> transport;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!active_)
                return;
            *stopped_ = true;
            transport = transport_;
        }

        control_.discard_all();
        if (transport)
        {
            transport->end_input();
            transport->terminate();
        }

        std::thread reader;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (reader_thread_.joinable() && reader_thread_.get_id() != std::this_thread::get_id())
                reader = std::move(reader_thread_);
        }
        if (reader.joinable())
            reader.join();

        std::lock_guard<std::mutex> lock(mutex_);
        active_ = false;
    }

    bool respond_to_control(const std::string& request_id, bool approved, bool always_allow)
    {
        auto request = control_.take(request_id);
        if (!request)
            return false;

        if (approved && always_allow && patterns_)
        {
            std::optional<std::string> pattern = request->pattern;
            if (!pattern)
                pattern = extract_command(request->tool_name, request->input);
            if (pattern)
                patterns_->add(request->tool_name, *pattern);
        }

        std::shared_ptr<Transport> transport;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            transport = transport_;
        }
        if (!transport || !transport->is_ready())
            return false;

        try
        {
            transport->write(
                protocol::ControlChannel::build_response_message(*request, approved, always_allow));
        }
        catch (const AgentConnectionError& e)
        {
            std::cerr << "Warning: could not deliver permission decision: " << e.what()
                      << std::endl;
            return false;
        }
        return true;
    }

    void handle_control_request(const ControlRequestEvent& event, const SendOptions& options)
    {
        if (event.subtype != "can_use_tool")
        {
            std::cerr << "Warning: ignoring unsupported control request '" << event.subtype << "'"
                      << std::endl;
            return;
        }

        auto pending = control_.register_request(event);

        bool auto_allowed =
            options.auto_approve &&
            !protocol::ControlChannel::requires_explicit_decision(event.tool_name);
        if (!auto_allowed && patterns_)
            auto_allowed = patterns_->is_pre_approved(event.tool_name, event.input);

        if (auto_allowed)
        {
            respond_to_control(pending.request_id, true, false);
            return;
        }

        if (channels_.on_control_request)
            channels_.on_control_request(pending);
    }

    void reader_loop(std::shared_ptr<Transport> transport, SendOptions options,
                     std::shared_ptr<std::atomic<bool>> stopped)
    {
        std::optional<ResultEvent> result;
        std::string failure;

        try
        {
            while (!*stopped)
            {
                auto events = transport->read_events();
                if (events.empty() && !transport->has_events())
                    break;

                for (const auto& event : events)
                {
                    if (*stopped)
                        break;

                    if (auto* request = std::get_if<ControlRequestEvent>(&event))
                    {
                        handle_control_request(*request, options);
                        continue;
                    }

                    if (auto* terminal = std::get_if<ResultEvent>(&event))
                    {
                        result = *terminal;
                        transport->end_input();
                    }

                    if (channels_.on_message)
                        channels_.on_message(event);
                }
            }
        }
        catch (const std::exception& e)
        {
            failure = e.what();
            std::cerr << "Warning: agent reader stopped: " << failure << std::endl;
        }

        if (*stopped)
            return;

        // Pending requests die with the process, unanswered
        control_.discard_all();

        int exit_code = transport->wait_for_exit();
        std::string diagnostic = trim(transport->diagnostics());
        if (diagnostic.empty())
            diagnostic = failure;

        std::optional<SessionError> error;
        if (exit_code != 0)
        {
            if (!diagnostic.empty())
                error = classify_diagnostic(diagnostic, exit_code, options.auto_approve);
            else
                error = SessionError{ErrorCategory::ProcessError, "", exit_code, std::nullopt};
        }
        else if (!result)
        {
            // Output closed before the terminal record
            error = SessionError{ErrorCategory::ProcessError, diagnostic, exit_code, std::nullopt};
        }
        else if (result->subtype != "success")
        {
            std::string text = trim(result->result);
            error = SessionError{ErrorCategory::ProcessError,
                                 text.empty() ? "Agent run failed" : text, exit_code,
                                 std::nullopt};
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (*stopped)
                return;
            active_ = false;
        }

        if (error)
            emit_error(*error);
        emit_end();
    }

    void emit_error(const SessionError& error)
    {
        if (channels_.on_error)
            channels_.on_error(error);
    }

    void emit_end()
    {
        if (channels_.on_end)
            channels_.on_end();
    }
};

// ============================================================================
// ProcessSupervisor
// ============================================================================

ProcessSupervisor::ProcessSupervisor(const AgentOptions& options, SupervisorChannels channels,
                                     std::shared_ptr<PermissionPatternCache> patterns,
                                     TransportFactory transport_factory)
    : impl_(std::make_unique<Impl>(options, std::move(channels), std::move(patterns),
                                   std::move(transport_factory)))
{
}

ProcessSupervisor::~ProcessSupervisor() = default;

void ProcessSupervisor::send(const TurnPayload& payload, const SendOptions& options)
{
    impl_->send(payload, options);
}

void ProcessSupervisor::stop()
{
    impl_->stop();
}

bool ProcessSupervisor::respond_to_control(const std::string& request_id, bool approved,
                                           bool always_allow)
{
    return impl_->respond_to_control(request_id, approved, always_allow);
}

bool ProcessSupervisor::is_running() const
{
    std::lock_guard<std::mutex> lock(impl_->mutex_);
    return impl_->active_;
}

std::vector<protocol::PendingControlRequest> ProcessSupervisor::pending_requests() const
{
    return impl_->control_.pending();
}

std::shared_ptr<PermissionPatternCache> ProcessSupervisor::patterns() const
{
    return impl_->patterns_;
}

} // namespace agentchat
