#include "subprocess_transport.hpp"

#include "../event_decoder.hpp"
#include "agent_verification.hpp"

#include <agentchat/errors.hpp>
#include <agentchat/version.hpp>
#include <chrono>
#include <iostream>

namespace agentchat
{
namespace internal
{

namespace
{
constexpr int POLL_INTERVAL_MS = 100;
constexpr size_t READ_CHUNK_SIZE = 4096;
} // namespace

SubprocessTransport::SubprocessTransport(const AgentOptions& options,
                                         std::vector<std::string> args)
    : options_(options), args_(std::move(args)), framer_(options.max_line_buffer_size)
{
}

SubprocessTransport::~SubprocessTransport()
{
    close();
}

subprocess::ProcessOptions SubprocessTransport::build_process_options() const
{
    subprocess::ProcessOptions proc_opts;
    proc_opts.redirect_stdin = true;
    proc_opts.redirect_stdout = true;
    proc_opts.redirect_stderr = true;
    proc_opts.new_process_group = true;
    proc_opts.inherit_environment = options_.inherit_environment;

    if (options_.working_directory)
        proc_opts.working_directory = *options_.working_directory;

    for (const auto& [key, value] : options_.environment)
        proc_opts.environment[key] = value;

    // Plain output: the stream is parsed, never rendered
    proc_opts.environment["FORCE_COLOR"] = "0";
    proc_opts.environment["NO_COLOR"] = "1";
    proc_opts.environment["AGENTCHAT_VERSION"] = version_string();

    return proc_opts;
}

void SubprocessTransport::connect()
{
    if (process_)
        throw AgentConnectionError("Transport already connected");

    std::string agent_path = resolve_agent_path(options_);

    auto process = std::make_unique<subprocess::Process>();
    process->spawn(agent_path, args_, build_process_options());

    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        process_ = std::move(process);
    }

    running_ = true;
    reader_thread_ = std::thread(&SubprocessTransport::reader_loop, this);
    stderr_reader_thread_ = std::thread(&SubprocessTransport::stderr_reader_loop, this);

    ready_ = true;
}

void SubprocessTransport::write(const std::string& data)
{
    std::lock_guard<std::mutex> lock(write_mutex_);

    if (!ready_ || !process_ || !process_->stdin_pipe().is_open())
        throw AgentConnectionError("Transport is not ready for writing");

    try
    {
        process_->stdin_pipe().write(data);
    }
    catch (const std::runtime_error& e)
    {
        throw AgentConnectionError(std::string("Cannot write to agent process: ") + e.what());
    }
}

std::vector<ProtocolEvent> SubprocessTransport::read_events()
{
    std::unique_lock<std::mutex> lock(queue_mutex_);

    queue_cv_.wait_for(lock, std::chrono::milliseconds(POLL_INTERVAL_MS),
                       [this] { return !event_queue_.empty() || queue_stopped_; });

    std::vector<ProtocolEvent> events;
    while (!event_queue_.empty())
    {
        events.push_back(std::move(event_queue_.front()));
        event_queue_.pop();
    }

    return events;
}

bool SubprocessTransport::has_events() const
{
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return !event_queue_.empty() || (!queue_stopped_ && process_ != nullptr);
}

void SubprocessTransport::end_input()
{
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (process_ && process_->stdin_pipe().is_open())
        process_->stdin_pipe().close();
}

void SubprocessTransport::terminate()
{
    if (!process_)
        return;

    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        if (process_->try_wait())
            return;
        process_->terminate();
    }

    auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(options_.stop_grace_ms);
    while (std::chrono::steady_clock::now() < deadline)
    {
        {
            std::lock_guard<std::mutex> lock(process_mutex_);
            if (process_->try_wait())
                return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    std::lock_guard<std::mutex> lock(process_mutex_);
    if (!process_->try_wait())
    {
        std::cerr << "Warning: agent process " << process_->pid()
                  << " ignored SIGTERM, sending SIGKILL" << std::endl;
        process_->kill();
    }
}

int SubprocessTransport::wait_for_exit()
{
    if (!process_)
        return -1;

    int exit_code = -1;
    for (;;)
    {
        {
            std::lock_guard<std::mutex> lock(process_mutex_);
            if (auto code = process_->try_wait())
            {
                exit_code = *code;
                break;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    // Let the stderr reader drain what the process wrote before exiting
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
    while (!stderr_done_ && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

    return exit_code;
}

std::string SubprocessTransport::diagnostics() const
{
    std::lock_guard<std::mutex> lock(diagnostics_mutex_);
    return diagnostics_;
}

void SubprocessTransport::close()
{
    ready_ = false;
    end_input();

    if (process_ && is_running())
        terminate();

    stop_readers();

    if (process_)
    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        process_->wait();
    }

    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_stopped_ = true;
    queue_cv_.notify_all();
}

bool SubprocessTransport::is_ready() const
{
    if (!ready_ || !process_)
        return false;

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (!process_->stdin_pipe().is_open())
            return false;
    }
    return is_running();
}

bool SubprocessTransport::is_running() const
{
    if (!process_)
        return false;

    std::lock_guard<std::mutex> lock(process_mutex_);
    return process_->is_running();
}

long SubprocessTransport::get_pid() const
{
    if (process_)
        return static_cast<long>(process_->pid());
    return 0;
}

void SubprocessTransport::push_line(const std::string& line)
{
    auto event = protocol::EventDecoder::decode(line);
    if (!event)
        return;

    std::lock_guard<std::mutex> lock(queue_mutex_);
    event_queue_.push(std::move(*event));
    queue_cv_.notify_all();
}

void SubprocessTransport::reader_loop()
{
    try
    {
        auto& out = process_->stdout_pipe();
        while (running_)
        {
            if (!out.has_data(POLL_INTERVAL_MS))
                continue;

            char buffer[READ_CHUNK_SIZE];
            size_t n = out.read(buffer, sizeof(buffer));
            if (n == 0)
                break; // EOF

            std::vector<std::string> lines;
            try
            {
                lines = framer_.feed(std::string(buffer, n));
            }
            catch (const JSONDecodeError& e)
            {
                std::cerr << "Warning: dropping oversized agent output: " << e.what()
                          << std::endl;
                continue;
            }

            for (const auto& line : lines)
                push_line(line);
        }

        // A final record without a trailing newline is still a record
        if (auto rest = framer_.flush())
            push_line(*rest);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Warning: agent stdout reader stopped: " << e.what() << std::endl;
    }

    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_stopped_ = true;
    queue_cv_.notify_all();
}

void SubprocessTransport::handle_stderr_line(const std::string& line)
{
    {
        std::lock_guard<std::mutex> lock(diagnostics_mutex_);
        diagnostics_ += line;
        diagnostics_ += '\n';
    }

    if (options_.stderr_callback.has_value())
    {
        try
        {
            (*options_.stderr_callback)(line);
        }
        catch (const std::exception& e)
        {
            std::cerr << "Warning: stderr callback threw: " << e.what() << std::endl;
        }
    }
}

void SubprocessTransport::stderr_reader_loop()
{
    std::string pending;
    try
    {
        auto& err = process_->stderr_pipe();
        while (running_)
        {
            if (!err.has_data(POLL_INTERVAL_MS))
                continue;

            char buffer[READ_CHUNK_SIZE];
            size_t n = err.read(buffer, sizeof(buffer));
            if (n == 0)
                break; // EOF

            pending.append(buffer, n);
            size_t pos;
            while ((pos = pending.find('\n')) != std::string::npos)
            {
                std::string line = pending.substr(0, pos);
                pending.erase(0, pos + 1);
                while (!line.empty() && line.back() == '\r')
                    line.pop_back();
                if (!line.empty())
                    handle_stderr_line(line);
            }
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "Warning: agent stderr reader stopped: " << e.what() << std::endl;
    }

    if (!pending.empty())
        handle_stderr_line(pending);

    stderr_done_ = true;
}

void SubprocessTransport::stop_readers()
{
    running_ = false;
    if (reader_thread_.joinable() && reader_thread_.get_id() != std::this_thread::get_id())
        reader_thread_.join();
    if (stderr_reader_thread_.joinable() &&
        stderr_reader_thread_.get_id() != std::this_thread::get_id())
        stderr_reader_thread_.join();
}

} // namespace internal

std::unique_ptr<Transport> create_subprocess_transport(const AgentOptions& options,
                                                       const std::vector<std::string>& args)
{
    return std::make_unique<internal::SubprocessTransport>(options, args);
}

} // namespace agentchat
