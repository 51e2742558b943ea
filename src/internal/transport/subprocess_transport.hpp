#ifndef AGENTCHAT_INTERNAL_SUBPROCESS_TRANSPORT_HPP
#define AGENTCHAT_INTERNAL_SUBPROCESS_TRANSPORT_HPP

#include "../line_framer.hpp"
#include "../subprocess/process.hpp"

#include <agentchat/transport.hpp>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>

namespace agentchat
{
namespace internal
{

/**
 * Subprocess transport for the agent CLI.
 *
 * The agent runs as leader of its own process group and talks line-delimited
 * JSON over stdin/stdout. A reader thread frames and decodes stdout into a
 * queue; a second thread captures stderr into the diagnostics buffer.
 */
class SubprocessTransport : public Transport
{
  public:
    SubprocessTransport(const AgentOptions& options, std::vector<std::string> args);
    ~SubprocessTransport() override;

    // Transport interface
    void connect() override;
    void write(const std::string& data) override;
    std::vector<ProtocolEvent> read_events() override;
    bool has_events() const override;
    void end_input() override;
    void terminate() override;
    int wait_for_exit() override;
    std::string diagnostics() const override;
    void close() override;
    bool is_ready() const override;
    bool is_running() const override;
    long get_pid() const override;

  private:
    subprocess::ProcessOptions build_process_options() const;

    // Background reader thread (stdout)
    void reader_loop();
    void push_line(const std::string& line);

    // Background stderr reader thread
    void stderr_reader_loop();
    void handle_stderr_line(const std::string& line);

    void stop_readers();

    AgentOptions options_;
    std::vector<std::string> args_;

    std::unique_ptr<subprocess::Process> process_;
    // Serializes waitpid/kill between the reader and the stopping thread
    mutable std::mutex process_mutex_;

    protocol::LineFramer framer_;

    // Thread-safe event queue
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::queue<ProtocolEvent> event_queue_;
    bool queue_stopped_ = false;

    // Serialize stdin writes and coordinate with end_input
    mutable std::mutex write_mutex_;

    mutable std::mutex diagnostics_mutex_;
    std::string diagnostics_;

    std::thread reader_thread_;
    std::thread stderr_reader_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> ready_{false};
    std::atomic<bool> stderr_done_{false};
};

} // namespace internal
} // namespace agentchat

#endif // AGENTCHAT_INTERNAL_SUBPROCESS_TRANSPORT_HPP
