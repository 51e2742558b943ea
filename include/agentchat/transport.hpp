#ifndef AGENTCHAT_TRANSPORT_HPP
#define AGENTCHAT_TRANSPORT_HPP

#include <agentchat/types.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace agentchat
{

/**
 * Abstract transport to one agent process invocation.
 *
 * A transport is single-use: connect() starts the process with a fixed
 * argument vector, events are drained with read_events() until has_events()
 * reports the stream ended, and wait_for_exit() then yields the exit code.
 * ProcessSupervisor builds the protocol on top of this; tests substitute a
 * scripted implementation through a TransportFactory.
 */
class Transport
{
  public:
    virtual ~Transport() = default;

    /**
     * Start the agent process.
     * Throws AgentNotInstalledError when the binary cannot be resolved and
     * std::runtime_error when it cannot be executed.
     */
    virtual void connect() = 0;

    /**
     * Write raw data (one JSON record + newline) to the process input.
     * Throws AgentConnectionError when input is closed or the process is gone.
     */
    virtual void write(const std::string& data) = 0;

    /**
     * Return decoded events in stream order. Blocks briefly (about 100 ms)
     * when nothing is queued; an empty result does not mean end of stream.
     */
    virtual std::vector<ProtocolEvent> read_events() = 0;

    /**
     * False once the output stream ended and every queued event was read.
     */
    virtual bool has_events() const = 0;

    /**
     * Close the process input. Idempotent.
     */
    virtual void end_input() = 0;

    /**
     * Stop the process tree: SIGTERM to the process group, escalating to
     * SIGKILL after the configured grace period.
     */
    virtual void terminate() = 0;

    /**
     * Block until the process exited and return its exit code
     * (128 + signal number when killed by a signal).
     */
    virtual int wait_for_exit() = 0;

    /**
     * Stderr text captured so far.
     */
    virtual std::string diagnostics() const = 0;

    /**
     * Release all resources, terminating the process if still running.
     */
    virtual void close() = 0;

    // True while input is open and the process is alive
    virtual bool is_ready() const = 0;

    virtual bool is_running() const = 0;

    virtual long get_pid() const { return 0; }
};

using TransportFactory = std::function<std::unique_ptr<Transport>(
    const AgentOptions& options, const std::vector<std::string>& args)>;

// Factory for the default subprocess transport
std::unique_ptr<Transport> create_subprocess_transport(const AgentOptions& options,
                                                       const std::vector<std::string>& args);

} // namespace agentchat

#endif // AGENTCHAT_TRANSPORT_HPP
