#pragma once

#include "../src/internal/event_decoder.hpp"
#include "../src/internal/subprocess/process.hpp"

#include <agentchat/errors.hpp>
#include <agentchat/transport.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <vector>

namespace agentchat::test
{

inline bool is_ci_environment()
{
    const char* ci_vars[] = {
        "CI",                 // Generic (GitHub Actions, GitLab CI, etc.)
        "GITHUB_ACTIONS",     // GitHub Actions
        "GITLAB_CI",          // GitLab CI
        "JENKINS_URL",        // Jenkins
        "BUILDKITE",          // Buildkite
    };

    for (const char* var : ci_vars)
    {
        const char* value = std::getenv(var);
        if (value != nullptr && value[0] != '\0')
            return true;
    }
    return false;
}

inline bool has_env_flag(const char* name)
{
    const char* value = std::getenv(name);
    return value != nullptr && value[0] != '\0' && std::string(value) != "0";
}

inline bool is_agent_available()
{
    if (const char* path = std::getenv("AGENTCHAT_AGENT_PATH"); path != nullptr && path[0] != '\0')
        return true;
    return agentchat::subprocess::find_executable("claude").has_value();
}

inline bool should_run_live_tests()
{
    if (is_ci_environment())
        return false;

    if (!has_env_flag("AGENTCHAT_RUN_LIVE_TESTS"))
        return false;

    return is_agent_available();
}

// ============================================================================
// Scripted transport
// ============================================================================

// State shared between a test and the transports its factory creates
struct TransportScript
{
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<ProtocolEvent> queue;
    bool finished = false;
    int exit_code = 0;
    std::string diagnostics;
    std::vector<std::string> writes;
    std::vector<std::vector<std::string>> launches;
    bool input_closed = false;
    bool terminated = false;
    bool fail_connect = false;
    // When set, write() throws std::runtime_error with this text
    std::string fail_write;

    // Queue one agent stdout line; malformed lines are dropped like the real decoder does
    void push_line(const std::string& line)
    {
        auto event = agentchat::protocol::EventDecoder::decode(line);
        std::lock_guard<std::mutex> lock(mutex);
        if (event)
            queue.push_back(std::move(*event));
        cv.notify_all();
    }

    // Close stdout and exit with the given code
    void finish(int code = 0, const std::string& stderr_text = "")
    {
        std::lock_guard<std::mutex> lock(mutex);
        exit_code = code;
        diagnostics = stderr_text;
        finished = true;
        cv.notify_all();
    }

    std::vector<std::string> written()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return writes;
    }

    size_t launch_count()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return launches.size();
    }

    bool was_terminated()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return terminated;
    }

    // Reuse the script for another run
    void reset_run()
    {
        std::lock_guard<std::mutex> lock(mutex);
        queue.clear();
        finished = false;
        exit_code = 0;
        diagnostics.clear();
        input_closed = false;
        terminated = false;
    }

    // Poll until `count` records were written to the agent
    bool wait_for_writes(size_t count, int timeout_ms = 2000)
    {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                           [&] { return writes.size() >= count; });
    }
};

class ScriptedTransport : public Transport
{
  public:
    ScriptedTransport(std::shared_ptr<TransportScript> script, std::vector<std::string> args)
        : script_(std::move(script)), args_(std::move(args))
    {
    }

    void connect() override
    {
        std::lock_guard<std::mutex> lock(script_->mutex);
        if (script_->fail_connect)
            throw AgentNotInstalledError("agent executable not found");
        script_->launches.push_back(args_);
        connected_ = true;
    }

    void write(const std::string& data) override
    {
        std::lock_guard<std::mutex> lock(script_->mutex);
        if (!script_->fail_write.empty())
            throw std::runtime_error(script_->fail_write);
        if (!connected_ || script_->input_closed || script_->finished)
            throw AgentConnectionError("Agent input is closed");
        script_->writes.push_back(data);
        script_->cv.notify_all();
    }

    std::vector<ProtocolEvent> read_events() override
    {
        std::unique_lock<std::mutex> lock(script_->mutex);
        script_->cv.wait_for(lock, std::chrono::milliseconds(100),
                             [this] { return !script_->queue.empty() || script_->finished; });

        std::vector<ProtocolEvent> events(script_->queue.begin(), script_->queue.end());
        script_->queue.clear();
        return events;
    }

    bool has_events() const override
    {
        std::lock_guard<std::mutex> lock(script_->mutex);
        return !script_->finished || !script_->queue.empty();
    }

    void end_input() override
    {
        std::lock_guard<std::mutex> lock(script_->mutex);
        script_->input_closed = true;
    }

    void terminate() override
    {
        std::lock_guard<std::mutex> lock(script_->mutex);
        script_->terminated = true;
        if (!script_->finished)
        {
            script_->finished = true;
            script_->exit_code = 128 + 15;
        }
        script_->cv.notify_all();
    }

    int wait_for_exit() override
    {
        std::unique_lock<std::mutex> lock(script_->mutex);
        script_->cv.wait(lock, [this] { return script_->finished; });
        return script_->exit_code;
    }

    std::string diagnostics() const override
    {
        std::lock_guard<std::mutex> lock(script_->mutex);
        return script_->diagnostics;
    }

    void close() override
    {
        terminate();
    }

    bool is_ready() const override
    {
        std::lock_guard<std::mutex> lock(script_->mutex);
        return connected_ && !script_->input_closed && !script_->finished;
    }

    bool is_running() const override
    {
        std::lock_guard<std::mutex> lock(script_->mutex);
        return connected_ && !script_->finished;
    }

  private:
    std::shared_ptr<TransportScript> script_;
    std::vector<std::string> args_;
    bool connected_ = false;
};

inline TransportFactory scripted_factory(std::shared_ptr<TransportScript> script)
{
    return [script](const AgentOptions&, const std::vector<std::string>& args)
    { return std::make_unique<ScriptedTransport>(script, args); };
}

// ============================================================================
// Filesystem helpers
// ============================================================================

// Unique scratch directory, removed on destruction
class TempDir
{
  public:
    TempDir()
    {
        std::string pattern =
            (std::filesystem::temp_directory_path() / "agentchat_test_XXXXXX").string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (mkdtemp(buffer.data()) == nullptr)
            throw std::runtime_error("mkdtemp failed");
        path_ = buffer.data();
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }

    std::string file(const std::string& name) const { return path_ + "/" + name; }

  private:
    std::string path_;
};

// Write an executable /bin/sh script standing in for the agent
inline std::string write_agent_script(const TempDir& dir, const std::string& body)
{
    std::string path = dir.file("fake-agent.sh");
    {
        std::ofstream out(path);
        out << "#!/bin/sh\n" << body << "\n";
    }
    chmod(path.c_str(), 0755);
    return path;
}

} // namespace agentchat::test

#define SKIP_IN_CI()                                                                               \
    do                                                                                             \
    {                                                                                              \
        if (!agentchat::test::should_run_live_tests())                                             \
        {                                                                                          \
            GTEST_SKIP() << "Skipped live agent test (set "                                        \
                            "AGENTCHAT_RUN_LIVE_TESTS=1 and ensure `claude` "                      \
                            "is in PATH or set AGENTCHAT_AGENT_PATH)";                             \
        }                                                                                          \
    } while (0)
