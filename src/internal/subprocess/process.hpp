#ifndef AGENTCHAT_SUBPROCESS_PROCESS_HPP
#define AGENTCHAT_SUBPROCESS_PROCESS_HPP

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentchat
{
namespace subprocess
{

struct ProcessHandle;
struct PipeHandle;

/**
 * Parent end of a child's stdout or stderr.
 *
 * The transport polls with has_data() and pulls raw chunks with read();
 * framing into records happens above this layer.
 */
class ReadPipe
{
  public:
    ReadPipe();
    ~ReadPipe();

    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;
    ReadPipe(ReadPipe&&) noexcept;
    ReadPipe& operator=(ReadPipe&&) noexcept;

    // Bytes read; 0 means EOF. Throws std::runtime_error on a read error.
    size_t read(char* buffer, size_t size);

    // True once data or EOF is readable within timeout_ms
    bool has_data(int timeout_ms = 0);

    void close();
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

// Parent end of a child's stdin. Turn records and permission decisions go here.
class WritePipe
{
  public:
    WritePipe();
    ~WritePipe();

    WritePipe(const WritePipe&) = delete;
    WritePipe& operator=(const WritePipe&) = delete;
    WritePipe(WritePipe&&) noexcept;
    WritePipe& operator=(WritePipe&&) noexcept;

    // Writes everything; a closed reader throws rather than raising SIGPIPE
    size_t write(const char* data, size_t size);
    size_t write(const std::string& data);

    void close();
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

struct ProcessOptions
{
    std::string working_directory;
    // Overrides layered on the parent environment (or the whole environment
    // when inherit_environment is false)
    std::map<std::string, std::string> environment;
    bool inherit_environment = true;
    bool redirect_stdin = true;
    bool redirect_stdout = true;
    bool redirect_stderr = false;
    // Make the child a process group leader; terminate() and kill() then
    // reach every process the agent started
    bool new_process_group = false;
};

/**
 * One spawned child with optional redirected stdio.
 *
 * Exit codes follow the shell convention: a child killed by signal N
 * reports 128 + N.
 */
class Process
{
  public:
    Process();
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) noexcept;
    Process& operator=(Process&&) noexcept;

    // Throws std::runtime_error when the pipes cannot be created or exec fails
    void spawn(const std::string& executable, const std::vector<std::string>& args,
               const ProcessOptions& options = {});

    // Valid only for streams that were redirected
    WritePipe& stdin_pipe();
    ReadPipe& stdout_pipe();
    ReadPipe& stderr_pipe();

    bool is_running() const;
    std::optional<int> try_wait();
    int wait();
    void terminate(); // SIGTERM
    void kill();      // SIGKILL

    int pid() const;

  private:
    std::unique_ptr<ProcessHandle> handle_;
    std::unique_ptr<WritePipe> stdin_;
    std::unique_ptr<ReadPipe> stdout_;
    std::unique_ptr<ReadPipe> stderr_;

    void signal(int signo);
};

// Search PATH for an executable file named `name`
std::optional<std::string> find_executable(const std::string& name);

} // namespace subprocess
} // namespace agentchat

#endif // AGENTCHAT_SUBPROCESS_PROCESS_HPP
