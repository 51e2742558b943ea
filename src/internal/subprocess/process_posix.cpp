// POSIX implementation of subprocess process management
// For Linux and macOS

#include "process.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <pthread.h>
#include <signal.h>
#include <stdexcept>
#include <sys/select.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

extern char** environ;

namespace agentchat
{
namespace subprocess
{

// ============================================================================
// ProcessHandle - POSIX implementation
// ============================================================================

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    bool group_leader = false;
    int exit_code = -1;
};

// ============================================================================
// PipeHandle - POSIX implementation
// ============================================================================

struct PipeHandle
{
    int fd = -1;

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

// ============================================================================
// Helper functions
// ============================================================================

namespace
{

std::string get_errno_message(int err = errno)
{
    return std::strerror(err);
}

// Both ends of a pipe(2); closes whatever is still owned on destruction
struct PipePair
{
    int fds[2] = {-1, -1};

    void open(const char* what, bool cloexec = false)
    {
        if (::pipe(fds) != 0)
            throw std::runtime_error(std::string("Failed to create ") + what +
                                     " pipe: " + get_errno_message());
        if (cloexec)
        {
            ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
            ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
        }
    }

    int release(int end)
    {
        int fd = fds[end];
        fds[end] = -1;
        return fd;
    }

    void close_end(int end)
    {
        if (fds[end] >= 0)
        {
            ::close(fds[end]);
            fds[end] = -1;
        }
    }

    ~PipePair()
    {
        close_end(0);
        close_end(1);
    }
};

// Keeps SIGPIPE blocked for the calling thread while writing to a pipe whose
// reader may already be gone, and swallows the signal if the write raised it.
class SigpipeGuard
{
  public:
    SigpipeGuard()
    {
        sigemptyset(&sigpipe_);
        sigaddset(&sigpipe_, SIGPIPE);

        sigset_t pending;
        sigemptyset(&pending);
        sigpending(&pending);
        was_pending_ = sigismember(&pending, SIGPIPE) == 1;

        pthread_sigmask(SIG_BLOCK, &sigpipe_, &old_mask_);
    }

    ~SigpipeGuard()
    {
        if (!was_pending_)
        {
            struct timespec zero = {0, 0};
            while (sigtimedwait(&sigpipe_, nullptr, &zero) == -1 && errno == EINTR)
            {
            }
        }
        pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
    }

  private:
    sigset_t sigpipe_;
    sigset_t old_mask_;
    bool was_pending_ = false;
};

int decode_wait_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

// Child side of spawn(); never returns
void exec_child(const std::string& executable, const std::vector<std::string>& args,
                const ProcessOptions& options, PipePair& in, PipePair& out, PipePair& err,
                PipePair& exec_status)
{
    auto fail = [&exec_status](int code)
    {
        int saved = code;
        ssize_t ignored = ::write(exec_status.fds[1], &saved, sizeof(saved));
        (void)ignored;
        _exit(127);
    };

    if (options.new_process_group && setpgid(0, 0) != 0)
        fail(errno);

    if (options.redirect_stdin && dup2(in.fds[0], STDIN_FILENO) < 0)
        fail(errno);
    if (options.redirect_stdout && dup2(out.fds[1], STDOUT_FILENO) < 0)
        fail(errno);
    if (options.redirect_stderr && dup2(err.fds[1], STDERR_FILENO) < 0)
        fail(errno);

    for (PipePair* pair : {&in, &out, &err})
    {
        pair->close_end(0);
        pair->close_end(1);
    }

    if (!options.working_directory.empty() && chdir(options.working_directory.c_str()) != 0)
        fail(errno);

    if (!options.inherit_environment)
    {
#if defined(__linux__)
        clearenv();
#else
        if (environ)
            environ[0] = nullptr;
#endif
    }
    for (const auto& [key, value] : options.environment)
        setenv(key.c_str(), value.c_str(), 1);

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    execvp(executable.c_str(), argv.data());
    fail(errno);
    _exit(127);
}

} // namespace

// ============================================================================
// ReadPipe implementation
// ============================================================================

ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}

ReadPipe::~ReadPipe()
{
    close();
}

ReadPipe::ReadPipe(ReadPipe&&) noexcept = default;
ReadPipe& ReadPipe::operator=(ReadPipe&&) noexcept = default;

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");

    for (;;)
    {
        ssize_t bytes_read = ::read(handle_->fd, buffer, size);
        if (bytes_read >= 0)
            return static_cast<size_t>(bytes_read);
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return 0;
        throw std::runtime_error("Read failed: " + get_errno_message());
    }
}

bool ReadPipe::has_data(int timeout_ms)
{
    if (!is_open())
        return false;

    fd_set read_fds;
    FD_ZERO(&read_fds);
    FD_SET(handle_->fd, &read_fds);

    struct timeval timeout;
    timeout.tv_sec = timeout_ms / 1000;
    timeout.tv_usec = (timeout_ms % 1000) * 1000;

    int result = select(handle_->fd + 1, &read_fds, nullptr, nullptr, &timeout);
    if (result < 0)
    {
        if (errno == EINTR)
            return false;
        throw std::runtime_error("select failed: " + get_errno_message());
    }

    return result > 0 && FD_ISSET(handle_->fd, &read_fds);
}

void ReadPipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool ReadPipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// ============================================================================
// WritePipe implementation
// ============================================================================

WritePipe::WritePipe() : handle_(std::make_unique<PipeHandle>()) {}

WritePipe::~WritePipe()
{
    close();
}

WritePipe::WritePipe(WritePipe&&) noexcept = default;
WritePipe& WritePipe::operator=(WritePipe&&) noexcept = default;

size_t WritePipe::write(const char* data, size_t size)
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");

    SigpipeGuard guard;
    size_t total = 0;
    while (total < size)
    {
        ssize_t written = ::write(handle_->fd, data + total, size - total);
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
                throw std::runtime_error("Broken pipe (process closed stdin)");
            throw std::runtime_error("Write failed: " + get_errno_message());
        }
        total += static_cast<size_t>(written);
    }

    return total;
}

size_t WritePipe::write(const std::string& data)
{
    return write(data.data(), data.size());
}

void WritePipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool WritePipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// ============================================================================
// Process implementation
// ============================================================================

Process::Process() : handle_(std::make_unique<ProcessHandle>()) {}

Process::~Process()
{
    if (handle_ && handle_->running)
    {
        kill();
        wait();
    }
}

Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const ProcessOptions& options)
{
    PipePair in, out, err, exec_status;
    if (options.redirect_stdin)
        in.open("stdin");
    if (options.redirect_stdout)
        out.open("stdout");
    if (options.redirect_stderr)
        err.open("stderr");
    // Closed by a successful exec; carries errno back otherwise
    exec_status.open("exec status", true);

    pid_t pid = fork();
    if (pid < 0)
        throw std::runtime_error("Failed to fork process: " + get_errno_message());

    if (pid == 0)
        exec_child(executable, args, options, in, out, err, exec_status);

    // Parent process
    exec_status.close_end(1);
    int child_errno = 0;
    ssize_t n;
    do
    {
        n = ::read(exec_status.fds[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n > 0)
    {
        int status = 0;
        waitpid(pid, &status, 0);
        throw std::runtime_error("Failed to execute '" + executable +
                                 "': " + get_errno_message(child_errno));
    }

    if (options.redirect_stdin)
    {
        stdin_ = std::make_unique<WritePipe>();
        stdin_->handle_->fd = in.release(1);
    }
    if (options.redirect_stdout)
    {
        stdout_ = std::make_unique<ReadPipe>();
        stdout_->handle_->fd = out.release(0);
    }
    if (options.redirect_stderr)
    {
        stderr_ = std::make_unique<ReadPipe>();
        stderr_->handle_->fd = err.release(0);
    }

    handle_->pid = pid;
    handle_->running = true;
    handle_->group_leader = options.new_process_group;
    handle_->exit_code = -1;
}

WritePipe& Process::stdin_pipe()
{
    if (!stdin_)
        throw std::runtime_error("stdin not redirected");
    return *stdin_;
}

ReadPipe& Process::stdout_pipe()
{
    if (!stdout_)
        throw std::runtime_error("stdout not redirected");
    return *stdout_;
}

ReadPipe& Process::stderr_pipe()
{
    if (!stderr_)
        throw std::runtime_error("stderr not redirected");
    return *stderr_;
}

bool Process::is_running() const
{
    if (!handle_ || handle_->pid == 0 || !handle_->running)
        return false;

    // Exited children stay visible to kill(0) until reaped
    int status = 0;
    pid_t result = waitpid(handle_->pid, &status, WNOHANG);
    if (result == handle_->pid)
    {
        handle_->exit_code = decode_wait_status(status);
        handle_->running = false;
        return false;
    }

    return result == 0;
}

std::optional<int> Process::try_wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result = waitpid(handle_->pid, &status, WNOHANG);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_wait_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }
    else if (result == 0)
    {
        return std::nullopt;
    }

    throw std::runtime_error("waitpid failed: " + get_errno_message());
}

int Process::wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result;
    do
    {
        result = waitpid(handle_->pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_wait_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }

    throw std::runtime_error("waitpid failed: " + get_errno_message());
}

void Process::signal(int signo)
{
    if (!handle_ || handle_->pid <= 0 || !handle_->running)
        return;

    // Negative pid addresses the whole process group
    if (handle_->group_leader && ::kill(-handle_->pid, signo) == 0)
        return;
    ::kill(handle_->pid, signo);
}

void Process::terminate()
{
    signal(SIGTERM);
}

void Process::kill()
{
    signal(SIGKILL);
}

int Process::pid() const
{
    return handle_ ? static_cast<int>(handle_->pid) : 0;
}

// ============================================================================
// Helper functions
// ============================================================================

std::optional<std::string> find_executable(const std::string& name)
{
    namespace fs = std::filesystem;

    auto is_executable = [](const fs::path& p)
    {
        std::error_code ec;
        return fs::is_regular_file(p, ec) && access(p.c_str(), X_OK) == 0;
    };

    // Absolute or relative path given explicitly
    if (name.find('/') != std::string::npos)
    {
        if (is_executable(name))
            return fs::absolute(name).string();
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env)
        return std::nullopt;

    std::string path_str(path_env);
    size_t start = 0;
    while (start <= path_str.size())
    {
        size_t end = path_str.find(':', start);
        if (end == std::string::npos)
            end = path_str.size();

        std::string dir = path_str.substr(start, end - start);
        if (!dir.empty())
        {
            fs::path candidate = fs::path(dir) / name;
            if (is_executable(candidate))
                return candidate.string();
        }
        start = end + 1;
    }

    return std::nullopt;
}

} // namespace subprocess
} // namespace agentchat
