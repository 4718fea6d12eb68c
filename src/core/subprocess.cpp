#include "core/subprocess.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

namespace
{
    std::once_flag sigpipe_once;

    // Writes to a pipe whose reader exited must surface as EPIPE, not kill the server
    void ignoreSigpipe()
    {
        std::call_once(sigpipe_once, []
                       { signal(SIGPIPE, SIG_IGN); });
    }

    std::string errnoText(const std::string &what)
    {
        return what + ": " + std::strerror(errno);
    }
}

Subprocess::Subprocess(std::vector<std::string> argv)
    : Subprocess(std::move(argv), Options())
{
}

Subprocess::Subprocess(std::vector<std::string> argv, Options options)
    : argv_(std::move(argv)), options_(options)
{
    if (argv_.empty())
    {
        throw std::invalid_argument("Subprocess: empty argument vector");
    }
}

Subprocess::~Subprocess()
{
    // Never leave a zombie or a running child behind
    closeStdin();
    if (pid_ > 0 && !exited_.load())
    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        int status = 0;
        if (!reapLocked(false, status))
        {
            kill(pid_, SIGKILL);
            reapLocked(true, status);
        }
    }
    joinDrainThreads();
    closeFd(stdout_fd_);
    closeFd(stderr_fd_);
}

void Subprocess::start()
{
    ignoreSigpipe();

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};

    // Pipes are close-on-exec; the child keeps only the ends it dup2s
    auto close_all = [&]()
    {
        for (int *p : {in_pipe, out_pipe, err_pipe, exec_pipe})
        {
            closeFd(p[0]);
            closeFd(p[1]);
        }
    };

    if ((options_.pipe_stdin && pipe2(in_pipe, O_CLOEXEC) != 0) ||
        pipe2(out_pipe, O_CLOEXEC) != 0 ||
        pipe2(err_pipe, O_CLOEXEC) != 0 ||
        pipe2(exec_pipe, O_CLOEXEC) != 0)
    {
        std::string message = errnoText("Subprocess: pipe creation failed");
        close_all();
        throw std::runtime_error(message);
    }

    // Build argv before fork; the child may only use async-signal-safe calls
    std::vector<char *> c_argv;
    c_argv.reserve(argv_.size() + 1);
    for (auto &arg : argv_)
    {
        c_argv.push_back(const_cast<char *>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0)
    {
        std::string message = errnoText("Subprocess: fork failed");
        close_all();
        throw std::runtime_error(message);
    }

    if (pid == 0)
    {
        // Child: wire up stdio, then exec
        if (options_.pipe_stdin)
        {
            dup2(in_pipe[0], STDIN_FILENO);
        }
        else
        {
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0)
                dup2(devnull, STDIN_FILENO);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);

        execvp(c_argv[0], c_argv.data());

        // Only reached if exec failed; report errno to the parent
        int error = errno;
        ssize_t ignored = write(exec_pipe[1], &error, sizeof(error));
        (void)ignored;
        _exit(127);
    }

    // Parent: drop the child's ends
    pid_ = pid;
    closeFd(in_pipe[0]);
    closeFd(out_pipe[1]);
    closeFd(err_pipe[1]);
    closeFd(exec_pipe[1]);

    // exec_pipe is close-on-exec: EOF means exec succeeded, data means it failed
    int exec_errno = 0;
    ssize_t n;
    do
    {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    closeFd(exec_pipe[0]);

    if (n > 0)
    {
        closeFd(in_pipe[1]);
        closeFd(out_pipe[0]);
        closeFd(err_pipe[0]);
        std::lock_guard<std::mutex> lock(process_mutex_);
        int status = 0;
        reapLocked(true, status);
        throw std::runtime_error("Subprocess: failed to execute '" + argv_[0] + "': " + std::strerror(exec_errno));
    }

    // Drain both outputs so a chatty child never blocks on a full pipe
    stdin_fd_ = in_pipe[1];
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];

    stdout_thread_ = std::thread(&Subprocess::drainStdout, this);
    stderr_thread_ = std::thread(&Subprocess::drainStderr, this);

    Logger::debug("Subprocess: started '" + argv_[0] + "' (pid " + std::to_string(pid_) + ")");
}

bool Subprocess::writeStdin(const char *data, size_t length)
{
    if (stdin_fd_ < 0)
    {
        return false;
    }

    size_t written = 0;
    while (written < length)
    {
        ssize_t n = write(stdin_fd_, data + written, length - written);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            // Reader closed its end
            if (errno == EPIPE)
                return false;
            throw std::runtime_error(errnoText("Subprocess: write to stdin failed"));
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

void Subprocess::closeStdin()
{
    closeFd(stdin_fd_);
}

int Subprocess::wait()
{
    int status = 0;
    // Poll rather than block so terminate() can take the lock meanwhile
    for (;;)
    {
        {
            std::lock_guard<std::mutex> lock(process_mutex_);
            if (reapLocked(false, status))
                break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    joinDrainThreads();
    return status;
}

bool Subprocess::tryWait(int &status)
{
    std::lock_guard<std::mutex> lock(process_mutex_);
    return reapLocked(false, status);
}

void Subprocess::terminate(std::chrono::milliseconds grace)
{
    int status = 0;
    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        if (pid_ <= 0 || reapLocked(false, status))
            return;
        Logger::debug("Subprocess: sending SIGTERM to pid " + std::to_string(pid_));
        kill(pid_, SIGTERM);
    }

    // Give it the grace period to exit on its own
    auto give_up = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < give_up)
    {
        {
            std::lock_guard<std::mutex> lock(process_mutex_);
            if (reapLocked(false, status))
                return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    std::lock_guard<std::mutex> lock(process_mutex_);
    if (!reapLocked(false, status))
    {
        Logger::warn("Subprocess: pid " + std::to_string(pid_) + " ignored SIGTERM, sending SIGKILL");
        kill(pid_, SIGKILL);
        reapLocked(true, status);
    }
}

bool Subprocess::reapLocked(bool block, int &status)
{
    if (exited_.load())
    {
        status = exit_status_;
        return true;
    }
    if (pid_ <= 0)
    {
        return false;
    }

    pid_t result;
    do
    {
        result = waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == pid_)
    {
        exit_status_ = status;
        exited_.store(true);
        return true;
    }
    if (result < 0)
    {
        // ECHILD: nothing left to reap, treat as killed
        exit_status_ = SIGKILL;
        status = exit_status_;
        exited_.store(true);
        return true;
    }
    return false;
}

void Subprocess::drainStdout()
{
    char buffer[16384];
    for (;;)
    {
        ssize_t n = read(stdout_fd_, buffer, sizeof(buffer));
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            break;

        // Keep the head up to the limit, discard the rest
        std::lock_guard<std::mutex> lock(output_mutex_);
        size_t room = options_.stdout_limit_bytes > stdout_buffer_.size()
                          ? options_.stdout_limit_bytes - stdout_buffer_.size()
                          : 0;
        size_t take = std::min(room, static_cast<size_t>(n));
        stdout_buffer_.append(buffer, take);
        if (take < static_cast<size_t>(n))
            stdout_truncated_ = true;
    }
}

void Subprocess::drainStderr()
{
    char buffer[4096];
    for (;;)
    {
        ssize_t n = read(stderr_fd_, buffer, sizeof(buffer));
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            break;

        std::lock_guard<std::mutex> lock(output_mutex_);
        // Keep only the newest bytes
        stderr_tail_.append(buffer, static_cast<size_t>(n));
        if (stderr_tail_.size() > options_.stderr_tail_bytes)
        {
            stderr_tail_.erase(0, stderr_tail_.size() - options_.stderr_tail_bytes);
        }
    }
}

void Subprocess::joinDrainThreads()
{
    if (stdout_thread_.joinable())
        stdout_thread_.join();
    if (stderr_thread_.joinable())
        stderr_thread_.join();
}

void Subprocess::closeFd(int &fd)
{
    if (fd >= 0)
    {
        close(fd);
        fd = -1;
    }
}

std::string Subprocess::stdoutText() const
{
    std::lock_guard<std::mutex> lock(output_mutex_);
    if (stdout_truncated_)
    {
        Logger::warn("Subprocess: stdout of '" + argv_[0] + "' exceeded " +
                     std::to_string(options_.stdout_limit_bytes) + " bytes and was truncated");
    }
    return stdout_buffer_;
}

std::string Subprocess::stderrTail() const
{
    std::lock_guard<std::mutex> lock(output_mutex_);
    return stderr_tail_;
}

bool Subprocess::succeeded(int status)
{
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

std::string Subprocess::describeStatus(int status)
{
    if (WIFEXITED(status))
        return "exit code " + std::to_string(WEXITSTATUS(status));
    if (WIFSIGNALED(status))
        return "killed by signal " + std::to_string(WTERMSIG(status));
    return "status " + std::to_string(status);
}
