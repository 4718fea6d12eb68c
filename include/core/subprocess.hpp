#pragma once

#include <sys/types.h>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief RAII wrapper around a forked child process with piped stdio
 *
 * stdout and stderr are drained on background threads so the child never blocks
 * on a full pipe. stdout is kept up to a byte limit, stderr only as a rolling
 * tail for diagnostics. When stdin is piped the caller feeds it with
 * writeStdin() and signals EOF with closeStdin().
 *
 * The destructor kills and reaps a child that is still running.
 */
class Subprocess
{
public:
    struct Options
    {
        bool pipe_stdin = false;
        size_t stdout_limit_bytes = 64 * 1024 * 1024;
        size_t stderr_tail_bytes = 8192;
    };

    explicit Subprocess(std::vector<std::string> argv);
    Subprocess(std::vector<std::string> argv, Options options);
    ~Subprocess();

    Subprocess(const Subprocess &) = delete;
    Subprocess &operator=(const Subprocess &) = delete;

    /**
     * @brief Fork and exec the child
     * @throws std::runtime_error if pipes cannot be created, fork fails or exec fails
     */
    void start();

    /**
     * @brief Write a chunk to the child's stdin
     * @return false if the child closed its end of the pipe
     * @throws std::runtime_error on any other write error
     */
    bool writeStdin(const char *data, size_t length);

    void closeStdin();

    /**
     * @brief Block until the child exits and the drain threads finish
     * @return Raw wait status as produced by waitpid()
     */
    int wait();

    /**
     * @brief Non-blocking exit check
     * @return true if the child has exited (status is then valid)
     */
    bool tryWait(int &status);

    /**
     * @brief SIGTERM, then SIGKILL if the child is still alive after @p grace
     */
    void terminate(std::chrono::milliseconds grace);

    bool hasExited() const { return exited_.load(); }
    pid_t pid() const { return pid_; }

    std::string stdoutText() const;
    std::string stderrTail() const;

    /**
     * @brief Whether a raw wait status means "exited with code 0"
     */
    static bool succeeded(int status);

    /**
     * @brief Describe a raw wait status, e.g. "exit code 1" or "killed by signal 9"
     */
    static std::string describeStatus(int status);

private:
    bool reapLocked(bool block, int &status);
    void drainStdout();
    void drainStderr();
    void joinDrainThreads();
    void closeFd(int &fd);

    std::vector<std::string> argv_;
    Options options_;

    pid_t pid_{-1};
    int stdin_fd_{-1};
    int stdout_fd_{-1};
    int stderr_fd_{-1};

    std::thread stdout_thread_;
    std::thread stderr_thread_;

    mutable std::mutex output_mutex_;
    std::string stdout_buffer_;
    std::string stderr_tail_;
    bool stdout_truncated_{false};

    mutable std::mutex process_mutex_;
    std::atomic<bool> exited_{false};
    int exit_status_{0};
};
