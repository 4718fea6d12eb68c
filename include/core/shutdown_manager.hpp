#pragma once

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

/**
 * Process-wide shutdown coordination.
 *
 * Signal handlers only raise a sig_atomic_t flag. A watcher thread turns the flag
 * into a shutdown request, which wakes waitForShutdown(). Hooks registered with
 * addShutdownHook() run once, in reverse registration order, from runShutdownHooks().
 * In-flight clip requests poll isShutdownRequested() through their cancellation token.
 */
class ShutdownManager
{
public:
    static ShutdownManager &getInstance();

    void installSignalHandlers();

    void requestShutdown(const std::string &reason, int signal_number = 0) noexcept;
    bool isShutdownRequested() const noexcept { return shutdown_requested_.load(); }
    void waitForShutdown();

    int getSignalNumber() const noexcept { return last_signal_.load(); }
    std::string getReason() const;

    void addShutdownHook(const std::string &name, std::function<void()> hook);
    void runShutdownHooks();

    // Test support
    void reset() noexcept;

private:
    ShutdownManager() = default;
    ~ShutdownManager();
    ShutdownManager(const ShutdownManager &) = delete;
    ShutdownManager &operator=(const ShutdownManager &) = delete;

    static void handleSignal(int sig) noexcept;

    void startWatcher();
    void stopWatcher();

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<int> last_signal_{0};
    std::string reason_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::mutex hooks_mutex_;
    std::vector<std::pair<std::string, std::function<void()>>> hooks_;

    std::thread watcher_;
    std::atomic<bool> watcher_running_{false};

    static volatile sig_atomic_t signal_flag_;
    static volatile sig_atomic_t signal_num_;
};
