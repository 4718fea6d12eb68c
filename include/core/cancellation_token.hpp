#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>

/**
 * @brief Cooperative cancellation for one clip request
 *
 * A token is cancelled when cancel() is called, when its deadline passes, or when
 * the optional external predicate (e.g. process shutdown) reports true.
 * Thread-safe; the request thread, the transcoder watchdog and the remote
 * reader all poll the same token.
 */
class CancellationToken
{
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() : deadline_(Clock::time_point::max()) {}

    explicit CancellationToken(Clock::duration budget, std::function<bool()> external = nullptr)
        : deadline_(Clock::now() + budget), external_(std::move(external)) {}

    CancellationToken(const CancellationToken &) = delete;
    CancellationToken &operator=(const CancellationToken &) = delete;

    void cancel(const std::string &reason = "cancelled")
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!cancelled_.load())
            {
                reason_ = reason;
            }
            cancelled_.store(true);
        }
        cv_.notify_all();
    }

    bool isCancelled() const
    {
        return cancelled_.load() || deadlineExceeded() || (external_ && external_());
    }

    bool deadlineExceeded() const
    {
        return deadline_ != Clock::time_point::max() && Clock::now() >= deadline_;
    }

    /**
     * @brief Human-readable cause, valid once isCancelled() returned true
     */
    std::string reason() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.load())
            return reason_;
        if (deadlineExceeded())
            return "request time budget exceeded";
        return "server shutting down";
    }

    /**
     * @brief Sleep up to @p interval, waking early on cancel()
     * @return true if the token is cancelled on return
     */
    bool waitFor(Clock::duration interval) const
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, interval, [this]
                     { return cancelled_.load(); });
        lock.unlock();
        return isCancelled();
    }


private:
    std::atomic<bool> cancelled_{false};
    Clock::time_point deadline_;
    std::function<bool()> external_;
    std::string reason_;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};
