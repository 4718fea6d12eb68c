#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <chrono>

volatile sig_atomic_t ShutdownManager::signal_flag_ = 0;
volatile sig_atomic_t ShutdownManager::signal_num_ = 0;

ShutdownManager &ShutdownManager::getInstance()
{
    static ShutdownManager instance;
    return instance;
}

ShutdownManager::~ShutdownManager()
{
    stopWatcher();
}

void ShutdownManager::installSignalHandlers()
{
    struct sigaction action{};
    action.sa_handler = &ShutdownManager::handleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;

    for (int sig : {SIGINT, SIGTERM, SIGQUIT})
    {
        if (sigaction(sig, &action, nullptr) != 0)
        {
            Logger::warn("ShutdownManager: could not install handler for signal " + std::to_string(sig));
        }
    }

    startWatcher();
    Logger::info("ShutdownManager: signal handlers installed");
}

void ShutdownManager::handleSignal(int sig) noexcept
{
    signal_num_ = sig;
    signal_flag_ = 1;
}

void ShutdownManager::startWatcher()
{
    if (watcher_running_.exchange(true))
    {
        return;
    }
    watcher_ = std::thread([this]()
                           {
        while (watcher_running_.load() && !shutdown_requested_.load())
        {
            if (signal_flag_)
            {
                int sig = signal_num_;
                signal_flag_ = 0;
                requestShutdown("signal received", sig);
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        } });
}

void ShutdownManager::stopWatcher()
{
    watcher_running_.store(false);
    if (watcher_.joinable())
    {
        watcher_.join();
    }
}

void ShutdownManager::requestShutdown(const std::string &reason, int signal_number) noexcept
{
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (shutdown_requested_.load())
        {
            return;
        }
        reason_ = reason;
        last_signal_.store(signal_number);
        shutdown_requested_.store(true);
    }
    cv_.notify_all();

    if (signal_number != 0)
    {
        Logger::info("ShutdownManager: received signal " + std::to_string(signal_number) + ", shutting down");
    }
    else
    {
        Logger::info("ShutdownManager: shutdown requested: " + reason);
    }
}

void ShutdownManager::waitForShutdown()
{
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait(lk, [this]
             { return shutdown_requested_.load(); });
}

std::string ShutdownManager::getReason() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return reason_;
}

void ShutdownManager::addShutdownHook(const std::string &name, std::function<void()> hook)
{
    std::lock_guard<std::mutex> lk(hooks_mutex_);
    hooks_.emplace_back(name, std::move(hook));
}

void ShutdownManager::runShutdownHooks()
{
    std::vector<std::pair<std::string, std::function<void()>>> hooks;
    {
        std::lock_guard<std::mutex> lk(hooks_mutex_);
        hooks.swap(hooks_);
    }

    for (auto it = hooks.rbegin(); it != hooks.rend(); ++it)
    {
        Logger::debug("ShutdownManager: running hook '" + it->first + "'");
        try
        {
            it->second();
        }
        catch (const std::exception &e)
        {
            Logger::error("ShutdownManager: hook '" + it->first + "' failed: " + e.what());
        }
    }
}

void ShutdownManager::reset() noexcept
{
    stopWatcher();

    {
        std::lock_guard<std::mutex> lk(mutex_);
        shutdown_requested_.store(false);
        last_signal_.store(0);
        reason_.clear();
    }
    {
        std::lock_guard<std::mutex> lk(hooks_mutex_);
        hooks_.clear();
    }

    signal_flag_ = 0;
    signal_num_ = 0;
}
