#pragma once

#include "core/poco_config_manager.hpp"
#include "core/remote_stream.hpp"
#include "core/source_stream_resolver.hpp"
#include "core/transcoding_pipeline.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Forward declarations
class ConfigObserver;
struct ConfigUpdateEvent;

/**
 * @brief Application-facing configuration facade over PocoConfigManager.
 *
 * Adds typed component settings, observer notification and runtime reloading of
 * the config file. Observers receive the list of dotted keys whose values
 * changed.
 */
class PocoConfigAdapter
{
public:
    static PocoConfigAdapter &getInstance()
    {
        static PocoConfigAdapter instance;
        return instance;
    }

    ~PocoConfigAdapter();

    // Configuration getters - delegate to PocoConfigManager
    std::string getLogLevel() const;
    int getServerPort() const;
    std::string getServerHost() const;
    int getRequestBudgetSeconds() const;
    std::string getTempDir() const;
    int getMaxBodyBytes() const;

    // Component settings, snapshotted by callers at construction time
    TranscoderConfig getTranscoderConfig() const;
    ResolverConfig getResolverConfig() const;
    StreamConfig getStreamConfig() const;

    // Configuration setters with event publishing
    void setLogLevel(const std::string &level);
    void updateConfig(const std::string &json_config);

    // Configuration file operations
    bool loadConfig(const std::string &file_path);

    bool validateConfig() const;

    // Runtime config file watching
    void startWatching(const std::string &file_path, int interval_seconds = 2);
    void stopWatching();
    bool isWatching() const { return watching_.load(); }

    // Observer management
    void subscribe(ConfigObserver *observer);
    void unsubscribe(ConfigObserver *observer);

    /**
     * @brief Dotted keys whose leaf values differ between two config snapshots
     */
    static std::vector<std::string> diffKeys(const nlohmann::json &before, const nlohmann::json &after);

private:
    PocoConfigAdapter();
    PocoConfigAdapter(const PocoConfigAdapter &) = delete;
    PocoConfigAdapter &operator=(const PocoConfigAdapter &) = delete;

    void publishEvent(const ConfigUpdateEvent &event);
    void publishChanges(const nlohmann::json &before, const std::string &source);

    PocoConfigManager &poco_cfg_;

    // Observers
    mutable std::mutex observers_mutex_;
    std::vector<ConfigObserver *> observers_;

    // File watching internals
    std::atomic<bool> watching_{false};
    std::thread watcher_thread_;
    std::string watched_file_path_;
    int watch_interval_seconds_{2};
    std::filesystem::file_time_type last_write_time_{};
    std::atomic<unsigned long> update_counter_{0};
};
