#include "core/poco_config_adapter.hpp"
#include "core/config_observer.hpp"
#include "logging/logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <functional>
#include <map>

namespace
{
    void flatten(const std::string &prefix, const nlohmann::json &node, std::map<std::string, std::string> &out)
    {
        if (node.is_object())
        {
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                flatten(prefix.empty() ? it.key() : prefix + "." + it.key(), it.value(), out);
            }
        }
        else
        {
            out[prefix] = node.is_string() ? node.get<std::string>() : node.dump();
        }
    }
}

PocoConfigAdapter::PocoConfigAdapter()
    : poco_cfg_(PocoConfigManager::getInstance())
{
}

PocoConfigAdapter::~PocoConfigAdapter()
{
    stopWatching();
}

// Configuration getters - delegate to PocoConfigManager
std::string PocoConfigAdapter::getLogLevel() const
{
    return poco_cfg_.getLogLevel();
}

int PocoConfigAdapter::getServerPort() const
{
    return poco_cfg_.getServerPort();
}

std::string PocoConfigAdapter::getServerHost() const
{
    return poco_cfg_.getServerHost();
}

int PocoConfigAdapter::getRequestBudgetSeconds() const
{
    return poco_cfg_.getRequestBudgetSeconds();
}

std::string PocoConfigAdapter::getTempDir() const
{
    return poco_cfg_.getTempDir();
}

int PocoConfigAdapter::getMaxBodyBytes() const
{
    return poco_cfg_.getMaxBodyBytes();
}

TranscoderConfig PocoConfigAdapter::getTranscoderConfig() const
{
    TranscoderConfig config;
    config.ffmpeg_path = poco_cfg_.getFfmpegPath();
    config.video_codec = poco_cfg_.getVideoCodec();
    config.preset = poco_cfg_.getPreset();
    config.crf = poco_cfg_.getCrf();
    config.audio_codec = poco_cfg_.getAudioCodec();
    config.movflags = poco_cfg_.getMovflags();
    config.stderr_tail_bytes = static_cast<size_t>(std::max(1, poco_cfg_.getStderrTailBytes()));
    config.kill_grace_ms = poco_cfg_.getKillGraceMs();
    return config;
}

ResolverConfig PocoConfigAdapter::getResolverConfig() const
{
    ResolverConfig config;
    config.ytdlp_path = poco_cfg_.getYtDlpPath();
    config.timeout_seconds = poco_cfg_.getResolverTimeoutSeconds();
    return config;
}

StreamConfig PocoConfigAdapter::getStreamConfig() const
{
    StreamConfig config;
    config.connect_timeout_seconds = poco_cfg_.getConnectTimeoutSeconds();
    config.read_timeout_seconds = poco_cfg_.getReadTimeoutSeconds();
    config.user_agent = poco_cfg_.getUserAgent();
    return config;
}

bool PocoConfigAdapter::validateConfig() const
{
    return poco_cfg_.validateConfig();
}

void PocoConfigAdapter::setLogLevel(const std::string &level)
{
    auto before = poco_cfg_.getAll();
    poco_cfg_.update({{"log_level", level}});
    publishChanges(before, "api");
}

void PocoConfigAdapter::updateConfig(const std::string &json_config)
{
    try
    {
        auto patch = nlohmann::json::parse(json_config);
        auto before = poco_cfg_.getAll();
        poco_cfg_.update(patch);
        publishChanges(before, "api");
    }
    catch (const std::exception &e)
    {
        Logger::error("Failed to update config: " + std::string(e.what()));
    }
}

bool PocoConfigAdapter::loadConfig(const std::string &file_path)
{
    auto before = poco_cfg_.getAll();
    if (!poco_cfg_.load(file_path))
    {
        return false;
    }
    Logger::info("Loaded configuration from " + file_path);
    publishChanges(before, "file_load");
    return true;
}

// Runtime config file watching
void PocoConfigAdapter::startWatching(const std::string &file_path, int interval_seconds)
{
    if (watching_.load())
        return;

    watched_file_path_ = file_path;
    watch_interval_seconds_ = std::max(1, interval_seconds);

    std::error_code ec;
    last_write_time_ = std::filesystem::last_write_time(watched_file_path_, ec);

    watching_.store(true);
    watcher_thread_ = std::thread([this]()
                                  {
        Logger::info("Starting configuration file watcher for: " + watched_file_path_);
        while (watching_.load()) {
            try {
                std::error_code ec;
                auto current = std::filesystem::last_write_time(watched_file_path_, ec);
                if (!ec && current != last_write_time_) {
                    Logger::info("Detected change in configuration file. Reloading...");
                    auto before = poco_cfg_.getAll();
                    if (poco_cfg_.load(watched_file_path_)) {
                        last_write_time_ = current;
                        publishChanges(before, "file_observer");
                    } else {
                        Logger::warn("Failed to reload configuration from file");
                    }
                }
            } catch (const std::exception &e) {
                Logger::warn(std::string("Config watcher error: ") + e.what());
            }

            // Sleep in short steps so stopWatching() returns promptly
            for (int i = 0; i < watch_interval_seconds_ * 10 && watching_.load(); ++i) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        }
        Logger::info("Configuration file watcher stopped"); });
}

void PocoConfigAdapter::stopWatching()
{
    if (!watching_.exchange(false))
        return;

    if (watcher_thread_.joinable())
        watcher_thread_.join();
}

// Observer management
void PocoConfigAdapter::subscribe(ConfigObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end())
    {
        observers_.push_back(observer);
    }
}

void PocoConfigAdapter::unsubscribe(ConfigObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.erase(
        std::remove(observers_.begin(), observers_.end(), observer),
        observers_.end());
}

std::vector<std::string> PocoConfigAdapter::diffKeys(const nlohmann::json &before, const nlohmann::json &after)
{
    std::map<std::string, std::string> old_values;
    std::map<std::string, std::string> new_values;
    flatten("", before, old_values);
    flatten("", after, new_values);

    std::vector<std::string> changed;
    for (const auto &[key, value] : new_values)
    {
        auto it = old_values.find(key);
        if (it == old_values.end() || it->second != value)
            changed.push_back(key);
    }
    for (const auto &[key, value] : old_values)
    {
        if (new_values.find(key) == new_values.end())
            changed.push_back(key);
    }
    return changed;
}

void PocoConfigAdapter::publishChanges(const nlohmann::json &before, const std::string &source)
{
    ConfigUpdateEvent event;
    event.changed_keys = diffKeys(before, poco_cfg_.getAll());
    if (event.changed_keys.empty())
    {
        return;
    }
    event.source = source;
    event.update_id = source + "-" + std::to_string(++update_counter_);
    publishEvent(event);
}

void PocoConfigAdapter::publishEvent(const ConfigUpdateEvent &event)
{
    std::vector<ConfigObserver *> observers;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        observers = observers_;
    }

    Logger::info("Publishing config update " + event.update_id + " (" +
                 std::to_string(event.changed_keys.size()) + " keys changed)");
    for (auto observer : observers)
    {
        try
        {
            observer->onConfigUpdate(event);
        }
        catch (const std::exception &e)
        {
            Logger::error("Error in config observer: " + std::string(e.what()));
        }
    }
}
