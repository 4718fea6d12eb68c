#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <fstream>
#include <functional>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

PocoConfigManager::PocoConfigManager()
{
    cfg_ = new JSONConfiguration();
    initializeDefaultConfig();
}

void PocoConfigManager::initializeDefaultConfig()
{
    update({{"log_level", "INFO"},
            {"server_host", "0.0.0.0"},
            {"server_port", 8080},
            {"clip", {{"request_budget_seconds", 60}, {"temp_dir", "/tmp"}, {"max_body_bytes", 65536}}},
            {"transcoder", {{"ffmpeg_path", "ffmpeg"}, {"video_codec", "libx264"}, {"preset", "veryfast"}, {"crf", 23}, {"audio_codec", "aac"}, {"movflags", "+faststart"}, {"stderr_tail_bytes", 8192}, {"kill_grace_ms", 2000}}},
            {"resolver", {{"ytdlp_path", "yt-dlp"}, {"timeout_seconds", 30}}},
            {"stream", {{"connect_timeout_seconds", 10}, {"read_timeout_seconds", 30}, {"user_agent", "Mozilla/5.0 (clip_server)"}}}});
}

bool PocoConfigManager::load(const std::string &path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream in(path);
    if (!in.good())
        return false;
    try
    {
        AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
        tmp->load(in);
        cfg_ = tmp;
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("PocoConfigManager: failed to parse " + path + ": " + e.displayText());
        return false;
    }
    return true;
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

void PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    // Flatten and set values
    std::function<void(const std::string &, const nlohmann::json &)> apply;
    apply = [&](const std::string &prefix, const nlohmann::json &node)
    {
        if (node.is_object())
        {
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
                apply(key, it.value());
            }
        }
        else if (!node.is_null())
        {
            if (node.is_boolean())
                cfg_->setBool(prefix, node.get<bool>());
            else if (node.is_number_integer())
                cfg_->setInt(prefix, node.get<int>());
            else if (node.is_number_float())
                cfg_->setDouble(prefix, node.get<double>());
            else if (node.is_string())
                cfg_->setString(prefix, node.get<std::string>());
            else
                cfg_->setString(prefix, node.dump());
        }
    };
    apply("", patch);
}

// Basic configuration getters
std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt(key, def);
}

// Server configuration getters
std::string PocoConfigManager::getLogLevel() const
{
    return getString("log_level", "INFO");
}

int PocoConfigManager::getServerPort() const
{
    return getInt("server_port", 8080);
}

std::string PocoConfigManager::getServerHost() const
{
    return getString("server_host", "0.0.0.0");
}

// Clip request configuration getters
int PocoConfigManager::getRequestBudgetSeconds() const
{
    return getInt("clip.request_budget_seconds", 60);
}

std::string PocoConfigManager::getTempDir() const
{
    return getString("clip.temp_dir", "/tmp");
}

int PocoConfigManager::getMaxBodyBytes() const
{
    return getInt("clip.max_body_bytes", 65536);
}

// Transcoder configuration getters
std::string PocoConfigManager::getFfmpegPath() const
{
    return getString("transcoder.ffmpeg_path", "ffmpeg");
}

std::string PocoConfigManager::getVideoCodec() const
{
    return getString("transcoder.video_codec", "libx264");
}

std::string PocoConfigManager::getPreset() const
{
    return getString("transcoder.preset", "veryfast");
}

int PocoConfigManager::getCrf() const
{
    return getInt("transcoder.crf", 23);
}

std::string PocoConfigManager::getAudioCodec() const
{
    return getString("transcoder.audio_codec", "aac");
}

std::string PocoConfigManager::getMovflags() const
{
    return getString("transcoder.movflags", "+faststart");
}

int PocoConfigManager::getStderrTailBytes() const
{
    return getInt("transcoder.stderr_tail_bytes", 8192);
}

int PocoConfigManager::getKillGraceMs() const
{
    return getInt("transcoder.kill_grace_ms", 2000);
}

// Resolver configuration getters
std::string PocoConfigManager::getYtDlpPath() const
{
    return getString("resolver.ytdlp_path", "yt-dlp");
}

int PocoConfigManager::getResolverTimeoutSeconds() const
{
    return getInt("resolver.timeout_seconds", 30);
}

// Remote stream configuration getters
int PocoConfigManager::getConnectTimeoutSeconds() const
{
    return getInt("stream.connect_timeout_seconds", 10);
}

int PocoConfigManager::getReadTimeoutSeconds() const
{
    return getInt("stream.read_timeout_seconds", 30);
}

std::string PocoConfigManager::getUserAgent() const
{
    return getString("stream.user_agent", "Mozilla/5.0 (clip_server)");
}

bool PocoConfigManager::validateConfig() const
{
    bool valid = true;
    // A wrongly typed value fails its rule instead of escaping as an exception
    auto require = [&](const std::function<bool()> &check, const std::string &message)
    {
        bool ok = false;
        try
        {
            ok = check();
        }
        catch (const Poco::Exception &e)
        {
            Logger::error("PocoConfigManager: unreadable value (" + e.displayText() + ")");
        }
        if (!ok)
        {
            Logger::error("PocoConfigManager: invalid configuration: " + message);
            valid = false;
        }
    };

    require([this]
            { int port = getServerPort(); return port > 0 && port <= 65535; },
            "server_port must be between 1 and 65535");
    require([this]
            { return getRequestBudgetSeconds() > 0; }, "clip.request_budget_seconds must be positive");
    require([this]
            { return !getTempDir().empty(); }, "clip.temp_dir must not be empty");
    require([this]
            { return getMaxBodyBytes() > 0; }, "clip.max_body_bytes must be positive");
    require([this]
            { return !getFfmpegPath().empty(); }, "transcoder.ffmpeg_path must not be empty");
    require([this]
            { int crf = getCrf(); return crf >= 0 && crf <= 51; },
            "transcoder.crf must be between 0 and 51");
    require([this]
            { return getStderrTailBytes() > 0; }, "transcoder.stderr_tail_bytes must be positive");
    require([this]
            { return getKillGraceMs() >= 0; }, "transcoder.kill_grace_ms must not be negative");
    require([this]
            { return !getYtDlpPath().empty(); }, "resolver.ytdlp_path must not be empty");
    require([this]
            { return getResolverTimeoutSeconds() > 0; }, "resolver.timeout_seconds must be positive");
    require([this]
            { return getConnectTimeoutSeconds() > 0; }, "stream.connect_timeout_seconds must be positive");
    require([this]
            { return getReadTimeoutSeconds() > 0; }, "stream.read_timeout_seconds must be positive");
    require([this]
            { return Logger::isValidLevel(getLogLevel()); },
            "log_level must be one of TRACE, DEBUG, INFO, WARN, ERROR");

    return valid;
}
