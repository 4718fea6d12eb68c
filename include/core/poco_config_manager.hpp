#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Thread-safe key/value view over a JSON config file (dotted keys, e.g. "transcoder.crf")
 */
class PocoConfigManager
{
public:
    static PocoConfigManager &getInstance()
    {
        static PocoConfigManager instance;
        return instance;
    }

    // Core file operations
    bool load(const std::string &path);
    void update(const nlohmann::json &patch);
    nlohmann::json getAll() const;

    // Basic configuration getters
    std::string getString(const std::string &key, const std::string &def = "") const;
    int getInt(const std::string &key, int def = 0) const;

    // Server configuration getters
    std::string getLogLevel() const;
    int getServerPort() const;
    std::string getServerHost() const;

    // Clip request configuration getters
    int getRequestBudgetSeconds() const;
    std::string getTempDir() const;
    int getMaxBodyBytes() const;

    // Transcoder configuration getters
    std::string getFfmpegPath() const;
    std::string getVideoCodec() const;
    std::string getPreset() const;
    int getCrf() const;
    std::string getAudioCodec() const;
    std::string getMovflags() const;
    int getStderrTailBytes() const;
    int getKillGraceMs() const;

    // Resolver configuration getters
    std::string getYtDlpPath() const;
    int getResolverTimeoutSeconds() const;

    // Remote stream configuration getters
    int getConnectTimeoutSeconds() const;
    int getReadTimeoutSeconds() const;
    std::string getUserAgent() const;

    // Configuration validation
    bool validateConfig() const;

    // Utility methods
    void initializeDefaultConfig();

private:
    PocoConfigManager();
    ~PocoConfigManager() = default;
    PocoConfigManager(const PocoConfigManager &) = delete;
    PocoConfigManager &operator=(const PocoConfigManager &) = delete;

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
