#include <gtest/gtest.h>
#include "core/poco_config_adapter.hpp"
#include "core/config_observer.hpp"
#include "core/logger_observer.hpp"
#include "logging/logger.hpp"
#include "test_base.hpp"
#include <algorithm>
#include <atomic>
#include <fstream>
#include <filesystem>
#include <mutex>
#include <thread>

class RecordingObserver : public ConfigObserver
{
public:
    void onConfigUpdate(const ConfigUpdateEvent &event) override
    {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(event);
    }

    bool sawKey(const std::string &key)
    {
        std::lock_guard<std::mutex> lock(mutex);
        return std::any_of(events.begin(), events.end(), [&](const ConfigUpdateEvent &e)
                           { return e.touches(key); });
    }

    std::mutex mutex;
    std::vector<ConfigUpdateEvent> events;
};

class PocoConfigAdapterTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        test_config_path_ = scratchDir() + "/config.json";
        writeConfig(R"({
            "log_level": "DEBUG",
            "server_host": "127.0.0.1",
            "server_port": 9090,
            "clip": {"request_budget_seconds": 45, "temp_dir": "/var/tmp/clips", "max_body_bytes": 4096},
            "transcoder": {"ffmpeg_path": "/opt/ffmpeg/bin/ffmpeg", "preset": "ultrafast", "crf": 28, "kill_grace_ms": 500},
            "resolver": {"ytdlp_path": "/usr/local/bin/yt-dlp", "timeout_seconds": 15},
            "stream": {"read_timeout_seconds": 20}
        })");

        auto &config = PocoConfigAdapter::getInstance();
        config.stopWatching();
        ASSERT_TRUE(config.loadConfig(test_config_path_));
    }

    void TearDown() override
    {
        PocoConfigAdapter::getInstance().stopWatching();
        TestBase::TearDown();
    }

    void writeConfig(const std::string &content)
    {
        std::ofstream out(test_config_path_, std::ios::trunc);
        out << content;
    }

    std::string test_config_path_;
};

TEST_F(PocoConfigAdapterTest, SingletonPattern)
{
    auto &a = PocoConfigAdapter::getInstance();
    auto &b = PocoConfigAdapter::getInstance();
    EXPECT_EQ(&a, &b);
}

TEST_F(PocoConfigAdapterTest, ServerAndClipGetters)
{
    auto &config = PocoConfigAdapter::getInstance();
    EXPECT_EQ(config.getLogLevel(), "DEBUG");
    EXPECT_EQ(config.getServerHost(), "127.0.0.1");
    EXPECT_EQ(config.getServerPort(), 9090);
    EXPECT_EQ(config.getRequestBudgetSeconds(), 45);
    EXPECT_EQ(config.getTempDir(), "/var/tmp/clips");
    EXPECT_EQ(config.getMaxBodyBytes(), 4096);
}

TEST_F(PocoConfigAdapterTest, ComponentConfigsFallBackToDefaults)
{
    auto &config = PocoConfigAdapter::getInstance();

    auto transcoder = config.getTranscoderConfig();
    EXPECT_EQ(transcoder.ffmpeg_path, "/opt/ffmpeg/bin/ffmpeg");
    EXPECT_EQ(transcoder.preset, "ultrafast");
    EXPECT_EQ(transcoder.crf, 28);
    EXPECT_EQ(transcoder.kill_grace_ms, 500);
    EXPECT_EQ(transcoder.video_codec, "libx264");
    EXPECT_EQ(transcoder.audio_codec, "aac");
    EXPECT_EQ(transcoder.movflags, "+faststart");
    EXPECT_EQ(transcoder.stderr_tail_bytes, 8192u);

    auto resolver = config.getResolverConfig();
    EXPECT_EQ(resolver.ytdlp_path, "/usr/local/bin/yt-dlp");
    EXPECT_EQ(resolver.timeout_seconds, 15);

    auto stream = config.getStreamConfig();
    EXPECT_EQ(stream.read_timeout_seconds, 20);
    EXPECT_EQ(stream.connect_timeout_seconds, 10);
    EXPECT_EQ(stream.user_agent, "Mozilla/5.0 (clip_server)");
}

TEST_F(PocoConfigAdapterTest, MissingFileKeepsCurrentValues)
{
    auto &config = PocoConfigAdapter::getInstance();
    EXPECT_FALSE(config.loadConfig(scratchDir() + "/absent.json"));
    EXPECT_EQ(config.getServerPort(), 9090);
}

TEST_F(PocoConfigAdapterTest, ValidationCatchesBadValues)
{
    auto &config = PocoConfigAdapter::getInstance();
    EXPECT_TRUE(config.validateConfig());

    config.updateConfig(R"({"transcoder": {"crf": 99}})");
    EXPECT_FALSE(config.validateConfig());

    config.updateConfig(R"({"transcoder": {"crf": 23}, "log_level": "CHATTY"})");
    EXPECT_FALSE(config.validateConfig());
}

TEST_F(PocoConfigAdapterTest, WronglyTypedValueFailsValidationWithoutThrowing)
{
    auto &config = PocoConfigAdapter::getInstance();
    config.updateConfig(R"({"server_port": "abc"})");

    bool valid = true;
    EXPECT_NO_THROW(valid = config.validateConfig());
    EXPECT_FALSE(valid);

    config.updateConfig(R"({"server_port": 9090, "transcoder": {"crf": "high"}})");
    EXPECT_NO_THROW(valid = config.validateConfig());
    EXPECT_FALSE(valid);
}

TEST_F(PocoConfigAdapterTest, UpdatePublishesChangedKeysOnly)
{
    auto &config = PocoConfigAdapter::getInstance();
    RecordingObserver observer;
    config.subscribe(&observer);

    config.updateConfig(R"({"transcoder": {"preset": "slow", "crf": 28}})");
    config.updateConfig(R"({"server_port": 9090})");
    config.unsubscribe(&observer);

    ASSERT_EQ(observer.events.size(), 1u);
    const auto &event = observer.events[0];
    EXPECT_EQ(event.source, "api");
    EXPECT_EQ(event.changed_keys, std::vector<std::string>{"transcoder.preset"});
    EXPECT_TRUE(event.touchesSection("transcoder"));
    EXPECT_FALSE(event.touchesSection("clip"));
    EXPECT_EQ(config.getTranscoderConfig().preset, "slow");
}

TEST_F(PocoConfigAdapterTest, InvalidJsonUpdateIsIgnored)
{
    auto &config = PocoConfigAdapter::getInstance();
    RecordingObserver observer;
    config.subscribe(&observer);

    config.updateConfig("{broken");
    config.unsubscribe(&observer);

    EXPECT_TRUE(observer.events.empty());
    EXPECT_EQ(config.getServerPort(), 9090);
}

TEST_F(PocoConfigAdapterTest, DiffKeysReportsNestedChanges)
{
    nlohmann::json before = {{"a", 1}, {"clip", {{"temp_dir", "/tmp"}, {"max_body_bytes", 10}}}};
    nlohmann::json after = {{"a", 1}, {"clip", {{"temp_dir", "/data"}}}, {"b", true}};

    auto keys = PocoConfigAdapter::diffKeys(before, after);
    std::sort(keys.begin(), keys.end());
    EXPECT_EQ(keys, (std::vector<std::string>{"b", "clip.max_body_bytes", "clip.temp_dir"}));
}

TEST_F(PocoConfigAdapterTest, LoggerObserverAppliesLogLevel)
{
    auto &config = PocoConfigAdapter::getInstance();
    LoggerObserver logger_observer;
    config.subscribe(&logger_observer);

    EXPECT_NO_THROW(config.setLogLevel("WARN"));
    EXPECT_EQ(config.getLogLevel(), "WARN");
    EXPECT_NO_THROW(config.setLogLevel("NOISY"));

    config.unsubscribe(&logger_observer);
    Logger::init("DEBUG");
}

TEST_F(PocoConfigAdapterTest, FileWatchingReloadsChanges)
{
    auto &config = PocoConfigAdapter::getInstance();
    RecordingObserver observer;
    config.subscribe(&observer);
    config.startWatching(test_config_path_, 1);
    EXPECT_TRUE(config.isWatching());

    // Ensure the modification time moves even on coarse-grained filesystems
    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    writeConfig(R"({"log_level": "DEBUG", "server_port": 9191})");

    bool seen = false;
    for (int i = 0; i < 50 && !seen; ++i)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        seen = observer.sawKey("server_port");
    }

    config.stopWatching();
    config.unsubscribe(&observer);

    EXPECT_TRUE(seen);
    EXPECT_FALSE(config.isWatching());
    EXPECT_EQ(config.getServerPort(), 9191);
}
