#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include "core/transcoding_pipeline.hpp"
#include "stubs/fake_components.hpp"
#include "test_base.hpp"

namespace fs = std::filesystem;

namespace
{
    std::string readAll(const std::string &path)
    {
        std::ifstream in(path, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
}

class TranscodingPipelineTest : public TestBase
{
protected:
    TranscoderConfig configFor(const std::string &ffmpeg)
    {
        TranscoderConfig config;
        config.ffmpeg_path = ffmpeg;
        config.kill_grace_ms = 300;
        return config;
    }

    // Consumes stdin into <scratch>/input, records argv, writes a fake MP4 to the last argument
    std::string successfulEncoder()
    {
        return writeScript("ffmpeg-ok",
                           "cat > '" + scratchDir() + "/input'\n"
                           "echo \"$@\" > '" + scratchDir() + "/args'\n"
                           "for last; do :; done\n"
                           "printf FAKEMP4 > \"$last\"");
    }
};

TEST_F(TranscodingPipelineTest, BuildsTrimArguments)
{
    TranscodingPipeline pipeline(configFor("/usr/bin/ffmpeg"));
    TrimWindow window{12.5, 0.01};

    auto args = pipeline.buildArguments(window, "/tmp/out.mp4");
    std::vector<std::string> expected = {
        "/usr/bin/ffmpeg", "-hide_banner", "-loglevel", "error", "-y",
        "-i", "pipe:0",
        "-ss", "12.500", "-t", "0.010",
        "-c:v", "libx264", "-preset", "veryfast", "-crf", "23",
        "-c:a", "aac", "-movflags", "+faststart",
        "-f", "mp4", "/tmp/out.mp4"};
    EXPECT_EQ(args, expected);
}

TEST_F(TranscodingPipelineTest, FormatsSecondsWithMillisecondPrecision)
{
    EXPECT_EQ(TranscodingPipeline::formatSeconds(0), "0.000");
    EXPECT_EQ(TranscodingPipeline::formatSeconds(5), "5.000");
    EXPECT_EQ(TranscodingPipeline::formatSeconds(1.23456), "1.235");
}

TEST_F(TranscodingPipelineTest, PipesSourceAndProducesOutput)
{
    TranscodingPipeline pipeline(configFor(successfulEncoder()));
    FakeRemoteStream source({"chunk-one,", "chunk-two"});
    CancellationToken token;
    std::string output = scratchDir() + "/out.mp4";

    ASSERT_NO_THROW(pipeline.run(source, TrimWindow{10, 5}, output, token));

    EXPECT_EQ(readAll(output), "FAKEMP4");
    EXPECT_EQ(readAll(scratchDir() + "/input"), "chunk-one,chunk-two");
    std::string args = readAll(scratchDir() + "/args");
    EXPECT_NE(args.find("-ss 10.000 -t 5.000"), std::string::npos);
}

TEST_F(TranscodingPipelineTest, EncoderClosingInputEarlyIsNotAnError)
{
    std::string encoder = writeScript("ffmpeg-early",
                                      "head -c 4 > /dev/null\n"
                                      "for last; do :; done\n"
                                      "printf EARLY > \"$last\"");
    TranscodingPipeline pipeline(configFor(encoder));
    std::vector<std::string> chunks(64, std::string(64 * 1024, 'v'));
    FakeRemoteStream source(chunks);
    CancellationToken token;
    std::string output = scratchDir() + "/out.mp4";

    ASSERT_NO_THROW(pipeline.run(source, TrimWindow{0, 1}, output, token));
    EXPECT_EQ(readAll(output), "EARLY");
}

TEST_F(TranscodingPipelineTest, NonZeroExitIsTranscodeFailed)
{
    std::string encoder = writeScript("ffmpeg-fail", "cat > /dev/null\necho 'Invalid data found when processing input' >&2\nexit 1");
    TranscodingPipeline pipeline(configFor(encoder));
    FakeRemoteStream source({"garbage"});
    CancellationToken token;

    try
    {
        pipeline.run(source, TrimWindow{0, 1}, scratchDir() + "/out.mp4", token);
        FAIL() << "expected ClipError";
    }
    catch (const ClipError &e)
    {
        EXPECT_EQ(e.kind(), ClipErrorKind::TranscodeFailed);
        std::string message = e.what();
        EXPECT_NE(message.find("exit code 1"), std::string::npos);
        EXPECT_NE(message.find("Invalid data found"), std::string::npos);
    }
}

TEST_F(TranscodingPipelineTest, MissingEncoderIsTranscodeFailed)
{
    TranscodingPipeline pipeline(configFor(scratchDir() + "/no-ffmpeg"));
    FakeRemoteStream source({"x"});
    CancellationToken token;

    try
    {
        pipeline.run(source, TrimWindow{0, 1}, scratchDir() + "/out.mp4", token);
        FAIL() << "expected ClipError";
    }
    catch (const ClipError &e)
    {
        EXPECT_EQ(e.kind(), ClipErrorKind::TranscodeFailed);
        EXPECT_NE(std::string(e.what()).find("Failed to start transcoder"), std::string::npos);
    }
}

TEST_F(TranscodingPipelineTest, SourceFailureFailsEvenIfEncoderSucceeds)
{
    TranscodingPipeline pipeline(configFor(successfulEncoder()));
    FakeRemoteStream source({"partial"}, "connection reset");
    CancellationToken token;

    try
    {
        pipeline.run(source, TrimWindow{0, 1}, scratchDir() + "/out.mp4", token);
        FAIL() << "expected ClipError";
    }
    catch (const ClipError &e)
    {
        EXPECT_EQ(e.kind(), ClipErrorKind::TranscodeFailed);
        EXPECT_NE(std::string(e.what()).find("connection reset"), std::string::npos);
    }
}

TEST_F(TranscodingPipelineTest, BudgetExpiryKillsHungEncoder)
{
    std::string encoder = writeScript("ffmpeg-hang", "exec sleep 30");
    TranscodingPipeline pipeline(configFor(encoder));
    FakeRemoteStream source({"data"});
    CancellationToken token(std::chrono::milliseconds(300));

    auto started = std::chrono::steady_clock::now();
    try
    {
        pipeline.run(source, TrimWindow{0, 1}, scratchDir() + "/out.mp4", token);
        FAIL() << "expected ClipError";
    }
    catch (const ClipError &e)
    {
        EXPECT_EQ(e.kind(), ClipErrorKind::TranscodeFailed);
        EXPECT_NE(std::string(e.what()).find("time budget"), std::string::npos);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
}

TEST_F(TranscodingPipelineTest, BudgetExpiryAbortsStalledSourceRead)
{
    std::string encoder = writeScript("ffmpeg-drain", "cat > /dev/null");
    TranscodingPipeline pipeline(configFor(encoder));
    StallingStream source(std::chrono::seconds(5));
    CancellationToken token(std::chrono::milliseconds(300));

    auto started = std::chrono::steady_clock::now();
    try
    {
        pipeline.run(source, TrimWindow{0, 1}, scratchDir() + "/out.mp4", token);
        FAIL() << "expected ClipError";
    }
    catch (const ClipError &e)
    {
        EXPECT_EQ(e.kind(), ClipErrorKind::TranscodeFailed);
        EXPECT_NE(std::string(e.what()).find("time budget"), std::string::npos);
    }
    EXPECT_TRUE(source.wasCancelled());
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(3));
}

TEST_F(TranscodingPipelineTest, ExplicitCancelStopsEncoder)
{
    std::string encoder = writeScript("ffmpeg-hang", "exec sleep 30");
    TranscodingPipeline pipeline(configFor(encoder));
    FakeRemoteStream source({"data"});
    CancellationToken token;

    std::thread canceller([&token]()
                          {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        token.cancel("client went away"); });

    try
    {
        pipeline.run(source, TrimWindow{0, 1}, scratchDir() + "/out.mp4", token);
        ADD_FAILURE() << "expected ClipError";
    }
    catch (const ClipError &e)
    {
        EXPECT_NE(std::string(e.what()).find("client went away"), std::string::npos);
    }
    canceller.join();
}
