#include <gtest/gtest.h>
#include <filesystem>
#include <limits>
#include <thread>
#include "core/clip_extraction_orchestrator.hpp"
#include "stubs/fake_components.hpp"
#include "test_base.hpp"

namespace fs = std::filesystem;

class ClipExtractionOrchestratorTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        artifacts_ = std::make_unique<CountingArtifactManager>(scratchDir());
    }

    ClipExtractionOrchestrator makeOrchestrator(Transcoder &transcoder)
    {
        ClipExtractionOrchestrator::Settings settings;
        settings.request_budget = std::chrono::seconds(30);
        return ClipExtractionOrchestrator(resolver_, opener_, transcoder, *artifacts_, settings);
    }

    ClipRequest request(double start, double end, const std::string &url = "https://video.example/watch?v=1")
    {
        ClipRequest r;
        r.source_url = url;
        r.start_seconds = start;
        r.end_seconds = end;
        r.format = "mp4";
        return r;
    }

    void expectEveryArtifactDisposedOnce()
    {
        auto disposals = artifacts_->snapshotDisposals();
        EXPECT_EQ(disposals.size(), artifacts_->allocations.size());
        for (const auto &[path, count] : artifacts_->allocations)
        {
            EXPECT_EQ(count, 1);
            EXPECT_EQ(disposals[path], 1) << path;
            EXPECT_FALSE(fs::exists(path)) << path;
        }
    }

    StubResolver resolver_;
    StubOpener opener_;
    StubTranscoder transcoder_;
    std::unique_ptr<CountingArtifactManager> artifacts_;
};

TEST_F(ClipExtractionOrchestratorTest, SuccessfulExtractionReturnsClip)
{
    auto orchestrator = makeOrchestrator(transcoder_);
    auto result = orchestrator.extract(request(10, 15));

    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.filename, "clip_10-15.mp4");
    EXPECT_EQ(result.content_type, "video/mp4");
    EXPECT_EQ(std::string(result.data.begin(), result.data.end()), "MP4DATA");

    ASSERT_EQ(transcoder_.windows.size(), 1u);
    EXPECT_DOUBLE_EQ(transcoder_.windows[0].start_seconds, 10.0);
    EXPECT_DOUBLE_EQ(transcoder_.windows[0].duration_seconds, 5.0);
    expectEveryArtifactDisposedOnce();
}

TEST_F(ClipExtractionOrchestratorTest, EqualBoundsRejectedBeforeResolving)
{
    auto orchestrator = makeOrchestrator(transcoder_);
    auto result = orchestrator.extract(request(20, 20));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ClipErrorKind::InvalidRequest);
    EXPECT_EQ(resolver_.calls.load(), 0);
    EXPECT_TRUE(artifacts_->allocations.empty());
}

TEST_F(ClipExtractionOrchestratorTest, HugeBoundsRejectedBeforeResolving)
{
    auto orchestrator = makeOrchestrator(transcoder_);
    auto result = orchestrator.extract(request(0, 1e300));

    EXPECT_EQ(result.error_kind, ClipErrorKind::InvalidRequest);
    EXPECT_EQ(result.error_message, "start/end out of range");
    EXPECT_EQ(resolver_.calls.load(), 0);
    EXPECT_TRUE(artifacts_->allocations.empty());
}

TEST_F(ClipExtractionOrchestratorTest, InvertedBoundsRejected)
{
    auto orchestrator = makeOrchestrator(transcoder_);
    auto result = orchestrator.extract(request(30, 10));

    EXPECT_EQ(result.error_kind, ClipErrorKind::InvalidRequest);
    EXPECT_EQ(resolver_.calls.load(), 0);
}

TEST_F(ClipExtractionOrchestratorTest, ValidationRules)
{
    auto expectInvalid = [](ClipRequest r, const std::string &message)
    {
        try
        {
            ClipExtractionOrchestrator::validate(r);
            ADD_FAILURE() << "expected rejection: " << message;
        }
        catch (const ClipError &e)
        {
            EXPECT_EQ(e.kind(), ClipErrorKind::InvalidRequest);
            EXPECT_EQ(std::string(e.what()), message);
        }
    };

    expectInvalid(request(1, 2, ""), "Missing url");
    expectInvalid(request(1, 2, "ftp://files.example/video"), "url must be an absolute http(s) URL");
    expectInvalid(request(1, 2, "not a url"), "url must be an absolute http(s) URL");

    ClipRequest missing_end = request(1, 2);
    missing_end.end_seconds = std::numeric_limits<double>::quiet_NaN();
    expectInvalid(missing_end, "Missing start/end");

    expectInvalid(request(-1, 2), "start must not be negative");
    expectInvalid(request(5, 5), "end must be greater than start");
    expectInvalid(request(1, 1e19), "start/end out of range");
    expectInvalid(request(9.3e18, 9.4e18), "start/end out of range");

    ClipRequest webm = request(1, 2);
    webm.format = "webm";
    expectInvalid(webm, "Unsupported format: webm");

    ClipRequest no_format = request(1, 2, "HTTPS://video.example/watch");
    no_format.format.clear();
    EXPECT_NO_THROW(ClipExtractionOrchestrator::validate(no_format));
}

TEST_F(ClipExtractionOrchestratorTest, TinyWindowUsesMinimumDuration)
{
    auto orchestrator = makeOrchestrator(transcoder_);
    auto result = orchestrator.extract(request(3.0, 3.001));

    ASSERT_TRUE(result.success) << result.error_message;
    ASSERT_EQ(transcoder_.windows.size(), 1u);
    EXPECT_DOUBLE_EQ(transcoder_.windows[0].duration_seconds, ClipExtractionOrchestrator::MIN_DURATION_SECONDS);
}

TEST_F(ClipExtractionOrchestratorTest, ResolverFailureAllocatesNothing)
{
    resolver_.fail_kind = ClipErrorKind::NoPlayableFormat;
    auto orchestrator = makeOrchestrator(transcoder_);
    auto result = orchestrator.extract(request(1, 2));

    EXPECT_EQ(result.error_kind, ClipErrorKind::NoPlayableFormat);
    EXPECT_TRUE(artifacts_->allocations.empty());
    EXPECT_EQ(opener_.calls.load(), 0);
}

TEST_F(ClipExtractionOrchestratorTest, UnexpectedResolverExceptionIsNoPlayableFormat)
{
    resolver_.throw_plain = true;
    auto orchestrator = makeOrchestrator(transcoder_);
    auto result = orchestrator.extract(request(1, 2));

    EXPECT_EQ(result.error_kind, ClipErrorKind::NoPlayableFormat);
    EXPECT_EQ(result.error_message, "resolver exploded");
}

TEST_F(ClipExtractionOrchestratorTest, TranscodeFailureDisposesArtifact)
{
    transcoder_.fail = true;
    auto orchestrator = makeOrchestrator(transcoder_);
    auto result = orchestrator.extract(request(1, 2));

    EXPECT_EQ(result.error_kind, ClipErrorKind::TranscodeFailed);
    ASSERT_EQ(artifacts_->allocations.size(), 1u);
    expectEveryArtifactDisposedOnce();
}

TEST_F(ClipExtractionOrchestratorTest, EmptyOutputIsArtifactFailure)
{
    transcoder_.write_output = false;
    auto orchestrator = makeOrchestrator(transcoder_);
    auto result = orchestrator.extract(request(1, 2));

    EXPECT_EQ(result.error_kind, ClipErrorKind::ArtifactIOFailed);
    expectEveryArtifactDisposedOnce();
}

TEST_F(ClipExtractionOrchestratorTest, AllocationFailureIsArtifactFailure)
{
    artifacts_->fail_allocate = true;
    auto orchestrator = makeOrchestrator(transcoder_);
    auto result = orchestrator.extract(request(1, 2));

    EXPECT_EQ(result.error_kind, ClipErrorKind::ArtifactIOFailed);
    EXPECT_TRUE(transcoder_.windows.empty());
}

TEST_F(ClipExtractionOrchestratorTest, FailingEncoderExecutableLeavesNoTempFile)
{
    TranscoderConfig config;
    config.ffmpeg_path = writeScript("ffmpeg", "cat > /dev/null\necho 'encoder error' >&2\nexit 1");
    TranscodingPipeline pipeline(config);

    // Keep the script out of the artifact directory so only clips are counted
    std::string clips_dir = scratchDir() + "/clips";
    CountingArtifactManager clip_artifacts(clips_dir);
    ClipExtractionOrchestrator::Settings settings;
    ClipExtractionOrchestrator orchestrator(resolver_, opener_, pipeline, clip_artifacts, settings);

    auto result = orchestrator.extract(request(1, 2));

    EXPECT_EQ(result.error_kind, ClipErrorKind::TranscodeFailed);
    ASSERT_EQ(clip_artifacts.allocations.size(), 1u);
    EXPECT_TRUE(fs::is_empty(clips_dir));
}

TEST_F(ClipExtractionOrchestratorTest, CancelledTokenFailsWithoutLeaks)
{
    CancellationToken token;
    token.cancel("server shutting down");

    TranscoderConfig config;
    config.ffmpeg_path = writeScript("ffmpeg-hang", "exec sleep 30");
    config.kill_grace_ms = 200;
    TranscodingPipeline pipeline(config);
    ClipExtractionOrchestrator real(resolver_, opener_, pipeline, *artifacts_, ClipExtractionOrchestrator::Settings());

    auto result = real.extract(request(1, 2), token);

    EXPECT_EQ(result.error_kind, ClipErrorKind::TranscodeFailed);
    expectEveryArtifactDisposedOnce();
}

TEST_F(ClipExtractionOrchestratorTest, ConcurrentRequestsUseIndependentArtifacts)
{
    auto orchestrator = makeOrchestrator(transcoder_);
    ClipResult first;
    ClipResult second;

    std::thread a([&]()
                  { first = orchestrator.extract(request(0, 4)); });
    std::thread b([&]()
                  { second = orchestrator.extract(request(10, 12)); });
    a.join();
    b.join();

    ASSERT_TRUE(first.success) << first.error_message;
    ASSERT_TRUE(second.success) << second.error_message;
    EXPECT_EQ(first.filename, "clip_0-4.mp4");
    EXPECT_EQ(second.filename, "clip_10-12.mp4");

    ASSERT_EQ(transcoder_.outputs.size(), 2u);
    EXPECT_NE(transcoder_.outputs[0], transcoder_.outputs[1]);
    expectEveryArtifactDisposedOnce();
}
