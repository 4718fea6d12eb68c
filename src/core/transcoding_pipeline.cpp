#include "core/transcoding_pipeline.hpp"
#include "core/subprocess.hpp"
#include "logging/logger.hpp"
#include <atomic>
#include <iomanip>
#include <sstream>
#include <thread>

namespace
{
    // Aborts the source read and terminates the encoder when the token fires; joined on scope exit
    class CancellationWatchdog
    {
    public:
        CancellationWatchdog(Subprocess &process, RemoteStream &source, const CancellationToken &token,
                             std::chrono::milliseconds grace)
        {
            thread_ = std::thread([this, &process, &source, &token, grace]()
                                  {
                while (!done_.load())
                {
                    if (!token.waitFor(std::chrono::milliseconds(50)))
                        continue;
                    if (done_.load())
                        break;
                    fired_.store(true);
                    Logger::warn("TranscodingPipeline: stopping ffmpeg (pid " + std::to_string(process.pid()) +
                                 "): " + token.reason());
                    // Unblock a pump() stuck on a silent socket before killing the encoder
                    source.cancel();
                    process.terminate(grace);

                    // A read that had not reached the socket yet is caught on a later pass
                    while (!done_.load())
                    {
                        source.cancel();
                        std::this_thread::sleep_for(std::chrono::milliseconds(50));
                    }
                    break;
                } });
        }

        ~CancellationWatchdog()
        {
            done_.store(true);
            if (thread_.joinable())
                thread_.join();
        }

        bool fired() const { return fired_.load(); }

    private:
        std::atomic<bool> done_{false};
        std::atomic<bool> fired_{false};
        std::thread thread_;
    };
}

TranscodingPipeline::TranscodingPipeline(TranscoderConfig config)
    : config_(std::move(config))
{
}

std::string TranscodingPipeline::formatSeconds(double seconds)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << seconds;
    return oss.str();
}

std::vector<std::string> TranscodingPipeline::buildArguments(const TrimWindow &window, const std::string &output_path) const
{
    return {
        config_.ffmpeg_path,
        "-hide_banner",
        "-loglevel", "error",
        "-y",
        "-i", "pipe:0",
        "-ss", formatSeconds(window.start_seconds),
        "-t", formatSeconds(window.duration_seconds),
        "-c:v", config_.video_codec,
        "-preset", config_.preset,
        "-crf", std::to_string(config_.crf),
        "-c:a", config_.audio_codec,
        "-movflags", config_.movflags,
        "-f", "mp4",
        output_path};
}

void TranscodingPipeline::run(RemoteStream &source, const TrimWindow &window,
                              const std::string &output_path, const CancellationToken &token)
{
    Subprocess::Options options;
    options.pipe_stdin = true;
    options.stdout_limit_bytes = 64 * 1024;
    options.stderr_tail_bytes = config_.stderr_tail_bytes;

    Subprocess process(buildArguments(window, output_path), options);
    try
    {
        process.start();
    }
    catch (const std::exception &e)
    {
        throw ClipError(ClipErrorKind::TranscodeFailed, std::string("Failed to start transcoder: ") + e.what());
    }

    Logger::debug("TranscodingPipeline: ffmpeg pid " + std::to_string(process.pid()) +
                  " trimming " + formatSeconds(window.start_seconds) + "s +" +
                  formatSeconds(window.duration_seconds) + "s into " + output_path);

    std::string stream_error;
    bool input_closed_early = false;
    size_t bytes_fed = 0;
    int status = 0;
    bool cancelled = false;

    {
        CancellationWatchdog watchdog(process, source, token, std::chrono::milliseconds(config_.kill_grace_ms));

        try
        {
            source.pump([&](const char *data, size_t length)
                        {
                if (token.isCancelled())
                    return false;
                if (!process.writeStdin(data, length))
                {
                    // ffmpeg stops reading once the requested window is encoded
                    input_closed_early = true;
                    return false;
                }
                bytes_fed += length;
                return true; });
        }
        catch (const std::exception &e)
        {
            stream_error = e.what();
        }

        process.closeStdin();
        status = process.wait();
        cancelled = watchdog.fired();
    }

    Logger::debug("TranscodingPipeline: fed " + std::to_string(bytes_fed) + " bytes" +
                  (input_closed_early ? " (encoder closed input early)" : "") +
                  ", ffmpeg " + Subprocess::describeStatus(status));

    if (cancelled || token.isCancelled())
    {
        throw ClipError(ClipErrorKind::TranscodeFailed, "Transcoding aborted: " + token.reason());
    }

    if (!Subprocess::succeeded(status))
    {
        std::string message = "Transcoder failed (" + Subprocess::describeStatus(status) + ")";
        std::string diagnostics = process.stderrTail();
        if (!diagnostics.empty())
            message += ": " + diagnostics;
        if (!stream_error.empty())
            message += "; source stream: " + stream_error;
        throw ClipError(ClipErrorKind::TranscodeFailed, message);
    }

    if (!stream_error.empty())
    {
        throw ClipError(ClipErrorKind::TranscodeFailed, "Source stream failed: " + stream_error);
    }
}
