#pragma once

#include "core/cancellation_token.hpp"
#include "core/clip_types.hpp"
#include "core/remote_stream.hpp"
#include <string>
#include <vector>

/**
 * @brief Encoder settings handed to the pipeline at construction
 */
struct TranscoderConfig
{
    std::string ffmpeg_path = "ffmpeg";
    std::string video_codec = "libx264";
    std::string preset = "veryfast";
    int crf = 23;
    std::string audio_codec = "aac";
    std::string movflags = "+faststart";
    size_t stderr_tail_bytes = 8192;
    int kill_grace_ms = 2000;
};

/**
 * @brief Trims and re-encodes a byte stream into a finished file
 */
class Transcoder
{
public:
    virtual ~Transcoder() = default;

    /**
     * @brief Run to completion or fail
     * @throws ClipError(TranscodeFailed) on spawn failure, abnormal exit, stream error or cancellation
     */
    virtual void run(RemoteStream &source, const TrimWindow &window,
                     const std::string &output_path, const CancellationToken &token) = 0;
};

/**
 * @brief ffmpeg-backed transcoder fed through the child's stdin
 *
 * The source is pumped chunk by chunk into ffmpeg while it encodes, so memory use
 * is bounded by one chunk whatever the source size. Seek and duration are
 * applied as output options and the video is re-encoded, which gives
 * frame-accurate cut points instead of snapping to keyframes.
 *
 * One attempt per call; nothing is retried.
 */
class TranscodingPipeline : public Transcoder
{
public:
    explicit TranscodingPipeline(TranscoderConfig config);

    void run(RemoteStream &source, const TrimWindow &window,
             const std::string &output_path, const CancellationToken &token) override;

    /**
     * @brief Full ffmpeg argument vector, argv[0] included
     */
    std::vector<std::string> buildArguments(const TrimWindow &window, const std::string &output_path) const;

    const TranscoderConfig &config() const { return config_; }

    static std::string formatSeconds(double seconds);

private:
    TranscoderConfig config_;
};
