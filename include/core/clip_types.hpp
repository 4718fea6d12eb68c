#pragma once

#include <chrono>
#include <cstdint>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Failure classification for a clip extraction
 */
enum class ClipErrorKind
{
    None,
    InvalidRequest,   // Malformed url, missing or inverted window
    NoPlayableFormat, // Manifest has no usable encoding
    TranscodeFailed,  // Encoder exited abnormally or the source stream broke
    ArtifactIOFailed  // Finished file could not be created or read back
};

const char *toString(ClipErrorKind kind);

/**
 * @brief Error raised by any pipeline stage, caught at the orchestrator boundary
 */
class ClipError : public std::runtime_error
{
public:
    ClipError(ClipErrorKind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind) {}

    ClipErrorKind kind() const { return kind_; }

private:
    ClipErrorKind kind_;
};

/**
 * @brief A single clip extraction request as received from the caller
 *
 * Missing numeric fields are represented as NaN so that validation treats them
 * the same way as non-finite input.
 */
struct ClipRequest
{
    std::string source_url;
    double start_seconds = std::numeric_limits<double>::quiet_NaN();
    double end_seconds = std::numeric_limits<double>::quiet_NaN();
    std::string format; // Empty when the caller did not specify one

    /**
     * @brief Parse the JSON request body
     * @param body Raw request body
     * @return Parsed request (not yet validated)
     * @throws ClipError(InvalidRequest) on malformed JSON or wrongly typed fields
     */
    static ClipRequest fromJson(const std::string &body);
};

/**
 * @brief The time window handed to the transcoder
 */
struct TrimWindow
{
    double start_seconds = 0.0;
    double duration_seconds = 0.0;
};

/**
 * @brief One entry of a remote video's format manifest
 */
struct EncodingCandidate
{
    std::string format_id;
    std::string container_format;
    bool has_video_track = false;
    bool has_audio_track = false;
    bool is_segmented = false;
    double quality_rank = 0.0;
    std::string stream_locator;
    std::map<std::string, std::string> http_headers;

    bool isProgressiveMp4() const
    {
        return container_format == "mp4" && has_video_track && has_audio_track && !is_segmented;
    }

    std::string describe() const;
};

/**
 * @brief Per-request temporary output file
 */
struct TempArtifact
{
    std::string id;
    std::string path;
    std::chrono::system_clock::time_point created_at;
};

/**
 * @brief Outcome of a clip extraction
 */
struct ClipResult
{
    bool success;
    ClipErrorKind error_kind;
    std::string error_message;
    std::vector<uint8_t> data;
    std::string filename;
    std::string content_type;

    ClipResult() : success(false), error_kind(ClipErrorKind::None) {}

    static ClipResult ok(std::vector<uint8_t> bytes, const std::string &name)
    {
        ClipResult result;
        result.success = true;
        result.data = std::move(bytes);
        result.filename = name;
        result.content_type = "video/mp4";
        return result;
    }

    static ClipResult failure(ClipErrorKind kind, const std::string &message)
    {
        ClipResult result;
        result.error_kind = kind;
        result.error_message = message;
        return result;
    }
};

namespace ClipNaming
{
    /**
     * @brief Suggested download name, clip_<floor(start)>-<floor(end)>.mp4
     */
    std::string suggestedFilename(double start_seconds, double end_seconds);
}
