#include "core/clip_types.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <limits>

using json = nlohmann::json;

const char *toString(ClipErrorKind kind)
{
    switch (kind)
    {
    case ClipErrorKind::None:
        return "None";
    case ClipErrorKind::InvalidRequest:
        return "InvalidRequest";
    case ClipErrorKind::NoPlayableFormat:
        return "NoPlayableFormat";
    case ClipErrorKind::TranscodeFailed:
        return "TranscodeFailed";
    case ClipErrorKind::ArtifactIOFailed:
        return "ArtifactIOFailed";
    }
    return "Unknown";
}

namespace
{
    double readSeconds(const json &body, const char *field)
    {
        auto it = body.find(field);
        if (it == body.end() || it->is_null())
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
        if (!it->is_number())
        {
            throw ClipError(ClipErrorKind::InvalidRequest, std::string("Field '") + field + "' must be a number");
        }
        return it->get<double>();
    }
}

ClipRequest ClipRequest::fromJson(const std::string &body)
{
    json parsed;
    try
    {
        parsed = json::parse(body);
    }
    catch (const json::parse_error &e)
    {
        throw ClipError(ClipErrorKind::InvalidRequest, "Invalid JSON body: " + std::string(e.what()));
    }

    if (!parsed.is_object())
    {
        throw ClipError(ClipErrorKind::InvalidRequest, "Request body must be a JSON object");
    }

    ClipRequest request;

    auto url = parsed.find("url");
    if (url != parsed.end() && !url->is_null())
    {
        if (!url->is_string())
        {
            throw ClipError(ClipErrorKind::InvalidRequest, "Field 'url' must be a string");
        }
        request.source_url = url->get<std::string>();
    }

    request.start_seconds = readSeconds(parsed, "start");
    request.end_seconds = readSeconds(parsed, "end");

    auto format = parsed.find("format");
    if (format != parsed.end() && !format->is_null())
    {
        if (!format->is_string())
        {
            throw ClipError(ClipErrorKind::InvalidRequest, "Field 'format' must be a string");
        }
        request.format = format->get<std::string>();
    }

    return request;
}

std::string EncodingCandidate::describe() const
{
    return "format " + (format_id.empty() ? std::string("?") : format_id) +
           " (" + (container_format.empty() ? std::string("unknown") : container_format) +
           (has_video_track ? ", video" : "") +
           (has_audio_track ? ", audio" : "") +
           (is_segmented ? ", segmented" : "") +
           ", rank " + std::to_string(quality_rank) + ")";
}

namespace ClipNaming
{
    namespace
    {
        // Saturates instead of overflowing the cast
        long long wholeSeconds(double seconds)
        {
            constexpr double limit = static_cast<double>(std::numeric_limits<long long>::max());
            double floored = std::floor(seconds);
            if (!(floored > -limit))
                return std::numeric_limits<long long>::min();
            if (floored >= limit)
                return std::numeric_limits<long long>::max();
            return static_cast<long long>(floored);
        }
    }

    std::string suggestedFilename(double start_seconds, double end_seconds)
    {
        auto start = wholeSeconds(start_seconds);
        auto end = wholeSeconds(end_seconds);
        return "clip_" + std::to_string(start) + "-" + std::to_string(end) + ".mp4";
    }
}
