#include "core/clip_extraction_orchestrator.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace
{
    // Attributes an unexpected exception to the stage that raised it
    template <typename Fn>
    auto runStage(ClipErrorKind kind_on_unexpected, Fn &&fn) -> decltype(fn())
    {
        try
        {
            return fn();
        }
        catch (const ClipError &)
        {
            throw;
        }
        catch (const std::exception &e)
        {
            throw ClipError(kind_on_unexpected, e.what());
        }
    }

    bool isHttpUrl(const std::string &url)
    {
        auto scheme_end = url.find("://");
        if (scheme_end == std::string::npos || scheme_end + 3 >= url.size())
            return false;
        std::string scheme = url.substr(0, scheme_end);
        std::transform(scheme.begin(), scheme.end(), scheme.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        if (scheme != "http" && scheme != "https")
            return false;
        // Whitespace would break the resolver's argv
        return url.find_first_of(" \t\r\n") == std::string::npos;
    }

    // Log tag; full ids are 32 hex chars
    std::string shortId(const std::string &id)
    {
        return id.substr(0, 8);
    }
}

ClipExtractionOrchestrator::ClipExtractionOrchestrator(StreamResolver &resolver,
                                                       StreamOpener &opener,
                                                       Transcoder &transcoder,
                                                       TempArtifactManager &artifacts,
                                                       Settings settings)
    : resolver_(resolver),
      opener_(opener),
      transcoder_(transcoder),
      artifacts_(artifacts),
      settings_(std::move(settings))
{
}

void ClipExtractionOrchestrator::validate(const ClipRequest &request)
{
    if (request.source_url.empty())
    {
        throw ClipError(ClipErrorKind::InvalidRequest, "Missing url");
    }
    if (!isHttpUrl(request.source_url))
    {
        throw ClipError(ClipErrorKind::InvalidRequest, "url must be an absolute http(s) URL");
    }
    if (!std::isfinite(request.start_seconds) || !std::isfinite(request.end_seconds))
    {
        throw ClipError(ClipErrorKind::InvalidRequest, "Missing start/end");
    }
    if (request.start_seconds < 0)
    {
        throw ClipError(ClipErrorKind::InvalidRequest, "start must not be negative");
    }
    if (request.end_seconds <= request.start_seconds)
    {
        throw ClipError(ClipErrorKind::InvalidRequest, "end must be greater than start");
    }
    // Whole-second bounds must fit the filename's integer fields; start < end covers start
    if (request.end_seconds >= static_cast<double>(std::numeric_limits<long long>::max()))
    {
        throw ClipError(ClipErrorKind::InvalidRequest, "start/end out of range");
    }
    if (!request.format.empty() && request.format != "mp4")
    {
        throw ClipError(ClipErrorKind::InvalidRequest, "Unsupported format: " + request.format);
    }
}

double ClipExtractionOrchestrator::effectiveDuration(const ClipRequest &request)
{
    return std::max(MIN_DURATION_SECONDS, request.end_seconds - request.start_seconds);
}

ClipResult ClipExtractionOrchestrator::extract(const ClipRequest &request)
{
    // Budget starts when the request is accepted
    CancellationToken token(settings_.request_budget, settings_.external_cancel);
    return extract(request, token);
}

ClipResult ClipExtractionOrchestrator::extract(const ClipRequest &request, const CancellationToken &token)
{
    // Nothing remote happens for a request that fails validation
    try
    {
        validate(request);
    }
    catch (const ClipError &e)
    {
        Logger::info("ClipExtractionOrchestrator: rejected request: " + std::string(e.what()));
        return ClipResult::failure(e.kind(), e.what());
    }

    auto started = std::chrono::steady_clock::now();
    std::string request_id;

    try
    {
        request_id = runStage(ClipErrorKind::ArtifactIOFailed, []
                              { return TempArtifactManager::generateId(); });

        Logger::info("ClipExtractionOrchestrator: [" + shortId(request_id) + "] extracting " +
                     TranscodingPipeline::formatSeconds(request.start_seconds) + "s-" +
                     TranscodingPipeline::formatSeconds(request.end_seconds) + "s from " + request.source_url);

        auto data = runStages(request, request_id, token);

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
        Logger::info("ClipExtractionOrchestrator: [" + shortId(request_id) + "] done, " +
                     std::to_string(data.size()) + " bytes in " + std::to_string(elapsed.count()) + "ms");

        return ClipResult::ok(std::move(data), ClipNaming::suggestedFilename(request.start_seconds, request.end_seconds));
    }
    catch (const ClipError &e)
    {
        Logger::warn("ClipExtractionOrchestrator: [" + shortId(request_id) + "] " + toString(e.kind()) + ": " + e.what());
        return ClipResult::failure(e.kind(), e.what());
    }
}

std::vector<uint8_t> ClipExtractionOrchestrator::runStages(const ClipRequest &request, const std::string &request_id,
                                                           const CancellationToken &token)
{
    const std::string tag = "ClipExtractionOrchestrator: [" + shortId(request_id) + "] ";

    // Resolve first so a bad URL never touches the temp directory
    EncodingCandidate candidate = runStage(ClipErrorKind::NoPlayableFormat, [&]
                                           { return resolver_.resolve(request.source_url, token); });
    Logger::debug(tag + "resolved " + candidate.describe());

    // Disposed exactly once on every exit path
    ScopedArtifact artifact(artifacts_, runStage(ClipErrorKind::ArtifactIOFailed, [&]
                                                 { return artifacts_.allocate(request_id); }));
    Logger::debug(tag + "allocated " + artifact.path());

    TrimWindow window;
    window.start_seconds = request.start_seconds;
    window.duration_seconds = effectiveDuration(request);

    // Stream and encode; the stream lives only as long as the transcode
    runStage(ClipErrorKind::TranscodeFailed, [&]
             {
        auto stream = opener_.open(candidate);
        Logger::debug(tag + "streaming from " + stream->describe());
        transcoder_.run(*stream, window, artifact.path(), token); });
    Logger::debug(tag + "transcode finished");

    // Bytes are in memory; dispose the file now rather than at scope exit
    auto data = runStage(ClipErrorKind::ArtifactIOFailed, [&]
                         { return artifacts_.finalize(artifact.get()); });

    artifact.release();
    return data;
}
