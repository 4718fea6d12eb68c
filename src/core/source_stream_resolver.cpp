#include "core/source_stream_resolver.hpp"
#include "core/subprocess.hpp"
#include "logging/logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

using json = nlohmann::json;

namespace
{
    const EncodingCandidate *highestRanked(const std::vector<EncodingCandidate> &manifest, bool progressive_only)
    {
        const EncodingCandidate *best = nullptr;
        for (const auto &candidate : manifest)
        {
            if (candidate.stream_locator.empty())
                continue;
            if (progressive_only && !candidate.isProgressiveMp4())
                continue;
            if (!best || candidate.quality_rank > best->quality_rank)
                best = &candidate;
        }
        return best;
    }

    std::string stringField(const json &entry, const char *key)
    {
        auto it = entry.find(key);
        if (it != entry.end() && it->is_string())
            return it->get<std::string>();
        return "";
    }

    double numberField(const json &entry, const char *key)
    {
        auto it = entry.find(key);
        if (it != entry.end() && it->is_number())
            return it->get<double>();
        return 0.0;
    }

    bool isSegmentedProtocol(const std::string &protocol)
    {
        static const std::vector<std::string> segmented = {"m3u8", "dash", "ism", "f4m"};
        return std::any_of(segmented.begin(), segmented.end(), [&](const std::string &p)
                           { return protocol.find(p) != std::string::npos; });
    }

    bool hasTrack(const json &entry, const char *codec_key)
    {
        std::string codec = stringField(entry, codec_key);
        return !codec.empty() && codec != "none";
    }
}

SourceStreamResolver::SourceStreamResolver(std::shared_ptr<ManifestProvider> provider)
    : provider_(std::move(provider))
{
}

EncodingCandidate SourceStreamResolver::resolve(const std::string &url, const CancellationToken &token)
{
    auto manifest = provider_->fetchManifest(url, token);
    Logger::debug("SourceStreamResolver: manifest for " + url + " has " + std::to_string(manifest.size()) + " entries");

    EncodingCandidate chosen = selectCandidate(manifest);
    Logger::info("SourceStreamResolver: selected " + chosen.describe());
    return chosen;
}

EncodingCandidate SourceStreamResolver::selectCandidate(const std::vector<EncodingCandidate> &manifest)
{
    if (manifest.empty())
    {
        throw ClipError(ClipErrorKind::NoPlayableFormat, "Failed to get a downloadable format: manifest is empty");
    }

    if (const auto *progressive = highestRanked(manifest, true))
    {
        return *progressive;
    }

    if (const auto *fallback = highestRanked(manifest, false))
    {
        Logger::warn("SourceStreamResolver: no progressive mp4 stream, falling back to " + fallback->describe());
        return *fallback;
    }

    throw ClipError(ClipErrorKind::NoPlayableFormat, "Failed to get a downloadable format: no candidate exposes a stream URL");
}

YtDlpManifestProvider::YtDlpManifestProvider(ResolverConfig config)
    : config_(std::move(config))
{
}

std::vector<EncodingCandidate> YtDlpManifestProvider::fetchManifest(const std::string &url, const CancellationToken &token)
{
    Subprocess process({config_.ytdlp_path, "-J", "--no-playlist", "--no-warnings", "--", url});

    try
    {
        process.start();
    }
    catch (const std::exception &e)
    {
        throw ClipError(ClipErrorKind::NoPlayableFormat, std::string("Failed to query formats: ") + e.what());
    }

    auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(config_.timeout_seconds);
    int status = 0;
    while (!process.tryWait(status))
    {
        if (token.waitFor(std::chrono::milliseconds(50)) || std::chrono::steady_clock::now() >= give_up)
        {
            process.terminate(std::chrono::milliseconds(500));
            std::string why = token.isCancelled() ? token.reason() : "timed out after " + std::to_string(config_.timeout_seconds) + "s";
            throw ClipError(ClipErrorKind::NoPlayableFormat, "Failed to query formats: " + why);
        }
    }
    status = process.wait();

    if (!Subprocess::succeeded(status))
    {
        std::string diagnostics = process.stderrTail();
        Logger::warn("YtDlpManifestProvider: yt-dlp failed (" + Subprocess::describeStatus(status) + "): " + diagnostics);
        throw ClipError(ClipErrorKind::NoPlayableFormat,
                        "Failed to query formats (" + Subprocess::describeStatus(status) + "): " + diagnostics);
    }

    return parseManifest(process.stdoutText());
}

std::vector<EncodingCandidate> YtDlpManifestProvider::parseManifest(const std::string &info_json)
{
    json info;
    try
    {
        info = json::parse(info_json);
    }
    catch (const json::parse_error &e)
    {
        throw ClipError(ClipErrorKind::NoPlayableFormat, "Unreadable format manifest: " + std::string(e.what()));
    }

    std::vector<EncodingCandidate> manifest;
    auto formats = info.find("formats");
    if (formats == info.end() || !formats->is_array())
    {
        return manifest;
    }

    for (const auto &entry : *formats)
    {
        if (!entry.is_object())
            continue;

        EncodingCandidate candidate;
        candidate.format_id = stringField(entry, "format_id");
        candidate.container_format = stringField(entry, "ext");
        candidate.has_video_track = hasTrack(entry, "vcodec");
        candidate.has_audio_track = hasTrack(entry, "acodec");
        candidate.is_segmented = isSegmentedProtocol(stringField(entry, "protocol")) ||
                                 entry.contains("fragments") ||
                                 !stringField(entry, "manifest_url").empty();
        candidate.quality_rank = numberField(entry, "height") * 10000.0 + numberField(entry, "tbr");
        candidate.stream_locator = stringField(entry, "url");

        auto headers = entry.find("http_headers");
        if (headers != entry.end() && headers->is_object())
        {
            for (auto it = headers->begin(); it != headers->end(); ++it)
            {
                if (it.value().is_string())
                    candidate.http_headers[it.key()] = it.value().get<std::string>();
            }
        }

        manifest.push_back(std::move(candidate));
    }

    return manifest;
}
