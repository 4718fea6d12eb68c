#pragma once

#include "core/cancellation_token.hpp"
#include "core/clip_types.hpp"
#include <memory>
#include <string>
#include <vector>

/**
 * @brief Resolver configuration, snapshotted from the config file at startup
 */
struct ResolverConfig
{
    std::string ytdlp_path = "yt-dlp";
    int timeout_seconds = 30;
};

/**
 * @brief Source of a remote video's format manifest
 */
class ManifestProvider
{
public:
    virtual ~ManifestProvider() = default;

    /**
     * @brief Fetch every encoding the remote video offers
     * @throws ClipError(NoPlayableFormat) if the manifest cannot be retrieved
     */
    virtual std::vector<EncodingCandidate> fetchManifest(const std::string &url, const CancellationToken &token) = 0;
};

/**
 * @brief Picks the one encoding a clip request will stream from
 */
class StreamResolver
{
public:
    virtual ~StreamResolver() = default;

    /**
     * @throws ClipError(NoPlayableFormat) when no candidate is usable
     */
    virtual EncodingCandidate resolve(const std::string &url, const CancellationToken &token) = 0;
};

/**
 * @brief Two-tier format selection over a freshly fetched manifest
 *
 * Tier 1: progressive mp4 (video + audio, not segmented), highest quality rank.
 * Tier 2: highest quality rank overall.
 * Candidates without a stream locator are never selected. Ties keep manifest order.
 */
class SourceStreamResolver : public StreamResolver
{
public:
    explicit SourceStreamResolver(std::shared_ptr<ManifestProvider> provider);

    EncodingCandidate resolve(const std::string &url, const CancellationToken &token) override;

    /**
     * @brief Apply the selection policy to a manifest
     * @throws ClipError(NoPlayableFormat) for an empty manifest or one without locators
     */
    static EncodingCandidate selectCandidate(const std::vector<EncodingCandidate> &manifest);

private:
    std::shared_ptr<ManifestProvider> provider_;
};

/**
 * @brief Manifest provider backed by `yt-dlp -J`
 */
class YtDlpManifestProvider : public ManifestProvider
{
public:
    explicit YtDlpManifestProvider(ResolverConfig config);

    std::vector<EncodingCandidate> fetchManifest(const std::string &url, const CancellationToken &token) override;

    /**
     * @brief Map the `formats` array of a yt-dlp info JSON document to candidates
     * @throws ClipError(NoPlayableFormat) if the document is not valid JSON
     */
    static std::vector<EncodingCandidate> parseManifest(const std::string &info_json);

private:
    ResolverConfig config_;
};
