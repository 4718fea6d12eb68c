#pragma once

#include "core/cancellation_token.hpp"
#include "core/clip_types.hpp"
#include "core/remote_stream.hpp"
#include "core/source_stream_resolver.hpp"
#include "core/temp_artifact_manager.hpp"
#include "core/transcoding_pipeline.hpp"
#include <chrono>
#include <functional>
#include <string>

/**
 * @brief Drives one clip request through validate -> resolve -> allocate ->
 * open stream -> transcode -> read back -> dispose.
 *
 * Stateless between calls; concurrent extract() calls only share the temp
 * directory, partitioned by random artifact ids. Every failure is converted into
 * a failed ClipResult here, and the artifact is disposed on every path.
 */
class ClipExtractionOrchestrator
{
public:
    static constexpr double MIN_DURATION_SECONDS = 0.01;

    struct Settings
    {
        std::chrono::seconds request_budget{60};
        // Extra cancellation source for every request, e.g. process shutdown
        std::function<bool()> external_cancel;
    };

    ClipExtractionOrchestrator(StreamResolver &resolver,
                               StreamOpener &opener,
                               Transcoder &transcoder,
                               TempArtifactManager &artifacts,
                               Settings settings);

    /**
     * @brief Extract using a token bound to the configured request budget
     */
    ClipResult extract(const ClipRequest &request);

    /**
     * @brief Extract under a caller-owned token
     */
    ClipResult extract(const ClipRequest &request, const CancellationToken &token);

    /**
     * @throws ClipError(InvalidRequest) describing the first failed rule
     */
    static void validate(const ClipRequest &request);

    /**
     * @brief max(MIN_DURATION_SECONDS, end - start)
     */
    static double effectiveDuration(const ClipRequest &request);

private:
    std::vector<uint8_t> runStages(const ClipRequest &request, const std::string &request_id,
                                   const CancellationToken &token);

    StreamResolver &resolver_;
    StreamOpener &opener_;
    Transcoder &transcoder_;
    TempArtifactManager &artifacts_;
    Settings settings_;
};
