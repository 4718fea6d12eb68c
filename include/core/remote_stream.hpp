#pragma once

#include "core/clip_types.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

/**
 * @brief Receives stream bytes as they arrive; return false to stop the read
 */
using ChunkSink = std::function<bool(const char *data, size_t length)>;

/**
 * @brief Remote stream client settings, snapshotted at startup
 */
struct StreamConfig
{
    int connect_timeout_seconds = 10;
    int read_timeout_seconds = 30;
    std::string user_agent = "Mozilla/5.0 (clip_server)";
};

/**
 * @brief A readable byte source for one encoding
 */
class RemoteStream
{
public:
    virtual ~RemoteStream() = default;

    /**
     * @brief Push the stream's bytes into @p sink until EOF or until the sink declines
     * @throws ClipError(TranscodeFailed) if the source errors mid-read
     */
    virtual void pump(const ChunkSink &sink) = 0;

    /**
     * @brief Abort an in-flight or upcoming pump() from another thread
     *
     * A pump() blocked on the network returns promptly once this is called.
     */
    virtual void cancel() = 0;

    virtual std::string describe() const = 0;
};

/**
 * @brief Opens the byte source behind an encoding candidate
 */
class StreamOpener
{
public:
    virtual ~StreamOpener() = default;
    virtual std::unique_ptr<RemoteStream> open(const EncodingCandidate &candidate) = 0;
};

/**
 * @brief Streams a candidate's locator over HTTP(S) with the httplib client
 */
class HttpStreamOpener : public StreamOpener
{
public:
    explicit HttpStreamOpener(StreamConfig config);

    /**
     * @throws ClipError(TranscodeFailed) if the locator is not an http(s) URL
     */
    std::unique_ptr<RemoteStream> open(const EncodingCandidate &candidate) override;

    struct UrlParts
    {
        std::string scheme_host_port; // e.g. "https://host:443"
        std::string path_and_query;   // e.g. "/videoplayback?id=..."
    };

    /**
     * @brief Split an absolute http(s) URL for httplib::Client
     * @return false if the URL is not an absolute http(s) URL
     */
    static bool splitUrl(const std::string &url, UrlParts &parts);

private:
    StreamConfig config_;
};
