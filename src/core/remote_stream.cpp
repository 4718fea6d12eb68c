#include "core/remote_stream.hpp"
#include "logging/logger.hpp"
#include <httplib.h>
#include <atomic>

namespace
{
    class HttpRemoteStream : public RemoteStream
    {
    public:
        HttpRemoteStream(HttpStreamOpener::UrlParts parts, httplib::Headers headers, const StreamConfig &config)
            : parts_(std::move(parts)), headers_(std::move(headers)), client_(parts_.scheme_host_port)
        {
            client_.set_follow_location(true);
            client_.set_connection_timeout(config.connect_timeout_seconds, 0);
            client_.set_read_timeout(config.read_timeout_seconds, 0);
        }

        void pump(const ChunkSink &sink) override
        {
            // Cancelled before the request went out
            if (aborted_.load())
            {
                throw ClipError(ClipErrorKind::TranscodeFailed, "Source stream cancelled");
            }

            int status = 0;
            bool declined = false;
            size_t received = 0;

            auto result = client_.Get(
                parts_.path_and_query, headers_,
                [&](const httplib::Response &response)
                {
                    // Redirects are followed by httplib, so only the final status lands here
                    status = response.status;
                    return status >= 200 && status < 300;
                },
                [&](const char *data, size_t length)
                {
                    if (aborted_.load())
                        return false;
                    received += length;
                    if (!sink(data, length))
                    {
                        declined = true;
                        return false;
                    }
                    return true;
                });

            // The consumer has what it needs
            if (declined)
            {
                Logger::debug("HttpRemoteStream: consumer stopped reading after " + std::to_string(received) + " bytes");
                return;
            }
            if (aborted_.load())
            {
                throw ClipError(ClipErrorKind::TranscodeFailed,
                                "Source stream cancelled after " + std::to_string(received) + " bytes");
            }
            if (status != 0 && (status < 200 || status >= 300))
            {
                throw ClipError(ClipErrorKind::TranscodeFailed,
                                "Source stream returned HTTP " + std::to_string(status));
            }
            // Transport failure: connect, TLS or mid-body read
            if (!result)
            {
                throw ClipError(ClipErrorKind::TranscodeFailed,
                                "Source stream error after " + std::to_string(received) + " bytes: " +
                                    httplib::to_string(result.error()));
            }

            Logger::debug("HttpRemoteStream: received " + std::to_string(received) + " bytes from " + describe());
        }

        void cancel() override
        {
            if (!aborted_.exchange(true))
                Logger::debug("HttpRemoteStream: cancelling read from " + describe());
            // Shuts down the socket of an in-flight request; repeat calls are harmless
            client_.stop();
        }

        std::string describe() const override
        {
            return parts_.scheme_host_port;
        }

    private:
        HttpStreamOpener::UrlParts parts_;
        httplib::Headers headers_;
        httplib::Client client_;
        std::atomic<bool> aborted_{false};
    };
}

HttpStreamOpener::HttpStreamOpener(StreamConfig config)
    : config_(std::move(config))
{
}

std::unique_ptr<RemoteStream> HttpStreamOpener::open(const EncodingCandidate &candidate)
{
    // Only plain http(s) locators are streamable
    UrlParts parts;
    if (!splitUrl(candidate.stream_locator, parts))
    {
        throw ClipError(ClipErrorKind::TranscodeFailed, "Unsupported stream locator for " + candidate.describe());
    }

    // Format-specific headers from the manifest take precedence
    httplib::Headers headers;
    for (const auto &[name, value] : candidate.http_headers)
    {
        headers.emplace(name, value);
    }
    if (headers.find("User-Agent") == headers.end())
    {
        headers.emplace("User-Agent", config_.user_agent);
    }

    Logger::debug("HttpStreamOpener: opening " + parts.scheme_host_port + " for " + candidate.describe());
    return std::make_unique<HttpRemoteStream>(std::move(parts), std::move(headers), config_);
}

bool HttpStreamOpener::splitUrl(const std::string &url, UrlParts &parts)
{
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        return false;

    std::string scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https")
        return false;

    // Authority runs up to the first path, query or fragment delimiter
    auto authority_start = scheme_end + 3;
    auto path_start = url.find_first_of("/?#", authority_start);
    std::string authority = url.substr(authority_start, path_start == std::string::npos ? std::string::npos : path_start - authority_start);
    if (authority.empty())
        return false;

    parts.scheme_host_port = scheme + "://" + authority;
    if (path_start == std::string::npos || url[path_start] == '#')
    {
        parts.path_and_query = "/";
    }
    else
    {
        // Fragments never go on the wire
        auto fragment = url.find('#', path_start);
        parts.path_and_query = url.substr(path_start, fragment == std::string::npos ? std::string::npos : fragment - path_start);
        if (parts.path_and_query[0] == '?')
            parts.path_and_query = "/" + parts.path_and_query;
    }
    return true;
}
