#pragma once

#include "core/clip_extraction_orchestrator.hpp"
#include "logging/logger.hpp"
#include "server_config.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

/**
 * @brief Values reported by the status endpoint and used for request limits
 */
struct RouteSettings
{
    size_t max_body_bytes = 65536;
    std::string temp_dir;
    int request_budget_seconds = 60;
    std::string ffmpeg_path;
};

class RouteHandlers
{
public:
    /**
     * @brief Register the clip and status endpoints.
     *
     * The orchestrator must outlive the server; handlers capture it by reference.
     * The body size limit is enforced by handleClip so oversized requests get a 400.
     */
    static void setupRoutes(httplib::Server &svr, ClipExtractionOrchestrator &orchestrator,
                            const RouteSettings &settings)
    {
        svr.Post(ServerConfig::CLIP_PATH, [&orchestrator, settings](const httplib::Request &req, httplib::Response &res)
                 { handleClip(req, res, orchestrator, settings); });

        svr.Get(ServerConfig::STATUS_PATH, [settings](const httplib::Request &req, httplib::Response &res)
                { handleStatus(req, res, settings); });

        Logger::info("RouteHandlers: registered " + std::string(ServerConfig::CLIP_PATH) + " and " +
                     ServerConfig::STATUS_PATH);
    }

    static int statusFor(ClipErrorKind kind)
    {
        switch (kind)
        {
        case ClipErrorKind::None:
            return 200;
        case ClipErrorKind::InvalidRequest:
            return 400;
        default:
            return 500;
        }
    }

    static void handleClip(const httplib::Request &req, httplib::Response &res,
                           ClipExtractionOrchestrator &orchestrator, const RouteSettings &settings)
    {
        Logger::trace("Received clip request from " + req.remote_addr);

        if (req.body.size() > settings.max_body_bytes)
        {
            writeFailure(res, ClipResult::failure(ClipErrorKind::InvalidRequest, "Request body too large"));
            return;
        }

        ClipRequest request;
        try
        {
            request = ClipRequest::fromJson(req.body);
        }
        catch (const ClipError &e)
        {
            writeFailure(res, ClipResult::failure(e.kind(), e.what()));
            return;
        }

        ClipResult result = orchestrator.extract(request);
        if (!result.success)
        {
            writeFailure(res, result);
            return;
        }

        res.status = 200;
        res.set_header("Content-Disposition", "attachment; filename=\"" + result.filename + "\"");
        res.set_header("Cache-Control", "no-store");
        res.body.assign(result.data.begin(), result.data.end());
        res.set_header("Content-Type", result.content_type);
    }

    static void handleStatus(const httplib::Request &, httplib::Response &res, const RouteSettings &settings)
    {
        json response = {
            {"status", "ok"},
            {"service", ServerConfig::SERVICE_NAME},
            {"temp_dir", settings.temp_dir},
            {"request_budget_seconds", settings.request_budget_seconds},
            {"ffmpeg_path", settings.ffmpeg_path}};
        res.set_content(response.dump(), "application/json");
    }

private:
    static void writeFailure(httplib::Response &res, const ClipResult &result)
    {
        res.status = statusFor(result.error_kind);
        res.set_header("X-Clip-Error", toString(result.error_kind));
        res.set_content(result.error_message, "text/plain");
    }
};
