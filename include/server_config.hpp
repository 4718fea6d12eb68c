#pragma once

class ServerConfig
{
public:
    static constexpr const char *SERVICE_NAME = "clip_server";
    static constexpr const char *DEFAULT_CONFIG_PATH = "config/config.json";

    static constexpr const char *CLIP_PATH = "/api/clip";
    static constexpr const char *STATUS_PATH = "/api/status";

    static constexpr int CONFIG_WATCH_INTERVAL_SECONDS = 2;
};
