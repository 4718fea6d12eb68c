#include "core/clip_extraction_orchestrator.hpp"
#include "core/http_server_manager.hpp"
#include "core/logger_observer.hpp"
#include "core/poco_config_adapter.hpp"
#include "core/remote_stream.hpp"
#include "core/shutdown_manager.hpp"
#include "core/source_stream_resolver.hpp"
#include "core/temp_artifact_manager.hpp"
#include "core/transcoding_pipeline.hpp"
#include "logging/logger.hpp"
#include "server_config.hpp"
#include "web/route_handlers.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <unistd.h>

namespace
{
    void printUsage(const char *program)
    {
        std::cout << "Clip Server - extracts MP4 clips from remote videos" << std::endl;
        std::cout << "Usage: " << program << " [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config, -c <path>  Configuration file (default: " << ServerConfig::DEFAULT_CONFIG_PATH << ")" << std::endl;
        std::cout << "  --help, -h           Show this help message" << std::endl;
    }
}

int main(int argc, char *argv[])
{
    std::string config_path = ServerConfig::DEFAULT_CONFIG_PATH;
    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else if (arg == "--config" || arg == "-c")
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Error: " << arg << " requires a path" << std::endl;
                return 1;
            }
            config_path = argv[++i];
        }
        else
        {
            std::cerr << "Error: unknown option " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    auto &shutdown_manager = ShutdownManager::getInstance();
    shutdown_manager.installSignalHandlers();

    auto &config_manager = PocoConfigAdapter::getInstance();
    bool config_loaded = config_manager.loadConfig(config_path);
    Logger::init(config_manager.getLogLevel());
    if (!config_loaded)
    {
        Logger::warn("Could not load " + config_path + ", using built-in defaults");
    }
    if (!config_manager.validateConfig())
    {
        Logger::error("Configuration is invalid, refusing to start");
        return 1;
    }

    Logger::info("Starting clip server (PID: " + std::to_string(getpid()) + ")...");

    LoggerObserver logger_observer;
    config_manager.subscribe(&logger_observer);

    std::unique_ptr<TempArtifactManager> artifacts;
    try
    {
        artifacts = std::make_unique<TempArtifactManager>(config_manager.getTempDir());
    }
    catch (const ClipError &e)
    {
        Logger::error("Cannot use temp directory: " + std::string(e.what()));
        return 1;
    }

    SourceStreamResolver resolver(std::make_shared<YtDlpManifestProvider>(config_manager.getResolverConfig()));
    HttpStreamOpener opener(config_manager.getStreamConfig());
    TranscodingPipeline transcoder(config_manager.getTranscoderConfig());

    ClipExtractionOrchestrator::Settings settings;
    settings.request_budget = std::chrono::seconds(config_manager.getRequestBudgetSeconds());
    settings.external_cancel = [&shutdown_manager]()
    { return shutdown_manager.isShutdownRequested(); };
    ClipExtractionOrchestrator orchestrator(resolver, opener, transcoder, *artifacts, settings);

    RouteSettings route_settings;
    route_settings.max_body_bytes = static_cast<size_t>(config_manager.getMaxBodyBytes());
    route_settings.temp_dir = artifacts->tempDir();
    route_settings.request_budget_seconds = config_manager.getRequestBudgetSeconds();
    route_settings.ffmpeg_path = transcoder.config().ffmpeg_path;

    auto &http_server = HttpServerManager::getInstance();
    http_server.setRouteSetupCallback([&orchestrator, route_settings](httplib::Server &svr)
                                      { RouteHandlers::setupRoutes(svr, orchestrator, route_settings); });
    config_manager.subscribe(&http_server);
    http_server.start(config_manager.getServerHost(), config_manager.getServerPort());

    if (config_loaded)
    {
        config_manager.startWatching(config_path, ServerConfig::CONFIG_WATCH_INTERVAL_SECONDS);
    }

    // Hooks run in reverse order: the watcher stops before the listener
    shutdown_manager.addShutdownHook("http_server", [&http_server]()
                                     { http_server.stop(); });
    shutdown_manager.addShutdownHook("config_watcher", [&config_manager]()
                                     { config_manager.stopWatching(); });

    Logger::info("Clip server ready on " + config_manager.getServerHost() + ":" +
                 std::to_string(config_manager.getServerPort()));

    shutdown_manager.waitForShutdown();
    Logger::info("Shutting down: " + shutdown_manager.getReason());

    shutdown_manager.runShutdownHooks();
    config_manager.unsubscribe(&http_server);
    config_manager.unsubscribe(&logger_observer);

    Logger::info("Clip server stopped");
    return 0;
}
