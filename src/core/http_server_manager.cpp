#include "core/http_server_manager.hpp"
#include "core/poco_config_adapter.hpp"
#include "logging/logger.hpp"

HttpServerManager::HttpServerManager() : current_host_("0.0.0.0"), current_port_(8080)
{
}

HttpServerManager::~HttpServerManager()
{
    stop();
}

HttpServerManager &HttpServerManager::getInstance()
{
    static HttpServerManager instance;
    return instance;
}

void HttpServerManager::setRouteSetupCallback(RouteSetupCallback callback)
{
    std::lock_guard<std::mutex> lock(server_mutex_);
    route_setup_callback_ = std::move(callback);
}

void HttpServerManager::start(const std::string &host, int port)
{
    std::lock_guard<std::mutex> lock(server_mutex_);

    if (running_.load())
    {
        Logger::warn("HttpServerManager: server already running, restarting");
        shutdownLocked();
    }

    {
        std::lock_guard<std::mutex> config_lock(config_mutex_);
        current_host_ = host;
        current_port_ = port;
    }
    launchLocked();
}

void HttpServerManager::stop()
{
    std::lock_guard<std::mutex> lock(server_mutex_);
    if (!running_.load() && !server_)
    {
        return;
    }
    shutdownLocked();
    Logger::info("HttpServerManager: server stopped");
}

void HttpServerManager::onConfigUpdate(const ConfigUpdateEvent &event)
{
    if (!event.touches("server_port") && !event.touches("server_host"))
    {
        return;
    }

    auto &config = PocoConfigAdapter::getInstance();
    std::string new_host = config.getServerHost();
    int new_port = config.getServerPort();

    std::lock_guard<std::mutex> lock(server_mutex_);
    {
        std::lock_guard<std::mutex> config_lock(config_mutex_);
        if (new_host == current_host_ && new_port == current_port_)
        {
            return;
        }
        current_host_ = new_host;
        current_port_ = new_port;
    }

    if (!running_.load())
    {
        Logger::info("HttpServerManager: listener not running, " + new_host + ":" +
                     std::to_string(new_port) + " will be used on next start");
        return;
    }

    Logger::info("HttpServerManager: rebinding listener to " + new_host + ":" + std::to_string(new_port));
    shutdownLocked();
    launchLocked();
}

void HttpServerManager::launchLocked()
{
    server_ = std::make_unique<httplib::Server>();
    if (route_setup_callback_)
    {
        route_setup_callback_(*server_);
    }
    else
    {
        Logger::warn("HttpServerManager: no routes registered");
    }

    std::string host;
    int port;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        host = current_host_;
        port = current_port_;
    }

    running_.store(true);
    server_thread_ = std::thread(&HttpServerManager::serverThread, this, server_.get(), host, port);
    Logger::info("HttpServerManager: listening on " + host + ":" + std::to_string(port));
}

void HttpServerManager::shutdownLocked()
{
    running_.store(false);
    if (server_)
    {
        server_->stop();
    }
    if (server_thread_.joinable())
    {
        server_thread_.join();
    }
    server_.reset();
}

void HttpServerManager::serverThread(httplib::Server *server, std::string host, int port)
{
    try
    {
        if (!server->listen(host, port))
        {
            Logger::error("HttpServerManager: failed to listen on " + host + ":" + std::to_string(port));
            running_.store(false);
        }
    }
    catch (const std::exception &e)
    {
        Logger::error("HttpServerManager: server thread error: " + std::string(e.what()));
        running_.store(false);
    }
}
