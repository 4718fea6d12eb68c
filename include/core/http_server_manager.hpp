#pragma once

#include <httplib.h>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "config_observer.hpp"

/**
 * @brief Owns the HTTP listener and its thread.
 *
 * Routes are installed through a callback so the listener can be rebuilt when
 * server_host or server_port change at runtime.
 */
class HttpServerManager : public ConfigObserver
{
public:
    static HttpServerManager &getInstance();

    using RouteSetupCallback = std::function<void(httplib::Server &)>;
    void setRouteSetupCallback(RouteSetupCallback callback);

    void start(const std::string &host, int port);
    void stop();

    void onConfigUpdate(const ConfigUpdateEvent &event) override;

private:
    HttpServerManager();
    ~HttpServerManager();
    HttpServerManager(const HttpServerManager &) = delete;
    HttpServerManager &operator=(const HttpServerManager &) = delete;

    void launchLocked();
    void shutdownLocked();
    void serverThread(httplib::Server *server, std::string host, int port);

    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_{false};

    std::string current_host_;
    int current_port_;
    RouteSetupCallback route_setup_callback_;

    // Guards server_, server_thread_ and the callback
    mutable std::mutex server_mutex_;
    mutable std::mutex config_mutex_;
};
