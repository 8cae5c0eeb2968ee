#pragma once

#include <httplib.h>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "core/config_observer.hpp"

class PocoConfigAdapter;

/**
 * @brief Owns the HTTP listener and rebinds it when server_host/server_port change
 *
 * Routes are installed through the route setup callback each time a fresh
 * httplib::Server is created, so a rebind keeps the same endpoints.
 */
class HttpServerManager : public ConfigObserver
{
public:
    using RouteSetupCallback = std::function<void(httplib::Server &)>;

    explicit HttpServerManager(PocoConfigAdapter &config);
    ~HttpServerManager() override;

    HttpServerManager(const HttpServerManager &) = delete;
    HttpServerManager &operator=(const HttpServerManager &) = delete;

    /**
     * @brief Bind and start serving on a background thread
     * @return false when the address cannot be bound
     */
    bool start(const std::string &host, int port);
    void stop();
    bool isRunning() const;

    void onConfigUpdate(const ConfigUpdateEvent &event) override;

    std::string getCurrentHost() const;
    int getCurrentPort() const;

    void setRouteSetupCallback(RouteSetupCallback callback);

private:
    // Callers hold server_mutex_
    bool startLocked(const std::string &host, int port);
    void stopLocked();

    PocoConfigAdapter &config_;

    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_{false};

    std::string current_host_;
    int current_port_;

    RouteSetupCallback route_setup_callback_;

    mutable std::mutex server_mutex_;
    mutable std::mutex config_mutex_;
};
