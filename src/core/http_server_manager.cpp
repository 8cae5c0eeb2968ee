#include "core/http_server_manager.hpp"
#include "poco_config_adapter.hpp"
#include "logging/logger.hpp"
#include "server_config.hpp"

HttpServerManager::HttpServerManager(PocoConfigAdapter &config)
    : config_(config),
      current_host_(config.getServerHost()),
      current_port_(config.getServerPort())
{
}

HttpServerManager::~HttpServerManager()
{
    stop();
}

bool HttpServerManager::start(const std::string &host, int port)
{
    std::lock_guard<std::mutex> lock(server_mutex_);
    if (running_.load())
    {
        Logger::warn("HttpServerManager: server already running, restarting");
        stopLocked();
    }
    return startLocked(host, port);
}

void HttpServerManager::stop()
{
    std::lock_guard<std::mutex> lock(server_mutex_);
    stopLocked();
}

bool HttpServerManager::startLocked(const std::string &host, int port)
{
    auto server = std::make_unique<httplib::Server>();
    server->set_payload_max_length(ServerConfig::MAX_REQUEST_BODY_BYTES);
    if (route_setup_callback_)
    {
        route_setup_callback_(*server);
    }
    else
    {
        Logger::warn("HttpServerManager: no route setup callback, server will answer 404 only");
    }

    if (!server->bind_to_port(host, port))
    {
        Logger::error("HttpServerManager: failed to bind " + host + ":" + std::to_string(port));
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        current_host_ = host;
        current_port_ = port;
    }

    server_ = std::move(server);
    running_.store(true);
    httplib::Server *raw = server_.get();
    server_thread_ = std::thread([this, raw]
                                 {
        if (!raw->listen_after_bind())
        {
            Logger::error("HttpServerManager: listener exited with an error");
        }
        running_.store(false); });

    Logger::info("HttpServerManager: serving on http://" + host + ":" + std::to_string(port));
    return true;
}

void HttpServerManager::stopLocked()
{
    if (server_)
    {
        server_->stop();
    }
    if (server_thread_.joinable())
    {
        server_thread_.join();
    }
    if (server_)
    {
        server_.reset();
        Logger::info("HttpServerManager: server stopped");
    }
    running_.store(false);
}

bool HttpServerManager::isRunning() const
{
    return running_.load();
}

std::string HttpServerManager::getCurrentHost() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    return current_host_;
}

int HttpServerManager::getCurrentPort() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    return current_port_;
}

void HttpServerManager::setRouteSetupCallback(RouteSetupCallback callback)
{
    std::lock_guard<std::mutex> lock(server_mutex_);
    route_setup_callback_ = std::move(callback);
}

void HttpServerManager::onConfigUpdate(const ConfigUpdateEvent &event)
{
    if (!event.touches("server_host") && !event.touches("server_port"))
    {
        return;
    }

    std::string new_host = config_.getServerHost();
    int new_port = config_.getServerPort();

    std::lock_guard<std::mutex> lock(server_mutex_);
    if (!running_.load() && !server_)
    {
        Logger::info("HttpServerManager: not running, next start uses " + new_host + ":" + std::to_string(new_port));
        std::lock_guard<std::mutex> config_lock(config_mutex_);
        current_host_ = new_host;
        current_port_ = new_port;
        return;
    }

    std::string old_host = getCurrentHost();
    int old_port = getCurrentPort();
    if (old_host == new_host && old_port == new_port)
    {
        return;
    }

    Logger::info("HttpServerManager: rebinding from " + old_host + ":" + std::to_string(old_port) +
                 " to " + new_host + ":" + std::to_string(new_port));
    stopLocked();
    if (!startLocked(new_host, new_port))
    {
        Logger::error("HttpServerManager: rebind failed, restoring " + old_host + ":" + std::to_string(old_port));
        if (!startLocked(old_host, old_port))
        {
            Logger::error("HttpServerManager: could not restore the previous address, server is down");
        }
    }
}
