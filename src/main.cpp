#include "core/http_server_manager.hpp"
#include "core/inference_context.hpp"
#include "core/inference_settings_observer.hpp"
#include "core/logger_observer.hpp"
#include "core/shutdown_manager.hpp"
#include "web/route_handlers.hpp"
#include "logging/logger.hpp"
#include "poco_config_adapter.hpp"
#include "server_config.hpp"
#include <iostream>
#include <memory>
#include <string>

namespace
{
    void printUsage(const char *program)
    {
        std::cout << "Deepfake inference server " << ServerConfig::SERVICE_VERSION << std::endl;
        std::cout << "Usage: " << program << " [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config, -c <path>   Configuration file (default " << ServerConfig::DEFAULT_CONFIG_PATH << ")" << std::endl;
        std::cout << "  --no-watch            Do not reload the configuration file when it changes" << std::endl;
        std::cout << "  --help, -h            Show this help message" << std::endl;
    }
}

int main(int argc, char *argv[])
{
    // Block shutdown signals before any other thread exists
    auto &shutdown_manager = ShutdownManager::getInstance();
    shutdown_manager.installSignalHandlers();

    std::string config_path = ServerConfig::DEFAULT_CONFIG_PATH;
    bool watch_config = true;
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
                std::cerr << "Error: " << arg << " needs a path" << std::endl;
                return 1;
            }
            config_path = argv[++i];
        }
        else if (arg == "--no-watch")
        {
            watch_config = false;
        }
        else
        {
            std::cerr << "Error: unknown option " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    auto &config_manager = PocoConfigAdapter::getInstance();
    if (!config_manager.loadConfig(config_path))
    {
        Logger::warn("Using built-in defaults, " + config_path + " was not loaded");
    }
    if (!config_manager.validateConfig())
    {
        Logger::error("Configuration is invalid, refusing to start");
        return 1;
    }

    Logger::init(config_manager.getLogLevel());
    Logger::info("Starting " + std::string(ServerConfig::SERVICE_NAME) + " " + ServerConfig::SERVICE_VERSION);

    auto logger_observer = std::make_unique<LoggerObserver>(config_manager);
    config_manager.subscribe(logger_observer.get());

    std::unique_ptr<InferenceContext> context = InferenceContext::fromConfig(config_manager);
    Logger::info("Model loaded: " + std::string(context->isReady() ? "true" : "false"));

    // Pick the face detector backend now rather than on the first request
    if (context->detectorProvider() && context->settings().detect_faces)
    {
        Logger::info("Face detection method: " + context->detectorProvider()->detectionMethod());
    }

    InferenceSettingsObserver inference_settings_observer(config_manager, *context);
    config_manager.subscribe(&inference_settings_observer);

    HttpServerManager http_server_manager(config_manager);
    http_server_manager.setRouteSetupCallback([&context](httplib::Server &svr)
                                              { RouteHandlers::setupRoutes(svr, *context); });
    config_manager.subscribe(&http_server_manager);

    if (!http_server_manager.start(config_manager.getServerHost(), config_manager.getServerPort()))
    {
        config_manager.unsubscribe(&http_server_manager);
        config_manager.unsubscribe(&inference_settings_observer);
        config_manager.unsubscribe(logger_observer.get());
        return 1;
    }

    if (watch_config)
    {
        config_manager.startWatching(config_manager.configPath(), 2);
    }

    shutdown_manager.addShutdownHook("observers", [&]
                                     {
        config_manager.unsubscribe(&http_server_manager);
        config_manager.unsubscribe(&inference_settings_observer);
        config_manager.unsubscribe(logger_observer.get()); });
    shutdown_manager.addShutdownHook("http_server", [&]
                                     { http_server_manager.stop(); });
    shutdown_manager.addShutdownHook("config_watcher", [&]
                                     { config_manager.stopWatching(); });

    shutdown_manager.waitForShutdown();
    Logger::info("Shutdown requested (" + shutdown_manager.getReason() + "), cleaning up...");

    shutdown_manager.runShutdownHooks();

    Logger::info("Server shutdown complete");
    return 0;
}
