#include "core/logger_observer.hpp"
#include "poco_config_adapter.hpp"
#include "logging/logger.hpp"

LoggerObserver::LoggerObserver(PocoConfigAdapter &config)
    : config_(config)
{
}

void LoggerObserver::onConfigUpdate(const ConfigUpdateEvent &event)
{
    if (!event.touches("log_level"))
    {
        return;
    }

    std::string new_log_level = config_.getLogLevel();
    if (!Logger::isKnownLevel(new_log_level))
    {
        Logger::warn("LoggerObserver: ignoring unknown log level " + new_log_level);
        return;
    }

    Logger::setLevel(new_log_level);
    Logger::info("LoggerObserver: log level is now " + new_log_level);
}
