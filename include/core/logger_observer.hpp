#pragma once

#include "core/config_observer.hpp"

class PocoConfigAdapter;

/**
 * @brief Applies log_level changes to the Logger at runtime
 */
class LoggerObserver : public ConfigObserver
{
public:
    explicit LoggerObserver(PocoConfigAdapter &config);
    ~LoggerObserver() override = default;

    void onConfigUpdate(const ConfigUpdateEvent &event) override;

private:
    PocoConfigAdapter &config_;
};
