#pragma once

#include "core/config_observer.hpp"
#include <string>
#include <vector>

class InferenceContext;
class PocoConfigAdapter;

/**
 * @brief Applies inference.* and model.default_version changes to a running context
 *
 * Requests already in flight keep the settings they started with. Detector and
 * classifier keys are chosen once at startup; changes to them are logged as
 * needing a restart.
 */
class InferenceSettingsObserver : public ConfigObserver
{
public:
    InferenceSettingsObserver(PocoConfigAdapter &config, InferenceContext &context);
    ~InferenceSettingsObserver() override = default;

    void onConfigUpdate(const ConfigUpdateEvent &event) override;

private:
    bool hasPipelineChange(const ConfigUpdateEvent &event) const;

    /**
     * @brief Keys that only take effect after a restart
     */
    std::vector<std::string> restartOnlyKeys(const ConfigUpdateEvent &event) const;

    void handlePipelineChange();

    PocoConfigAdapter &config_;
    InferenceContext &context_;
};
