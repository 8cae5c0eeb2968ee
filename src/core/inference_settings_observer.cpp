#include "core/inference_settings_observer.hpp"
#include "core/inference_context.hpp"
#include "poco_config_adapter.hpp"
#include "logging/logger.hpp"

namespace
{
    bool startsWith(const std::string &key, const std::string &prefix)
    {
        return key.compare(0, prefix.size(), prefix) == 0;
    }

    std::string joinKeys(const std::vector<std::string> &keys)
    {
        std::string joined;
        for (const auto &key : keys)
        {
            joined += (joined.empty() ? "" : ", ") + key;
        }
        return joined;
    }
}

InferenceSettingsObserver::InferenceSettingsObserver(PocoConfigAdapter &config, InferenceContext &context)
    : config_(config), context_(context)
{
}

void InferenceSettingsObserver::onConfigUpdate(const ConfigUpdateEvent &event)
{
    if (hasPipelineChange(event))
    {
        try
        {
            handlePipelineChange();
        }
        catch (const std::exception &e)
        {
            Logger::error("InferenceSettingsObserver: error applying inference settings: " + std::string(e.what()));
        }
    }

    auto restart_keys = restartOnlyKeys(event);
    if (!restart_keys.empty())
    {
        Logger::warn("InferenceSettingsObserver: " + joinKeys(restart_keys) + " changed, restart to apply");
    }
}

bool InferenceSettingsObserver::hasPipelineChange(const ConfigUpdateEvent &event) const
{
    for (const auto &key : event.changed_keys)
    {
        if (startsWith(key, "inference.") || key == "model.default_version")
        {
            return true;
        }
    }
    return false;
}

std::vector<std::string> InferenceSettingsObserver::restartOnlyKeys(const ConfigUpdateEvent &event) const
{
    std::vector<std::string> keys;
    for (const auto &key : event.changed_keys)
    {
        if (startsWith(key, "detector.") || (startsWith(key, "model.") && key != "model.default_version"))
        {
            keys.push_back(key);
        }
    }
    return keys;
}

void InferenceSettingsObserver::handlePipelineChange()
{
    int max_frames = config_.getMaxVideoFrames();
    int max_threads = config_.getMaxInferenceThreads();
    double padding = config_.getPaddingPercent();
    if (max_frames <= 0 || max_threads <= 0 || padding < 0.0)
    {
        Logger::warn("InferenceSettingsObserver: rejecting inference settings (max_video_frames=" +
                     std::to_string(max_frames) + ", max_threads=" + std::to_string(max_threads) +
                     ", padding_percent=" + std::to_string(padding) + "), keeping current values");
        return;
    }

    PipelineSettings settings = InferenceContext::settingsFromConfig(config_);
    context_.updateSettings(settings);
    Logger::info("InferenceSettingsObserver: max_video_frames=" + std::to_string(settings.max_video_frames) +
                 ", padding_percent=" + std::to_string(settings.padding_percent) +
                 ", detect_faces=" + (settings.detect_faces ? "true" : "false") +
                 ", max_threads=" + std::to_string(settings.max_threads) +
                 ", default_model_version=" + settings.default_model_version);
}
