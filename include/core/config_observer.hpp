#pragma once

#include <string>
#include <vector>

/**
 * @brief Configuration change notification
 */
struct ConfigUpdateEvent
{
    std::vector<std::string> changed_keys; // dotted keys, e.g. "inference.max_video_frames"
    std::string source;                    // "api" or "file_observer"
    std::string update_id;

    bool touches(const std::string &key) const
    {
        for (const auto &changed : changed_keys)
        {
            if (changed == key)
                return true;
        }
        return false;
    }
};

/**
 * @brief Observer interface for configuration changes
 */
class ConfigObserver
{
public:
    virtual ~ConfigObserver() = default;
    virtual void onConfigUpdate(const ConfigUpdateEvent &event) = 0;
};
