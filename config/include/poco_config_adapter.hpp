#pragma once

#include "poco_config_manager.hpp"
#include "core/config_observer.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Application-facing configuration: typed access plus change notification
 *
 * Delegates storage to PocoConfigManager. Setters persist to the active config file
 * and publish a ConfigUpdateEvent naming the changed keys; the optional file watcher
 * reloads the file when it changes on disk and publishes the keys whose values
 * differ from before the reload.
 */
class PocoConfigAdapter
{
public:
    static PocoConfigAdapter &getInstance()
    {
        static PocoConfigAdapter instance;
        return instance;
    }

    ~PocoConfigAdapter();

    nlohmann::json getAll() const;

    // Server
    std::string getLogLevel() const;
    int getServerPort() const;
    std::string getServerHost() const;

    // Classifier model
    std::string getModelPath() const;
    std::string getModelName() const;
    int getModelInputSize() const;
    std::vector<std::string> getModelLabels() const;
    std::string getDefaultModelVersion() const;

    // Face detector
    std::string getDetectorCacheDir() const;
    std::string getDnnConfigUrl() const;
    std::string getDnnWeightsUrl() const;
    std::string getHaarCascadePath() const;
    double getDnnConfidenceThreshold() const;
    double getHaarConfidenceThreshold() const;
    bool getModelDownloadEnabled() const;

    // Inference pipeline
    int getMaxVideoFrames() const;
    double getPaddingPercent() const;
    bool getDetectFaces() const;
    int getMaxInferenceThreads() const;

    // Configuration setters with event publishing
    void setLogLevel(const std::string &level);
    void setServerPort(int port);
    void setServerHost(const std::string &host);
    void setMaxVideoFrames(int frames);
    void setDetectFaces(bool enabled);

    /**
     * @brief Merge a JSON object into the configuration and publish the keys that changed
     * @throws nlohmann::json::parse_error on malformed JSON, std::invalid_argument for non-objects
     */
    void updateConfig(const std::string &json_config);

    // Configuration file operations
    bool loadConfig(const std::string &file_path);
    bool saveConfig(const std::string &file_path = "") const;
    std::string configPath() const;

    // Restore built-in defaults without publishing (tests, --help)
    void resetToDefaults();

    bool validateConfig() const;

    // Runtime config file watching
    void startWatching(const std::string &file_path = "", int interval_seconds = 2);
    void stopWatching();
    bool isWatching() const { return watching_.load(); }

    // Observer management
    void subscribe(ConfigObserver *observer);
    void unsubscribe(ConfigObserver *observer);

    /**
     * @brief Dotted keys whose leaf values differ between two configuration snapshots
     */
    static std::vector<std::string> diffKeys(const nlohmann::json &before, const nlohmann::json &after);

private:
    PocoConfigAdapter();
    PocoConfigAdapter(const PocoConfigAdapter &) = delete;
    PocoConfigAdapter &operator=(const PocoConfigAdapter &) = delete;

    void applyAndPublish(const nlohmann::json &patch, const std::string &source);
    void publishEvent(const ConfigUpdateEvent &event);
    std::string generateUpdateId() const;
    void persistChanges(const std::vector<std::string> &changed_keys);
    void watchLoop();

    PocoConfigManager &poco_cfg_;

    mutable std::mutex path_mutex_;
    std::string config_path_;

    // Observers
    mutable std::mutex observers_mutex_;
    std::vector<ConfigObserver *> observers_;

    // File watching internals
    std::atomic<bool> watching_{false};
    std::thread watcher_thread_;
    std::mutex watch_mutex_;
    std::condition_variable watch_cv_;
    std::string watched_file_path_;
    int watch_interval_seconds_{2};
    std::filesystem::file_time_type last_write_time_{};
};
