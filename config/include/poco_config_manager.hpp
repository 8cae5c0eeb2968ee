#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Thread-safe JSON configuration store with built-in defaults
 *
 * Every key has a default; load() overlays a file on top of the defaults so a
 * partial config file never removes a setting.
 */
class PocoConfigManager
{
public:
    static PocoConfigManager &getInstance()
    {
        static PocoConfigManager instance;
        return instance;
    }

    // Core file operations
    bool load(const std::string &path);
    bool save(const std::string &path) const;
    void update(const nlohmann::json &patch);
    nlohmann::json getAll() const;
    void resetToDefaults();

    // Basic configuration getters
    std::string getString(const std::string &key, const std::string &def = "") const;
    int getInt(const std::string &key, int def = 0) const;
    double getDouble(const std::string &key, double def = 0.0) const;
    bool getBool(const std::string &key, bool def = false) const;

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

    // Configuration validation
    bool validateConfig() const;

    bool hasKey(const std::string &key) const;

private:
    PocoConfigManager();
    ~PocoConfigManager() = default;
    PocoConfigManager(const PocoConfigManager &) = delete;
    PocoConfigManager &operator=(const PocoConfigManager &) = delete;

    // Callers hold mutex_
    void applyDefaults();
    void applyPatch(const nlohmann::json &patch);

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};

// Helper function to split strings by delimiter
std::vector<std::string> split(const std::string &str, char delimiter);
