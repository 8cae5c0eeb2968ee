#include "poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <fstream>
#include <functional>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

PocoConfigManager::PocoConfigManager()
{
    cfg_ = new JSONConfiguration();
    applyDefaults();
}

bool PocoConfigManager::load(const std::string &path)
{
    std::ifstream in(path);
    if (!in.good())
        return false;

    nlohmann::json file_config;
    try
    {
        in >> file_config;
    }
    catch (const nlohmann::json::parse_error &e)
    {
        Logger::error("PocoConfigManager: cannot parse " + path + ": " + e.what());
        return false;
    }
    if (!file_config.is_object())
    {
        Logger::error("PocoConfigManager: " + path + " does not contain a JSON object");
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    cfg_ = new JSONConfiguration();
    applyDefaults();
    applyPatch(file_config);
    return true;
}

bool PocoConfigManager::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
        return false;
    cfg_->save(out);
    return out.good();
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

void PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    applyPatch(patch);
}

void PocoConfigManager::resetToDefaults()
{
    std::lock_guard<std::mutex> lock(mutex_);
    cfg_ = new JSONConfiguration();
    applyDefaults();
}

void PocoConfigManager::applyPatch(const nlohmann::json &patch)
{
    // Flatten nested objects into dotted keys
    std::function<void(const std::string &, const nlohmann::json &)> apply;
    apply = [&](const std::string &prefix, const nlohmann::json &node)
    {
        if (node.is_object())
        {
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
                apply(key, it.value());
            }
        }
        else if (!node.is_null())
        {
            if (node.is_boolean())
                cfg_->setBool(prefix, node.get<bool>());
            else if (node.is_number_integer())
                cfg_->setInt(prefix, node.get<int>());
            else if (node.is_number_float())
                cfg_->setDouble(prefix, node.get<double>());
            else if (node.is_string())
                cfg_->setString(prefix, node.get<std::string>());
            else
                cfg_->setString(prefix, node.dump());
        }
    };
    apply("", patch);
}

std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getInt(key, def);
    }
    catch (const Poco::SyntaxException &)
    {
        Logger::warn("PocoConfigManager: " + key + " is not an integer, using " + std::to_string(def));
        return def;
    }
}

double PocoConfigManager::getDouble(const std::string &key, double def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getDouble(key, def);
    }
    catch (const Poco::SyntaxException &)
    {
        Logger::warn("PocoConfigManager: " + key + " is not a number, using " + std::to_string(def));
        return def;
    }
}

bool PocoConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getBool(key, def);
    }
    catch (const Poco::SyntaxException &)
    {
        Logger::warn("PocoConfigManager: " + key + " is not a boolean, using default");
        return def;
    }
}

std::string PocoConfigManager::getLogLevel() const
{
    return getString("log_level", "INFO");
}

int PocoConfigManager::getServerPort() const
{
    return getInt("server_port", 5000);
}

std::string PocoConfigManager::getServerHost() const
{
    return getString("server_host", "0.0.0.0");
}

std::string PocoConfigManager::getModelPath() const
{
    return getString("model.classifier_path", "models/deepfake_classifier.onnx");
}

std::string PocoConfigManager::getModelName() const
{
    return getString("model.name", "efficientnet_b0_ffpp_c23");
}

int PocoConfigManager::getModelInputSize() const
{
    return getInt("model.input_size", 224);
}

std::vector<std::string> PocoConfigManager::getModelLabels() const
{
    std::vector<std::string> labels;
    for (const auto &label : split(getString("model.labels", "Real,Fake"), ','))
    {
        auto first = label.find_first_not_of(" \t");
        auto last = label.find_last_not_of(" \t");
        if (first != std::string::npos)
        {
            labels.push_back(label.substr(first, last - first + 1));
        }
    }
    return labels;
}

std::string PocoConfigManager::getDefaultModelVersion() const
{
    return getString("model.default_version", "v2");
}

std::string PocoConfigManager::getDetectorCacheDir() const
{
    return getString("detector.cache_dir", "face_detection_models");
}

std::string PocoConfigManager::getDnnConfigUrl() const
{
    return getString("detector.dnn_config_url");
}

std::string PocoConfigManager::getDnnWeightsUrl() const
{
    return getString("detector.dnn_weights_url");
}

std::string PocoConfigManager::getHaarCascadePath() const
{
    return getString("detector.haar_cascade_path", "haarcascade_frontalface_default.xml");
}

double PocoConfigManager::getDnnConfidenceThreshold() const
{
    return getDouble("detector.dnn_confidence_threshold", 0.3);
}

double PocoConfigManager::getHaarConfidenceThreshold() const
{
    return getDouble("detector.haar_confidence_threshold", 0.5);
}

bool PocoConfigManager::getModelDownloadEnabled() const
{
    return getBool("detector.download_enabled", true);
}

int PocoConfigManager::getMaxVideoFrames() const
{
    return getInt("inference.max_video_frames", 30);
}

double PocoConfigManager::getPaddingPercent() const
{
    return getDouble("inference.padding_percent", 30.0);
}

bool PocoConfigManager::getDetectFaces() const
{
    return getBool("inference.detect_faces", true);
}

int PocoConfigManager::getMaxInferenceThreads() const
{
    return getInt("inference.max_threads", 4);
}

bool PocoConfigManager::validateConfig() const
{
    std::vector<std::string> required_fields = {
        "log_level", "server_port", "server_host", "model.classifier_path", "model.labels"};

    for (const auto &field : required_fields)
    {
        if (!hasKey(field))
        {
            Logger::error("Missing required config field: " + field);
            return false;
        }
    }

    int port = getServerPort();
    if (port <= 0 || port > 65535)
    {
        Logger::error("Invalid server port: " + std::to_string(port));
        return false;
    }

    if (!Logger::isKnownLevel(getLogLevel()))
    {
        Logger::error("Invalid log level: " + getLogLevel());
        return false;
    }

    if (getModelLabels().empty())
    {
        Logger::error("model.labels must name at least one class");
        return false;
    }

    if (getModelInputSize() <= 0)
    {
        Logger::error("Invalid model input size: " + std::to_string(getModelInputSize()));
        return false;
    }

    if (getMaxVideoFrames() <= 0)
    {
        Logger::error("Invalid inference.max_video_frames: " + std::to_string(getMaxVideoFrames()));
        return false;
    }

    if (getPaddingPercent() < 0.0)
    {
        Logger::error("Invalid inference.padding_percent: " + std::to_string(getPaddingPercent()));
        return false;
    }

    if (getMaxInferenceThreads() <= 0)
    {
        Logger::error("Invalid inference.max_threads: " + std::to_string(getMaxInferenceThreads()));
        return false;
    }

    return true;
}

void PocoConfigManager::applyDefaults()
{
    cfg_->setString("log_level", "INFO");
    cfg_->setString("server_host", "0.0.0.0");
    cfg_->setInt("server_port", 5000);

    // Classifier
    cfg_->setString("model.classifier_path", "models/deepfake_classifier.onnx");
    cfg_->setString("model.name", "efficientnet_b0_ffpp_c23");
    cfg_->setInt("model.input_size", 224);
    cfg_->setString("model.labels", "Real,Fake");
    cfg_->setString("model.default_version", "v2");

    // Face detector
    cfg_->setString("detector.cache_dir", "face_detection_models");
    cfg_->setString("detector.dnn_config_url",
                    "https://raw.githubusercontent.com/opencv/opencv/master/samples/dnn/face_detector/deploy.prototxt");
    cfg_->setString("detector.dnn_weights_url",
                    "https://raw.githubusercontent.com/opencv/opencv_3rdparty/dnn_samples_face_detector_20170830/"
                    "res10_300x300_ssd_iter_140000.caffemodel");
    cfg_->setString("detector.haar_cascade_path", "haarcascade_frontalface_default.xml");
    cfg_->setDouble("detector.dnn_confidence_threshold", 0.3);
    cfg_->setDouble("detector.haar_confidence_threshold", 0.5);
    cfg_->setBool("detector.download_enabled", true);

    // Inference pipeline
    cfg_->setInt("inference.max_video_frames", 30);
    cfg_->setDouble("inference.padding_percent", 30.0);
    cfg_->setBool("inference.detect_faces", true);
    cfg_->setInt("inference.max_threads", 4);
}

bool PocoConfigManager::hasKey(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->hasProperty(key);
}

std::vector<std::string> split(const std::string &str, char delimiter)
{
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;

    while (std::getline(ss, token, delimiter))
    {
        tokens.push_back(token);
    }

    return tokens;
}
