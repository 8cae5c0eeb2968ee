#include "poco_config_adapter.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <stdexcept>

PocoConfigAdapter::PocoConfigAdapter()
    : poco_cfg_(PocoConfigManager::getInstance()),
      config_path_("config/config.json")
{
}

PocoConfigAdapter::~PocoConfigAdapter()
{
    stopWatching();
}

nlohmann::json PocoConfigAdapter::getAll() const
{
    return poco_cfg_.getAll();
}

std::string PocoConfigAdapter::getLogLevel() const { return poco_cfg_.getLogLevel(); }
int PocoConfigAdapter::getServerPort() const { return poco_cfg_.getServerPort(); }
std::string PocoConfigAdapter::getServerHost() const { return poco_cfg_.getServerHost(); }

std::string PocoConfigAdapter::getModelPath() const { return poco_cfg_.getModelPath(); }
std::string PocoConfigAdapter::getModelName() const { return poco_cfg_.getModelName(); }
int PocoConfigAdapter::getModelInputSize() const { return poco_cfg_.getModelInputSize(); }
std::vector<std::string> PocoConfigAdapter::getModelLabels() const { return poco_cfg_.getModelLabels(); }
std::string PocoConfigAdapter::getDefaultModelVersion() const { return poco_cfg_.getDefaultModelVersion(); }

std::string PocoConfigAdapter::getDetectorCacheDir() const { return poco_cfg_.getDetectorCacheDir(); }
std::string PocoConfigAdapter::getDnnConfigUrl() const { return poco_cfg_.getDnnConfigUrl(); }
std::string PocoConfigAdapter::getDnnWeightsUrl() const { return poco_cfg_.getDnnWeightsUrl(); }
std::string PocoConfigAdapter::getHaarCascadePath() const { return poco_cfg_.getHaarCascadePath(); }
double PocoConfigAdapter::getDnnConfidenceThreshold() const { return poco_cfg_.getDnnConfidenceThreshold(); }
double PocoConfigAdapter::getHaarConfidenceThreshold() const { return poco_cfg_.getHaarConfidenceThreshold(); }
bool PocoConfigAdapter::getModelDownloadEnabled() const { return poco_cfg_.getModelDownloadEnabled(); }

int PocoConfigAdapter::getMaxVideoFrames() const { return poco_cfg_.getMaxVideoFrames(); }
double PocoConfigAdapter::getPaddingPercent() const { return poco_cfg_.getPaddingPercent(); }
bool PocoConfigAdapter::getDetectFaces() const { return poco_cfg_.getDetectFaces(); }
int PocoConfigAdapter::getMaxInferenceThreads() const { return poco_cfg_.getMaxInferenceThreads(); }

void PocoConfigAdapter::setLogLevel(const std::string &level)
{
    applyAndPublish({{"log_level", level}}, "api");
}

void PocoConfigAdapter::setServerPort(int port)
{
    applyAndPublish({{"server_port", port}}, "api");
}

void PocoConfigAdapter::setServerHost(const std::string &host)
{
    applyAndPublish({{"server_host", host}}, "api");
}

void PocoConfigAdapter::setMaxVideoFrames(int frames)
{
    nlohmann::json patch;
    patch["inference"]["max_video_frames"] = frames;
    applyAndPublish(patch, "api");
}

void PocoConfigAdapter::setDetectFaces(bool enabled)
{
    nlohmann::json patch;
    patch["inference"]["detect_faces"] = enabled;
    applyAndPublish(patch, "api");
}

void PocoConfigAdapter::updateConfig(const std::string &json_config)
{
    auto patch = nlohmann::json::parse(json_config);
    if (!patch.is_object())
    {
        throw std::invalid_argument("configuration update must be a JSON object");
    }
    applyAndPublish(patch, "api");
}

void PocoConfigAdapter::applyAndPublish(const nlohmann::json &patch, const std::string &source)
{
    auto before = poco_cfg_.getAll();
    poco_cfg_.update(patch);
    auto changed_keys = diffKeys(before, poco_cfg_.getAll());
    if (changed_keys.empty())
    {
        Logger::debug("PocoConfigAdapter: update from " + source + " changed nothing");
        return;
    }

    persistChanges(changed_keys);

    ConfigUpdateEvent event;
    event.changed_keys = changed_keys;
    event.source = source;
    event.update_id = generateUpdateId();
    publishEvent(event);
}

std::vector<std::string> PocoConfigAdapter::diffKeys(const nlohmann::json &before, const nlohmann::json &after)
{
    std::vector<std::string> keys;
    std::function<void(const std::string &, const nlohmann::json *, const nlohmann::json *)> walk;
    walk = [&](const std::string &prefix, const nlohmann::json *a, const nlohmann::json *b)
    {
        bool a_obj = a && a->is_object();
        bool b_obj = b && b->is_object();
        if (a_obj || b_obj)
        {
            std::vector<std::string> names;
            if (a_obj)
                for (auto it = a->begin(); it != a->end(); ++it)
                    names.push_back(it.key());
            if (b_obj)
                for (auto it = b->begin(); it != b->end(); ++it)
                    if (!a_obj || !a->contains(it.key()))
                        names.push_back(it.key());

            for (const auto &name : names)
            {
                const nlohmann::json *child_a = (a_obj && a->contains(name)) ? &a->at(name) : nullptr;
                const nlohmann::json *child_b = (b_obj && b->contains(name)) ? &b->at(name) : nullptr;
                walk(prefix.empty() ? name : prefix + "." + name, child_a, child_b);
            }
            return;
        }
        if (!a || !b || *a != *b)
        {
            keys.push_back(prefix);
        }
    };
    walk("", &before, &after);
    std::sort(keys.begin(), keys.end());
    return keys;
}

bool PocoConfigAdapter::loadConfig(const std::string &file_path)
{
    if (!poco_cfg_.load(file_path))
    {
        Logger::warn("PocoConfigAdapter: could not load " + file_path + ", keeping current configuration");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(path_mutex_);
        config_path_ = file_path;
    }
    Logger::info("PocoConfigAdapter: loaded configuration from " + file_path);
    return true;
}

bool PocoConfigAdapter::saveConfig(const std::string &file_path) const
{
    std::string target_path = file_path.empty() ? configPath() : file_path;
    return poco_cfg_.save(target_path);
}

std::string PocoConfigAdapter::configPath() const
{
    std::lock_guard<std::mutex> lock(path_mutex_);
    return config_path_;
}

void PocoConfigAdapter::resetToDefaults()
{
    poco_cfg_.resetToDefaults();
}

bool PocoConfigAdapter::validateConfig() const
{
    return poco_cfg_.validateConfig();
}

void PocoConfigAdapter::startWatching(const std::string &file_path, int interval_seconds)
{
    if (watching_.load())
        return;

    watched_file_path_ = file_path.empty() ? configPath() : file_path;
    watch_interval_seconds_ = std::max(1, interval_seconds);

    std::error_code ec;
    last_write_time_ = std::filesystem::last_write_time(watched_file_path_, ec);
    if (ec)
    {
        Logger::warn("PocoConfigAdapter: " + watched_file_path_ + " not readable yet: " + ec.message());
        last_write_time_ = std::filesystem::file_time_type{};
    }

    watching_.store(true);
    watcher_thread_ = std::thread(&PocoConfigAdapter::watchLoop, this);
}

void PocoConfigAdapter::stopWatching()
{
    if (!watching_.exchange(false))
        return;

    {
        std::lock_guard<std::mutex> lock(watch_mutex_);
    }
    watch_cv_.notify_all();
    if (watcher_thread_.joinable())
        watcher_thread_.join();
}

void PocoConfigAdapter::watchLoop()
{
    Logger::info("PocoConfigAdapter: watching " + watched_file_path_ + " for changes");
    while (watching_.load())
    {
        std::error_code ec;
        auto current = std::filesystem::last_write_time(watched_file_path_, ec);
        if (!ec && current != last_write_time_)
        {
            Logger::info("PocoConfigAdapter: configuration file changed, reloading");
            auto before = poco_cfg_.getAll();
            if (poco_cfg_.load(watched_file_path_))
            {
                last_write_time_ = current;
                auto changed_keys = diffKeys(before, poco_cfg_.getAll());
                if (!changed_keys.empty())
                {
                    ConfigUpdateEvent event;
                    event.changed_keys = changed_keys;
                    event.source = "file_observer";
                    event.update_id = generateUpdateId();
                    publishEvent(event);
                }
            }
            else
            {
                Logger::warn("PocoConfigAdapter: failed to reload configuration from file");
            }
        }

        std::unique_lock<std::mutex> lock(watch_mutex_);
        watch_cv_.wait_for(lock, std::chrono::seconds(watch_interval_seconds_),
                           [this]
                           { return !watching_.load(); });
    }
    Logger::info("PocoConfigAdapter: configuration file watcher stopped");
}

void PocoConfigAdapter::subscribe(ConfigObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end())
    {
        observers_.push_back(observer);
    }
}

void PocoConfigAdapter::unsubscribe(ConfigObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.erase(
        std::remove(observers_.begin(), observers_.end(), observer),
        observers_.end());
}

void PocoConfigAdapter::publishEvent(const ConfigUpdateEvent &event)
{
    std::vector<ConfigObserver *> observers;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        observers = observers_;
    }

    std::string keys;
    for (const auto &key : event.changed_keys)
    {
        keys += (keys.empty() ? "" : ", ") + key;
    }
    Logger::info("PocoConfigAdapter: " + event.source + " changed [" + keys + "]");

    for (auto observer : observers)
    {
        try
        {
            observer->onConfigUpdate(event);
        }
        catch (const std::exception &e)
        {
            Logger::error("PocoConfigAdapter: error in config observer: " + std::string(e.what()));
        }
    }
}

std::string PocoConfigAdapter::generateUpdateId() const
{
    auto now = std::chrono::system_clock::now();
    auto duration = now.time_since_epoch();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
    static std::atomic<uint64_t> sequence{0};
    return "update_" + std::to_string(millis) + "_" + std::to_string(++sequence);
}

void PocoConfigAdapter::persistChanges(const std::vector<std::string> &changed_keys)
{
    std::string path = configPath();
    if (!poco_cfg_.save(path))
    {
        Logger::error("PocoConfigAdapter: failed to persist configuration changes to " + path);
        return;
    }
    Logger::debug("PocoConfigAdapter: persisted " + std::to_string(changed_keys.size()) +
                  " changed keys to " + path);
}
