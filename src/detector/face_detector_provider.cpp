#include "core/detector/face_detector_provider.hpp"
#include "logging/logger.hpp"
#include <httplib.h>
#include <fstream>
#include <utility>
#include <vector>

namespace
{
    // Splits "https://host[:port]/path" into the client origin and the request path
    bool splitUrl(const std::string &url, std::string &origin, std::string &path)
    {
        auto scheme_end = url.find("://");
        if (scheme_end == std::string::npos)
        {
            return false;
        }
        auto path_start = url.find('/', scheme_end + 3);
        if (path_start == std::string::npos)
        {
            origin = url;
            path = "/";
        }
        else
        {
            origin = url.substr(0, path_start);
            path = url.substr(path_start);
        }
        return true;
    }
}

FaceDetectorProvider::FaceDetectorProvider(FaceDetectorSettings settings)
    : settings_(std::move(settings)),
      confidence_threshold_(settings_.dnn_confidence_threshold),
      detection_method_("none")
{
}

FaceDetectorProvider::FaceDetectorProvider(std::unique_ptr<FaceDetector> detector, float confidence_threshold)
    : detector_(std::move(detector)),
      confidence_threshold_(confidence_threshold),
      detection_method_(detector_ ? detector_->name() : "none")
{
    // Consume the once flag so detector() never tries to load from disk
    std::call_once(init_flag_, [] {});
    initialized_.store(true);
}

FaceDetectorProvider::FaceDetectorProvider(std::unique_ptr<FaceDetector> detector)
    : FaceDetectorProvider(std::move(detector), 0.0f)
{
    if (detector_)
    {
        confidence_threshold_ = detector_->defaultConfidenceThreshold();
    }
}

FaceDetector *FaceDetectorProvider::detector()
{
    std::call_once(init_flag_, [this]
                   { initialize(); });
    return detector_.get();
}

float FaceDetectorProvider::confidenceThreshold()
{
    detector();
    return confidence_threshold_;
}

std::string FaceDetectorProvider::detectionMethod()
{
    detector();
    return detection_method_;
}

bool FaceDetectorProvider::isInitialized() const
{
    return initialized_.load();
}

void FaceDetectorProvider::initialize()
{
    Logger::info("FaceDetectorProvider: initializing face detector");

    detector_ = tryLoadDnn();
    if (detector_)
    {
        confidence_threshold_ = settings_.dnn_confidence_threshold;
    }
    else
    {
        Logger::warn("FaceDetectorProvider: DNN model not available, using Haar cascade fallback");
        detector_ = tryLoadHaar();
        confidence_threshold_ = settings_.haar_confidence_threshold;
    }

    if (detector_)
    {
        detection_method_ = detector_->name();
        Logger::info("FaceDetectorProvider: " + detection_method_ + " initialized (threshold " +
                     std::to_string(confidence_threshold_) + ")");
    }
    else
    {
        detection_method_ = "none";
        Logger::error("FaceDetectorProvider: no face detector available, full images will be classified");
    }

    initialized_.store(true);
}

std::unique_ptr<FaceDetector> FaceDetectorProvider::tryLoadDnn()
{
    std::filesystem::path models_dir(settings_.cache_dir);
    std::filesystem::path config_path = models_dir / "deploy.prototxt";
    std::filesystem::path weights_path = models_dir / "res10_300x300_ssd_iter_140000.caffemodel";

    try
    {
        std::filesystem::create_directories(models_dir);
    }
    catch (const std::filesystem::filesystem_error &e)
    {
        Logger::error("FaceDetectorProvider: cannot create " + models_dir.string() + ": " + e.what());
        return nullptr;
    }

    if (!ensureArtifact(settings_.dnn_config_url, config_path) ||
        !ensureArtifact(settings_.dnn_weights_url, weights_path))
    {
        return nullptr;
    }

    try
    {
        return std::make_unique<DnnFaceDetector>(config_path.string(), weights_path.string());
    }
    catch (const std::exception &e)
    {
        Logger::error("FaceDetectorProvider: failed to load DNN detector: " + std::string(e.what()));
        return nullptr;
    }
}

std::unique_ptr<FaceDetector> FaceDetectorProvider::tryLoadHaar()
{
    std::string cascade_path = resolveCascadePath();
    if (cascade_path.empty())
    {
        Logger::error("FaceDetectorProvider: Haar cascade not found: " + settings_.haar_cascade_path);
        return nullptr;
    }

    try
    {
        return std::make_unique<HaarFaceDetector>(cascade_path);
    }
    catch (const std::exception &e)
    {
        Logger::error("FaceDetectorProvider: " + std::string(e.what()));
        return nullptr;
    }
}

std::string FaceDetectorProvider::resolveCascadePath() const
{
    std::filesystem::path configured(settings_.haar_cascade_path);
    std::string file_name = configured.filename().string();
    const std::vector<std::filesystem::path> candidates = {
        configured,
        std::filesystem::path(settings_.cache_dir) / file_name,
        std::filesystem::path("/usr/share/opencv4/haarcascades") / file_name,
        std::filesystem::path("/usr/local/share/opencv4/haarcascades") / file_name};

    for (const auto &candidate : candidates)
    {
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec))
        {
            return candidate.string();
        }
    }
    return "";
}

bool FaceDetectorProvider::ensureArtifact(const std::string &url, const std::filesystem::path &target) const
{
    std::error_code ec;
    if (std::filesystem::exists(target, ec) && std::filesystem::file_size(target, ec) > 0)
    {
        return true;
    }

    if (!settings_.download_enabled)
    {
        Logger::warn("FaceDetectorProvider: " + target.string() + " missing and downloads are disabled");
        return false;
    }

    std::string origin;
    std::string path;
    if (!splitUrl(url, origin, path))
    {
        Logger::error("FaceDetectorProvider: malformed model URL: " + url);
        return false;
    }

    Logger::info("FaceDetectorProvider: downloading " + url);
    httplib::Client client(origin);
    client.set_follow_location(true);
    client.set_connection_timeout(10, 0);
    client.set_read_timeout(60, 0);

    auto res = client.Get(path);
    if (!res)
    {
        Logger::error("FaceDetectorProvider: download failed for " + url + ": " + httplib::to_string(res.error()));
        return false;
    }
    if (res->status != 200 || res->body.empty())
    {
        Logger::error("FaceDetectorProvider: download of " + url + " returned HTTP " + std::to_string(res->status));
        return false;
    }

    // Write beside the target and rename so a partial file is never picked up
    std::filesystem::path partial = target;
    partial += ".part";
    {
        std::ofstream out(partial, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            Logger::error("FaceDetectorProvider: cannot write " + partial.string());
            return false;
        }
        out.write(res->body.data(), static_cast<std::streamsize>(res->body.size()));
        if (!out.good())
        {
            Logger::error("FaceDetectorProvider: short write to " + partial.string());
            return false;
        }
    }

    std::filesystem::rename(partial, target, ec);
    if (ec)
    {
        Logger::error("FaceDetectorProvider: cannot move " + partial.string() + " into place: " + ec.message());
        return false;
    }

    Logger::info("FaceDetectorProvider: downloaded to " + target.string());
    return true;
}
