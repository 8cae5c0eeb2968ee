#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include "core/detector/face_detector.hpp"

/**
 * @brief Settings that decide which detector backend gets built
 */
struct FaceDetectorSettings
{
    std::string cache_dir = "face_detection_models";
    std::string dnn_config_url =
        "https://raw.githubusercontent.com/opencv/opencv/master/samples/dnn/face_detector/deploy.prototxt";
    std::string dnn_weights_url =
        "https://raw.githubusercontent.com/opencv/opencv_3rdparty/dnn_samples_face_detector_20170830/res10_300x300_ssd_iter_140000.caffemodel";
    std::string haar_cascade_path = "haarcascade_frontalface_default.xml";
    float dnn_confidence_threshold = 0.3f;
    float haar_confidence_threshold = 0.5f;
    bool download_enabled = true;
};

/**
 * @brief Lazily builds the process' face detector exactly once
 *
 * First use resolves the SSD model files in the cache directory (downloading them
 * when missing and allowed), loads the DNN backend, and falls back to the Haar
 * cascade when that fails. The choice, with the matching confidence threshold, is
 * recorded once; concurrent first callers block until it is made. When neither
 * backend loads, detector() returns nullptr and callers classify full images.
 */
class FaceDetectorProvider
{
public:
    explicit FaceDetectorProvider(FaceDetectorSettings settings);

    /**
     * @brief Wrap an already constructed backend (tests, custom backends)
     * @param detector Backend, may be nullptr for "no detector available"
     * @param confidence_threshold Overrides the backend's default threshold
     */
    FaceDetectorProvider(std::unique_ptr<FaceDetector> detector, float confidence_threshold);
    explicit FaceDetectorProvider(std::unique_ptr<FaceDetector> detector);

    FaceDetectorProvider(const FaceDetectorProvider &) = delete;
    FaceDetectorProvider &operator=(const FaceDetectorProvider &) = delete;

    // Initializes on first call; nullptr when no backend is available
    FaceDetector *detector();

    // Threshold matching the active backend
    float confidenceThreshold();

    // Backend name, or "none"
    std::string detectionMethod();

    bool isInitialized() const;

private:
    void initialize();
    std::unique_ptr<FaceDetector> tryLoadDnn();
    std::unique_ptr<FaceDetector> tryLoadHaar();
    bool ensureArtifact(const std::string &url, const std::filesystem::path &target) const;
    std::string resolveCascadePath() const;

    FaceDetectorSettings settings_;
    std::once_flag init_flag_;
    std::unique_ptr<FaceDetector> detector_;
    float confidence_threshold_;
    std::string detection_method_;
    std::atomic<bool> initialized_{false};
};
