#pragma once

#include <mutex>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>
#include <opencv2/objdetect.hpp>
#include "core/bounding_box_selector.hpp"
#include "core/detection_types.hpp"

/**
 * @brief Face detector backend interface
 *
 * Implementations return every candidate they find with its raw confidence; picking
 * one is BoundingBoxSelector's job. Boxes may extend past the image edges.
 */
class FaceDetector
{
public:
    virtual ~FaceDetector() = default;

    /**
     * @brief Detect faces in a BGR image
     * @param image 8-bit, 3-channel BGR image; not modified
     * @return Zero or more detections
     */
    virtual std::vector<Detection> detect(const cv::Mat &image) = 0;

    // Human readable backend name, reported by /health
    virtual std::string name() const = 0;

    // Selection threshold suited to this backend's score scale
    virtual float defaultConfidenceThreshold() const = 0;
};

/**
 * @brief OpenCV DNN face detector (SSD, ResNet-10 backbone, Caffe weights)
 */
class DnnFaceDetector : public FaceDetector
{
public:
    static constexpr int INPUT_SIZE = 300;

    /**
     * @throws std::runtime_error if the network cannot be loaded
     */
    DnnFaceDetector(const std::string &prototxt_path, const std::string &weights_path);

    std::vector<Detection> detect(const cv::Mat &image) override;
    std::string name() const override { return "OpenCV DNN (SSD ResNet-10)"; }
    float defaultConfidenceThreshold() const override { return BoundingBoxSelector::DNN_CONFIDENCE_THRESHOLD; }

    /**
     * @brief Convert a raw [1, 1, N, 7] SSD output into pixel-space detections
     *
     * Rows with a non-finite confidence or coordinate are dropped; a malformed
     * output yields no detections.
     */
    static std::vector<Detection> parseDetections(const cv::Mat &output, int width, int height);

private:
    cv::dnn::Net net_;
    std::mutex net_mutex_;
};

/**
 * @brief Haar cascade fallback
 *
 * The cascade reports accepted windows only, with no score, so every detection
 * carries confidence 1.0.
 */
class HaarFaceDetector : public FaceDetector
{
public:
    /**
     * @throws std::runtime_error if the cascade file cannot be loaded
     */
    explicit HaarFaceDetector(const std::string &cascade_path);

    std::vector<Detection> detect(const cv::Mat &image) override;
    std::string name() const override { return "OpenCV Haar Cascade (fallback)"; }
    float defaultConfidenceThreshold() const override { return BoundingBoxSelector::HAAR_CONFIDENCE_THRESHOLD; }

private:
    cv::CascadeClassifier cascade_;
    std::mutex cascade_mutex_;
};
