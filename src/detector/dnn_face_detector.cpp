#include "core/detector/face_detector.hpp"
#include "logging/logger.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

DnnFaceDetector::DnnFaceDetector(const std::string &prototxt_path, const std::string &weights_path)
{
    net_ = cv::dnn::readNetFromCaffe(prototxt_path, weights_path);
    if (net_.empty())
    {
        throw std::runtime_error("Failed to load Caffe face detector from " + prototxt_path + " / " + weights_path);
    }
    Logger::info("DnnFaceDetector: loaded " + weights_path);
}

namespace
{
    // SSD coordinates are normalised and may overshoot the frame; clamp before scaling to pixels
    constexpr float MIN_NORMALISED_COORD = -1.0f;
    constexpr float MAX_NORMALISED_COORD = 2.0f;

    int toPixel(float normalised, int extent)
    {
        float clamped = std::min(MAX_NORMALISED_COORD, std::max(MIN_NORMALISED_COORD, normalised));
        return static_cast<int>(static_cast<double>(clamped) * extent);
    }
}

std::vector<Detection> DnnFaceDetector::detect(const cv::Mat &image)
{
    if (image.empty())
    {
        return {};
    }

    const int width = image.cols;
    const int height = image.rows;

    cv::Mat resized;
    cv::resize(image, resized, cv::Size(INPUT_SIZE, INPUT_SIZE));
    cv::Mat blob = cv::dnn::blobFromImage(resized, 1.0, cv::Size(INPUT_SIZE, INPUT_SIZE),
                                          cv::Scalar(104.0, 177.0, 123.0));

    cv::Mat output;
    {
        std::lock_guard<std::mutex> lock(net_mutex_);
        net_.setInput(blob);
        output = net_.forward();
    }

    std::vector<Detection> detections = parseDetections(output, width, height);
    Logger::trace("DnnFaceDetector: " + std::to_string(detections.size()) + " candidates");
    return detections;
}

std::vector<Detection> DnnFaceDetector::parseDetections(const cv::Mat &output, int width, int height)
{
    std::vector<Detection> detections;
    if (output.dims != 4 || output.size[3] != 7 || output.type() != CV_32F)
    {
        Logger::warn("DnnFaceDetector: unexpected output shape, no detections");
        return detections;
    }

    // Output shape is [1, 1, N, 7]: image_id, label, confidence, x1, y1, x2, y2 (normalised)
    cv::Mat rows(output.size[2], output.size[3], CV_32F, const_cast<float *>(output.ptr<float>()));
    for (int i = 0; i < rows.rows; ++i)
    {
        const float *row = rows.ptr<float>(i);
        float confidence = row[2];
        if (!std::isfinite(confidence) || confidence <= 0.0f)
        {
            continue;
        }
        if (!std::isfinite(row[3]) || !std::isfinite(row[4]) || !std::isfinite(row[5]) || !std::isfinite(row[6]))
        {
            Logger::debug("DnnFaceDetector: dropping candidate with non-finite coordinates");
            continue;
        }

        int x1 = toPixel(row[3], width);
        int y1 = toPixel(row[4], height);
        int x2 = toPixel(row[5], width);
        int y2 = toPixel(row[6], height);

        detections.emplace_back(BoundingBox(x1, y1, x2 - x1, y2 - y1), confidence);
    }
    return detections;
}
