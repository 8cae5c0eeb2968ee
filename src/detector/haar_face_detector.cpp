#include "core/detector/face_detector.hpp"
#include "logging/logger.hpp"
#include <opencv2/imgproc.hpp>
#include <stdexcept>

HaarFaceDetector::HaarFaceDetector(const std::string &cascade_path)
{
    if (!cascade_.load(cascade_path) || cascade_.empty())
    {
        throw std::runtime_error("Could not load Haar cascade: " + cascade_path);
    }
    Logger::info("HaarFaceDetector: loaded " + cascade_path);
}

std::vector<Detection> HaarFaceDetector::detect(const cv::Mat &image)
{
    std::vector<Detection> detections;
    if (image.empty())
    {
        return detections;
    }

    cv::Mat gray;
    cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);

    std::vector<cv::Rect> faces;
    {
        std::lock_guard<std::mutex> lock(cascade_mutex_);
        cascade_.detectMultiScale(gray, faces, 1.1, 5, 0, cv::Size(30, 30));
    }

    for (const auto &face : faces)
    {
        detections.emplace_back(BoundingBox(face.x, face.y, face.width, face.height), 1.0f);
    }
    return detections;
}
