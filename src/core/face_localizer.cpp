#include "core/face_localizer.hpp"
#include "core/bounding_box_selector.hpp"
#include "core/detector/face_detector_provider.hpp"
#include "core/face_crop_geometry.hpp"
#include "core/inference_error.hpp"
#include "logging/logger.hpp"

const char *localizationOutcomeName(LocalizationOutcome outcome)
{
    switch (outcome)
    {
    case LocalizationOutcome::FACE_CROPPED:
        return "face_cropped";
    case LocalizationOutcome::NO_FACE_DETECTED:
        return "no_face_detected";
    case LocalizationOutcome::DETECTOR_UNAVAILABLE:
        return "detector_unavailable";
    case LocalizationOutcome::DETECTION_DISABLED:
        return "detection_disabled";
    case LocalizationOutcome::DETECTOR_FAILED:
        return "detector_failed";
    }
    return "detector_failed";
}

FaceLocalizer::FaceLocalizer(FaceDetectorProvider *provider, double padding_percent)
    : provider_(provider), padding_percent_(padding_percent)
{
}

LocalizedFace FaceLocalizer::localize(const cv::Mat &frame, const std::string &source) const
{
    if (frame.empty() || frame.type() != CV_8UC3)
    {
        throw InferenceException(InferenceErrorCode::INVALID_INPUT,
                                 "Frame " + source + " is not an 8-bit BGR image");
    }

    if (!provider_)
    {
        return LocalizedFace{frame, std::nullopt, LocalizationOutcome::DETECTION_DISABLED};
    }

    FaceDetector *detector = provider_->detector();
    if (!detector)
    {
        return LocalizedFace{frame, std::nullopt, LocalizationOutcome::DETECTOR_UNAVAILABLE};
    }

    std::optional<BoundingBox> face;
    try
    {
        face = BoundingBoxSelector::select(detector->detect(frame), provider_->confidenceThreshold(),
                                           frame.cols, frame.rows);
    }
    catch (const cv::Exception &e)
    {
        Logger::error("FaceLocalizer: detector failed on " + source + ": " + e.what());
        return LocalizedFace{frame, std::nullopt, LocalizationOutcome::DETECTOR_FAILED};
    }

    if (!face)
    {
        Logger::warn("FaceLocalizer: no face detected in " + source + ", classifying full image");
        return LocalizedFace{frame, std::nullopt, LocalizationOutcome::NO_FACE_DETECTED};
    }

    CropRegion region = FaceCropGeometry::computeCropRegion(frame.cols, frame.rows, *face, padding_percent_);
    cv::Mat crop = frame(cv::Rect(region.x, region.y, region.width, region.height)).clone();

    Logger::debug("FaceLocalizer: " + source + " face " + std::to_string(face->width) + "x" +
                  std::to_string(face->height) + " cropped to " + std::to_string(region.width) + "x" +
                  std::to_string(region.height) + " at (" + std::to_string(region.x) + "," +
                  std::to_string(region.y) + ")");
    return LocalizedFace{crop, region, LocalizationOutcome::FACE_CROPPED};
}
