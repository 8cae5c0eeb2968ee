#pragma once

#include <optional>
#include <string>
#include <opencv2/core.hpp>
#include "core/detection_types.hpp"

class FaceDetectorProvider;

enum class LocalizationOutcome
{
    FACE_CROPPED,
    NO_FACE_DETECTED,
    DETECTOR_UNAVAILABLE,
    DETECTION_DISABLED,
    DETECTOR_FAILED
};

const char *localizationOutcomeName(LocalizationOutcome outcome);

/**
 * @brief Image handed to the classifier for one frame
 *
 * region is set only when the image is a face crop; otherwise image is the full frame.
 */
struct LocalizedFace
{
    cv::Mat image;
    std::optional<CropRegion> region;
    LocalizationOutcome outcome;
};

/**
 * @brief Detect, select and crop the face in one frame
 *
 * Every outcome other than FACE_CROPPED falls back to the full frame; the frame is
 * never dropped here.
 */
class FaceLocalizer
{
public:
    /**
     * @param provider Detector source; nullptr disables detection
     * @param padding_percent Crop padding relative to the face's larger side
     */
    FaceLocalizer(FaceDetectorProvider *provider, double padding_percent);

    /**
     * @brief Localize the face in a BGR frame
     * @param frame 8-bit 3-channel image
     * @param source Frame identifier used in log messages
     * @throws InferenceException (INVALID_INPUT) for an empty or non-BGR frame
     */
    LocalizedFace localize(const cv::Mat &frame, const std::string &source) const;

private:
    FaceDetectorProvider *provider_;
    double padding_percent_;
};
