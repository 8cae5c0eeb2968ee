#pragma once

#include <optional>
#include <vector>
#include "core/detection_types.hpp"

/**
 * @brief Picks the face the crop is built around
 *
 * Among detections strictly above the confidence threshold whose box still has a
 * positive extent after clamping to the image, the largest clamped area wins. Ties
 * keep the earliest detection. An empty result means "no face" and the caller
 * should classify the full image instead.
 */
class BoundingBoxSelector
{
public:
    // Threshold for the high-recall SSD backend
    static constexpr float DNN_CONFIDENCE_THRESHOLD = 0.3f;
    // Threshold for the lower-recall cascade backend
    static constexpr float HAAR_CONFIDENCE_THRESHOLD = 0.5f;

    /**
     * @brief Select the best detection
     * @param detections Raw detector output, any order
     * @param confidence_threshold Detections with confidence <= threshold are dropped
     * @param image_width Source image width in pixels
     * @param image_height Source image height in pixels
     * @return Clamped box of the winning detection, or std::nullopt when none survive
     */
    static std::optional<BoundingBox> select(const std::vector<Detection> &detections,
                                             float confidence_threshold,
                                             int image_width,
                                             int image_height);

    /**
     * @brief Clamp a box to [0,width]x[0,height]
     * @return Clamped box, or std::nullopt if nothing of it remains inside
     */
    static std::optional<BoundingBox> clampToImage(const BoundingBox &box, int image_width, int image_height);
};
