#include "core/bounding_box_selector.hpp"
#include "core/inference_error.hpp"
#include <algorithm>
#include <cmath>
#include <string>

std::optional<BoundingBox> BoundingBoxSelector::clampToImage(const BoundingBox &box, int image_width, int image_height)
{
    // 64-bit so x + width cannot overflow on hostile detector output
    long long x1 = std::max<long long>(0, box.x);
    long long y1 = std::max<long long>(0, box.y);
    long long x2 = std::min<long long>(image_width, static_cast<long long>(box.x) + box.width);
    long long y2 = std::min<long long>(image_height, static_cast<long long>(box.y) + box.height);

    if (x2 <= x1 || y2 <= y1)
    {
        return std::nullopt;
    }

    return BoundingBox(static_cast<int>(x1), static_cast<int>(y1),
                       static_cast<int>(x2 - x1), static_cast<int>(y2 - y1));
}

std::optional<BoundingBox> BoundingBoxSelector::select(const std::vector<Detection> &detections,
                                                       float confidence_threshold,
                                                       int image_width,
                                                       int image_height)
{
    if (image_width <= 0 || image_height <= 0)
    {
        throw InferenceException(InferenceErrorCode::INVALID_INPUT,
                                 "Invalid image dimensions " + std::to_string(image_width) + "x" +
                                     std::to_string(image_height));
    }

    std::optional<BoundingBox> best;
    for (const auto &detection : detections)
    {
        if (!std::isfinite(detection.confidence) || detection.confidence <= confidence_threshold)
        {
            continue;
        }

        auto clamped = clampToImage(detection.box, image_width, image_height);
        if (!clamped)
        {
            continue;
        }

        // Strict comparison keeps the first of equally sized boxes
        if (!best || clamped->area() > best->area())
        {
            best = clamped;
        }
    }

    return best;
}
