#include "core/face_crop_geometry.hpp"
#include "core/inference_error.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace
{
    std::string describe(const BoundingBox &box)
    {
        return "(" + std::to_string(box.x) + "," + std::to_string(box.y) + "," +
               std::to_string(box.width) + "," + std::to_string(box.height) + ")";
    }
}

long long FaceCropGeometry::paddedSize(const BoundingBox &face, double padding_percent)
{
    int max_dim = std::max(face.width, face.height);
    double padded = std::floor(max_dim * (1.0 + padding_percent / 100.0));
    if (padded >= static_cast<double>(std::numeric_limits<long long>::max()))
    {
        return std::numeric_limits<long long>::max();
    }
    return static_cast<long long>(padded);
}

void FaceCropGeometry::fitAxis(long long &lo, long long &hi, long long size, long long limit)
{
    // Slide the window back inside instead of shrinking it
    if (hi - lo < size)
    {
        if (lo == 0)
        {
            hi = std::min(limit, size);
        }
        else if (hi == limit)
        {
            lo = std::max(0LL, limit - size);
        }
    }

    hi = std::min(limit, lo + size);
    lo = std::max(0LL, hi - size);
}

CropRegion FaceCropGeometry::computeCropRegion(int image_width,
                                               int image_height,
                                               const BoundingBox &face,
                                               double padding_percent)
{
    if (image_width <= 0 || image_height <= 0)
    {
        throw InferenceException(InferenceErrorCode::INVALID_INPUT,
                                 "Invalid image dimensions " + std::to_string(image_width) + "x" +
                                     std::to_string(image_height));
    }
    if (face.width <= 0 || face.height <= 0)
    {
        throw InferenceException(InferenceErrorCode::INVALID_INPUT, "Degenerate face box " + describe(face));
    }
    if (!std::isfinite(padding_percent) || padding_percent < 0.0)
    {
        throw InferenceException(InferenceErrorCode::INVALID_INPUT,
                                 "Invalid padding percent " + std::to_string(padding_percent));
    }

    double right = static_cast<double>(face.x) + face.width;
    double bottom = static_cast<double>(face.y) + face.height;
    if (right <= 0.0 || bottom <= 0.0 || face.x >= image_width || face.y >= image_height)
    {
        throw InferenceException(InferenceErrorCode::INVALID_INPUT, "Face box " + describe(face) + " lies outside the image");
    }

    double center_x = face.x + face.width / 2.0;
    double center_y = face.y + face.height / 2.0;
    // A crop never exceeds the image, so the larger side bounds the square
    long long size = std::min(paddedSize(face, padding_percent),
                              static_cast<long long>(std::max(image_width, image_height)));
    long long half_size = size / 2;

    long long x1 = static_cast<long long>(std::max(0.0, center_x - half_size));
    long long y1 = static_cast<long long>(std::max(0.0, center_y - half_size));
    long long x2 = static_cast<long long>(std::min(static_cast<double>(image_width), center_x + half_size));
    long long y2 = static_cast<long long>(std::min(static_cast<double>(image_height), center_y + half_size));

    fitAxis(x1, x2, size, image_width);
    fitAxis(y1, y2, size, image_height);

    return CropRegion(static_cast<int>(x1), static_cast<int>(y1),
                      static_cast<int>(x2 - x1), static_cast<int>(y2 - y1));
}
