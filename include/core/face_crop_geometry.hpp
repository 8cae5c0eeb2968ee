#pragma once

#include "core/detection_types.hpp"

/**
 * @brief Turns a face box into the square, padded crop fed to the classifier
 *
 * The square is centred on the face, grown by padding_percent of the face's larger
 * side, then slid (not shrunk) back inside the image when it crosses an edge. On an
 * axis where the image is smaller than the padded size the crop spans that whole
 * axis, so the result is square only when the padded size fits both dimensions.
 *
 * Applying the geometry to its own output is not a no-op: padding compounds.
 */
class FaceCropGeometry
{
public:
    static constexpr double DEFAULT_PADDING_PERCENT = 30.0;

    /**
     * @brief Compute the crop region for a face
     * @param image_width Source image width, must be positive
     * @param image_height Source image height, must be positive
     * @param face Face box; must have positive extent and overlap the image
     * @param padding_percent Extra size relative to the face's larger side, >= 0
     * @return Region with x,y >= 0, x+width <= image_width, y+height <= image_height
     * @throws InferenceException (INVALID_INPUT) on malformed arguments
     */
    static CropRegion computeCropRegion(int image_width,
                                        int image_height,
                                        const BoundingBox &face,
                                        double padding_percent = DEFAULT_PADDING_PERCENT);

    /**
     * @brief Side length of the padded square before any clamping
     *
     * 64-bit since a huge box that still overlaps the image can pad past INT_MAX.
     */
    static long long paddedSize(const BoundingBox &face, double padding_percent = DEFAULT_PADDING_PERCENT);

private:
    // Resolves one axis; lo/hi are the initial clamped edges
    static void fitAxis(long long &lo, long long &hi, long long size, long long limit);
};
