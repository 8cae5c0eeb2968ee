#pragma once

#include <string>
#include <vector>

/**
 * @brief Integer pixel rectangle, width and height non-negative
 */
struct BoundingBox
{
    int x;
    int y;
    int width;
    int height;

    BoundingBox() : x(0), y(0), width(0), height(0) {}
    BoundingBox(int x_, int y_, int w, int h) : x(x_), y(y_), width(w), height(h) {}

    long long area() const { return static_cast<long long>(width) * height; }

    bool operator==(const BoundingBox &other) const
    {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
    bool operator!=(const BoundingBox &other) const { return !(*this == other); }
};

/**
 * @brief One candidate face returned by a detector backend
 */
struct Detection
{
    BoundingBox box;
    float confidence;

    Detection() : confidence(0.0f) {}
    Detection(const BoundingBox &b, float c) : box(b), confidence(c) {}
};

/**
 * @brief Crop rectangle guaranteed to lie inside its source image
 *
 * Square whenever the padded size fits the image on both axes.
 */
using CropRegion = BoundingBox;

/**
 * @brief One label/score pair of a classifier result
 */
struct LabelScore
{
    std::string label;
    double score;

    LabelScore() : score(0.0) {}
    LabelScore(const std::string &l, double s) : label(l), score(s) {}
};

// Ranked label/score pairs for one image; order is not guaranteed
using ClassifierResult = std::vector<LabelScore>;

// Probability in [0,1] that one frame is synthetic
using FrameProbability = double;
