#pragma once

#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "core/detection_types.hpp"

/**
 * @brief Batch image classifier contract
 *
 * classify() returns exactly one result per input image, in input order, with the
 * same shape for a batch of one as for larger batches.
 */
class ImageClassifier
{
public:
    virtual ~ImageClassifier() = default;

    virtual bool isReady() const = 0;

    // Model identifier reported by /health
    virtual std::string modelName() const = 0;

    /**
     * @brief Classify a batch of BGR images
     * @throws InferenceException CLASSIFIER_UNAVAILABLE when not ready,
     *         INFERENCE_FAILURE when the backend fails
     */
    virtual std::vector<ClassifierResult> classify(const std::vector<cv::Mat> &images) = 0;
};
