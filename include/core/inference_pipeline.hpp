#pragma once

#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "core/face_localizer.hpp"
#include "core/inference_context.hpp"
#include "core/inference_request.hpp"

/**
 * @brief One inference request end to end
 *
 * Frames are selected (first frame for IMAGE, stride-sampled for VIDEO), loaded and
 * face-localized in parallel, classified as one batch, reduced to fake
 * probabilities and aggregated. Unreadable frames are skipped; the request fails
 * only when none remain.
 */
class InferencePipeline
{
public:
    explicit InferencePipeline(InferenceContext &context);

    /**
     * @brief Score a request
     * @throws InferenceException with the code the HTTP layer maps to a status
     */
    InferenceResponse run(const InferenceRequest &request);

    /**
     * @brief Frame paths that will be read for a request, in order
     * @throws InferenceException INVALID_INPUT / UNSUPPORTED_MEDIA_TYPE
     */
    std::vector<std::string> selectFrames(const InferenceRequest &request) const;

private:
    std::vector<std::string> selectFrames(const InferenceRequest &request, const PipelineSettings &settings) const;

    // Loads and localizes frames; result slots follow the input order
    std::vector<std::optional<LocalizedFace>> prepareFrames(const std::vector<std::string> &paths,
                                                            const PipelineSettings &settings);

    InferenceResponse score(const InferenceRequest &request);

    InferenceContext &context_;
};
