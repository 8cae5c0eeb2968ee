#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/media_types.hpp"
#include "core/score_aggregator.hpp"

/**
 * @brief Parsed body of POST /api/v1/inference
 *
 * Frames are file paths of frames already extracted by the caller.
 */
struct InferenceRequest
{
    std::string hash;
    MediaType media_type = MediaType::UNKNOWN;
    std::string media_type_name;
    std::string model_version;
    std::vector<std::string> extracted_frames;
    std::optional<std::string> extracted_audio;

    /**
     * @brief Parse and type-check a request body
     *
     * extractedFrames may be a single string, treated as a one-frame list.
     * @throws InferenceException (INVALID_INPUT) when a field has the wrong type
     */
    static InferenceRequest fromJson(const nlohmann::json &body);
};

struct InferenceResponse
{
    AggregatedReport report;
    std::string model_version;
    long long inference_time_ms = 0;

    nlohmann::json toJson() const;
};
