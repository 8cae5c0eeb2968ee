#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Failure categories raised by the inference core
 *
 * "No face detected" and "ambiguous label" are not in this list: they are valid
 * outcomes carried in return values.
 */
enum class InferenceErrorCode
{
    INVALID_INPUT,            // empty frame list, malformed box, non-finite number, unreadable frames
    UNSUPPORTED_MEDIA_TYPE,   // e.g. AUDIO for an image-only classifier
    CLASSIFIER_UNAVAILABLE,   // model not loaded; "service not ready"
    AGGREGATION_PRECONDITION, // empty probability sequence reached the aggregator
    INFERENCE_FAILURE         // classifier raised or returned a malformed batch
};

inline const char *inferenceErrorName(InferenceErrorCode code)
{
    switch (code)
    {
    case InferenceErrorCode::INVALID_INPUT:
        return "InvalidInput";
    case InferenceErrorCode::UNSUPPORTED_MEDIA_TYPE:
        return "UnsupportedMediaType";
    case InferenceErrorCode::CLASSIFIER_UNAVAILABLE:
        return "ClassifierUnavailable";
    case InferenceErrorCode::AGGREGATION_PRECONDITION:
        return "AggregationPrecondition";
    case InferenceErrorCode::INFERENCE_FAILURE:
        return "InferenceFailure";
    }
    return "InferenceFailure";
}

class InferenceException : public std::runtime_error
{
public:
    InferenceException(InferenceErrorCode code, const std::string &message)
        : std::runtime_error(message), code_(code) {}

    InferenceErrorCode code() const noexcept { return code_; }

private:
    InferenceErrorCode code_;
};
