#include "core/inference_request.hpp"
#include "core/inference_error.hpp"

namespace
{
    std::string optionalString(const nlohmann::json &body, const char *key)
    {
        auto it = body.find(key);
        if (it == body.end() || it->is_null())
        {
            return "";
        }
        if (!it->is_string())
        {
            throw InferenceException(InferenceErrorCode::INVALID_INPUT,
                                     std::string("Field '") + key + "' must be a string");
        }
        return it->get<std::string>();
    }
}

InferenceRequest InferenceRequest::fromJson(const nlohmann::json &body)
{
    if (!body.is_object())
    {
        throw InferenceException(InferenceErrorCode::INVALID_INPUT, "Request body must be a JSON object");
    }

    InferenceRequest request;
    request.hash = optionalString(body, "hash");
    request.media_type_name = optionalString(body, "mediaType");
    request.media_type = MediaTypes::fromString(request.media_type_name);
    request.model_version = optionalString(body, "modelVersion");

    auto frames = body.find("extractedFrames");
    if (frames != body.end() && !frames->is_null())
    {
        if (frames->is_string())
        {
            request.extracted_frames.push_back(frames->get<std::string>());
        }
        else if (frames->is_array())
        {
            for (const auto &frame : *frames)
            {
                if (!frame.is_string())
                {
                    throw InferenceException(InferenceErrorCode::INVALID_INPUT,
                                             "Every entry of 'extractedFrames' must be a string path");
                }
                request.extracted_frames.push_back(frame.get<std::string>());
            }
        }
        else
        {
            throw InferenceException(InferenceErrorCode::INVALID_INPUT,
                                     "Field 'extractedFrames' must be an array of paths");
        }
    }

    std::string audio = optionalString(body, "extractedAudio");
    if (!audio.empty())
    {
        request.extracted_audio = audio;
    }
    return request;
}

nlohmann::json InferenceResponse::toJson() const
{
    return {
        {"video_score", report.video_score},
        {"peak_risk", report.peak_risk},
        {"mean_risk", report.mean_risk},
        {"audio_score", report.audio_score},
        {"gan_fingerprint", report.gan_fingerprint},
        {"temporal_consistency", report.temporal_consistency},
        {"risk_score", report.risk_score},
        {"confidence", report.confidence},
        {"model_version", model_version},
        {"inference_time", inference_time_ms}};
}
