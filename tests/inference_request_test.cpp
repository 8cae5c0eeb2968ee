#include <gtest/gtest.h>
#include "core/inference_error.hpp"
#include "core/inference_request.hpp"

TEST(InferenceRequestTest, ParsesFullBody)
{
    auto body = nlohmann::json::parse(R"({
        "hash": "abc123",
        "mediaType": "VIDEO",
        "modelVersion": "v3",
        "extractedFrames": ["/tmp/a.jpg", "/tmp/b.jpg"],
        "extractedAudio": "/tmp/a.wav"
    })");

    InferenceRequest request = InferenceRequest::fromJson(body);

    EXPECT_EQ(request.hash, "abc123");
    EXPECT_EQ(request.media_type, MediaType::VIDEO);
    EXPECT_EQ(request.model_version, "v3");
    ASSERT_EQ(request.extracted_frames.size(), 2u);
    EXPECT_EQ(request.extracted_frames[1], "/tmp/b.jpg");
    ASSERT_TRUE(request.extracted_audio.has_value());
    EXPECT_EQ(*request.extracted_audio, "/tmp/a.wav");
}

TEST(InferenceRequestTest, MissingFieldsAreEmpty)
{
    InferenceRequest request = InferenceRequest::fromJson(nlohmann::json::parse(R"({"mediaType": "IMAGE"})"));

    EXPECT_TRUE(request.hash.empty());
    EXPECT_TRUE(request.model_version.empty());
    EXPECT_TRUE(request.extracted_frames.empty());
    EXPECT_FALSE(request.extracted_audio.has_value());
}

TEST(InferenceRequestTest, SingleFramePathIsAccepted)
{
    InferenceRequest request =
        InferenceRequest::fromJson(nlohmann::json::parse(R"({"mediaType": "IMAGE", "extractedFrames": "/tmp/x.png"})"));

    ASSERT_EQ(request.extracted_frames.size(), 1u);
    EXPECT_EQ(request.extracted_frames[0], "/tmp/x.png");
}

TEST(InferenceRequestTest, UnknownMediaTypeKeepsName)
{
    InferenceRequest request = InferenceRequest::fromJson(nlohmann::json::parse(R"({"mediaType": "GIF"})"));

    EXPECT_EQ(request.media_type, MediaType::UNKNOWN);
    EXPECT_EQ(request.media_type_name, "GIF");
}

TEST(InferenceRequestTest, WrongTypesAreInvalidInput)
{
    for (const char *text : {R"({"mediaType": 3})",
                             R"({"extractedFrames": [1, 2]})",
                             R"({"extractedFrames": {"a": 1}})",
                             R"([1, 2, 3])"})
    {
        try
        {
            InferenceRequest::fromJson(nlohmann::json::parse(text));
            ADD_FAILURE() << "expected InferenceException for " << text;
        }
        catch (const InferenceException &e)
        {
            EXPECT_EQ(e.code(), InferenceErrorCode::INVALID_INPUT);
        }
    }
}

TEST(InferenceResponseTest, SerializesAllFields)
{
    InferenceResponse response;
    response.report.video_score = 58.0;
    response.report.risk_score = 67.6;
    response.model_version = "v2";
    response.inference_time_ms = 42;

    nlohmann::json json = response.toJson();

    for (const char *key : {"video_score", "peak_risk", "mean_risk", "audio_score", "gan_fingerprint",
                            "temporal_consistency", "risk_score", "confidence", "model_version", "inference_time"})
    {
        EXPECT_TRUE(json.contains(key)) << key;
    }
    EXPECT_DOUBLE_EQ(json["risk_score"].get<double>(), 67.6);
    EXPECT_EQ(json["model_version"], "v2");
    EXPECT_EQ(json["inference_time"].get<long long>(), 42);
}
