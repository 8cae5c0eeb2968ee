#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>
#include "core/inference_context.hpp"
#include "core/inference_pipeline.hpp"
#include "core/inference_settings_observer.hpp"
#include "poco_config_adapter.hpp"
#include "stubs/fake_classifier.hpp"
#include "stubs/fake_face_detector.hpp"

class InferenceSettingsObserverTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        config_path_ = (std::filesystem::temp_directory_path() / "inference_settings_observer_test.json").string();
        std::ofstream(config_path_) << "{}";

        auto &adapter = PocoConfigAdapter::getInstance();
        ASSERT_TRUE(adapter.loadConfig(config_path_));

        context_ = std::make_unique<InferenceContext>(
            std::make_unique<FakeClassifier>(),
            std::make_unique<FaceDetectorProvider>(std::make_unique<FakeFaceDetector>()),
            InferenceContext::settingsFromConfig(adapter));
        observer_ = std::make_unique<InferenceSettingsObserver>(adapter, *context_);
        adapter.subscribe(observer_.get());
    }

    void TearDown() override
    {
        auto &adapter = PocoConfigAdapter::getInstance();
        adapter.unsubscribe(observer_.get());
        adapter.resetToDefaults();
        std::error_code ec;
        std::filesystem::remove(config_path_, ec);
    }

    static InferenceRequest videoRequest(size_t frame_count)
    {
        InferenceRequest request;
        request.media_type = MediaType::VIDEO;
        request.media_type_name = "VIDEO";
        for (size_t i = 0; i < frame_count; i++)
        {
            request.extracted_frames.push_back("/frames/" + std::to_string(i) + ".png");
        }
        return request;
    }

    std::string config_path_;
    std::unique_ptr<InferenceContext> context_;
    std::unique_ptr<InferenceSettingsObserver> observer_;
};

TEST_F(InferenceSettingsObserverTest, StartsFromConfiguredDefaults)
{
    PipelineSettings settings = context_->settings();

    EXPECT_EQ(settings.max_video_frames, 30u);
    EXPECT_DOUBLE_EQ(settings.padding_percent, 30.0);
    EXPECT_TRUE(settings.detect_faces);
    EXPECT_EQ(settings.default_model_version, "v2");
}

TEST_F(InferenceSettingsObserverTest, FrameLimitChangeAppliesToNextRequest)
{
    PocoConfigAdapter::getInstance().setMaxVideoFrames(5);

    EXPECT_EQ(context_->settings().max_video_frames, 5u);
    InferencePipeline pipeline(*context_);
    EXPECT_EQ(pipeline.selectFrames(videoRequest(40)).size(), 5u);
}

TEST_F(InferenceSettingsObserverTest, DisablingDetectionSkipsDetector)
{
    EXPECT_EQ(context_->detectionMethod(), "Fake detector");

    PocoConfigAdapter::getInstance().setDetectFaces(false);

    EXPECT_FALSE(context_->settings().detect_faces);
    EXPECT_EQ(context_->detectionMethod(), "disabled");
}

TEST_F(InferenceSettingsObserverTest, FileStyleUpdateAppliesEveryPipelineKey)
{
    PocoConfigAdapter::getInstance().updateConfig(
        R"({"inference": {"padding_percent": 10, "max_threads": 2}, "model": {"default_version": "v7"}})");

    PipelineSettings settings = context_->settings();
    EXPECT_DOUBLE_EQ(settings.padding_percent, 10.0);
    EXPECT_EQ(settings.max_threads, 2);
    EXPECT_EQ(settings.default_model_version, "v7");
}

TEST_F(InferenceSettingsObserverTest, InvalidValuesKeepCurrentSettings)
{
    PocoConfigAdapter::getInstance().setMaxVideoFrames(12);
    PocoConfigAdapter::getInstance().updateConfig(R"({"inference": {"max_video_frames": 0}})");

    EXPECT_EQ(context_->settings().max_video_frames, 12u);
}

TEST_F(InferenceSettingsObserverTest, RestartOnlyKeysLeaveSettingsAlone)
{
    PocoConfigAdapter::getInstance().updateConfig(R"({"detector": {"dnn_confidence_threshold": 0.6}})");

    PipelineSettings settings = context_->settings();
    EXPECT_EQ(settings.max_video_frames, 30u);
    EXPECT_TRUE(settings.detect_faces);
}
