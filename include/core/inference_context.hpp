#pragma once

#include <memory>
#include <mutex>
#include <string>
#include "core/classifier/image_classifier.hpp"
#include "core/detector/face_detector_provider.hpp"
#include "core/fake_probability_extractor.hpp"
#include "core/inference_stats.hpp"
#include "core/score_aggregator.hpp"

class PocoConfigAdapter;

struct PipelineSettings
{
    size_t max_video_frames = 30;
    double padding_percent = 30.0;
    bool detect_faces = true;
    int max_threads = 4;
    std::string default_model_version = "v2";
};

/**
 * @brief Everything one inference call needs, built once at startup
 *
 * Owns the classifier, the face detector provider and the counters. The face
 * detector is resolved lazily on first use. Pipeline settings can be replaced at
 * runtime; each request works on the snapshot it took when it started.
 */
class InferenceContext
{
public:
    InferenceContext(std::unique_ptr<ImageClassifier> classifier,
                     std::unique_ptr<FaceDetectorProvider> detector_provider,
                     PipelineSettings settings,
                     FakeProbabilityExtractor extractor = FakeProbabilityExtractor(),
                     BlendPolicy blend_policy = BlendPolicy());

    InferenceContext(const InferenceContext &) = delete;
    InferenceContext &operator=(const InferenceContext &) = delete;

    /**
     * @brief Build from configuration: loads the ONNX classifier, prepares the detector
     *
     * A classifier that fails to load leaves the context in place but not ready.
     */
    static std::unique_ptr<InferenceContext> fromConfig(const PocoConfigAdapter &config);

    static PipelineSettings settingsFromConfig(const PocoConfigAdapter &config);

    ImageClassifier *classifier() const { return classifier_.get(); }
    FaceDetectorProvider *detectorProvider() const { return detector_provider_.get(); }
    const FakeProbabilityExtractor &extractor() const { return extractor_; }
    const BlendPolicy &blendPolicy() const { return blend_policy_; }
    PipelineSettings settings() const;
    void updateSettings(const PipelineSettings &settings);

    InferenceStats &stats() { return stats_; }
    const InferenceStats &stats() const { return stats_; }

    bool isReady() const;
    std::string modelName() const;
    std::string detectionMethod() const;

private:
    std::unique_ptr<ImageClassifier> classifier_;
    std::unique_ptr<FaceDetectorProvider> detector_provider_;
    mutable std::mutex settings_mutex_;
    PipelineSettings settings_;
    FakeProbabilityExtractor extractor_;
    BlendPolicy blend_policy_;
    InferenceStats stats_;
};
