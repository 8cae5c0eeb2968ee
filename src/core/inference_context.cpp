#include "core/inference_context.hpp"
#include "core/classifier/onnx_image_classifier.hpp"
#include "poco_config_adapter.hpp"
#include "logging/logger.hpp"
#include <algorithm>

InferenceContext::InferenceContext(std::unique_ptr<ImageClassifier> classifier,
                                   std::unique_ptr<FaceDetectorProvider> detector_provider,
                                   PipelineSettings settings,
                                   FakeProbabilityExtractor extractor,
                                   BlendPolicy blend_policy)
    : classifier_(std::move(classifier)),
      detector_provider_(std::move(detector_provider)),
      settings_(std::move(settings)),
      extractor_(std::move(extractor)),
      blend_policy_(blend_policy)
{
}

std::unique_ptr<InferenceContext> InferenceContext::fromConfig(const PocoConfigAdapter &config)
{
    auto classifier = std::make_unique<OnnxImageClassifier>(config.getModelPath(), config.getModelLabels(),
                                                            config.getModelInputSize(), config.getModelName());
    if (!classifier->load())
    {
        Logger::error("InferenceContext: classifier not loaded, service will report unhealthy");
    }

    PipelineSettings settings = settingsFromConfig(config);

    // Built even when detection is off so it can be switched on at runtime; loading stays lazy
    FaceDetectorSettings detector_settings;
    detector_settings.cache_dir = config.getDetectorCacheDir();
    detector_settings.dnn_config_url = config.getDnnConfigUrl();
    detector_settings.dnn_weights_url = config.getDnnWeightsUrl();
    detector_settings.haar_cascade_path = config.getHaarCascadePath();
    detector_settings.dnn_confidence_threshold = static_cast<float>(config.getDnnConfidenceThreshold());
    detector_settings.haar_confidence_threshold = static_cast<float>(config.getHaarConfidenceThreshold());
    detector_settings.download_enabled = config.getModelDownloadEnabled();
    auto provider = std::make_unique<FaceDetectorProvider>(detector_settings);

    if (!settings.detect_faces)
    {
        Logger::info("InferenceContext: face detection disabled, full frames will be classified");
    }

    return std::make_unique<InferenceContext>(std::move(classifier), std::move(provider), settings);
}

PipelineSettings InferenceContext::settingsFromConfig(const PocoConfigAdapter &config)
{
    PipelineSettings settings;
    settings.max_video_frames = static_cast<size_t>(std::max(1, config.getMaxVideoFrames()));
    settings.padding_percent = std::max(0.0, config.getPaddingPercent());
    settings.detect_faces = config.getDetectFaces();
    settings.max_threads = std::max(1, config.getMaxInferenceThreads());
    settings.default_model_version = config.getDefaultModelVersion();
    return settings;
}

PipelineSettings InferenceContext::settings() const
{
    std::lock_guard<std::mutex> lock(settings_mutex_);
    return settings_;
}

void InferenceContext::updateSettings(const PipelineSettings &settings)
{
    std::lock_guard<std::mutex> lock(settings_mutex_);
    settings_ = settings;
}

bool InferenceContext::isReady() const
{
    return classifier_ && classifier_->isReady();
}

std::string InferenceContext::modelName() const
{
    return classifier_ ? classifier_->modelName() : "none";
}

std::string InferenceContext::detectionMethod() const
{
    if (!detector_provider_ || !settings().detect_faces)
    {
        return "disabled";
    }
    // Report without forcing the lazy load from a health check
    if (!detector_provider_->isInitialized())
    {
        return "not_initialized";
    }
    return detector_provider_->detectionMethod();
}
