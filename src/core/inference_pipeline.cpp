#include "core/inference_pipeline.hpp"
#include "core/frame_sampler.hpp"
#include "core/inference_context.hpp"
#include "core/inference_error.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <opencv2/imgcodecs.hpp>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

namespace
{
    std::string formatScore(double value)
    {
        std::ostringstream out;
        out << std::fixed << std::setprecision(2) << value;
        return out.str();
    }

    std::string shortHash(const std::string &hash)
    {
        return hash.empty() ? "none" : hash.substr(0, 16);
    }
}

InferencePipeline::InferencePipeline(InferenceContext &context)
    : context_(context)
{
}

InferenceResponse InferencePipeline::run(const InferenceRequest &request)
{
    context_.stats().requests++;
    try
    {
        return score(request);
    }
    catch (const std::exception &)
    {
        context_.stats().failures++;
        throw;
    }
}

std::vector<std::string> InferencePipeline::selectFrames(const InferenceRequest &request) const
{
    return selectFrames(request, context_.settings());
}

std::vector<std::string> InferencePipeline::selectFrames(const InferenceRequest &request,
                                                         const PipelineSettings &settings) const
{
    switch (request.media_type)
    {
    case MediaType::AUDIO:
        throw InferenceException(InferenceErrorCode::UNSUPPORTED_MEDIA_TYPE,
                                 "Audio-only inference is not supported by the image classification model");
    case MediaType::UNKNOWN:
        throw InferenceException(InferenceErrorCode::INVALID_INPUT,
                                 "Unknown media type: " + request.media_type_name);
    default:
        break;
    }

    if (request.extracted_frames.empty())
    {
        throw InferenceException(InferenceErrorCode::INVALID_INPUT,
                                 "No frame paths provided for " + MediaTypes::getName(request.media_type));
    }

    if (request.media_type == MediaType::IMAGE)
    {
        return {request.extracted_frames.front()};
    }
    return FrameSampler::sample(request.extracted_frames, settings.max_video_frames);
}

std::vector<std::optional<LocalizedFace>> InferencePipeline::prepareFrames(const std::vector<std::string> &paths,
                                                                           const PipelineSettings &settings)
{
    std::vector<std::optional<LocalizedFace>> slots(paths.size());
    FaceDetectorProvider *provider = settings.detect_faces ? context_.detectorProvider() : nullptr;
    FaceLocalizer localizer(provider, settings.padding_percent);
    InferenceStats &stats = context_.stats();

    // Resolve the detector before fanning out so workers never race its first load
    if (provider)
    {
        provider->detector();
    }

    tbb::task_arena arena(settings.max_threads);
    arena.execute([&]
                  { tbb::parallel_for(tbb::blocked_range<size_t>(0, paths.size()),
                                      [&](const tbb::blocked_range<size_t> &range)
                                      {
                                          for (size_t i = range.begin(); i != range.end(); ++i)
                                          {
                                              cv::Mat frame = cv::imread(paths[i], cv::IMREAD_COLOR);
                                              if (frame.empty())
                                              {
                                                  Logger::warn("InferencePipeline: could not read frame " + paths[i] + ", skipping");
                                                  stats.frames_skipped++;
                                                  continue;
                                              }

                                              LocalizedFace face = localizer.localize(frame, paths[i]);
                                              if (face.outcome == LocalizationOutcome::FACE_CROPPED)
                                              {
                                                  stats.faces_cropped++;
                                              }
                                              else
                                              {
                                                  stats.full_image_fallbacks++;
                                              }
                                              slots[i] = std::move(face);
                                          }
                                      }); });
    return slots;
}

InferenceResponse InferencePipeline::score(const InferenceRequest &request)
{
    auto start_time = std::chrono::steady_clock::now();
    PipelineSettings settings = context_.settings();

    ImageClassifier *classifier = context_.classifier();
    if (!classifier || !classifier->isReady())
    {
        throw InferenceException(InferenceErrorCode::CLASSIFIER_UNAVAILABLE, "Model is not loaded");
    }

    std::string model_version = request.model_version.empty()
                                    ? settings.default_model_version
                                    : request.model_version;
    Logger::info("InferencePipeline: request hash=" + shortHash(request.hash) + ", type=" +
                 MediaTypes::getName(request.media_type) + ", model=" + model_version);

    std::vector<std::string> paths = selectFrames(request, settings);
    auto slots = prepareFrames(paths, settings);

    std::vector<cv::Mat> batch;
    batch.reserve(slots.size());
    for (auto &slot : slots)
    {
        if (slot)
        {
            batch.push_back(slot->image);
        }
    }
    if (batch.empty())
    {
        throw InferenceException(InferenceErrorCode::INVALID_INPUT, "No valid frames processed");
    }
    Logger::debug("InferencePipeline: " + std::to_string(batch.size()) + " of " +
                  std::to_string(paths.size()) + " frames usable");

    std::vector<ClassifierResult> results;
    try
    {
        results = classifier->classify(batch);
    }
    catch (const cv::Exception &e)
    {
        throw InferenceException(InferenceErrorCode::INFERENCE_FAILURE, std::string("Classifier failed: ") + e.what());
    }
    if (results.size() != batch.size())
    {
        throw InferenceException(InferenceErrorCode::INFERENCE_FAILURE,
                                 "Classifier returned " + std::to_string(results.size()) + " results for " +
                                     std::to_string(batch.size()) + " frames");
    }
    context_.stats().frames_processed += batch.size();

    std::vector<FrameProbability> probabilities;
    probabilities.reserve(results.size());
    for (const auto &result : results)
    {
        probabilities.push_back(context_.extractor().extract(result));
    }

    InferenceResponse response;
    response.report = ScoreAggregator::aggregate(probabilities, request.media_type, context_.blendPolicy());
    response.model_version = model_version;
    response.inference_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::steady_clock::now() - start_time)
                                     .count();

    Logger::info("InferencePipeline: Calculated scores: P90=" + formatScore(response.report.video_score) +
                 ", Peak=" + formatScore(response.report.peak_risk) +
                 ", Mean=" + formatScore(response.report.mean_risk) +
                 ", Risk=" + formatScore(response.report.risk_score));
    Logger::info("InferencePipeline: complete risk_score=" + formatScore(response.report.risk_score) +
                 ", confidence=" + formatScore(response.report.confidence) + ", time=" +
                 std::to_string(response.inference_time_ms) + "ms");
    return response;
}
