#pragma once

#include <atomic>
#include <functional>
#include <string>
#include <vector>
#include "core/classifier/image_classifier.hpp"
#include "core/inference_error.hpp"

/**
 * @brief Scriptable classifier; by default scores each image by its mean blue value
 *
 * Mean blue / 255 becomes the "Fake" score, so tests control the probability
 * through the pixel colour of the frames they write.
 */
class FakeClassifier : public ImageClassifier
{
public:
    using Scorer = std::function<ClassifierResult(const cv::Mat &)>;

    explicit FakeClassifier(bool ready = true) : ready_(ready), scorer_(blueChannelScorer) {}

    bool isReady() const override { return ready_; }
    std::string modelName() const override { return "fake-classifier"; }

    std::vector<ClassifierResult> classify(const std::vector<cv::Mat> &images) override
    {
        if (!ready_)
        {
            throw InferenceException(InferenceErrorCode::CLASSIFIER_UNAVAILABLE, "Model is not loaded");
        }
        calls_++;
        last_batch_size_ = images.size();
        std::vector<ClassifierResult> results;
        for (const auto &image : images)
        {
            last_image_size_ = image.size();
            results.push_back(scorer_(image));
        }
        if (drop_last_result_ && !results.empty())
        {
            results.pop_back();
        }
        return results;
    }

    void setReady(bool ready) { ready_ = ready; }
    void setScorer(Scorer scorer) { scorer_ = std::move(scorer); }
    void dropLastResult(bool drop) { drop_last_result_ = drop; }

    int calls() const { return calls_.load(); }
    size_t lastBatchSize() const { return last_batch_size_; }
    cv::Size lastImageSize() const { return last_image_size_; }

    static ClassifierResult blueChannelScorer(const cv::Mat &image)
    {
        double fake = cv::mean(image)[0] / 255.0;
        return {LabelScore("Real", 1.0 - fake), LabelScore("Fake", fake)};
    }

private:
    bool ready_;
    Scorer scorer_;
    bool drop_last_result_ = false;
    std::atomic<int> calls_{0};
    size_t last_batch_size_ = 0;
    cv::Size last_image_size_;
};
