#include "core/classifier/onnx_image_classifier.hpp"
#include "core/inference_error.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>

OnnxImageClassifier::OnnxImageClassifier(const std::string &model_path,
                                         const std::vector<std::string> &labels,
                                         int input_size,
                                         const std::string &model_name)
    : model_path_(model_path),
      labels_(labels),
      input_size_(input_size),
      model_name_(model_name),
      ready_(false)
{
}

bool OnnxImageClassifier::load()
{
    std::lock_guard<std::mutex> lock(net_mutex_);
    ready_ = false;

    if (!std::filesystem::exists(model_path_))
    {
        Logger::error("OnnxImageClassifier: model file not found: " + model_path_);
        return false;
    }
    if (labels_.empty())
    {
        Logger::error("OnnxImageClassifier: no class labels configured");
        return false;
    }

    try
    {
        net_ = cv::dnn::readNetFromONNX(model_path_);
    }
    catch (const cv::Exception &e)
    {
        Logger::error("OnnxImageClassifier: failed to load " + model_path_ + ": " + e.what());
        return false;
    }

    if (net_.empty())
    {
        Logger::error("OnnxImageClassifier: network is empty after loading " + model_path_);
        return false;
    }

    ready_ = true;
    Logger::info("OnnxImageClassifier: loaded " + model_name_ + " from " + model_path_);
    return true;
}

bool OnnxImageClassifier::isReady() const
{
    std::lock_guard<std::mutex> lock(net_mutex_);
    return ready_;
}

cv::Mat OnnxImageClassifier::softmaxRows(const cv::Mat &logits)
{
    cv::Mat probabilities(logits.rows, logits.cols, CV_32F);
    for (int r = 0; r < logits.rows; ++r)
    {
        const float *in = logits.ptr<float>(r);
        float *out = probabilities.ptr<float>(r);
        float max_logit = *std::max_element(in, in + logits.cols);

        double sum = 0.0;
        for (int c = 0; c < logits.cols; ++c)
        {
            out[c] = std::exp(in[c] - max_logit);
            sum += out[c];
        }
        for (int c = 0; c < logits.cols; ++c)
        {
            out[c] = static_cast<float>(out[c] / sum);
        }
    }
    return probabilities;
}

std::vector<ClassifierResult> OnnxImageClassifier::classify(const std::vector<cv::Mat> &images)
{
    if (images.empty())
    {
        return {};
    }

    cv::Mat output;
    {
        std::lock_guard<std::mutex> lock(net_mutex_);
        if (!ready_)
        {
            throw InferenceException(InferenceErrorCode::CLASSIFIER_UNAVAILABLE, "Model is not loaded");
        }

        try
        {
            cv::Mat blob = cv::dnn::blobFromImages(images, 1.0 / 255.0, cv::Size(input_size_, input_size_),
                                                   cv::Scalar(), true, false, CV_32F);
            net_.setInput(blob);
            output = net_.forward().clone();
        }
        catch (const cv::Exception &e)
        {
            throw InferenceException(InferenceErrorCode::INFERENCE_FAILURE,
                                     std::string("Classifier forward pass failed: ") + e.what());
        }
    }

    return rankResults(output, images.size(), labels_);
}

std::vector<ClassifierResult> OnnxImageClassifier::rankResults(const cv::Mat &output,
                                                               size_t batch_size,
                                                               const std::vector<std::string> &labels)
{
    if (batch_size == 0 || output.total() != batch_size * labels.size())
    {
        throw InferenceException(InferenceErrorCode::INFERENCE_FAILURE,
                                 "Classifier produced " + std::to_string(output.total()) + " outputs for " +
                                     std::to_string(batch_size) + " images and " +
                                     std::to_string(labels.size()) + " labels");
    }

    cv::Mat logits;
    output.reshape(1, static_cast<int>(batch_size)).convertTo(logits, CV_32F);

    cv::Mat probabilities = softmaxRows(logits);
    std::vector<ClassifierResult> results;
    results.reserve(batch_size);
    for (int r = 0; r < probabilities.rows; ++r)
    {
        ClassifierResult result;
        for (int c = 0; c < probabilities.cols; ++c)
        {
            result.emplace_back(labels[c], probabilities.at<float>(r, c));
        }
        std::stable_sort(result.begin(), result.end(),
                         [](const LabelScore &a, const LabelScore &b)
                         { return a.score > b.score; });
        results.push_back(std::move(result));
    }
    return results;
}
