#pragma once

#include <mutex>
#include <string>
#include <vector>
#include <opencv2/dnn.hpp>
#include "core/classifier/image_classifier.hpp"

/**
 * @brief Binary real/fake classifier exported to ONNX, run through OpenCV DNN
 *
 * Preprocessing matches the training pipeline: resize to input_size x input_size,
 * RGB channel order, values scaled to [0,1], no mean/std normalisation. Logits are
 * turned into probabilities with a softmax; each result is sorted by score,
 * descending.
 */
class OnnxImageClassifier : public ImageClassifier
{
public:
    OnnxImageClassifier(const std::string &model_path,
                        const std::vector<std::string> &labels,
                        int input_size,
                        const std::string &model_name);

    /**
     * @brief Load the network from model_path
     * @return true on success; failures are logged and leave the classifier not ready
     */
    bool load();

    bool isReady() const override;
    std::string modelName() const override { return model_name_; }
    std::vector<ClassifierResult> classify(const std::vector<cv::Mat> &images) override;

    // Row-wise softmax of a [N x C] float matrix
    static cv::Mat softmaxRows(const cv::Mat &logits);

    /**
     * @brief Turn raw network output into one ranked result per image
     * @throws InferenceException INFERENCE_FAILURE when output size != batch_size * labels
     */
    static std::vector<ClassifierResult> rankResults(const cv::Mat &output,
                                                     size_t batch_size,
                                                     const std::vector<std::string> &labels);

private:
    std::string model_path_;
    std::vector<std::string> labels_;
    int input_size_;
    std::string model_name_;

    cv::dnn::Net net_;
    bool ready_;
    mutable std::mutex net_mutex_;
};
