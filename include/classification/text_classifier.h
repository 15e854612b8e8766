#pragma once

#include <dxrt/dxrt_api.h>
#include <opencv2/opencv.hpp>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "common/logger.hpp"

namespace picmod {

/**
 * Text line orientation classifier configuration
 */
struct ClassifierConfig {
    std::string modelPath;

    // Rotate if label is "180" and score > threshold
    float threshold = 0.9f;

    int inputWidth = 160;
    int inputHeight = 80;

    /**
     * @brief 使用 cls 目录中的第一个模型
     */
    static ClassifierConfig FromModelDir(const std::string& dir);

    void Show() const {
        LOG_INFO("ClassifierConfig:");
        LOG_INFO("  modelPath={}", modelPath);
        LOG_INFO("  threshold={:.2f}", threshold);
        LOG_INFO("  inputSize={}x{}", inputWidth, inputHeight);
    }
};

/**
 * Text Classifier
 * Detects whether a text line image is upside down
 */
class TextClassifier {
public:
    explicit TextClassifier(const ClassifierConfig& config);
    ~TextClassifier() = default;

    bool Initialize();

    /**
     * @brief 分类单张文本行图像
     * @return (label, confidence)，label 为 "0" 或 "180"
     */
    std::pair<std::string, float> Classify(const cv::Mat& textImage);

    bool NeedsRotation(const std::string& label, float confidence) const {
        return (label == "180" && confidence > config_.threshold);
    }

private:
    cv::Mat Preprocess(const cv::Mat& image);
    std::pair<std::string, float> Postprocess(dxrt::TensorPtrs& outputs);

    ClassifierConfig config_;
    std::unique_ptr<dxrt::InferenceEngine> engine_;
    std::vector<std::string> labels_ = {"0", "180"};
    bool initialized_ = false;
};

} // namespace picmod
