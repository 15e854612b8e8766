#include "classification/text_classifier.h"
#include "ocr/model_locator.h"

namespace picmod {

ClassifierConfig ClassifierConfig::FromModelDir(const std::string& dir) {
    ClassifierConfig config;
    auto files = ModelLocator::listModelFiles(dir);
    if (!files.empty()) {
        config.modelPath = files.front();
    }
    return config;
}

TextClassifier::TextClassifier(const ClassifierConfig& config)
    : config_(config) {
}

bool TextClassifier::Initialize() {
    if (config_.modelPath.empty()) {
        LOG_ERROR("Classification model path is empty");
        return false;
    }

    try {
        engine_ = std::make_unique<dxrt::InferenceEngine>(config_.modelPath);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to load classification model: {}", e.what());
        return false;
    }

    initialized_ = true;
    LOG_INFO("TextClassifier initialized: {}", config_.modelPath);
    return true;
}

std::pair<std::string, float> TextClassifier::Classify(const cv::Mat& textImage) {
    if (!initialized_ || textImage.empty()) {
        return {"0", 0.0f};
    }

    cv::Mat input = Preprocess(textImage);

    dxrt::TensorPtrs outputs;
    try {
        outputs = engine_->Run(input.data);
    } catch (const std::exception& e) {
        LOG_ERROR("Classification inference failed: {}", e.what());
        return {"0", 0.0f};
    }

    auto result = Postprocess(outputs);
    LOG_TRACE("Classification result: label={}, confidence={:.3f}", result.first, result.second);
    return result;
}

cv::Mat TextClassifier::Preprocess(const cv::Mat& image) {
    // 固定尺寸 160x80，uint8 HWC，归一化在模型内部
    cv::Mat resized;
    cv::resize(image, resized, cv::Size(config_.inputWidth, config_.inputHeight));
    if (!resized.isContinuous()) {
        resized = resized.clone();
    }
    return resized;
}

std::pair<std::string, float> TextClassifier::Postprocess(dxrt::TensorPtrs& outputs) {
    if (outputs.empty() || !outputs[0]) {
        LOG_ERROR("No output tensors");
        return {"0", 0.0f};
    }

    // [1, 2] or [2]
    auto shape = outputs[0]->shape();
    if (shape.empty() || shape.back() != 2) {
        LOG_ERROR("Unexpected classifier output shape");
        return {"0", 0.0f};
    }

    const float* data = reinterpret_cast<const float*>(outputs[0]->data());
    if (!data) {
        return {"0", 0.0f};
    }

    // 输出已经过 Softmax，直接取最大值
    int max_idx = data[1] > data[0] ? 1 : 0;
    return {labels_[max_idx], data[max_idx]};
}

} // namespace picmod
