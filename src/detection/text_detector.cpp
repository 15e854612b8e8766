#include "detection/text_detector.h"
#include "detection/db_postprocess.h"
#include "ocr/model_locator.h"
#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>

namespace picmod {

DetectorConfig DetectorConfig::FromModelDir(const std::string& dir) {
    DetectorConfig config;
    std::vector<std::string> untagged;

    for (const auto& path : ModelLocator::listModelFiles(dir)) {
        std::string name = std::filesystem::path(path).filename().string();
        if (name.find("640") != std::string::npos) {
            config.model640Path = path;
        } else if (name.find("960") != std::string::npos) {
            config.model960Path = path;
        } else {
            untagged.push_back(path);
        }
    }

    // 未标注尺寸的单模型按640输入使用
    if (config.model640Path.empty() && config.model960Path.empty() && !untagged.empty()) {
        config.model640Path = untagged.front();
    }
    return config;
}

void DetectorConfig::Show() const {
    LOG_INFO("DetectorConfig:");
    LOG_INFO("  thresh={:.2f}, boxThresh={:.2f}, unclipRatio={:.2f}", thresh, boxThresh, unclipRatio);
    LOG_INFO("  model640={}", model640Path.empty() ? "(none)" : model640Path);
    LOG_INFO("  model960={}", model960Path.empty() ? "(none)" : model960Path);
}

TextDetector::TextDetector(const DetectorConfig& config)
    : config_(config) {
}

TextDetector::~TextDetector() = default;

bool TextDetector::init() {
    if (initialized_) {
        LOG_WARN("TextDetector already initialized");
        return true;
    }

    postprocessor_ = std::make_unique<DBPostProcessor>(
        config_.thresh, config_.boxThresh, config_.maxCandidates, config_.unclipRatio);

    try {
        if (!config_.model640Path.empty()) {
            model640_ = std::make_unique<dxrt::InferenceEngine>(config_.model640Path);
            LOG_INFO("Loaded det_640 model: {}", config_.model640Path);
        }
        if (!config_.model960Path.empty()) {
            model960_ = std::make_unique<dxrt::InferenceEngine>(config_.model960Path);
            LOG_INFO("Loaded det_960 model: {}", config_.model960Path);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to initialize TextDetector: {}", e.what());
        return false;
    }

    if (!model640_ && !model960_) {
        LOG_ERROR("No detection model loaded");
        return false;
    }

    initialized_ = true;
    return true;
}

std::vector<TextBox> TextDetector::detect(const cv::Mat& image) {
    if (!initialized_) {
        LOG_ERROR("TextDetector not initialized");
        return {};
    }
    if (image.empty()) {
        LOG_ERROR("Input image is empty");
        return {};
    }

    int target_size = 0;
    auto* engine = selectModel(image.rows, image.cols, target_size);
    if (!engine) {
        LOG_ERROR("No suitable model for image size {}x{}", image.cols, image.rows);
        return {};
    }

    auto t1 = std::chrono::high_resolution_clock::now();
    int padded_h = 0, padded_w = 0;
    cv::Mat input = preprocess(image, target_size, padded_h, padded_w);

    cv::Mat pred = runInference(engine, input);
    auto t2 = std::chrono::high_resolution_clock::now();
    if (pred.empty()) {
        LOG_ERROR("Inference returned empty result");
        return {};
    }

    auto boxes = postprocessor_->process(pred, image.rows, image.cols, padded_h, padded_w);
    auto t3 = std::chrono::high_resolution_clock::now();

    LOG_DEBUG("Detection: {} boxes | Inference: {:.2f}ms | Postprocess: {:.2f}ms",
              boxes.size(),
              std::chrono::duration<double, std::milli>(t2 - t1).count(),
              std::chrono::duration<double, std::milli>(t3 - t2).count());
    return boxes;
}

dxrt::InferenceEngine* TextDetector::selectModel(int height, int width, int& target_size) {
    int max_side = std::max(height, width);

    if (max_side < config_.sizeThreshold && model640_) {
        target_size = 640;
        return model640_.get();
    }
    if (model960_) {
        target_size = 960;
        return model960_.get();
    }
    if (model640_) {
        target_size = 640;
        return model640_.get();
    }
    return nullptr;
}

cv::Mat TextDetector::preprocess(const cv::Mat& image, int target_size,
                                 int& padded_h, int& padded_w) {
    // 灰色(114,114,114)填充，黑色会导致边缘文字漏检
    const cv::Scalar PAD_COLOR(114, 114, 114);

    cv::Mat padded;
    if (image.cols < image.rows) {
        cv::copyMakeBorder(image, padded, 0, 0, 0, image.rows - image.cols,
                           cv::BORDER_CONSTANT, PAD_COLOR);
    } else if (image.cols > image.rows) {
        cv::copyMakeBorder(image, padded, 0, image.cols - image.rows, 0, 0,
                           cv::BORDER_CONSTANT, PAD_COLOR);
    } else {
        padded = image;
    }

    padded_h = padded.rows;
    padded_w = padded.cols;

    cv::Mat resized;
    cv::resize(padded, resized, cv::Size(target_size, target_size));
    if (!resized.isContinuous()) {
        resized = resized.clone();
    }
    return resized;
}

cv::Mat TextDetector::runInference(dxrt::InferenceEngine* engine, const cv::Mat& input) {
    dxrt::TensorPtrs outputs;
    try {
        outputs = engine->Run(reinterpret_cast<void*>(const_cast<uint8_t*>(input.ptr<uint8_t>())));
    } catch (const std::exception& e) {
        LOG_ERROR("Detection inference failed: {}", e.what());
        return cv::Mat();
    }

    if (outputs.empty() || !outputs[0]) {
        LOG_ERROR("Inference failed: no output tensors");
        return cv::Mat();
    }

    // [1, 1, H, W]
    auto shape = outputs[0]->shape();
    if (shape.size() != 4) {
        LOG_ERROR("Unexpected output shape size: {}", shape.size());
        return cv::Mat();
    }

    int out_h = static_cast<int>(shape[2]);
    int out_w = static_cast<int>(shape[3]);
    cv::Mat pred(out_h, out_w, CV_32FC1);
    std::memcpy(pred.data, outputs[0]->data(), static_cast<size_t>(out_h) * out_w * sizeof(float));
    return pred;
}

} // namespace picmod
