#include "recognition/text_recognizer.h"
#include "ocr/model_locator.h"
#include <algorithm>
#include <climits>
#include <filesystem>
#include <regex>

namespace picmod {

RecognizerConfig RecognizerConfig::FromModelDir(const std::string& dir, const std::string& dict_path) {
    RecognizerConfig config;
    config.dictPath = dict_path;

    static const std::regex ratio_re("ratio_(\\d+)");
    for (const auto& path : ModelLocator::listModelFiles(dir)) {
        std::string name = std::filesystem::path(path).filename().string();
        std::smatch m;
        int ratio = 10;
        if (std::regex_search(name, m, ratio_re)) {
            ratio = std::stoi(m[1].str());
        }
        if (!config.modelPaths.count(ratio)) {
            config.modelPaths[ratio] = path;
        }
    }
    return config;
}

int RecognizerConfig::RatioBucket(int width, int height) {
    if (height <= 0) {
        return 35;
    }
    float ratio = static_cast<float>(width) / height;
    if (ratio <= 3.0f) return 3;
    if (ratio <= 5.0f) return 5;
    if (ratio <= 10.0f) return 10;
    if (ratio <= 15.0f) return 15;
    if (ratio <= 25.0f) return 25;
    return 35;
}

TextRecognizer::TextRecognizer(const RecognizerConfig& config)
    : config_(config) {
}

bool TextRecognizer::Initialize() {
    if (config_.modelPaths.empty()) {
        LOG_ERROR("No recognition models specified");
        return false;
    }

    for (const auto& [ratio, model_path] : config_.modelPaths) {
        try {
            models_[ratio] = std::make_unique<dxrt::InferenceEngine>(model_path);
            LOG_INFO("Loaded rec ratio_{} model: {}", ratio, model_path);
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to load ratio_{} model: {}", ratio, e.what());
            return false;
        }
    }

    decoder_ = std::make_unique<CTCDecoder>(config_.dictPath, true);
    if (decoder_->getDictSize() <= 1) {
        LOG_ERROR("Failed to load character dictionary: {}", config_.dictPath);
        return false;
    }

    LOG_INFO("TextRecognizer initialized: {} ratios, {} characters",
             models_.size(), decoder_->getDictSize());
    return true;
}

std::pair<std::string, float> TextRecognizer::Recognize(const cv::Mat& textImage) {
    if (textImage.empty() || !decoder_) {
        return {"", 0.0f};
    }

    int ratio = RecognizerConfig::RatioBucket(textImage.cols, textImage.rows);
    int used_ratio = ratio;
    auto* engine = SelectModel(ratio, used_ratio);
    if (!engine) {
        LOG_ERROR("No recognition model for ratio {}", ratio);
        return {"", 0.0f};
    }

    cv::Mat input = Preprocess(textImage, used_ratio);

    dxrt::TensorPtrs outputs;
    try {
        outputs = engine->Run(input.data);
    } catch (const std::exception& e) {
        LOG_ERROR("Recognition inference failed: {}", e.what());
        return {"", 0.0f};
    }

    auto result = Postprocess(outputs);
    if (result.second < config_.confThreshold) {
        LOG_DEBUG("Low confidence filtered: '{}' ({:.4f} < {:.4f})",
                  result.first, result.second, config_.confThreshold);
        return {"", result.second};
    }
    return result;
}

dxrt::InferenceEngine* TextRecognizer::SelectModel(int ratio, int& used_ratio) {
    auto it = models_.find(ratio);
    if (it != models_.end()) {
        used_ratio = ratio;
        return it->second.get();
    }

    // 找不到精确匹配时使用最接近的ratio
    int closest = -1;
    int min_diff = INT_MAX;
    for (const auto& [r, _] : models_) {
        int diff = std::abs(r - ratio);
        if (diff < min_diff) {
            min_diff = diff;
            closest = r;
        }
    }
    if (closest == -1) {
        return nullptr;
    }
    used_ratio = closest;
    return models_[closest].get();
}

cv::Mat TextRecognizer::Preprocess(const cv::Mat& image, int ratio) {
    // 固定高度48；ratio_3 的输入宽度是120而不是144
    int target_height = config_.inputHeight;
    int target_width = (ratio == 3) ? 120 : target_height * ratio;

    float target_ratio = static_cast<float>(target_width) / target_height;
    float orig_ratio = static_cast<float>(image.cols) / image.rows;

    // 比目标窄时右侧灰色补边，否则直接缩放
    cv::Mat padded;
    if (orig_ratio < target_ratio) {
        int pad_w = static_cast<int>(image.rows * target_ratio) - image.cols;
        cv::copyMakeBorder(image, padded, 0, 0, 0, pad_w,
                           cv::BORDER_CONSTANT, cv::Scalar(114, 114, 114));
    } else {
        padded = image;
    }

    // NPU 输入为 HWC uint8，归一化在模型内部完成
    cv::Mat resized;
    cv::resize(padded, resized, cv::Size(target_width, target_height));
    if (!resized.isContinuous()) {
        resized = resized.clone();
    }
    return resized;
}

std::pair<std::string, float> TextRecognizer::Postprocess(dxrt::TensorPtrs& outputs) {
    if (outputs.empty() || !outputs[0]) {
        LOG_ERROR("Empty output tensors");
        return {"", 0.0f};
    }

    // [batch, time_steps, num_classes]
    auto shape = outputs[0]->shape();
    if (shape.size() != 3) {
        LOG_ERROR("Expected 3D recognition output, got {} dimensions", shape.size());
        return {"", 0.0f};
    }

    const float* data = reinterpret_cast<const float*>(outputs[0]->data());
    return decoder_->decode(data, static_cast<int>(shape[1]), static_cast<int>(shape[2]));
}

} // namespace picmod
