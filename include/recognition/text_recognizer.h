#pragma once

#include <dxrt/dxrt_api.h>
#include <opencv2/opencv.hpp>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "common/logger.hpp"
#include "common/types.hpp"
#include "recognition/rec_postprocess.h"

namespace picmod {

/**
 * Text Recognizer Configuration
 * PP-OCR CRNN with one model per aspect ratio bucket
 */
struct RecognizerConfig {
    float confThreshold = 0.3f;

    // ratio bucket -> model file
    std::map<int, std::string> modelPaths;

    std::string dictPath;

    // Input height (fixed at 48)
    int inputHeight = 48;

    /**
     * @brief 从 rec 目录构造
     *
     * "ratio_N" in a file name selects the bucket; untagged models go to
     * bucket 10.
     */
    static RecognizerConfig FromModelDir(const std::string& dir, const std::string& dict_path);

    /**
     * @brief 宽高比所属的模型档位 (3/5/10/15/25/35)
     */
    static int RatioBucket(int width, int height);

    void Show() const {
        LOG_INFO("RecognizerConfig:");
        LOG_INFO("  confThreshold={:.2f}", confThreshold);
        LOG_INFO("  dictPath={}", dictPath);
        LOG_INFO("  Models: {} ratios", modelPaths.size());
    }
};

/**
 * Text Recognizer
 * Recognizes text content from cropped text line images
 */
class TextRecognizer {
public:
    explicit TextRecognizer(const RecognizerConfig& config);
    ~TextRecognizer() = default;

    bool Initialize();

    /**
     * @brief 识别单行文本
     * @return (文本, 置信度)；置信度低于阈值时文本为空
     */
    std::pair<std::string, float> Recognize(const cv::Mat& textImage);

private:
    dxrt::InferenceEngine* SelectModel(int ratio, int& used_ratio);
    cv::Mat Preprocess(const cv::Mat& image, int ratio);
    std::pair<std::string, float> Postprocess(dxrt::TensorPtrs& outputs);

    RecognizerConfig config_;
    std::map<int, std::unique_ptr<dxrt::InferenceEngine>> models_;
    std::unique_ptr<CTCDecoder> decoder_;
};

} // namespace picmod
