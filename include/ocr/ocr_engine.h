#pragma once

#include <opencv2/opencv.hpp>
#include <memory>
#include <string>
#include <vector>

#include "common/config.h"
#include "common/types.hpp"

namespace picmod {

/**
 * @brief OCR 引擎接口
 *
 * recognize() returns boxes in the coordinates of the image it was given.
 * Implementations may throw; OcrProcessor contains the failure.
 */
class OcrEngine {
public:
    virtual ~OcrEngine() = default;

    /**
     * @brief 加载模型
     * @return 是否可用
     */
    virtual bool initialize() = 0;

    virtual bool isAvailable() const = 0;

    virtual std::vector<TextBox> recognize(const cv::Mat& image) = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief 创建默认OCR引擎
 * @return 未编译推理运行时时返回 nullptr
 */
std::unique_ptr<OcrEngine> CreateOcrEngine(const OcrConfig& config);

} // namespace picmod
