#pragma once

#include <opencv2/opencv.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "ocr/ocr_engine.h"

namespace picmod {

/**
 * @brief OCR 处理器
 *
 * Owns an OcrEngine and shapes its output for editing: region crop,
 * image-coordinate boxes, empty texts dropped, reading order. Never throws.
 * May be shared between sessions; the engine serializes inference itself.
 */
class OcrProcessor {
public:
    /**
     * @param engine 可为空，此时 OCR 不可用
     */
    explicit OcrProcessor(std::unique_ptr<OcrEngine> engine);

    /**
     * @brief 初始化引擎（只尝试一次）
     */
    bool initialize();

    bool isAvailable() const;

    std::string engineName() const;

    /**
     * @brief 识别整张图像
     */
    std::vector<TextBox> recognize(const cv::Mat& image);

    /**
     * @brief 识别选区内的文字
     * @param image 完整图像
     * @param selection 选区（裁剪到图像范围）
     * @return 完整图像坐标系下的结果，按阅读顺序排序并设置 index
     */
    std::vector<TextBox> recognizeRegion(const cv::Mat& image, const SelectionRect& selection);

private:
    std::vector<TextBox> runEngine(const cv::Mat& image);

    std::unique_ptr<OcrEngine> engine_;
    std::mutex init_mutex_;
    bool init_attempted_ = false;
};

} // namespace picmod
