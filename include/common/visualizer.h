#pragma once

#include <opencv2/opencv.hpp>
#include <string>
#include <vector>
#include "common/types.hpp"

namespace picmod {

/**
 * @brief 可视化工具类，用于绘制识别结果和选区
 */
class Visualizer {
public:
    /**
     * @brief 绘制OCR结果（文本框+序号+识别文本）
     * @param font_path TrueType字体路径（用于中文显示），为空时用 Hershey 字体
     */
    static cv::Mat drawOCRResults(const cv::Mat& image,
                                  const std::vector<TextBox>& boxes,
                                  const std::string& font_path = "");

    /**
     * @brief 绘制选区边框（虚线）
     */
    static cv::Mat drawSelection(const cv::Mat& image,
                                 const SelectionRect& selection,
                                 const cv::Scalar& color = cv::Scalar(255, 0, 0));

private:
    // 按序号取固定调色板颜色，同一结果每次颜色一致
    static cv::Scalar paletteColor(size_t i);
};

} // namespace picmod
