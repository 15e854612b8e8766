#pragma once

#include <opencv2/opencv.hpp>
#include <optional>
#include <string>
#include "common/types.hpp"

namespace picmod {

/**
 * @brief 图像处理器
 *
 * All operations take a BGR image and return a new image; the input is
 * never modified.
 */
class ImageProcessor {
public:
    /**
     * @brief 垂直删除并拼接
     *
     * Removes rows [y1, y2) over the full image width and joins the part
     * above with the part below. x coordinates of the selection are ignored.
     *
     * @param image 输入图像
     * @param selection 选择区域
     * @return 拼接后的图像；区域为空或会删除全部行时返回副本
     */
    static cv::Mat verticalDeleteAndStitch(const cv::Mat& image, const SelectionRect& selection);

    /**
     * @brief 智能填充选中区域
     * @param image 输入图像
     * @param selection 选择区域（会被裁剪到图像范围）
     * @param mode 填充模式
     * @param color 纯色填充颜色 (RGB)，仅 FillMode::Color 使用，默认白色
     * @param inpaint_radius inpaint 半径
     * @return 填充后的图像
     * @throws std::invalid_argument 输入不是 CV_8UC3
     */
    static cv::Mat smartFill(const cv::Mat& image,
                             const SelectionRect& selection,
                             FillMode mode = FillMode::Inpaint,
                             const std::optional<cv::Vec3b>& color = std::nullopt,
                             double inpaint_radius = 3.0);

    /**
     * @brief 按掩码修复图像
     * @param mask CV_8UC1，非零像素为待修复区域
     * @throws std::invalid_argument 掩码尺寸或类型不匹配
     */
    static cv::Mat inpaintMask(const cv::Mat& image,
                               const cv::Mat& mask,
                               double radius = 3.0,
                               int method = cv::INPAINT_TELEA);

    /**
     * @brief 解析填充模式名称 (inpaint|average|median|color)
     * @throws std::invalid_argument 未知名称
     */
    static FillMode parseFillMode(const std::string& name);

    static std::string fillModeName(FillMode mode);

private:
    // One-pixel ring just outside the rectangle, sides inside the image only
    static std::vector<cv::Vec3b> borderPixels(const cv::Mat& image, const cv::Rect& rect);
};

} // namespace picmod
