#pragma once

#include <opencv2/opencv.hpp>
#include <vector>
#include "common/types.hpp"

namespace picmod {

/**
 * @brief 几何工具类
 */
class Geometry {
public:
    /**
     * @brief 计算两点之间的欧氏距离
     */
    static float distance(const cv::Point2f& p1, const cv::Point2f& p2);

    /**
     * @brief 对四个点进行排序：左上、右上、右下、左下
     * @param points 输入点集（4个点）
     * @return 排序后的点
     */
    static std::vector<cv::Point2f> orderPointsClockwise(const std::vector<cv::Point2f>& points);

    /**
     * @brief 裁剪并矫正文本区域（四点透视变换）
     * @param image 输入图像
     * @param box 文本框的四个顶点
     * @param dst_height 目标高度（宽度按比例计算）
     * @return 矫正后的文本图像
     */
    static cv::Mat cropTextRegion(const cv::Mat& image,
                                  const std::vector<cv::Point2f>& box,
                                  int dst_height = 48);

    /**
     * @brief 将矩形裁剪到图像范围内
     * @return 可能为空的矩形
     */
    static cv::Rect clampRect(const cv::Rect& rect, const cv::Size& bounds);

    /**
     * @brief 文本框外接矩形加边距后裁剪到图像范围
     */
    static cv::Rect paddedBoxRect(const TextBox& box, int padding, const cv::Size& bounds);

    /**
     * @brief 判断文本框是否完全位于选区内
     */
    static bool isBoxInside(const TextBox& box, const SelectionRect& selection);

    /**
     * @brief 按阅读顺序排序（从上到下，同一行从左到右）
     *
     * Two boxes share a row when their centers differ in y by less than half
     * the smaller box height. Also rewrites TextBox::index.
     */
    static void sortReadingOrder(std::vector<TextBox>& boxes);
};

} // namespace picmod
