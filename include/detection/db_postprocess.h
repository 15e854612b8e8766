#pragma once

#include <opencv2/opencv.hpp>
#include <vector>
#include "common/types.hpp"

namespace picmod {

/**
 * @brief DBNet 后处理器
 * 将网络输出的概率图转换为文本检测框
 *
 * Pure OpenCV; usable without the inference runtime.
 */
class DBPostProcessor {
public:
    /**
     * @brief 构造函数
     * @param thresh 二值化阈值 (默认0.3)
     * @param box_thresh 检测框置信度阈值 (默认0.6)
     * @param max_candidates 最大候选框数量 (默认1000)
     * @param unclip_ratio 检测框扩展比例 (默认1.5)
     */
    explicit DBPostProcessor(float thresh = 0.3f,
                             float box_thresh = 0.6f,
                             int max_candidates = 1000,
                             float unclip_ratio = 1.5f);

    /**
     * @brief 处理检测输出
     * @param pred 概率图 CV_32FC1 [H, W]，取值 0-1
     * @param src_h 原始图像高度
     * @param src_w 原始图像宽度
     * @param padded_h 补边后（缩放前）高度，<=0 表示无补边
     * @param padded_w 补边后（缩放前）宽度，<=0 表示无补边
     * @return 原图坐标系下的文本框，confidence 为框内平均概率
     */
    std::vector<TextBox> process(const cv::Mat& pred,
                                 int src_h, int src_w,
                                 int padded_h = -1, int padded_w = -1) const;

private:
    std::vector<cv::Point2f> getMinBoxes(const std::vector<cv::Point>& contour,
                                         float& min_side) const;

    /**
     * @brief 计算检测框的置信度分数（轮廓内概率均值）
     */
    float boxScoreFast(const cv::Mat& pred, const std::vector<cv::Point>& contour) const;

    /**
     * @brief 按 area * ratio / perimeter 向外扩展检测框
     */
    std::vector<cv::Point2f> unclip(const std::vector<cv::Point2f>& box) const;

    static float polygonArea(const std::vector<cv::Point2f>& box);
    static float polygonLength(const std::vector<cv::Point2f>& box);

private:
    float thresh_;
    float box_thresh_;
    int max_candidates_;
    float unclip_ratio_;
};

} // namespace picmod
