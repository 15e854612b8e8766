#pragma once

#include <opencv2/opencv.hpp>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/types.hpp"
#include "text/font_manager.h"

namespace picmod {

/**
 * @brief 文字编辑器
 *
 * Erases, replaces and adds text on BGR images. Every operation returns a
 * new image; the input is never modified.
 */
class TextEditor {
public:
    /**
     * @param fonts 字体管理器，为空时内部创建默认实例
     * @param padding 删除文字时掩码外扩像素
     * @param inpaint_radius inpaint 半径
     */
    explicit TextEditor(std::shared_ptr<FontManager> fonts = nullptr,
                        int padding = 2,
                        double inpaint_radius = 3.0);

    /**
     * @brief 提取文字区域的字体特征
     *
     * Size is 80% of the region height (at least 12). Colour is the
     * per-channel median of the dark pixels (RGB sum below 600), or the mean
     * of all pixels when there are none. Bold means Canny edge density above
     * 0.1.
     *
     * @param image BGR 图像
     * @param box 文字区域
     * @return 区域为空时返回默认特征
     */
    FontFeatures extractFontFeatures(const cv::Mat& image, const TextBox& box) const;

    static FontFeatures defaultFeatures() { return FontFeatures(); }

    /**
     * @brief 根据特征匹配字体
     * @return (字体路径或空串, 字号)
     */
    std::pair<std::string, int> matchFont(const FontFeatures& features, const std::string& text);

    /**
     * @brief 删除文字：外扩后的外接矩形并集做 TELEA 修复
     * @return 无文字框时返回副本
     */
    cv::Mat deleteText(const cv::Mat& image, const std::vector<TextBox>& boxes) const;

    /**
     * @brief 替换文字：先删除原文字，再将新文字居中绘制在原区域
     * @param params 为空时从原区域提取字体特征并匹配字体
     * @return 新文字为空时返回副本
     */
    cv::Mat replaceText(const cv::Mat& image,
                        const TextBox& box,
                        const std::string& new_text,
                        const std::optional<FontParams>& params = std::nullopt);

    /**
     * @brief 在指定区域添加文字（不擦除背景）
     *
     * params override features. A font name is resolved to a path through
     * the FontManager; without either the font is matched from features.
     */
    cv::Mat addText(const cv::Mat& image,
                    const TextBox& box,
                    const std::string& new_text,
                    const std::optional<FontParams>& params = std::nullopt,
                    const std::optional<FontFeatures>& features = std::nullopt);

    FontManager& fonts() { return *fonts_; }

private:
    // Draws text centered in rect with the resolved font into a copy of image
    cv::Mat drawText(const cv::Mat& image, const cv::Rect& rect, const std::string& text,
                     const std::string& font_path, int font_size, const cv::Vec3b& rgb) const;

    std::shared_ptr<FontManager> fonts_;
    int padding_;
    double inpaint_radius_;
};

} // namespace picmod
