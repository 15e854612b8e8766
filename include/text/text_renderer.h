#pragma once

#include <opencv2/opencv.hpp>
#include <string>

// FreeType handles, kept opaque here
typedef struct FT_LibraryRec_* FT_Library;
typedef struct FT_FaceRec_* FT_Face;

namespace picmod {

/**
 * @brief UTF-8 文本渲染
 *
 * Renders with FreeType and alpha-blends glyph coverage into a BGR image.
 * Without a loaded font it falls back to OpenCV's Hershey font, which only
 * covers ASCII; other characters are drawn as '?'.
 */
class TextRenderer {
public:
    TextRenderer();
    ~TextRenderer();

    TextRenderer(const TextRenderer&) = delete;
    TextRenderer& operator=(const TextRenderer&) = delete;

    /**
     * @brief 加载字体
     * @param font_path TrueType/OpenType 字体路径
     * @param pixel_size 字号（像素）
     * @return 失败时保持 Hershey 回退模式
     */
    bool loadFont(const std::string& font_path, int pixel_size);

    bool hasFont() const { return face_ != nullptr; }
    int pixelSize() const { return pixel_size_; }

    /**
     * @brief 文本墨迹范围，相对于基线起点
     * @return x/y 可为负（y 向下为正）
     */
    cv::Rect measure(const std::string& text) const;

    /**
     * @brief 在基线起点 origin 处绘制文本
     * @param color BGR
     */
    void draw(cv::Mat& image, const std::string& text, cv::Point origin, const cv::Scalar& color) const;

    /**
     * @brief 将文本墨迹居中绘制在矩形内
     * @param rgb 文字颜色 (RGB)
     * @return 实际绘制的墨迹范围（图像坐标）
     */
    cv::Rect drawCentered(cv::Mat& image, const cv::Rect& rect,
                          const std::string& text, const cv::Vec3b& rgb) const;

private:
    void releaseFace();
    std::string toAscii(const std::string& text) const;
    double hersheyScale() const;

    FT_Library library_ = nullptr;
    FT_Face face_ = nullptr;
    int pixel_size_ = 24;
};

} // namespace picmod
