#include "text/text_editor.h"
#include "text/text_renderer.h"
#include "editing/image_processor.h"
#include "common/geometry.h"
#include "common/logger.hpp"

#include <algorithm>

namespace picmod {

namespace {

// numpy 风格中位数：偶数个取中间两个的平均，再截断为整数
int medianOf(std::vector<int>& values) {
    size_t n = values.size();
    std::sort(values.begin(), values.end());
    if (n % 2 == 1) {
        return values[n / 2];
    }
    return static_cast<int>((values[n / 2 - 1] + values[n / 2]) / 2.0);
}

} // namespace

TextEditor::TextEditor(std::shared_ptr<FontManager> fonts, int padding, double inpaint_radius)
    : fonts_(fonts ? std::move(fonts) : std::make_shared<FontManager>()),
      padding_(std::max(0, padding)),
      inpaint_radius_(inpaint_radius) {
}

FontFeatures TextEditor::extractFontFeatures(const cv::Mat& image, const TextBox& box) const {
    if (image.empty() || image.type() != CV_8UC3) {
        return defaultFeatures();
    }

    cv::Rect rect = Geometry::clampRect(box.GetRect(), image.size());
    if (rect.empty()) {
        return defaultFeatures();
    }

    cv::Mat region = image(rect);
    FontFeatures features;

    // 1. 字号
    features.fontSize = std::max(12, static_cast<int>(rect.height * 0.8));

    // 2. 颜色：暗色像素的中位数，没有暗色像素时取均值
    std::vector<int> dark[3];
    long long sum[3] = {0, 0, 0};
    for (int y = 0; y < region.rows; y++) {
        const cv::Vec3b* row = region.ptr<cv::Vec3b>(y);
        for (int x = 0; x < region.cols; x++) {
            const cv::Vec3b& px = row[x];
            int r = px[2], g = px[1], b = px[0];
            sum[0] += r;
            sum[1] += g;
            sum[2] += b;
            if (r + g + b < 600) {
                dark[0].push_back(r);
                dark[1].push_back(g);
                dark[2].push_back(b);
            }
        }
    }

    if (!dark[0].empty()) {
        for (int c = 0; c < 3; c++) {
            features.fontColor[c] = static_cast<uchar>(medianOf(dark[c]));
        }
    } else {
        long long total = static_cast<long long>(region.rows) * region.cols;
        for (int c = 0; c < 3; c++) {
            features.fontColor[c] = static_cast<uchar>(sum[c] / total);
        }
    }

    // 3. 粗体：边缘密度
    cv::Mat gray, edges;
    cv::cvtColor(region, gray, cv::COLOR_BGR2GRAY);
    cv::Canny(gray, edges, 50, 150);
    double density = static_cast<double>(cv::countNonZero(edges)) / edges.total();
    features.isBold = density > 0.1;

    // 4. 字间距
    features.charSpacing = std::max(0, static_cast<int>(rect.width * 0.05));
    features.bbox = rect;

    LOG_DEBUG("Font features: size={} color=({},{},{}) bold={} edgeDensity={:.3f}",
              features.fontSize, features.fontColor[0], features.fontColor[1],
              features.fontColor[2], features.isBold, density);
    return features;
}

std::pair<std::string, int> TextEditor::matchFont(const FontFeatures& features, const std::string& text) {
    return fonts_->matchFont(features, text);
}

cv::Mat TextEditor::deleteText(const cv::Mat& image, const std::vector<TextBox>& boxes) const {
    if (image.empty()) {
        return cv::Mat();
    }
    if (boxes.empty()) {
        return image.clone();
    }

    cv::Mat mask = cv::Mat::zeros(image.size(), CV_8UC1);
    int masked = 0;
    for (const auto& box : boxes) {
        cv::Rect r = Geometry::paddedBoxRect(box, padding_, image.size());
        if (r.empty()) {
            continue;
        }
        mask(r).setTo(255);
        masked++;
    }

    LOG_DEBUG("deleteText: {} of {} boxes masked", masked, boxes.size());
    return ImageProcessor::inpaintMask(image, mask, inpaint_radius_, cv::INPAINT_TELEA);
}

cv::Mat TextEditor::replaceText(const cv::Mat& image,
                                const TextBox& box,
                                const std::string& new_text,
                                const std::optional<FontParams>& params) {
    if (image.empty()) {
        return cv::Mat();
    }
    if (new_text.empty()) {
        return image.clone();
    }

    // 特征取自擦除前的原文字
    FontFeatures features = extractFontFeatures(image, box);
    cv::Mat erased = deleteText(image, {box});
    return addText(erased, box, new_text, params, features);
}

cv::Mat TextEditor::addText(const cv::Mat& image,
                            const TextBox& box,
                            const std::string& new_text,
                            const std::optional<FontParams>& params,
                            const std::optional<FontFeatures>& features) {
    if (image.empty()) {
        return cv::Mat();
    }
    if (new_text.empty()) {
        return image.clone();
    }

    FontFeatures feat = features ? *features : defaultFeatures();
    FontParams p = params ? *params : FontParams();

    int font_size = p.fontSize > 0 ? p.fontSize : feat.fontSize;
    cv::Vec3b color = p.fontColor ? *p.fontColor : feat.fontColor;

    std::string font_path = p.fontPath;
    if (font_path.empty() && !p.fontName.empty()) {
        font_path = fonts_->findFontPath(p.fontName);
        if (font_path.empty()) {
            LOG_WARN("Font '{}' not found, matching from features", p.fontName);
        }
    }
    if (font_path.empty()) {
        auto matched = fonts_->matchFont(feat, new_text);
        font_path = matched.first;
        if (p.fontSize <= 0) {
            font_size = matched.second;
        }
    }

    return drawText(image, box.GetRect(), new_text, font_path, font_size, color);
}

cv::Mat TextEditor::drawText(const cv::Mat& image, const cv::Rect& rect, const std::string& text,
                             const std::string& font_path, int font_size, const cv::Vec3b& rgb) const {
    cv::Mat result = image.clone();

    TextRenderer renderer;
    if (!renderer.loadFont(font_path, font_size)) {
        LOG_WARN("No TrueType font available for '{}', falling back to Hershey", text);
    }

    cv::Rect ink = renderer.drawCentered(result, rect, text, rgb);
    LOG_DEBUG("Drew '{}' at ({}, {}) {}x{} size={} font={}",
              text, ink.x, ink.y, ink.width, ink.height, font_size,
              font_path.empty() ? "<hershey>" : font_path);
    return result;
}

} // namespace picmod
