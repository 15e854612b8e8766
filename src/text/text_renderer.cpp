#include "text/text_renderer.h"
#include "text/utf8.h"
#include "common/logger.hpp"

#include <ft2build.h>
#include FT_FREETYPE_H

#include <algorithm>
#include <climits>

namespace picmod {

TextRenderer::TextRenderer() {
    if (FT_Init_FreeType(&library_) != 0) {
        LOG_ERROR("FT_Init_FreeType failed, using Hershey font only");
        library_ = nullptr;
    }
}

TextRenderer::~TextRenderer() {
    releaseFace();
    if (library_) {
        FT_Done_FreeType(library_);
    }
}

void TextRenderer::releaseFace() {
    if (face_) {
        FT_Done_Face(face_);
        face_ = nullptr;
    }
}

bool TextRenderer::loadFont(const std::string& font_path, int pixel_size) {
    releaseFace();
    pixel_size_ = std::max(1, pixel_size);

    if (!library_ || font_path.empty()) {
        return false;
    }

    FT_Error err = FT_New_Face(library_, font_path.c_str(), 0, &face_);
    if (err != 0) {
        LOG_WARN("Cannot load font {} (FreeType error {}), using Hershey font", font_path, err);
        face_ = nullptr;
        return false;
    }

    err = FT_Set_Pixel_Sizes(face_, 0, static_cast<FT_UInt>(pixel_size_));
    if (err != 0) {
        LOG_WARN("Font {} does not support size {} (FreeType error {})", font_path, pixel_size_, err);
        releaseFace();
        return false;
    }

    LOG_TRACE("Loaded font {} at {}px", font_path, pixel_size_);
    return true;
}

std::string TextRenderer::toAscii(const std::string& text) const {
    std::string out;
    for (char32_t cp : DecodeUtf8(text)) {
        out.push_back((cp >= 0x20 && cp < 0x7F) ? static_cast<char>(cp) : '?');
    }
    return out;
}

double TextRenderer::hersheyScale() const {
    return cv::getFontScaleFromHeight(cv::FONT_HERSHEY_SIMPLEX, pixel_size_, 1);
}

cv::Rect TextRenderer::measure(const std::string& text) const {
    if (text.empty()) {
        return cv::Rect();
    }

    if (!face_) {
        int baseline = 0;
        cv::Size size = cv::getTextSize(toAscii(text), cv::FONT_HERSHEY_SIMPLEX,
                                        hersheyScale(), 1, &baseline);
        return cv::Rect(0, -size.height, size.width, size.height + baseline);
    }

    int pen_x = 0;
    int min_x = INT_MAX, min_y = INT_MAX, max_x = INT_MIN, max_y = INT_MIN;
    FT_UInt prev = 0;
    bool use_kerning = FT_HAS_KERNING(face_);

    for (char32_t cp : DecodeUtf8(text)) {
        FT_UInt index = FT_Get_Char_Index(face_, cp);
        if (use_kerning && prev && index) {
            FT_Vector delta;
            FT_Get_Kerning(face_, prev, index, FT_KERNING_DEFAULT, &delta);
            pen_x += static_cast<int>(delta.x >> 6);
        }
        if (FT_Load_Glyph(face_, index, FT_LOAD_RENDER) != 0) {
            continue;
        }
        FT_GlyphSlot slot = face_->glyph;
        if (slot->bitmap.width > 0 && slot->bitmap.rows > 0) {
            int x0 = pen_x + slot->bitmap_left;
            int y0 = -slot->bitmap_top;
            min_x = std::min(min_x, x0);
            min_y = std::min(min_y, y0);
            max_x = std::max(max_x, x0 + static_cast<int>(slot->bitmap.width));
            max_y = std::max(max_y, y0 + static_cast<int>(slot->bitmap.rows));
        }
        pen_x += static_cast<int>(slot->advance.x >> 6);
        prev = index;
    }

    if (min_x == INT_MAX) {
        // 只有空白字符
        int ascender = static_cast<int>(face_->size->metrics.ascender >> 6);
        return cv::Rect(0, -ascender, pen_x, ascender);
    }
    return cv::Rect(min_x, min_y, max_x - min_x, max_y - min_y);
}

void TextRenderer::draw(cv::Mat& image, const std::string& text, cv::Point origin, const cv::Scalar& color) const {
    if (image.empty() || text.empty()) {
        return;
    }
    CV_Assert(image.type() == CV_8UC3);

    if (!face_) {
        cv::putText(image, toAscii(text), origin, cv::FONT_HERSHEY_SIMPLEX,
                    hersheyScale(), color, 1, cv::LINE_AA);
        return;
    }

    int pen_x = origin.x;
    FT_UInt prev = 0;
    bool use_kerning = FT_HAS_KERNING(face_);

    for (char32_t cp : DecodeUtf8(text)) {
        FT_UInt index = FT_Get_Char_Index(face_, cp);
        if (use_kerning && prev && index) {
            FT_Vector delta;
            FT_Get_Kerning(face_, prev, index, FT_KERNING_DEFAULT, &delta);
            pen_x += static_cast<int>(delta.x >> 6);
        }
        if (FT_Load_Glyph(face_, index, FT_LOAD_RENDER) != 0) {
            continue;
        }

        FT_GlyphSlot slot = face_->glyph;
        const FT_Bitmap& bmp = slot->bitmap;
        int gx = pen_x + slot->bitmap_left;
        int gy = origin.y - slot->bitmap_top;

        // 按覆盖率做 alpha 混合
        for (unsigned int row = 0; row < bmp.rows; row++) {
            int y = gy + static_cast<int>(row);
            if (y < 0 || y >= image.rows) continue;
            const unsigned char* src = bmp.buffer + row * bmp.pitch;
            cv::Vec3b* dst = image.ptr<cv::Vec3b>(y);
            for (unsigned int col = 0; col < bmp.width; col++) {
                int x = gx + static_cast<int>(col);
                if (x < 0 || x >= image.cols) continue;
                unsigned char coverage = src[col];
                if (coverage == 0) continue;
                float a = coverage / 255.0f;
                for (int c = 0; c < 3; c++) {
                    dst[x][c] = cv::saturate_cast<uchar>(dst[x][c] * (1.0f - a) + color[c] * a);
                }
            }
        }

        pen_x += static_cast<int>(slot->advance.x >> 6);
        prev = index;
    }
}

cv::Rect TextRenderer::drawCentered(cv::Mat& image, const cv::Rect& rect,
                                    const std::string& text, const cv::Vec3b& rgb) const {
    cv::Rect ink = measure(text);
    if (ink.empty()) {
        return cv::Rect();
    }

    cv::Point origin(rect.x + (rect.width - ink.width) / 2 - ink.x,
                     rect.y + (rect.height - ink.height) / 2 - ink.y);
    draw(image, text, origin, cv::Scalar(rgb[2], rgb[1], rgb[0]));

    return cv::Rect(origin.x + ink.x, origin.y + ink.y, ink.width, ink.height);
}

} // namespace picmod
