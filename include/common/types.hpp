#pragma once

#include <opencv2/opencv.hpp>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

namespace picmod {

/**
 * Axis-aligned selection in image pixels.
 * Half-open: covers columns [x1, x2) and rows [y1, y2).
 */
struct SelectionRect {
    int x1 = 0;
    int y1 = 0;
    int x2 = 0;
    int y2 = 0;

    SelectionRect() = default;
    SelectionRect(int ax1, int ay1, int ax2, int ay2)
        : x1(ax1), y1(ay1), x2(ax2), y2(ay2) {}

    int width() const { return std::abs(x2 - x1); }
    int height() const { return std::abs(y2 - y1); }
    bool empty() const { return x1 >= x2 || y1 >= y2; }

    // Corner order fixed so that x1 <= x2 and y1 <= y2
    SelectionRect normalized() const {
        return SelectionRect(std::min(x1, x2), std::min(y1, y2),
                             std::max(x1, x2), std::max(y1, y2));
    }

    // Every coordinate clipped into [0, w] x [0, h]
    SelectionRect clampedTo(int w, int h) const {
        return SelectionRect(std::clamp(x1, 0, w), std::clamp(y1, 0, h),
                             std::clamp(x2, 0, w), std::clamp(y2, 0, h));
    }

    cv::Rect toRect() const {
        SelectionRect n = normalized();
        return cv::Rect(n.x1, n.y1, n.x2 - n.x1, n.y2 - n.y1);
    }

    bool operator==(const SelectionRect& o) const {
        return x1 == o.x1 && y1 == o.y1 && x2 == o.x2 && y2 == o.y2;
    }
    bool operator!=(const SelectionRect& o) const { return !(*this == o); }
};

/**
 * Text bounding box with recognition result
 */
struct TextBox {
    // Quad, clockwise from top-left
    cv::Point2f points[4];

    std::string text;
    float confidence = 0.0f;

    // Line classifier decided the crop was upside down
    bool rotated = false;

    // Reading-order index after sorting (-1 = unsorted)
    int index = -1;

    TextBox() {
        for (int i = 0; i < 4; i++) {
            points[i] = cv::Point2f(0, 0);
        }
    }

    static TextBox FromRect(const cv::Rect& rect) {
        TextBox box;
        box.points[0] = cv::Point2f(rect.x, rect.y);
        box.points[1] = cv::Point2f(rect.x + rect.width, rect.y);
        box.points[2] = cv::Point2f(rect.x + rect.width, rect.y + rect.height);
        box.points[3] = cv::Point2f(rect.x, rect.y + rect.height);
        return box;
    }

    std::vector<cv::Point2f> quad() const {
        return std::vector<cv::Point2f>(points, points + 4);
    }

    // Integer bounding rectangle (floor of min corner, ceil of max corner)
    cv::Rect GetRect() const {
        float min_x = points[0].x, max_x = points[0].x;
        float min_y = points[0].y, max_y = points[0].y;

        for (int i = 1; i < 4; i++) {
            min_x = std::min(min_x, points[i].x);
            max_x = std::max(max_x, points[i].x);
            min_y = std::min(min_y, points[i].y);
            max_y = std::max(max_y, points[i].y);
        }

        cv::Point tl(static_cast<int>(std::floor(min_x)), static_cast<int>(std::floor(min_y)));
        cv::Point br(static_cast<int>(std::ceil(max_x)), static_cast<int>(std::ceil(max_y)));
        return cv::Rect(tl, br);
    }

    cv::Point2f GetCenter() const {
        cv::Point2f c(0, 0);
        for (int i = 0; i < 4; i++) {
            c += points[i];
        }
        return cv::Point2f(c.x / 4.0f, c.y / 4.0f);
    }

    void Translate(float dx, float dy) {
        for (int i = 0; i < 4; i++) {
            points[i].x += dx;
            points[i].y += dy;
        }
    }
};

/**
 * Font appearance estimated from an existing text region
 */
struct FontFeatures {
    int fontSize = 24;
    cv::Vec3b fontColor = cv::Vec3b(0, 0, 0);   // RGB
    bool isBold = false;
    int charSpacing = 2;
    std::optional<cv::Rect> bbox;
};

/**
 * Caller-supplied font choice. Unset fields fall back to matched values.
 */
struct FontParams {
    std::string fontPath;
    std::string fontName;
    int fontSize = 0;                           // 0 = unspecified
    std::optional<cv::Vec3b> fontColor;         // RGB
};

/**
 * Background fill strategies for a selected region
 */
enum class FillMode {
    Inpaint,
    Average,
    Median,
    Color
};

} // namespace picmod
