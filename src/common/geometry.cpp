#include "common/geometry.h"
#include <algorithm>
#include <cmath>

namespace picmod {

float Geometry::distance(const cv::Point2f& p1, const cv::Point2f& p2) {
    float dx = p1.x - p2.x;
    float dy = p1.y - p2.y;
    return std::sqrt(dx * dx + dy * dy);
}

std::vector<cv::Point2f> Geometry::orderPointsClockwise(const std::vector<cv::Point2f>& points) {
    if (points.size() != 4) {
        return points;
    }

    std::vector<cv::Point2f> pts = points;

    // 计算中心点
    cv::Point2f center(0, 0);
    for (const auto& pt : pts) {
        center += pt;
    }
    center.x /= 4;
    center.y /= 4;

    // 按照与中心点的角度排序（图像坐标系下即顺时针）
    std::sort(pts.begin(), pts.end(), [&center](const cv::Point2f& a, const cv::Point2f& b) {
        return std::atan2(a.y - center.y, a.x - center.x) <
               std::atan2(b.y - center.y, b.x - center.x);
    });

    // 左上角（x+y最小）放在第一个位置
    int top_left_idx = 0;
    float min_sum = pts[0].x + pts[0].y;
    for (int i = 1; i < 4; i++) {
        float sum = pts[i].x + pts[i].y;
        if (sum < min_sum) {
            min_sum = sum;
            top_left_idx = i;
        }
    }

    std::vector<cv::Point2f> ordered;
    for (int i = 0; i < 4; i++) {
        ordered.push_back(pts[(top_left_idx + i) % 4]);
    }
    return ordered;
}

cv::Mat Geometry::cropTextRegion(const cv::Mat& image,
                                 const std::vector<cv::Point2f>& box,
                                 int dst_height) {
    if (box.size() != 4 || image.empty()) {
        return cv::Mat();
    }

    std::vector<cv::Point2f> ordered_pts = orderPointsClockwise(box);

    float max_width = std::max(distance(ordered_pts[0], ordered_pts[1]),
                               distance(ordered_pts[2], ordered_pts[3]));
    float max_height = std::max(distance(ordered_pts[0], ordered_pts[3]),
                                distance(ordered_pts[1], ordered_pts[2]));
    if (max_width < 1.0f || max_height < 1.0f) {
        return cv::Mat();
    }

    int dst_width = std::max(1, static_cast<int>(max_width * dst_height / max_height));

    std::vector<cv::Point2f> dst_pts = {
        cv::Point2f(0, 0),
        cv::Point2f(dst_width - 1, 0),
        cv::Point2f(dst_width - 1, dst_height - 1),
        cv::Point2f(0, dst_height - 1)
    };

    cv::Mat M = cv::getPerspectiveTransform(ordered_pts, dst_pts);
    cv::Mat warped;
    cv::warpPerspective(image, warped, M, cv::Size(dst_width, dst_height),
                        cv::INTER_CUBIC, cv::BORDER_REPLICATE);
    return warped;
}

cv::Rect Geometry::clampRect(const cv::Rect& rect, const cv::Size& bounds) {
    return rect & cv::Rect(0, 0, bounds.width, bounds.height);
}

cv::Rect Geometry::paddedBoxRect(const TextBox& box, int padding, const cv::Size& bounds) {
    cv::Rect r = clampRect(box.GetRect(), bounds);
    if (r.empty()) {
        return r;
    }
    r.x -= padding;
    r.y -= padding;
    r.width += 2 * padding;
    r.height += 2 * padding;
    return clampRect(r, bounds);
}

bool Geometry::isBoxInside(const TextBox& box, const SelectionRect& selection) {
    SelectionRect sel = selection.normalized();
    for (const auto& pt : box.points) {
        if (pt.x < sel.x1 || pt.x > sel.x2 || pt.y < sel.y1 || pt.y > sel.y2) {
            return false;
        }
    }
    return true;
}

void Geometry::sortReadingOrder(std::vector<TextBox>& boxes) {
    std::stable_sort(boxes.begin(), boxes.end(), [](const TextBox& a, const TextBox& b) {
        return a.GetCenter().y < b.GetCenter().y;
    });

    // 分行：与当前行首框的中心Y差小于半个行高则视为同一行
    std::vector<TextBox> ordered;
    ordered.reserve(boxes.size());
    size_t row_start = 0;
    while (row_start < boxes.size()) {
        const TextBox& head = boxes[row_start];
        size_t row_end = row_start + 1;
        while (row_end < boxes.size()) {
            float threshold = std::min(head.GetRect().height, boxes[row_end].GetRect().height) * 0.5f;
            if (std::abs(boxes[row_end].GetCenter().y - head.GetCenter().y) >= threshold) {
                break;
            }
            row_end++;
        }

        std::stable_sort(boxes.begin() + row_start, boxes.begin() + row_end,
                         [](const TextBox& a, const TextBox& b) {
                             return a.GetCenter().x < b.GetCenter().x;
                         });
        for (size_t i = row_start; i < row_end; ++i) {
            ordered.push_back(boxes[i]);
        }
        row_start = row_end;
    }

    for (size_t i = 0; i < ordered.size(); ++i) {
        ordered[i].index = static_cast<int>(i);
    }
    boxes = std::move(ordered);
}

} // namespace picmod
