#include "common/visualizer.h"
#include "common/logger.hpp"
#include "text/text_renderer.h"

namespace picmod {

namespace {

std::vector<cv::Point> toIntPoints(const TextBox& box) {
    std::vector<cv::Point> pts;
    for (int i = 0; i < 4; i++) {
        pts.push_back(cv::Point(cvRound(box.points[i].x), cvRound(box.points[i].y)));
    }
    return pts;
}

} // namespace

cv::Scalar Visualizer::paletteColor(size_t i) {
    static const cv::Scalar palette[] = {
        cv::Scalar(0, 200, 0), cv::Scalar(0, 128, 255), cv::Scalar(255, 64, 0),
        cv::Scalar(200, 0, 200), cv::Scalar(0, 200, 200), cv::Scalar(128, 0, 255),
    };
    return palette[i % (sizeof(palette) / sizeof(palette[0]))];
}

cv::Mat Visualizer::drawOCRResults(const cv::Mat& image,
                                   const std::vector<TextBox>& boxes,
                                   const std::string& font_path) {
    if (image.empty()) {
        return cv::Mat();
    }
    cv::Mat vis = image.clone();

    TextRenderer renderer;
    renderer.loadFont(font_path, 16);

    for (size_t i = 0; i < boxes.size(); i++) {
        const auto& box = boxes[i];
        cv::Scalar color = paletteColor(i);

        std::vector<std::vector<cv::Point>> contours = {toIntPoints(box)};
        cv::polylines(vis, contours, true, color, 2);

        // 标签：[序号] 文本 (置信度)
        int index = box.index >= 0 ? box.index : static_cast<int>(i);
        std::string label = cv::format("[%d] ", index) + box.text;
        if (box.confidence > 0) {
            label += cv::format(" (%.2f)", box.confidence);
        }

        cv::Rect ink = renderer.measure(label);
        cv::Rect rect = box.GetRect();
        cv::Point origin(rect.x, std::max(ink.height, rect.y - 4));

        // 文本背景
        cv::Rect bg(origin.x + ink.x - 1, origin.y + ink.y - 1, ink.width + 2, ink.height + 2);
        bg &= cv::Rect(0, 0, vis.cols, vis.rows);
        if (!bg.empty()) {
            vis(bg).setTo(cv::Scalar(0, 0, 0));
        }
        renderer.draw(vis, label, origin, cv::Scalar(255, 255, 255));
    }

    LOG_DEBUG("Visualized {} OCR results", boxes.size());
    return vis;
}

cv::Mat Visualizer::drawSelection(const cv::Mat& image,
                                  const SelectionRect& selection,
                                  const cv::Scalar& color) {
    cv::Mat vis = image.clone();
    cv::Rect r = selection.normalized().clampedTo(image.cols, image.rows).toRect();
    if (r.empty()) {
        return vis;
    }

    // 虚线边框，线段长 6 像素
    const int dash = 6;
    auto dashed = [&](cv::Point a, cv::Point b) {
        double len = cv::norm(b - a);
        int steps = std::max(1, static_cast<int>(len / dash));
        for (int s = 0; s < steps; s += 2) {
            cv::Point p1 = a + (b - a) * (static_cast<double>(s) / steps);
            cv::Point p2 = a + (b - a) * (std::min(s + 1, steps) / static_cast<double>(steps));
            cv::line(vis, p1, p2, color, 2);
        }
    };

    cv::Point tl(r.x, r.y), tr(r.x + r.width - 1, r.y);
    cv::Point br(r.x + r.width - 1, r.y + r.height - 1), bl(r.x, r.y + r.height - 1);
    dashed(tl, tr);
    dashed(tr, br);
    dashed(br, bl);
    dashed(bl, tl);
    return vis;
}

} // namespace picmod
