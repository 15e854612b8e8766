#include "detection/db_postprocess.h"
#include "common/geometry.h"
#include "common/logger.hpp"
#include <algorithm>
#include <cmath>

namespace picmod {

DBPostProcessor::DBPostProcessor(float thresh,
                                 float box_thresh,
                                 int max_candidates,
                                 float unclip_ratio)
    : thresh_(thresh),
      box_thresh_(box_thresh),
      max_candidates_(max_candidates),
      unclip_ratio_(unclip_ratio) {
}

std::vector<TextBox> DBPostProcessor::process(const cv::Mat& pred,
                                              int src_h, int src_w,
                                              int padded_h, int padded_w) const {
    std::vector<TextBox> text_boxes;
    if (pred.empty() || pred.type() != CV_32FC1) {
        LOG_ERROR("DB postprocess expects a non-empty CV_32FC1 map");
        return text_boxes;
    }

    if (padded_h <= 0) padded_h = src_h;
    if (padded_w <= 0) padded_w = src_w;

    // 二值化
    cv::Mat bitmap;
    cv::threshold(pred, bitmap, thresh_, 255, cv::THRESH_BINARY);
    bitmap.convertTo(bitmap, CV_8UC1);

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(bitmap, contours, cv::RETR_LIST, cv::CHAIN_APPROX_SIMPLE);
    LOG_DEBUG("DB: {} contours above thresh {:.2f}", contours.size(), thresh_);

    // 预测图坐标 -> 补边空间（即原图坐标，补边只在右/下方）
    float scale_x = static_cast<float>(padded_w) / pred.cols;
    float scale_y = static_cast<float>(padded_h) / pred.rows;

    int num_contours = std::min(static_cast<int>(contours.size()), max_candidates_);
    for (int i = 0; i < num_contours; i++) {
        const auto& contour = contours[i];
        if (contour.size() < 3) {
            continue;
        }

        float score = boxScoreFast(pred, contour);
        if (score < box_thresh_) {
            continue;
        }

        float min_side = 0.0f;
        auto box = getMinBoxes(contour, min_side);
        if (min_side < 3) {
            continue;
        }

        auto unclipped = unclip(box);
        // 扩展后重新取最小外接矩形并排序
        std::vector<cv::Point> unclipped_int;
        for (const auto& pt : unclipped) {
            unclipped_int.emplace_back(cvRound(pt.x), cvRound(pt.y));
        }
        float expanded_side = 0.0f;
        auto expanded = getMinBoxes(unclipped_int, expanded_side);
        if (expanded_side < 5) {
            continue;
        }

        TextBox text_box;
        for (int j = 0; j < 4; j++) {
            float x = expanded[j].x * scale_x;
            float y = expanded[j].y * scale_y;
            text_box.points[j].x = std::clamp(x, 0.0f, static_cast<float>(src_w));
            text_box.points[j].y = std::clamp(y, 0.0f, static_cast<float>(src_h));
        }
        text_box.confidence = score;
        text_boxes.push_back(text_box);
    }

    LOG_DEBUG("DB: kept {} boxes", text_boxes.size());
    return text_boxes;
}

std::vector<cv::Point2f> DBPostProcessor::getMinBoxes(const std::vector<cv::Point>& contour,
                                                      float& min_side) const {
    cv::RotatedRect rect = cv::minAreaRect(contour);
    min_side = std::min(rect.size.width, rect.size.height);

    cv::Point2f vertices[4];
    rect.points(vertices);
    std::vector<cv::Point2f> box(vertices, vertices + 4);

    return Geometry::orderPointsClockwise(box);
}

float DBPostProcessor::boxScoreFast(const cv::Mat& pred, const std::vector<cv::Point>& contour) const {
    cv::Rect rect = cv::boundingRect(contour) & cv::Rect(0, 0, pred.cols, pred.rows);
    if (rect.empty()) {
        return 0.0f;
    }

    cv::Mat mask = cv::Mat::zeros(rect.size(), CV_8UC1);
    std::vector<cv::Point> local;
    local.reserve(contour.size());
    for (const auto& pt : contour) {
        local.emplace_back(pt.x - rect.x, pt.y - rect.y);
    }
    std::vector<std::vector<cv::Point>> polys = {local};
    cv::fillPoly(mask, polys, cv::Scalar(1));

    return static_cast<float>(cv::mean(pred(rect), mask)[0]);
}

std::vector<cv::Point2f> DBPostProcessor::unclip(const std::vector<cv::Point2f>& box) const {
    float area = polygonArea(box);
    float length = polygonLength(box);
    if (length == 0) {
        return box;
    }

    float distance = area * unclip_ratio_ / length;

    cv::Point2f center(0, 0);
    for (const auto& pt : box) {
        center += pt;
    }
    center.x /= static_cast<float>(box.size());
    center.y /= static_cast<float>(box.size());

    // 对矩形，沿对角线外扩 d*sqrt(2) 约等于各边外扩 d
    std::vector<cv::Point2f> result;
    result.reserve(box.size());
    for (const auto& pt : box) {
        cv::Point2f dir = pt - center;
        float len = std::sqrt(dir.x * dir.x + dir.y * dir.y);
        if (len > 0) {
            dir *= (len + distance * std::sqrt(2.0f)) / len;
        }
        result.push_back(center + dir);
    }
    return result;
}

float DBPostProcessor::polygonArea(const std::vector<cv::Point2f>& box) {
    if (box.size() < 3) {
        return 0.0f;
    }
    float area = 0.0f;
    size_t n = box.size();
    for (size_t i = 0; i < n; i++) {
        size_t j = (i + 1) % n;
        area += box[i].x * box[j].y - box[j].x * box[i].y;
    }
    return std::abs(area) / 2.0f;
}

float DBPostProcessor::polygonLength(const std::vector<cv::Point2f>& box) {
    float length = 0.0f;
    size_t n = box.size();
    for (size_t i = 0; i < n; i++) {
        size_t j = (i + 1) % n;
        length += Geometry::distance(box[i], box[j]);
    }
    return length;
}

} // namespace picmod
