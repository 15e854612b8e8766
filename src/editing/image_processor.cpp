#include "editing/image_processor.h"
#include "common/logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace picmod {

cv::Mat ImageProcessor::verticalDeleteAndStitch(const cv::Mat& image, const SelectionRect& selection) {
    if (image.empty()) {
        return cv::Mat();
    }

    SelectionRect sel = selection.normalized();
    int height = image.rows;
    int y1 = std::clamp(sel.y1, 0, height);
    int y2 = std::clamp(sel.y2, 0, height);

    if (y1 >= y2) {
        return image.clone();
    }

    int bottom_rows = height - y2;
    int new_height = y1 + bottom_rows;
    if (new_height <= 0) {
        LOG_WARN("Stitch would remove every row, keeping image unchanged");
        return image.clone();
    }

    cv::Mat result(new_height, image.cols, image.type());
    if (y1 > 0) {
        image.rowRange(0, y1).copyTo(result.rowRange(0, y1));
    }
    if (bottom_rows > 0) {
        image.rowRange(y2, height).copyTo(result.rowRange(y1, new_height));
    }

    LOG_DEBUG("Stitch: removed rows [{}, {}), {}x{} -> {}x{}",
              y1, y2, image.cols, height, result.cols, result.rows);
    return result;
}

std::vector<cv::Vec3b> ImageProcessor::borderPixels(const cv::Mat& image, const cv::Rect& rect) {
    std::vector<cv::Vec3b> pixels;
    int x1 = rect.x, y1 = rect.y;
    int x2 = rect.x + rect.width, y2 = rect.y + rect.height;

    // 上边界
    if (y1 > 0) {
        for (int x = x1; x < x2; x++) pixels.push_back(image.at<cv::Vec3b>(y1 - 1, x));
    }
    // 下边界
    if (y2 < image.rows) {
        for (int x = x1; x < x2; x++) pixels.push_back(image.at<cv::Vec3b>(y2, x));
    }
    // 左边界
    if (x1 > 0) {
        for (int y = y1; y < y2; y++) pixels.push_back(image.at<cv::Vec3b>(y, x1 - 1));
    }
    // 右边界
    if (x2 < image.cols) {
        for (int y = y1; y < y2; y++) pixels.push_back(image.at<cv::Vec3b>(y, x2));
    }
    return pixels;
}

cv::Mat ImageProcessor::smartFill(const cv::Mat& image,
                                  const SelectionRect& selection,
                                  FillMode mode,
                                  const std::optional<cv::Vec3b>& color,
                                  double inpaint_radius) {
    if (image.empty()) {
        return cv::Mat();
    }
    if (image.type() != CV_8UC3) {
        throw std::invalid_argument("smartFill expects an 8-bit BGR image");
    }

    cv::Rect rect = selection.normalized().clampedTo(image.cols, image.rows).toRect();
    if (rect.empty()) {
        return image.clone();
    }

    cv::Mat result = image.clone();

    switch (mode) {
    case FillMode::Inpaint: {
        cv::Mat mask = cv::Mat::zeros(image.size(), CV_8UC1);
        mask(rect).setTo(255);
        return inpaintMask(image, mask, inpaint_radius, cv::INPAINT_TELEA);
    }

    case FillMode::Average: {
        auto pixels = borderPixels(image, rect);
        if (pixels.empty()) {
            LOG_DEBUG("Average fill: no border pixels, image unchanged");
            return result;
        }
        cv::Vec3d sum(0, 0, 0);
        for (const auto& p : pixels) {
            sum += cv::Vec3d(p[0], p[1], p[2]);
        }
        double n = static_cast<double>(pixels.size());
        // Truncate like an integer cast of the mean
        cv::Vec3b avg(static_cast<uchar>(sum[0] / n),
                      static_cast<uchar>(sum[1] / n),
                      static_cast<uchar>(sum[2] / n));
        result(rect).setTo(cv::Scalar(avg[0], avg[1], avg[2]));
        return result;
    }

    case FillMode::Median: {
        auto pixels = borderPixels(image, rect);
        if (pixels.empty()) {
            LOG_DEBUG("Median fill: no border pixels, image unchanged");
            return result;
        }
        cv::Vec3b med;
        for (int c = 0; c < 3; c++) {
            std::vector<int> channel;
            channel.reserve(pixels.size());
            for (const auto& p : pixels) {
                channel.push_back(p[c]);
            }
            std::sort(channel.begin(), channel.end());
            size_t n = channel.size();
            double m = (n % 2 == 1) ? channel[n / 2]
                                    : (channel[n / 2 - 1] + channel[n / 2]) / 2.0;
            med[c] = static_cast<uchar>(m);
        }
        result(rect).setTo(cv::Scalar(med[0], med[1], med[2]));
        return result;
    }

    case FillMode::Color: {
        cv::Vec3b rgb = color.value_or(cv::Vec3b(255, 255, 255));
        // RGB -> BGR
        result(rect).setTo(cv::Scalar(rgb[2], rgb[1], rgb[0]));
        return result;
    }
    }

    return result;
}

cv::Mat ImageProcessor::inpaintMask(const cv::Mat& image,
                                    const cv::Mat& mask,
                                    double radius,
                                    int method) {
    if (image.empty()) {
        return cv::Mat();
    }
    if (mask.size() != image.size() || mask.type() != CV_8UC1) {
        throw std::invalid_argument("inpaint mask must be CV_8UC1 and match the image size");
    }
    if (cv::countNonZero(mask) == 0) {
        return image.clone();
    }

    cv::Mat result;
    cv::inpaint(image, mask, result, radius, method);
    return result;
}

FillMode ImageProcessor::parseFillMode(const std::string& name) {
    if (name == "inpaint") return FillMode::Inpaint;
    if (name == "average") return FillMode::Average;
    if (name == "median") return FillMode::Median;
    if (name == "color") return FillMode::Color;
    throw std::invalid_argument("Unknown fill mode: " + name);
}

std::string ImageProcessor::fillModeName(FillMode mode) {
    switch (mode) {
    case FillMode::Inpaint: return "inpaint";
    case FillMode::Average: return "average";
    case FillMode::Median: return "median";
    case FillMode::Color: return "color";
    }
    return "inpaint";
}

} // namespace picmod
