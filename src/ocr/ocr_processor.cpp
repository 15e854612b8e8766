#include "ocr/ocr_processor.h"
#include "common/geometry.h"
#include "common/logger.hpp"
#include <algorithm>

namespace picmod {

OcrProcessor::OcrProcessor(std::unique_ptr<OcrEngine> engine)
    : engine_(std::move(engine)) {
}

bool OcrProcessor::initialize() {
    if (!engine_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(init_mutex_);
    if (engine_->isAvailable()) {
        return true;
    }
    if (init_attempted_) {
        return false;
    }
    init_attempted_ = true;

    try {
        return engine_->initialize();
    } catch (const std::exception& e) {
        LOG_ERROR("OCR engine '{}' failed to initialize: {}", engine_->name(), e.what());
        return false;
    }
}

bool OcrProcessor::isAvailable() const {
    return engine_ && engine_->isAvailable();
}

std::string OcrProcessor::engineName() const {
    return engine_ ? engine_->name() : "none";
}

std::vector<TextBox> OcrProcessor::runEngine(const cv::Mat& image) {
    if (!isAvailable() || image.empty()) {
        return {};
    }

    std::vector<TextBox> boxes;
    try {
        boxes = engine_->recognize(image);
    } catch (const std::exception& e) {
        LOG_ERROR("OCR failed: {}", e.what());
        return {};
    }

    boxes.erase(std::remove_if(boxes.begin(), boxes.end(),
                               [](const TextBox& b) { return b.text.empty(); }),
                boxes.end());
    return boxes;
}

std::vector<TextBox> OcrProcessor::recognize(const cv::Mat& image) {
    auto boxes = runEngine(image);
    Geometry::sortReadingOrder(boxes);
    return boxes;
}

std::vector<TextBox> OcrProcessor::recognizeRegion(const cv::Mat& image, const SelectionRect& selection) {
    if (image.empty()) {
        return {};
    }

    cv::Rect roi = selection.normalized().clampedTo(image.cols, image.rows).toRect();
    if (roi.empty()) {
        LOG_WARN("OCR region is empty after clamping");
        return {};
    }

    auto boxes = runEngine(image(roi).clone());

    // 区域坐标 -> 原图坐标
    for (auto& box : boxes) {
        box.Translate(static_cast<float>(roi.x), static_cast<float>(roi.y));
    }

    Geometry::sortReadingOrder(boxes);
    LOG_INFO("OCR: {} text lines in region ({}, {}, {}x{})",
             boxes.size(), roi.x, roi.y, roi.width, roi.height);
    return boxes;
}

} // namespace picmod
