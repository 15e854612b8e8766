#include "ocr/dx_ocr_engine.h"
#include "common/geometry.h"
#include "common/logger.hpp"

namespace picmod {

DxOcrEngine::DxOcrEngine(const OcrConfig& config)
    : config_(config) {
}

DxOcrEngine::~DxOcrEngine() = default;

bool DxOcrEngine::initialize() {
    if (available_) {
        return true;
    }

    ModelLocator locator(config_.modelRoot);
    ModelPaths paths = locator.locate();
    if (!paths.complete()) {
        locator.logExpectedLayout();
        return false;
    }

    DetectorConfig det_config = DetectorConfig::FromModelDir(paths.detDir);
    det_config.thresh = config_.detThresh;
    det_config.boxThresh = config_.detBoxThresh;
    det_config.unclipRatio = config_.unclipRatio;
    det_config.maxCandidates = config_.maxCandidates;
    det_config.sizeThreshold = config_.detSizeThreshold;
    LOG_DEBUG_EXEC([&] { det_config.Show(); });

    auto detector = std::make_unique<TextDetector>(det_config);
    if (!detector->init()) {
        return false;
    }

    RecognizerConfig rec_config = RecognizerConfig::FromModelDir(paths.recDir, paths.dictPath);
    rec_config.confThreshold = config_.recScoreThresh;
    rec_config.inputHeight = config_.recInputHeight;
    LOG_DEBUG_EXEC([&] { rec_config.Show(); });

    auto recognizer = std::make_unique<TextRecognizer>(rec_config);
    if (!recognizer->Initialize()) {
        return false;
    }

    // 方向分类器可选，加载失败只降级
    if (config_.useClassifier && !paths.clsDir.empty()) {
        ClassifierConfig cls_config = ClassifierConfig::FromModelDir(paths.clsDir);
        cls_config.threshold = config_.clsThresh;
        auto classifier = std::make_unique<TextClassifier>(cls_config);
        if (classifier->Initialize()) {
            classifier_ = std::move(classifier);
        } else {
            LOG_WARN("Text line classifier unavailable, continuing without it");
        }
    }

    detector_ = std::move(detector);
    recognizer_ = std::move(recognizer);
    available_ = true;
    LOG_INFO("DxOcrEngine ready (classifier: {})", classifier_ ? "on" : "off");
    return true;
}

std::vector<TextBox> DxOcrEngine::recognize(const cv::Mat& image) {
    std::vector<TextBox> results;
    if (!available_ || image.empty()) {
        return results;
    }

    std::lock_guard<std::mutex> lock(run_mutex_);

    auto boxes = detector_->detect(image);
    for (auto& box : boxes) {
        cv::Mat crop = Geometry::cropTextRegion(image, box.quad(), config_.recInputHeight);
        if (crop.empty()) {
            continue;
        }

        if (classifier_) {
            auto [label, score] = classifier_->Classify(crop);
            if (classifier_->NeedsRotation(label, score)) {
                cv::rotate(crop, crop, cv::ROTATE_180);
                box.rotated = true;
            }
        }

        auto [text, confidence] = recognizer_->Recognize(crop);
        if (text.empty()) {
            continue;
        }
        box.text = text;
        box.confidence = confidence;
        results.push_back(box);
    }

    LOG_DEBUG("DxOcrEngine: {} detected, {} recognized", boxes.size(), results.size());
    return results;
}

} // namespace picmod
