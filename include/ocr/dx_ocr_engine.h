#pragma once

#include <memory>
#include <mutex>

#include "classification/text_classifier.h"
#include "detection/text_detector.h"
#include "ocr/model_locator.h"
#include "ocr/ocr_engine.h"
#include "recognition/text_recognizer.h"

namespace picmod {

/**
 * @brief DEEPX NPU OCR 引擎
 *
 * Detection -> optional 180 degree line classification -> recognition,
 * one image at a time. Models are located with ModelLocator under
 * OcrConfig::modelRoot.
 */
class DxOcrEngine : public OcrEngine {
public:
    explicit DxOcrEngine(const OcrConfig& config);
    ~DxOcrEngine() override;

    bool initialize() override;
    bool isAvailable() const override { return available_; }
    std::vector<TextBox> recognize(const cv::Mat& image) override;
    std::string name() const override { return "dxrt"; }

private:
    OcrConfig config_;
    std::unique_ptr<TextDetector> detector_;
    std::unique_ptr<TextClassifier> classifier_;
    std::unique_ptr<TextRecognizer> recognizer_;
    bool available_ = false;

    // dxrt engines are not shared between concurrent Run() calls
    std::mutex run_mutex_;
};

} // namespace picmod
