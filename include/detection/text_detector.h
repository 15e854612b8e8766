#pragma once

#include <dxrt/dxrt_api.h>
#include <opencv2/opencv.hpp>
#include <memory>
#include <string>
#include <vector>

#include "common/logger.hpp"
#include "common/types.hpp"

namespace picmod {

class DBPostProcessor;

/**
 * Text Detector Configuration
 * PP-OCR DBNet, one model per input resolution
 */
struct DetectorConfig {
    float thresh = 0.3f;          // Binary threshold
    float boxThresh = 0.6f;       // Box confidence threshold
    float unclipRatio = 1.5f;     // Box expansion ratio
    int maxCandidates = 1000;

    // Either may be empty; at least one must load
    std::string model640Path;
    std::string model960Path;

    // Use 640 if max(w,h) < threshold, else 960
    int sizeThreshold = 800;

    /**
     * @brief 按文件名从 det 目录中选择模型
     *
     * Files whose name contains "640" / "960" fill the matching slot; a lone
     * model without a size tag is used as the 640 model.
     */
    static DetectorConfig FromModelDir(const std::string& dir);

    void Show() const;
};

/**
 * Text Detector
 * Detects text regions in images on the DEEPX runtime
 */
class TextDetector {
public:
    explicit TextDetector(const DetectorConfig& config);
    ~TextDetector();

    /**
     * @brief Load models
     * @return true if at least one model loaded
     */
    bool init();

    /**
     * @brief Detect text boxes
     * @param image BGR image
     * @return Boxes in image coordinates, empty on failure
     */
    std::vector<TextBox> detect(const cv::Mat& image);

private:
    dxrt::InferenceEngine* selectModel(int height, int width, int& target_size);

    /**
     * @brief Pad to square with gray on the right/bottom, then resize
     */
    cv::Mat preprocess(const cv::Mat& image, int target_size, int& padded_h, int& padded_w);

    cv::Mat runInference(dxrt::InferenceEngine* engine, const cv::Mat& input);

private:
    DetectorConfig config_;
    std::unique_ptr<dxrt::InferenceEngine> model640_;
    std::unique_ptr<dxrt::InferenceEngine> model960_;
    std::unique_ptr<DBPostProcessor> postprocessor_;
    bool initialized_ = false;
};

} // namespace picmod
