#pragma once

#include <gmock/gmock.h>
#include "ocr/ocr_engine.h"

namespace picmod {
namespace testing_support {

class MockOcrEngine : public OcrEngine {
public:
    MOCK_METHOD(bool, initialize, (), (override));
    MOCK_METHOD(bool, isAvailable, (), (const, override));
    MOCK_METHOD(std::vector<TextBox>, recognize, (const cv::Mat& image), (override));
    MOCK_METHOD(std::string, name, (), (const, override));
};

inline TextBox MakeBox(const cv::Rect& rect, const std::string& text, float confidence = 0.9f) {
    TextBox box = TextBox::FromRect(rect);
    box.text = text;
    box.confidence = confidence;
    return box;
}

} // namespace testing_support
} // namespace picmod
