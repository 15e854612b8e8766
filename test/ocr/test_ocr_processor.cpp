/**
 * @file test_ocr_processor.cpp
 * @brief OCR 处理器测试（使用 mock 引擎）
 */

#include <gtest/gtest.h>
#include <stdexcept>
#include "ocr/ocr_processor.h"
#include "mock_ocr_engine.h"

using namespace picmod;
using picmod::testing_support::MakeBox;
using picmod::testing_support::MockOcrEngine;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

namespace {

std::unique_ptr<NiceMock<MockOcrEngine>> availableEngine() {
    auto engine = std::make_unique<NiceMock<MockOcrEngine>>();
    ON_CALL(*engine, isAvailable()).WillByDefault(Return(true));
    ON_CALL(*engine, name()).WillByDefault(Return("mock"));
    return engine;
}

} // namespace

// ==================== 初始化 测试 ====================

TEST(OcrProcessor, NullEngine_Unavailable) {
    OcrProcessor processor(nullptr);

    EXPECT_FALSE(processor.initialize());
    EXPECT_FALSE(processor.isAvailable());
    EXPECT_EQ(processor.engineName(), "none");
    EXPECT_TRUE(processor.recognize(cv::Mat(10, 10, CV_8UC3)).empty());
}

/**
 * @brief 初始化失败后不再重试
 */
TEST(OcrProcessor, Initialize_AttemptedOnce) {
    auto engine = std::make_unique<NiceMock<MockOcrEngine>>();
    ON_CALL(*engine, isAvailable()).WillByDefault(Return(false));
    EXPECT_CALL(*engine, initialize()).Times(1).WillOnce(Return(false));

    OcrProcessor processor(std::move(engine));

    EXPECT_FALSE(processor.initialize());
    EXPECT_FALSE(processor.initialize());
}

TEST(OcrProcessor, Initialize_ThrowingEngine) {
    auto engine = std::make_unique<NiceMock<MockOcrEngine>>();
    ON_CALL(*engine, isAvailable()).WillByDefault(Return(false));
    EXPECT_CALL(*engine, initialize()).WillOnce(Throw(std::runtime_error("no device")));

    OcrProcessor processor(std::move(engine));

    EXPECT_FALSE(processor.initialize());
}

TEST(OcrProcessor, Initialize_AlreadyAvailable) {
    auto engine = availableEngine();
    EXPECT_CALL(*engine, initialize()).Times(0);

    OcrProcessor processor(std::move(engine));

    EXPECT_TRUE(processor.initialize());
    EXPECT_EQ(processor.engineName(), "mock");
}

// ==================== 区域识别 测试 ====================

/**
 * @brief 引擎收到裁剪后的区域，结果平移回原图坐标
 */
TEST(OcrProcessor, RecognizeRegion_OffsetsToImageCoordinates) {
    auto engine = availableEngine();
    EXPECT_CALL(*engine, recognize(_)).WillOnce([](const cv::Mat& crop) {
        EXPECT_EQ(crop.cols, 100);
        EXPECT_EQ(crop.rows, 50);
        return std::vector<TextBox>{MakeBox(cv::Rect(5, 10, 40, 12), "hello")};
    });

    OcrProcessor processor(std::move(engine));
    cv::Mat image(200, 300, CV_8UC3, cv::Scalar(255, 255, 255));

    auto boxes = processor.recognizeRegion(image, SelectionRect(150, 120, 50, 70));

    ASSERT_EQ(boxes.size(), 1u);
    EXPECT_EQ(boxes[0].GetRect(), cv::Rect(55, 80, 40, 12));
    EXPECT_EQ(boxes[0].index, 0);
    EXPECT_EQ(boxes[0].text, "hello");
}

/**
 * @brief 丢弃空文本，按阅读顺序排序并编号
 */
TEST(OcrProcessor, RecognizeRegion_DropsEmptyAndSorts) {
    auto engine = availableEngine();
    EXPECT_CALL(*engine, recognize(_)).WillOnce(Return(std::vector<TextBox>{
        MakeBox(cv::Rect(10, 60, 30, 10), "second"),
        MakeBox(cv::Rect(50, 10, 30, 10), "right"),
        MakeBox(cv::Rect(20, 30, 30, 10), ""),
        MakeBox(cv::Rect(5, 11, 30, 10), "left"),
    }));

    OcrProcessor processor(std::move(engine));
    cv::Mat image(100, 100, CV_8UC3, cv::Scalar(255, 255, 255));

    auto boxes = processor.recognizeRegion(image, SelectionRect(0, 0, 100, 100));

    ASSERT_EQ(boxes.size(), 3u);
    EXPECT_EQ(boxes[0].text, "left");
    EXPECT_EQ(boxes[1].text, "right");
    EXPECT_EQ(boxes[2].text, "second");
    for (size_t i = 0; i < boxes.size(); i++) {
        EXPECT_EQ(boxes[i].index, static_cast<int>(i));
    }
}

TEST(OcrProcessor, RecognizeRegion_EngineThrowsReturnsEmpty) {
    auto engine = availableEngine();
    EXPECT_CALL(*engine, recognize(_)).WillOnce(Throw(std::runtime_error("inference failed")));

    OcrProcessor processor(std::move(engine));
    cv::Mat image(50, 50, CV_8UC3);

    EXPECT_TRUE(processor.recognizeRegion(image, SelectionRect(0, 0, 50, 50)).empty());
}

TEST(OcrProcessor, RecognizeRegion_OutsideImageSkipsEngine) {
    auto engine = availableEngine();
    EXPECT_CALL(*engine, recognize(_)).Times(0);

    OcrProcessor processor(std::move(engine));
    cv::Mat image(50, 50, CV_8UC3);

    EXPECT_TRUE(processor.recognizeRegion(image, SelectionRect(60, 60, 90, 90)).empty());
    EXPECT_TRUE(processor.recognizeRegion(cv::Mat(), SelectionRect(0, 0, 10, 10)).empty());
}

TEST(OcrProcessor, RecognizeWholeImage) {
    auto engine = availableEngine();
    EXPECT_CALL(*engine, recognize(_)).WillOnce(Return(std::vector<TextBox>{
        MakeBox(cv::Rect(10, 10, 20, 10), "a")}));

    OcrProcessor processor(std::move(engine));

    auto boxes = processor.recognize(cv::Mat(40, 40, CV_8UC3));

    ASSERT_EQ(boxes.size(), 1u);
    EXPECT_EQ(boxes[0].GetRect(), cv::Rect(10, 10, 20, 10));
    EXPECT_EQ(boxes[0].index, 0);
}
