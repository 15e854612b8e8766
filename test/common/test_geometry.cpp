/**
 * @file test_geometry.cpp
 * @brief 几何工具测试
 */

#include <gtest/gtest.h>
#include "common/geometry.h"

using namespace picmod;

namespace {

TextBox makeBox(int x, int y, int w, int h, const std::string& text = "t") {
    TextBox box = TextBox::FromRect(cv::Rect(x, y, w, h));
    box.text = text;
    return box;
}

} // namespace

// ==================== orderPointsClockwise ====================

/**
 * @brief 乱序四点应排成 左上、右上、右下、左下
 */
TEST(Geometry, OrderPointsClockwise_Shuffled) {
    std::vector<cv::Point2f> pts = {
        cv::Point2f(100, 50), cv::Point2f(0, 0), cv::Point2f(0, 50), cv::Point2f(100, 0)
    };

    auto ordered = Geometry::orderPointsClockwise(pts);

    ASSERT_EQ(ordered.size(), 4u);
    EXPECT_EQ(ordered[0], cv::Point2f(0, 0));
    EXPECT_EQ(ordered[1], cv::Point2f(100, 0));
    EXPECT_EQ(ordered[2], cv::Point2f(100, 50));
    EXPECT_EQ(ordered[3], cv::Point2f(0, 50));
}

TEST(Geometry, CropTextRegion_KeepsAspectRatio) {
    cv::Mat image(100, 200, CV_8UC3, cv::Scalar(255, 255, 255));
    std::vector<cv::Point2f> box = {
        cv::Point2f(10, 10), cv::Point2f(110, 10), cv::Point2f(110, 35), cv::Point2f(10, 35)
    };

    cv::Mat crop = Geometry::cropTextRegion(image, box, 48);

    EXPECT_EQ(crop.rows, 48);
    EXPECT_EQ(crop.cols, 192);   // 100 * 48 / 25
}

TEST(Geometry, CropTextRegion_DegenerateBox) {
    cv::Mat image(100, 200, CV_8UC3, cv::Scalar(255, 255, 255));
    std::vector<cv::Point2f> line = {
        cv::Point2f(10, 10), cv::Point2f(50, 10), cv::Point2f(50, 10), cv::Point2f(10, 10)
    };
    EXPECT_TRUE(Geometry::cropTextRegion(image, line).empty());
}

// ==================== 矩形工具 ====================

TEST(Geometry, PaddedBoxRect_ClampedToImage) {
    TextBox box = makeBox(1, 1, 10, 10);
    cv::Rect r = Geometry::paddedBoxRect(box, 2, cv::Size(12, 12));

    EXPECT_EQ(r, cv::Rect(0, 0, 12, 12));
}

TEST(Geometry, PaddedBoxRect_OutsideImageIsEmpty) {
    TextBox box = makeBox(50, 50, 10, 10);
    EXPECT_TRUE(Geometry::paddedBoxRect(box, 2, cv::Size(20, 20)).empty());
}

TEST(Geometry, IsBoxInside_BoundaryInclusive) {
    TextBox box = makeBox(10, 10, 20, 20);

    EXPECT_TRUE(Geometry::isBoxInside(box, SelectionRect(10, 10, 30, 30)));
    EXPECT_TRUE(Geometry::isBoxInside(box, SelectionRect(30, 30, 0, 0)));   // 反向选区
    EXPECT_FALSE(Geometry::isBoxInside(box, SelectionRect(11, 10, 30, 30)));
}

// ==================== sortReadingOrder ====================

/**
 * @brief 从上到下、同一行从左到右，并重写 index
 */
TEST(Geometry, SortReadingOrder_RowsThenColumns) {
    std::vector<TextBox> boxes = {
        makeBox(200, 52, 80, 20, "row2-right"),
        makeBox(10, 10, 80, 20, "row1-left"),
        makeBox(10, 50, 80, 20, "row2-left"),
        makeBox(200, 12, 80, 20, "row1-right"),
    };

    Geometry::sortReadingOrder(boxes);

    ASSERT_EQ(boxes.size(), 4u);
    EXPECT_EQ(boxes[0].text, "row1-left");
    EXPECT_EQ(boxes[1].text, "row1-right");
    EXPECT_EQ(boxes[2].text, "row2-left");
    EXPECT_EQ(boxes[3].text, "row2-right");
    for (int i = 0; i < 4; i++) {
        EXPECT_EQ(boxes[i].index, i);
    }
}

/**
 * @brief 中心Y差超过半个行高则分到下一行
 */
TEST(Geometry, SortReadingOrder_HalfLineTolerance) {
    std::vector<TextBox> boxes = {
        makeBox(200, 0, 50, 20, "upper-right"),
        makeBox(0, 11, 50, 20, "lower-left"),      // 中心差 11 > 10
    };

    Geometry::sortReadingOrder(boxes);

    EXPECT_EQ(boxes[0].text, "upper-right");
    EXPECT_EQ(boxes[1].text, "lower-left");
}

TEST(Geometry, SortReadingOrder_Empty) {
    std::vector<TextBox> boxes;
    Geometry::sortReadingOrder(boxes);
    EXPECT_TRUE(boxes.empty());
}

// ==================== 数据类型 ====================

TEST(SelectionRect, NormalizedAndClamped) {
    SelectionRect r(50, 40, -10, 5);
    SelectionRect n = r.normalized();
    EXPECT_EQ(n, SelectionRect(-10, 5, 50, 40));

    SelectionRect c = n.clampedTo(30, 30);
    EXPECT_EQ(c, SelectionRect(0, 5, 30, 30));
    EXPECT_EQ(c.toRect(), cv::Rect(0, 5, 30, 25));
}

TEST(TextBox, GetRectAndTranslate) {
    TextBox box;
    box.points[0] = cv::Point2f(1.5f, 2.5f);
    box.points[1] = cv::Point2f(10.2f, 2.5f);
    box.points[2] = cv::Point2f(10.2f, 8.1f);
    box.points[3] = cv::Point2f(1.5f, 8.1f);

    EXPECT_EQ(box.GetRect(), cv::Rect(cv::Point(1, 2), cv::Point(11, 9)));

    box.Translate(100, 200);
    EXPECT_FLOAT_EQ(box.points[0].x, 101.5f);
    EXPECT_FLOAT_EQ(box.points[2].y, 208.1f);
}
