/**
 * @file test_visualizer.cpp
 * @brief 结果可视化测试
 */

#include <gtest/gtest.h>
#include "common/visualizer.h"

using namespace picmod;

namespace {

cv::Mat whiteImage() {
    return cv::Mat(100, 120, CV_8UC3, cv::Scalar(255, 255, 255));
}

} // namespace

TEST(Visualizer, DrawOCRResults_DrawsBoxOutline) {
    cv::Mat image = whiteImage();
    TextBox box = TextBox::FromRect(cv::Rect(20, 40, 60, 20));
    box.text = "hi";
    box.confidence = 0.9f;
    box.index = 0;

    cv::Mat vis = Visualizer::drawOCRResults(image, {box});

    ASSERT_EQ(vis.size(), image.size());
    // 第一个结果使用调色板第一种颜色（绿色）
    EXPECT_EQ(vis.at<cv::Vec3b>(52, 20), cv::Vec3b(0, 200, 0));
    // 框内部与原图不共享数据
    EXPECT_EQ(vis.at<cv::Vec3b>(52, 50), cv::Vec3b(255, 255, 255));
    EXPECT_EQ(image.at<cv::Vec3b>(52, 20), cv::Vec3b(255, 255, 255));
}

TEST(Visualizer, DrawOCRResults_EmptyInput) {
    EXPECT_TRUE(Visualizer::drawOCRResults(cv::Mat(), {}).empty());

    cv::Mat image = whiteImage();
    cv::Mat vis = Visualizer::drawOCRResults(image, {});
    EXPECT_EQ(cv::norm(vis, image, cv::NORM_INF), 0.0);
}

TEST(Visualizer, DrawSelection_DashedBorder) {
    cv::Mat image = whiteImage();

    cv::Mat vis = Visualizer::drawSelection(image, SelectionRect(10, 10, 70, 50));

    EXPECT_EQ(vis.at<cv::Vec3b>(10, 10), cv::Vec3b(255, 0, 0));
    EXPECT_EQ(vis.at<cv::Vec3b>(30, 40), cv::Vec3b(255, 255, 255));
    EXPECT_EQ(image.at<cv::Vec3b>(10, 10), cv::Vec3b(255, 255, 255));
}

/**
 * @brief 选区完全在图像外或图像为空时不绘制
 */
TEST(Visualizer, DrawSelection_NothingToDraw) {
    cv::Mat image = whiteImage();

    cv::Mat vis = Visualizer::drawSelection(image, SelectionRect(200, 200, 300, 300));
    EXPECT_EQ(cv::norm(vis, image, cv::NORM_INF), 0.0);

    EXPECT_TRUE(Visualizer::drawSelection(cv::Mat(), SelectionRect(0, 0, 10, 10)).empty());
}
