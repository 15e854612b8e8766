/**
 * @file test_db_postprocess.cpp
 * @brief DBNet 后处理测试（不依赖推理运行时）
 */

#include <gtest/gtest.h>
#include "detection/db_postprocess.h"

using namespace picmod;

namespace {

bool contains(const cv::Rect& outer, const cv::Rect& inner) {
    return (outer & inner) == inner;
}

} // namespace

/**
 * @brief 概率图上的矩形高响应区域生成一个覆盖它的检测框
 */
TEST(DBPostProcessor, SyntheticBlob_OneBox) {
    cv::Mat pred = cv::Mat::zeros(100, 200, CV_32FC1);
    cv::Rect blob(40, 30, 100, 20);
    pred(blob).setTo(0.9f);

    DBPostProcessor post(0.3f, 0.6f, 1000, 1.5f);
    auto boxes = post.process(pred, 100, 200);

    ASSERT_EQ(boxes.size(), 1u);
    EXPECT_NEAR(boxes[0].confidence, 0.9f, 1e-3);

    cv::Rect r = boxes[0].GetRect();
    EXPECT_TRUE(contains(r, blob)) << r;
    // 扩展量有限
    EXPECT_LT(r.width, 160);
    EXPECT_LT(r.height, 60);
}

/**
 * @brief 均值低于 box_thresh 的区域被丢弃
 */
TEST(DBPostProcessor, LowScoreBlob_Dropped) {
    cv::Mat pred = cv::Mat::zeros(100, 200, CV_32FC1);
    pred(cv::Rect(40, 30, 100, 20)).setTo(0.4f);

    DBPostProcessor post(0.3f, 0.6f);
    EXPECT_TRUE(post.process(pred, 100, 200).empty());
}

TEST(DBPostProcessor, TinyBlob_Dropped) {
    cv::Mat pred = cv::Mat::zeros(100, 200, CV_32FC1);
    pred(cv::Rect(50, 50, 2, 2)).setTo(1.0f);

    DBPostProcessor post;
    EXPECT_TRUE(post.process(pred, 100, 200).empty());
}

/**
 * @brief 预测图坐标按补边尺寸缩放，并裁剪到原图范围
 */
TEST(DBPostProcessor, PaddedInput_ScaledAndClamped) {
    // 原图 150x200 (h x w) 补边到 200x200，网络输入 100x100
    cv::Mat pred = cv::Mat::zeros(100, 100, CV_32FC1);
    pred(cv::Rect(10, 10, 30, 10)).setTo(0.95f);
    // 靠近底部的区域，映射后超出原图高度的部分被裁掉
    pred(cv::Rect(10, 70, 30, 10)).setTo(0.95f);

    DBPostProcessor post;
    auto boxes = post.process(pred, 150, 200, 200, 200);

    ASSERT_EQ(boxes.size(), 2u);
    for (const auto& box : boxes) {
        for (const auto& pt : box.points) {
            EXPECT_GE(pt.x, 0.0f);
            EXPECT_LE(pt.x, 200.0f);
            EXPECT_GE(pt.y, 0.0f);
            EXPECT_LE(pt.y, 150.0f);
        }
    }

    bool found_top = false;
    for (const auto& box : boxes) {
        if (contains(box.GetRect(), cv::Rect(20, 20, 60, 18))) {
            found_top = true;
        }
    }
    EXPECT_TRUE(found_top);
}

TEST(DBPostProcessor, InvalidInput) {
    DBPostProcessor post;
    EXPECT_TRUE(post.process(cv::Mat(), 10, 10).empty());

    cv::Mat wrong_type = cv::Mat::zeros(10, 10, CV_8UC1);
    EXPECT_TRUE(post.process(wrong_type, 10, 10).empty());
}

TEST(DBPostProcessor, MaxCandidates_Limits) {
    cv::Mat pred = cv::Mat::zeros(100, 200, CV_32FC1);
    pred(cv::Rect(10, 10, 60, 15)).setTo(0.9f);
    pred(cv::Rect(10, 60, 60, 15)).setTo(0.9f);
    pred(cv::Rect(110, 35, 60, 15)).setTo(0.9f);

    DBPostProcessor all(0.3f, 0.6f, 1000);
    DBPostProcessor one(0.3f, 0.6f, 1);

    EXPECT_EQ(all.process(pred, 100, 200).size(), 3u);
    EXPECT_EQ(one.process(pred, 100, 200).size(), 1u);
}
