/**
 * @file test_ctc_decoder.cpp
 * @brief CTC 解码测试
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "recognition/rec_postprocess.h"

using namespace picmod;
namespace fs = std::filesystem;

namespace {

// 每个时间步给定类别概率最高
std::vector<float> oneHotSteps(const std::vector<int>& classes, int num_classes, float prob) {
    std::vector<float> data(classes.size() * num_classes, (1.0f - prob) / (num_classes - 1));
    for (size_t t = 0; t < classes.size(); t++) {
        data[t * num_classes + classes[t]] = prob;
    }
    return data;
}

} // namespace

TEST(CTCDecoder, FromCharacters_DictLayout) {
    CTCDecoder decoder({"a", "b", "c"});
    // blank + 3 + 空格
    EXPECT_EQ(decoder.getDictSize(), 5u);

    CTCDecoder no_space({"a", "b", "c"}, false);
    EXPECT_EQ(no_space.getDictSize(), 4u);
}

/**
 * @brief 连续重复合并，blank 分隔的重复保留
 */
TEST(CTCDecoder, DecodeSequence_CollapsesRepeatsAndBlanks) {
    CTCDecoder decoder({"a", "b", "c"});

    auto result = decoder.decodeSequence({1, 1, 0, 1, 2, 2, 0, 4, 3},
                                         {0.9f, 0.1f, 0.5f, 0.7f, 0.8f, 0.2f, 0.5f, 0.6f, 1.0f});

    EXPECT_EQ(result.first, "aab c");
    // 只统计保留字符的置信度
    EXPECT_NEAR(result.second, (0.9f + 0.7f + 0.8f + 0.6f + 1.0f) / 5.0f, 1e-5);
}

TEST(CTCDecoder, DecodeSequence_AllBlank) {
    CTCDecoder decoder(std::vector<std::string>{"a"});
    auto result = decoder.decodeSequence({0, 0, 0}, {0.9f, 0.9f, 0.9f});
    EXPECT_EQ(result.first, "");
    EXPECT_FLOAT_EQ(result.second, 0.0f);
}

TEST(CTCDecoder, DecodeSequence_SkipsOutOfRange) {
    CTCDecoder decoder(std::vector<std::string>{"a"});
    auto result = decoder.decodeSequence({1, 42, 1}, {0.5f, 0.9f, 0.5f});
    EXPECT_EQ(result.first, "aa");
}

TEST(CTCDecoder, Decode_ArgmaxPerStep) {
    CTCDecoder decoder(std::vector<std::string>{"x", "y"});
    const int num_classes = 4;
    auto data = oneHotSteps({1, 0, 2, 2, 3}, num_classes, 0.8f);

    auto result = decoder.decode(data.data(), 5, num_classes);

    EXPECT_EQ(result.first, "xy ");
    EXPECT_NEAR(result.second, 0.8f, 1e-5);
}

TEST(CTCDecoder, Decode_ClassCountMismatch) {
    CTCDecoder decoder(std::vector<std::string>{"x", "y"});
    auto data = oneHotSteps({1, 2}, 6, 0.9f);

    auto result = decoder.decode(data.data(), 2, 6);

    EXPECT_TRUE(result.first.empty());
    EXPECT_FLOAT_EQ(result.second, 0.0f);
    EXPECT_TRUE(decoder.decode(nullptr, 2, 4).first.empty());
}

/**
 * @brief 字典文件：去掉 \r，跳过空行，支持多字节字符
 */
TEST(CTCDecoder, LoadDictionary_FromFile) {
    fs::path path = fs::temp_directory_path() / "picmod_test_dict.txt";
    {
        std::ofstream out(path, std::ios::binary);
        out << "x\r\n\xE4\xB8\xAD\n\ny\n";
    }

    CTCDecoder decoder(path.string());
    ASSERT_EQ(decoder.getDictSize(), 5u);

    auto result = decoder.decodeSequence({2, 3}, {1.0f, 1.0f});
    EXPECT_EQ(result.first, "\xE4\xB8\xAD" "y");

    fs::remove(path);
}

TEST(CTCDecoder, LoadDictionary_Missing) {
    CTCDecoder decoder;
    EXPECT_FALSE(decoder.loadDictionary("/nonexistent/dict.txt", true));
}
