/**
 * @file test_cli_options.cpp
 * @brief 命令行参数解析测试
 */

#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "cli_options.h"

using namespace picmod_cli;

namespace {

// getopt 需要可写的 argv
class Argv {
public:
    Argv(std::initializer_list<std::string> args) : storage_(args) {
        for (auto& s : storage_) {
            ptrs_.push_back(&s[0]);
        }
        ptrs_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return ptrs_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> ptrs_;
};

bool parse(std::initializer_list<std::string> args, CliOptions& options, std::string& error) {
    Argv argv(args);
    return ParseCommandLine(argv.argc(), argv.argv(), options, error);
}

} // namespace

// ==================== 值解析 测试 ====================

TEST(CliOptions, ParseRect) {
    picmod::SelectionRect rect;

    ASSERT_TRUE(ParseRect("10,20,110,80", rect));
    EXPECT_EQ(rect, picmod::SelectionRect(10, 20, 110, 80));

    // 负数允许，后续裁剪到图像范围
    EXPECT_TRUE(ParseRect("-5,0,10,10", rect));

    EXPECT_FALSE(ParseRect("1,2,3", rect));
    EXPECT_FALSE(ParseRect("1,2,3,4,5", rect));
    EXPECT_FALSE(ParseRect("1,2,x,4", rect));
    EXPECT_FALSE(ParseRect("1,2,3,4,", rect));
    EXPECT_FALSE(ParseRect("1,,3,4", rect));
    EXPECT_FALSE(ParseRect("", rect));
}

TEST(CliOptions, ParseColor) {
    cv::Vec3b color;

    ASSERT_TRUE(ParseColor("255,128,0", color));
    EXPECT_EQ(color, cv::Vec3b(255, 128, 0));

    EXPECT_FALSE(ParseColor("256,0,0", color));
    EXPECT_FALSE(ParseColor("-1,0,0", color));
    EXPECT_FALSE(ParseColor("1,2", color));
    EXPECT_FALSE(ParseColor("red", color));
}

TEST(CliOptions, ParseIndices) {
    std::vector<int> indices;

    ASSERT_TRUE(ParseIndices("0,2,5", indices));
    EXPECT_EQ(indices, (std::vector<int>{0, 2, 5}));

    ASSERT_TRUE(ParseIndices("3", indices));
    EXPECT_EQ(indices, (std::vector<int>{3}));

    EXPECT_FALSE(ParseIndices("-1", indices));
    EXPECT_FALSE(ParseIndices("1.5", indices));
    EXPECT_FALSE(ParseIndices("", indices));
}

// ==================== ParseCommandLine 测试 ====================

TEST(CliOptions, ParseCommandLine_Stitch) {
    CliOptions options;
    std::string error;

    ASSERT_TRUE(parse({"picmod", "stitch", "--rect", "0,10,100,40", "-o", "out.png", "in.png"},
                      options, error)) << error;

    EXPECT_EQ(options.command, "stitch");
    EXPECT_EQ(options.input, "in.png");
    EXPECT_EQ(options.output, "out.png");
    ASSERT_TRUE(options.rect.has_value());
    EXPECT_EQ(*options.rect, picmod::SelectionRect(0, 10, 100, 40));
}

TEST(CliOptions, ParseCommandLine_FillWithColor) {
    CliOptions options;
    std::string error;

    ASSERT_TRUE(parse({"picmod", "fill", "-r", "1,1,20,20", "-m", "color", "-c", "0,0,255", "-q", "80", "in.jpg"},
                      options, error)) << error;

    EXPECT_EQ(options.mode, "color");
    ASSERT_TRUE(options.color.has_value());
    EXPECT_EQ(*options.color, cv::Vec3b(0, 0, 255));
    EXPECT_EQ(options.quality, 80);
}

TEST(CliOptions, ParseCommandLine_ReplaceText) {
    CliOptions options;
    std::string error;

    ASSERT_TRUE(parse({"picmod", "replace-text", "-t", "新文字", "-i", "2", "-f", "SimHei", "-s", "24", "-V",
                       "scan.png"},
                      options, error)) << error;

    EXPECT_EQ(options.text, "新文字");
    EXPECT_EQ(options.indices, (std::vector<int>{2}));
    EXPECT_EQ(options.font, "SimHei");
    EXPECT_EQ(options.size, 24);
    EXPECT_TRUE(options.visualize);
    EXPECT_FALSE(options.rect.has_value());
}

TEST(CliOptions, ParseCommandLine_FontsTakesNoInput) {
    CliOptions options;
    std::string error;

    EXPECT_TRUE(parse({"picmod", "fonts"}, options, error)) << error;
    EXPECT_TRUE(options.input.empty());

    CliOptions other;
    EXPECT_FALSE(parse({"picmod", "fonts", "extra.png"}, other, error));
}

TEST(CliOptions, ParseCommandLine_Help) {
    CliOptions options;
    std::string error;

    EXPECT_TRUE(parse({"picmod", "-h"}, options, error));
    EXPECT_TRUE(options.help);
}

/**
 * @brief 命令缺失、未知命令、缺少必需参数时报错
 */
TEST(CliOptions, ParseCommandLine_Errors) {
    std::string error;

    CliOptions a;
    EXPECT_FALSE(parse({"picmod"}, a, error));
    EXPECT_NE(error.find("Missing command"), std::string::npos);

    CliOptions b;
    EXPECT_FALSE(parse({"picmod", "blur", "in.png"}, b, error));
    EXPECT_NE(error.find("Unknown command"), std::string::npos);

    CliOptions c;
    EXPECT_FALSE(parse({"picmod", "stitch", "in.png"}, c, error));
    EXPECT_NE(error.find("--rect"), std::string::npos);

    CliOptions d;
    EXPECT_FALSE(parse({"picmod", "add-text", "-r", "0,0,50,50", "in.png"}, d, error));
    EXPECT_NE(error.find("--text"), std::string::npos);

    CliOptions e;
    EXPECT_FALSE(parse({"picmod", "ocr"}, e, error));

    CliOptions f;
    EXPECT_FALSE(parse({"picmod", "ocr", "a.png", "b.png"}, f, error));

    CliOptions g;
    EXPECT_FALSE(parse({"picmod", "fill", "-r", "1,2,3", "in.png"}, g, error));
    EXPECT_NE(error.find("Invalid --rect"), std::string::npos);

    CliOptions h;
    EXPECT_FALSE(parse({"picmod", "fill", "-r", "0,0,9,9", "-q", "101", "in.png"}, h, error));

    CliOptions i;
    EXPECT_FALSE(parse({"picmod", "ocr", "--bogus", "in.png"}, i, error));
}

TEST(CliOptions, Usage_ListsCommands) {
    std::string usage = Usage("picmod");

    for (const auto& command : Commands()) {
        EXPECT_NE(usage.find(command), std::string::npos) << command;
    }
    EXPECT_TRUE(NeedsInput("ocr"));
    EXPECT_FALSE(NeedsInput("fonts"));
}
