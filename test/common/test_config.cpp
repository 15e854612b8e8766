/**
 * @file test_config.cpp
 * @brief 配置加载与校验测试
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "common/config.h"

using namespace picmod;
namespace fs = std::filesystem;

namespace {

std::string writeTempFile(const std::string& name, const std::string& content) {
    fs::path path = fs::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path.string();
}

} // namespace

/**
 * @brief 默认配置有效
 */
TEST(AppConfig, Defaults_AreValid) {
    AppConfig config;
    std::string error;

    EXPECT_TRUE(config.Validate(error)) << error;
    EXPECT_EQ(config.edit.historySize, 20u);
    EXPECT_EQ(config.edit.jpegQuality, 95);
    EXPECT_EQ(config.ocr.modelRoot, std::string(PROJECT_ROOT_DIR));
}

/**
 * @brief 缺失字段保留默认值
 */
TEST(AppConfig, FromJson_PartialOverride) {
    json j = json::parse(R"({
        "log": {"level": "debug"},
        "edit": {"historySize": 5, "jpegQuality": 80},
        "font": {"dirs": ["/opt/fonts"], "fallback": "DejaVuSans"},
        "workers": 4
    })");

    AppConfig config = AppConfig::FromJson(j);

    EXPECT_EQ(config.log.level, "debug");
    EXPECT_EQ(config.edit.historySize, 5u);
    EXPECT_EQ(config.edit.jpegQuality, 80);
    EXPECT_DOUBLE_EQ(config.edit.inpaintRadius, 3.0);
    ASSERT_EQ(config.font.extraDirs.size(), 1u);
    EXPECT_EQ(config.font.extraDirs[0], "/opt/fonts");
    EXPECT_EQ(config.font.fallbackFont, "DejaVuSans");
    EXPECT_EQ(config.workers, 4);
    EXPECT_FLOAT_EQ(config.ocr.detThresh, 0.3f);
}

TEST(AppConfig, FromJson_WrongTypeThrows) {
    json j = json::parse(R"({"edit": {"historySize": "many"}})");
    EXPECT_THROW(AppConfig::FromJson(j), json::exception);
}

TEST(AppConfig, Validate_RejectsOutOfRange) {
    std::string error;

    AppConfig a;
    a.edit.jpegQuality = 0;
    EXPECT_FALSE(a.Validate(error));
    EXPECT_NE(error.find("jpegQuality"), std::string::npos);

    AppConfig b;
    b.ocr.detThresh = 1.5f;
    EXPECT_FALSE(b.Validate(error));

    AppConfig c;
    c.workers = 0;
    EXPECT_FALSE(c.Validate(error));

    AppConfig d;
    d.log.level = "verbose";
    EXPECT_FALSE(d.Validate(error));

    AppConfig e;
    e.edit.historySize = 0;
    EXPECT_FALSE(e.Validate(error));
}

/**
 * @brief 检测候选数、模型切换尺寸、方向分类阈值的范围检查
 */
TEST(AppConfig, Validate_RejectsDetectorAndClassifierLimits) {
    std::string error;

    AppConfig a;
    a.ocr.maxCandidates = -1;
    EXPECT_FALSE(a.Validate(error));
    EXPECT_NE(error.find("maxCandidates"), std::string::npos);

    AppConfig b;
    b.ocr.maxCandidates = 0;
    EXPECT_FALSE(b.Validate(error));

    AppConfig c;
    c.ocr.detSizeThreshold = 0;
    EXPECT_FALSE(c.Validate(error));
    EXPECT_NE(error.find("detSizeThreshold"), std::string::npos);

    AppConfig d;
    d.ocr.clsThresh = 1.2f;
    EXPECT_FALSE(d.Validate(error));
    EXPECT_NE(error.find("clsThresh"), std::string::npos);

    AppConfig e;
    e.ocr.clsThresh = -0.1f;
    EXPECT_FALSE(e.Validate(error));

    AppConfig ok;
    ok.ocr.maxCandidates = 1;
    ok.ocr.clsThresh = 0.0f;
    EXPECT_TRUE(ok.Validate(error)) << error;
}

TEST(AppConfig, LoadFile_Success) {
    std::string path = writeTempFile("picmod_config_ok.json",
                                     R"({"edit": {"inpaintRadius": 5.0}, "ocr": {"useClassifier": false}})");
    AppConfig config;
    std::string error;

    ASSERT_TRUE(AppConfig::LoadFile(path, config, error)) << error;
    EXPECT_DOUBLE_EQ(config.edit.inpaintRadius, 5.0);
    EXPECT_FALSE(config.ocr.useClassifier);
    fs::remove(path);
}

TEST(AppConfig, LoadFile_InvalidJson) {
    std::string path = writeTempFile("picmod_config_bad.json", "{ not json");
    AppConfig config;
    std::string error;

    EXPECT_FALSE(AppConfig::LoadFile(path, config, error));
    EXPECT_FALSE(error.empty());
    fs::remove(path);
}

TEST(AppConfig, LoadFile_Missing) {
    AppConfig config;
    std::string error;

    EXPECT_FALSE(AppConfig::LoadFile("/nonexistent/picmod.json", config, error));
    EXPECT_NE(error.find("Cannot open"), std::string::npos);
}

TEST(AppConfig, LoadFile_InvalidValues) {
    std::string path = writeTempFile("picmod_config_range.json", R"({"workers": 100})");
    AppConfig config;
    std::string error;

    EXPECT_FALSE(AppConfig::LoadFile(path, config, error));
    EXPECT_NE(error.find("workers"), std::string::npos);
    fs::remove(path);
}
