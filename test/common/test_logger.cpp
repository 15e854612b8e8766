/**
 * @file test_logger.cpp
 * @brief 日志初始化测试
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "common/logger.hpp"

using namespace picmod;
namespace fs = std::filesystem;

namespace {

// 恢复 test_main 中的控制台日志
void restoreConsoleLogger() {
    LoggerConfig config;
    config.level = "warn";
    InitLogger(config);
}

} // namespace

TEST(Logger, InitLogger_CreatesLogDirectory) {
    fs::path dir = fs::temp_directory_path() / "picmod_logger_test" / "nested";
    fs::remove_all(dir.parent_path());

    LoggerConfig config;
    config.level = "warn";
    config.logDir = dir.string();
    ASSERT_NO_THROW(InitLogger(config));
    LOG_WARN("file sink check");
    spdlog::default_logger()->flush();

    EXPECT_TRUE(fs::is_directory(dir));
    EXPECT_TRUE(fs::exists(dir / config.fileName));

    restoreConsoleLogger();
    fs::remove_all(dir.parent_path());
}

/**
 * @brief 日志目录无法创建时抛出 spdlog_ex，默认日志器保持不变
 */
TEST(Logger, InitLogger_UncreatableDirectoryThrowsSpdlogEx) {
    // 父路径是普通文件，任何用户都无法在其下建目录
    fs::path blocker = fs::temp_directory_path() / "picmod_logger_blocker";
    fs::remove_all(blocker);
    std::ofstream(blocker.string()) << "x";

    auto before = spdlog::default_logger();

    LoggerConfig config;
    config.logDir = (blocker / "logs").string();
    EXPECT_THROW(InitLogger(config), spdlog::spdlog_ex);
    EXPECT_EQ(spdlog::default_logger(), before);

    fs::remove(blocker);
}
