#pragma once

#include "common/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace picmod_cli {

/**
 * @brief 命令行退出码
 */
namespace ExitCode {
    constexpr int SUCCESS = 0;
    constexpr int USAGE_ERROR = 1;
    constexpr int PROCESSING_ERROR = 2;
}

/**
 * @brief 命令行参数
 */
struct CliOptions {
    std::string command;        // stitch|fill|ocr|erase-text|replace-text|add-text|fonts|info
    std::string input;
    std::string output;
    std::optional<picmod::SelectionRect> rect;
    std::string mode = "inpaint";
    std::optional<cv::Vec3b> color;   // RGB
    std::string text;
    std::string font;
    int size = 0;
    std::vector<int> indices;
    int quality = 0;            // 0 = from config
    std::string configPath;
    std::string logDir;
    bool visualize = false;
    bool help = false;
};

/**
 * @brief 支持的子命令
 */
const std::vector<std::string>& Commands();

/**
 * @brief 命令是否需要输入图像
 */
bool NeedsInput(const std::string& command);

/**
 * @brief 解析 "x1,y1,x2,y2"
 */
bool ParseRect(const std::string& s, picmod::SelectionRect& out);

/**
 * @brief 解析 "r,g,b"，每个分量 0-255
 */
bool ParseColor(const std::string& s, cv::Vec3b& out);

/**
 * @brief 解析 "0,2,5"，序号非负
 */
bool ParseIndices(const std::string& s, std::vector<int>& out);

/**
 * @brief 解析命令行
 * @param error_msg 失败原因
 * @return 是否成功；-h 时成功并设置 help
 */
bool ParseCommandLine(int argc, char* argv[], CliOptions& options, std::string& error_msg);

/**
 * @brief 帮助信息
 */
std::string Usage(const std::string& program);

} // namespace picmod_cli
