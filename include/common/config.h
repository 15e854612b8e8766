#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "common/logger.hpp"

namespace picmod {

using json = nlohmann::json;

/**
 * @brief OCR 配置
 */
struct OcrConfig {
    // Root searched for .paddlex/ and models/paddleocr/
    std::string modelRoot = PROJECT_ROOT_DIR;
    bool useClassifier = true;

    // Detection (DBNet)
    float detThresh = 0.3f;
    float detBoxThresh = 0.6f;
    float unclipRatio = 1.5f;
    int maxCandidates = 1000;
    int detSizeThreshold = 800;      // 640 model below, 960 model above

    // Recognition (CRNN + CTC)
    float recScoreThresh = 0.3f;
    int recInputHeight = 48;

    // Line orientation classifier
    float clsThresh = 0.9f;

    void Show() const;
};

/**
 * @brief 编辑操作配置
 */
struct EditConfig {
    size_t historySize = 20;
    double inpaintRadius = 3.0;
    int textPadding = 2;             // Erase mask padding around each text box
    int jpegQuality = 95;

    void Show() const;
};

/**
 * @brief 字体配置
 */
struct FontConfig {
    // Scanned before the platform font directories
    std::vector<std::string> extraDirs;
    // Used when matching finds nothing
    std::string fallbackFont;

    void Show() const;
};

/**
 * @brief 应用总配置
 *
 * Loaded from a JSON file, then overridden by command line options.
 */
struct AppConfig {
    LoggerConfig log;
    OcrConfig ocr;
    EditConfig edit;
    FontConfig font;
    int workers = 2;

    /**
     * @brief 从JSON解析配置，缺失字段保留默认值
     * @throws nlohmann::json::exception 字段类型错误
     */
    static AppConfig FromJson(const json& j);

    /**
     * @brief 从文件加载配置
     * @param path JSON文件路径
     * @param config 输出配置
     * @param error_msg 失败原因
     * @return 是否成功
     */
    static bool LoadFile(const std::string& path, AppConfig& config, std::string& error_msg);

    /**
     * @brief 验证配置参数
     */
    bool Validate(std::string& error_msg) const;

    void Show() const;
};

} // namespace picmod
