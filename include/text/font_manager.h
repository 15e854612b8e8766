#pragma once

#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "common/types.hpp"

namespace picmod {

/**
 * @brief 系统字体管理
 *
 * Scans font directories once, validating every .ttf/.otf/.ttc with
 * FreeType. Name lookups are case-insensitive substring matches on the file
 * name and are cached. Thread-safe.
 */
class FontManager {
public:
    /**
     * @param extra_dirs 优先于系统目录扫描的目录
     * @param fallback_font 匹配失败时使用的字体名或路径
     */
    explicit FontManager(std::vector<std::string> extra_dirs = {},
                         std::string fallback_font = "");

    /**
     * @brief 当前平台的字体目录
     */
    static std::vector<std::string> DefaultFontDirs();

    /**
     * @brief 总是出现在字体列表中的常用字体名
     */
    static const std::vector<std::string>& CommonFonts();

    /**
     * @brief 文本是否包含中日韩统一表意文字 (U+4E00..U+9FFF)
     */
    static bool ContainsCJK(const std::string& utf8);

    /**
     * @brief 用 FreeType 打开字体文件以验证其有效
     */
    static bool IsValidFontFile(const std::string& path);

    /**
     * @brief 可用字体名：扫描结果加常用字体，排序去重
     */
    std::vector<std::string> systemFonts();

    /**
     * @brief 按名称查找 .ttf/.otf 字体文件
     * @return 路径，未找到返回空串
     */
    std::string findFontPath(const std::string& name);

    /**
     * @brief 根据字体特征和文本内容选择字体
     * @return (字体路径或空串, 字号)
     */
    std::pair<std::string, int> matchFont(const FontFeatures& features, const std::string& text);

    const std::vector<std::string>& searchDirs() const { return dirs_; }

private:
    struct FontFile {
        std::string name;   // file stem
        std::string path;
    };

    void scanLocked();
    std::string findFontPathLocked(const std::string& name);

    std::vector<std::string> dirs_;
    std::string fallback_font_;

    std::mutex mutex_;
    bool scanned_ = false;
    std::vector<FontFile> files_;
    std::map<std::string, std::string> path_cache_;
};

} // namespace picmod
