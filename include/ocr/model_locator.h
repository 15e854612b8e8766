#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace picmod {

/**
 * @brief 本地模型路径
 */
struct ModelPaths {
    std::string detDir;
    std::string recDir;
    std::string clsDir;      // 可选
    std::string dictPath;

    bool complete() const {
        return !detDir.empty() && !recDir.empty() && !dictPath.empty();
    }
};

/**
 * @brief 本地模型查找器
 *
 * Search order:
 *   1. <root>/.paddlex, recursively. A directory holding a model file is
 *      det/rec/cls when its own name or its parent's name says so.
 *   2. <root>/models/paddleocr/{det,rec,cls}
 * Nothing is ever downloaded.
 */
class ModelLocator {
public:
    static constexpr const char* kModelExtension = ".dxnn";

    explicit ModelLocator(std::string root);

    /**
     * @brief 查找模型；未找到时返回的 ModelPaths::complete() 为 false
     */
    ModelPaths locate() const;

    /**
     * @brief 目录中是否直接包含模型文件
     */
    static bool hasModelFile(const std::filesystem::path& dir);

    /**
     * @brief 目录中的模型文件（按文件名排序）
     */
    static std::vector<std::string> listModelFiles(const std::string& dir);

    /**
     * @brief 未找到模型时打印期望的目录结构
     */
    void logExpectedLayout() const;

    const std::string& root() const { return root_; }

private:
    ModelPaths searchPaddlex(const std::filesystem::path& base) const;
    ModelPaths searchModelsDir(const std::filesystem::path& base) const;
    static std::string findDictionary(const std::vector<std::filesystem::path>& dirs);

    std::string root_;
};

} // namespace picmod
