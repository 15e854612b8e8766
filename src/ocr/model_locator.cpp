#include "ocr/model_locator.h"
#include "common/logger.hpp"
#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

namespace picmod {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

ModelLocator::ModelLocator(std::string root)
    : root_(std::move(root)) {
}

bool ModelLocator::hasModelFile(const fs::path& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return false;
    }
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.is_regular_file(ec) && toLower(entry.path().extension().string()) == kModelExtension) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> ModelLocator::listModelFiles(const std::string& dir) {
    std::vector<std::string> files;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return files;
    }
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.is_regular_file(ec) && toLower(entry.path().extension().string()) == kModelExtension) {
            files.push_back(entry.path().string());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::string ModelLocator::findDictionary(const std::vector<fs::path>& dirs) {
    for (const auto& dir : dirs) {
        std::error_code ec;
        if (dir.empty() || !fs::is_directory(dir, ec)) {
            continue;
        }
        std::vector<fs::path> candidates;
        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            std::string name = toLower(entry.path().filename().string());
            if (entry.is_regular_file(ec) && contains(name, "dict") && entry.path().extension() == ".txt") {
                candidates.push_back(entry.path());
            }
        }
        if (!candidates.empty()) {
            std::sort(candidates.begin(), candidates.end());
            return candidates.front().string();
        }
    }
    return "";
}

ModelPaths ModelLocator::searchPaddlex(const fs::path& base) const {
    ModelPaths paths;
    std::error_code ec;
    if (!fs::is_directory(base, ec)) {
        return paths;
    }

    // 收集后排序，保证结果与遍历顺序无关
    std::vector<fs::path> dirs = {base};
    for (auto it = fs::recursive_directory_iterator(base, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_directory(ec)) {
            dirs.push_back(it->path());
        }
    }
    std::sort(dirs.begin(), dirs.end());

    for (const auto& dir : dirs) {
        if (!hasModelFile(dir)) {
            continue;
        }
        std::string name = toLower(dir.filename().string());
        std::string parent = toLower(dir.parent_path().filename().string());

        if (contains(name, "det") || contains(parent, "det")) {
            if (paths.detDir.empty()) paths.detDir = dir.string();
        } else if (contains(name, "rec") || contains(parent, "rec")) {
            if (paths.recDir.empty()) paths.recDir = dir.string();
        } else if (contains(name, "cls") || contains(name, "classify") || contains(name, "angle") ||
                   contains(parent, "cls")) {
            if (paths.clsDir.empty()) paths.clsDir = dir.string();
        }
    }

    if (!paths.recDir.empty()) {
        paths.dictPath = findDictionary({paths.recDir, base});
    }
    return paths;
}

ModelPaths ModelLocator::searchModelsDir(const fs::path& base) const {
    ModelPaths paths;
    if (hasModelFile(base / "det")) paths.detDir = (base / "det").string();
    if (hasModelFile(base / "rec")) paths.recDir = (base / "rec").string();
    if (hasModelFile(base / "cls")) paths.clsDir = (base / "cls").string();

    if (!paths.recDir.empty()) {
        paths.dictPath = findDictionary({paths.recDir, base});
    }
    return paths;
}

ModelPaths ModelLocator::locate() const {
    fs::path root(root_);

    ModelPaths paddlex = searchPaddlex(root / ".paddlex");
    if (paddlex.complete()) {
        LOG_INFO("Using local models from {}", (root / ".paddlex").string());
        return paddlex;
    }
    if (!paddlex.detDir.empty() || !paddlex.recDir.empty()) {
        LOG_WARN(".paddlex is incomplete (det={}, rec={}, dict={})",
                 !paddlex.detDir.empty(), !paddlex.recDir.empty(), !paddlex.dictPath.empty());
    }

    fs::path models_dir = root / "models" / "paddleocr";
    ModelPaths standard = searchModelsDir(models_dir);
    if (standard.complete()) {
        LOG_INFO("Using local models from {}", models_dir.string());
        return standard;
    }

    return ModelPaths{};
}

void ModelLocator::logExpectedLayout() const {
    fs::path root(root_);
    LOG_WARN("No local OCR models found, OCR is disabled (models are never downloaded)");
    LOG_WARN("Place models in one of:");
    LOG_WARN("  1. {}", (root / ".paddlex").string());
    LOG_WARN("  2. {}", (root / "models" / "paddleocr").string());
    LOG_WARN("Layout:");
    LOG_WARN("  det/  *.dxnn      (detection, det_*640*/det_*960* or a single model)");
    LOG_WARN("  rec/  *.dxnn      (recognition, rec_*ratio_N* per aspect ratio)");
    LOG_WARN("        *dict*.txt  (character dictionary)");
    LOG_WARN("  cls/  *.dxnn      (text line orientation, optional)");
}

} // namespace picmod
