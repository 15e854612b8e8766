#include "text/font_manager.h"
#include "text/utf8.h"
#include "common/logger.hpp"

#include <ft2build.h>
#include FT_FREETYPE_H

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <set>

namespace fs = std::filesystem;

namespace picmod {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string homeDir() {
    const char* home = std::getenv("HOME");
    return home ? std::string(home) : std::string();
}

} // namespace

FontManager::FontManager(std::vector<std::string> extra_dirs, std::string fallback_font)
    : dirs_(std::move(extra_dirs)),
      fallback_font_(std::move(fallback_font)) {
    for (const auto& dir : DefaultFontDirs()) {
        dirs_.push_back(dir);
    }
}

std::vector<std::string> FontManager::DefaultFontDirs() {
#if defined(_WIN32)
    const char* windir = std::getenv("WINDIR");
    return {std::string(windir ? windir : "C:\\Windows") + "\\Fonts"};
#elif defined(__APPLE__)
    std::vector<std::string> dirs = {"/System/Library/Fonts", "/Library/Fonts"};
    if (!homeDir().empty()) dirs.push_back(homeDir() + "/Library/Fonts");
    return dirs;
#else
    std::vector<std::string> dirs = {"/usr/share/fonts", "/usr/local/share/fonts"};
    if (!homeDir().empty()) dirs.push_back(homeDir() + "/.fonts");
    return dirs;
#endif
}

const std::vector<std::string>& FontManager::CommonFonts() {
    static const std::vector<std::string> fonts = {
        "SimHei", "SimSun", "Microsoft YaHei", "KaiTi", "FangSong",
        "Arial", "Times New Roman", "Courier New", "Calibri"
    };
    return fonts;
}

bool FontManager::ContainsCJK(const std::string& utf8) {
    for (char32_t cp : DecodeUtf8(utf8)) {
        if (cp >= 0x4E00 && cp <= 0x9FFF) {
            return true;
        }
    }
    return false;
}

bool FontManager::IsValidFontFile(const std::string& path) {
    FT_Library library = nullptr;
    if (FT_Init_FreeType(&library) != 0) {
        LOG_ERROR("FT_Init_FreeType failed");
        return false;
    }

    FT_Face face = nullptr;
    bool ok = FT_New_Face(library, path.c_str(), 0, &face) == 0;
    if (ok) {
        ok = FT_Set_Pixel_Sizes(face, 0, 12) == 0;
        FT_Done_Face(face);
    }
    FT_Done_FreeType(library);
    return ok;
}

void FontManager::scanLocked() {
    if (scanned_) {
        return;
    }
    scanned_ = true;

    static const std::set<std::string> extensions = {".ttf", ".otf", ".ttc"};
    std::set<std::string> seen_paths;

    for (const auto& dir : dirs_) {
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) {
            continue;
        }

        std::vector<fs::path> candidates;
        for (auto it = fs::recursive_directory_iterator(dir, fs::directory_options::skip_permission_denied, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (it->is_regular_file(ec) && extensions.count(toLower(it->path().extension().string()))) {
                candidates.push_back(it->path());
            }
        }
        std::sort(candidates.begin(), candidates.end());

        for (const auto& path : candidates) {
            if (!seen_paths.insert(path.string()).second) {
                continue;
            }
            if (!IsValidFontFile(path.string())) {
                LOG_DEBUG("Skipping unreadable font: {}", path.string());
                continue;
            }
            files_.push_back({path.stem().string(), path.string()});
        }
    }

    LOG_DEBUG("Font scan: {} usable font files in {} directories", files_.size(), dirs_.size());
}

std::vector<std::string> FontManager::systemFonts() {
    std::lock_guard<std::mutex> lock(mutex_);
    scanLocked();

    std::set<std::string> names;
    for (const auto& f : files_) {
        names.insert(f.name);
    }
    for (const auto& name : CommonFonts()) {
        names.insert(name);
    }
    return std::vector<std::string>(names.begin(), names.end());
}

std::string FontManager::findFontPathLocked(const std::string& name) {
    if (name.empty()) {
        return "";
    }

    auto cached = path_cache_.find(name);
    if (cached != path_cache_.end()) {
        return cached->second;
    }

    scanLocked();

    std::string needle = toLower(name);
    for (const auto& f : files_) {
        std::string file = toLower(fs::path(f.path).filename().string());
        std::string ext = toLower(fs::path(f.path).extension().string());
        if ((ext == ".ttf" || ext == ".otf") && file.find(needle) != std::string::npos) {
            path_cache_[name] = f.path;
            return f.path;
        }
    }
    return "";
}

std::string FontManager::findFontPath(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return findFontPathLocked(name);
}

std::pair<std::string, int> FontManager::matchFont(const FontFeatures& features, const std::string& text) {
    std::vector<std::string> preferred;
    if (ContainsCJK(text)) {
        preferred = {"SimHei", "Microsoft YaHei", "SimSun", "KaiTi"};
        if (features.isBold) {
            preferred.insert(preferred.begin(), {"SimHei", "Microsoft YaHei", "KaiTi"});
        }
    } else {
        preferred = {"Arial", "Times New Roman", "Calibri", "Courier New"};
        if (features.isBold) {
            preferred.insert(preferred.begin(), {"Arial Bold", "Times New Roman Bold"});
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto& name : preferred) {
        std::string path = findFontPathLocked(name);
        if (!path.empty()) {
            LOG_DEBUG("Matched font '{}' -> {}", name, path);
            return {path, features.fontSize};
        }
    }

    if (!fallback_font_.empty()) {
        std::error_code ec;
        if (fs::is_regular_file(fallback_font_, ec)) {
            return {fallback_font_, features.fontSize};
        }
        std::string path = findFontPathLocked(fallback_font_);
        if (!path.empty()) {
            return {path, features.fontSize};
        }
    }

    // 第一个可用字体
    scanLocked();
    for (const auto& f : files_) {
        std::string ext = toLower(fs::path(f.path).extension().string());
        if (ext != ".ttc") {
            return {f.path, features.fontSize};
        }
    }
    if (!files_.empty()) {
        return {files_.front().path, features.fontSize};
    }

    LOG_WARN("No usable font found, text will use the built-in Hershey font");
    return {"", features.fontSize};
}

} // namespace picmod
