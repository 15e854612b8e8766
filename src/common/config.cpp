#include "common/config.h"
#include <fstream>

namespace picmod {

void OcrConfig::Show() const {
    LOG_INFO("OcrConfig:");
    LOG_INFO("  modelRoot={}", modelRoot);
    LOG_INFO("  useClassifier={}", useClassifier);
    LOG_INFO("  detThresh={:.2f}, detBoxThresh={:.2f}, unclipRatio={:.2f}",
             detThresh, detBoxThresh, unclipRatio);
    LOG_INFO("  recScoreThresh={:.2f}, clsThresh={:.2f}", recScoreThresh, clsThresh);
}

void EditConfig::Show() const {
    LOG_INFO("EditConfig:");
    LOG_INFO("  historySize={}, inpaintRadius={:.1f}, textPadding={}, jpegQuality={}",
             historySize, inpaintRadius, textPadding, jpegQuality);
}

void FontConfig::Show() const {
    LOG_INFO("FontConfig:");
    LOG_INFO("  extraDirs={}", extraDirs.size());
    LOG_INFO("  fallbackFont={}", fallbackFont.empty() ? "(none)" : fallbackFont);
}

AppConfig AppConfig::FromJson(const json& j) {
    AppConfig cfg;

    if (j.contains("log")) {
        const auto& l = j["log"];
        if (l.contains("level")) cfg.log.level = l["level"].get<std::string>();
        if (l.contains("dir")) cfg.log.logDir = l["dir"].get<std::string>();
        if (l.contains("file")) cfg.log.fileName = l["file"].get<std::string>();
        if (l.contains("maxFileSize")) cfg.log.maxFileSize = l["maxFileSize"].get<size_t>();
        if (l.contains("maxFiles")) cfg.log.maxFiles = l["maxFiles"].get<size_t>();
        if (l.contains("color")) cfg.log.colorConsole = l["color"].get<bool>();
    }

    if (j.contains("ocr")) {
        const auto& o = j["ocr"];
        if (o.contains("modelRoot")) cfg.ocr.modelRoot = o["modelRoot"].get<std::string>();
        if (o.contains("useClassifier")) cfg.ocr.useClassifier = o["useClassifier"].get<bool>();
        if (o.contains("detThresh")) cfg.ocr.detThresh = o["detThresh"].get<float>();
        if (o.contains("detBoxThresh")) cfg.ocr.detBoxThresh = o["detBoxThresh"].get<float>();
        if (o.contains("unclipRatio")) cfg.ocr.unclipRatio = o["unclipRatio"].get<float>();
        if (o.contains("maxCandidates")) cfg.ocr.maxCandidates = o["maxCandidates"].get<int>();
        if (o.contains("detSizeThreshold")) cfg.ocr.detSizeThreshold = o["detSizeThreshold"].get<int>();
        if (o.contains("recScoreThresh")) cfg.ocr.recScoreThresh = o["recScoreThresh"].get<float>();
        if (o.contains("clsThresh")) cfg.ocr.clsThresh = o["clsThresh"].get<float>();
    }

    if (j.contains("edit")) {
        const auto& e = j["edit"];
        if (e.contains("historySize")) cfg.edit.historySize = e["historySize"].get<size_t>();
        if (e.contains("inpaintRadius")) cfg.edit.inpaintRadius = e["inpaintRadius"].get<double>();
        if (e.contains("textPadding")) cfg.edit.textPadding = e["textPadding"].get<int>();
        if (e.contains("jpegQuality")) cfg.edit.jpegQuality = e["jpegQuality"].get<int>();
    }

    if (j.contains("font")) {
        const auto& f = j["font"];
        if (f.contains("dirs")) cfg.font.extraDirs = f["dirs"].get<std::vector<std::string>>();
        if (f.contains("fallback")) cfg.font.fallbackFont = f["fallback"].get<std::string>();
    }

    if (j.contains("workers")) cfg.workers = j["workers"].get<int>();

    return cfg;
}

bool AppConfig::LoadFile(const std::string& path, AppConfig& config, std::string& error_msg) {
    std::ifstream in(path);
    if (!in.is_open()) {
        error_msg = "Cannot open config file: " + path;
        return false;
    }

    try {
        json j = json::parse(in);
        config = FromJson(j);
    } catch (const json::exception& e) {
        error_msg = "Invalid config file " + path + ": " + e.what();
        return false;
    }

    return config.Validate(error_msg);
}

bool AppConfig::Validate(std::string& error_msg) const {
    if (ocr.detThresh <= 0.0f || ocr.detThresh >= 1.0f) {
        error_msg = "ocr.detThresh must be in range (0, 1)";
        return false;
    }
    if (ocr.detBoxThresh <= 0.0f || ocr.detBoxThresh >= 1.0f) {
        error_msg = "ocr.detBoxThresh must be in range (0, 1)";
        return false;
    }
    if (ocr.unclipRatio <= 0.0f) {
        error_msg = "ocr.unclipRatio must be positive";
        return false;
    }
    if (ocr.maxCandidates < 1) {
        error_msg = "ocr.maxCandidates must be at least 1";
        return false;
    }
    if (ocr.detSizeThreshold < 1) {
        error_msg = "ocr.detSizeThreshold must be positive";
        return false;
    }
    if (ocr.clsThresh < 0.0f || ocr.clsThresh > 1.0f) {
        error_msg = "ocr.clsThresh must be in range [0, 1]";
        return false;
    }
    if (ocr.recScoreThresh < 0.0f || ocr.recScoreThresh > 1.0f) {
        error_msg = "ocr.recScoreThresh must be in range [0, 1]";
        return false;
    }
    if (edit.historySize < 1) {
        error_msg = "edit.historySize must be at least 1";
        return false;
    }
    if (edit.inpaintRadius <= 0.0) {
        error_msg = "edit.inpaintRadius must be positive";
        return false;
    }
    if (edit.textPadding < 0) {
        error_msg = "edit.textPadding must not be negative";
        return false;
    }
    if (edit.jpegQuality < 1 || edit.jpegQuality > 100) {
        error_msg = "edit.jpegQuality must be in range [1, 100]";
        return false;
    }
    if (workers < 1 || workers > 64) {
        error_msg = "workers must be in range [1, 64]";
        return false;
    }

    auto lvl = spdlog::level::from_str(log.level);
    if (lvl == spdlog::level::off && log.level != "off") {
        error_msg = "Unknown log level: " + log.level;
        return false;
    }

    return true;
}

void AppConfig::Show() const {
    LOG_INFO("AppConfig: workers={}, logLevel={}", workers, log.level);
    ocr.Show();
    edit.Show();
    font.Show();
}

} // namespace picmod
