#include "io/file_handler.h"
#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>

namespace fs = std::filesystem;

namespace picmod {

const std::vector<std::string>& FileHandler::SupportedFormats() {
    static const std::vector<std::string> formats = {
        ".jpg", ".jpeg", ".png", ".bmp", ".gif", ".webp", ".tiff", ".tif"
    };
    return formats;
}

std::string FileHandler::lowerExtension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool FileHandler::isSupportedFormat(const std::string& path) {
    const auto& formats = SupportedFormats();
    return std::find(formats.begin(), formats.end(), lowerExtension(path)) != formats.end();
}

cv::Mat FileHandler::openImage(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        LOG_ERROR("File does not exist: {}", path);
        return cv::Mat();
    }

    if (!isSupportedFormat(path)) {
        LOG_ERROR("Unsupported image format: {}", fs::path(path).extension().string());
        return cv::Mat();
    }

    cv::Mat image;
    try {
        // IMREAD_COLOR drops alpha and expands grayscale to 3 channels
        image = cv::imread(path, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        LOG_ERROR("Failed to decode {}: {}", path, e.what());
        return cv::Mat();
    }

    if (image.empty()) {
        LOG_ERROR("Failed to decode image: {}", path);
        return cv::Mat();
    }

    LOG_DEBUG("Opened {} ({}x{})", path, image.cols, image.rows);
    return image;
}

std::string FileHandler::resolveSavePath(const std::string& path) {
    if (fs::path(path).extension().empty()) {
        return path + ".png";
    }
    // 没有 GIF 编码器的 OpenCV 版本改存为 PNG
    if (lowerExtension(path) == ".gif" && !cv::haveImageWriter(path)) {
        return fs::path(path).replace_extension(".png").string();
    }
    return path;
}

bool FileHandler::saveImage(const cv::Mat& image, const std::string& path, int quality) {
    if (image.empty()) {
        LOG_ERROR("Cannot save empty image to {}", path);
        return false;
    }

    std::string target = resolveSavePath(path);
    std::string ext = lowerExtension(target);
    if (lowerExtension(path) == ".gif" && ext != ".gif") {
        LOG_WARN("GIF encoding not available, saving {} as {}", path, target);
    }

    fs::path parent = fs::path(target).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            LOG_ERROR("Cannot create directory {}: {}", parent.string(), ec.message());
            return false;
        }
    }

    std::vector<int> params;
    std::string encode_ext = ext;
    if (ext == ".jpg" || ext == ".jpeg") {
        params = {cv::IMWRITE_JPEG_QUALITY, quality};
    } else if (ext == ".webp") {
        params = {cv::IMWRITE_WEBP_QUALITY, quality};
    } else if (ext != ".png" && ext != ".bmp" && ext != ".tif" && ext != ".tiff" && ext != ".gif") {
        // Unknown extensions go through the PNG encoder
        encode_ext = ".png";
    }

    try {
        if (encode_ext == ext) {
            if (!cv::imwrite(target, image, params)) {
                LOG_ERROR("Failed to save image to {}", target);
                return false;
            }
        } else {
            std::vector<uchar> buffer;
            if (!cv::imencode(encode_ext, image, buffer)) {
                LOG_ERROR("Failed to encode image for {}", target);
                return false;
            }
            std::FILE* fp = std::fopen(target.c_str(), "wb");
            if (!fp) {
                LOG_ERROR("Cannot open {} for writing", target);
                return false;
            }
            size_t written = std::fwrite(buffer.data(), 1, buffer.size(), fp);
            std::fclose(fp);
            if (written != buffer.size()) {
                LOG_ERROR("Short write to {}", target);
                return false;
            }
        }
    } catch (const cv::Exception& e) {
        LOG_ERROR("Failed to save image to {}: {}", target, e.what());
        return false;
    }

    LOG_INFO("Saved image: {}", target);
    return true;
}

ImageInfo FileHandler::imageInfo(const cv::Mat& image, const std::string& path) {
    ImageInfo info;
    if (image.empty()) {
        return info;
    }
    info.width = image.cols;
    info.height = image.rows;
    info.channels = image.channels();

    std::string ext = lowerExtension(path);
    if (ext == ".jpg" || ext == ".jpeg") {
        info.format = "JPEG";
    } else if (ext == ".tif" || ext == ".tiff") {
        info.format = "TIFF";
    } else if (!ext.empty() && isSupportedFormat(path)) {
        info.format = ext.substr(1);
        std::transform(info.format.begin(), info.format.end(), info.format.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    }
    return info;
}

} // namespace picmod
