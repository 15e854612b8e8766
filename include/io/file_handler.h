#pragma once

#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

namespace picmod {

/**
 * @brief 图像基本信息
 */
struct ImageInfo {
    int width = 0;
    int height = 0;
    int channels = 0;
    std::string format = "Unknown";
};

/**
 * @brief 图像文件读写工具
 */
class FileHandler {
public:
    /**
     * @brief 支持的扩展名（小写，含点）
     */
    static const std::vector<std::string>& SupportedFormats();

    /**
     * @brief 检查文件扩展名是否受支持（不区分大小写）
     */
    static bool isSupportedFormat(const std::string& path);

    /**
     * @brief 打开图像文件，统一转换为 8 位 BGR
     * @return 失败时返回空Mat并记录错误日志
     */
    static cv::Mat openImage(const std::string& path);

    /**
     * @brief 保存图像
     *
     * Creates missing parent directories. JPEG and WebP use `quality`;
     * a path without extension gets ".png"; unknown extensions are written
     * with the PNG encoder. GIF is written as GIF when the OpenCV build has
     * a GIF encoder, otherwise under the same name with ".png".
     *
     * @see resolveSavePath
     *
     * @param image 图像
     * @param path 目标路径
     * @param quality JPEG/WebP质量 (1-100)
     * @return 是否保存成功
     */
    static bool saveImage(const cv::Mat& image, const std::string& path, int quality = 95);

    /**
     * @brief 实际写入路径（无扩展名时追加 .png，无 GIF 编码器时 .gif 改为 .png）
     */
    static std::string resolveSavePath(const std::string& path);

    /**
     * @brief 图像信息，format 取自路径扩展名
     */
    static ImageInfo imageInfo(const cv::Mat& image, const std::string& path = "");

private:
    static std::string lowerExtension(const std::string& path);
};

} // namespace picmod
