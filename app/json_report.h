#pragma once

#include "common/types.hpp"
#include "session/edit_session.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace picmod_cli {

/**
 * @brief OCR 结果 JSON 报告构建器
 */
class JsonReportBuilder {
public:
    /**
     * @brief 生成UUID作为logId
     */
    static std::string GenerateUUID();

    /**
     * @brief 构建成功的OCR报告
     * @param results OCR识别结果列表
     * @param vis_image_path 可视化图片路径（可选）
     * @return JSON报告对象
     */
    static json BuildSuccessReport(const std::vector<picmod::TextBox>& results,
                                   const std::string& vis_image_path = "");

    /**
     * @brief 构建错误报告
     */
    static json BuildErrorReport(int error_code, const std::string& error_msg);

    /**
     * @brief 由编辑状态构建错误报告
     */
    static json BuildErrorReport(const picmod::EditStatus& status);

    /**
     * @brief 将单个文本框转换为JSON
     *
     * score keeps 3 decimals, point coordinates keep 1 decimal.
     */
    static json ConvertTextBoxToJson(const picmod::TextBox& box);
};

/**
 * @brief 报告错误码定义
 */
namespace ErrorCode {
    constexpr int SUCCESS = 0;
    constexpr int INVALID_PARAMETER = 400;
    constexpr int NOT_FOUND = 404;
    constexpr int INTERNAL_ERROR = 500;
    constexpr int SERVICE_UNAVAILABLE = 503;

    /**
     * @brief 编辑错误码映射为报告错误码
     */
    int FromEditError(picmod::EditError error);
}

} // namespace picmod_cli
