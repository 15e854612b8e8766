#include "json_report.h"
#include <uuid/uuid.h>
#include <cmath>

namespace picmod_cli {

std::string JsonReportBuilder::GenerateUUID() {
    uuid_t uuid;
    uuid_generate(uuid);

    char uuid_str[37];
    uuid_unparse_lower(uuid, uuid_str);

    return std::string(uuid_str);
}

json JsonReportBuilder::BuildSuccessReport(const std::vector<picmod::TextBox>& results,
                                           const std::string& vis_image_path) {
    json report;
    report["logId"] = GenerateUUID();
    report["errorCode"] = ErrorCode::SUCCESS;
    report["errorMsg"] = "Success";

    json ocr_results = json::array();
    for (const auto& box : results) {
        ocr_results.push_back(ConvertTextBoxToJson(box));
    }
    report["result"]["ocrResults"] = ocr_results;

    if (!vis_image_path.empty()) {
        report["result"]["ocrImage"] = vis_image_path;
    }

    return report;
}

json JsonReportBuilder::BuildErrorReport(int error_code, const std::string& error_msg) {
    json report;
    report["logId"] = GenerateUUID();
    report["errorCode"] = error_code;
    report["errorMsg"] = error_msg;
    return report;
}

json JsonReportBuilder::BuildErrorReport(const picmod::EditStatus& status) {
    return BuildErrorReport(ErrorCode::FromEditError(status.error), status.message);
}

json JsonReportBuilder::ConvertTextBoxToJson(const picmod::TextBox& box) {
    json item;

    item["text"] = box.text;

    // 保留3位小数
    item["score"] = std::round(box.confidence * 1000.0) / 1000.0;

    // 文本框四个顶点，保留1位小数
    json points = json::array();
    for (const auto& pt : box.points) {
        json point;
        point["x"] = std::round(pt.x * 10.0) / 10.0;
        point["y"] = std::round(pt.y * 10.0) / 10.0;
        points.push_back(point);
    }
    item["points"] = points;

    return item;
}

namespace ErrorCode {

int FromEditError(picmod::EditError error) {
    switch (error) {
        case picmod::EditError::None:
            return SUCCESS;
        case picmod::EditError::NoImage:
        case picmod::EditError::IoError:
            return NOT_FOUND;
        case picmod::EditError::NoSelection:
        case picmod::EditError::InvalidArgument:
            return INVALID_PARAMETER;
        case picmod::EditError::OcrUnavailable:
            return SERVICE_UNAVAILABLE;
        case picmod::EditError::NoText:
        case picmod::EditError::ProcessingFailed:
        case picmod::EditError::Cancelled:
            return INTERNAL_ERROR;
    }
    return INTERNAL_ERROR;
}

} // namespace ErrorCode

} // namespace picmod_cli
