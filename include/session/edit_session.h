#pragma once

#include <opencv2/opencv.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/config.h"
#include "common/types.hpp"
#include "editing/history_manager.h"
#include "editing/selection_manager.h"
#include "ocr/ocr_processor.h"
#include "text/text_editor.h"

namespace picmod {

/**
 * @brief 编辑操作错误码
 */
enum class EditError {
    None = 0,
    NoImage,            // 请先打开图片
    NoSelection,        // 请先选择区域
    OcrUnavailable,     // OCR功能不可用
    NoText,             // 没有识别到的文字
    InvalidArgument,
    IoError,
    ProcessingFailed,   // OpenCV / 运行时异常
    Cancelled
};

const char* EditErrorName(EditError error);

/**
 * @brief 编辑操作结果
 */
struct EditStatus {
    EditError error = EditError::None;
    std::string message;

    bool ok() const { return error == EditError::None; }

    static EditStatus Ok(const std::string& msg = "") { return {EditError::None, msg}; }
    static EditStatus Fail(EditError err, const std::string& msg) { return {err, msg}; }
};

/**
 * @brief 单张图片的编辑会话
 *
 * Holds the original and current image, undo history, the selection and the
 * last OCR results. Opening an image resets history to it; every successful
 * mutation pushes its result so undo returns to the state before it.
 * Mutations clear the selection. Not thread-safe; AsyncEditor serializes
 * access.
 */
class EditSession {
public:
    /**
     * @param config 编辑配置
     * @param ocr OCR 处理器，可为空（OCR 不可用）
     * @param editor 文字编辑器，为空时创建默认实例
     */
    EditSession(const EditConfig& config,
                std::shared_ptr<OcrProcessor> ocr,
                std::shared_ptr<TextEditor> editor = nullptr);

    // ---- 文件 ----

    EditStatus open(const std::string& path);

    /**
     * @brief 直接载入内存图像（路径可为空）
     */
    EditStatus load(const cv::Mat& image, const std::string& path = "");

    /**
     * @brief 保存到当前路径，没有路径时返回 InvalidArgument
     */
    EditStatus save();

    /**
     * @brief 另存为，成功后更新当前路径
     */
    EditStatus saveAs(const std::string& path);

    /**
     * @brief 回到原始图像并重置历史
     */
    EditStatus reset();

    // ---- 历史 ----

    EditStatus undo();
    EditStatus redo();

    // ---- 图像编辑 ----

    EditStatus stitchSelection();
    EditStatus fillSelection(FillMode mode, const std::optional<cv::Vec3b>& color = std::nullopt);

    // ---- 文字 ----

    /**
     * @brief 识别选区内文字，结果保存在会话中
     * @return 未识别到文字时返回 NoText，保留之前的结果
     */
    EditStatus recognizeSelection();

    /**
     * @brief 删除指定序号的识别结果对应的文字
     */
    EditStatus deleteTexts(const std::vector<int>& indices);

    /**
     * @brief 删除完全位于选区内的识别文字
     */
    EditStatus deleteTextsInSelection();

    /**
     * @brief 替换指定序号的文字，成功后清空识别结果
     * @param params 为空时从原文字提取特征并匹配字体
     */
    EditStatus replaceText(int index, const std::string& new_text,
                           const std::optional<FontParams>& params = std::nullopt);

    /**
     * @brief 替换选区内第一个识别文字
     */
    EditStatus replaceTextInSelection(const std::string& new_text,
                                      const std::optional<FontParams>& params = std::nullopt);

    /**
     * @brief 在矩形区域内添加文字
     */
    EditStatus addText(const SelectionRect& rect, const std::string& text,
                       const std::optional<FontParams>& params = std::nullopt);

    // ---- 状态 ----

    bool hasImage() const { return !current_.empty(); }
    const cv::Mat& currentImage() const { return current_; }
    const cv::Mat& originalImage() const { return original_; }
    const std::string& filePath() const { return path_; }

    const std::vector<TextBox>& ocrResults() const { return ocr_results_; }
    void clearOcrResults() { ocr_results_.clear(); }

    SelectionManager& selection() { return selection_; }
    const SelectionManager& selection() const { return selection_; }

    const HistoryManager& history() const { return history_; }
    bool ocrAvailable() const;

    TextEditor& textEditor() { return *editor_; }

private:
    EditStatus requireImage() const;
    EditStatus requireSelection(SelectionRect& out);
    std::vector<TextBox> textsInSelection(const SelectionRect& sel) const;
    EditStatus deleteBoxes(const std::vector<TextBox>& boxes);
    EditStatus replaceBox(const TextBox& box, const std::string& new_text,
                          const std::optional<FontParams>& params);

    // Makes result current and records it in history
    void commit(const cv::Mat& result);

    EditConfig config_;
    std::shared_ptr<OcrProcessor> ocr_;
    std::shared_ptr<TextEditor> editor_;

    cv::Mat original_;
    cv::Mat current_;
    std::string path_;

    HistoryManager history_;
    SelectionManager selection_;
    std::vector<TextBox> ocr_results_;
};

} // namespace picmod
