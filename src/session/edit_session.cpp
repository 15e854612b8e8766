#include "session/edit_session.h"
#include "editing/image_processor.h"
#include "io/file_handler.h"
#include "common/geometry.h"
#include "common/logger.hpp"

#include <set>
#include <stdexcept>

namespace picmod {

const char* EditErrorName(EditError error) {
    switch (error) {
        case EditError::None: return "None";
        case EditError::NoImage: return "NoImage";
        case EditError::NoSelection: return "NoSelection";
        case EditError::OcrUnavailable: return "OcrUnavailable";
        case EditError::NoText: return "NoText";
        case EditError::InvalidArgument: return "InvalidArgument";
        case EditError::IoError: return "IoError";
        case EditError::ProcessingFailed: return "ProcessingFailed";
        case EditError::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

namespace {

// 把库异常转成错误码，其它异常继续向上抛
template <typename Fn>
EditStatus guarded(const char* what, Fn&& fn) {
    try {
        return fn();
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("{}: {}", what, e.what());
        return EditStatus::Fail(EditError::InvalidArgument, e.what());
    } catch (const cv::Exception& e) {
        LOG_ERROR("{}: OpenCV error: {}", what, e.what());
        return EditStatus::Fail(EditError::ProcessingFailed, e.what());
    }
}

} // namespace

EditSession::EditSession(const EditConfig& config,
                         std::shared_ptr<OcrProcessor> ocr,
                         std::shared_ptr<TextEditor> editor)
    : config_(config),
      ocr_(std::move(ocr)),
      editor_(editor ? std::move(editor)
                     : std::make_shared<TextEditor>(nullptr, config.textPadding, config.inpaintRadius)),
      history_(config.historySize) {
}

bool EditSession::ocrAvailable() const {
    return ocr_ && ocr_->isAvailable();
}

EditStatus EditSession::requireImage() const {
    if (current_.empty()) {
        return EditStatus::Fail(EditError::NoImage, "No image is open");
    }
    return EditStatus::Ok();
}

EditStatus EditSession::requireSelection(SelectionRect& out) {
    EditStatus st = requireImage();
    if (!st.ok()) {
        return st;
    }
    selection_.normalizeSelection(current_.cols, current_.rows);
    if (!selection_.hasSelection()) {
        return EditStatus::Fail(EditError::NoSelection, "Select a region first");
    }
    out = *selection_.selection();
    return EditStatus::Ok();
}

void EditSession::commit(const cv::Mat& result) {
    current_ = result;
    history_.saveState(current_);
    selection_.clearSelection();
}

EditStatus EditSession::open(const std::string& path) {
    cv::Mat image = FileHandler::openImage(path);
    if (image.empty()) {
        return EditStatus::Fail(EditError::IoError, "Cannot open image: " + path);
    }
    return load(image, path);
}

EditStatus EditSession::load(const cv::Mat& image, const std::string& path) {
    if (image.empty()) {
        return EditStatus::Fail(EditError::InvalidArgument, "Empty image");
    }
    if (image.type() != CV_8UC3) {
        return EditStatus::Fail(EditError::InvalidArgument, "Expected an 8-bit BGR image");
    }

    original_ = image.clone();
    current_ = image.clone();
    path_ = path;
    history_.reset(current_);
    selection_.clearSelection();
    ocr_results_.clear();

    LOG_INFO("Opened {} ({}x{})", path.empty() ? "<memory>" : path, current_.cols, current_.rows);
    return EditStatus::Ok();
}

EditStatus EditSession::save() {
    EditStatus st = requireImage();
    if (!st.ok()) {
        return st;
    }
    if (path_.empty()) {
        return EditStatus::Fail(EditError::InvalidArgument, "No file path, use saveAs");
    }
    if (!FileHandler::saveImage(current_, path_, config_.jpegQuality)) {
        return EditStatus::Fail(EditError::IoError, "Failed to save " + path_);
    }
    return EditStatus::Ok("Saved " + path_);
}

EditStatus EditSession::saveAs(const std::string& path) {
    EditStatus st = requireImage();
    if (!st.ok()) {
        return st;
    }
    if (path.empty()) {
        return EditStatus::Fail(EditError::InvalidArgument, "Empty output path");
    }
    if (!FileHandler::saveImage(current_, path, config_.jpegQuality)) {
        return EditStatus::Fail(EditError::IoError, "Failed to save " + path);
    }
    path_ = FileHandler::resolveSavePath(path);
    return EditStatus::Ok("Saved " + path_);
}

EditStatus EditSession::reset() {
    EditStatus st = requireImage();
    if (!st.ok()) {
        return st;
    }
    current_ = original_.clone();
    history_.reset(current_);
    selection_.clearSelection();
    ocr_results_.clear();
    return EditStatus::Ok();
}

EditStatus EditSession::undo() {
    if (!history_.canUndo()) {
        return EditStatus::Fail(EditError::InvalidArgument, "Nothing to undo");
    }
    current_ = history_.undo();
    selection_.clearSelection();
    ocr_results_.clear();
    return EditStatus::Ok();
}

EditStatus EditSession::redo() {
    if (!history_.canRedo()) {
        return EditStatus::Fail(EditError::InvalidArgument, "Nothing to redo");
    }
    current_ = history_.redo();
    selection_.clearSelection();
    ocr_results_.clear();
    return EditStatus::Ok();
}

EditStatus EditSession::stitchSelection() {
    SelectionRect sel;
    EditStatus st = requireSelection(sel);
    if (!st.ok()) {
        return st;
    }

    return guarded("stitchSelection", [&]() {
        cv::Mat result = ImageProcessor::verticalDeleteAndStitch(current_, sel);
        if (result.rows == current_.rows) {
            return EditStatus::Fail(EditError::InvalidArgument, "Selection would remove the whole image");
        }
        commit(result);
        // 行坐标已变化
        ocr_results_.clear();
        return EditStatus::Ok("Vertical delete and stitch done");
    });
}

EditStatus EditSession::fillSelection(FillMode mode, const std::optional<cv::Vec3b>& color) {
    SelectionRect sel;
    EditStatus st = requireSelection(sel);
    if (!st.ok()) {
        return st;
    }

    return guarded("fillSelection", [&]() {
        cv::Mat result = ImageProcessor::smartFill(current_, sel, mode, color, config_.inpaintRadius);
        commit(result);
        return EditStatus::Ok("Smart fill done (" + ImageProcessor::fillModeName(mode) + ")");
    });
}

EditStatus EditSession::recognizeSelection() {
    SelectionRect sel;
    EditStatus st = requireSelection(sel);
    if (!st.ok()) {
        return st;
    }
    if (!ocr_ || !ocr_->initialize()) {
        return EditStatus::Fail(EditError::OcrUnavailable,
                                "OCR is unavailable, check the inference runtime and model files");
    }

    std::vector<TextBox> results = ocr_->recognizeRegion(current_, sel);
    if (results.empty()) {
        return EditStatus::Fail(EditError::NoText, "No text recognized");
    }
    ocr_results_ = std::move(results);
    return EditStatus::Ok("Recognized " + std::to_string(ocr_results_.size()) + " text lines");
}

std::vector<TextBox> EditSession::textsInSelection(const SelectionRect& sel) const {
    std::vector<TextBox> inside;
    for (const auto& box : ocr_results_) {
        if (Geometry::isBoxInside(box, sel)) {
            inside.push_back(box);
        }
    }
    return inside;
}

EditStatus EditSession::deleteBoxes(const std::vector<TextBox>& boxes) {
    return guarded("deleteTexts", [&]() {
        cv::Mat result = editor_->deleteText(current_, boxes);
        commit(result);

        // 从识别结果中移除已删除的文字
        std::set<int> removed;
        for (const auto& b : boxes) {
            removed.insert(b.index);
        }
        std::vector<TextBox> kept;
        for (const auto& b : ocr_results_) {
            if (!removed.count(b.index)) {
                kept.push_back(b);
            }
        }
        for (size_t i = 0; i < kept.size(); i++) {
            kept[i].index = static_cast<int>(i);
        }
        ocr_results_ = std::move(kept);

        return EditStatus::Ok("Deleted " + std::to_string(boxes.size()) + " text lines");
    });
}

EditStatus EditSession::deleteTexts(const std::vector<int>& indices) {
    EditStatus st = requireImage();
    if (!st.ok()) {
        return st;
    }
    if (ocr_results_.empty()) {
        return EditStatus::Fail(EditError::NoText, "No recognized text, run text recognition first");
    }
    if (indices.empty()) {
        return EditStatus::Fail(EditError::InvalidArgument, "No text selected");
    }

    std::set<int> unique(indices.begin(), indices.end());
    std::vector<TextBox> boxes;
    for (int idx : unique) {
        if (idx < 0 || idx >= static_cast<int>(ocr_results_.size())) {
            return EditStatus::Fail(EditError::InvalidArgument,
                                    "Text index out of range: " + std::to_string(idx));
        }
        boxes.push_back(ocr_results_[idx]);
    }
    return deleteBoxes(boxes);
}

EditStatus EditSession::deleteTextsInSelection() {
    EditStatus st = requireImage();
    if (!st.ok()) {
        return st;
    }
    if (ocr_results_.empty()) {
        return EditStatus::Fail(EditError::NoText, "No recognized text, run text recognition first");
    }

    SelectionRect sel;
    st = requireSelection(sel);
    if (!st.ok()) {
        return st;
    }

    std::vector<TextBox> boxes = textsInSelection(sel);
    if (boxes.empty()) {
        return EditStatus::Fail(EditError::NoText, "No recognized text inside the selection");
    }
    return deleteBoxes(boxes);
}

EditStatus EditSession::replaceBox(const TextBox& box, const std::string& new_text,
                                   const std::optional<FontParams>& params) {
    if (new_text.empty()) {
        return EditStatus::Fail(EditError::InvalidArgument, "New text must not be empty");
    }

    return guarded("replaceText", [&]() {
        cv::Mat result = editor_->replaceText(current_, box, new_text, params);
        commit(result);
        // 替换后位置可能变化，需重新识别
        ocr_results_.clear();
        return EditStatus::Ok("Replaced '" + box.text + "' -> '" + new_text + "'");
    });
}

EditStatus EditSession::replaceText(int index, const std::string& new_text,
                                    const std::optional<FontParams>& params) {
    EditStatus st = requireImage();
    if (!st.ok()) {
        return st;
    }
    if (ocr_results_.empty()) {
        return EditStatus::Fail(EditError::NoText, "No recognized text, run text recognition first");
    }
    if (index < 0 || index >= static_cast<int>(ocr_results_.size())) {
        return EditStatus::Fail(EditError::InvalidArgument,
                                "Text index out of range: " + std::to_string(index));
    }
    TextBox box = ocr_results_[index];
    return replaceBox(box, new_text, params);
}

EditStatus EditSession::replaceTextInSelection(const std::string& new_text,
                                               const std::optional<FontParams>& params) {
    EditStatus st = requireImage();
    if (!st.ok()) {
        return st;
    }
    if (ocr_results_.empty()) {
        return EditStatus::Fail(EditError::NoText, "No recognized text, run text recognition first");
    }

    SelectionRect sel;
    st = requireSelection(sel);
    if (!st.ok()) {
        return st;
    }

    std::vector<TextBox> boxes = textsInSelection(sel);
    if (boxes.empty()) {
        return EditStatus::Fail(EditError::NoText, "No recognized text inside the selection");
    }
    return replaceBox(boxes.front(), new_text, params);
}

EditStatus EditSession::addText(const SelectionRect& rect, const std::string& text,
                                const std::optional<FontParams>& params) {
    EditStatus st = requireImage();
    if (!st.ok()) {
        return st;
    }
    if (text.empty()) {
        return EditStatus::Fail(EditError::InvalidArgument, "Text must not be empty");
    }

    cv::Rect r = rect.normalized().clampedTo(current_.cols, current_.rows).toRect();
    if (r.empty()) {
        return EditStatus::Fail(EditError::NoSelection, "Target rectangle is outside the image");
    }

    return guarded("addText", [&]() {
        cv::Mat result = editor_->addText(current_, TextBox::FromRect(r), text, params);
        commit(result);
        return EditStatus::Ok("Added '" + text + "'");
    });
}

} // namespace picmod
