#include "cli_options.h"
#include "json_report.h"
#include "common/config.h"
#include "common/logger.hpp"
#include "common/visualizer.h"
#include "editing/image_processor.h"
#include "io/file_handler.h"
#include "ocr/ocr_engine.h"
#include "session/async_editor.h"
#include "session/edit_session.h"
#include "text/font_manager.h"

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace fs = std::filesystem;
using namespace picmod_cli;

namespace {

/**
 * @brief 默认输出路径：<dir>/<stem><suffix><ext>
 */
std::string derivedPath(const std::string& input, const std::string& suffix, const std::string& ext = "") {
    fs::path p(input);
    std::string extension = ext.empty() ? p.extension().string() : ext;
    if (extension.empty()) {
        extension = ".png";
    }
    return (p.parent_path() / (p.stem().string() + suffix + extension)).string();
}

std::optional<picmod::FontParams> buildFontParams(const CliOptions& opts) {
    if (opts.font.empty() && opts.size <= 0 && !opts.color) {
        return std::nullopt;
    }

    picmod::FontParams params;
    std::error_code ec;
    if (!opts.font.empty()) {
        if (fs::is_regular_file(opts.font, ec)) {
            params.fontPath = opts.font;
        } else {
            params.fontName = opts.font;
        }
    }
    params.fontSize = opts.size;
    params.fontColor = opts.color;
    return params;
}

int exitCodeFor(const picmod::EditStatus& status) {
    return status.ok() ? ExitCode::SUCCESS : ExitCode::PROCESSING_ERROR;
}

/**
 * @brief 后台执行任务并等待结果
 */
picmod::EditStatus runTask(picmod::AsyncEditor& editor,
                           std::shared_ptr<picmod::EditSession> session,
                           picmod::AsyncEditor::Task task) {
    auto future = editor.submit(std::move(session), std::move(task),
                                [](int percent, const std::string& message) {
                                    LOG_INFO("[{:3d}%] {}", percent, message);
                                });
    return future.get();
}

int listFonts(const picmod::AppConfig& config) {
    picmod::FontManager fonts(config.font.extraDirs, config.font.fallbackFont);
    for (const auto& name : fonts.systemFonts()) {
        std::cout << name << "\n";
    }
    return ExitCode::SUCCESS;
}

int printInfo(const CliOptions& opts) {
    cv::Mat image = picmod::FileHandler::openImage(opts.input);
    if (image.empty()) {
        std::cerr << "Error: cannot open image " << opts.input << "\n";
        return ExitCode::PROCESSING_ERROR;
    }

    picmod::ImageInfo info = picmod::FileHandler::imageInfo(image, opts.input);
    json j;
    j["path"] = opts.input;
    j["width"] = info.width;
    j["height"] = info.height;
    j["channels"] = info.channels;
    j["format"] = info.format;
    std::cout << j.dump(2) << std::endl;
    return ExitCode::SUCCESS;
}

int runOcr(const CliOptions& opts, picmod::AsyncEditor& editor,
           std::shared_ptr<picmod::EditSession> session, picmod::FontManager& fonts) {
    picmod::EditStatus status = runTask(editor, session,
        [](picmod::EditSession& s, picmod::ProgressReporter& progress, const std::atomic<bool>& cancel) {
            progress.report(10, "recognizing text");
            if (cancel) {
                return picmod::EditStatus::Fail(picmod::EditError::Cancelled, "Cancelled");
            }
            return s.recognizeSelection();
        });

    if (!status.ok() && status.error != picmod::EditError::NoText) {
        std::cout << JsonReportBuilder::BuildErrorReport(status).dump(2) << std::endl;
        return ExitCode::PROCESSING_ERROR;
    }

    std::string vis_path;
    if (opts.visualize) {
        vis_path = opts.output.empty() ? derivedPath(opts.input, "_ocr", ".png") : opts.output;
        picmod::FontFeatures features;
        std::string font_path = fonts.matchFont(features, "").first;
        for (const auto& box : session->ocrResults()) {
            if (picmod::FontManager::ContainsCJK(box.text)) {
                font_path = fonts.matchFont(features, box.text).first;
                break;
            }
        }
        cv::Mat vis = picmod::Visualizer::drawOCRResults(session->currentImage(),
                                                         session->ocrResults(), font_path);
        if (!picmod::FileHandler::saveImage(vis, vis_path)) {
            LOG_WARN("Failed to write visualization {}", vis_path);
            vis_path.clear();
        } else {
            vis_path = picmod::FileHandler::resolveSavePath(vis_path);
        }
    }

    std::cout << JsonReportBuilder::BuildSuccessReport(session->ocrResults(), vis_path).dump(2) << std::endl;
    return ExitCode::SUCCESS;
}

int runEdit(const CliOptions& opts, picmod::FillMode fill_mode, picmod::AsyncEditor& editor,
            std::shared_ptr<picmod::EditSession> session) {
    const std::string& cmd = opts.command;
    auto params = buildFontParams(opts);

    if (opts.visualize && opts.rect) {
        std::string preview = derivedPath(opts.output.empty() ? opts.input : opts.output, "_selection", ".png");
        cv::Mat vis = picmod::Visualizer::drawSelection(session->currentImage(), *opts.rect);
        if (picmod::FileHandler::saveImage(vis, preview)) {
            LOG_INFO("Selection preview written to {}", preview);
        }
    }

    picmod::EditStatus status = runTask(editor, session,
        [&](picmod::EditSession& s, picmod::ProgressReporter& progress, const std::atomic<bool>& cancel) {
            if (cmd == "stitch") {
                progress.report(20, "stitching");
                return s.stitchSelection();
            }
            if (cmd == "fill") {
                progress.report(20, "filling (" + picmod::ImageProcessor::fillModeName(fill_mode) + ")");
                return s.fillSelection(fill_mode, opts.color);
            }
            if (cmd == "add-text") {
                progress.report(20, "drawing text");
                return s.addText(*opts.rect, opts.text, params);
            }

            // erase-text / replace-text: 先识别
            progress.report(10, "recognizing text");
            picmod::EditStatus st = s.recognizeSelection();
            if (!st.ok()) {
                return st;
            }
            LOG_INFO("{}", st.message);
            if (cancel) {
                return picmod::EditStatus::Fail(picmod::EditError::Cancelled, "Cancelled");
            }

            if (cmd == "erase-text") {
                progress.report(60, "erasing text");
                return opts.indices.empty() ? s.deleteTextsInSelection() : s.deleteTexts(opts.indices);
            }

            progress.report(60, "replacing text");
            return opts.indices.empty() ? s.replaceTextInSelection(opts.text, params)
                                        : s.replaceText(opts.indices.front(), opts.text, params);
        });

    if (!status.ok()) {
        std::cerr << "Error: " << status.message << "\n";
        LOG_ERROR("{} failed: {} ({})", cmd, status.message, picmod::EditErrorName(status.error));
        return exitCodeFor(status);
    }
    LOG_INFO("{}", status.message);

    std::string output = opts.output.empty() ? derivedPath(opts.input, "_edited") : opts.output;
    status = session->saveAs(output);
    if (!status.ok()) {
        std::cerr << "Error: " << status.message << "\n";
        return exitCodeFor(status);
    }

    std::cout << session->filePath() << std::endl;
    return ExitCode::SUCCESS;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    std::string error_msg;
    if (!ParseCommandLine(argc, argv, opts, error_msg)) {
        std::cerr << "Error: " << error_msg << "\n\n" << Usage(argv[0]);
        return ExitCode::USAGE_ERROR;
    }
    if (opts.help) {
        std::cout << Usage(argv[0]);
        return ExitCode::SUCCESS;
    }

    // 加载配置，命令行参数优先
    picmod::AppConfig config;
    if (!opts.configPath.empty() && !picmod::AppConfig::LoadFile(opts.configPath, config, error_msg)) {
        std::cerr << "Error: " << error_msg << "\n";
        return ExitCode::USAGE_ERROR;
    }
    if (!opts.logDir.empty()) {
        config.log.logDir = opts.logDir;
    }
    if (opts.quality > 0) {
        config.edit.jpegQuality = opts.quality;
    }
    if (!config.Validate(error_msg)) {
        std::cerr << "Error: invalid configuration: " << error_msg << "\n";
        return ExitCode::USAGE_ERROR;
    }

    picmod::FillMode fill_mode = picmod::FillMode::Inpaint;
    if (opts.command == "fill") {
        try {
            fill_mode = picmod::ImageProcessor::parseFillMode(opts.mode);
        } catch (const std::invalid_argument& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return ExitCode::USAGE_ERROR;
        }
    }

    try {
        picmod::InitLogger(config.log);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Error: logger initialization failed: " << ex.what() << "\n";
        return ExitCode::PROCESSING_ERROR;
    }

    LOG_DEBUG("========== PictureModify {} ==========", opts.command);
    LOG_DEBUG_EXEC([&]() { config.Show(); });

    if (opts.command == "fonts" || opts.command == "info") {
        int rc = opts.command == "fonts" ? listFonts(config) : printInfo(opts);
        picmod::ShutdownLogger();
        return rc;
    }

    bool needs_ocr = opts.command == "ocr" || opts.command == "erase-text" || opts.command == "replace-text";
    std::shared_ptr<picmod::OcrProcessor> ocr;
    if (needs_ocr) {
        ocr = std::make_shared<picmod::OcrProcessor>(picmod::CreateOcrEngine(config.ocr));
    }

    auto fonts = std::make_shared<picmod::FontManager>(config.font.extraDirs, config.font.fallbackFont);
    auto text_editor = std::make_shared<picmod::TextEditor>(fonts, config.edit.textPadding,
                                                            config.edit.inpaintRadius);
    auto session = std::make_shared<picmod::EditSession>(config.edit, ocr, text_editor);

    picmod::EditStatus status = session->open(opts.input);
    if (!status.ok()) {
        std::cerr << "Error: " << status.message << "\n";
        if (opts.command == "ocr") {
            std::cout << JsonReportBuilder::BuildErrorReport(status).dump(2) << std::endl;
        }
        picmod::ShutdownLogger();
        return ExitCode::PROCESSING_ERROR;
    }

    const cv::Mat& image = session->currentImage();
    session->selection().setSelection(opts.rect ? *opts.rect
                                                : picmod::SelectionRect(0, 0, image.cols, image.rows));

    picmod::AsyncEditor editor(static_cast<size_t>(config.workers));
    int rc = opts.command == "ocr" ? runOcr(opts, editor, session, *fonts)
                                   : runEdit(opts, fill_mode, editor, session);

    picmod::ShutdownLogger();
    return rc;
}
