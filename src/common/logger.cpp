#include "common/logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <filesystem>
#include <memory>
#include <system_error>
#include <vector>

namespace picmod {

void InitLogger(const LoggerConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.colorConsole) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    } else {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());
    }

    if (!config.logDir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config.logDir, ec);
        if (ec) {
            throw spdlog::spdlog_ex("cannot create log directory " + config.logDir + ": " + ec.message());
        }
        std::string path = config.logDir + "/" + config.fileName;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            path, config.maxFileSize, config.maxFiles));
    }

    auto logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
    // [time] [level] [file:line] message
    logger->set_pattern("%^[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#]%$ %v");
    logger->set_level(spdlog::level::from_str(config.level));
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
}

void ShutdownLogger() {
    spdlog::shutdown();
}

} // namespace picmod
