#pragma once

#include <spdlog/spdlog.h>
#include <string>

/**
 * Logging system for PictureModify
 *
 * Thin macro layer over spdlog. Format strings use fmt syntax ("{}").
 * Call picmod::InitLogger() once at startup; before that the macros write to
 * spdlog's default console logger.
 */

// Log levels
#define LOG_LEVEL_OFF 1000
#define LOG_LEVEL_ERROR 500
#define LOG_LEVEL_WARN 400
#define LOG_LEVEL_INFO 300
#define LOG_LEVEL_DEBUG 200
#define LOG_LEVEL_TRACE 100
#define LOG_LEVEL_ALL 0

// Default compile-time log level
#ifndef LOG_LEVEL
#ifndef NDEBUG
#define LOG_LEVEL LOG_LEVEL_DEBUG
#else
#define LOG_LEVEL LOG_LEVEL_INFO
#endif
#endif

namespace picmod {

/**
 * Logger configuration
 */
struct LoggerConfig {
    std::string name = "picmod";
    std::string level = "info";          // trace, debug, info, warn, error, off
    std::string logDir;                  // empty = console only
    std::string fileName = "picmod.log";
    size_t maxFileSize = 10 * 1024 * 1024;
    size_t maxFiles = 3;
    bool colorConsole = true;
};

/**
 * @brief Create the process-wide logger and register it as spdlog default
 * @throws spdlog::spdlog_ex if the log directory or the file sink cannot be created
 */
void InitLogger(const LoggerConfig& config);

/**
 * @brief Flush and drop all loggers
 */
void ShutdownLogger();

} // namespace picmod

#define PICMOD_LOG_CALL(lvl, ...) \
    SPDLOG_LOGGER_CALL(spdlog::default_logger_raw(), lvl, __VA_ARGS__)

#if LOG_LEVEL <= LOG_LEVEL_ERROR
#define LOG_ERROR(...) PICMOD_LOG_CALL(spdlog::level::err, __VA_ARGS__)
#else
#define LOG_ERROR(...) ((void)0)
#endif

#if LOG_LEVEL <= LOG_LEVEL_WARN
#define LOG_WARN(...) PICMOD_LOG_CALL(spdlog::level::warn, __VA_ARGS__)
#else
#define LOG_WARN(...) ((void)0)
#endif

#if LOG_LEVEL <= LOG_LEVEL_INFO
#define LOG_INFO(...) PICMOD_LOG_CALL(spdlog::level::info, __VA_ARGS__)
#else
#define LOG_INFO(...) ((void)0)
#endif

#if LOG_LEVEL <= LOG_LEVEL_DEBUG
#define LOG_DEBUG_ENABLED
#define LOG_DEBUG(...) PICMOD_LOG_CALL(spdlog::level::debug, __VA_ARGS__)
#define LOG_DEBUG_EXEC(fn) (fn)()
#else
#define LOG_DEBUG(...) ((void)0)
#define LOG_DEBUG_EXEC(fn) ((void)0)
#endif

#if LOG_LEVEL <= LOG_LEVEL_TRACE
#define LOG_TRACE(...) PICMOD_LOG_CALL(spdlog::level::trace, __VA_ARGS__)
#else
#define LOG_TRACE(...) ((void)0)
#endif
