/// @file logger.hpp
/// @brief spdlog setup for hosts embedding the drop target
///
/// Library code only writes through the LOG_* macros, which go to spdlog's
/// default logger. A host that never calls init_logging() gets spdlog's
/// stock stdout logger.

#pragma once

// Keep every level in the binary; filtering happens at runtime
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "core/config/settings.hpp"

namespace shelldrop {

inline constexpr char kLoggerName[] = "shelldrop";

/// @brief Map the configured level onto spdlog's
[[nodiscard]] constexpr spdlog::level::level_enum toSpdlogLevel(config::LogLevel level) noexcept {
    switch (level) {
    case config::LogLevel::Trace:
        return spdlog::level::trace;
    case config::LogLevel::Debug:
        return spdlog::level::debug;
    case config::LogLevel::Info:
        return spdlog::level::info;
    case config::LogLevel::Warn:
        return spdlog::level::warn;
    case config::LogLevel::Error:
        return spdlog::level::err;
    }
    return spdlog::level::info;
}

/// @brief Install the "shelldrop" logger as spdlog's default
/// @param log_file Log file, truncated on open; empty for console only
/// @param level Minimum level written
/// @param console_output Also write to stdout
/// @return false if a sink could not be created
inline bool init_logging(const std::filesystem::path& log_file, config::LogLevel level,
                         bool console_output = true) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (!log_file.empty()) {
            sinks.push_back(
                std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string(), true));
        }
        if (console_output || sinks.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        }

        auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
        logger->set_level(toSpdlogLevel(level));
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] [%s:%#] %v");
        logger->flush_on(spdlog::level::warn);

        spdlog::set_default_logger(logger);
        return true;
    } catch (const spdlog::spdlog_ex&) {
        return false;
    }
}

/// @brief Flush and drop every logger
inline void shutdown_logging() {
    spdlog::shutdown();
}

#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)

}  // namespace shelldrop
