/// @file settings.hpp
/// @brief Drop target settings structure definitions

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace shelldrop::config {

/// @brief Log verbosity written by the host's logger
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
};

/// @brief Get string representation of LogLevel
[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Trace:
        return "trace";
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    }
    return "info";
}

/// @brief Parse LogLevel from string
[[nodiscard]] constexpr LogLevel logLevelFromString(std::string_view str) noexcept {
    if (str == "trace")
        return LogLevel::Trace;
    if (str == "debug")
        return LogLevel::Debug;
    if (str == "warn")
        return LogLevel::Warn;
    if (str == "error")
        return LogLevel::Error;
    return LogLevel::Info;
}

/// @brief Where and how virtual files are written to disk
struct SpoolSettings {
    std::filesystem::path directory;         // Empty: system temp directory
    std::string prefix = "shelldrop";        // <prefix>_<pid>_<name>
    uint32_t chunk_size = 1024 * 1024;       // Bytes per stream read
    std::string forced_extension;            // Appended when missing, e.g. ".jpg"
    uint32_t max_virtual_files = 0;          // 0: unlimited
};

/// @brief WM_DROPFILES fallback options
struct LegacySettings {
    bool allow_uipi_messages = true;  // Let medium-integrity Explorer reach elevated windows
};

/// @brief Complete drop target settings
struct DropSettings {
    SpoolSettings spool;
    LegacySettings legacy;
    LogLevel log_level = LogLevel::Info;

    /// @brief Create default settings
    [[nodiscard]] static DropSettings defaults() { return DropSettings{}; }
};

}  // namespace shelldrop::config
