/// @file settings_manager.hpp
/// @brief shelldrop.toml reading, writing and checking (toml++)

#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "settings.hpp"

namespace shelldrop::config {

/// @brief Why settings could not be produced
enum class ConfigError {
    FileNotFound,
    ParseError,
    ValidationError,
    IoError,
};

[[nodiscard]] constexpr std::string_view to_string(ConfigError error) noexcept {
    switch (error) {
    case ConfigError::FileNotFound:
        return "Configuration file not found";
    case ConfigError::ParseError:
        return "Failed to parse configuration file";
    case ConfigError::ValidationError:
        return "Configuration validation failed";
    case ConfigError::IoError:
        return "I/O error";
    }
    return "Unknown configuration error";
}

/// @brief Errors make settings unusable; warnings are only logged
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

/// @brief Static entry points for the [spool], [legacy] and [logging] tables
class SettingsManager {
public:
    /// @brief loadFrom(defaultPath())
    [[nodiscard]] static std::expected<DropSettings, ConfigError> load();

    /// @return Settings, or FileNotFound / IoError / ParseError / ValidationError
    [[nodiscard]] static std::expected<DropSettings, ConfigError>
    loadFrom(const std::filesystem::path& path);

    /// @brief Parse TOML text; missing keys keep their defaults
    [[nodiscard]] static std::expected<DropSettings, ConfigError> parse(std::string_view text);

    /// @brief load(), falling back to DropSettings::defaults() on any error
    [[nodiscard]] static DropSettings loadOrDefault();

    /// @brief Write every key, creating the parent directory if needed
    [[nodiscard]] static std::expected<void, ConfigError> saveTo(const DropSettings& settings,
                                                                 const std::filesystem::path& path);

    [[nodiscard]] static ValidationResult validate(const DropSettings& settings);

    /// @brief shelldrop.toml beside the executable on Windows, in the
    ///        working directory elsewhere
    [[nodiscard]] static std::filesystem::path defaultPath();
};

}  // namespace shelldrop::config
