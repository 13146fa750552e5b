/// @file settings_manager.cpp
/// @brief Settings persistence implementation using toml++

#include "settings_manager.hpp"

#ifdef _WIN32
    #include <Windows.h>
#endif

#include <fstream>
#include <sstream>

#include <toml++/toml.hpp>

#include "core/util/logger.hpp"
#include "core/util/string_utils.hpp"

namespace shelldrop::config {

namespace {

constexpr uint32_t kMinChunkSize = 4 * 1024;
constexpr uint32_t kMaxChunkSize = 64 * 1024 * 1024;

// Helper to get optional value from toml table
template <typename T>
T get_or(const toml::table& tbl, std::string_view key, T default_value) {
    if (auto val = tbl[key].value<T>()) {
        return *val;
    }
    return default_value;
}

uint32_t get_u32_or(const toml::table& tbl, std::string_view key, uint32_t default_value) {
    auto value = get_or(tbl, key, static_cast<int64_t>(default_value));
    if (value < 0 || value > static_cast<int64_t>(UINT32_MAX)) {
        LOG_WARN("Setting '{}' out of range ({}), using {}", key, value, default_value);
        return default_value;
    }
    return static_cast<uint32_t>(value);
}

DropSettings parse_settings(const toml::table& tbl) {
    DropSettings settings;

    // Spool settings
    if (auto* spool = tbl["spool"].as_table()) {
        auto dir_str = get_or<std::string>(*spool, "directory", "");
        if (!dir_str.empty()) {
            settings.spool.directory = utf8ToPath(dir_str);
        }
        settings.spool.prefix = get_or<std::string>(*spool, "prefix", settings.spool.prefix);
        settings.spool.chunk_size = get_u32_or(*spool, "chunk_size", settings.spool.chunk_size);
        settings.spool.forced_extension =
            get_or<std::string>(*spool, "forced_extension", settings.spool.forced_extension);
        settings.spool.max_virtual_files =
            get_u32_or(*spool, "max_virtual_files", settings.spool.max_virtual_files);
    }

    // Legacy WM_DROPFILES fallback
    if (auto* legacy = tbl["legacy"].as_table()) {
        settings.legacy.allow_uipi_messages =
            get_or(*legacy, "allow_uipi_messages", settings.legacy.allow_uipi_messages);
    }

    // Logging
    if (auto* logging = tbl["logging"].as_table()) {
        settings.log_level = logLevelFromString(get_or<std::string>(*logging, "level", "info"));
    }

    return settings;
}

toml::table serialize_settings(const DropSettings& settings) {
    toml::table tbl;

    tbl.insert("spool", toml::table{
                            {        "directory", pathToUtf8(settings.spool.directory)},
                            {           "prefix",                settings.spool.prefix},
                            {       "chunk_size",                 static_cast<int64_t>(settings.spool.chunk_size)},
                            { "forced_extension",      settings.spool.forced_extension},
                            {"max_virtual_files", static_cast<int64_t>(settings.spool.max_virtual_files)},
    });

    tbl.insert("legacy", toml::table{
                             {"allow_uipi_messages", settings.legacy.allow_uipi_messages},
    });

    tbl.insert("logging", toml::table{
                              {"level", std::string(to_string(settings.log_level))},
    });

    return tbl;
}

std::expected<DropSettings, ConfigError> checked(DropSettings settings) {
    auto validation = SettingsManager::validate(settings);
    for (const auto& warning : validation.warnings) {
        LOG_WARN("Settings: {}", warning);
    }
    if (!validation.valid) {
        for (const auto& error : validation.errors) {
            LOG_ERROR("Settings: {}", error);
        }
        return std::unexpected(ConfigError::ValidationError);
    }
    return settings;
}

}  // namespace

std::filesystem::path SettingsManager::defaultPath() {
#ifdef _WIN32
    wchar_t exe_path[MAX_PATH];
    if (GetModuleFileNameW(nullptr, exe_path, MAX_PATH) > 0) {
        return std::filesystem::path(exe_path).parent_path() / L"shelldrop.toml";
    }
#endif
    return "shelldrop.toml";
}

std::expected<DropSettings, ConfigError> SettingsManager::load() {
    return loadFrom(defaultPath());
}

std::expected<DropSettings, ConfigError>
SettingsManager::loadFrom(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::unexpected(ConfigError::FileNotFound);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(ConfigError::IoError);
    }

    std::ostringstream content;
    content << file.rdbuf();
    return parse(content.str());
}

std::expected<DropSettings, ConfigError> SettingsManager::parse(std::string_view text) {
    try {
        auto tbl = toml::parse(text);
        return checked(parse_settings(tbl));
    } catch (const toml::parse_error& e) {
        LOG_ERROR("Failed to parse settings: {}", e.description());
        return std::unexpected(ConfigError::ParseError);
    }
}

DropSettings SettingsManager::loadOrDefault() {
    auto result = load();
    if (result) {
        return *result;
    }
    if (result.error() != ConfigError::FileNotFound) {
        LOG_WARN("Using default settings: {}", to_string(result.error()));
    }
    return DropSettings::defaults();
}

std::expected<void, ConfigError> SettingsManager::saveTo(const DropSettings& settings,
                                                         const std::filesystem::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(ConfigError::IoError);
        }
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return std::unexpected(ConfigError::IoError);
    }

    file << "# shelldrop configuration\n\n" << serialize_settings(settings) << "\n";
    if (!file) {
        return std::unexpected(ConfigError::IoError);
    }
    return {};
}

ValidationResult SettingsManager::validate(const DropSettings& settings) {
    ValidationResult result;

    if (settings.spool.prefix.empty()) {
        result.valid = false;
        result.errors.push_back("spool.prefix must not be empty");
    } else if (settings.spool.prefix.find_first_of("<>:\"/\\|?*") != std::string::npos) {
        result.valid = false;
        result.errors.push_back("spool.prefix contains characters not allowed in file names");
    }

    if (settings.spool.chunk_size < kMinChunkSize || settings.spool.chunk_size > kMaxChunkSize) {
        result.valid = false;
        result.errors.push_back("spool.chunk_size must be between 4096 and 67108864");
    }

    const auto& ext = settings.spool.forced_extension;
    if (!ext.empty() && (ext.front() != '.' || ext.size() < 2)) {
        result.valid = false;
        result.errors.push_back("spool.forced_extension must look like \".ext\"");
    }

    if (!settings.spool.directory.empty()) {
        std::error_code ec;
        if (!std::filesystem::is_directory(settings.spool.directory, ec)) {
            result.warnings.push_back("spool.directory does not exist: " +
                                      pathToUtf8(settings.spool.directory));
        }
    }

    return result;
}

}  // namespace shelldrop::config
