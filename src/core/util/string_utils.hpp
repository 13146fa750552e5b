/// @file string_utils.hpp
/// @brief String conversion and manipulation utilities
///
/// Path/UTF-8 conversion for logging and configuration, plus the
/// UTF-16 helpers used when naming spooled virtual files.

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace shelldrop {

/// @brief Convert UTF-16 to UTF-8
///
/// Never throws on malformed input: an unpaired surrogate becomes U+FFFD.
[[nodiscard]] std::string utf16ToUtf8(std::u16string_view utf16);

/// @brief Convert filesystem path to UTF-8 string, lossy like utf16ToUtf8
[[nodiscard]] std::string pathToUtf8(const std::filesystem::path& path);

/// @brief Convert UTF-8 string to filesystem path
[[nodiscard]] std::filesystem::path utf8ToPath(std::string_view utf8);

/// @brief Convert ASCII/UTF-8 text to UTF-16 through std::filesystem
[[nodiscard]] std::u16string utf8ToUtf16(std::string_view utf8);

/// @brief Make UTF-16 string lowercase (ASCII only, for file extensions)
[[nodiscard]] std::u16string toLowercaseAscii(std::u16string_view str);

/// @brief Check if string ends with suffix (case-insensitive, ASCII)
[[nodiscard]] bool endsWithIcase(std::u16string_view str, std::u16string_view suffix);

}  // namespace shelldrop
