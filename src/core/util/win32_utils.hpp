/// @file win32_utils.hpp
/// @brief Windows API helper utilities

#pragma once

#include <Windows.h>

#include <string>
#include <string_view>

namespace shelldrop {

/// @brief Convert UTF-16 (wide string) to UTF-8, empty on failure
[[nodiscard]] std::string wideToUtf8(std::wstring_view wide);

/// @brief Get the system message for an HRESULT or Win32 error code
///
/// Falls back to the hex value when the system has no message for it.
[[nodiscard]] std::string getErrorString(HRESULT hr);

/// @brief Get the last Win32 error as a string
[[nodiscard]] std::string getLastErrorString();

}  // namespace shelldrop
