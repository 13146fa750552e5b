/// @file win32_utils.cpp
/// @brief Windows API helper utilities implementation

#include "win32_utils.hpp"

#include <spdlog/fmt/fmt.h>

namespace shelldrop {

std::string wideToUtf8(std::wstring_view wide) {
    if (wide.empty()) {
        return {};
    }

    int size = WideCharToMultiByte(CP_UTF8, 0, wide.data(), static_cast<int>(wide.size()),
                                   nullptr, 0, nullptr, nullptr);
    if (size <= 0) {
        return {};
    }

    std::string result(static_cast<size_t>(size), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wide.data(), static_cast<int>(wide.size()), result.data(),
                        size, nullptr, nullptr);
    return result;
}

std::string getErrorString(HRESULT hr) {
    wchar_t* buffer = nullptr;
    DWORD length = FormatMessageW(FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM |
                                      FORMAT_MESSAGE_IGNORE_INSERTS,
                                  nullptr, static_cast<DWORD>(hr), 0,
                                  reinterpret_cast<wchar_t*>(&buffer), 0, nullptr);

    std::string message;
    if (length > 0 && buffer) {
        std::wstring_view text(buffer, length);
        while (!text.empty() && (text.back() == L'\r' || text.back() == L'\n')) {
            text.remove_suffix(1);
        }
        message = wideToUtf8(text);
    }
    if (buffer) {
        LocalFree(buffer);
    }

    if (message.empty()) {
        message = fmt::format("0x{:08X}", static_cast<unsigned long>(hr));
    }
    return message;
}

std::string getLastErrorString() {
    return getErrorString(HRESULT_FROM_WIN32(GetLastError()));
}

}  // namespace shelldrop
