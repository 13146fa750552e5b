/// @file string_utils.cpp
/// @brief String conversion and manipulation utilities implementation

#include "string_utils.hpp"

#include <algorithm>

namespace shelldrop {

namespace {

void appendUtf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

constexpr char32_t kReplacementChar = 0xFFFD;

}  // namespace

std::string utf16ToUtf8(std::u16string_view utf16) {
    std::string result;
    result.reserve(utf16.size());

    for (std::size_t i = 0; i < utf16.size(); ++i) {
        char32_t unit = utf16[i];
        if (unit >= 0xD800 && unit <= 0xDBFF) {
            if (i + 1 < utf16.size() && utf16[i + 1] >= 0xDC00 && utf16[i + 1] <= 0xDFFF) {
                char32_t low = utf16[++i];
                appendUtf8(result, 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
            } else {
                appendUtf8(result, kReplacementChar);
            }
        } else if (unit >= 0xDC00 && unit <= 0xDFFF) {
            appendUtf8(result, kReplacementChar);
        } else {
            appendUtf8(result, unit);
        }
    }
    return result;
}

std::string pathToUtf8(const std::filesystem::path& path) {
#ifdef _WIN32
    const auto& native = path.native();
    return utf16ToUtf8(
        std::u16string_view(reinterpret_cast<const char16_t*>(native.data()), native.size()));
#else
    return path.native();
#endif
}

std::filesystem::path utf8ToPath(std::string_view utf8) {
    return std::filesystem::path(
        std::u8string(reinterpret_cast<const char8_t*>(utf8.data()), utf8.size()));
}

std::u16string utf8ToUtf16(std::string_view utf8) {
    return utf8ToPath(utf8).u16string();
}

std::u16string toLowercaseAscii(std::u16string_view str) {
    std::u16string result(str);
    std::transform(result.begin(), result.end(), result.begin(), [](char16_t c) {
        return (c >= u'A' && c <= u'Z') ? static_cast<char16_t>(c - u'A' + u'a') : c;
    });
    return result;
}

bool endsWithIcase(std::u16string_view str, std::u16string_view suffix) {
    if (suffix.size() > str.size()) {
        return false;
    }
    return toLowercaseAscii(str.substr(str.size() - suffix.size())) == toLowercaseAscii(suffix);
}

}  // namespace shelldrop
