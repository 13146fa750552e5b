/// @file legacy_drop.cpp
/// @brief WM_DROPFILES fallback implementation

#include "legacy_drop.hpp"

#include <string>

#include "core/util/logger.hpp"
#include "core/util/string_utils.hpp"
#include "core/util/win32_utils.hpp"

namespace shelldrop::ui {

bool allowDropMessagesThroughUipi(HWND hwnd) {
    bool all_allowed = true;

    for (UINT message : {static_cast<UINT>(WM_DROPFILES), static_cast<UINT>(WM_COPYDATA),
                         WM_COPYGLOBALDATA}) {
        CHANGEFILTERSTRUCT filter = {};
        filter.cbSize = sizeof(filter);
        if (!ChangeWindowMessageFilterEx(hwnd, message, MSGFLT_ALLOW, &filter)) {
            LOG_WARN("ChangeWindowMessageFilterEx(0x{:04X}) failed: {}", message,
                     getLastErrorString());
            all_allowed = false;
        }
    }

    return all_allowed;
}

void enableLegacyDrop(HWND hwnd, bool enable, bool allow_uipi) {
    if (enable && allow_uipi) {
        (void)allowDropMessagesThroughUipi(hwnd);
    }
    DragAcceptFiles(hwnd, enable ? TRUE : FALSE);
    LOG_INFO("WM_DROPFILES {} on hwnd {}", enable ? "enabled" : "disabled",
             static_cast<const void*>(hwnd));
}

std::vector<std::filesystem::path> takeDroppedFiles(HDROP hdrop) {
    std::vector<std::filesystem::path> paths;

    if (!hdrop) {
        return paths;
    }

    UINT count = DragQueryFileW(hdrop, 0xFFFFFFFF, nullptr, 0);

    for (UINT i = 0; i < count; ++i) {
        UINT len = DragQueryFileW(hdrop, i, nullptr, 0);
        if (len > 0) {
            std::wstring path(len + 1, L'\0');
            DragQueryFileW(hdrop, i, path.data(), len + 1);
            path.resize(len);
            paths.emplace_back(path);
        }
    }

    DragFinish(hdrop);

    LOG_INFO("WM_DROPFILES delivered {} path(s)", paths.size());
    for (const auto& path : paths) {
        LOG_DEBUG("  {}", pathToUtf8(path));
    }
    return paths;
}

}  // namespace shelldrop::ui
