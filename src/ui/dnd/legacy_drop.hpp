/// @file legacy_drop.hpp
/// @brief WM_DROPFILES fallback for windows without an OLE drop target

#pragma once

#include <Windows.h>

#include <shellapi.h>

#include <filesystem>
#include <vector>

namespace shelldrop::ui {

/// @brief Not in the SDK headers; needed with WM_DROPFILES across UIPI
constexpr UINT WM_COPYGLOBALDATA = 0x0049;

/// @brief Let lower-integrity processes (Explorer) send drop messages to
///        an elevated window
/// @return true if every message was allowed
bool allowDropMessagesThroughUipi(HWND hwnd);

/// @brief Turn WM_DROPFILES delivery on or off for a window
/// @param hwnd Target window
/// @param enable Accept dropped files
/// @param allow_uipi Also relax the UIPI message filter (enable only)
void enableLegacyDrop(HWND hwnd, bool enable, bool allow_uipi = true);

/// @brief Read every path from a WM_DROPFILES handle and release it
///
/// The handle is finished (DragFinish) before returning and must not be
/// used afterwards.
///
/// @param hdrop WPARAM of WM_DROPFILES
/// @return Paths in arrival order
[[nodiscard]] std::vector<std::filesystem::path> takeDroppedFiles(HDROP hdrop);

}  // namespace shelldrop::ui
