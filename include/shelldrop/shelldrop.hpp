/// @file shelldrop.hpp
/// @brief shelldrop public API - native shell file drops for any window
///
/// Registers an OLE drop target on a native window so that files dragged
/// from Explorer (CF_HDROP) or from applications that offer virtual files
/// (FileGroupDescriptorW + FileContents) reach the host as a list of
/// absolute paths, without going through a GUI toolkit's drag machinery.
///
/// Threading: call install() and revoke() on the thread that owns the
/// window. The handler runs synchronously on that thread while the shell
/// waits for the drop to finish, so long work on the files should be
/// queued elsewhere by the host.
///
/// On platforms without the OLE drag-and-drop protocol install() returns
/// false and revoke() does nothing.
///
/// SHELLDROP_VERSION_MAJOR/MINOR/PATCH and SHELLDROP_VERSION_STRING come
/// from the build (the CMake project version) as compile definitions.

#ifndef SHELLDROP_SHELLDROP_HPP
#define SHELLDROP_SHELLDROP_HPP

#include <filesystem>
#include <functional>
#include <vector>

namespace shelldrop {

namespace config {
struct DropSettings;
}

/// @brief Native window handle (HWND on Windows)
using NativeWindowHandle = void*;

/// @brief Receives the dropped paths in arrival order
///
/// Called at most once per drop, never with an empty list. Virtual files
/// arrive as paths of temporary copies.
using FileListHandler = std::function<void(const std::vector<std::filesystem::path>& files)>;

/// @brief Enable shell file drops on a window
///
/// Initializes OLE on the calling thread if needed and replaces any
/// earlier registration on the same window.
///
/// @param window Window to receive drops
/// @param on_files Handler for dropped files
/// @return false if the window could not be registered; the caller should
///         fall back to another drop mechanism (e.g. WM_DROPFILES)
[[nodiscard]] bool install(NativeWindowHandle window, FileListHandler on_files);

/// @brief Disable shell file drops on a window
///
/// Does nothing if the window is not registered.
void revoke(NativeWindowHandle window);

/// @brief Check whether a window currently has a drop target
[[nodiscard]] bool isInstalled(NativeWindowHandle window);

/// @brief Set the settings used by drop targets installed afterwards
void configure(const config::DropSettings& settings);

}  // namespace shelldrop

#endif  // SHELLDROP_SHELLDROP_HPP
