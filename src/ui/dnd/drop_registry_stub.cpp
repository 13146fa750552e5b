/// @file drop_registry_stub.cpp
/// @brief install/revoke for platforms without OLE drag and drop

#include <shelldrop/shelldrop.hpp>

#include "core/config/settings.hpp"
#include "core/util/logger.hpp"

namespace shelldrop {

bool install(NativeWindowHandle window, FileListHandler /*on_files*/) {
    LOG_DEBUG("Shell drop targets are not available on this platform (window {})",
              static_cast<const void*>(window));
    return false;
}

void revoke(NativeWindowHandle /*window*/) {
}

bool isInstalled(NativeWindowHandle /*window*/) {
    return false;
}

void configure(const config::DropSettings& /*settings*/) {
}

}  // namespace shelldrop
