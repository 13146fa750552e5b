/// @file drop_registry.cpp
/// @brief Drop target registration and the public install/revoke API

#include "drop_registry.hpp"

#include <Ole2.h>

#include "core/util/logger.hpp"
#include "core/util/win32_utils.hpp"

namespace shelldrop::ui {

namespace {

[[nodiscard]] const void* ptr(HWND hwnd) {
    return static_cast<const void*>(hwnd);
}

}  // namespace

DropRegistry& DropRegistry::instance() {
    static DropRegistry registry;
    return registry;
}

VoidResult<DropError> DropRegistry::ensureOleInitialized() {
    // OLE apartments are per thread. The UI thread initializes once and
    // OleUninitialize is left to process exit.
    thread_local bool initialized = false;
    if (initialized) {
        return {};
    }

    HRESULT hr = OleInitialize(nullptr);
    if (FAILED(hr)) {
        return logAndReturn(DropError::SubsystemInitFailure, "OleInitialize", hr);
    }
    if (hr == S_FALSE) {
        LOG_DEBUG("OLE already initialized on this thread");
    }

    initialized = true;
    return {};
}

Result<DropTarget*, DropError> DropRegistry::install(HWND hwnd, FileListHandler on_files) {
    if (!hwnd || !IsWindow(hwnd)) {
        return logAndReturn(DropError::RegistrationFailure, "install: invalid window handle");
    }
    if (!on_files) {
        return logAndReturn(DropError::RegistrationFailure, "install: empty handler");
    }

    SHELLDROP_TRY_VOID(ensureOleInitialized());

    std::lock_guard lock(mutex_);
    reapRetired();

    // Clear a registration left by us or by someone else on this window
    HRESULT hr = RevokeDragDrop(hwnd);
    if (SUCCEEDED(hr)) {
        LOG_DEBUG("Revoked previous registration on hwnd {}", ptr(hwnd));
    } else if (hr != DRAGDROP_E_NOTREGISTERED) {
        LOG_DEBUG("RevokeDragDrop before install: {}", getErrorString(hr));
    }
    if (auto previous = targets_.find(hwnd); previous != targets_.end()) {
        retire(std::move(previous->second));
        targets_.erase(previous);
    }

    auto target =
        std::make_unique<DropTarget>(hwnd, std::move(on_files), DataExtractor(settings_.spool));

    hr = RegisterDragDrop(hwnd, target.get());
    if (FAILED(hr)) {
        return logAndReturn(DropError::RegistrationFailure, "RegisterDragDrop", hr);
    }

    auto* raw = target.get();
    targets_.emplace(hwnd, std::move(target));
    LOG_INFO("Drop target registered on hwnd {}", ptr(hwnd));
    return raw;
}

void DropRegistry::revoke(HWND hwnd) {
    std::lock_guard lock(mutex_);
    reapRetired();

    auto it = targets_.find(hwnd);
    if (it == targets_.end()) {
        return;
    }

    HRESULT hr = RevokeDragDrop(hwnd);
    if (FAILED(hr) && hr != DRAGDROP_E_NOTREGISTERED) {
        LOG_WARN("RevokeDragDrop on hwnd {}: {}", ptr(hwnd), getErrorString(hr));
    }

    retire(std::move(it->second));
    targets_.erase(it);
    LOG_INFO("Drop target revoked on hwnd {}", ptr(hwnd));
}

void DropRegistry::revokeAll() {
    std::lock_guard lock(mutex_);
    reapRetired();

    for (auto& [hwnd, target] : targets_) {
        HRESULT hr = RevokeDragDrop(hwnd);
        if (FAILED(hr) && hr != DRAGDROP_E_NOTREGISTERED) {
            LOG_WARN("RevokeDragDrop on hwnd {}: {}", ptr(hwnd), getErrorString(hr));
        }
        retire(std::move(target));
    }
    targets_.clear();
}

void DropRegistry::retire(std::unique_ptr<DropTarget> target) {
    if (!target || !target->inUse()) {
        return;
    }
    LOG_DEBUG("Drop target for hwnd {} still in use (count {}), retiring", ptr(target->hwnd()),
              target->refCount());
    retired_.push_back(std::move(target));
}

void DropRegistry::reapRetired() {
    std::erase_if(retired_, [](const auto& target) { return !target->inUse(); });
}

bool DropRegistry::isRegistered(HWND hwnd) const {
    std::lock_guard lock(mutex_);
    return targets_.contains(hwnd);
}

std::size_t DropRegistry::registrationCount() const {
    std::lock_guard lock(mutex_);
    return targets_.size();
}

std::size_t DropRegistry::retiredCount() const {
    std::lock_guard lock(mutex_);
    return retired_.size();
}

void DropRegistry::configure(const config::DropSettings& settings) {
    std::lock_guard lock(mutex_);
    settings_ = settings;
}

config::DropSettings DropRegistry::settings() const {
    std::lock_guard lock(mutex_);
    return settings_;
}

}  // namespace shelldrop::ui

namespace shelldrop {

bool install(NativeWindowHandle window, FileListHandler on_files) {
    return ui::DropRegistry::instance()
        .install(static_cast<HWND>(window), std::move(on_files))
        .has_value();
}

void revoke(NativeWindowHandle window) {
    ui::DropRegistry::instance().revoke(static_cast<HWND>(window));
}

bool isInstalled(NativeWindowHandle window) {
    return ui::DropRegistry::instance().isRegistered(static_cast<HWND>(window));
}

void configure(const config::DropSettings& settings) {
    ui::DropRegistry::instance().configure(settings);
}

}  // namespace shelldrop
