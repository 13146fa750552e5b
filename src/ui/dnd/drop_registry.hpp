/// @file drop_registry.hpp
/// @brief Process-wide registry of window drop targets

#pragma once

#include <Windows.h>

#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include <shelldrop/shelldrop.hpp>

#include "core/config/settings.hpp"
#include "core/dnd/drop_error.hpp"
#include "core/util/result.hpp"
#include "drop_target.hpp"

namespace shelldrop::ui {

/// @brief Owns every DropTarget and its RegisterDragDrop registration
///
/// One target per window at most. The map entry is the real owner of the
/// target; the COM count seen by the shell never frees it. Entries live
/// until revoke()/revokeAll() or process exit.
///
/// A target the shell still references after RevokeDragDrop (a drag loop
/// in progress, or a handler revoking from inside Drop) moves to a retired
/// list instead of being destroyed. Retired targets are freed by a later
/// install(), revoke() or revokeAll() once nothing else uses them.
class DropRegistry {
public:
    /// @brief Get singleton instance
    [[nodiscard]] static DropRegistry& instance();

    DropRegistry() = default;
    ~DropRegistry() = default;

    DropRegistry(const DropRegistry&) = delete;
    DropRegistry& operator=(const DropRegistry&) = delete;

    /// @brief Register a drop target on a window
    ///
    /// Initializes OLE on the calling thread (S_FALSE counts as success),
    /// revokes any earlier registration on the window, then registers a new
    /// target.
    ///
    /// @return The registered target, SubsystemInitFailure or RegistrationFailure
    [[nodiscard]] Result<DropTarget*, DropError> install(HWND hwnd, FileListHandler on_files);

    /// @brief Revoke a window's registration; no-op when not registered
    void revoke(HWND hwnd);

    /// @brief Revoke every registration
    void revokeAll();

    [[nodiscard]] bool isRegistered(HWND hwnd) const;
    [[nodiscard]] std::size_t registrationCount() const;

    /// @brief Revoked targets still waiting for the shell to let go
    [[nodiscard]] std::size_t retiredCount() const;

    /// @brief Settings for targets installed afterwards
    void configure(const config::DropSettings& settings);
    [[nodiscard]] config::DropSettings settings() const;

private:
    [[nodiscard]] static VoidResult<DropError> ensureOleInitialized();

    // Both expect mutex_ to be held
    void retire(std::unique_ptr<DropTarget> target);
    void reapRetired();

    mutable std::mutex mutex_;
    std::unordered_map<HWND, std::unique_ptr<DropTarget>> targets_;
    std::vector<std::unique_ptr<DropTarget>> retired_;
    config::DropSettings settings_;
};

}  // namespace shelldrop::ui
