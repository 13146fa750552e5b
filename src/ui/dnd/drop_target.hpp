/// @file drop_target.hpp
/// @brief OLE IDropTarget implementation for receiving shell file drops

#pragma once

#include <Windows.h>

#include <ObjIdl.h>
#include <oleidl.h>

#include <optional>

#include <shelldrop/shelldrop.hpp>

#include "data_extractor.hpp"

namespace shelldrop::ui {

/// @brief Interfaces the drop target answers QueryInterface for
enum class Capability {
    Unknown,     // IID_IUnknown
    DropTarget,  // IID_IDropTarget
};

/// @brief Match an interface identifier against the supported set
/// @return The capability, or nullopt for any other IID
[[nodiscard]] std::optional<Capability> matchInterface(REFIID riid) noexcept;

/// @brief Drag session state
enum class DragState {
    Idle,
    DragActive,
};

/// @brief OLE IDropTarget implementation
///
/// Always offers DROPEFFECT_COPY, also for payloads no extractor
/// understands; such drops end with an empty list and no handler call.
///
/// The COM reference count is bookkeeping for the shell only. Release never
/// deletes the object; DropRegistry owns it and keeps it alive while the
/// count or a running handler says it is still in use.
class DropTarget : public IDropTarget {
public:
    /// @brief Create a drop target
    /// @param hwnd Window the target is registered on
    /// @param on_files Handler for non-empty drops
    /// @param extractor Extraction chain run on Drop
    DropTarget(HWND hwnd, FileListHandler on_files, DataExtractor extractor);
    virtual ~DropTarget();

    DropTarget(const DropTarget&) = delete;
    DropTarget& operator=(const DropTarget&) = delete;

    // IUnknown
    STDMETHOD(QueryInterface)(REFIID riid, void** ppv) override;
    STDMETHOD_(ULONG, AddRef)() override;
    STDMETHOD_(ULONG, Release)() override;

    // IDropTarget
    STDMETHOD(DragEnter)(IDataObject* pDataObj, DWORD grfKeyState, POINTL pt,
                         DWORD* pdwEffect) override;
    STDMETHOD(DragOver)(DWORD grfKeyState, POINTL pt, DWORD* pdwEffect) override;
    STDMETHOD(DragLeave)() override;
    STDMETHOD(Drop)(IDataObject* pDataObj, DWORD grfKeyState, POINTL pt, DWORD* pdwEffect) override;

    [[nodiscard]] HWND hwnd() const noexcept { return hwnd_; }
    [[nodiscard]] DragState state() const noexcept { return state_; }
    [[nodiscard]] LONG refCount() const noexcept { return ref_count_; }

    /// @brief Whether the file handler is running right now
    [[nodiscard]] bool dispatching() const noexcept { return dispatching_; }

    /// @brief Whether anything besides the owner still uses the target
    [[nodiscard]] bool inUse() const noexcept { return ref_count_ > 1 || dispatching_; }

private:
    // Starts at 1: the registry's reference
    volatile LONG ref_count_ = 1;
    HWND hwnd_;
    FileListHandler on_files_;
    DataExtractor extractor_;

    DragState state_ = DragState::Idle;
    bool payload_recognized_ = false;
    bool dispatching_ = false;
};

}  // namespace shelldrop::ui
