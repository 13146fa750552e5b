/// @file drop_target.cpp
/// @brief OLE IDropTarget implementation

#include "drop_target.hpp"

#include <exception>
#include <iterator>

#include "core/dnd/drop_error.hpp"
#include "core/util/logger.hpp"
#include "core/util/win32_utils.hpp"

namespace shelldrop::ui {

std::optional<Capability> matchInterface(REFIID riid) noexcept {
    if (IsEqualIID(riid, IID_IUnknown)) {
        return Capability::Unknown;
    }
    if (IsEqualIID(riid, IID_IDropTarget)) {
        return Capability::DropTarget;
    }
    return std::nullopt;
}

DropTarget::DropTarget(HWND hwnd, FileListHandler on_files, DataExtractor extractor)
    : hwnd_(hwnd), on_files_(std::move(on_files)), extractor_(std::move(extractor)) {
}

DropTarget::~DropTarget() = default;

STDMETHODIMP DropTarget::QueryInterface(REFIID riid, void** ppv) {
    if (!ppv) {
        return E_POINTER;
    }

    *ppv = nullptr;

    if (!matchInterface(riid)) {
        wchar_t iid[64] = {};
        StringFromGUID2(riid, iid, static_cast<int>(std::size(iid)));
        LOG_TRACE("QueryInterface {}: {}", wideToUtf8(iid), to_string(DropError::CapabilityMiss));
        return E_NOINTERFACE;
    }

    *ppv = static_cast<IDropTarget*>(this);
    AddRef();
    return S_OK;
}

STDMETHODIMP_(ULONG) DropTarget::AddRef() {
    return static_cast<ULONG>(InterlockedIncrement(&ref_count_));
}

STDMETHODIMP_(ULONG) DropTarget::Release() {
    LONG current = InterlockedCompareExchange(&ref_count_, 0, 0);
    for (;;) {
        if (current <= 0) {
            LOG_WARN("DropTarget::Release with count already at zero (hwnd {})",
                     static_cast<const void*>(hwnd_));
            return 0;
        }
        LONG previous = InterlockedCompareExchange(&ref_count_, current - 1, current);
        if (previous == current) {
            return static_cast<ULONG>(current - 1);
        }
        current = previous;
    }
}

STDMETHODIMP DropTarget::DragEnter(IDataObject* pDataObj, DWORD /*grfKeyState*/, POINTL pt,
                                   DWORD* pdwEffect) {
    if (!pdwEffect) {
        return E_INVALIDARG;
    }

    state_ = DragState::DragActive;
    payload_recognized_ = extractor_.canExtract(pDataObj);
    LOG_DEBUG("DragEnter at ({}, {}), recognized payload: {}", pt.x, pt.y, payload_recognized_);

    *pdwEffect = DROPEFFECT_COPY;
    return S_OK;
}

STDMETHODIMP DropTarget::DragOver(DWORD /*grfKeyState*/, POINTL /*pt*/, DWORD* pdwEffect) {
    if (!pdwEffect) {
        return E_INVALIDARG;
    }

    *pdwEffect = DROPEFFECT_COPY;
    return S_OK;
}

STDMETHODIMP DropTarget::DragLeave() {
    LOG_DEBUG("DragLeave");
    state_ = DragState::Idle;
    payload_recognized_ = false;
    return S_OK;
}

STDMETHODIMP DropTarget::Drop(IDataObject* pDataObj, DWORD /*grfKeyState*/, POINTL pt,
                              DWORD* pdwEffect) {
    if (!pdwEffect) {
        return E_INVALIDARG;
    }

    *pdwEffect = DROPEFFECT_COPY;
    state_ = DragState::Idle;
    payload_recognized_ = false;

    try {
        auto paths = extractor_.extract(pDataObj);
        LOG_INFO("Drop at ({}, {}) on hwnd {}: {} path(s)", pt.x, pt.y,
                 static_cast<const void*>(hwnd_), paths.size());

        if (!paths.empty() && on_files_) {
            dispatching_ = true;
            on_files_(paths);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Drop handling failed: {}", e.what());
    } catch (...) {
        LOG_ERROR("Drop handling failed: unknown exception");
    }
    dispatching_ = false;

    return S_OK;
}

}  // namespace shelldrop::ui
