/// @file storage_medium.hpp
/// @brief RAII ownership of STGMEDIUM and locked HGLOBAL blocks

#pragma once

#include <Windows.h>

#include <ObjIdl.h>

#include <cstddef>
#include <span>
#include <string_view>

#include "core/dnd/drop_error.hpp"
#include "core/util/result.hpp"

namespace shelldrop::ui {

/// @brief Owns one STGMEDIUM retrieved from a data object
///
/// ReleaseStgMedium runs exactly once, on reset() or destruction,
/// whatever path the caller leaves by.
class StorageMedium {
public:
    StorageMedium() = default;
    ~StorageMedium() { reset(); }

    StorageMedium(const StorageMedium&) = delete;
    StorageMedium& operator=(const StorageMedium&) = delete;

    StorageMedium(StorageMedium&& other) noexcept : medium_(other.medium_) {
        other.medium_ = {};
    }

    StorageMedium& operator=(StorageMedium&& other) noexcept {
        if (this != &other) {
            reset();
            medium_ = other.medium_;
            other.medium_ = {};
        }
        return *this;
    }

    /// @brief Release the current medium and expose the slot for GetData
    [[nodiscard]] STGMEDIUM* put() noexcept {
        reset();
        return &medium_;
    }

    void reset() noexcept {
        if (medium_.tymed != TYMED_NULL) {
            ReleaseStgMedium(&medium_);
            medium_ = {};
        }
    }

    [[nodiscard]] DWORD tymed() const noexcept { return medium_.tymed; }
    [[nodiscard]] HGLOBAL hGlobal() const noexcept {
        return medium_.tymed == TYMED_HGLOBAL ? medium_.hGlobal : nullptr;
    }
    [[nodiscard]] IStream* stream() const noexcept {
        return medium_.tymed == TYMED_ISTREAM ? medium_.pstm : nullptr;
    }

private:
    STGMEDIUM medium_ = {};
};

/// @brief GlobalLock for the lifetime of the object
class GlobalLockView {
public:
    explicit GlobalLockView(HGLOBAL handle) : handle_(handle) {
        if (handle_) {
            data_ = static_cast<const std::byte*>(GlobalLock(handle_));
            if (data_) {
                size_ = GlobalSize(handle_);
            }
        }
    }

    ~GlobalLockView() {
        if (data_) {
            GlobalUnlock(handle_);
        }
    }

    GlobalLockView(const GlobalLockView&) = delete;
    GlobalLockView& operator=(const GlobalLockView&) = delete;

    [[nodiscard]] std::span<const std::byte> bytes() const noexcept { return {data_, size_}; }

    [[nodiscard]] explicit operator bool() const noexcept { return data_ != nullptr; }

private:
    HGLOBAL handle_ = nullptr;
    const std::byte* data_ = nullptr;
    std::size_t size_ = 0;
};

/// @brief Registered clipboard format for FileGroupDescriptorW
[[nodiscard]] CLIPFORMAT fileDescriptorFormat();

/// @brief Registered clipboard format for FileContents
[[nodiscard]] CLIPFORMAT fileContentsFormat();

/// @brief Build a content-aspect FORMATETC
[[nodiscard]] FORMATETC makeFormat(CLIPFORMAT format, LONG index, DWORD tymed) noexcept;

/// @brief Ask whether the data object offers a format, without retrieving it
[[nodiscard]] bool offersFormat(IDataObject* data_object, CLIPFORMAT format, DWORD tymed);

/// @brief GetData into an owned medium
///
/// FormatUnavailable when the object reports DV_E_FORMATETC / DV_E_TYMED /
/// DV_E_LINDEX, MediumAcquisitionFailure for any other failure.
///
/// @param operation Name used in the log record
[[nodiscard]] Result<StorageMedium, DropError> acquireMedium(IDataObject* data_object,
                                                             CLIPFORMAT format, LONG index,
                                                             DWORD tymed,
                                                             std::string_view operation);

}  // namespace shelldrop::ui
