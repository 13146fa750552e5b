/// @file drop_error.hpp
/// @brief Drag-and-drop error types

#pragma once

#include <string_view>

namespace shelldrop {

/// @brief Drop pipeline errors
enum class DropError {
    SubsystemInitFailure,      // OleInitialize failed
    RegistrationFailure,       // RegisterDragDrop failed or bad arguments
    CapabilityMiss,            // QueryInterface for an unsupported IID
    MediumAcquisitionFailure,  // GetData or GlobalLock failed
    StreamReadFailure,         // IStream::Read or the byte source failed
    TempFileWriteFailure,      // Spool file could not be created or written
    FormatUnavailable,         // Data object does not offer the format
    MalformedPayload,          // Block layout does not decode
};

/// @brief Get string representation of drop error
[[nodiscard]] constexpr std::string_view to_string(DropError error) noexcept {
    switch (error) {
    case DropError::SubsystemInitFailure:
        return "Drag-and-drop subsystem initialization failed";
    case DropError::RegistrationFailure:
        return "Drop target registration failed";
    case DropError::CapabilityMiss:
        return "Interface not supported";
    case DropError::MediumAcquisitionFailure:
        return "Storage medium acquisition failed";
    case DropError::StreamReadFailure:
        return "Stream read failed";
    case DropError::TempFileWriteFailure:
        return "Temporary file write failed";
    case DropError::FormatUnavailable:
        return "Format not available";
    case DropError::MalformedPayload:
        return "Malformed payload";
    }
    return "Unknown drop error";
}

}  // namespace shelldrop
