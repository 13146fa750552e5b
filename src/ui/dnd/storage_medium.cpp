/// @file storage_medium.cpp
/// @brief Format negotiation helpers

#include "storage_medium.hpp"

#include <ShlObj.h>

namespace shelldrop::ui {

CLIPFORMAT fileDescriptorFormat() {
    static const CLIPFORMAT format =
        static_cast<CLIPFORMAT>(RegisterClipboardFormatW(CFSTR_FILEDESCRIPTORW));
    return format;
}

CLIPFORMAT fileContentsFormat() {
    static const CLIPFORMAT format =
        static_cast<CLIPFORMAT>(RegisterClipboardFormatW(CFSTR_FILECONTENTS));
    return format;
}

FORMATETC makeFormat(CLIPFORMAT format, LONG index, DWORD tymed) noexcept {
    return FORMATETC{format, nullptr, DVASPECT_CONTENT, index, tymed};
}

bool offersFormat(IDataObject* data_object, CLIPFORMAT format, DWORD tymed) {
    if (!data_object || format == 0) {
        return false;
    }

    FORMATETC fmt = makeFormat(format, -1, tymed);
    return data_object->QueryGetData(&fmt) == S_OK;
}

Result<StorageMedium, DropError> acquireMedium(IDataObject* data_object, CLIPFORMAT format,
                                               LONG index, DWORD tymed,
                                               std::string_view operation) {
    if (!data_object || format == 0) {
        return std::unexpected(DropError::FormatUnavailable);
    }

    FORMATETC fmt = makeFormat(format, index, tymed);
    StorageMedium medium;
    HRESULT hr = data_object->GetData(&fmt, medium.put());
    if (SUCCEEDED(hr)) {
        return medium;
    }

    switch (hr) {
    case DV_E_FORMATETC:
    case DV_E_TYMED:
    case DV_E_LINDEX:
    case DV_E_CLIPFORMAT:
        LOG_DEBUG("{}: format not offered (0x{:08X})", operation, static_cast<unsigned long>(hr));
        return std::unexpected(DropError::FormatUnavailable);
    default:
        return logAndReturn(DropError::MediumAcquisitionFailure, operation, hr);
    }
}

}  // namespace shelldrop::ui
