/// @file data_extractor.cpp
/// @brief IDataObject file extraction

#include "data_extractor.hpp"

#include <ShlObj.h>
#include <shellapi.h>

#include <algorithm>
#include <limits>
#include <string>

#include "core/util/com_ptr.hpp"
#include "core/util/string_utils.hpp"
#include "storage_medium.hpp"

namespace shelldrop::ui {

namespace {

[[nodiscard]] HRESULT lastErrorHresult() {
    return HRESULT_FROM_WIN32(GetLastError());
}

[[nodiscard]] std::string recordName(const dnd::VirtualFileRecord& record) {
    return utf16ToUtf8(record.name);
}

}  // namespace

// FileListExtractor

bool FileListExtractor::offeredBy(IDataObject* data_object) const {
    return offersFormat(data_object, CF_HDROP, TYMED_HGLOBAL);
}

Result<PathList, DropError> FileListExtractor::extract(IDataObject* data_object) {
    auto medium = acquireMedium(data_object, CF_HDROP, -1, TYMED_HGLOBAL, "GetData(CF_HDROP)");
    if (!medium) {
        return std::unexpected(medium.error());
    }

    // The medium owns the handle; ReleaseStgMedium frees it, not DragFinish
    auto hdrop = static_cast<HDROP>(medium->hGlobal());
    if (!hdrop) {
        return logAndReturn(DropError::MediumAcquisitionFailure, "CF_HDROP medium type",
                            static_cast<std::int32_t>(medium->tymed()));
    }

    PathList paths;
    UINT count = DragQueryFileW(hdrop, 0xFFFFFFFF, nullptr, 0);
    paths.reserve(count);

    for (UINT i = 0; i < count; ++i) {
        UINT length = DragQueryFileW(hdrop, i, nullptr, 0);
        if (length == 0) {
            continue;
        }
        std::wstring path(length + 1, L'\0');
        DragQueryFileW(hdrop, i, path.data(), length + 1);
        path.resize(length);
        paths.emplace_back(std::move(path));
    }

    return paths;
}

// VirtualFileExtractor

VirtualFileExtractor::VirtualFileExtractor(config::SpoolSettings settings)
    : settings_(std::move(settings)) {
}

bool VirtualFileExtractor::offeredBy(IDataObject* data_object) const {
    return offersFormat(data_object, fileDescriptorFormat(), TYMED_HGLOBAL);
}

Result<PathList, DropError> VirtualFileExtractor::extract(IDataObject* data_object) {
    std::vector<dnd::VirtualFileRecord> records;
    {
        auto medium = acquireMedium(data_object, fileDescriptorFormat(), -1, TYMED_HGLOBAL,
                                    "GetData(FileGroupDescriptorW)");
        if (!medium) {
            return std::unexpected(medium.error());
        }

        GlobalLockView view(medium->hGlobal());
        if (!view) {
            return logAndReturn(DropError::MediumAcquisitionFailure,
                                "GlobalLock(FileGroupDescriptorW)", lastErrorHresult());
        }

        auto decoded = dnd::decodeFileGroupDescriptor(view.bytes());
        if (!decoded) {
            return std::unexpected(decoded.error());
        }
        records = std::move(*decoded);
    }

    std::size_t limit = records.size();
    if (settings_.max_virtual_files > 0 && limit > settings_.max_virtual_files) {
        LOG_INFO("Descriptor lists {} virtual files, extracting the first {}", limit,
                 settings_.max_virtual_files);
        limit = settings_.max_virtual_files;
    }

    PathList paths;
    dnd::SpoolNameSet names(settings_);

    for (std::size_t i = 0; i < limit; ++i) {
        const auto& record = records[i];
        if (record.isDirectory()) {
            LOG_DEBUG("Virtual entry {} '{}' is a directory, skipped", i, recordName(record));
            continue;
        }

        auto path = spoolRecord(data_object, record, i, names);
        if (!path) {
            LOG_WARN("Virtual file {} '{}' skipped: {}", i, recordName(record),
                     to_string(path.error()));
            continue;
        }
        paths.push_back(std::move(*path));
    }

    return paths;
}

Result<std::filesystem::path, DropError>
VirtualFileExtractor::spoolRecord(IDataObject* data_object, const dnd::VirtualFileRecord& record,
                                  std::size_t index, dnd::SpoolNameSet& names) {
    auto target = names.reserve(record.name, index);

    auto medium = acquireMedium(data_object, fileContentsFormat(), static_cast<LONG>(index),
                                TYMED_ISTREAM | TYMED_HGLOBAL, "GetData(FileContents)");
    if (!medium) {
        return std::unexpected(medium.error() == DropError::FormatUnavailable
                                   ? DropError::MediumAcquisitionFailure
                                   : medium.error());
    }

    Result<std::uint64_t, DropError> written = std::unexpected(DropError::MediumAcquisitionFailure);

    if (IStream* stream = medium->stream()) {
        written = dnd::spoolToFile(target, streamReader(stream), settings_.chunk_size);
    } else if (HGLOBAL handle = medium->hGlobal()) {
        GlobalLockView view(handle);
        if (!view) {
            return logAndReturn(DropError::MediumAcquisitionFailure, "GlobalLock(FileContents)",
                                lastErrorHresult());
        }

        // GlobalSize may be rounded up to the allocation granularity
        auto bytes = view.bytes();
        if (record.size && *record.size <= bytes.size()) {
            bytes = bytes.first(static_cast<std::size_t>(*record.size));
        }
        written = dnd::spoolToFile(target, dnd::memoryReader(bytes), settings_.chunk_size);
    } else {
        return logAndReturn(DropError::MediumAcquisitionFailure, "FileContents medium type",
                            static_cast<std::int32_t>(medium->tymed()));
    }

    if (!written) {
        return std::unexpected(written.error());
    }

    if (record.size && *record.size != *written) {
        LOG_WARN("Virtual file '{}': descriptor size {} but {} bytes received",
                 recordName(record), *record.size, *written);
    }

    return target;
}

dnd::ByteReader streamReader(IStream* stream) {
    ComPtr<IStream> holder(stream);

    LARGE_INTEGER zero = {};
    HRESULT seek = holder->Seek(zero, STREAM_SEEK_SET, nullptr);
    if (FAILED(seek)) {
        LOG_TRACE("Stream not seekable (0x{:08X}), reading from current position",
                  static_cast<unsigned long>(seek));
    }

    return [holder](std::span<std::byte> buffer) -> Result<std::size_t, DropError> {
        ULONG read = 0;
        const ULONG request = static_cast<ULONG>(
            std::min<std::size_t>(buffer.size(), std::numeric_limits<ULONG>::max()));
        HRESULT hr = holder->Read(buffer.data(), request, &read);
        if (FAILED(hr)) {
            return logAndReturn(DropError::StreamReadFailure, "IStream::Read", hr);
        }
        return static_cast<std::size_t>(read);
    };
}

// DataExtractor

DataExtractor::DataExtractor(config::SpoolSettings settings) {
    chain_.push_back(std::make_unique<FileListExtractor>());
    chain_.push_back(std::make_unique<VirtualFileExtractor>(std::move(settings)));
}

DataExtractor::DataExtractor(std::vector<std::unique_ptr<PayloadExtractor>> chain)
    : chain_(std::move(chain)) {
}

bool DataExtractor::canExtract(IDataObject* data_object) const {
    return std::any_of(chain_.begin(), chain_.end(),
                       [data_object](const auto& e) { return e->offeredBy(data_object); });
}

PathList DataExtractor::extract(IDataObject* data_object) const {
    if (!data_object) {
        return {};
    }

    for (const auto& extractor : chain_) {
        auto result = extractor->extract(data_object);
        if (!result) {
            if (result.error() == DropError::FormatUnavailable) {
                LOG_DEBUG("{}: not offered", extractor->name());
            } else {
                LOG_WARN("{}: {}", extractor->name(), to_string(result.error()));
            }
            continue;
        }
        if (!result->empty()) {
            LOG_INFO("{}: {} path(s) extracted", extractor->name(), result->size());
            return std::move(*result);
        }
        LOG_DEBUG("{}: offered but empty", extractor->name());
    }

    return {};
}

}  // namespace shelldrop::ui
