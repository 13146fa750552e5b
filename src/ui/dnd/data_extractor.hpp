/// @file data_extractor.hpp
/// @brief Turns a dropped IDataObject into a list of file paths
///
/// Extraction is an ordered chain; the first extractor that yields at least
/// one path wins:
/// 1. FileListExtractor: CF_HDROP, real files from Explorer
/// 2. VirtualFileExtractor: FileGroupDescriptorW + FileContents, spooled to
///    temporary files (browsers, mail clients, archive viewers)

#pragma once

#include <Windows.h>

#include <ObjIdl.h>

#include <filesystem>
#include <memory>
#include <string_view>
#include <vector>

#include "core/config/settings.hpp"
#include "core/dnd/drop_error.hpp"
#include "core/dnd/drop_payload.hpp"
#include "core/dnd/virtual_file_spool.hpp"
#include "core/util/result.hpp"

namespace shelldrop::ui {

using PathList = std::vector<std::filesystem::path>;

/// @brief One step of the extraction chain
class PayloadExtractor {
public:
    virtual ~PayloadExtractor() = default;

    /// @brief Short name used in log records
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /// @brief Whether the data object advertises this extractor's format
    [[nodiscard]] virtual bool offeredBy(IDataObject* data_object) const = 0;

    /// @brief Extract paths
    /// @return Paths (possibly empty), FormatUnavailable when the format is
    ///         absent, or the error that stopped the extractor
    [[nodiscard]] virtual Result<PathList, DropError> extract(IDataObject* data_object) = 0;
};

/// @brief CF_HDROP file list
class FileListExtractor : public PayloadExtractor {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "CF_HDROP"; }
    [[nodiscard]] bool offeredBy(IDataObject* data_object) const override;
    [[nodiscard]] Result<PathList, DropError> extract(IDataObject* data_object) override;
};

/// @brief FileGroupDescriptorW + FileContents virtual files
///
/// Each record is retrieved separately by index. A record that fails is
/// logged and skipped; the others are still extracted.
class VirtualFileExtractor : public PayloadExtractor {
public:
    explicit VirtualFileExtractor(config::SpoolSettings settings);

    [[nodiscard]] std::string_view name() const noexcept override {
        return "FileGroupDescriptorW";
    }
    [[nodiscard]] bool offeredBy(IDataObject* data_object) const override;
    [[nodiscard]] Result<PathList, DropError> extract(IDataObject* data_object) override;

private:
    Result<std::filesystem::path, DropError> spoolRecord(IDataObject* data_object,
                                                         const dnd::VirtualFileRecord& record,
                                                         std::size_t index,
                                                         dnd::SpoolNameSet& names);

    config::SpoolSettings settings_;
};

/// @brief Byte source over an IStream, read until it reports no more data
[[nodiscard]] dnd::ByteReader streamReader(IStream* stream);

/// @brief Ordered extractor chain
class DataExtractor {
public:
    /// @brief Default chain: file list, then virtual files
    explicit DataExtractor(config::SpoolSettings settings = {});

    /// @brief Custom chain
    explicit DataExtractor(std::vector<std::unique_ptr<PayloadExtractor>> chain);

    DataExtractor(DataExtractor&&) noexcept = default;
    DataExtractor& operator=(DataExtractor&&) noexcept = default;

    /// @brief Whether any extractor's format is advertised
    [[nodiscard]] bool canExtract(IDataObject* data_object) const;

    /// @brief Run the chain; an empty list means nothing usable was dropped
    [[nodiscard]] PathList extract(IDataObject* data_object) const;

private:
    std::vector<std::unique_ptr<PayloadExtractor>> chain_;
};

}  // namespace shelldrop::ui
