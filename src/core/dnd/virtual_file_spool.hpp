/// @file virtual_file_spool.hpp
/// @brief Writes virtual file contents to temporary files
///
/// Virtual files (FileGroupDescriptorW + FileContents) have no path of their
/// own. Their bytes are copied into a file under the spool directory so the
/// receiver gets ordinary paths, the same as for a CF_HDROP drop.

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <set>
#include <span>
#include <string>
#include <string_view>

#include "core/config/settings.hpp"
#include "core/dnd/drop_error.hpp"
#include "core/util/result.hpp"

namespace shelldrop::dnd {

/// @brief Pull-style byte source
///
/// Fills the buffer and returns the number of bytes written to it.
/// 0 means the source is exhausted.
using ByteReader = std::function<Result<std::size_t, DropError>(std::span<std::byte>)>;

/// @brief Strip a descriptor name down to a safe single file name
///
/// Keeps only the last path component, replaces characters that are invalid
/// in Windows file names with '_', trims trailing dots and spaces, and falls
/// back to "virtual_<index>" when nothing usable is left.
[[nodiscard]] std::u16string sanitizeFileName(std::u16string_view name, std::size_t index);

/// @brief Build the spool path for one virtual file
///
/// <directory>/<prefix>_<pid>_<sanitized name>[forced_extension]
///
/// @param settings Spool settings (empty directory means system temp)
/// @param name File name from the descriptor
/// @param index Record index, used for the fallback name
[[nodiscard]] std::filesystem::path makeSpoolPath(const config::SpoolSettings& settings,
                                                  std::u16string_view name, std::size_t index);

/// @brief Spool paths handed out during one drop
///
/// Paths are compared ASCII case-insensitively, as the file system does.
class SpoolNameSet {
public:
    explicit SpoolNameSet(config::SpoolSettings settings);

    /// @brief Pick a spool path no earlier reserve() returned, and hold it
    ///
    /// The first choice is makeSpoolPath(name). On a collision the
    /// sanitized name is prefixed with "<index>_", then "<index>_2_",
    /// "<index>_3_" and so on until the path is free.
    [[nodiscard]] std::filesystem::path reserve(std::u16string_view name, std::size_t index);

    [[nodiscard]] bool contains(const std::filesystem::path& path) const;
    [[nodiscard]] std::size_t size() const noexcept { return keys_.size(); }

private:
    config::SpoolSettings settings_;
    std::set<std::u16string> keys_;
};

/// @brief Copy a byte source into a file until the source is exhausted
///
/// The file is created or truncated. On failure the partial file is removed.
///
/// @param path Destination file
/// @param reader Byte source
/// @param chunk_size Bytes requested per read
/// @return Number of bytes written, StreamReadFailure or TempFileWriteFailure
[[nodiscard]] Result<std::uint64_t, DropError>
spoolToFile(const std::filesystem::path& path, const ByteReader& reader, std::size_t chunk_size);

/// @brief Byte source over a memory block
[[nodiscard]] ByteReader memoryReader(std::span<const std::byte> bytes);

}  // namespace shelldrop::dnd
