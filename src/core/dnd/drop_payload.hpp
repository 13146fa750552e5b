/// @file drop_payload.hpp
/// @brief Byte-level codec for the shell's file transfer blocks
///
/// The two HGLOBAL layouts a shell data object uses to describe dragged
/// files:
/// - DROPFILES (CF_HDROP): 20-byte header followed by a double-null
///   terminated list of UTF-16LE paths. Only encoded here; received
///   blocks are read with DragQueryFileW.
/// - FILEGROUPDESCRIPTORW: item count followed by fixed 592-byte
///   FILEDESCRIPTORW records, decoded and encoded.
///
/// The layouts are read byte by byte (little endian) so the codec has no
/// dependency on the Windows headers and can be tested on any platform.

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "core/dnd/drop_error.hpp"
#include "core/util/result.hpp"

namespace shelldrop::dnd {

/// DROPFILES: pFiles, pt.x, pt.y, fNC, fWide
inline constexpr std::size_t kDropFilesHeaderSize = 20;
inline constexpr std::size_t kDropFilesWideOffset = 16;

/// FILEDESCRIPTORW layout
inline constexpr std::size_t kFileDescriptorSize = 592;
inline constexpr std::size_t kFileDescriptorNameOffset = 72;
inline constexpr std::size_t kFileDescriptorNameChars = 260;

/// FILEDESCRIPTOR dwFlags bits
inline constexpr std::uint32_t kFdAttributes = 0x00000004;
inline constexpr std::uint32_t kFdCreateTime = 0x00000008;
inline constexpr std::uint32_t kFdAccessTime = 0x00000010;
inline constexpr std::uint32_t kFdWriteTime = 0x00000020;
inline constexpr std::uint32_t kFdFileSize = 0x00000040;

inline constexpr std::uint32_t kFileAttributeDirectory = 0x00000010;

/// @brief One entry of a virtual file group descriptor
struct VirtualFileRecord {
    std::u16string name;
    std::optional<std::uint64_t> size;  // Set when FD_FILESIZE is present
    std::uint32_t attributes = 0;       // Zero unless FD_ATTRIBUTES is present

    // Raw FILETIME ticks, set when the matching FD_*TIME flag is present
    std::optional<std::uint64_t> creation_time;
    std::optional<std::uint64_t> last_access_time;
    std::optional<std::uint64_t> last_write_time;

    [[nodiscard]] bool isDirectory() const noexcept {
        return (attributes & kFileAttributeDirectory) != 0;
    }
};

/// @brief Encode paths as a wide DROPFILES block
[[nodiscard]] std::vector<std::byte> encodeDropFiles(std::span<const std::filesystem::path> paths);

/// @brief Decode a FILEGROUPDESCRIPTORW block
/// @param block Locked HGLOBAL contents
/// @return Records in descriptor order, or MalformedPayload if the block is
///         shorter than its item count claims
[[nodiscard]] Result<std::vector<VirtualFileRecord>, DropError>
decodeFileGroupDescriptor(std::span<const std::byte> block);

/// @brief Encode records as a FILEGROUPDESCRIPTORW block
///
/// Names longer than 259 UTF-16 units are truncated.
[[nodiscard]] std::vector<std::byte>
encodeFileGroupDescriptor(std::span<const VirtualFileRecord> records);

}  // namespace shelldrop::dnd
