/// @file drop_payload.cpp
/// @brief DROPFILES / FILEGROUPDESCRIPTORW codec implementation

#include "drop_payload.hpp"

#include <algorithm>

namespace shelldrop::dnd {

namespace {

[[nodiscard]] std::uint32_t readU32(std::span<const std::byte> bytes, std::size_t offset) {
    return static_cast<std::uint32_t>(bytes[offset]) |
           (static_cast<std::uint32_t>(bytes[offset + 1]) << 8) |
           (static_cast<std::uint32_t>(bytes[offset + 2]) << 16) |
           (static_cast<std::uint32_t>(bytes[offset + 3]) << 24);
}

[[nodiscard]] char16_t readU16(std::span<const std::byte> bytes, std::size_t offset) {
    return static_cast<char16_t>(static_cast<std::uint16_t>(bytes[offset]) |
                                 (static_cast<std::uint16_t>(bytes[offset + 1]) << 8));
}

/// @brief FILETIME is two DWORDs, low part first
[[nodiscard]] std::uint64_t readFileTime(std::span<const std::byte> bytes, std::size_t offset) {
    return static_cast<std::uint64_t>(readU32(bytes, offset)) |
           (static_cast<std::uint64_t>(readU32(bytes, offset + 4)) << 32);
}

void writeU32(std::vector<std::byte>& out, std::size_t offset, std::uint32_t value) {
    for (std::size_t i = 0; i < 4; ++i) {
        out[offset + i] = static_cast<std::byte>((value >> (8 * i)) & 0xFF);
    }
}

void writeU16(std::vector<std::byte>& out, std::size_t offset, char16_t value) {
    out[offset] = static_cast<std::byte>(value & 0xFF);
    out[offset + 1] = static_cast<std::byte>((value >> 8) & 0xFF);
}

void writeFileTime(std::vector<std::byte>& out, std::size_t offset, std::uint64_t value) {
    writeU32(out, offset, static_cast<std::uint32_t>(value & 0xFFFFFFFF));
    writeU32(out, offset + 4, static_cast<std::uint32_t>(value >> 32));
}

}  // namespace

std::vector<std::byte> encodeDropFiles(std::span<const std::filesystem::path> paths) {
    std::vector<std::u16string> names;
    names.reserve(paths.size());

    std::size_t units = 1;  // Final terminator
    for (const auto& path : paths) {
        names.push_back(path.u16string());
        units += names.back().size() + 1;
    }

    std::vector<std::byte> out(kDropFilesHeaderSize + units * 2, std::byte{0});
    writeU32(out, 0, static_cast<std::uint32_t>(kDropFilesHeaderSize));
    writeU32(out, kDropFilesWideOffset, 1);

    std::size_t offset = kDropFilesHeaderSize;
    for (const auto& name : names) {
        for (char16_t ch : name) {
            writeU16(out, offset, ch);
            offset += 2;
        }
        offset += 2;  // Item terminator, already zero
    }
    return out;
}

Result<std::vector<VirtualFileRecord>, DropError>
decodeFileGroupDescriptor(std::span<const std::byte> block) {
    if (block.size() < 4) {
        return logAndReturn(DropError::MalformedPayload, "FILEGROUPDESCRIPTORW count");
    }

    const std::uint64_t count = readU32(block, 0);
    const std::uint64_t required = 4 + count * kFileDescriptorSize;
    if (required > block.size()) {
        LOG_WARN("FILEGROUPDESCRIPTORW claims {} items but block holds {} bytes", count,
                 block.size());
        return logAndReturn(DropError::MalformedPayload, "FILEGROUPDESCRIPTORW records");
    }

    std::vector<VirtualFileRecord> records;
    records.reserve(static_cast<std::size_t>(count));

    for (std::size_t i = 0; i < count; ++i) {
        auto fd = block.subspan(4 + i * kFileDescriptorSize, kFileDescriptorSize);
        const std::uint32_t flags = readU32(fd, 0);

        VirtualFileRecord record;
        if (flags & kFdAttributes) {
            record.attributes = readU32(fd, 36);
        }
        if (flags & kFdCreateTime) {
            record.creation_time = readFileTime(fd, 40);
        }
        if (flags & kFdAccessTime) {
            record.last_access_time = readFileTime(fd, 48);
        }
        if (flags & kFdWriteTime) {
            record.last_write_time = readFileTime(fd, 56);
        }
        if (flags & kFdFileSize) {
            record.size = (static_cast<std::uint64_t>(readU32(fd, 64)) << 32) | readU32(fd, 68);
        }

        for (std::size_t c = 0; c < kFileDescriptorNameChars; ++c) {
            char16_t ch = readU16(fd, kFileDescriptorNameOffset + c * 2);
            if (ch == u'\0') {
                break;
            }
            record.name.push_back(ch);
        }

        records.push_back(std::move(record));
    }

    return records;
}

std::vector<std::byte> encodeFileGroupDescriptor(std::span<const VirtualFileRecord> records) {
    std::vector<std::byte> out(4 + records.size() * kFileDescriptorSize, std::byte{0});
    writeU32(out, 0, static_cast<std::uint32_t>(records.size()));

    for (std::size_t i = 0; i < records.size(); ++i) {
        const auto& record = records[i];
        const std::size_t base = 4 + i * kFileDescriptorSize;

        std::uint32_t flags = kFdAttributes;
        writeU32(out, base + 36, record.attributes);
        if (record.creation_time) {
            flags |= kFdCreateTime;
            writeFileTime(out, base + 40, *record.creation_time);
        }
        if (record.last_access_time) {
            flags |= kFdAccessTime;
            writeFileTime(out, base + 48, *record.last_access_time);
        }
        if (record.last_write_time) {
            flags |= kFdWriteTime;
            writeFileTime(out, base + 56, *record.last_write_time);
        }
        if (record.size) {
            flags |= kFdFileSize;
            writeU32(out, base + 64, static_cast<std::uint32_t>(*record.size >> 32));
            writeU32(out, base + 68, static_cast<std::uint32_t>(*record.size & 0xFFFFFFFF));
        }
        writeU32(out, base, flags);

        const std::size_t chars = std::min(record.name.size(), kFileDescriptorNameChars - 1);
        for (std::size_t c = 0; c < chars; ++c) {
            writeU16(out, base + kFileDescriptorNameOffset + c * 2, record.name[c]);
        }
    }

    return out;
}

}  // namespace shelldrop::dnd
