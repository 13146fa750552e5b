/// @file virtual_file_spool.cpp
/// @brief Virtual file spooling implementation

#include "virtual_file_spool.hpp"

#ifdef _WIN32
    #include <Windows.h>
#else
    #include <unistd.h>
#endif

#include <algorithm>
#include <cstring>
#include <fstream>
#include <memory>
#include <utility>
#include <vector>

#include "core/util/logger.hpp"
#include "core/util/string_utils.hpp"

namespace shelldrop::dnd {

namespace {

[[nodiscard]] unsigned long currentProcessId() {
#ifdef _WIN32
    return GetCurrentProcessId();
#else
    return static_cast<unsigned long>(getpid());
#endif
}

[[nodiscard]] bool isInvalidFileNameChar(char16_t c) {
    if (c < 0x20) {
        return true;
    }
    switch (c) {
    case u'<':
    case u'>':
    case u':':
    case u'"':
    case u'|':
    case u'?':
    case u'*':
        return true;
    default:
        return false;
    }
}

void removePartial(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        LOG_WARN("Could not remove partial spool file {}: {}", pathToUtf8(path), ec.message());
    }
}

[[nodiscard]] std::u16string spoolKey(const std::filesystem::path& path) {
    return toLowercaseAscii(path.u16string());
}

}  // namespace

std::u16string sanitizeFileName(std::u16string_view name, std::size_t index) {
    auto sep = name.find_last_of(u"/\\");
    if (sep != std::u16string_view::npos) {
        name = name.substr(sep + 1);
    }

    std::u16string result(name);
    std::replace_if(result.begin(), result.end(), isInvalidFileNameChar, u'_');

    while (!result.empty() && (result.back() == u'.' || result.back() == u' ')) {
        result.pop_back();
    }
    auto first = result.find_first_not_of(u' ');
    result.erase(0, first == std::u16string::npos ? result.size() : first);

    if (result.empty()) {
        result = utf8ToUtf16("virtual_" + std::to_string(index));
    }
    return result;
}

std::filesystem::path makeSpoolPath(const config::SpoolSettings& settings,
                                    std::u16string_view name, std::size_t index) {
    std::filesystem::path dir = settings.directory;
    if (dir.empty()) {
        std::error_code ec;
        dir = std::filesystem::temp_directory_path(ec);
        if (ec) {
            LOG_WARN("No temp directory ({}), spooling to working directory", ec.message());
            dir = std::filesystem::current_path(ec);
        }
    }

    auto file_name =
        utf8ToUtf16(settings.prefix + "_" + std::to_string(currentProcessId()) + "_");
    file_name += sanitizeFileName(name, index);

    const auto ext = utf8ToUtf16(settings.forced_extension);
    if (!ext.empty() && !endsWithIcase(file_name, ext)) {
        file_name += ext;
    }

    return dir / std::filesystem::path(file_name);
}

SpoolNameSet::SpoolNameSet(config::SpoolSettings settings) : settings_(std::move(settings)) {
}

std::filesystem::path SpoolNameSet::reserve(std::u16string_view name, std::size_t index) {
    auto path = makeSpoolPath(settings_, name, index);
    if (!contains(path)) {
        keys_.insert(spoolKey(path));
        return path;
    }

    const auto base = sanitizeFileName(name, index);
    for (std::size_t attempt = 1;; ++attempt) {
        std::string prefix = std::to_string(index) + "_";
        if (attempt > 1) {
            prefix += std::to_string(attempt) + "_";
        }
        path = makeSpoolPath(settings_, utf8ToUtf16(prefix) + base, index);
        if (!contains(path)) {
            break;
        }
    }

    LOG_DEBUG("Spool name for virtual file {} taken, using {}", index, pathToUtf8(path.filename()));
    keys_.insert(spoolKey(path));
    return path;
}

bool SpoolNameSet::contains(const std::filesystem::path& path) const {
    return keys_.contains(spoolKey(path));
}

Result<std::uint64_t, DropError> spoolToFile(const std::filesystem::path& path,
                                             const ByteReader& reader, std::size_t chunk_size) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        LOG_WARN("Cannot create spool file {}", pathToUtf8(path));
        return logAndReturn(DropError::TempFileWriteFailure, "open spool file");
    }

    std::vector<std::byte> buffer(std::max<std::size_t>(chunk_size, 1));
    std::uint64_t total = 0;

    for (;;) {
        auto read = reader(buffer);
        if (!read) {
            out.close();
            removePartial(path);
            return std::unexpected(read.error());
        }
        if (*read == 0) {
            break;
        }

        out.write(reinterpret_cast<const char*>(buffer.data()),
                  static_cast<std::streamsize>(*read));
        if (!out) {
            out.close();
            removePartial(path);
            return logAndReturn(DropError::TempFileWriteFailure, "write spool file");
        }
        total += *read;
    }

    out.close();
    if (!out) {
        removePartial(path);
        return logAndReturn(DropError::TempFileWriteFailure, "close spool file");
    }

    LOG_DEBUG("Spooled {} bytes to {}", total, pathToUtf8(path));
    return total;
}

ByteReader memoryReader(std::span<const std::byte> bytes) {
    auto offset = std::make_shared<std::size_t>(0);
    return [bytes, offset](std::span<std::byte> buffer) -> Result<std::size_t, DropError> {
        const std::size_t n = std::min(buffer.size(), bytes.size() - *offset);
        if (n > 0) {
            std::memcpy(buffer.data(), bytes.data() + *offset, n);
            *offset += n;
        }
        return n;
    };
}

}  // namespace shelldrop::dnd
