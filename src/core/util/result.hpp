/// @file result.hpp
/// @brief std::expected aliases and the error-logging helper used on every
///        failure path

#pragma once

#include <cstdint>
#include <expected>
#include <source_location>
#include <string_view>

#include "core/util/logger.hpp"

namespace shelldrop {

template <typename T, typename E>
using Result = std::expected<T, E>;

template <typename E>
using VoidResult = std::expected<void, E>;

/// @brief Write one warning record for a failed operation and return the
///        error as std::unexpected
///
/// The record names the operation, the error kind and the OS status
/// (HRESULT or Win32 code, 0 when there is none), tagged with the caller's
/// source location.
///
///   return logAndReturn(DropError::MediumAcquisitionFailure, "GetData(CF_HDROP)", hr);
template <typename E>
[[nodiscard]] std::unexpected<E>
logAndReturn(E error, std::string_view operation, std::int32_t status = 0,
             std::source_location loc = std::source_location::current()) {
    spdlog::default_logger_raw()->log(
        spdlog::source_loc{loc.file_name(), static_cast<int>(loc.line()), loc.function_name()},
        spdlog::level::warn, "{} failed: {} (status 0x{:08X})", operation, to_string(error),
        static_cast<std::uint32_t>(status));
    return std::unexpected(error);
}

}  // namespace shelldrop

/// @brief Return early with the error of a VoidResult/Result expression
#define SHELLDROP_TRY_VOID(expr)                                                                   \
    do {                                                                                           \
        auto&& _result = (expr);                                                                   \
        if (!_result) {                                                                            \
            return std::unexpected(_result.error());                                               \
        }                                                                                          \
    } while (0)
