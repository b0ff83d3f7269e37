/**
 * @file result.hpp
 * @brief common_system Result aliases and the fmri_sync error codes
 *
 * Every fallible fmri_sync operation returns Result<T> or VoidResult.
 * Errors carry the module name "fmri_sync" and, where useful, a details
 * string with the raw cause (stderr of a tool, the offending path).
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace fmri_sync {

template <typename T>
using Result = kcenon::common::Result<T>;
using VoidResult = kcenon::common::VoidResult;
using error_info = kcenon::common::error_info;

/**
 * @namespace error_codes
 * @brief fmri_sync error codes
 *
 * Error code range: -900 to -949
 */
namespace error_codes {
    constexpr int fmri_sync_base = -900;

    // Console hierarchy errors (-900 to -909)
    constexpr int not_found = fmri_sync_base - 0;
    constexpr int naming_convention_error = fmri_sync_base - 1;
    constexpr int remote_command_failed = fmri_sync_base - 2;

    // Process / transfer errors (-910 to -919)
    constexpr int spawn_failed = fmri_sync_base - 10;
    constexpr int command_timeout = fmri_sync_base - 11;
    constexpr int transfer_failed = fmri_sync_base - 12;

    // Header reading errors (-920 to -929)
    constexpr int file_read_error = fmri_sync_base - 20;
    constexpr int invalid_dicom_file = fmri_sync_base - 21;
    constexpr int unsupported_transfer_syntax = fmri_sync_base - 22;
    constexpr int decode_error = fmri_sync_base - 23;

    // General errors (-930 to -949)
    constexpr int invalid_argument = fmri_sync_base - 30;
    constexpr int invalid_config = fmri_sync_base - 31;
    constexpr int retry_exhausted = fmri_sync_base - 40;
    constexpr int cancelled = fmri_sync_base - 41;
} // namespace error_codes

/**
 * @brief Get a short symbolic name for an fmri_sync error code
 * @param code Error code from fmri_sync::error_codes
 * @return Name such as "not_found", or "unknown" for foreign codes
 */
[[nodiscard]] inline auto error_code_name(int code) -> const char* {
    switch (code) {
        case error_codes::not_found: return "not_found";
        case error_codes::naming_convention_error: return "naming_convention_error";
        case error_codes::remote_command_failed: return "remote_command_failed";
        case error_codes::spawn_failed: return "spawn_failed";
        case error_codes::command_timeout: return "command_timeout";
        case error_codes::transfer_failed: return "transfer_failed";
        case error_codes::file_read_error: return "file_read_error";
        case error_codes::invalid_dicom_file: return "invalid_dicom_file";
        case error_codes::unsupported_transfer_syntax: return "unsupported_transfer_syntax";
        case error_codes::decode_error: return "decode_error";
        case error_codes::invalid_argument: return "invalid_argument";
        case error_codes::invalid_config: return "invalid_config";
        case error_codes::retry_exhausted: return "retry_exhausted";
        case error_codes::cancelled: return "cancelled";
        default: return "unknown";
    }
}

using kcenon::common::ok;

/**
 * @brief Create an fmri_sync error result with module context
 * @tparam T The result value type
 * @param code Error code from fmri_sync::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> fmri_sync_error(int code, const std::string& message,
                                 const std::string& details = "") {
    if (details.empty()) {
        return kcenon::common::make_error<T>(code, message, "fmri_sync");
    }
    return kcenon::common::make_error<T>(code, message, "fmri_sync", details);
}

/**
 * @brief Create an fmri_sync void error result
 * @param code Error code from fmri_sync::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return VoidResult containing the error
 */
inline VoidResult fmri_sync_void_error(int code, const std::string& message,
                                       const std::string& details = "") {
    if (details.empty()) {
        return VoidResult(error_info{code, message, "fmri_sync"});
    }
    return VoidResult(error_info{code, message, "fmri_sync", details});
}

} // namespace fmri_sync

/**
 * @brief Return early if expression is an error
 */
#define FMRI_SYNC_RETURN_IF_ERROR(expr) COMMON_RETURN_IF_ERROR(expr)

