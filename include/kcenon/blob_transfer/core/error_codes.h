/**
 * @file error_codes.h
 * @brief Error codes for blob_transfer (-900 to -999 range)
 *
 * Error codes follow the range -900 to -999 as per ecosystem convention.
 */

#ifndef KCENON_BLOB_TRANSFER_CORE_ERROR_CODES_H
#define KCENON_BLOB_TRANSFER_CORE_ERROR_CODES_H

#include <cstdint>

namespace kcenon::blob_transfer {

/**
 * @brief Error codes for blob transfer operations (-900 to -999)
 *
 * Error code ranges:
 * - -900 to -919: Argument Errors (raised before any network call)
 * - -920 to -929: Local File Errors
 * - -930 to -949: Precondition Violations
 * - -950 to -959: Transient I/O Errors (retried by retry_reader)
 * - -960 to -979: Service Errors
 * - -980 to -999: Internal Errors
 */
enum class error_code : int32_t {
    success = 0,

    // Argument Errors (-900 to -919)
    invalid_argument = -900,
    null_argument = -901,
    invalid_block_size = -902,
    too_many_blocks = -903,
    invalid_parallelism = -904,
    invalid_range = -905,
    invalid_metadata = -906,
    invalid_http_headers = -907,
    invalid_retry_options = -908,
    invalid_configuration = -909,

    // Local File Errors (-920 to -929)
    file_not_found = -920,
    file_access_denied = -921,
    file_read_error = -922,
    file_write_error = -923,

    // Precondition Violations (-930 to -949)
    condition_not_met = -930,
    lease_id_mismatch = -931,
    lease_id_missing = -932,
    lease_not_present = -933,
    lease_lost = -934,

    // Transient I/O Errors (-950 to -959)
    stream_interrupted = -950,
    connection_failed = -951,
    connection_timeout = -952,
    connection_reset = -953,

    // Service Errors (-960 to -979)
    service_error = -960,
    blob_not_found = -961,
    server_busy = -962,
    invalid_range_response = -963,
    authentication_failed = -964,
    invalid_response = -965,

    // Internal Errors (-980 to -999)
    internal_error = -980,
    cancelled = -981,
    not_initialized = -982,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::invalid_argument:
            return "invalid argument";
        case error_code::null_argument:
            return "required argument is null";
        case error_code::invalid_block_size:
            return "invalid block size";
        case error_code::too_many_blocks:
            return "too many blocks";
        case error_code::invalid_parallelism:
            return "invalid parallelism";
        case error_code::invalid_range:
            return "invalid range";
        case error_code::invalid_metadata:
            return "invalid metadata";
        case error_code::invalid_http_headers:
            return "invalid http headers";
        case error_code::invalid_retry_options:
            return "invalid retry options";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_access_denied:
            return "file access denied";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::condition_not_met:
            return "condition not met";
        case error_code::lease_id_mismatch:
            return "lease id mismatch";
        case error_code::lease_id_missing:
            return "lease id missing";
        case error_code::lease_not_present:
            return "lease not present";
        case error_code::lease_lost:
            return "lease lost";
        case error_code::stream_interrupted:
            return "stream interrupted";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::connection_reset:
            return "connection reset";
        case error_code::service_error:
            return "service error";
        case error_code::blob_not_found:
            return "blob not found";
        case error_code::server_busy:
            return "server busy";
        case error_code::invalid_range_response:
            return "requested range not satisfiable";
        case error_code::authentication_failed:
            return "authentication failed";
        case error_code::invalid_response:
            return "invalid response";
        case error_code::internal_error:
            return "internal error";
        case error_code::cancelled:
            return "cancelled";
        case error_code::not_initialized:
            return "not initialized";
        default:
            return "unknown error";
    }
}

// ============================================================================
// Error Code Range Checks
// ============================================================================

[[nodiscard]] constexpr auto is_argument_error(error_code code) noexcept -> bool {
    auto value = static_cast<int32_t>(code);
    return value <= -900 && value >= -919;
}

[[nodiscard]] constexpr auto is_file_error(error_code code) noexcept -> bool {
    auto value = static_cast<int32_t>(code);
    return value <= -920 && value >= -929;
}

/**
 * @brief Check if the service rejected a conditional request
 *
 * Covers etag and time conditions as well as lease conflicts.
 */
[[nodiscard]] constexpr auto is_precondition_violation(error_code code) noexcept -> bool {
    auto value = static_cast<int32_t>(code);
    return value <= -930 && value >= -949;
}

/**
 * @brief Check if the error is a mid-stream failure worth re-issuing locally
 */
[[nodiscard]] constexpr auto is_transient(error_code code) noexcept -> bool {
    auto value = static_cast<int32_t>(code);
    return value <= -950 && value >= -959;
}

[[nodiscard]] constexpr auto is_service_error(error_code code) noexcept -> bool {
    auto value = static_cast<int32_t>(code);
    return value <= -960 && value >= -979;
}

[[nodiscard]] constexpr auto is_internal_error(error_code code) noexcept -> bool {
    auto value = static_cast<int32_t>(code);
    return value <= -980 && value >= -999;
}

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_CORE_ERROR_CODES_H
