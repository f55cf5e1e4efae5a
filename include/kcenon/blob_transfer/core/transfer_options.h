/**
 * @file transfer_options.h
 * @brief Caller options, service limits and their validation
 */

#ifndef KCENON_BLOB_TRANSFER_CORE_TRANSFER_OPTIONS_H
#define KCENON_BLOB_TRANSFER_CORE_TRANSFER_OPTIONS_H

#include <kcenon/blob_transfer/core/access_conditions.h>
#include <kcenon/blob_transfer/core/blob_types.h>
#include <kcenon/blob_transfer/core/types.h>

#include <cstdint>
#include <functional>
#include <optional>

namespace kcenon::blob_transfer {

/**
 * @brief Block blob service limits
 *
 * The static constants are the service's documented limits. An instance
 * carries the ceilings a transfer is validated against; they default to the
 * service limits and may only be lowered.
 */
struct service_limits {
    /// Largest blob accepted by a single Put Blob call (256MB)
    static constexpr uint64_t max_upload_blob_bytes = 256ULL * 1024 * 1024;

    /// Largest block accepted by Put Block (100MB)
    static constexpr uint64_t max_stage_block_bytes = 100ULL * 1024 * 1024;

    /// Maximum number of committed blocks per blob
    static constexpr uint32_t max_blocks = 50000;

    uint64_t upload_blob_ceiling = max_upload_blob_bytes;
    uint64_t stage_block_ceiling = max_stage_block_bytes;
    uint32_t block_count_ceiling = max_blocks;

    /**
     * @brief Validate the ceilings
     * @return Success if every ceiling is in [1, service limit]
     */
    [[nodiscard]] auto validate() const -> result<void>;
};

/**
 * @brief Progress sink: (bytes transferred so far, total bytes)
 *
 * May be invoked concurrently from worker threads, and totals from different
 * lanes may arrive out of order.
 */
using progress_callback = std::function<void(uint64_t, uint64_t)>;

/**
 * @brief Options of the restartable ranged reader
 */
struct retry_reader_options {
    /// Default number of re-issued requests per ranged read
    static constexpr int default_max_retries = 5;

    int max_retries = default_max_retries;

    [[nodiscard]] auto validate() const -> result<void>;
};

/**
 * @brief Options for upload_file_to_block_blob
 */
struct upload_options {
    /// Parallelism used when none is given
    static constexpr int default_parallelism = 5;

    blob_http_headers http_headers;
    blob_metadata metadata;
    access_conditions conditions;
    std::optional<int> parallelism;
    progress_callback progress;

    /**
     * @brief Validate parallelism, metadata and headers
     */
    [[nodiscard]] auto validate() const -> result<void>;

    [[nodiscard]] auto effective_parallelism(int fallback = default_parallelism) const -> int {
        return parallelism.value_or(fallback);
    }
};

/**
 * @brief Options for download_blob_to_file
 */
struct download_options {
    /// Ranged read size used when none is given (4MB)
    static constexpr uint64_t default_block_size = 4ULL * 1024 * 1024;

    /// Parallelism used when none is given
    static constexpr int default_parallelism = 5;

    std::optional<uint64_t> block_size;
    progress_callback progress;
    access_conditions conditions;
    std::optional<int> parallelism;
    std::optional<retry_reader_options> retry;

    /**
     * @brief Validate block size, parallelism and retry options
     */
    [[nodiscard]] auto validate() const -> result<void>;

    [[nodiscard]] auto effective_block_size(uint64_t fallback = default_block_size) const
        -> uint64_t {
        return block_size.value_or(fallback);
    }

    [[nodiscard]] auto effective_parallelism(int fallback = default_parallelism) const -> int {
        return parallelism.value_or(fallback);
    }

    [[nodiscard]] auto effective_retry(
        const retry_reader_options& fallback = retry_reader_options{}) const
        -> retry_reader_options {
        return retry.value_or(fallback);
    }
};

/**
 * @brief Validate a metadata map
 *
 * Names must be non-empty identifiers (letter or '_' followed by letters,
 * digits or '_'); values must not contain CR or LF.
 */
[[nodiscard]] auto validate_metadata(const blob_metadata& metadata) -> result<void>;

/**
 * @brief Validate an HTTP header set
 *
 * Values must not contain CR or LF and a content MD5 must be 16 bytes.
 */
[[nodiscard]] auto validate_http_headers(const blob_http_headers& headers) -> result<void>;

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_CORE_TRANSFER_OPTIONS_H
