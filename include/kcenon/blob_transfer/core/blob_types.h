/**
 * @file blob_types.h
 * @brief Data model shared by the upload and download engines
 */

#ifndef KCENON_BLOB_TRANSFER_CORE_BLOB_TYPES_H
#define KCENON_BLOB_TRANSFER_CORE_BLOB_TYPES_H

#include <kcenon/blob_transfer/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::blob_transfer {

/**
 * @brief Byte range of a blob
 *
 * A missing count means "from offset to the end of the blob".
 */
struct blob_range {
    uint64_t offset = 0;
    std::optional<uint64_t> count;

    blob_range() = default;
    explicit blob_range(uint64_t off, std::optional<uint64_t> cnt = std::nullopt)
        : offset(off), count(cnt) {}

    /**
     * @brief Validate the range
     * @return Success if valid, invalid_range otherwise
     */
    [[nodiscard]] auto validate() const -> result<void> {
        if (count.has_value() && *count == 0) {
            return unexpected{error{error_code::invalid_range,
                                    "range count must be greater than zero"}};
        }
        if (count.has_value() && *count > UINT64_MAX - offset) {
            return unexpected{error{error_code::invalid_range,
                                    "range end overflows"}};
        }
        return {};
    }

    /**
     * @brief Format as an HTTP range header value
     * @return "bytes=start-end", "bytes=start-" or nullopt for the whole blob
     */
    [[nodiscard]] auto to_header() const -> std::optional<std::string> {
        if (offset == 0 && !count.has_value()) {
            return std::nullopt;
        }
        if (!count.has_value()) {
            return "bytes=" + std::to_string(offset) + "-";
        }
        return "bytes=" + std::to_string(offset) + "-" +
               std::to_string(offset + *count - 1);
    }

    [[nodiscard]] auto operator==(const blob_range& other) const -> bool = default;
};

/**
 * @brief Standard HTTP headers stored on a blob
 */
struct blob_http_headers {
    std::optional<std::string> cache_control;
    std::optional<std::string> content_disposition;
    std::optional<std::string> content_encoding;
    std::optional<std::string> content_language;
    std::optional<std::string> content_type;
    std::optional<std::vector<uint8_t>> content_md5;

    [[nodiscard]] auto operator==(const blob_http_headers& other) const -> bool = default;
};

/**
 * @brief User-defined blob metadata (name -> value)
 */
using blob_metadata = std::map<std::string, std::string>;

/**
 * @brief Remote blob kind
 */
enum class blob_type {
    block_blob,
    page_blob,
    append_blob,
};

[[nodiscard]] constexpr auto to_string(blob_type type) -> const char* {
    switch (type) {
        case blob_type::block_blob: return "BlockBlob";
        case blob_type::page_blob: return "PageBlob";
        case blob_type::append_blob: return "AppendBlob";
        default: return "unknown";
    }
}

/**
 * @brief Blob properties as reported by the service
 *
 * Returned by a property fetch and by a completed download (the headers
 * observed when the download pinned its etag).
 */
struct blob_properties {
    blob_type type = blob_type::block_blob;
    uint64_t content_length = 0;
    std::string etag;
    std::chrono::system_clock::time_point last_modified{};
    blob_http_headers http_headers;
    blob_metadata metadata;
    std::optional<std::string> lease_state;
};

/**
 * @brief Response of a successful blob write (Put Blob / Put Block List)
 */
struct blob_write_response {
    int status_code = 201;
    std::string etag;
    std::chrono::system_clock::time_point last_modified{};
    std::optional<std::vector<uint8_t>> content_md5;
};

/**
 * @brief Upload strategy chosen for a file
 */
enum class upload_strategy {
    single_shot,  ///< One direct Put Blob call
    multi_block,  ///< Staged blocks followed by a block list commit
};

[[nodiscard]] constexpr auto to_string(upload_strategy strategy) -> const char* {
    switch (strategy) {
        case upload_strategy::single_shot: return "single_shot";
        case upload_strategy::multi_block: return "multi_block";
        default: return "unknown";
    }
}

/**
 * @brief Result of an upload_file_to_block_blob call
 */
struct upload_result {
    upload_strategy strategy = upload_strategy::single_shot;
    int status_code = 0;
    std::string etag;
    std::chrono::system_clock::time_point last_modified{};
    std::optional<std::vector<uint8_t>> content_md5;
    uint64_t bytes_uploaded = 0;
    std::size_t block_count = 0;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_CORE_BLOB_TYPES_H
