/**
 * @file block_blob_client.h
 * @brief Collaborator interface to a remote block blob
 *
 * The transfer engines reach the remote service only through this interface.
 * Request signing, URL building and wire serialization live in the concrete
 * implementations (see azure_block_blob_client.h).
 */

#ifndef KCENON_BLOB_TRANSFER_TRANSPORT_BLOCK_BLOB_CLIENT_H
#define KCENON_BLOB_TRANSFER_TRANSPORT_BLOCK_BLOB_CLIENT_H

#include <kcenon/blob_transfer/core/access_conditions.h>
#include <kcenon/blob_transfer/core/blob_types.h>
#include <kcenon/blob_transfer/core/types.h>

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace kcenon::blob_transfer {

/**
 * @brief Sequential body of a ranged read
 */
class blob_body_stream {
public:
    virtual ~blob_body_stream() = default;

    /**
     * @brief Read up to buffer.size() bytes
     * @return Bytes read, 0 at end of stream, or a (possibly transient) error
     */
    [[nodiscard]] virtual auto read(std::span<uint8_t> buffer) -> result<std::size_t> = 0;
};

/**
 * @brief Body stream over an owned byte buffer
 */
class memory_body_stream : public blob_body_stream {
public:
    explicit memory_body_stream(std::vector<uint8_t> data) : data_(std::move(data)) {}

    [[nodiscard]] auto read(std::span<uint8_t> buffer) -> result<std::size_t> override {
        auto n = std::min(buffer.size(), data_.size() - position_);
        if (n > 0) {
            std::memcpy(buffer.data(), data_.data() + position_, n);
            position_ += n;
        }
        return n;
    }

    [[nodiscard]] auto remaining() const -> std::size_t { return data_.size() - position_; }

private:
    std::vector<uint8_t> data_;
    std::size_t position_ = 0;
};

/**
 * @brief Response of a ranged read
 */
struct blob_download_response {
    blob_properties properties;
    uint64_t content_length = 0;  ///< Bytes the body is expected to deliver
    std::unique_ptr<blob_body_stream> body;
};

/**
 * @brief An addressable remote block blob
 *
 * Implementations must be safe to call from several threads at once: block
 * staging and chunk reads are issued concurrently.
 */
class block_blob_client {
public:
    virtual ~block_blob_client() = default;

    [[nodiscard]] virtual auto url() const -> std::string = 0;

    /**
     * @brief Fetch properties, headers and metadata
     */
    [[nodiscard]] virtual auto get_properties(const request_conditions& conditions)
        -> result<blob_properties> = 0;

    /**
     * @brief Start a ranged read
     */
    [[nodiscard]] virtual auto download(const blob_range& range,
                                        const request_conditions& conditions)
        -> result<blob_download_response> = 0;

    /**
     * @brief Replace the blob with content in one request
     */
    [[nodiscard]] virtual auto upload(std::span<const uint8_t> content,
                                      const blob_http_headers& headers,
                                      const blob_metadata& metadata,
                                      const request_conditions& conditions)
        -> result<blob_write_response> = 0;

    /**
     * @brief Stage an uncommitted block
     * @param conditions Lease condition only
     */
    [[nodiscard]] virtual auto stage_block(const std::string& block_id,
                                           std::span<const uint8_t> content,
                                           const request_conditions& conditions)
        -> result<void> = 0;

    /**
     * @brief Commit staged blocks in the given order
     */
    [[nodiscard]] virtual auto commit_block_list(const std::vector<std::string>& block_ids,
                                                 const blob_http_headers& headers,
                                                 const blob_metadata& metadata,
                                                 const request_conditions& conditions)
        -> result<blob_write_response> = 0;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_TRANSPORT_BLOCK_BLOB_CLIENT_H
