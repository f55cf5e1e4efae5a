/**
 * @file retry_reader.h
 * @brief Restartable reader over one ranged blob read
 */

#ifndef KCENON_BLOB_TRANSFER_TRANSFER_RETRY_READER_H
#define KCENON_BLOB_TRANSFER_TRANSFER_RETRY_READER_H

#include <kcenon/blob_transfer/core/blob_types.h>
#include <kcenon/blob_transfer/core/transfer_options.h>
#include <kcenon/blob_transfer/core/types.h>
#include <kcenon/blob_transfer/transport/block_blob_client.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <span>

namespace kcenon::blob_transfer {

/**
 * @brief Sequential reader of [offset, offset + length) that survives
 *        interrupted streams
 *
 * When the current stream fails with a transient error, or ends before the
 * range is complete, the reader re-issues the request for the unread
 * remainder and continues. At most max_retries re-issues happen over the
 * reader's lifetime; past that the last transient error is returned. Errors
 * of the re-issued request itself (for example a 412 after the blob changed)
 * are returned as they are.
 */
class retry_reader {
public:
    using reissue_function = std::function<result<blob_download_response>(const blob_range&)>;

    /**
     * @param initial Body of the first request
     * @param offset Start of the range in the blob
     * @param length Number of bytes the range holds
     * @param options Retry ceiling
     * @param reissue Issues a ranged read for the remainder
     */
    retry_reader(std::unique_ptr<blob_body_stream> initial,
                 uint64_t offset,
                 uint64_t length,
                 retry_reader_options options,
                 reissue_function reissue);

    /**
     * @brief Read the next bytes of the range
     * @return Bytes read; 0 once the whole range was delivered
     */
    [[nodiscard]] auto read(std::span<uint8_t> buffer) -> result<std::size_t>;

    [[nodiscard]] auto consumed() const -> uint64_t { return consumed_; }
    [[nodiscard]] auto remaining() const -> uint64_t { return length_ - consumed_; }
    [[nodiscard]] auto retries() const -> int { return retries_; }

private:
    auto reopen(const error& cause) -> result<void>;

    std::unique_ptr<blob_body_stream> stream_;
    uint64_t offset_;
    uint64_t length_;
    uint64_t consumed_ = 0;
    int retries_ = 0;
    retry_reader_options options_;
    reissue_function reissue_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_TRANSFER_RETRY_READER_H
