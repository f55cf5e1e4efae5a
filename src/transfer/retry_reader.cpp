/**
 * @file retry_reader.cpp
 * @brief Implementation of retry_reader
 */

#include <kcenon/blob_transfer/transfer/retry_reader.h>

#include <kcenon/blob_transfer/core/logging.h>

#include <algorithm>

namespace kcenon::blob_transfer {

retry_reader::retry_reader(std::unique_ptr<blob_body_stream> initial,
                           uint64_t offset,
                           uint64_t length,
                           retry_reader_options options,
                           reissue_function reissue)
    : stream_(std::move(initial)),
      offset_(offset),
      length_(length),
      options_(options),
      reissue_(std::move(reissue)) {}

auto retry_reader::read(std::span<uint8_t> buffer) -> result<std::size_t> {
    if (consumed_ >= length_ || buffer.empty()) {
        return std::size_t{0};
    }

    auto window = buffer.first(
        static_cast<std::size_t>(std::min<uint64_t>(buffer.size(), length_ - consumed_)));

    while (true) {
        error cause;
        if (!stream_) {
            cause = error{error_code::stream_interrupted, "no response body"};
        } else {
            auto got = stream_->read(window);
            if (got && got.value() > 0) {
                consumed_ += got.value();
                return got.value();
            }
            if (got) {
                cause = error{error_code::stream_interrupted,
                              "stream ended after " + std::to_string(consumed_) + " of " +
                                  std::to_string(length_) + " bytes"};
            } else {
                cause = got.error();
            }
        }

        if (!is_transient(cause.code)) {
            return unexpected{cause};
        }
        if (retries_ >= options_.max_retries) {
            BT_LOG_WARN(log_category::retry,
                        "retry ceiling reached at offset " +
                            std::to_string(offset_ + consumed_) + ": " + cause.message);
            return unexpected{cause};
        }

        if (auto reopened = reopen(cause); !reopened) {
            return unexpected{reopened.error()};
        }
    }
}

auto retry_reader::reopen(const error& cause) -> result<void> {
    ++retries_;
    stream_.reset();

    blob_range remainder(offset_ + consumed_, length_ - consumed_);

    transfer_log_context ctx;
    ctx.bytes_transferred = consumed_;
    ctx.attempt = retries_;
    ctx.error_message = cause.message;
    BT_LOG_DEBUG_CTX(log_category::retry,
                     "re-issuing ranged read from " + std::to_string(remainder.offset), ctx);

    if (!reissue_) {
        return unexpected{error{error_code::internal_error, "no reissue function"}};
    }

    auto response = reissue_(remainder);
    if (!response) {
        return unexpected{response.error()};
    }
    stream_ = std::move(response.value().body);
    return {};
}

}  // namespace kcenon::blob_transfer
