/**
 * @file download_engine.cpp
 * @brief Implementation of download_engine
 */

#include <kcenon/blob_transfer/transfer/download_engine.h>

#include <kcenon/blob_transfer/core/access_conditions.h>
#include <kcenon/blob_transfer/core/block_planner.h>
#include <kcenon/blob_transfer/core/logging.h>
#include <kcenon/blob_transfer/transfer/parallel_dispatcher.h>
#include <kcenon/blob_transfer/transfer/retry_reader.h>

#include <algorithm>
#include <chrono>
#include <vector>

namespace kcenon::blob_transfer {

namespace {

constexpr const char* download_chunk_stage = "download_chunk";

void log_failure(std::string_view what, const std::string& url, const error& failure) {
    transfer_log_context ctx;
    ctx.blob_url = url;
    ctx.status_code = failure.status_code;
    ctx.error_message = std::string(to_string(failure.code)) + ": " + failure.message;
    BT_LOG_ERROR_CTX(log_category::download, std::string(what), ctx);
}

}  // namespace

download_engine::download_engine(download_defaults policy,
                                 std::shared_ptr<adapters::worker_pool_interface> shared_pool)
    : defaults_(policy), shared_pool_(std::move(shared_pool)) {}

auto download_engine::download(const std::shared_ptr<block_blob_client>& source,
                               const std::shared_ptr<local_file>& destination,
                               const std::optional<blob_range>& range,
                               const download_options& options) -> result<blob_properties> {
    if (!source) {
        return unexpected{error{error_code::null_argument, "source blob must not be null"}};
    }
    if (!destination) {
        return unexpected{error{error_code::null_argument,
                                "destination file must not be null"}};
    }
    if (destination->mode() != local_file::access_mode::write) {
        return unexpected{error{error_code::invalid_argument,
                                "destination file is not open for writing: " +
                                    destination->path().string()}};
    }
    if (auto valid = options.validate(); !valid) {
        return unexpected{valid.error()};
    }

    blob_range requested = range.value_or(blob_range{});
    if (auto valid = requested.validate(); !valid) {
        return unexpected{valid.error()};
    }

    auto started = std::chrono::steady_clock::now();

    // Step 1: observe the blob once
    auto properties =
        source->get_properties(access_condition_evaluator::to_request(options.conditions));
    if (!properties) {
        log_failure("property fetch failed", source->url(), properties.error());
        return unexpected{properties.error()};
    }
    const auto blob_size = properties.value().content_length;

    // Step 2: plan
    uint64_t count = 0;
    if (requested.offset > 0 || blob_size > 0) {
        if (requested.offset >= blob_size) {
            return unexpected{error{error_code::invalid_range,
                                    "offset " + std::to_string(requested.offset) +
                                        " is beyond the end of a blob of " +
                                        std::to_string(blob_size) + " bytes"}};
        }
        count = std::min(requested.count.value_or(blob_size - requested.offset),
                         blob_size - requested.offset);
    }

    auto chunk_size = options.effective_block_size(defaults_.block_size);
    auto chunks = block_planner::plan_chunks(requested.offset, count, chunk_size);
    auto chunk_conditions = access_condition_evaluator::to_request(
        access_condition_evaluator::pin_etag(options.conditions, properties.value().etag));
    auto retry = options.effective_retry(defaults_.retry);
    auto parallelism = options.effective_parallelism(defaults_.parallelism);

    transfer_log_context ctx;
    ctx.blob_url = source->url();
    ctx.file_path = destination->path().string();
    ctx.file_size = count;
    ctx.block_count = chunks.size();
    ctx.etag = properties.value().etag;
    BT_LOG_INFO_CTX(log_category::download, "downloading range", ctx);

    // Step 3: fetch
    progress_reporter progress(count, options.progress);

    auto fetch = [&](uint64_t index, const cancellation_flag& flag) -> result<void> {
        const auto& chunk = chunks[static_cast<std::size_t>(index)];

        auto response = source->download(blob_range(chunk.offset, chunk.length), chunk_conditions);
        if (!response) {
            return unexpected{response.error()};
        }

        retry_reader reader(
            std::move(response.value().body), chunk.offset, chunk.length, retry,
            [&source, &chunk_conditions](const blob_range& remainder) {
                return source->download(remainder, chunk_conditions);
            });

        std::vector<uint8_t> buffer(static_cast<std::size_t>(
            std::min<uint64_t>(chunk.length, max_read_buffer)));
        uint64_t position = chunk.offset - requested.offset;

        while (reader.remaining() > 0) {
            if (flag.is_cancelled()) {
                return unexpected{error{error_code::cancelled, "download cancelled"}};
            }

            auto got = reader.read(buffer);
            if (!got) {
                return unexpected{got.error()};
            }

            auto n = got.value();
            if (auto written = destination->write_at(
                    position, std::span<const uint8_t>(buffer.data(), n));
                !written) {
                return written;
            }
            position += n;
            progress.add(n);
        }
        return {};
    };

    auto pool = shared_pool_;
    if (!pool && !chunks.empty()) {
        pool = adapters::worker_pool_factory::create(static_cast<size_t>(parallelism),
                                                     "blob_download");
    }

    if (!chunks.empty()) {
        parallel_dispatcher dispatcher(pool);
        auto fetched = dispatcher.run(chunks.size(), parallelism, fetch, download_chunk_stage);
        if (!shared_pool_) {
            pool->stop(true);
        }
        if (!fetched) {
            log_failure("chunk fetch failed", source->url(), fetched.error());
            return unexpected{fetched.error()};
        }
    }

    if (auto flushed = destination->flush(); !flushed) {
        return unexpected{flushed.error()};
    }

    auto ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                        std::chrono::steady_clock::now() - started)
                                        .count());
    ctx.bytes_transferred = count;
    ctx.duration_ms = ms;
    if (ms > 0) {
        ctx.rate_mbps = (static_cast<double>(count) / (1024.0 * 1024.0)) /
                        (static_cast<double>(ms) / 1000.0);
    }
    BT_LOG_INFO_CTX(log_category::download, "download completed", ctx);

    return properties.value();
}

}  // namespace kcenon::blob_transfer
