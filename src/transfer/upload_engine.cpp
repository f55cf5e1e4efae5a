/**
 * @file upload_engine.cpp
 * @brief Implementation of upload_engine
 */

#include <kcenon/blob_transfer/transfer/upload_engine.h>

#include <kcenon/blob_transfer/core/access_conditions.h>
#include <kcenon/blob_transfer/core/logging.h>
#include <kcenon/blob_transfer/transfer/parallel_dispatcher.h>

#include <chrono>
#include <mutex>
#include <vector>

namespace kcenon::blob_transfer {

namespace {

constexpr const char* stage_block_stage = "stage_block";

auto elapsed_ms(std::chrono::steady_clock::time_point start) -> uint64_t {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::steady_clock::now() - start)
                                     .count());
}

auto rate_mbps(uint64_t bytes, uint64_t ms) -> double {
    if (ms == 0) {
        return 0.0;
    }
    return (static_cast<double>(bytes) / (1024.0 * 1024.0)) / (static_cast<double>(ms) / 1000.0);
}

auto read_exact(local_file& source, uint64_t offset, std::vector<uint8_t>& buffer)
    -> result<void> {
    auto got = source.read_at(offset, buffer);
    if (!got) {
        return unexpected{got.error()};
    }
    if (got.value() != buffer.size()) {
        return unexpected{error{error_code::file_read_error,
                                "file shrank during upload: expected " +
                                    std::to_string(buffer.size()) + " bytes at offset " +
                                    std::to_string(offset) + ", got " +
                                    std::to_string(got.value())}};
    }
    return {};
}

void log_failure(std::string_view what, const std::string& url, const error& failure) {
    transfer_log_context ctx;
    ctx.blob_url = url;
    ctx.status_code = failure.status_code;
    ctx.error_message = std::string(to_string(failure.code)) + ": " + failure.message;
    BT_LOG_ERROR_CTX(log_category::upload, std::string(what), ctx);
}

}  // namespace

upload_engine::upload_engine(service_limits limits,
                             int default_parallelism,
                             std::shared_ptr<adapters::worker_pool_interface> shared_pool)
    : planner_(limits),
      default_parallelism_(default_parallelism),
      shared_pool_(std::move(shared_pool)) {}

auto upload_engine::upload(const std::shared_ptr<local_file>& source,
                           const std::shared_ptr<block_blob_client>& target,
                           uint64_t block_length,
                           const upload_options& options) -> result<upload_result> {
    if (!source) {
        return unexpected{error{error_code::null_argument, "source file must not be null"}};
    }
    if (!target) {
        return unexpected{error{error_code::null_argument, "target blob must not be null"}};
    }
    if (auto valid = options.validate(); !valid) {
        return unexpected{valid.error()};
    }

    auto plan = planner_.plan_upload(source->size(), block_length);
    if (!plan) {
        return unexpected{plan.error()};
    }

    if (plan.value().strategy == upload_strategy::single_shot) {
        return upload_single_shot(*source, *target, plan.value(), options);
    }
    return upload_blocks(source, target, plan.value(), options);
}

auto upload_engine::upload_single_shot(local_file& source,
                                       block_blob_client& target,
                                       const block_plan& plan,
                                       const upload_options& options) -> result<upload_result> {
    auto started = std::chrono::steady_clock::now();

    std::vector<uint8_t> content(static_cast<std::size_t>(plan.file_size));
    if (auto r = read_exact(source, 0, content); !r) {
        return unexpected{r.error()};
    }

    auto response = target.upload(content, options.http_headers, options.metadata,
                                  access_condition_evaluator::to_request(options.conditions));
    if (!response) {
        log_failure("single-shot upload failed", target.url(), response.error());
        return unexpected{response.error()};
    }

    progress_reporter progress(plan.file_size, options.progress);
    progress.add(plan.file_size);

    upload_result outcome;
    outcome.strategy = upload_strategy::single_shot;
    outcome.status_code = response.value().status_code;
    outcome.etag = response.value().etag;
    outcome.last_modified = response.value().last_modified;
    outcome.content_md5 = response.value().content_md5;
    outcome.bytes_uploaded = plan.file_size;
    outcome.block_count = 0;

    auto ms = elapsed_ms(started);
    transfer_log_context ctx;
    ctx.blob_url = target.url();
    ctx.file_path = source.path().string();
    ctx.file_size = plan.file_size;
    ctx.etag = outcome.etag;
    ctx.duration_ms = ms;
    ctx.rate_mbps = rate_mbps(plan.file_size, ms);
    BT_LOG_INFO_CTX(log_category::upload, "single-shot upload completed", ctx);

    return outcome;
}

auto upload_engine::upload_blocks(const std::shared_ptr<local_file>& source,
                                  const std::shared_ptr<block_blob_client>& target,
                                  const block_plan& plan,
                                  const upload_options& options) -> result<upload_result> {
    auto started = std::chrono::steady_clock::now();
    auto parallelism = options.effective_parallelism(default_parallelism_);

    transfer_log_context start_ctx;
    start_ctx.blob_url = target->url();
    start_ctx.file_path = source->path().string();
    start_ctx.file_size = plan.file_size;
    start_ctx.block_count = plan.blocks.size();
    BT_LOG_INFO_CTX(log_category::upload, "staging blocks", start_ctx);

    auto pool = shared_pool_;
    if (!pool) {
        pool = adapters::worker_pool_factory::create(static_cast<size_t>(parallelism),
                                                     "blob_upload");
    }

    auto lease_only = access_condition_evaluator::to_lease_request(options.conditions);
    progress_reporter progress(plan.file_size, options.progress);

    std::mutex staged_mutex;
    std::vector<std::string> staged_ids;
    staged_ids.reserve(plan.blocks.size());

    auto stage = [&](uint64_t index, const cancellation_flag& flag) -> result<void> {
        const auto& block = plan.blocks[static_cast<std::size_t>(index)];

        std::vector<uint8_t> buffer(static_cast<std::size_t>(block.length));
        if (auto r = read_exact(*source, block.offset, buffer); !r) {
            return r;
        }
        if (flag.is_cancelled()) {
            return unexpected{error{error_code::cancelled, "upload cancelled"}};
        }

        if (auto r = target->stage_block(block.id, buffer, lease_only); !r) {
            return r;
        }

        {
            std::lock_guard lock(staged_mutex);
            staged_ids.push_back(block.id);
        }
        progress.add(block.length);
        return {};
    };

    parallel_dispatcher dispatcher(pool);
    auto staged = dispatcher.run(plan.blocks.size(), parallelism, stage, stage_block_stage);
    if (!shared_pool_) {
        pool->stop(true);
    }
    if (!staged) {
        log_failure("block staging failed", target->url(), staged.error());
        return unexpected{staged.error()};
    }

    block_planner::sort_block_ids(staged_ids);

    auto committed = target->commit_block_list(
        staged_ids, options.http_headers, options.metadata,
        access_condition_evaluator::to_request(options.conditions));
    if (!committed) {
        log_failure("block list commit failed", target->url(), committed.error());
        return unexpected{committed.error()};
    }

    upload_result outcome;
    outcome.strategy = upload_strategy::multi_block;
    outcome.status_code = committed.value().status_code;
    outcome.etag = committed.value().etag;
    outcome.last_modified = committed.value().last_modified;
    outcome.content_md5 = committed.value().content_md5;
    outcome.bytes_uploaded = plan.file_size;
    outcome.block_count = staged_ids.size();

    auto ms = elapsed_ms(started);
    transfer_log_context ctx = start_ctx;
    ctx.etag = outcome.etag;
    ctx.bytes_transferred = plan.file_size;
    ctx.duration_ms = ms;
    ctx.rate_mbps = rate_mbps(plan.file_size, ms);
    BT_LOG_INFO_CTX(log_category::upload, "block list committed", ctx);

    return outcome;
}

}  // namespace kcenon::blob_transfer
