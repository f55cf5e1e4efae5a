/**
 * @file transfer_manager.cpp
 * @brief Implementation of transfer_manager
 */

#include <kcenon/blob_transfer/transfer/transfer_manager.h>

#include <kcenon/blob_transfer/core/logging.h>
#include <kcenon/blob_transfer/transfer/download_engine.h>
#include <kcenon/blob_transfer/transfer/upload_engine.h>

namespace kcenon::blob_transfer {

struct transfer_manager::impl {
    transfer_manager_config config;
    upload_engine uploader;
    download_engine downloader;

    explicit impl(transfer_manager_config cfg)
        : config(std::move(cfg)),
          uploader(config.limits, config.default_parallelism, config.thread_pool),
          downloader(download_defaults{config.default_block_size, config.default_parallelism,
                                       config.default_retry},
                     config.thread_pool) {}
};

// builder

transfer_manager::builder::builder() = default;

auto transfer_manager::builder::with_limits(const service_limits& limits) -> builder& {
    config_.limits = limits;
    return *this;
}

auto transfer_manager::builder::with_default_parallelism(int parallelism) -> builder& {
    config_.default_parallelism = parallelism;
    return *this;
}

auto transfer_manager::builder::with_default_download_block_size(uint64_t block_size)
    -> builder& {
    config_.default_block_size = block_size;
    return *this;
}

auto transfer_manager::builder::with_default_retry(const retry_reader_options& retry)
    -> builder& {
    config_.default_retry = retry;
    return *this;
}

auto transfer_manager::builder::with_thread_pool(
    std::shared_ptr<adapters::worker_pool_interface> pool) -> builder& {
    config_.thread_pool = std::move(pool);
    return *this;
}

auto transfer_manager::builder::build() -> result<transfer_manager> {
    if (auto valid = config_.limits.validate(); !valid) {
        return unexpected{valid.error()};
    }
    if (config_.default_parallelism < 1) {
        return unexpected{error{error_code::invalid_configuration,
                                "default parallelism must be at least 1"}};
    }
    if (config_.default_block_size == 0) {
        return unexpected{error{error_code::invalid_configuration,
                                "default download block size must be at least 1"}};
    }
    if (config_.default_retry.max_retries < 0) {
        return unexpected{error{error_code::invalid_configuration,
                                "default retry ceiling must not be negative"}};
    }
    if (config_.thread_pool && !config_.thread_pool->is_running()) {
        return unexpected{error{error_code::invalid_configuration,
                                "injected thread pool is not running"}};
    }

    return transfer_manager{std::move(config_)};
}

// transfer_manager

transfer_manager::transfer_manager(transfer_manager_config config)
    : impl_(std::make_unique<impl>(std::move(config))) {
    // Safe to call multiple times
    get_logger().initialize();
}

transfer_manager::transfer_manager(transfer_manager&&) noexcept = default;
auto transfer_manager::operator=(transfer_manager&&) noexcept -> transfer_manager& = default;
transfer_manager::~transfer_manager() = default;

auto transfer_manager::upload_file_to_block_blob(const std::shared_ptr<local_file>& source,
                                                 const std::shared_ptr<block_blob_client>& target,
                                                 uint64_t block_length,
                                                 const upload_options& options)
    -> result<upload_result> {
    return impl_->uploader.upload(source, target, block_length, options);
}

auto transfer_manager::download_blob_to_file(const std::shared_ptr<local_file>& destination,
                                             const std::shared_ptr<block_blob_client>& source,
                                             const std::optional<blob_range>& range,
                                             const download_options& options)
    -> result<blob_properties> {
    return impl_->downloader.download(source, destination, range, options);
}

auto transfer_manager::upload_file(const std::filesystem::path& path,
                                   const std::shared_ptr<block_blob_client>& target,
                                   uint64_t block_length,
                                   const upload_options& options) -> result<upload_result> {
    auto file = local_file::open_for_read(path);
    if (!file) {
        BT_LOG_ERROR(log_category::manager, "cannot open upload source: " + file.error().message);
        return unexpected{file.error()};
    }
    return upload_file_to_block_blob(file.value(), target, block_length, options);
}

auto transfer_manager::download_file(const std::shared_ptr<block_blob_client>& source,
                                     const std::filesystem::path& path,
                                     const std::optional<blob_range>& range,
                                     const download_options& options)
    -> result<blob_properties> {
    // Validate before touching the destination so a bad call leaves it intact
    if (!source) {
        return unexpected{error{error_code::null_argument, "source blob must not be null"}};
    }
    if (auto valid = options.validate(); !valid) {
        return unexpected{valid.error()};
    }
    if (range) {
        if (auto valid = range->validate(); !valid) {
            return unexpected{valid.error()};
        }
    }

    auto file = local_file::open_for_write(path, true);
    if (!file) {
        BT_LOG_ERROR(log_category::manager,
                     "cannot open download destination: " + file.error().message);
        return unexpected{file.error()};
    }
    return download_blob_to_file(file.value(), source, range, options);
}

auto transfer_manager::config() const -> const transfer_manager_config& {
    return impl_->config;
}

}  // namespace kcenon::blob_transfer
