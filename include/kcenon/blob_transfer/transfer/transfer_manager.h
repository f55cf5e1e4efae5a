/**
 * @file transfer_manager.h
 * @brief Public entry points for blob uploads and downloads
 */

#ifndef KCENON_BLOB_TRANSFER_TRANSFER_TRANSFER_MANAGER_H
#define KCENON_BLOB_TRANSFER_TRANSFER_TRANSFER_MANAGER_H

#include <kcenon/blob_transfer/adapters/thread_pool_adapter.h>
#include <kcenon/blob_transfer/core/blob_types.h>
#include <kcenon/blob_transfer/core/local_file.h>
#include <kcenon/blob_transfer/core/transfer_options.h>
#include <kcenon/blob_transfer/core/types.h>
#include <kcenon/blob_transfer/transport/block_blob_client.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>

namespace kcenon::blob_transfer {

/**
 * @brief Limits and default policy of a transfer_manager
 */
struct transfer_manager_config {
    service_limits limits;
    int default_parallelism = upload_options::default_parallelism;
    uint64_t default_block_size = download_options::default_block_size;
    retry_reader_options default_retry;

    /// Pool shared by all transfers; each transfer creates its own when null
    std::shared_ptr<adapters::worker_pool_interface> thread_pool;
};

/**
 * @brief Moves files to and from block blobs
 *
 * @code
 * auto manager = transfer_manager::builder()
 *     .with_default_parallelism(8)
 *     .build();
 *
 * auto uploaded = manager.value().upload_file("data.bin", blob, 8 * 1024 * 1024);
 * @endcode
 */
class transfer_manager {
public:
    class builder {
    public:
        builder();

        /**
         * @brief Lower the service ceilings
         * @param limits Ceilings, each in [1, service limit]
         * @return Reference to builder for chaining
         */
        auto with_limits(const service_limits& limits) -> builder&;

        /**
         * @brief Parallelism used when the options name none (default: 5)
         * @return Reference to builder for chaining
         */
        auto with_default_parallelism(int parallelism) -> builder&;

        /**
         * @brief Download block size used when the options name none (default: 4MB)
         * @return Reference to builder for chaining
         */
        auto with_default_download_block_size(uint64_t block_size) -> builder&;

        /**
         * @brief Retry policy used when the download options name none (default: 5 retries)
         * @return Reference to builder for chaining
         */
        auto with_default_retry(const retry_reader_options& retry) -> builder&;

        /**
         * @brief Run every transfer on a shared pool
         * @return Reference to builder for chaining
         */
        auto with_thread_pool(std::shared_ptr<adapters::worker_pool_interface> pool) -> builder&;

        /**
         * @brief Validate the configuration and build the manager
         * @return Result containing the manager or invalid_configuration
         */
        [[nodiscard]] auto build() -> result<transfer_manager>;

    private:
        transfer_manager_config config_;
    };

    // Non-copyable, movable
    transfer_manager(const transfer_manager&) = delete;
    auto operator=(const transfer_manager&) -> transfer_manager& = delete;
    transfer_manager(transfer_manager&&) noexcept;
    auto operator=(transfer_manager&&) noexcept -> transfer_manager&;
    ~transfer_manager();

    /**
     * @brief Upload a local file to a block blob
     *
     * Files up to limits.upload_blob_ceiling go up in one request; larger
     * files are staged in blocks of block_length bytes and committed. The
     * caller keeps ownership of source; it is not closed.
     *
     * @param source File to read
     * @param target Blob to replace
     * @param block_length Block size for staged uploads, validated even when
     *        the file is uploaded in one request
     * @param options Headers, metadata, conditions, parallelism, progress
     */
    [[nodiscard]] auto upload_file_to_block_blob(const std::shared_ptr<local_file>& source,
                                                 const std::shared_ptr<block_blob_client>& target,
                                                 uint64_t block_length,
                                                 const upload_options& options = {})
        -> result<upload_result>;

    /**
     * @brief Download a blob range into a local file
     *
     * The range is written from position 0 of destination; existing bytes
     * beyond the range are left untouched.
     *
     * @return Properties observed when the download started
     */
    [[nodiscard]] auto download_blob_to_file(const std::shared_ptr<local_file>& destination,
                                             const std::shared_ptr<block_blob_client>& source,
                                             const std::optional<blob_range>& range = std::nullopt,
                                             const download_options& options = {})
        -> result<blob_properties>;

    /**
     * @brief Open path and upload it
     */
    [[nodiscard]] auto upload_file(const std::filesystem::path& path,
                                   const std::shared_ptr<block_blob_client>& target,
                                   uint64_t block_length,
                                   const upload_options& options = {}) -> result<upload_result>;

    /**
     * @brief Download into path, replacing any existing file
     */
    [[nodiscard]] auto download_file(const std::shared_ptr<block_blob_client>& source,
                                     const std::filesystem::path& path,
                                     const std::optional<blob_range>& range = std::nullopt,
                                     const download_options& options = {})
        -> result<blob_properties>;

    [[nodiscard]] auto config() const -> const transfer_manager_config&;

private:
    explicit transfer_manager(transfer_manager_config config);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_TRANSFER_TRANSFER_MANAGER_H
