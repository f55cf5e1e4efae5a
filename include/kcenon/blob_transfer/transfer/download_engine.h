/**
 * @file download_engine.h
 * @brief Parallel ranged download of a blob into a local file
 */

#ifndef KCENON_BLOB_TRANSFER_TRANSFER_DOWNLOAD_ENGINE_H
#define KCENON_BLOB_TRANSFER_TRANSFER_DOWNLOAD_ENGINE_H

#include <kcenon/blob_transfer/adapters/thread_pool_adapter.h>
#include <kcenon/blob_transfer/core/blob_types.h>
#include <kcenon/blob_transfer/core/local_file.h>
#include <kcenon/blob_transfer/core/transfer_options.h>
#include <kcenon/blob_transfer/core/types.h>
#include <kcenon/blob_transfer/transport/block_blob_client.h>

#include <cstdint>
#include <memory>
#include <optional>

namespace kcenon::blob_transfer {

/**
 * @brief Download policy used when the options leave a value unset
 */
struct download_defaults {
    uint64_t block_size = download_options::default_block_size;
    int parallelism = download_options::default_parallelism;
    retry_reader_options retry{};
};

/**
 * @brief Downloads a blob range with parallel ranged reads
 *
 * The blob's properties are fetched once. Unless the caller supplied access
 * conditions, every chunk read is pinned to the etag observed then, so a
 * blob modified mid-download fails the transfer with condition_not_met. The
 * destination receives exactly the requested range starting at position 0.
 */
class download_engine {
public:
    /// Upper bound of the per-task read buffer
    static constexpr std::size_t max_read_buffer = 4 * 1024 * 1024;

    explicit download_engine(download_defaults policy = download_defaults{},
                             std::shared_ptr<adapters::worker_pool_interface> shared_pool = nullptr);

    /**
     * @param source Blob to read
     * @param destination File that receives the range from position 0
     * @param range Range to read; the whole blob when nullopt
     * @param options Block size, parallelism, retry policy, conditions
     * @return Properties observed when the download started
     */
    [[nodiscard]] auto download(const std::shared_ptr<block_blob_client>& source,
                                const std::shared_ptr<local_file>& destination,
                                const std::optional<blob_range>& range = std::nullopt,
                                const download_options& options = {})
        -> result<blob_properties>;

private:
    download_defaults defaults_;
    std::shared_ptr<adapters::worker_pool_interface> shared_pool_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_TRANSFER_DOWNLOAD_ENGINE_H
