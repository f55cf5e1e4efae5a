/**
 * @file upload_engine.h
 * @brief Upload of a local file to a block blob
 */

#ifndef KCENON_BLOB_TRANSFER_TRANSFER_UPLOAD_ENGINE_H
#define KCENON_BLOB_TRANSFER_TRANSFER_UPLOAD_ENGINE_H

#include <kcenon/blob_transfer/adapters/thread_pool_adapter.h>
#include <kcenon/blob_transfer/core/blob_types.h>
#include <kcenon/blob_transfer/core/block_planner.h>
#include <kcenon/blob_transfer/core/local_file.h>
#include <kcenon/blob_transfer/core/transfer_options.h>
#include <kcenon/blob_transfer/core/types.h>
#include <kcenon/blob_transfer/transport/block_blob_client.h>

#include <cstdint>
#include <memory>

namespace kcenon::blob_transfer {

/**
 * @brief Uploads files as a single Put Blob or as staged blocks plus a commit
 *
 * Files up to the single-shot ceiling go up in one request. Larger files are
 * cut into blocks that are staged in parallel and committed in file order.
 * All arguments are validated before the first remote call.
 */
class upload_engine {
public:
    /**
     * @param limits Service ceilings the upload is validated against
     * @param default_parallelism Parallelism when the options name none
     * @param shared_pool Pool to run on; a per-upload pool is created if null
     */
    explicit upload_engine(service_limits limits = {},
                           int default_parallelism = upload_options::default_parallelism,
                           std::shared_ptr<adapters::worker_pool_interface> shared_pool = nullptr);

    [[nodiscard]] auto upload(const std::shared_ptr<local_file>& source,
                              const std::shared_ptr<block_blob_client>& target,
                              uint64_t block_length,
                              const upload_options& options = {}) -> result<upload_result>;

private:
    auto upload_single_shot(local_file& source,
                            block_blob_client& target,
                            const block_plan& plan,
                            const upload_options& options) -> result<upload_result>;

    auto upload_blocks(const std::shared_ptr<local_file>& source,
                       const std::shared_ptr<block_blob_client>& target,
                       const block_plan& plan,
                       const upload_options& options) -> result<upload_result>;

    block_planner planner_;
    int default_parallelism_;
    std::shared_ptr<adapters::worker_pool_interface> shared_pool_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_TRANSFER_UPLOAD_ENGINE_H
