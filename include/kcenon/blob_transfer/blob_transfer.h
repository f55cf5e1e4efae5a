/**
 * @file blob_transfer.h
 * @brief Main header for the blob_transfer library
 * @version 0.1.0
 *
 * Include this header to access the transfer manager, the block blob
 * abstraction and the Azure REST adapter.
 *
 * @code
 * #include <kcenon/blob_transfer/blob_transfer.h>
 *
 * using namespace kcenon::blob_transfer;
 *
 * auto manager = transfer_manager::builder().build();
 *
 * auto endpoint = azure_blob_endpoint::from_connection_string(conn, "backups", "db.tar");
 * auto blob = azure_block_blob_client::create(endpoint.value());
 *
 * manager.value().upload_file("db.tar", blob.value(), 8 * 1024 * 1024);
 * @endcode
 */

#ifndef KCENON_BLOB_TRANSFER_BLOB_TRANSFER_H
#define KCENON_BLOB_TRANSFER_BLOB_TRANSFER_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/blob_transfer/core/types.h"
#include "kcenon/blob_transfer/core/blob_types.h"
#include "kcenon/blob_transfer/core/access_conditions.h"
#include "kcenon/blob_transfer/core/transfer_options.h"
#include "kcenon/blob_transfer/core/local_file.h"

// Transport
#include "kcenon/blob_transfer/transport/block_blob_client.h"
#include "kcenon/blob_transfer/transport/azure_block_blob_client.h"

// Transfer
#include "kcenon/blob_transfer/transfer/transfer_manager.h"

// Adapters
#include "kcenon/blob_transfer/adapters/thread_pool_adapter.h"

namespace kcenon::blob_transfer {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_BLOB_TRANSFER_H
