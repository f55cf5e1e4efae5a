/**
 * @file block_planner.h
 * @brief Partitioning of uploads into blocks and downloads into chunks
 */

#ifndef KCENON_BLOB_TRANSFER_CORE_BLOCK_PLANNER_H
#define KCENON_BLOB_TRANSFER_CORE_BLOCK_PLANNER_H

#include <kcenon/blob_transfer/core/blob_types.h>
#include <kcenon/blob_transfer/core/transfer_options.h>
#include <kcenon/blob_transfer/core/types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::blob_transfer {

/**
 * @brief One block of a multi-block upload
 */
struct block_descriptor {
    std::string id;        ///< Base64 block id, fixed length within an upload
    uint32_t ordinal = 0;  ///< Position of the block in the file
    uint64_t offset = 0;   ///< Byte offset in the file
    uint64_t length = 0;   ///< Byte count (the last block may be shorter)
};

/**
 * @brief One ranged read of a download
 */
struct chunk_descriptor {
    uint64_t index = 0;
    uint64_t offset = 0;  ///< Absolute offset in the blob
    uint64_t length = 0;
};

/**
 * @brief Upload plan for one file
 */
struct block_plan {
    upload_strategy strategy = upload_strategy::single_shot;
    uint64_t file_size = 0;
    uint64_t block_length = 0;
    std::vector<block_descriptor> blocks;  ///< Empty for single-shot
};

/**
 * @brief Computes block and chunk layouts against the service limits
 *
 * Block ids encode a per-upload nonce and a zero-padded ordinal, so their
 * decoded forms sort into file order and the commit can restore ordering from
 * the ids alone.
 */
class block_planner {
public:
    /// Digits of the zero-padded ordinal inside a block id
    static constexpr int ordinal_width = 6;

    explicit block_planner(service_limits limits = {});

    /**
     * @brief Plan an upload
     *
     * The block length is validated even when the file is small enough for a
     * single-shot upload.
     *
     * @param file_size Size of the local file
     * @param block_length Requested block length
     * @param nonce Id prefix; a random one is generated when empty
     * @return Plan, or invalid_block_size / too_many_blocks
     */
    [[nodiscard]] auto plan_upload(uint64_t file_size,
                                   uint64_t block_length,
                                   std::string nonce = {}) const -> result<block_plan>;

    /**
     * @brief Number of blocks needed for size bytes
     */
    [[nodiscard]] static auto calculate_block_count(uint64_t size, uint64_t block_length)
        -> uint64_t {
        if (size == 0 || block_length == 0) return 0;
        return (size + block_length - 1) / block_length;
    }

    /**
     * @brief Split [offset, offset + count) into contiguous chunks
     */
    [[nodiscard]] static auto plan_chunks(uint64_t offset,
                                          uint64_t count,
                                          uint64_t chunk_size) -> std::vector<chunk_descriptor>;

    /**
     * @brief Build the block id for an ordinal
     */
    [[nodiscard]] static auto make_block_id(const std::string& nonce, uint32_t ordinal)
        -> std::string;

    /**
     * @brief Recover the ordinal from a block id
     * @return Ordinal, or nullopt if the id was not produced by make_block_id
     */
    [[nodiscard]] static auto parse_block_ordinal(const std::string& block_id)
        -> std::optional<uint32_t>;

    /**
     * @brief Sort block ids of one upload into file order
     */
    static void sort_block_ids(std::vector<std::string>& block_ids);

    [[nodiscard]] auto limits() const -> const service_limits& { return limits_; }

private:
    service_limits limits_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_CORE_BLOCK_PLANNER_H
