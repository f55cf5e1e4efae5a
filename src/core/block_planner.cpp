/**
 * @file block_planner.cpp
 * @brief Implementation of block and chunk planning
 */

#include <kcenon/blob_transfer/core/block_planner.h>

#include <kcenon/blob_transfer/core/encoding.h>

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

namespace kcenon::blob_transfer {

block_planner::block_planner(service_limits limits) : limits_(limits) {}

auto block_planner::plan_upload(uint64_t file_size,
                                uint64_t block_length,
                                std::string nonce) const -> result<block_plan> {
    if (block_length == 0 || block_length > limits_.stage_block_ceiling) {
        return unexpected{error{
            error_code::invalid_block_size,
            "block length must be in [1, " + std::to_string(limits_.stage_block_ceiling) +
                "], got " + std::to_string(block_length)}};
    }

    block_plan plan;
    plan.file_size = file_size;
    plan.block_length = block_length;

    if (file_size <= limits_.upload_blob_ceiling) {
        plan.strategy = upload_strategy::single_shot;
        return plan;
    }

    auto block_count = calculate_block_count(file_size, block_length);
    if (block_count > limits_.block_count_ceiling) {
        return unexpected{error{
            error_code::too_many_blocks,
            "file of " + std::to_string(file_size) + " bytes needs " +
                std::to_string(block_count) + " blocks of " + std::to_string(block_length) +
                " bytes (maximum: " + std::to_string(limits_.block_count_ceiling) + ")"}};
    }

    if (nonce.empty()) {
        nonce = encoding::generate_random_hex(8);
    }

    plan.strategy = upload_strategy::multi_block;
    plan.blocks.reserve(static_cast<std::size_t>(block_count));
    for (uint64_t i = 0; i < block_count; ++i) {
        block_descriptor block;
        block.ordinal = static_cast<uint32_t>(i);
        block.offset = i * block_length;
        block.length = std::min(block_length, file_size - block.offset);
        block.id = make_block_id(nonce, block.ordinal);
        plan.blocks.push_back(std::move(block));
    }

    return plan;
}

auto block_planner::plan_chunks(uint64_t offset,
                                uint64_t count,
                                uint64_t chunk_size) -> std::vector<chunk_descriptor> {
    std::vector<chunk_descriptor> chunks;
    if (count == 0 || chunk_size == 0) {
        return chunks;
    }

    chunks.reserve(static_cast<std::size_t>(calculate_block_count(count, chunk_size)));
    uint64_t position = 0;
    uint64_t index = 0;
    while (position < count) {
        chunk_descriptor chunk;
        chunk.index = index++;
        chunk.offset = offset + position;
        chunk.length = std::min(chunk_size, count - position);
        position += chunk.length;
        chunks.push_back(chunk);
    }
    return chunks;
}

auto block_planner::make_block_id(const std::string& nonce, uint32_t ordinal) -> std::string {
    std::ostringstream oss;
    oss << nonce << '-' << std::setfill('0') << std::setw(ordinal_width) << ordinal;
    return encoding::base64_encode(oss.str());
}

auto block_planner::parse_block_ordinal(const std::string& block_id) -> std::optional<uint32_t> {
    auto decoded = encoding::base64_decode(block_id);
    std::string raw(decoded.begin(), decoded.end());

    auto dash = raw.rfind('-');
    if (dash == std::string::npos ||
        raw.size() - dash - 1 != static_cast<std::size_t>(ordinal_width)) {
        return std::nullopt;
    }

    uint32_t ordinal = 0;
    for (std::size_t i = dash + 1; i < raw.size(); ++i) {
        if (raw[i] < '0' || raw[i] > '9') {
            return std::nullopt;
        }
        ordinal = ordinal * 10 + static_cast<uint32_t>(raw[i] - '0');
    }
    return ordinal;
}

void block_planner::sort_block_ids(std::vector<std::string>& block_ids) {
    std::vector<std::pair<std::string, std::string>> keyed;
    keyed.reserve(block_ids.size());
    for (auto& id : block_ids) {
        auto decoded = encoding::base64_decode(id);
        keyed.emplace_back(std::string(decoded.begin(), decoded.end()), std::move(id));
    }

    std::sort(keyed.begin(), keyed.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    for (std::size_t i = 0; i < keyed.size(); ++i) {
        block_ids[i] = std::move(keyed[i].second);
    }
}

}  // namespace kcenon::blob_transfer
