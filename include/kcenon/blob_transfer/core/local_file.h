/**
 * @file local_file.h
 * @brief Shared local file handle with positional reads and writes
 */

#ifndef KCENON_BLOB_TRANSFER_CORE_LOCAL_FILE_H
#define KCENON_BLOB_TRANSFER_CORE_LOCAL_FILE_H

#include <kcenon/blob_transfer/core/types.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <span>

namespace kcenon::blob_transfer {

/**
 * @brief Local file shared by concurrent block and chunk tasks
 *
 * Every access names its own offset, so tasks never depend on a shared file
 * position. Accesses are serialized internally. The file is closed when the
 * last owner releases it; the transfer engines never close a caller's file.
 */
class local_file {
public:
    enum class access_mode {
        read,
        write
    };

    /**
     * @brief Open an existing file for reading
     * @return Handle, or file_not_found / file_access_denied
     */
    [[nodiscard]] static auto open_for_read(const std::filesystem::path& path)
        -> result<std::shared_ptr<local_file>>;

    /**
     * @brief Open a file for writing, creating it if needed
     * @param path Target path
     * @param truncate Discard existing contents
     */
    [[nodiscard]] static auto open_for_write(const std::filesystem::path& path,
                                             bool truncate = true)
        -> result<std::shared_ptr<local_file>>;

    ~local_file();

    local_file(const local_file&) = delete;
    auto operator=(const local_file&) -> local_file& = delete;

    /**
     * @brief Current size of the file in bytes
     */
    [[nodiscard]] auto size() const -> uint64_t;

    /**
     * @brief Read up to buffer.size() bytes starting at offset
     * @return Number of bytes read; less than requested only at end of file
     */
    [[nodiscard]] auto read_at(uint64_t offset, std::span<uint8_t> buffer) -> result<std::size_t>;

    /**
     * @brief Write data at offset, extending the file if needed
     */
    [[nodiscard]] auto write_at(uint64_t offset, std::span<const uint8_t> data) -> result<void>;

    /**
     * @brief Flush buffered writes
     */
    [[nodiscard]] auto flush() -> result<void>;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }
    [[nodiscard]] auto mode() const -> access_mode { return mode_; }

private:
    local_file(std::filesystem::path path, access_mode mode);

    std::filesystem::path path_;
    access_mode mode_;
    uint64_t size_ = 0;
    std::fstream stream_;
    mutable std::mutex mutex_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_CORE_LOCAL_FILE_H
