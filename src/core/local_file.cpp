/**
 * @file local_file.cpp
 * @brief Implementation of local_file
 */

#include <kcenon/blob_transfer/core/local_file.h>

#include <algorithm>

namespace kcenon::blob_transfer {

namespace {

auto open_failure(const std::filesystem::path& path, const char* action) -> error {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return error{error_code::file_not_found, "file not found: " + path.string()};
    }
    return error{error_code::file_access_denied,
                 std::string("cannot open file for ") + action + ": " + path.string()};
}

}  // namespace

local_file::local_file(std::filesystem::path path, access_mode mode)
    : path_(std::move(path)), mode_(mode) {}

local_file::~local_file() {
    if (stream_.is_open()) {
        stream_.close();
    }
}

auto local_file::open_for_read(const std::filesystem::path& path)
    -> result<std::shared_ptr<local_file>> {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return unexpected{error{error_code::file_access_denied,
                                "path is a directory: " + path.string()}};
    }

    std::shared_ptr<local_file> file(new local_file(path, access_mode::read));
    file->stream_.open(path, std::ios::in | std::ios::binary);
    if (!file->stream_.is_open()) {
        return unexpected{open_failure(path, "reading")};
    }

    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return unexpected{error{error_code::file_read_error,
                                "cannot determine file size: " + path.string()}};
    }
    file->size_ = size;
    return file;
}

auto local_file::open_for_write(const std::filesystem::path& path, bool truncate)
    -> result<std::shared_ptr<local_file>> {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return unexpected{error{error_code::file_access_denied,
                                "path is a directory: " + path.string()}};
    }

    // in|out requires an existing file
    if (truncate || !std::filesystem::exists(path, ec)) {
        std::ofstream create(path, std::ios::binary | std::ios::trunc);
        if (!create.is_open()) {
            return unexpected{error{error_code::file_access_denied,
                                    "cannot create file: " + path.string()}};
        }
    }

    std::shared_ptr<local_file> file(new local_file(path, access_mode::write));
    file->stream_.open(path, std::ios::in | std::ios::out | std::ios::binary);
    if (!file->stream_.is_open()) {
        return unexpected{open_failure(path, "writing")};
    }

    auto size = std::filesystem::file_size(path, ec);
    file->size_ = ec ? 0 : size;
    return file;
}

auto local_file::size() const -> uint64_t {
    std::lock_guard lock(mutex_);
    return size_;
}

auto local_file::read_at(uint64_t offset, std::span<uint8_t> buffer) -> result<std::size_t> {
    std::lock_guard lock(mutex_);

    if (offset >= size_ || buffer.empty()) {
        return std::size_t{0};
    }

    auto to_read = static_cast<std::size_t>(
        std::min<uint64_t>(buffer.size(), size_ - offset));

    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset));
    if (!stream_.good()) {
        return unexpected{error{error_code::file_read_error,
                                "seek to " + std::to_string(offset) + " failed: " +
                                    path_.string()}};
    }

    stream_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(to_read));
    auto got = static_cast<std::size_t>(stream_.gcount());
    if (got != to_read) {
        return unexpected{error{error_code::file_read_error,
                                "short read at " + std::to_string(offset) + ": " +
                                    path_.string()}};
    }
    return got;
}

auto local_file::write_at(uint64_t offset, std::span<const uint8_t> data) -> result<void> {
    if (mode_ != access_mode::write) {
        return unexpected{error{error_code::file_access_denied,
                                "file is open for reading: " + path_.string()}};
    }

    std::lock_guard lock(mutex_);
    if (data.empty()) {
        return {};
    }

    stream_.clear();
    stream_.seekp(static_cast<std::streamoff>(offset));
    if (!stream_.good()) {
        return unexpected{error{error_code::file_write_error,
                                "seek to " + std::to_string(offset) + " failed: " +
                                    path_.string()}};
    }

    stream_.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
    if (!stream_.good()) {
        return unexpected{error{error_code::file_write_error,
                                "write at " + std::to_string(offset) + " failed: " +
                                    path_.string()}};
    }

    size_ = std::max<uint64_t>(size_, offset + data.size());
    return {};
}

auto local_file::flush() -> result<void> {
    std::lock_guard lock(mutex_);
    if (mode_ != access_mode::write) {
        return {};
    }
    stream_.flush();
    if (!stream_.good()) {
        return unexpected{error{error_code::file_write_error,
                                "flush failed: " + path_.string()}};
    }
    return {};
}

}  // namespace kcenon::blob_transfer
