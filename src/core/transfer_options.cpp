/**
 * @file transfer_options.cpp
 * @brief Validation of transfer options and service limits
 */

#include <kcenon/blob_transfer/core/transfer_options.h>

#include <cctype>
#include <string>

namespace kcenon::blob_transfer {

namespace {

auto has_line_break(const std::string& value) -> bool {
    return value.find_first_of("\r\n") != std::string::npos;
}

auto is_identifier(const std::string& name) -> bool {
    if (name.empty()) {
        return false;
    }
    auto first = static_cast<unsigned char>(name.front());
    if (!std::isalpha(first) && first != '_') {
        return false;
    }
    for (char c : name) {
        auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && uc != '_') {
            return false;
        }
    }
    return true;
}

auto check_header(const std::optional<std::string>& value, const char* name) -> result<void> {
    if (value && has_line_break(*value)) {
        return unexpected{error{error_code::invalid_http_headers,
                                std::string(name) + " must not contain line breaks"}};
    }
    return {};
}

}  // namespace

auto service_limits::validate() const -> result<void> {
    if (upload_blob_ceiling == 0 || upload_blob_ceiling > max_upload_blob_bytes) {
        return unexpected{error{
            error_code::invalid_configuration,
            "upload ceiling must be in [1, " + std::to_string(max_upload_blob_bytes) + "]"}};
    }
    if (stage_block_ceiling == 0 || stage_block_ceiling > max_stage_block_bytes) {
        return unexpected{error{
            error_code::invalid_configuration,
            "stage block ceiling must be in [1, " + std::to_string(max_stage_block_bytes) + "]"}};
    }
    if (block_count_ceiling == 0 || block_count_ceiling > max_blocks) {
        return unexpected{error{
            error_code::invalid_configuration,
            "block count ceiling must be in [1, " + std::to_string(max_blocks) + "]"}};
    }
    return {};
}

auto retry_reader_options::validate() const -> result<void> {
    if (max_retries < 0) {
        return unexpected{error{error_code::invalid_retry_options,
                                "max retries must not be negative"}};
    }
    return {};
}

auto upload_options::validate() const -> result<void> {
    if (parallelism && *parallelism < 1) {
        return unexpected{error{error_code::invalid_parallelism,
                                "parallelism must be at least 1"}};
    }
    if (auto r = validate_metadata(metadata); !r) {
        return r;
    }
    return validate_http_headers(http_headers);
}

auto download_options::validate() const -> result<void> {
    if (parallelism && *parallelism < 1) {
        return unexpected{error{error_code::invalid_parallelism,
                                "parallelism must be at least 1"}};
    }
    if (block_size && *block_size == 0) {
        return unexpected{error{error_code::invalid_block_size,
                                "block size must be at least 1"}};
    }
    if (retry) {
        return retry->validate();
    }
    return {};
}

auto validate_metadata(const blob_metadata& metadata) -> result<void> {
    for (const auto& [name, value] : metadata) {
        if (!is_identifier(name)) {
            return unexpected{error{error_code::invalid_metadata,
                                    "invalid metadata name: '" + name + "'"}};
        }
        if (has_line_break(value)) {
            return unexpected{error{error_code::invalid_metadata,
                                    "metadata value for '" + name + "' contains a line break"}};
        }
    }
    return {};
}

auto validate_http_headers(const blob_http_headers& headers) -> result<void> {
    if (auto r = check_header(headers.cache_control, "cache-control"); !r) return r;
    if (auto r = check_header(headers.content_disposition, "content-disposition"); !r) return r;
    if (auto r = check_header(headers.content_encoding, "content-encoding"); !r) return r;
    if (auto r = check_header(headers.content_language, "content-language"); !r) return r;
    if (auto r = check_header(headers.content_type, "content-type"); !r) return r;

    if (headers.content_md5 && headers.content_md5->size() != 16) {
        return unexpected{error{error_code::invalid_http_headers,
                                "content MD5 must be 16 bytes"}};
    }
    return {};
}

}  // namespace kcenon::blob_transfer
