/**
 * @file fake_block_blob_service.h
 * @brief In-memory block blob used by the engine and manager tests
 *
 * Behaves like the service for the calls the engines make: conditional
 * headers and leases are evaluated, staged blocks are kept apart from the
 * committed content, and every successful write produces a new etag.
 * Faults can be injected to exercise retries and failure paths.
 */

#ifndef KCENON_BLOB_TRANSFER_TESTS_SUPPORT_FAKE_BLOCK_BLOB_SERVICE_H
#define KCENON_BLOB_TRANSFER_TESTS_SUPPORT_FAKE_BLOCK_BLOB_SERVICE_H

#include <kcenon/blob_transfer/core/access_conditions.h>
#include <kcenon/blob_transfer/core/encoding.h>
#include <kcenon/blob_transfer/transport/block_blob_client.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace kcenon::blob_transfer::test {

/**
 * @brief Deterministic test payload
 */
inline auto make_test_data(std::size_t size, uint32_t seed = 42) -> std::vector<uint8_t> {
    std::vector<uint8_t> data(size);
    std::mt19937 gen(seed);
    std::uniform_int_distribution<> dis(0, 255);
    for (auto& byte : data) {
        byte = static_cast<uint8_t>(dis(gen));
    }
    return data;
}

/**
 * @brief Body stream that can stop early or fail after a byte budget
 */
class fake_body_stream : public blob_body_stream {
public:
    enum class fault { none, interrupt, truncate };

    fake_body_stream(std::vector<uint8_t> data, fault kind, std::size_t fault_after)
        : data_(std::move(data)), fault_(kind), fault_after_(fault_after) {}

    [[nodiscard]] auto read(std::span<uint8_t> buffer) -> result<std::size_t> override {
        std::size_t limit = data_.size();
        if (fault_ != fault::none) {
            limit = std::min(limit, fault_after_);
        }

        if (position_ >= limit) {
            if (fault_ == fault::interrupt && position_ < data_.size()) {
                return unexpected{error{error_code::stream_interrupted,
                                        "connection dropped mid-stream"}};
            }
            return std::size_t{0};
        }

        auto n = std::min(buffer.size(), limit - position_);
        std::memcpy(buffer.data(), data_.data() + position_, n);
        position_ += n;
        return n;
    }

private:
    std::vector<uint8_t> data_;
    fault fault_;
    std::size_t fault_after_;
    std::size_t position_ = 0;
};

/**
 * @brief Thread-safe in-memory block blob
 */
class fake_block_blob_service : public block_blob_client {
public:
    explicit fake_block_blob_service(std::string url = "https://account.blob.core.windows.net/c/blob")
        : url_(std::move(url)), last_modified_(whole_seconds(std::chrono::system_clock::now())) {}

    // ------------------------------------------------------------------------
    // Test setup
    // ------------------------------------------------------------------------

    void set_content(std::vector<uint8_t> content) {
        std::lock_guard lock(mutex_);
        content_ = std::move(content);
        exists_ = true;
        touch();
    }

    void set_http_headers(const blob_http_headers& headers) {
        std::lock_guard lock(mutex_);
        headers_ = headers;
    }

    void set_metadata(const blob_metadata& metadata) {
        std::lock_guard lock(mutex_);
        metadata_ = metadata;
    }

    void set_last_modified(std::chrono::system_clock::time_point when) {
        std::lock_guard lock(mutex_);
        last_modified_ = whole_seconds(when);
    }

    void acquire_lease(const std::string& lease_id) {
        std::lock_guard lock(mutex_);
        lease_id_ = lease_id;
    }

    void break_lease() {
        std::lock_guard lock(mutex_);
        lease_id_.reset();
    }

    /**
     * @brief The next `count` download bodies fail after `after_bytes` bytes
     */
    void interrupt_downloads(int count, std::size_t after_bytes) {
        std::lock_guard lock(mutex_);
        download_fault_ = fake_body_stream::fault::interrupt;
        download_faults_left_ = count;
        download_fault_after_ = after_bytes;
    }

    /**
     * @brief The next `count` download bodies end cleanly after `after_bytes` bytes
     */
    void truncate_downloads(int count, std::size_t after_bytes) {
        std::lock_guard lock(mutex_);
        download_fault_ = fake_body_stream::fault::truncate;
        download_faults_left_ = count;
        download_fault_after_ = after_bytes;
    }

    /**
     * @brief Replace the content once `download_calls` ranged reads were served
     */
    void mutate_after_downloads(int download_calls, std::vector<uint8_t> replacement) {
        std::lock_guard lock(mutex_);
        mutate_after_ = download_calls;
        replacement_ = std::move(replacement);
    }

    /**
     * @brief Fail the n-th stage_block call (1-based) with `failure`
     */
    void fail_stage_block_at(int call_number, error failure) {
        std::lock_guard lock(mutex_);
        stage_failure_at_ = call_number;
        stage_failure_ = std::move(failure);
    }

    /**
     * @brief Fail every ranged read with `failure`
     */
    void fail_downloads(error failure) {
        std::lock_guard lock(mutex_);
        download_failure_ = std::move(failure);
    }

    // ------------------------------------------------------------------------
    // Observation
    // ------------------------------------------------------------------------

    [[nodiscard]] auto content() const -> std::vector<uint8_t> {
        std::lock_guard lock(mutex_);
        return content_;
    }

    [[nodiscard]] auto exists() const -> bool {
        std::lock_guard lock(mutex_);
        return exists_;
    }

    [[nodiscard]] auto etag() const -> std::string {
        std::lock_guard lock(mutex_);
        return etag_;
    }

    [[nodiscard]] auto last_modified() const -> std::chrono::system_clock::time_point {
        std::lock_guard lock(mutex_);
        return last_modified_;
    }

    [[nodiscard]] auto http_headers() const -> blob_http_headers {
        std::lock_guard lock(mutex_);
        return headers_;
    }

    [[nodiscard]] auto metadata() const -> blob_metadata {
        std::lock_guard lock(mutex_);
        return metadata_;
    }

    [[nodiscard]] auto committed_block_ids() const -> std::vector<std::string> {
        std::lock_guard lock(mutex_);
        return committed_ids_;
    }

    [[nodiscard]] auto staged_block_count() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return staged_.size();
    }

    [[nodiscard]] auto properties_calls() const -> int {
        std::lock_guard lock(mutex_);
        return properties_calls_;
    }

    [[nodiscard]] auto download_calls() const -> int {
        std::lock_guard lock(mutex_);
        return download_calls_;
    }

    [[nodiscard]] auto upload_calls() const -> int {
        std::lock_guard lock(mutex_);
        return upload_calls_;
    }

    [[nodiscard]] auto stage_calls() const -> int {
        std::lock_guard lock(mutex_);
        return stage_calls_;
    }

    [[nodiscard]] auto commit_calls() const -> int {
        std::lock_guard lock(mutex_);
        return commit_calls_;
    }

    [[nodiscard]] auto download_ranges() const -> std::vector<blob_range> {
        std::lock_guard lock(mutex_);
        return download_ranges_;
    }

    [[nodiscard]] auto download_conditions() const -> std::vector<request_conditions> {
        std::lock_guard lock(mutex_);
        return download_conditions_;
    }

    [[nodiscard]] auto stage_conditions() const -> std::vector<request_conditions> {
        std::lock_guard lock(mutex_);
        return stage_conditions_;
    }

    [[nodiscard]] auto last_write_conditions() const -> request_conditions {
        std::lock_guard lock(mutex_);
        return last_write_conditions_;
    }

    // ------------------------------------------------------------------------
    // block_blob_client
    // ------------------------------------------------------------------------

    [[nodiscard]] auto url() const -> std::string override { return url_; }

    [[nodiscard]] auto get_properties(const request_conditions& conditions)
        -> result<blob_properties> override {
        std::lock_guard lock(mutex_);
        ++properties_calls_;

        if (auto rejected = check_read(conditions)) {
            return unexpected{*rejected};
        }
        return properties();
    }

    [[nodiscard]] auto download(const blob_range& range, const request_conditions& conditions)
        -> result<blob_download_response> override {
        std::lock_guard lock(mutex_);
        ++download_calls_;
        download_ranges_.push_back(range);
        download_conditions_.push_back(conditions);

        if (download_failure_) {
            return unexpected{*download_failure_};
        }
        if (auto rejected = check_read(conditions)) {
            return unexpected{*rejected};
        }

        const uint64_t size = content_.size();
        if (range.offset >= size && !(range.offset == 0 && size == 0)) {
            return unexpected{access_condition_evaluator::classify_failure(
                416, "InvalidRange", "The range specified is invalid", conditions)};
        }

        uint64_t end = size;
        if (range.count) {
            end = std::min<uint64_t>(size, range.offset + *range.count);
        }
        std::vector<uint8_t> slice(content_.begin() + static_cast<std::ptrdiff_t>(range.offset),
                                   content_.begin() + static_cast<std::ptrdiff_t>(end));

        auto fault = fake_body_stream::fault::none;
        if (download_faults_left_ > 0) {
            --download_faults_left_;
            fault = download_fault_;
        }

        blob_download_response response;
        response.properties = properties();
        response.content_length = slice.size();
        response.body =
            std::make_unique<fake_body_stream>(std::move(slice), fault, download_fault_after_);

        if (mutate_after_ > 0 && download_calls_ == mutate_after_) {
            content_ = replacement_;
            touch();
        }

        return response;
    }

    [[nodiscard]] auto upload(std::span<const uint8_t> content,
                              const blob_http_headers& headers,
                              const blob_metadata& metadata,
                              const request_conditions& conditions)
        -> result<blob_write_response> override {
        std::lock_guard lock(mutex_);
        ++upload_calls_;
        last_write_conditions_ = conditions;

        if (auto rejected = check_write(conditions)) {
            return unexpected{*rejected};
        }

        content_.assign(content.begin(), content.end());
        headers_ = headers;
        metadata_ = metadata;
        exists_ = true;
        committed_ids_.clear();
        staged_.clear();

        // Put Blob stores a service computed MD5 when the caller sent none
        auto digest = encoding::md5(std::as_bytes(std::span(content_)));
        if (!headers_.content_md5) {
            headers_.content_md5 = digest;
        }
        touch();

        blob_write_response response;
        response.etag = etag_;
        response.last_modified = last_modified_;
        response.content_md5 = digest;
        return response;
    }

    [[nodiscard]] auto stage_block(const std::string& block_id,
                                   std::span<const uint8_t> content,
                                   const request_conditions& conditions) -> result<void> override {
        std::lock_guard lock(mutex_);
        ++stage_calls_;
        stage_conditions_.push_back(conditions);

        if (stage_failure_at_ > 0 && stage_calls_ == stage_failure_at_) {
            return unexpected{stage_failure_};
        }
        if (auto rejected = check_lease(conditions, true)) {
            return unexpected{*rejected};
        }

        staged_[block_id] = std::vector<uint8_t>(content.begin(), content.end());
        return {};
    }

    [[nodiscard]] auto commit_block_list(const std::vector<std::string>& block_ids,
                                         const blob_http_headers& headers,
                                         const blob_metadata& metadata,
                                         const request_conditions& conditions)
        -> result<blob_write_response> override {
        std::lock_guard lock(mutex_);
        ++commit_calls_;
        last_write_conditions_ = conditions;

        if (auto rejected = check_write(conditions)) {
            return unexpected{*rejected};
        }

        std::vector<uint8_t> assembled;
        for (const auto& id : block_ids) {
            auto it = staged_.find(id);
            if (it == staged_.end()) {
                return unexpected{access_condition_evaluator::classify_failure(
                    400, "InvalidBlockList", "block " + id + " was never staged", conditions)};
            }
            assembled.insert(assembled.end(), it->second.begin(), it->second.end());
        }

        content_ = std::move(assembled);
        headers_ = headers;
        metadata_ = metadata;
        exists_ = true;
        committed_ids_ = block_ids;
        staged_.clear();
        touch();

        blob_write_response response;
        response.etag = etag_;
        response.last_modified = last_modified_;
        return response;
    }

private:
    static auto whole_seconds(std::chrono::system_clock::time_point tp)
        -> std::chrono::system_clock::time_point {
        return std::chrono::time_point_cast<std::chrono::seconds>(tp);
    }

    void touch() {
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "\"0x8D%012X\"", ++generation_);
        etag_ = buffer;
        auto now = whole_seconds(std::chrono::system_clock::now());
        last_modified_ = std::max(now, last_modified_ + std::chrono::seconds(1));
    }

    auto properties() const -> blob_properties {
        blob_properties props;
        props.content_length = content_.size();
        props.etag = etag_;
        props.last_modified = last_modified_;
        props.http_headers = headers_;
        props.metadata = metadata_;
        props.lease_state = lease_id_ ? "leased" : "available";
        return props;
    }

    auto reject(int status, const std::string& code, const request_conditions& sent) const
        -> error {
        return access_condition_evaluator::classify_failure(status, code, code, sent);
    }

    auto check_lease(const request_conditions& sent, bool is_write) const
        -> std::optional<error> {
        auto presented = sent.get(condition_header::lease_id);
        if (lease_id_) {
            if (!presented) {
                if (is_write) {
                    return reject(412, "LeaseIdMissing", sent);
                }
                return std::nullopt;
            }
            if (*presented != *lease_id_) {
                return reject(412, "LeaseIdMismatchWithBlobOperation", sent);
            }
            return std::nullopt;
        }
        if (presented) {
            return reject(412, "LeaseNotPresentWithBlobOperation", sent);
        }
        return std::nullopt;
    }

    auto check_conditions(const request_conditions& sent, bool is_write) const
        -> std::optional<error> {
        if (auto match = sent.get(condition_header::if_match)) {
            if (!exists_ || (*match != "*" && *match != etag_)) {
                return reject(412, "ConditionNotMet", sent);
            }
        }
        if (auto none_match = sent.get(condition_header::if_none_match)) {
            if (exists_ && (*none_match == "*" || *none_match == etag_)) {
                return reject(is_write ? 412 : 304, is_write ? "ConditionNotMet" : "", sent);
            }
        }
        if (auto since = sent.get(condition_header::if_modified_since)) {
            auto parsed = encoding::parse_rfc1123(*since);
            if (exists_ && parsed && last_modified_ <= *parsed) {
                return reject(is_write ? 412 : 304, is_write ? "ConditionNotMet" : "", sent);
            }
        }
        if (auto since = sent.get(condition_header::if_unmodified_since)) {
            auto parsed = encoding::parse_rfc1123(*since);
            if (exists_ && parsed && last_modified_ > *parsed) {
                return reject(412, "ConditionNotMet", sent);
            }
        }
        return std::nullopt;
    }

    auto check_read(const request_conditions& sent) const -> std::optional<error> {
        if (!exists_) {
            return reject(404, "BlobNotFound", sent);
        }
        if (auto rejected = check_lease(sent, false)) {
            return rejected;
        }
        return check_conditions(sent, false);
    }

    auto check_write(const request_conditions& sent) const -> std::optional<error> {
        if (auto rejected = check_lease(sent, true)) {
            return rejected;
        }
        return check_conditions(sent, true);
    }

    std::string url_;
    mutable std::mutex mutex_;

    std::vector<uint8_t> content_;
    bool exists_ = false;
    std::string etag_;
    unsigned int generation_ = 0;
    std::chrono::system_clock::time_point last_modified_;
    blob_http_headers headers_;
    blob_metadata metadata_;
    std::optional<std::string> lease_id_;
    std::map<std::string, std::vector<uint8_t>> staged_;
    std::vector<std::string> committed_ids_;

    int properties_calls_ = 0;
    int download_calls_ = 0;
    int upload_calls_ = 0;
    int stage_calls_ = 0;
    int commit_calls_ = 0;
    std::vector<blob_range> download_ranges_;
    std::vector<request_conditions> download_conditions_;
    std::vector<request_conditions> stage_conditions_;
    request_conditions last_write_conditions_;

    fake_body_stream::fault download_fault_ = fake_body_stream::fault::none;
    int download_faults_left_ = 0;
    std::size_t download_fault_after_ = 0;
    int mutate_after_ = 0;
    std::vector<uint8_t> replacement_;
    int stage_failure_at_ = 0;
    error stage_failure_;
    std::optional<error> download_failure_;
};

}  // namespace kcenon::blob_transfer::test

#endif  // KCENON_BLOB_TRANSFER_TESTS_SUPPORT_FAKE_BLOCK_BLOB_SERVICE_H
