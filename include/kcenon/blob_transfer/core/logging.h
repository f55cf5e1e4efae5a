// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file logging.h
 * @brief Structured logging for blob transfers
 *
 * Messages go to logger_system when it is linked (BLOB_TRANSFER_USE_LOGGER_SYSTEM)
 * and to stderr otherwise. Custom callbacks receive every message that passes
 * the level filter, which is how tests observe the log stream.
 */

#pragma once

#include <kcenon/blob_transfer/config/feature_flags.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#if BLOB_TRANSFER_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::blob_transfer {

/**
 * @brief Log categories for blob transfers
 */
struct log_category {
    static constexpr std::string_view upload = "blob_transfer.upload";
    static constexpr std::string_view download = "blob_transfer.download";
    static constexpr std::string_view retry = "blob_transfer.retry";
    static constexpr std::string_view dispatch = "blob_transfer.dispatch";
    static constexpr std::string_view transport = "blob_transfer.transport";
    static constexpr std::string_view manager = "blob_transfer.manager";
};

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

namespace detail {

inline auto escape_json(const std::string& input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief What the masker redacts
 *
 * Credentials (SAS signatures, SharedKey signatures, account keys) are
 * masked by default; lease ids and local paths only on request.
 */
struct masking_config {
    bool mask_credentials = true;
    bool mask_lease_ids = false;
    bool mask_paths = false;
    char mask_char = '*';
    size_t visible_chars = 4;

    static masking_config all_masked() {
        return {true, true, true, '*', 4};
    }

    static masking_config none() {
        return {false, false, false, '*', 4};
    }
};

/**
 * @brief Redacts secrets and identifying values from log text
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config{})
        : config_(config) {}

    /**
     * @brief Mask every credential in free text
     *
     * Handles "sig=" query parameters, "SharedKey account:signature"
     * authorization values and "AccountKey=" connection string entries.
     */
    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_credentials) {
            return input;
        }

        static const std::regex sas_signature(R"((sig=)[^&\s"]+)", std::regex::icase);
        static const std::regex shared_key(R"((SharedKey [^:\s]+:)[^\s"]+)");
        static const std::regex account_key(R"((AccountKey=)[^;\s"]+)");

        std::string replacement = "$1" + std::string(8, config_.mask_char);
        std::string result = std::regex_replace(input, sas_signature, replacement);
        result = std::regex_replace(result, shared_key, replacement);
        result = std::regex_replace(result, account_key, replacement);
        return result;
    }

    /**
     * @brief Mask a blob URL (credentials only, the path stays readable)
     */
    [[nodiscard]] auto mask_url(const std::string& url) const -> std::string {
        return mask(url);
    }

    /**
     * @brief Keep the first visible_chars of a lease id
     */
    [[nodiscard]] auto mask_lease_id(const std::string& lease_id) const -> std::string {
        if (!config_.mask_lease_ids || lease_id.size() <= config_.visible_chars) {
            return lease_id;
        }
        return lease_id.substr(0, config_.visible_chars) +
               std::string(lease_id.size() - config_.visible_chars, config_.mask_char);
    }

    /**
     * @brief Hide the directory part of a local path
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }
        auto last_sep = path.find_last_of("/\\");
        if (last_sep == std::string::npos) {
            return path;
        }
        return std::string(last_sep, config_.mask_char) + path.substr(last_sep);
    }

    [[nodiscard]] auto get_config() const -> const masking_config& { return config_; }

    void set_config(masking_config config) { config_ = config; }

private:
    masking_config config_;
};

/**
 * @brief Structured context attached to a transfer log message
 */
struct transfer_log_context {
    std::string transfer_id;
    std::string blob_url;
    std::string file_path;
    std::optional<uint64_t> file_size;
    std::optional<uint64_t> bytes_transferred;
    std::optional<uint64_t> block_index;
    std::optional<uint64_t> block_count;
    std::optional<std::string> etag;
    std::optional<std::string> lease_id;
    std::optional<int> attempt;
    std::optional<int> status_code;
    std::optional<uint64_t> duration_ms;
    std::optional<double> rate_mbps;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json(value) << "\"";
            first = false;
        };
        auto add_int = [&](const char* name, auto value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!transfer_id.empty()) add_field("transfer_id", transfer_id);
        if (!blob_url.empty()) add_field("blob_url", masker ? masker->mask_url(blob_url) : blob_url);
        if (!file_path.empty()) {
            add_field("file_path", masker ? masker->mask_path(file_path) : file_path);
        }
        if (file_size) add_int("size", *file_size);
        if (bytes_transferred) add_int("bytes_transferred", *bytes_transferred);
        if (block_index) add_int("block_index", *block_index);
        if (block_count) add_int("block_count", *block_count);
        if (etag) add_field("etag", *etag);
        if (lease_id) add_field("lease_id", masker ? masker->mask_lease_id(*lease_id) : *lease_id);
        if (attempt) add_int("attempt", *attempt);
        if (status_code) add_int("status_code", *status_code);
        if (duration_ms) add_int("duration_ms", *duration_ms);
        if (rate_mbps) {
            if (!first) oss << ",";
            oss << "\"rate_mbps\":" << std::fixed << std::setprecision(2) << *rate_mbps;
            first = false;
        }
        if (error_message) {
            add_field("error_message", masker ? masker->mask(*error_message) : *error_message);
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<transfer_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";
        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";
        oss << ",\"message\":\"" << detail::escape_json(masker ? masker->mask(message) : message)
            << "\"";

        if (context) {
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{\"file\":\"" << detail::escape_json(*source_file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            if (function_name) {
                oss << ",\"function\":\"" << *function_name << "\"";
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Builder for structured log entries
 *
 * @code
 * auto entry = log_entry_builder()
 *     .with_level(log_level::info)
 *     .with_category(log_category::upload)
 *     .with_message("Upload committed")
 *     .with_blob_url(client->url())
 *     .with_block_count(12)
 *     .build();
 * @endcode
 */
class log_entry_builder {
public:
    log_entry_builder() { entry_.timestamp = iso8601_now(); }

    auto with_level(log_level level) -> log_entry_builder& {
        entry_.level = level;
        return *this;
    }

    auto with_category(std::string_view category) -> log_entry_builder& {
        entry_.category = std::string(category);
        return *this;
    }

    auto with_message(std::string_view message) -> log_entry_builder& {
        entry_.message = std::string(message);
        return *this;
    }

    auto with_transfer_id(std::string_view id) -> log_entry_builder& {
        context().transfer_id = std::string(id);
        return *this;
    }

    auto with_blob_url(std::string_view url) -> log_entry_builder& {
        context().blob_url = std::string(url);
        return *this;
    }

    auto with_file_path(std::string_view path) -> log_entry_builder& {
        context().file_path = std::string(path);
        return *this;
    }

    auto with_file_size(uint64_t size) -> log_entry_builder& {
        context().file_size = size;
        return *this;
    }

    auto with_bytes_transferred(uint64_t bytes) -> log_entry_builder& {
        context().bytes_transferred = bytes;
        return *this;
    }

    auto with_block_index(uint64_t index) -> log_entry_builder& {
        context().block_index = index;
        return *this;
    }

    auto with_block_count(uint64_t count) -> log_entry_builder& {
        context().block_count = count;
        return *this;
    }

    auto with_attempt(int attempt) -> log_entry_builder& {
        context().attempt = attempt;
        return *this;
    }

    auto with_error_message(std::string_view message) -> log_entry_builder& {
        context().error_message = std::string(message);
        return *this;
    }

    auto with_source_location(const char* file, int line, const char* function)
        -> log_entry_builder& {
        if (file) entry_.source_file = file;
        if (line > 0) entry_.source_line = line;
        if (function) entry_.function_name = function;
        return *this;
    }

    auto with_context(const transfer_log_context& ctx) -> log_entry_builder& {
        entry_.context = ctx;
        return *this;
    }

    [[nodiscard]] auto build() const -> structured_log_entry { return entry_; }

    [[nodiscard]] auto build_json() const -> std::string { return entry_.to_json(); }

private:
    auto context() -> transfer_log_context& {
        if (!entry_.context) {
            entry_.context = transfer_log_context{};
        }
        return *entry_.context;
    }

    [[nodiscard]] static auto iso8601_now() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
            << std::setw(3) << ms.count() << 'Z';
        return oss.str();
    }

    structured_log_entry entry_;
};

enum class log_output_format {
    text,
    json
};

/**
 * @brief Process-wide logger for blob transfers
 */
class blob_transfer_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const transfer_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&, const std::string&)>;

    blob_transfer_logger() = default;
    ~blob_transfer_logger() = default;

    blob_transfer_logger(const blob_transfer_logger&) = delete;
    blob_transfer_logger& operator=(const blob_transfer_logger&) = delete;

    /**
     * @brief Initialize the logger backend
     *
     * Subsequent calls are no-ops. Called by transfer_manager::builder::build.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if BLOB_TRANSFER_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
                          .with_async(true)
                          .with_min_level(to_logger_level(min_level_.load()))
                          .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
                          .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if BLOB_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if BLOB_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(config);
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    /**
     * @brief Install a callback receiving the unmasked message and context
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    /**
     * @brief Install a callback receiving each masked JSON entry
     */
    void set_json_callback(json_log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        json_callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        log_output_format format;
        sensitive_info_masker masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            masker = masker_;
        }

        auto builder = log_entry_builder().with_level(level).with_category(category).with_message(
            message);
        if (file || line > 0 || function) {
            builder.with_source_location(file, line, function);
        }
        if (context) {
            builder.with_context(*context);
        }
        auto entry = builder.build();

        std::string rendered;
        if (format == log_output_format::json) {
            rendered = entry.to_json_with_masking(&masker);
        } else {
            rendered = format_text(entry, masker);
        }

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (json_callback_) {
                json_callback_(entry, format == log_output_format::json
                                          ? rendered
                                          : entry.to_json_with_masking(&masker));
            }
        }

        emit(level, rendered, file, line, function);
    }

    void flush() {
#if BLOB_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    static auto format_text(const structured_log_entry& entry,
                            const sensitive_info_masker& masker) -> std::string {
        std::ostringstream oss;
        oss << entry.timestamp << " [" << log_level_to_string(entry.level) << "] ["
            << entry.category << "] " << masker.mask(entry.message);
        if (entry.context) {
            oss << " " << entry.context->to_json_with_masking(&masker);
        }
        return oss.str();
    }

    void emit(log_level level,
              const std::string& rendered,
              [[maybe_unused]] const char* file,
              [[maybe_unused]] int line,
              [[maybe_unused]] const char* function) {
#if BLOB_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), rendered, file, line, function);
            } else {
                logger_->log(to_logger_level(level), rendered);
            }
            return;
        }
#endif
        (void)level;
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << rendered << "\n";
    }

#if BLOB_TRANSFER_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    std::atomic<log_level> min_level_{log_level::warn};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

inline blob_transfer_logger& get_logger() {
    static blob_transfer_logger instance;
    return instance;
}

#define BT_LOG(level, category, message) \
    kcenon::blob_transfer::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define BT_LOG_CTX(level, category, message, context) \
    kcenon::blob_transfer::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define BT_LOG_TRACE(category, message) \
    BT_LOG(kcenon::blob_transfer::log_level::trace, category, message)

#define BT_LOG_DEBUG(category, message) \
    BT_LOG(kcenon::blob_transfer::log_level::debug, category, message)

#define BT_LOG_INFO(category, message) \
    BT_LOG(kcenon::blob_transfer::log_level::info, category, message)

#define BT_LOG_WARN(category, message) \
    BT_LOG(kcenon::blob_transfer::log_level::warn, category, message)

#define BT_LOG_ERROR(category, message) \
    BT_LOG(kcenon::blob_transfer::log_level::error, category, message)

#define BT_LOG_DEBUG_CTX(category, message, ctx) \
    BT_LOG_CTX(kcenon::blob_transfer::log_level::debug, category, message, ctx)

#define BT_LOG_INFO_CTX(category, message, ctx) \
    BT_LOG_CTX(kcenon::blob_transfer::log_level::info, category, message, ctx)

#define BT_LOG_WARN_CTX(category, message, ctx) \
    BT_LOG_CTX(kcenon::blob_transfer::log_level::warn, category, message, ctx)

#define BT_LOG_ERROR_CTX(category, message, ctx) \
    BT_LOG_CTX(kcenon::blob_transfer::log_level::error, category, message, ctx)

}  // namespace kcenon::blob_transfer
