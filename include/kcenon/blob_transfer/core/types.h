/**
 * @file types.h
 * @brief Core result and error types for blob_transfer
 */

#ifndef KCENON_BLOB_TRANSFER_CORE_TYPES_H
#define KCENON_BLOB_TRANSFER_CORE_TYPES_H

#include <kcenon/blob_transfer/core/error_codes.h>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::blob_transfer {

/**
 * @brief Access condition that caused a precondition violation
 */
enum class condition_kind {
    none,
    if_modified_since,
    if_unmodified_since,
    if_match,
    if_none_match,
    lease_id,
};

[[nodiscard]] constexpr auto to_string(condition_kind kind) -> const char* {
    switch (kind) {
        case condition_kind::none: return "none";
        case condition_kind::if_modified_since: return "If-Modified-Since";
        case condition_kind::if_unmodified_since: return "If-Unmodified-Since";
        case condition_kind::if_match: return "If-Match";
        case condition_kind::if_none_match: return "If-None-Match";
        case condition_kind::lease_id: return "x-ms-lease-id";
        default: return "unknown";
    }
}

/**
 * @brief Error type with code and optional message
 *
 * Errors that originate from the remote service also keep the HTTP status
 * and the service error code unchanged, and precondition violations name
 * the access condition they were attributed to.
 */
struct error {
    error_code code;
    std::string message;
    int status_code = 0;
    std::string service_code;
    condition_kind condition = condition_kind::none;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    /**
     * @brief Build an error reported by the remote service
     */
    [[nodiscard]] static auto from_service(error_code c,
                                           std::string msg,
                                           int status,
                                           std::string svc_code,
                                           condition_kind kind = condition_kind::none)
        -> error {
        error e{c, std::move(msg)};
        e.status_code = status;
        e.service_code = std::move(svc_code);
        e.condition = kind;
        return e;
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_CORE_TYPES_H
