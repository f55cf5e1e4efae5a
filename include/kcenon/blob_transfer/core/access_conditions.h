/**
 * @file access_conditions.h
 * @brief Conditional-request preconditions and their translation
 *
 * Both engines attach the same preconditions to every remote call of a
 * transfer. access_condition_evaluator is the single place where the caller's
 * conditions become request parameters, and where a service rejection is
 * turned back into an error naming the violated condition.
 */

#ifndef KCENON_BLOB_TRANSFER_CORE_ACCESS_CONDITIONS_H
#define KCENON_BLOB_TRANSFER_CORE_ACCESS_CONDITIONS_H

#include <kcenon/blob_transfer/core/types.h>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::blob_transfer {

/**
 * @brief Optional preconditions for a transfer
 *
 * Every member is optional; the combination is passed through unchanged to
 * each remote call of the transfer (block staging only carries the lease).
 */
struct access_conditions {
    std::optional<std::chrono::system_clock::time_point> if_modified_since;
    std::optional<std::chrono::system_clock::time_point> if_unmodified_since;
    std::optional<std::string> if_match;
    std::optional<std::string> if_none_match;
    std::optional<std::string> lease_id;

    [[nodiscard]] auto empty() const -> bool {
        return !if_modified_since && !if_unmodified_since && !if_match &&
               !if_none_match && !lease_id;
    }
};

/**
 * @brief Header names used for conditional requests
 */
struct condition_header {
    static constexpr std::string_view if_modified_since = "If-Modified-Since";
    static constexpr std::string_view if_unmodified_since = "If-Unmodified-Since";
    static constexpr std::string_view if_match = "If-Match";
    static constexpr std::string_view if_none_match = "If-None-Match";
    static constexpr std::string_view lease_id = "x-ms-lease-id";
};

/**
 * @brief Conditional-request parameter set for one remote call
 */
struct request_conditions {
    std::map<std::string, std::string> headers;

    [[nodiscard]] auto empty() const -> bool { return headers.empty(); }

    [[nodiscard]] auto has(std::string_view name) const -> bool {
        return headers.find(std::string(name)) != headers.end();
    }

    [[nodiscard]] auto get(std::string_view name) const -> std::optional<std::string> {
        auto it = headers.find(std::string(name));
        if (it == headers.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

/**
 * @brief Translates access conditions to request parameters and classifies
 *        service rejections
 *
 * All members are pure functions; no network access and no state.
 */
class access_condition_evaluator {
public:
    /**
     * @brief Full parameter set (time, etag and lease conditions)
     */
    [[nodiscard]] static auto to_request(const access_conditions& conditions)
        -> request_conditions;

    /**
     * @brief Lease-only parameter set
     *
     * Block staging accepts only the lease condition; time and etag
     * conditions are enforced at commit.
     */
    [[nodiscard]] static auto to_lease_request(const access_conditions& conditions)
        -> request_conditions;

    /**
     * @brief Conditions for the ranged reads of a download
     *
     * When the caller supplied no conditions, the etag observed at the start
     * of the download becomes an implicit If-Match so a mutation of the blob
     * mid-transfer is rejected. Caller-supplied conditions take precedence and
     * are used unchanged.
     *
     * @param caller Caller-supplied conditions
     * @param etag Etag observed when the download started
     */
    [[nodiscard]] static auto pin_etag(const access_conditions& caller,
                                       const std::string& etag) -> access_conditions;

    /**
     * @brief Classify an unsuccessful service response
     *
     * Lease error codes map to the lease error family; 412 and 304 responses
     * map to condition_not_met, attributed to the first condition present in
     * the sent set (If-Match, If-None-Match, If-Unmodified-Since,
     * If-Modified-Since). Any other status is a service error carrying the
     * status and service code unchanged.
     *
     * @param status_code HTTP status returned by the service
     * @param service_code Service error code (x-ms-error-code), may be empty
     * @param message Human readable detail
     * @param sent Conditions that were attached to the failed request
     */
    [[nodiscard]] static auto classify_failure(int status_code,
                                               const std::string& service_code,
                                               const std::string& message,
                                               const request_conditions& sent) -> error;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_CORE_ACCESS_CONDITIONS_H
