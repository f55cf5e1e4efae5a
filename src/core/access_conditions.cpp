/**
 * @file access_conditions.cpp
 * @brief Implementation of access_condition_evaluator
 */

#include <kcenon/blob_transfer/core/access_conditions.h>

#include <kcenon/blob_transfer/core/encoding.h>

namespace kcenon::blob_transfer {

namespace {

auto attribute_condition(const request_conditions& sent) -> condition_kind {
    if (sent.has(condition_header::if_match)) {
        return condition_kind::if_match;
    }
    if (sent.has(condition_header::if_none_match)) {
        return condition_kind::if_none_match;
    }
    if (sent.has(condition_header::if_unmodified_since)) {
        return condition_kind::if_unmodified_since;
    }
    if (sent.has(condition_header::if_modified_since)) {
        return condition_kind::if_modified_since;
    }
    return condition_kind::none;
}

auto lease_error_code(const std::string& service_code) -> std::optional<error_code> {
    if (service_code == "LeaseIdMismatchWithBlobOperation" ||
        service_code == "LeaseIdMismatchWithLeaseOperation") {
        return error_code::lease_id_mismatch;
    }
    if (service_code == "LeaseIdMissing") {
        return error_code::lease_id_missing;
    }
    if (service_code == "LeaseNotPresentWithBlobOperation" ||
        service_code == "LeaseNotPresentWithLeaseOperation") {
        return error_code::lease_not_present;
    }
    if (service_code == "LeaseLost") {
        return error_code::lease_lost;
    }
    return std::nullopt;
}

}  // namespace

auto access_condition_evaluator::to_request(const access_conditions& conditions)
    -> request_conditions {
    request_conditions request = to_lease_request(conditions);

    if (conditions.if_modified_since) {
        request.headers[std::string(condition_header::if_modified_since)] =
            encoding::format_rfc1123(*conditions.if_modified_since);
    }
    if (conditions.if_unmodified_since) {
        request.headers[std::string(condition_header::if_unmodified_since)] =
            encoding::format_rfc1123(*conditions.if_unmodified_since);
    }
    if (conditions.if_match) {
        request.headers[std::string(condition_header::if_match)] = *conditions.if_match;
    }
    if (conditions.if_none_match) {
        request.headers[std::string(condition_header::if_none_match)] =
            *conditions.if_none_match;
    }

    return request;
}

auto access_condition_evaluator::to_lease_request(const access_conditions& conditions)
    -> request_conditions {
    request_conditions request;
    if (conditions.lease_id) {
        request.headers[std::string(condition_header::lease_id)] = *conditions.lease_id;
    }
    return request;
}

auto access_condition_evaluator::pin_etag(const access_conditions& caller,
                                          const std::string& etag) -> access_conditions {
    if (!caller.empty() || etag.empty()) {
        return caller;
    }
    access_conditions pinned;
    pinned.if_match = etag;
    return pinned;
}

auto access_condition_evaluator::classify_failure(int status_code,
                                                  const std::string& service_code,
                                                  const std::string& message,
                                                  const request_conditions& sent) -> error {
    if (auto lease_code = lease_error_code(service_code)) {
        return error::from_service(*lease_code, message, status_code, service_code,
                                   condition_kind::lease_id);
    }

    if (status_code == 412 || status_code == 304 || service_code == "ConditionNotMet") {
        return error::from_service(error_code::condition_not_met, message, status_code,
                                   service_code.empty() ? "ConditionNotMet" : service_code,
                                   attribute_condition(sent));
    }

    error_code code = error_code::service_error;
    switch (status_code) {
        case 401:
        case 403:
            code = error_code::authentication_failed;
            break;
        case 404:
            code = error_code::blob_not_found;
            break;
        case 416:
            code = error_code::invalid_range_response;
            break;
        case 503:
            code = error_code::server_busy;
            break;
        default:
            break;
    }
    return error::from_service(code, message, status_code, service_code);
}

}  // namespace kcenon::blob_transfer
