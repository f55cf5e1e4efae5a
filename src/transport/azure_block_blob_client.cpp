/**
 * @file azure_block_blob_client.cpp
 * @brief Azure Block Blob REST implementation of block_blob_client
 */

#include <kcenon/blob_transfer/transport/azure_block_blob_client.h>

#include <kcenon/blob_transfer/config/feature_flags.h>
#include <kcenon/blob_transfer/core/encoding.h>
#include <kcenon/blob_transfer/core/logging.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

#if BLOB_TRANS_HAS_HTTP_TRANSPORT
#include <kcenon/network/core/http_client.h>
#endif

namespace kcenon::blob_transfer {

namespace {

auto to_lower(std::string value) -> std::string {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

constexpr const char* meta_prefix = "x-ms-meta-";

}  // namespace

auto blob_http_response::get_header(const std::string& name) const
    -> std::optional<std::string> {
    auto it = headers.find(name);
    if (it != headers.end()) {
        return it->second;
    }
    auto wanted = to_lower(name);
    for (const auto& [key, value] : headers) {
        if (to_lower(key) == wanted) {
            return value;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Real HTTP Client Implementation
// ============================================================================

#if BLOB_TRANS_HAS_HTTP_TRANSPORT

/**
 * @brief HTTP client over network_system
 */
class network_blob_http_client : public blob_http_client_interface {
public:
    explicit network_blob_http_client(std::chrono::milliseconds timeout)
        : client_(std::make_shared<kcenon::network::core::http_client>(timeout)) {}

    auto get(const std::string& url, const std::map<std::string, std::string>& headers)
        -> result<blob_http_response> override {
        auto response = client_->get(url, {}, headers);
        if (response.is_err()) {
            return unexpected{error{error_code::connection_failed, "HTTP GET request failed"}};
        }
        return convert_response(response.value());
    }

    auto put(const std::string& url,
             const std::vector<uint8_t>& body,
             const std::map<std::string, std::string>& headers)
        -> result<blob_http_response> override {
        std::string body_str(body.begin(), body.end());
        auto response = client_->put(url, body_str, headers);
        if (response.is_err()) {
            return unexpected{error{error_code::connection_failed, "HTTP PUT request failed"}};
        }
        return convert_response(response.value());
    }

    auto head(const std::string& url, const std::map<std::string, std::string>& headers)
        -> result<blob_http_response> override {
        auto response = client_->head(url, headers);
        if (response.is_err()) {
            return unexpected{error{error_code::connection_failed, "HTTP HEAD request failed"}};
        }
        return convert_response(response.value());
    }

private:
    static auto convert_response(const kcenon::network::internal::http_response& resp)
        -> blob_http_response {
        blob_http_response converted;
        converted.status_code = resp.status_code;
        for (const auto& [key, value] : resp.headers) {
            converted.headers[key] = value;
        }
        if (!resp.body.empty()) {
            converted.body = std::vector<uint8_t>(resp.body.begin(), resp.body.end());
        }
        return converted;
    }

    std::shared_ptr<kcenon::network::core::http_client> client_;
};

#endif  // BLOB_TRANS_HAS_HTTP_TRANSPORT

auto make_default_blob_http_client([[maybe_unused]] std::chrono::milliseconds timeout)
    -> result<std::shared_ptr<blob_http_client_interface>> {
#if BLOB_TRANS_HAS_HTTP_TRANSPORT
    return std::shared_ptr<blob_http_client_interface>(
        std::make_shared<network_blob_http_client>(timeout));
#else
    return unexpected{error{error_code::not_initialized,
                            "no HTTP transport linked; build with network_system or inject "
                            "a blob_http_client_interface"}};
#endif
}

// ============================================================================
// azure_blob_endpoint
// ============================================================================

auto azure_blob_endpoint::from_connection_string(const std::string& connection_string,
                                                 const std::string& container,
                                                 const std::string& blob_name)
    -> result<azure_blob_endpoint> {
    azure_blob_endpoint parsed;
    parsed.container = container;
    parsed.blob_name = blob_name;

    std::size_t pos = 0;
    while (pos < connection_string.size()) {
        auto semi_pos = connection_string.find(';', pos);
        auto entry = connection_string.substr(
            pos, semi_pos == std::string::npos ? std::string::npos : semi_pos - pos);
        pos = semi_pos == std::string::npos ? connection_string.size() : semi_pos + 1;

        // Values (account keys, SAS tokens) may themselves contain '='
        auto eq_pos = entry.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }
        auto key = entry.substr(0, eq_pos);
        auto value = entry.substr(eq_pos + 1);

        if (key == "AccountName") {
            parsed.account_name = value;
        } else if (key == "AccountKey") {
            parsed.account_key = value;
        } else if (key == "SharedAccessSignature") {
            parsed.sas_token = value;
        } else if (key == "EndpointSuffix") {
            parsed.endpoint_suffix = value;
        } else if (key == "BlobEndpoint") {
            parsed.endpoint = value;
        } else if (key == "DefaultEndpointsProtocol") {
            parsed.use_ssl = (value != "http");
        }
    }

    if (auto valid = parsed.validate(); !valid) {
        return unexpected{valid.error()};
    }
    return parsed;
}

auto azure_blob_endpoint::validate() const -> result<void> {
    if (account_name.empty() && !endpoint) {
        return unexpected{error{error_code::invalid_configuration,
                                "account name or endpoint is required"}};
    }
    if (container.empty() || blob_name.empty()) {
        return unexpected{error{error_code::invalid_configuration,
                                "container and blob name are required"}};
    }
    if (!account_key && !sas_token) {
        return unexpected{error{error_code::invalid_configuration,
                                "an account key or a SAS token is required"}};
    }
    if (account_key && account_name.empty()) {
        return unexpected{error{error_code::invalid_configuration,
                                "SharedKey authorization needs the account name"}};
    }
    return {};
}

auto azure_blob_endpoint::account_url() const -> std::string {
    if (endpoint) {
        auto url = *endpoint;
        while (!url.empty() && url.back() == '/') {
            url.pop_back();
        }
        return url;
    }
    return std::string(use_ssl ? "https" : "http") + "://" + account_name + ".blob." +
           endpoint_suffix;
}

auto azure_blob_endpoint::blob_url() const -> std::string {
    return account_url() + "/" + container + "/" + encoding::url_encode(blob_name, false);
}

// ============================================================================
// shared_key_signer
// ============================================================================

shared_key_signer::shared_key_signer(std::string account_name,
                                     const std::string& account_key_base64)
    : account_name_(std::move(account_name)), key_(encoding::base64_decode(account_key_base64)) {}

auto shared_key_signer::string_to_sign(const std::string& method,
                                       const std::string& resource_path,
                                       const std::map<std::string, std::string>& query,
                                       const std::map<std::string, std::string>& headers) const
    -> std::string {
    auto get_header = [&headers](const std::string& name) -> std::string {
        auto it = headers.find(name);
        return (it != headers.end()) ? it->second : "";
    };

    // A zero Content-Length is signed as an empty string
    auto content_length = get_header("Content-Length");
    if (content_length == "0") {
        content_length.clear();
    }

    std::ostringstream oss;
    oss << method << "\n";
    oss << get_header("Content-Encoding") << "\n";
    oss << get_header("Content-Language") << "\n";
    oss << content_length << "\n";
    oss << get_header("Content-MD5") << "\n";
    oss << get_header("Content-Type") << "\n";
    oss << get_header("Date") << "\n";
    oss << get_header("If-Modified-Since") << "\n";
    oss << get_header("If-Match") << "\n";
    oss << get_header("If-None-Match") << "\n";
    oss << get_header("If-Unmodified-Since") << "\n";
    oss << get_header("Range") << "\n";

    std::map<std::string, std::string> ms_headers;
    for (const auto& [key, value] : headers) {
        auto lower_key = to_lower(key);
        if (lower_key.starts_with("x-ms-")) {
            ms_headers[lower_key] = value;
        }
    }
    for (const auto& [key, value] : ms_headers) {
        oss << key << ":" << value << "\n";
    }

    oss << "/" << account_name_ << resource_path;

    std::map<std::string, std::string> canonical_query;
    for (const auto& [key, value] : query) {
        canonical_query[to_lower(key)] = value;
    }
    for (const auto& [key, value] : canonical_query) {
        oss << "\n" << key << ":" << value;
    }

    return oss.str();
}

auto shared_key_signer::authorization(const std::string& method,
                                      const std::string& resource_path,
                                      const std::map<std::string, std::string>& query,
                                      const std::map<std::string, std::string>& headers) const
    -> std::string {
    auto signature =
        encoding::hmac_sha256(key_, string_to_sign(method, resource_path, query, headers));
    return "SharedKey " + account_name_ + ":" + encoding::base64_encode(signature);
}

// ============================================================================
// azure_block_blob_client
// ============================================================================

struct azure_block_blob_client::impl {
    azure_blob_endpoint endpoint;
    std::shared_ptr<blob_http_client_interface> http;
    std::optional<shared_key_signer> signer;

    impl(azure_blob_endpoint ep, std::shared_ptr<blob_http_client_interface> client)
        : endpoint(std::move(ep)), http(std::move(client)) {
        if (endpoint.account_key) {
            signer.emplace(endpoint.account_name, *endpoint.account_key);
        }
    }

    auto resource_path() const -> std::string {
        return "/" + endpoint.container + "/" + encoding::url_encode(endpoint.blob_name, false);
    }

    auto build_url(const std::map<std::string, std::string>& query) const -> std::string {
        std::string url = endpoint.blob_url();
        char separator = '?';
        for (const auto& [key, value] : query) {
            url += separator;
            url += key + "=" + encoding::url_encode(value);
            separator = '&';
        }
        if (endpoint.sas_token && !endpoint.sas_token->empty()) {
            auto sas = *endpoint.sas_token;
            if (sas.front() == '?') {
                sas.erase(0, 1);
            }
            url += separator;
            url += sas;
        }
        return url;
    }

    auto base_headers(const request_conditions& conditions) const
        -> std::map<std::string, std::string> {
        std::map<std::string, std::string> headers = conditions.headers;
        headers["x-ms-version"] = endpoint.api_version;
        headers["x-ms-date"] = encoding::get_rfc1123_time();
        return headers;
    }

    void authorize(const std::string& method,
                   const std::map<std::string, std::string>& query,
                   std::map<std::string, std::string>& headers) const {
        if (signer) {
            headers["Authorization"] = signer->authorization(method, resource_path(), query, headers);
        }
    }

    static void add_blob_headers(const blob_http_headers& blob_headers,
                                 const blob_metadata& metadata,
                                 std::map<std::string, std::string>& headers) {
        if (blob_headers.cache_control) {
            headers["x-ms-blob-cache-control"] = *blob_headers.cache_control;
        }
        if (blob_headers.content_disposition) {
            headers["x-ms-blob-content-disposition"] = *blob_headers.content_disposition;
        }
        if (blob_headers.content_encoding) {
            headers["x-ms-blob-content-encoding"] = *blob_headers.content_encoding;
        }
        if (blob_headers.content_language) {
            headers["x-ms-blob-content-language"] = *blob_headers.content_language;
        }
        if (blob_headers.content_type) {
            headers["x-ms-blob-content-type"] = *blob_headers.content_type;
        }
        if (blob_headers.content_md5) {
            headers["x-ms-blob-content-md5"] = encoding::base64_encode(*blob_headers.content_md5);
        }
        for (const auto& [name, value] : metadata) {
            headers[std::string(meta_prefix) + name] = value;
        }
    }

    static auto failure_from(const blob_http_response& response,
                             const request_conditions& sent,
                             const std::string& operation) -> error {
        auto body = response.get_body_string();
        auto service_code = response.get_header("x-ms-error-code").value_or("");
        if (service_code.empty()) {
            service_code = encoding::extract_xml_element(body, "Code").value_or("");
        }

        std::string message =
            operation + " failed with HTTP " + std::to_string(response.status_code);
        if (auto detail = encoding::extract_xml_element(body, "Message")) {
            message += ": " + *detail;
        }

        return access_condition_evaluator::classify_failure(response.status_code, service_code,
                                                            message, sent);
    }

    static auto transport_failure(const error& cause, const std::string& operation) -> error {
        auto code = is_transient(cause.code) ? cause.code : error_code::connection_failed;
        return error{code, operation + ": " + cause.message};
    }

    static auto parse_properties(const blob_http_response& response) -> blob_properties {
        blob_properties props;

        if (auto type = response.get_header("x-ms-blob-type")) {
            if (*type == "PageBlob") {
                props.type = blob_type::page_blob;
            } else if (*type == "AppendBlob") {
                props.type = blob_type::append_blob;
            }
        }
        if (auto length = response.get_header("Content-Length")) {
            props.content_length = std::strtoull(length->c_str(), nullptr, 10);
        }
        if (auto etag = response.get_header("ETag")) {
            props.etag = *etag;
        }
        if (auto modified = response.get_header("Last-Modified")) {
            if (auto parsed = encoding::parse_rfc1123(*modified)) {
                props.last_modified = *parsed;
            }
        }

        auto& h = props.http_headers;
        h.cache_control = response.get_header("Cache-Control");
        h.content_disposition = response.get_header("Content-Disposition");
        h.content_encoding = response.get_header("Content-Encoding");
        h.content_language = response.get_header("Content-Language");
        h.content_type = response.get_header("Content-Type");
        if (auto md5 = response.get_header("Content-MD5")) {
            h.content_md5 = encoding::base64_decode(*md5);
        }

        props.lease_state = response.get_header("x-ms-lease-state");

        const std::string prefix(meta_prefix);
        for (const auto& [key, value] : response.headers) {
            if (key.size() > prefix.size() && to_lower(key.substr(0, prefix.size())) == prefix) {
                props.metadata[key.substr(prefix.size())] = value;
            }
        }

        return props;
    }

    static auto parse_write_response(const blob_http_response& response) -> blob_write_response {
        blob_write_response written;
        written.status_code = response.status_code;
        written.etag = response.get_header("ETag").value_or("");
        if (auto modified = response.get_header("Last-Modified")) {
            if (auto parsed = encoding::parse_rfc1123(*modified)) {
                written.last_modified = *parsed;
            }
        }
        if (auto md5 = response.get_header("Content-MD5")) {
            written.content_md5 = encoding::base64_decode(*md5);
        }
        return written;
    }

    auto put(const std::map<std::string, std::string>& query,
             std::vector<uint8_t> body,
             std::map<std::string, std::string> headers,
             const request_conditions& sent,
             const std::string& operation) -> result<blob_http_response> {
        headers["Content-Length"] = std::to_string(body.size());
        authorize("PUT", query, headers);

        auto response = http->put(build_url(query), body, headers);
        if (!response) {
            return unexpected{transport_failure(response.error(), operation)};
        }
        if (response.value().status_code != 201) {
            return unexpected{failure_from(response.value(), sent, operation)};
        }
        return response;
    }
};

azure_block_blob_client::azure_block_blob_client(
    azure_blob_endpoint endpoint, std::shared_ptr<blob_http_client_interface> http_client)
    : impl_(std::make_unique<impl>(std::move(endpoint), std::move(http_client))) {}

azure_block_blob_client::~azure_block_blob_client() = default;

auto azure_block_blob_client::create(const azure_blob_endpoint& endpoint,
                                     std::shared_ptr<blob_http_client_interface> http_client)
    -> result<std::shared_ptr<azure_block_blob_client>> {
    if (auto valid = endpoint.validate(); !valid) {
        return unexpected{valid.error()};
    }

    if (!http_client) {
        auto made = make_default_blob_http_client();
        if (!made) {
            return unexpected{made.error()};
        }
        http_client = made.value();
    }

    return std::shared_ptr<azure_block_blob_client>(
        new azure_block_blob_client(endpoint, std::move(http_client)));
}

auto azure_block_blob_client::url() const -> std::string {
    return impl_->endpoint.blob_url();
}

auto azure_block_blob_client::endpoint() const -> const azure_blob_endpoint& {
    return impl_->endpoint;
}

auto azure_block_blob_client::get_properties(const request_conditions& conditions)
    -> result<blob_properties> {
    auto headers = impl_->base_headers(conditions);
    impl_->authorize("HEAD", {}, headers);

    auto response = impl_->http->head(impl_->build_url({}), headers);
    if (!response) {
        return unexpected{impl::transport_failure(response.error(), "Get Blob Properties")};
    }
    if (response.value().status_code != 200) {
        return unexpected{impl::failure_from(response.value(), conditions, "Get Blob Properties")};
    }
    return impl::parse_properties(response.value());
}

auto azure_block_blob_client::download(const blob_range& range,
                                       const request_conditions& conditions)
    -> result<blob_download_response> {
    auto headers = impl_->base_headers(conditions);
    if (auto value = range.to_header()) {
        headers["x-ms-range"] = *value;
    }
    impl_->authorize("GET", {}, headers);

    auto response = impl_->http->get(impl_->build_url({}), headers);
    if (!response) {
        return unexpected{impl::transport_failure(response.error(), "Get Blob")};
    }

    auto& http_response = response.value();
    if (http_response.status_code != 200 && http_response.status_code != 206) {
        return unexpected{impl::failure_from(http_response, conditions, "Get Blob")};
    }

    blob_download_response downloaded;
    downloaded.properties = impl::parse_properties(http_response);
    downloaded.content_length = http_response.body.size();

    // A partial response reports the blob size after the slash of Content-Range
    if (auto content_range = http_response.get_header("Content-Range")) {
        auto slash = content_range->rfind('/');
        if (slash != std::string::npos && slash + 1 < content_range->size() &&
            (*content_range)[slash + 1] != '*') {
            downloaded.properties.content_length =
                std::strtoull(content_range->c_str() + slash + 1, nullptr, 10);
        }
    }

    downloaded.body = std::make_unique<memory_body_stream>(std::move(http_response.body));
    return downloaded;
}

auto azure_block_blob_client::upload(std::span<const uint8_t> content,
                                     const blob_http_headers& headers,
                                     const blob_metadata& metadata,
                                     const request_conditions& conditions)
    -> result<blob_write_response> {
    auto request_headers = impl_->base_headers(conditions);
    request_headers["x-ms-blob-type"] = "BlockBlob";
    impl::add_blob_headers(headers, metadata, request_headers);

    auto response = impl_->put({}, std::vector<uint8_t>(content.begin(), content.end()),
                               std::move(request_headers), conditions, "Put Blob");
    if (!response) {
        return unexpected{response.error()};
    }
    return impl::parse_write_response(response.value());
}

auto azure_block_blob_client::stage_block(const std::string& block_id,
                                          std::span<const uint8_t> content,
                                          const request_conditions& conditions) -> result<void> {
    std::map<std::string, std::string> query{{"blockid", block_id}, {"comp", "block"}};

    auto response = impl_->put(query, std::vector<uint8_t>(content.begin(), content.end()),
                               impl_->base_headers(conditions), conditions, "Put Block");
    if (!response) {
        return unexpected{response.error()};
    }
    return {};
}

auto azure_block_blob_client::commit_block_list(const std::vector<std::string>& block_ids,
                                                const blob_http_headers& headers,
                                                const blob_metadata& metadata,
                                                const request_conditions& conditions)
    -> result<blob_write_response> {
    std::ostringstream xml;
    xml << "<?xml version=\"1.0\" encoding=\"utf-8\"?><BlockList>";
    for (const auto& id : block_ids) {
        xml << "<Latest>" << id << "</Latest>";
    }
    xml << "</BlockList>";
    auto body = xml.str();

    auto request_headers = impl_->base_headers(conditions);
    request_headers["Content-Type"] = "application/xml";
    impl::add_blob_headers(headers, metadata, request_headers);

    BT_LOG_DEBUG(log_category::transport,
                 "committing " + std::to_string(block_ids.size()) + " blocks to " + url());

    auto response = impl_->put({{"comp", "blocklist"}}, std::vector<uint8_t>(body.begin(), body.end()),
                               std::move(request_headers), conditions, "Put Block List");
    if (!response) {
        return unexpected{response.error()};
    }
    return impl::parse_write_response(response.value());
}

}  // namespace kcenon::blob_transfer
