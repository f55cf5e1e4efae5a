/**
 * @file azure_block_blob_client.h
 * @brief block_blob_client over the Azure Blob Storage REST protocol
 *
 * Requests are authorized with SharedKey (HMAC-SHA256 over the canonical
 * request) or with a SAS token appended to the query string. The HTTP
 * exchange goes through blob_http_client_interface, which defaults to the
 * network_system HTTP client when it is linked.
 */

#ifndef KCENON_BLOB_TRANSFER_TRANSPORT_AZURE_BLOCK_BLOB_CLIENT_H
#define KCENON_BLOB_TRANSFER_TRANSPORT_AZURE_BLOCK_BLOB_CLIENT_H

#include <kcenon/blob_transfer/transport/block_blob_client.h>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::blob_transfer {

// ============================================================================
// HTTP Client Interface (for dependency injection and testing)
// ============================================================================

/**
 * @brief HTTP response of a blob request
 */
struct blob_http_response {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    [[nodiscard]] auto get_body_string() const -> std::string {
        return std::string(body.begin(), body.end());
    }

    /**
     * @brief Look up a header, ignoring case
     */
    [[nodiscard]] auto get_header(const std::string& name) const -> std::optional<std::string>;
};

/**
 * @brief HTTP client used by azure_block_blob_client
 *
 * A failed exchange (no response at all) is reported as an error; any
 * response, whatever its status, is a value.
 */
class blob_http_client_interface {
public:
    virtual ~blob_http_client_interface() = default;

    [[nodiscard]] virtual auto get(const std::string& url,
                                   const std::map<std::string, std::string>& headers)
        -> result<blob_http_response> = 0;

    [[nodiscard]] virtual auto put(const std::string& url,
                                   const std::vector<uint8_t>& body,
                                   const std::map<std::string, std::string>& headers)
        -> result<blob_http_response> = 0;

    [[nodiscard]] virtual auto head(const std::string& url,
                                    const std::map<std::string, std::string>& headers)
        -> result<blob_http_response> = 0;
};

/**
 * @brief Create the network_system backed HTTP client
 * @return Client, or not_initialized when network_system is not linked
 */
[[nodiscard]] auto make_default_blob_http_client(
    std::chrono::milliseconds timeout = std::chrono::milliseconds(30000))
    -> result<std::shared_ptr<blob_http_client_interface>>;

// ============================================================================
// Endpoint configuration
// ============================================================================

/**
 * @brief Location of one block blob and the credentials to reach it
 */
struct azure_blob_endpoint {
    std::string account_name;
    std::optional<std::string> account_key;  ///< Base64 SharedKey
    std::optional<std::string> sas_token;    ///< With or without leading '?'
    std::string container;
    std::string blob_name;
    std::optional<std::string> endpoint;  ///< Overrides the account URL (emulators)
    std::string endpoint_suffix = "core.windows.net";
    bool use_ssl = true;
    std::string api_version = "2021-08-06";

    /**
     * @brief Build an endpoint from a storage connection string
     *
     * Recognizes AccountName, AccountKey, SharedAccessSignature,
     * EndpointSuffix, BlobEndpoint and DefaultEndpointsProtocol.
     */
    [[nodiscard]] static auto from_connection_string(const std::string& connection_string,
                                                     const std::string& container,
                                                     const std::string& blob_name)
        -> result<azure_blob_endpoint>;

    /**
     * @brief Check that the endpoint names a blob and carries a credential
     */
    [[nodiscard]] auto validate() const -> result<void>;

    /**
     * @brief Account URL without trailing slash
     */
    [[nodiscard]] auto account_url() const -> std::string;

    /**
     * @brief Blob URL without query string
     */
    [[nodiscard]] auto blob_url() const -> std::string;
};

// ============================================================================
// SharedKey signing
// ============================================================================

/**
 * @brief Builds SharedKey Authorization values for blob requests
 */
class shared_key_signer {
public:
    shared_key_signer(std::string account_name, const std::string& account_key_base64);

    /**
     * @brief Canonical string to sign
     *
     * @param method HTTP method
     * @param resource_path "/container/blob"
     * @param query Query parameters (unencoded)
     * @param headers Request headers
     */
    [[nodiscard]] auto string_to_sign(const std::string& method,
                                      const std::string& resource_path,
                                      const std::map<std::string, std::string>& query,
                                      const std::map<std::string, std::string>& headers) const
        -> std::string;

    /**
     * @brief "SharedKey account:signature"
     */
    [[nodiscard]] auto authorization(const std::string& method,
                                     const std::string& resource_path,
                                     const std::map<std::string, std::string>& query,
                                     const std::map<std::string, std::string>& headers) const
        -> std::string;

private:
    std::string account_name_;
    std::vector<uint8_t> key_;
};

// ============================================================================
// Client
// ============================================================================

/**
 * @brief Azure Block Blob implementation of block_blob_client
 *
 * @code
 * auto endpoint = azure_blob_endpoint::from_connection_string(conn, "backups", "db.tar");
 * auto blob = azure_block_blob_client::create(endpoint.value());
 * manager.upload_file("db.tar", blob.value(), 8 * 1024 * 1024);
 * @endcode
 */
class azure_block_blob_client : public block_blob_client {
public:
    /**
     * @param endpoint Blob location and credentials
     * @param http_client Transport; the network_system client when null
     */
    [[nodiscard]] static auto create(const azure_blob_endpoint& endpoint,
                                     std::shared_ptr<blob_http_client_interface> http_client =
                                         nullptr)
        -> result<std::shared_ptr<azure_block_blob_client>>;

    ~azure_block_blob_client() override;

    azure_block_blob_client(const azure_block_blob_client&) = delete;
    auto operator=(const azure_block_blob_client&) -> azure_block_blob_client& = delete;

    [[nodiscard]] auto url() const -> std::string override;

    [[nodiscard]] auto get_properties(const request_conditions& conditions)
        -> result<blob_properties> override;

    [[nodiscard]] auto download(const blob_range& range, const request_conditions& conditions)
        -> result<blob_download_response> override;

    [[nodiscard]] auto upload(std::span<const uint8_t> content,
                              const blob_http_headers& headers,
                              const blob_metadata& metadata,
                              const request_conditions& conditions)
        -> result<blob_write_response> override;

    [[nodiscard]] auto stage_block(const std::string& block_id,
                                   std::span<const uint8_t> content,
                                   const request_conditions& conditions) -> result<void> override;

    [[nodiscard]] auto commit_block_list(const std::vector<std::string>& block_ids,
                                         const blob_http_headers& headers,
                                         const blob_metadata& metadata,
                                         const request_conditions& conditions)
        -> result<blob_write_response> override;

    [[nodiscard]] auto endpoint() const -> const azure_blob_endpoint&;

private:
    azure_block_blob_client(azure_blob_endpoint endpoint,
                            std::shared_ptr<blob_http_client_interface> http_client);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_TRANSPORT_AZURE_BLOCK_BLOB_CLIENT_H
