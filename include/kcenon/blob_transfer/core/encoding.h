/**
 * @file encoding.h
 * @brief Encoding, hashing and time helpers used by the transfer engine and
 *        the Azure adapter
 */

#ifndef KCENON_BLOB_TRANSFER_CORE_ENCODING_H
#define KCENON_BLOB_TRANSFER_CORE_ENCODING_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace kcenon::blob_transfer::encoding {

// ============================================================================
// Encoding
// ============================================================================

/**
 * @brief Convert bytes to lowercase hex string
 */
auto bytes_to_hex(const std::vector<uint8_t>& bytes) -> std::string;

/**
 * @brief Base64 encode bytes
 */
auto base64_encode(const std::vector<uint8_t>& data) -> std::string;

/**
 * @brief Base64 encode a string
 */
auto base64_encode(const std::string& data) -> std::string;

/**
 * @brief Base64 decode
 *
 * Characters outside the alphabet are skipped; decoding stops at padding.
 */
auto base64_decode(const std::string& encoded) -> std::vector<uint8_t>;

/**
 * @brief Percent-encode a URL component
 * @param value String to encode
 * @param encode_slash Whether '/' is encoded (false for blob paths)
 */
auto url_encode(const std::string& value, bool encode_slash = true) -> std::string;

// ============================================================================
// Hashing (OpenSSL)
// ============================================================================

/**
 * @brief MD5 digest of a byte span (16 bytes)
 */
auto md5(std::span<const std::byte> data) -> std::vector<uint8_t>;

/**
 * @brief HMAC-SHA256 of a string with a binary key
 */
auto hmac_sha256(const std::vector<uint8_t>& key,
                 const std::string& data) -> std::vector<uint8_t>;

// ============================================================================
// Time
// ============================================================================

/**
 * @brief Format a time point as RFC 1123 ("Sun, 06 Nov 1994 08:49:37 GMT")
 */
auto format_rfc1123(std::chrono::system_clock::time_point tp) -> std::string;

/**
 * @brief Current time as RFC 1123
 */
auto get_rfc1123_time() -> std::string;

/**
 * @brief Parse an RFC 1123 date
 * @return Parsed time point, or nullopt if the value is malformed
 */
auto parse_rfc1123(const std::string& value)
    -> std::optional<std::chrono::system_clock::time_point>;

// ============================================================================
// Random
// ============================================================================

/**
 * @brief Generate a random hex string of byte_count random bytes
 */
auto generate_random_hex(std::size_t byte_count) -> std::string;

// ============================================================================
// XML
// ============================================================================

/**
 * @brief Extract the text of the first <tag>...</tag> element
 */
auto extract_xml_element(const std::string& xml,
                         const std::string& tag) -> std::optional<std::string>;

}  // namespace kcenon::blob_transfer::encoding

#endif  // KCENON_BLOB_TRANSFER_CORE_ENCODING_H
