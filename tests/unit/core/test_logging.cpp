/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging and credential masking
 */

#include <gtest/gtest.h>

#include <kcenon/blob_transfer/core/logging.h>

#include <string>
#include <tuple>
#include <vector>

namespace kcenon::blob_transfer::test {

// =============================================================================
// Masking Config Tests
// =============================================================================

TEST(MaskingConfigTest, DefaultConfigMasksCredentialsOnly) {
    masking_config config;

    EXPECT_TRUE(config.mask_credentials);
    EXPECT_FALSE(config.mask_lease_ids);
    EXPECT_FALSE(config.mask_paths);
    EXPECT_EQ(config.mask_char, '*');
    EXPECT_EQ(config.visible_chars, 4u);
}

TEST(MaskingConfigTest, Presets) {
    auto all = masking_config::all_masked();
    EXPECT_TRUE(all.mask_credentials);
    EXPECT_TRUE(all.mask_lease_ids);
    EXPECT_TRUE(all.mask_paths);

    auto none = masking_config::none();
    EXPECT_FALSE(none.mask_credentials);
    EXPECT_FALSE(none.mask_lease_ids);
    EXPECT_FALSE(none.mask_paths);
}

// =============================================================================
// Sensitive Info Masker Tests
// =============================================================================

class SensitiveInfoMaskerTest : public ::testing::Test {
protected:
    sensitive_info_masker masker_;
};

TEST_F(SensitiveInfoMaskerTest, MasksSasSignature) {
    auto masked = masker_.mask_url(
        "https://acct.blob.core.windows.net/c/b?sv=2021-08-06&sp=rw&sig=abcDEF%2B123&se=x");

    EXPECT_EQ(masked.find("abcDEF"), std::string::npos);
    EXPECT_NE(masked.find("sig=********&se=x"), std::string::npos);
    EXPECT_NE(masked.find("/c/b?sv=2021-08-06"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, MasksSharedKeySignature) {
    auto masked = masker_.mask("Authorization: SharedKey myaccount:c2lnbmF0dXJl");

    EXPECT_EQ(masked, "Authorization: SharedKey myaccount:********");
}

TEST_F(SensitiveInfoMaskerTest, MasksAccountKey) {
    auto masked = masker_.mask("AccountName=acct;AccountKey=c2VjcmV0a2V5;EndpointSuffix=x");

    EXPECT_EQ(masked, "AccountName=acct;AccountKey=********;EndpointSuffix=x");
}

TEST_F(SensitiveInfoMaskerTest, PlainTextIsUnchanged) {
    std::string input = "staged 12 blocks to https://acct.blob.core.windows.net/c/b";
    EXPECT_EQ(masker_.mask(input), input);
    EXPECT_EQ(masker_.mask(""), "");
}

TEST_F(SensitiveInfoMaskerTest, NoneConfigLeavesCredentials) {
    sensitive_info_masker masker(masking_config::none());
    std::string input = "sig=secret";
    EXPECT_EQ(masker.mask(input), input);
}

TEST_F(SensitiveInfoMaskerTest, LeaseIdMasking) {
    EXPECT_EQ(masker_.mask_lease_id("0f1e2d3c-aaaa"), "0f1e2d3c-aaaa");

    sensitive_info_masker masker(masking_config::all_masked());
    EXPECT_EQ(masker.mask_lease_id("0f1e2d3c"), "0f1e****");
    EXPECT_EQ(masker.mask_lease_id("abc"), "abc");
}

TEST_F(SensitiveInfoMaskerTest, PathMasking) {
    EXPECT_EQ(masker_.mask_path("/home/user/data.bin"), "/home/user/data.bin");

    sensitive_info_masker masker(masking_config::all_masked());
    auto masked = masker.mask_path("/home/user/data.bin");
    EXPECT_EQ(masked.find("/home/user"), std::string::npos);
    EXPECT_NE(masked.find("/data.bin"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, UpdateConfig) {
    masker_.set_config(masking_config::none());
    EXPECT_FALSE(masker_.get_config().mask_credentials);
    EXPECT_EQ(masker_.mask("sig=secret"), "sig=secret");
}

// =============================================================================
// Transfer Log Context Tests
// =============================================================================

TEST(TransferLogContextTest, EmptyContextToJson) {
    transfer_log_context ctx;
    EXPECT_EQ(ctx.to_json(), "{}");
}

TEST(TransferLogContextTest, FieldsToJson) {
    transfer_log_context ctx;
    ctx.blob_url = "https://acct.blob.core.windows.net/c/b";
    ctx.file_size = 1048576;
    ctx.bytes_transferred = 524288;
    ctx.block_index = 5;
    ctx.block_count = 10;
    ctx.etag = "\"0x8D1\"";
    ctx.attempt = 2;
    ctx.status_code = 412;
    ctx.duration_ms = 1000;
    ctx.rate_mbps = 2.5;
    ctx.error_message = "condition not met";

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\"blob_url\":\"https://acct.blob.core.windows.net/c/b\""),
              std::string::npos);
    EXPECT_NE(json.find("\"size\":1048576"), std::string::npos);
    EXPECT_NE(json.find("\"bytes_transferred\":524288"), std::string::npos);
    EXPECT_NE(json.find("\"block_index\":5"), std::string::npos);
    EXPECT_NE(json.find("\"block_count\":10"), std::string::npos);
    EXPECT_NE(json.find("\"etag\":\"\\\"0x8D1\\\"\""), std::string::npos);
    EXPECT_NE(json.find("\"attempt\":2"), std::string::npos);
    EXPECT_NE(json.find("\"status_code\":412"), std::string::npos);
    EXPECT_NE(json.find("\"rate_mbps\":2.50"), std::string::npos);
    EXPECT_NE(json.find("\"error_message\":\"condition not met\""), std::string::npos);
}

TEST(TransferLogContextTest, JsonWithMasking) {
    transfer_log_context ctx;
    ctx.blob_url = "https://acct.blob.core.windows.net/c/b?sig=topsecret";
    ctx.lease_id = "0f1e2d3c-4b5a";
    ctx.error_message = "request with SharedKey acct:c2lnbmF0dXJl was rejected";

    sensitive_info_masker masker(masking_config::all_masked());
    auto json = ctx.to_json_with_masking(&masker);

    EXPECT_EQ(json.find("topsecret"), std::string::npos);
    EXPECT_EQ(json.find("c2lnbmF0dXJl"), std::string::npos);
    EXPECT_EQ(json.find("0f1e2d3c-4b5a"), std::string::npos);
    EXPECT_NE(json.find("\"lease_id\":\"0f1e"), std::string::npos);
}

TEST(TransferLogContextTest, JsonEscaping) {
    transfer_log_context ctx;
    ctx.transfer_id = "id-with-\"quotes\"";
    ctx.error_message = "line\nbreak\ttab";

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\\\""), std::string::npos);
    EXPECT_NE(json.find("\\n"), std::string::npos);
    EXPECT_NE(json.find("\\t"), std::string::npos);
}

// =============================================================================
// Log Entry Builder Tests
// =============================================================================

TEST(LogEntryBuilderTest, BuildsEntryWithContext) {
    auto entry = log_entry_builder()
                     .with_level(log_level::info)
                     .with_category(log_category::upload)
                     .with_message("block list committed")
                     .with_blob_url("https://acct.blob.core.windows.net/c/b")
                     .with_block_count(12)
                     .with_bytes_transferred(4096)
                     .build();

    EXPECT_EQ(entry.level, log_level::info);
    EXPECT_EQ(entry.category, "blob_transfer.upload");
    EXPECT_EQ(entry.message, "block list committed");
    ASSERT_TRUE(entry.context.has_value());
    EXPECT_EQ(entry.context->block_count, 12u);
    EXPECT_EQ(entry.context->bytes_transferred, 4096u);
    EXPECT_FALSE(entry.timestamp.empty());
}

TEST(LogEntryBuilderTest, BuildJson) {
    auto json = log_entry_builder()
                    .with_level(log_level::error)
                    .with_category(log_category::download)
                    .with_message("chunk fetch failed")
                    .with_attempt(3)
                    .with_source_location("download_engine.cpp", 42, "download")
                    .build_json();

    EXPECT_NE(json.find("\"level\":\"ERROR\""), std::string::npos);
    EXPECT_NE(json.find("\"category\":\"blob_transfer.download\""), std::string::npos);
    EXPECT_NE(json.find("\"attempt\":3"), std::string::npos);
    EXPECT_NE(json.find("\"source\":{\"file\":\"download_engine.cpp\",\"line\":42"),
              std::string::npos);
}

TEST(LogLevelTest, LogLevelToString) {
    EXPECT_EQ(log_level_to_string(log_level::trace), "TRACE");
    EXPECT_EQ(log_level_to_string(log_level::debug), "DEBUG");
    EXPECT_EQ(log_level_to_string(log_level::info), "INFO");
    EXPECT_EQ(log_level_to_string(log_level::warn), "WARN");
    EXPECT_EQ(log_level_to_string(log_level::error), "ERROR");
    EXPECT_EQ(log_level_to_string(log_level::fatal), "FATAL");
}

// =============================================================================
// Logger Tests
// =============================================================================

class BlobTransferLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().initialize();
        get_logger().set_level(log_level::trace);
        get_logger().set_output_format(log_output_format::text);
        get_logger().set_masking_config(masking_config{});
    }

    void TearDown() override {
        get_logger().set_callback(nullptr);
        get_logger().set_json_callback(nullptr);
        get_logger().set_level(log_level::warn);
        get_logger().set_output_format(log_output_format::text);
        get_logger().set_masking_config(masking_config{});
    }
};

TEST_F(BlobTransferLoggerTest, InitializeIsIdempotent) {
    get_logger().initialize();
    EXPECT_TRUE(get_logger().is_initialized());
}

TEST_F(BlobTransferLoggerTest, SetOutputFormat) {
    get_logger().set_output_format(log_output_format::json);
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::json);

    get_logger().set_output_format(log_output_format::text);
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::text);
}

TEST_F(BlobTransferLoggerTest, LogCallback) {
    std::vector<std::tuple<log_level, std::string, std::string>> captured;

    get_logger().set_callback([&](log_level level, std::string_view category,
                                  std::string_view message, const transfer_log_context*) {
        captured.emplace_back(level, std::string(category), std::string(message));
    });

    BT_LOG_INFO(log_category::retry, "re-issuing ranged read");

    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(std::get<0>(captured[0]), log_level::info);
    EXPECT_EQ(std::get<1>(captured[0]), log_category::retry);
    EXPECT_EQ(std::get<2>(captured[0]), "re-issuing ranged read");
}

TEST_F(BlobTransferLoggerTest, LogLevelFiltering) {
    std::vector<std::string> captured;

    get_logger().set_callback([&](log_level, std::string_view, std::string_view message,
                                  const transfer_log_context*) {
        captured.push_back(std::string(message));
    });

    get_logger().set_level(log_level::warn);

    BT_LOG_DEBUG(log_category::upload, "Debug message");
    BT_LOG_INFO(log_category::upload, "Info message");
    BT_LOG_WARN(log_category::upload, "Warn message");
    BT_LOG_ERROR(log_category::upload, "Error message");

    ASSERT_EQ(captured.size(), 2u);
    EXPECT_EQ(captured[0], "Warn message");
    EXPECT_EQ(captured[1], "Error message");
}

TEST_F(BlobTransferLoggerTest, JsonCallbackReceivesMaskedEntry) {
    std::vector<std::string> captured_json;

    get_logger().set_output_format(log_output_format::json);
    get_logger().set_json_callback([&](const structured_log_entry&, const std::string& json) {
        captured_json.push_back(json);
    });

    transfer_log_context ctx;
    ctx.blob_url = "https://acct.blob.core.windows.net/c/b?sv=1&sig=topsecret";
    BT_LOG_INFO_CTX(log_category::transport, "request sent", ctx);

    ASSERT_EQ(captured_json.size(), 1u);
    EXPECT_NE(captured_json[0].find("\"level\":\"INFO\""), std::string::npos);
    EXPECT_NE(captured_json[0].find("\"message\":\"request sent\""), std::string::npos);
    EXPECT_EQ(captured_json[0].find("topsecret"), std::string::npos);
}

}  // namespace kcenon::blob_transfer::test
