/**
 * @file test_core_types.cpp
 * @brief Unit tests for error codes, error and result
 */

#include <gtest/gtest.h>

#include <kcenon/blob_transfer/core/types.h>

#include <string>

namespace kcenon::blob_transfer::test {

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, ErrorCodeRanges) {
    EXPECT_TRUE(is_argument_error(error_code::invalid_block_size));
    EXPECT_TRUE(is_argument_error(error_code::too_many_blocks));
    EXPECT_TRUE(is_argument_error(error_code::invalid_configuration));
    EXPECT_FALSE(is_argument_error(error_code::file_not_found));

    EXPECT_TRUE(is_file_error(error_code::file_not_found));
    EXPECT_TRUE(is_file_error(error_code::file_write_error));
    EXPECT_FALSE(is_file_error(error_code::condition_not_met));

    EXPECT_TRUE(is_precondition_violation(error_code::condition_not_met));
    EXPECT_TRUE(is_precondition_violation(error_code::lease_id_mismatch));
    EXPECT_TRUE(is_precondition_violation(error_code::lease_lost));
    EXPECT_FALSE(is_precondition_violation(error_code::service_error));

    EXPECT_TRUE(is_service_error(error_code::blob_not_found));
    EXPECT_TRUE(is_service_error(error_code::server_busy));
    EXPECT_FALSE(is_service_error(error_code::internal_error));

    EXPECT_TRUE(is_internal_error(error_code::cancelled));
    EXPECT_TRUE(is_internal_error(error_code::not_initialized));
}

TEST_F(ErrorCodeTest, OnlyStreamFailuresAreTransient) {
    EXPECT_TRUE(is_transient(error_code::stream_interrupted));
    EXPECT_TRUE(is_transient(error_code::connection_failed));
    EXPECT_TRUE(is_transient(error_code::connection_timeout));
    EXPECT_TRUE(is_transient(error_code::connection_reset));

    EXPECT_FALSE(is_transient(error_code::condition_not_met));
    EXPECT_FALSE(is_transient(error_code::server_busy));
    EXPECT_FALSE(is_transient(error_code::file_read_error));
    EXPECT_FALSE(is_transient(error_code::success));
}

TEST_F(ErrorCodeTest, ToString) {
    EXPECT_STREQ(to_string(error_code::success), "success");
    EXPECT_STREQ(to_string(error_code::too_many_blocks), "too many blocks");
    EXPECT_STREQ(to_string(error_code::condition_not_met), "condition not met");
    EXPECT_STREQ(to_string(error_code::stream_interrupted), "stream interrupted");
    EXPECT_STREQ(to_string(static_cast<error_code>(-1)), "unknown error");
}

TEST_F(ErrorCodeTest, ConditionKindToString) {
    EXPECT_STREQ(to_string(condition_kind::if_match), "If-Match");
    EXPECT_STREQ(to_string(condition_kind::if_unmodified_since), "If-Unmodified-Since");
    EXPECT_STREQ(to_string(condition_kind::lease_id), "x-ms-lease-id");
}

class ErrorTest : public ::testing::Test {};

TEST_F(ErrorTest, CodeOnlyUsesDefaultMessage) {
    error err(error_code::invalid_range);
    EXPECT_EQ(err.message, "invalid range");
    EXPECT_TRUE(static_cast<bool>(err));
    EXPECT_EQ(err.status_code, 0);
    EXPECT_EQ(err.condition, condition_kind::none);
}

TEST_F(ErrorTest, DefaultIsSuccess) {
    error err;
    EXPECT_EQ(err.code, error_code::success);
    EXPECT_FALSE(static_cast<bool>(err));
}

TEST_F(ErrorTest, FromServiceKeepsServiceDetail) {
    auto err = error::from_service(error_code::condition_not_met, "precondition failed", 412,
                                   "ConditionNotMet", condition_kind::if_match);

    EXPECT_EQ(err.code, error_code::condition_not_met);
    EXPECT_EQ(err.message, "precondition failed");
    EXPECT_EQ(err.status_code, 412);
    EXPECT_EQ(err.service_code, "ConditionNotMet");
    EXPECT_EQ(err.condition, condition_kind::if_match);
}

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, ValueResult) {
    result<int> r = 7;
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 7);
}

TEST_F(ResultTest, ErrorResult) {
    result<std::string> r = unexpected{error{error_code::file_not_found, "missing"}};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::file_not_found);
    EXPECT_EQ(r.error().message, "missing");
}

TEST_F(ResultTest, VoidResult) {
    result<void> ok;
    EXPECT_TRUE(ok.has_value());

    result<void> failed = unexpected{error{error_code::cancelled}};
    EXPECT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, error_code::cancelled);
}

}  // namespace kcenon::blob_transfer::test
