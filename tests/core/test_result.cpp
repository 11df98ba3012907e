#include <gtest/gtest.h>
#include <memory>
#include <string>
#include "market_ingest/core/error.hpp"

using namespace market_ingest;

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, SuccessfulResults) {
    Result<int> int_result(42);
    EXPECT_TRUE(int_result.is_ok());
    EXPECT_FALSE(int_result.is_error());
    EXPECT_EQ(int_result.value(), 42);

    Result<std::string> string_result("success");
    EXPECT_TRUE(string_result.is_ok());
    EXPECT_EQ(string_result.value(), "success");
}

TEST_F(ResultTest, ErrorCase) {
    auto error_result =
        make_error<int>(ErrorCode::VALIDATION_ERROR, "missing security code", "UpsertMerger");

    EXPECT_TRUE(error_result.is_error());
    EXPECT_EQ(error_result.error()->code(), ErrorCode::VALIDATION_ERROR);
    EXPECT_STREQ(error_result.error()->what(), "missing security code");
    EXPECT_EQ(error_result.error()->component(), "UpsertMerger");
    EXPECT_EQ(error_result.error()->to_string(),
              "Error in UpsertMerger: missing security code (VALIDATION_ERROR)");
}

TEST_F(ResultTest, MoveOnlyType) {
    auto ptr = std::make_unique<int>(42);
    Result<std::unique_ptr<int>> result(std::move(ptr));

    ASSERT_TRUE(result.is_ok());
    auto taken = result.take();
    EXPECT_EQ(*taken, 42);
}

TEST_F(ResultTest, ValueOfErrorThrows) {
    auto result = make_error<double>(ErrorCode::COMPUTATION_SKIPPED, "no history");
    EXPECT_THROW(result.value(), PipelineError);
}

TEST_F(ResultTest, VoidResult) {
    Result<void> ok;
    EXPECT_TRUE(ok.is_ok());
    EXPECT_NO_THROW(ok.value());

    auto failed = make_error<void>(ErrorCode::DATABASE_ERROR, "connection lost", "PostgresStore");
    EXPECT_TRUE(failed.is_error());
    EXPECT_THROW(failed.value(), PipelineError);
}

TEST_F(ResultTest, ForwardErrorKeepsCodeAndComponent) {
    auto original = make_error<int>(ErrorCode::TIMEOUT_ERROR, "attempt timed out", "Fetch");
    auto forwarded = forward_error<std::string>(original);

    ASSERT_TRUE(forwarded.is_error());
    EXPECT_EQ(forwarded.error()->code(), ErrorCode::TIMEOUT_ERROR);
    EXPECT_STREQ(forwarded.error()->what(), "attempt timed out");
    EXPECT_EQ(forwarded.error()->component(), "Fetch");
}

TEST_F(ResultTest, RetryableCodes) {
    EXPECT_TRUE(is_retryable(ErrorCode::FETCH_ERROR));
    EXPECT_TRUE(is_retryable(ErrorCode::CONNECTION_ERROR));
    EXPECT_TRUE(is_retryable(ErrorCode::TIMEOUT_ERROR));
    EXPECT_TRUE(is_retryable(ErrorCode::PARSE_ERROR));

    EXPECT_FALSE(is_retryable(ErrorCode::VALIDATION_ERROR));
    EXPECT_FALSE(is_retryable(ErrorCode::CONFLICT_ERROR));
    EXPECT_FALSE(is_retryable(ErrorCode::COMPUTATION_SKIPPED));
    EXPECT_FALSE(is_retryable(ErrorCode::DATABASE_ERROR));
}
