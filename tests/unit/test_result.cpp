/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> and the error taxonomy.
 */

#include "core/result.hpp"

#include <gtest/gtest.h>

using namespace execution_engine;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValue) {
    Result<int> r = Error{ErrorCode::NotFound, "something went wrong"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
    EXPECT_EQ(r.error().message, "something went wrong");
}

TEST(ResultTest, MessageOnlyErrorIsInternal) {
    Result<int> r = Error{"fail"};
    EXPECT_EQ(r.error().code, ErrorCode::Internal);
}

TEST(ResultTest, ValueOr) {
    Result<int> success = 42;
    Result<int> failure = Error{"fail"};
    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, Map) {
    Result<int> r = 21;
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_TRUE(doubled.has_value());
    EXPECT_EQ(*doubled, 42);
}

TEST(ResultTest, MapOnErrorKeepsCode) {
    Result<int> r = Error{ErrorCode::PoolExhausted, "fail"};
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_FALSE(doubled.has_value());
    EXPECT_EQ(doubled.error().code, ErrorCode::PoolExhausted);
}

TEST(ResultTest, AndThen) {
    Result<int> r = 4;
    auto chained = r.and_then([](int v) -> Result<int> {
        if (v > 3) return Error{ErrorCode::ConstraintViolation, "too big"};
        return v;
    });
    ASSERT_FALSE(chained.has_value());
    EXPECT_EQ(chained.error().code, ErrorCode::ConstraintViolation);
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    Result<void> bad = Error{ErrorCode::Cancelled, "stopped"};
    EXPECT_TRUE(ok);
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::Cancelled);
}

TEST(ErrorTest, Retryable) {
    EXPECT_TRUE((Error{ErrorCode::SchedulingTimeout, ""}.is_retryable()));
    EXPECT_TRUE((Error{ErrorCode::NoAvailableCapacity, ""}.is_retryable()));
    EXPECT_TRUE((Error{ErrorCode::PoolExhausted, ""}.is_retryable()));
    EXPECT_FALSE((Error{ErrorCode::ConstraintViolation, ""}.is_retryable()));
    EXPECT_FALSE((Error{ErrorCode::SandboxSetupFailed, ""}.is_retryable()));
    EXPECT_FALSE((Error{ErrorCode::InvalidArgument, ""}.is_retryable()));
}

TEST(ErrorTest, CodeNames) {
    EXPECT_EQ(to_string(ErrorCode::ConstraintViolation), "constraint_violation");
    EXPECT_EQ(to_string(ErrorCode::SchedulingTimeout), "scheduling_timeout");
    EXPECT_EQ(to_string(ErrorCode::PoolExhausted), "pool_exhausted");
}
