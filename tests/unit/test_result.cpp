/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> and error codes.
 */

#include "core/result.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace cloudslash;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValueDefaultsToGenericCode) {
    Result<int> r = Error{"something went wrong"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "something went wrong");
    EXPECT_EQ(r.error().code, ErrorCode::Generic);
    EXPECT_TRUE(r.error().subject.empty());
}

TEST(ResultTest, ErrorCarriesCodeAndSubject) {
    auto r = make_error<std::string>(ErrorCode::CycleDetected, "cycle detected involving a", "a");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::CycleDetected);
    EXPECT_EQ(r.error().subject, "a");
    EXPECT_EQ(r.error().what(), "cycle detected involving a");
}

TEST(ResultTest, ValueOr) {
    Result<int> success = 42;
    Result<int> failure = Error{ErrorCode::NotFound, "missing"};
    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, MapPropagatesError) {
    Result<int> ok = 21;
    auto doubled = ok.map([](int v) { return v * 2; });
    ASSERT_TRUE(doubled.has_value());
    EXPECT_EQ(*doubled, 42);

    Result<int> bad = Error{ErrorCode::Throttled, "Rate exceeded"};
    auto mapped = bad.map([](int v) { return v * 2; });
    ASSERT_FALSE(mapped.has_value());
    EXPECT_EQ(mapped.error().code, ErrorCode::Throttled);
}

TEST(ResultTest, AndThenChains) {
    Result<int> r = 4;
    auto chained = r.and_then([](int v) -> Result<int> {
        if (v > 3) return Error{ErrorCode::Generic, "too big"};
        return v;
    });
    ASSERT_FALSE(chained);
    EXPECT_EQ(chained.error().message, "too big");
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    EXPECT_TRUE(ok.has_value());

    Result<void> failed = Error{ErrorCode::Io, "disk full", "/tmp/x"};
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().code, ErrorCode::Io);
    EXPECT_THROW((void)ok.error(), std::runtime_error);
}

TEST(ResultTest, ValueOnErrorThrows) {
    Result<int> r = Error{"fail"};
    EXPECT_THROW((void)r.value(), std::runtime_error);
}

TEST(ResultTest, ErrorCodeNames) {
    EXPECT_EQ(to_string(ErrorCode::Throttled), "throttled");
    EXPECT_EQ(to_string(ErrorCode::CycleDetected), "cycle_detected");
    EXPECT_EQ(to_string(ErrorCode::TaskPanicked), "task_panicked");
}
