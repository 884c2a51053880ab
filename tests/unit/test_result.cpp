/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> monadic error type.
 * @author BeaconMesh contributors
 */

#include "core/result.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace beacon_mesh;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValue) {
    Result<int> r = Error{"something went wrong"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "something went wrong");
    EXPECT_EQ(r.error().kind, ErrorKind::Internal);
}

TEST(ResultTest, ErrorCarriesKind) {
    Result<uint16_t> r = Error{ErrorKind::ResourceConflict, "port taken"};
    ASSERT_FALSE(r);
    EXPECT_TRUE(r.error().is(ErrorKind::ResourceConflict));
    EXPECT_FALSE(r.error().is(ErrorKind::NotFound));
}

TEST(ResultTest, BoolConversion) {
    Result<int> success = 1;
    Result<int> failure = Error{"fail"};
    EXPECT_TRUE(static_cast<bool>(success));
    EXPECT_FALSE(static_cast<bool>(failure));
}

TEST(ResultTest, ValueOr) {
    Result<int> success = 42;
    Result<int> failure = Error{"fail"};
    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, ValueOnErrorThrows) {
    Result<int> failure = Error{"fail"};
    EXPECT_THROW((void)failure.value(), std::runtime_error);
}

TEST(ResultTest, Map) {
    Result<int> r = 21;
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_TRUE(doubled.has_value());
    EXPECT_EQ(*doubled, 42);
}

TEST(ResultTest, MapOnError) {
    Result<int> r = Error{ErrorKind::ProtocolViolation, "fail"};
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_FALSE(doubled.has_value());
    EXPECT_EQ(doubled.error().message, "fail");
    EXPECT_EQ(doubled.error().kind, ErrorKind::ProtocolViolation);
}

TEST(ResultTest, AndThenShortCircuits) {
    auto parse = [](int v) -> Result<std::string> {
        if (v < 0) return Error{ErrorKind::ProtocolViolation, "negative"};
        return std::to_string(v);
    };

    Result<int> ok = 7;
    auto chained = ok.and_then(parse);
    ASSERT_TRUE(chained);
    EXPECT_EQ(*chained, "7");

    Result<int> bad = -1;
    EXPECT_EQ(bad.and_then(parse).error().message, "negative");
}

TEST(ResultVoidTest, SuccessAndError) {
    Result<void> ok;
    EXPECT_TRUE(ok.has_value());

    Result<void> failed = Error{ErrorKind::ConfigurationError, "bad interval"};
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().kind, ErrorKind::ConfigurationError);
}

TEST(ResultTest, MakeError) {
    auto r = make_error<int>(ErrorKind::NotFound, "no such peer");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::NotFound);
    EXPECT_EQ(to_string(r.error().kind), "not_found");
}
