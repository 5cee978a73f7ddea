/*
 * test_error.cpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Tests for error codes, results and exceptions

**************************************************/

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "common/exceptions.hpp"
#include "common/json_fields.hpp"
#include "common/result.hpp"

using namespace lumen;

TEST(ErrorTest, CodeToString) {
    EXPECT_EQ(errorCodeToString(ErrorCode::DeviceUnavailable),
              "DeviceUnavailable");
    EXPECT_EQ(errorCodeToString(ErrorCode::StorageError), "StorageError");
}

TEST(ErrorTest, HttpStatusMapping) {
    EXPECT_EQ(errorCodeToHttpStatus(ErrorCode::ValidationError), 400);
    EXPECT_EQ(errorCodeToHttpStatus(ErrorCode::Conflict), 409);
    EXPECT_EQ(errorCodeToHttpStatus(ErrorCode::DeviceUnavailable), 503);
    EXPECT_EQ(errorCodeToHttpStatus(ErrorCode::StorageError), 500);
    EXPECT_EQ(errorCodeToHttpStatus(ErrorCode::InternalError), 500);
}

TEST(ErrorTest, ToStringAndJson) {
    Error error(ErrorCode::DeviceUnavailable, "cannot open", "/dev/ttyS1");
    error.details = "EACCES";
    EXPECT_EQ(error.toString(),
              "[DeviceUnavailable] /dev/ttyS1: cannot open (EACCES)");

    auto j = error.toJson();
    EXPECT_EQ(j["code"], "DeviceUnavailable");
    EXPECT_EQ(j["device"], "/dev/ttyS1");
    EXPECT_EQ(j["details"], "EACCES");
}

TEST(ResultTest, SuccessAndFailure) {
    auto ok = success(5);
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(*ok, 5);

    auto bad = failure<int>(ErrorCode::Conflict, "busy");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ErrorCode::Conflict);
    EXPECT_EQ(bad.error().message, "busy");

    EXPECT_TRUE(success().has_value());
}

TEST(ExceptionTest, StorageExceptionCarriesPath) {
    StorageException e("disk full", "/data/a.png");
    EXPECT_EQ(e.code(), ErrorCode::StorageError);
    EXPECT_EQ(e.path(), "/data/a.png");
    ASSERT_TRUE(e.error().details.has_value());
    EXPECT_EQ(*e.error().details, "/data/a.png");
}

TEST(ExceptionTest, ConfigExceptionIsValidationError) {
    ConfigException e("bad value");
    EXPECT_EQ(e.code(), ErrorCode::ValidationError);
    EXPECT_STREQ(e.what(), "bad value");
}

// ============================================================================
// JSON Field Tests
// ============================================================================

TEST(JsonFieldTest, ReadsIntegersWithinRange) {
    auto value = readIntField(nlohmann::json(42), "value");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 42);

    auto lowest = readIntField(nlohmann::json(std::int64_t{-2147483648}), "v");
    ASSERT_TRUE(lowest.has_value());
    EXPECT_EQ(*lowest, -2147483647 - 1);
}

TEST(JsonFieldTest, RejectsValuesThatWouldTruncate) {
    auto unsignedWide =
        readIntField(nlohmann::json::parse("4294967396"), "light_value");
    ASSERT_FALSE(unsignedWide.has_value());
    EXPECT_EQ(unsignedWide.error().code, ErrorCode::ValidationError);
    EXPECT_EQ(unsignedWide.error().message,
              "Field 'light_value' is out of range");

    EXPECT_FALSE(
        readIntField(nlohmann::json(std::uint64_t{2147483648u}), "v")
            .has_value());
    EXPECT_FALSE(
        readIntField(nlohmann::json(std::int64_t{-2147483649}), "v")
            .has_value());
}

TEST(JsonFieldTest, RejectsNonIntegers) {
    const std::vector<nlohmann::json> values{
        nlohmann::json(1.5), nlohmann::json("7"), nlohmann::json(nullptr)};
    for (const auto& value : values) {
        auto parsed = readIntField(value, "step");
        ASSERT_FALSE(parsed.has_value());
        EXPECT_EQ(parsed.error().message, "Field 'step' must be an integer");
    }
}
