// =============================================================================
// PhoneBridge - Result Type Unit Tests
// =============================================================================

#include <gtest/gtest.h>
#include "result.hpp"

#include <memory>
#include <vector>

using namespace phonebridge;

// =============================================================================
// Test: Basic Ok/Err Creation
// =============================================================================

TEST(ResultTest, OkCreation) {
    Result<int, Error> result = Ok(42);

    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_err());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrCreationDefaultsToInternal) {
    Result<int, Error> result = Err<int>("Something went wrong");

    EXPECT_FALSE(result.is_ok());
    EXPECT_TRUE(result.is_err());
    EXPECT_EQ(result.error().message, "Something went wrong");
    EXPECT_EQ(result.error().kind, ErrorKind::Internal);
}

TEST(ResultTest, ErrCreationWithKind) {
    Result<int, Error> result = Err<int>(std::string("bad count"), ErrorKind::Validation);

    EXPECT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, ErrorKind::Validation);
}

TEST(ResultTest, BoolConversion) {
    Result<int, Error> ok = Ok(1);
    Result<int, Error> err = Err<int>("error");

    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_FALSE(static_cast<bool>(err));
}

// =============================================================================
// Test: Error kinds
// =============================================================================

TEST(ResultTest, KindHelpers) {
    EXPECT_EQ(framing_error("x").kind, ErrorKind::Framing);
    EXPECT_EQ(validation_error("x").kind, ErrorKind::Validation);
    EXPECT_EQ(tool_error("x").kind, ErrorKind::Tool);
    EXPECT_EQ(transport_error("x").kind, ErrorKind::Transport);
    EXPECT_EQ(internal_error("x").kind, ErrorKind::Internal);
    EXPECT_EQ(tool_error("adb failed").message, "adb failed");
}

TEST(ResultTest, KindNames) {
    EXPECT_STREQ(errorKindName(ErrorKind::Framing), "framing");
    EXPECT_STREQ(errorKindName(ErrorKind::Validation), "validation");
    EXPECT_STREQ(errorKindName(ErrorKind::Tool), "tool");
    EXPECT_STREQ(errorKindName(ErrorKind::Transport), "transport");
    EXPECT_STREQ(errorKindName(ErrorKind::Internal), "internal");
}

TEST(ResultTest, ErrorEquality) {
    EXPECT_EQ(tool_error("a"), tool_error("a"));
    EXPECT_FALSE(tool_error("a") == validation_error("a"));
    EXPECT_FALSE(tool_error("a") == tool_error("b"));
}

// =============================================================================
// Test: Value Access
// =============================================================================

TEST(ResultTest, ValueAccess) {
    Result<std::string, Error> result = Ok(std::string("hello"));

    EXPECT_EQ(result.value(), "hello");
}

TEST(ResultTest, ValueAccessThrowsOnError) {
    Result<int, Error> result = Err<int>("error");

    EXPECT_THROW(result.value(), std::runtime_error);
}

TEST(ResultTest, ErrorAccessThrowsOnOk) {
    Result<int, Error> result = Ok(42);

    EXPECT_THROW(result.error(), std::runtime_error);
}

TEST(ResultTest, ValueOr) {
    Result<int, Error> ok = Ok(42);
    Result<int, Error> err = Err<int>("error");

    EXPECT_EQ(ok.value_or(0), 42);
    EXPECT_EQ(err.value_or(0), 0);
}

// =============================================================================
// Test: Optional-style Access
// =============================================================================

TEST(ResultTest, OkOptional) {
    Result<int, Error> ok = Ok(42);
    Result<int, Error> err = Err<int>("error");

    EXPECT_TRUE(ok.ok().has_value());
    EXPECT_EQ(*ok.ok(), 42);
    EXPECT_FALSE(err.ok().has_value());
}

TEST(ResultTest, ErrOptional) {
    Result<int, Error> ok = Ok(42);
    Result<int, Error> err = Err<int>("error");

    EXPECT_FALSE(ok.err().has_value());
    ASSERT_TRUE(err.err().has_value());
    EXPECT_EQ(err.err()->message, "error");
}

// =============================================================================
// Test: Map
// =============================================================================

TEST(ResultTest, MapSuccess) {
    Result<int, Error> result = Ok(10);

    auto mapped = result.map([](int x) { return x * 2; });

    EXPECT_TRUE(mapped.is_ok());
    EXPECT_EQ(mapped.value(), 20);
}

TEST(ResultTest, MapKeepsErrorKind) {
    Result<int, Error> result = tool_error("original error");

    auto mapped = result.map([](int x) { return x * 2; });

    EXPECT_TRUE(mapped.is_err());
    EXPECT_EQ(mapped.error().message, "original error");
    EXPECT_EQ(mapped.error().kind, ErrorKind::Tool);
}

// =============================================================================
// Test: Void Result
// =============================================================================

TEST(ResultTest, VoidOk) {
    Result<void, Error> result = Ok();

    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_err());
    EXPECT_NO_THROW(result.value());
}

TEST(ResultTest, VoidErr) {
    Result<void, Error> result = transport_error("failed");

    EXPECT_FALSE(result.is_ok());
    EXPECT_TRUE(result.is_err());
    EXPECT_THROW(result.value(), std::runtime_error);
    EXPECT_EQ(result.error().message, "failed");
    EXPECT_EQ(result.error().kind, ErrorKind::Transport);
}

// =============================================================================
// Test: Function Return
// =============================================================================

static Result<int, Error> divide(int a, int b) {
    if (b == 0) return validation_error("Division by zero");
    return a / b;
}

TEST(ResultTest, FunctionReturn) {
    auto ok_result = divide(10, 2);
    auto err_result = divide(10, 0);

    EXPECT_TRUE(ok_result.is_ok());
    EXPECT_EQ(ok_result.value(), 5);

    EXPECT_TRUE(err_result.is_err());
    EXPECT_EQ(err_result.error().message, "Division by zero");
}

static Result<int, Error> parse_int(const std::string& s) {
    try {
        return Ok(std::stoi(s));
    } catch (const std::exception&) {
        return Err<int>("Invalid integer: " + s, ErrorKind::Validation);
    }
}

TEST(ResultTest, ChainedOperations) {
    auto result = parse_int("32")
        .map([](int x) { return x + 10; })
        .map([](int x) { return x * 2; });

    EXPECT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), 84);  // (32 + 10) * 2
}

TEST(ResultTest, ChainedOperationsWithError) {
    auto result = parse_int("not a number")
        .map([](int x) { return x + 10; });

    EXPECT_TRUE(result.is_err());
    EXPECT_EQ(result.error().message, "Invalid integer: not a number");
}

// =============================================================================
// Test: Move Semantics
// =============================================================================

TEST(ResultTest, MoveSemantics) {
    Result<std::string, Error> result = Ok(std::string("hello world"));

    std::string value = std::move(result).value();

    EXPECT_EQ(value, "hello world");
}

TEST(ResultTest, MoveOnlyValue) {
    Result<std::unique_ptr<int>, Error> result = std::make_unique<int>(7);

    std::unique_ptr<int> p = std::move(result).value();
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(*p, 7);
}

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
