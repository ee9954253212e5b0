/**
 * @file test_value.cpp
 * @brief Unit tests for the Value tagged scalar (GoogleTest)
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>
#include "ras/Value.hpp"
#include "ras/Errors.hpp"

#include <sstream>

using namespace ras;

// ============================================================================
// Kinds
// ============================================================================

TEST(ValueKinds, FactoriesSetKind) {
    EXPECT_EQ(Value::boolean(true).kind(), ValueKind::Boolean);
    EXPECT_EQ(Value::integer(1).kind(), ValueKind::Integer);
    EXPECT_EQ(Value::floating(1.0).kind(), ValueKind::Float);
    EXPECT_EQ(Value::string("x").kind(), ValueKind::String);
}

TEST(ValueKinds, DefaultIsEmptyString) {
    Value v;
    EXPECT_TRUE(v.is_string());
    EXPECT_EQ(v.as_string(), "");
}

TEST(ValueKinds, IsNumber) {
    EXPECT_TRUE(Value::integer(3).is_number());
    EXPECT_TRUE(Value::floating(3.0).is_number());
    EXPECT_FALSE(Value::string("3").is_number());
    EXPECT_FALSE(Value::boolean(false).is_number());
}

TEST(ValueKinds, TypeNames) {
    EXPECT_EQ(type_name(Value::boolean(true)), "boolean");
    EXPECT_EQ(type_name(Value::integer(0)), "integer");
    EXPECT_EQ(type_name(Value::floating(0.5)), "float");
    EXPECT_EQ(type_name(Value::string("")), "string");
}

// ============================================================================
// Accessors
// ============================================================================

TEST(ValueAccess, MatchingKind) {
    EXPECT_TRUE(Value::boolean(true).as_bool());
    EXPECT_EQ(Value::integer(-5).as_int(), -5);
    EXPECT_DOUBLE_EQ(Value::floating(2.5).as_double(), 2.5);
    EXPECT_EQ(Value::string("abc").as_string(), "abc");
}

TEST(ValueAccess, WrongKindThrows) {
    EXPECT_THROW(Value::string("1").as_int(), ValueTypeError);
    EXPECT_THROW(Value::integer(1).as_double(), ValueTypeError);
    EXPECT_THROW(Value::floating(1.0).as_bool(), ValueTypeError);
    EXPECT_THROW(Value::boolean(true).as_string(), ValueTypeError);
}

TEST(ValueAccess, TypeErrorCarriesKinds) {
    try {
        Value::string("x").as_int();
        FAIL() << "Expected ValueTypeError";
    } catch (const ValueTypeError& e) {
        EXPECT_EQ(e.expected(), "integer");
        EXPECT_EQ(e.actual(), "string");
    }
}

// ============================================================================
// Equality
// ============================================================================

TEST(ValueEquality, SameKindAndPayload) {
    EXPECT_EQ(Value::integer(42), Value::integer(42));
    EXPECT_NE(Value::integer(42), Value::integer(43));
    EXPECT_EQ(Value::string("a"), Value::string("a"));
}

TEST(ValueEquality, KindMatters) {
    EXPECT_NE(Value::integer(1), Value::floating(1.0));
    EXPECT_NE(Value::integer(1), Value::boolean(true));
    EXPECT_NE(Value::string("1"), Value::integer(1));
}

// ============================================================================
// JSON mapping
// ============================================================================

TEST(ValueJson, ScalarsMapToJsonKinds) {
    nlohmann::json b = Value::boolean(false);
    nlohmann::json i = Value::integer(7);
    nlohmann::json f = Value::floating(0.25);
    nlohmann::json s = Value::string("hi");

    EXPECT_TRUE(b.is_boolean());
    EXPECT_TRUE(i.is_number_integer());
    EXPECT_TRUE(f.is_number_float());
    EXPECT_TRUE(s.is_string());
    EXPECT_EQ(s.get<std::string>(), "hi");
}

TEST(ValueJson, StreamOutputIsJsonText) {
    std::ostringstream oss;
    oss << Value::string("x") << " " << Value::integer(3) << " " << Value::boolean(true);
    EXPECT_EQ(oss.str(), "\"x\" 3 true");
}
