/**
 * @file test_value.cpp
 * @brief Unit tests for the document value model (GoogleTest)
 */

#include <gtest/gtest.h>
#include "tomlpath/Value.hpp"

#include <cstdint>
#include <string>
#include <type_traits>

using namespace tomlpath;

TEST(ValueTest, DefaultIsEmptyTable) {
    Value v;
    EXPECT_TRUE(v.is_table());
    EXPECT_TRUE(v.as_table()->empty());
    EXPECT_EQ(v.type(), Type::Table);
}

TEST(ValueTest, ConstructorsPickTag) {
    EXPECT_EQ(Value("x").type(), Type::String);
    EXPECT_EQ(Value(std::string("x")).type(), Type::String);
    EXPECT_EQ(Value(1).type(), Type::Integer);
    EXPECT_EQ(Value(std::int64_t{1}).type(), Type::Integer);
    EXPECT_EQ(Value(1.5).type(), Type::Float);
    EXPECT_EQ(Value(true).type(), Type::Boolean);
    EXPECT_EQ(Value(Datetime{"1979-05-27"}).type(), Type::Datetime);
    EXPECT_EQ(Value::array().type(), Type::Array);
    EXPECT_EQ(Value::table().type(), Type::Table);
}

// Pointers must not slip in as Boolean through pointer-to-bool
static_assert(!std::is_constructible<Value, const Value*>::value,
              "a resolved pointer is not a value");
static_assert(!std::is_constructible<Value, Value*>::value,
              "a resolved pointer is not a value");
static_assert(!std::is_convertible<const int*, Value>::value,
              "pointers do not convert to Value");
static_assert(!std::is_constructible<Value, std::nullptr_t>::value,
              "nullptr is not a value");

TEST(ValueTest, EveryIntegerTypeIsInteger) {
    EXPECT_EQ(Value(static_cast<long long>(5)), Value(5));
    EXPECT_EQ(Value(5u), Value(5));
    EXPECT_EQ(Value(std::size_t{5}), Value(5));
    EXPECT_EQ(Value(static_cast<short>(-5)), Value(-5));
    EXPECT_EQ(Value(static_cast<std::uint8_t>(200)).type(), Type::Integer);
}

TEST(ValueTest, OnlyBoolIsBoolean) {
    EXPECT_EQ(Value(false).type(), Type::Boolean);
    EXPECT_EQ(Value(0).type(), Type::Integer);
    EXPECT_EQ(Value(0.0f).type(), Type::Float);
}

TEST(ValueTest, AccessorsReturnNullOnOtherTag) {
    Value v(42);
    ASSERT_NE(v.as_integer(), nullptr);
    EXPECT_EQ(*v.as_integer(), 42);
    EXPECT_EQ(v.as_string(), nullptr);
    EXPECT_EQ(v.as_table(), nullptr);
    EXPECT_FALSE(v.is_container());
}

TEST(ValueTest, ContainersMutateInPlace) {
    Value doc;
    doc.as_table()->emplace("list", Array{1, 2});
    (*doc.as_table())["list"].as_array()->push_back(3);

    const Array& list = *(*doc.as_table())["list"].as_array();
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[2], Value(3));
}

TEST(ValueTest, EqualityComparesTagAndContent) {
    EXPECT_EQ(Value(1), Value(1));
    EXPECT_NE(Value(1), Value(1.0));
    EXPECT_NE(Value("1"), Value(1));
    EXPECT_EQ(Value(Table{{"a", 1}}), Value(Table{{"a", 1}}));
    EXPECT_NE(Value(Table{{"a", 1}}), Value(Table{{"a", 2}}));
}

TEST(ValueTest, TypeNames) {
    EXPECT_STREQ(type_name(Type::String), "String");
    EXPECT_STREQ(type_name(Type::Integer), "Integer");
    EXPECT_STREQ(type_name(Type::Float), "Float");
    EXPECT_STREQ(type_name(Type::Boolean), "Boolean");
    EXPECT_STREQ(type_name(Type::Datetime), "Datetime");
    EXPECT_STREQ(type_name(Type::Array), "Array");
    EXPECT_STREQ(type_name(Type::Table), "Table");
    EXPECT_STREQ(type_name(Value::array()), "Array");
}
