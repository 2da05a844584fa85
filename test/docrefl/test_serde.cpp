#include <gtest/gtest.h>

#include <docrefl/utils/serde.hpp>

using dr::serde::Value;

TEST(Serde, JsonIntegersKeepTheirWidth) {
    auto value = Value::from_json(R"({"small": 42, "big": 5000000000, "negative": -7})");
    ASSERT_TRUE(value.is_table());
    EXPECT_EQ(value.try_at("small")->type(), Value::Type::int32);
    EXPECT_EQ(value.try_at("big")->type(), Value::Type::int64);
    EXPECT_EQ(value.try_at("negative")->get_ref<Value::Int32>(), -7);
    EXPECT_EQ(value.try_at("big")->as_integer(), 5000000000LL);
}

TEST(Serde, JsonScalarsAndContainers) {
    auto value = Value::from_json(R"({"f": 1.5, "b": true, "s": "x", "n": null, "a": [1, "two"], "t": {"k": 1}})");
    EXPECT_TRUE(value.try_at("f")->is_float());
    EXPECT_TRUE(value.try_at("b")->is_bool());
    EXPECT_TRUE(value.try_at("s")->is_string());
    EXPECT_TRUE(value.try_at("n")->is_null());
    EXPECT_EQ(value.try_at("a")->size(), 2u);
    EXPECT_TRUE(value.try_at("t")->contains("k"));
    EXPECT_FALSE(value.contains("missing"));
    EXPECT_EQ(value.try_at("missing"), nullptr);
}

TEST(Serde, TypeNames) {
    EXPECT_EQ(Value{}.type_name(), "null");
    EXPECT_EQ(Value{true}.type_name(), "bool");
    EXPECT_EQ(Value{int32_t{1}}.type_name(), "int32");
    EXPECT_EQ(Value{int64_t{1}}.type_name(), "int64");
    EXPECT_EQ(Value{1.0}.type_name(), "double");
    EXPECT_EQ(Value{"text"}.type_name(), "string");
    EXPECT_EQ(Value{Value::Array{}}.type_name(), "array");
    EXPECT_EQ(Value{Value::Table{}}.type_name(), "document");
}

TEST(Serde, StringLiteralIsAString) {
    Value value{"NY"};
    ASSERT_TRUE(value.is_string());
    EXPECT_EQ(value.get_ref<Value::String>(), "NY");
}

TEST(Serde, IndexingBuildsTables) {
    Value value{};
    value["a"]["b"] = int32_t{1};
    value["c"] = "x";
    EXPECT_EQ(value.to_json(), R"({"a":{"b":1},"c":"x"})");
}

TEST(Serde, JsonRoundTrip) {
    auto text = R"({"list":[1,2,3],"name":"n","nested":{"flag":false}})";
    auto value = Value::from_json(text);
    EXPECT_EQ(Value::from_json(value.to_json()), value);
}

TEST(Serde, TomlTables) {
    auto value = Value::from_toml(R"(
title = "example"
count = 3

[renames]
"Address.city" = "c"
)");
    EXPECT_EQ(value.try_at("title")->get_ref<Value::String>(), "example");
    EXPECT_EQ(value.try_at("count")->type(), Value::Type::int32);
    auto renames = value.try_at("renames");
    ASSERT_NE(renames, nullptr);
    EXPECT_EQ(renames->try_at("Address.city")->get_ref<Value::String>(), "c");
}

TEST(Serde, MalformedInputThrows) {
    EXPECT_THROW(Value::from_json("{\"a\": "), dr::serde::ParseError);
    EXPECT_THROW(Value::from_toml("a = = 1"), dr::serde::ParseError);
    EXPECT_THROW(Value::from_json("18446744073709551615"), dr::serde::ParseError);
}
