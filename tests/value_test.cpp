#include "record/value.hpp"

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

namespace sdb::record {

// ── parse() ───────────────────────────────────────────────────────────────────

TEST(ValueParse, ObjectWithScalarFields) {
    auto v = parse(R"({"name":"Alice","age":30,"score":4.5,"admin":false,"note":null})");
    ASSERT_TRUE(v.has_value());
    ASSERT_TRUE(v->is_object());

    const auto& fields = *v->get_if<Object>();
    ASSERT_EQ(fields.size(), 5u);
    EXPECT_EQ(fields.at("name").type(),  ValueType::String);
    EXPECT_EQ(fields.at("age").type(),   ValueType::Integer);
    EXPECT_EQ(fields.at("score").type(), ValueType::Float);
    EXPECT_EQ(fields.at("admin").type(), ValueType::Boolean);
    EXPECT_EQ(fields.at("note").type(),  ValueType::Null);
    EXPECT_EQ(*fields.at("age").get_if<int64_t>(), 30);
}

TEST(ValueParse, WholeFloatStaysFloat) {
    auto v = parse("30.0");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->type(), ValueType::Float);
}

TEST(ValueParse, NegativeIntegerIsInteger) {
    auto v = parse("-12");
    ASSERT_TRUE(v.has_value());
    ASSERT_EQ(v->type(), ValueType::Integer);
    EXPECT_EQ(*v->get_if<int64_t>(), -12);
}

TEST(ValueParse, HugeUnsignedDegradesToFloat) {
    auto v = parse("18446744073709551615");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->type(), ValueType::Float);
}

TEST(ValueParse, NestedStructures) {
    auto v = parse(R"({"tags":["a",1,true],"address":{"city":"Oslo"}})");
    ASSERT_TRUE(v.has_value());
    const auto& fields = *v->get_if<Object>();

    const auto* tags = fields.at("tags").get_if<Array>();
    ASSERT_NE(tags, nullptr);
    ASSERT_EQ(tags->size(), 3u);
    EXPECT_EQ((*tags)[0], Value("a"));
    EXPECT_EQ((*tags)[1], Value(1));
    EXPECT_EQ((*tags)[2], Value(true));

    const auto* address = fields.at("address").get_if<Object>();
    ASSERT_NE(address, nullptr);
    EXPECT_EQ(address->at("city"), Value("Oslo"));
}

TEST(ValueParse, MalformedTextReturnsNullopt) {
    EXPECT_FALSE(parse("{\"name\":").has_value());
    EXPECT_FALSE(parse("not json").has_value());
    EXPECT_FALSE(parse("").has_value());
}

namespace {

std::string nested_arrays(std::size_t depth) {
    return std::string(depth, '[') + std::string(depth, ']');
}

} // namespace

TEST(ValueParse, ModerateNestingIsAccepted) {
    auto v = parse(R"({"a":)" + nested_arrays(kMaxNestingDepth / 2) + "}");
    ASSERT_TRUE(v.has_value());
    EXPECT_TRUE(v->is_object());
}

TEST(ValueParse, ExcessiveNestingIsRejected) {
    EXPECT_FALSE(parse(nested_arrays(kMaxNestingDepth * 2)).has_value());
    EXPECT_FALSE(parse(R"({"a":)" + nested_arrays(100000) + "}").has_value());
}

// ── dump() ────────────────────────────────────────────────────────────────────

TEST(ValueDump, ObjectFieldsAreLexicographic) {
    Object o;
    o.emplace("zeta", Value(1));
    o.emplace("alpha", Value("x"));
    EXPECT_EQ(dump(Value(o)), R"({"alpha":"x","zeta":1})");
}

TEST(ValueDump, Scalars) {
    EXPECT_EQ(dump(Value(42)), "42");
    EXPECT_EQ(dump(Value(true)), "true");
    EXPECT_EQ(dump(Value(nullptr)), "null");
    EXPECT_EQ(dump(Value("hi")), "\"hi\"");
    EXPECT_EQ(dump(Value(1.5)), "1.5");
}

TEST(ValueDump, ParsedTextReproducesValue) {
    const std::string text = R"({"a":[1,2,{"b":null}],"c":"d"})";
    auto v = parse(text);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(dump(*v), text);
}

// ── nlohmann::json interop ────────────────────────────────────────────────────

TEST(ValueJson, AdlConversions) {
    nlohmann::json j = Value(Object{{"k", Value(Array{Value(1), Value("two")})}});
    EXPECT_TRUE(j.is_object());
    EXPECT_EQ(j["k"][1], "two");

    auto back = j.get<Value>();
    EXPECT_EQ(back, Value(Object{{"k", Value(Array{Value(1), Value("two")})}}));
}

TEST(ValueType, Names) {
    EXPECT_EQ(type_name(ValueType::Integer), "integer");
    EXPECT_EQ(type_name(ValueType::Object), "object");
    EXPECT_EQ(type_name(Value().type()), "null");
}

} // namespace sdb::record
