#include "schema/schema.hpp"

#include "record/value.hpp"

#include <string>
#include <variant>

#include <gtest/gtest.h>

namespace sdb::schema {

namespace {

SchemaDef must_define(const std::string& fields, const SchemaPolicy& policy = {}) {
    auto result = define_schema("User", fields, policy);
    EXPECT_TRUE(std::holds_alternative<SchemaDef>(result));
    return std::holds_alternative<SchemaDef>(result) ? std::get<SchemaDef>(result) : SchemaDef{};
}

record::Value must_parse(const std::string& json) {
    auto v = record::parse(json);
    EXPECT_TRUE(v.has_value()) << json;
    return v.value_or(record::Value{});
}

} // namespace

// ── parse_field_type ──────────────────────────────────────────────────────────

TEST(FieldTypes, Spellings) {
    EXPECT_EQ(parse_field_type("string"),  FieldType::String);
    EXPECT_EQ(parse_field_type("int"),     FieldType::Integer);
    EXPECT_EQ(parse_field_type("integer"), FieldType::Integer);
    EXPECT_EQ(parse_field_type("float"),   FieldType::Float);
    EXPECT_EQ(parse_field_type("double"),  FieldType::Float);
    EXPECT_EQ(parse_field_type("bool"),    FieldType::Boolean);
    EXPECT_EQ(parse_field_type("boolean"), FieldType::Boolean);
    EXPECT_EQ(parse_field_type("object"),  FieldType::Object);
    EXPECT_EQ(parse_field_type("json"),    FieldType::Object);
    EXPECT_EQ(parse_field_type("uuid"),    FieldType::Unknown);
    EXPECT_EQ(parse_field_type("String"),  FieldType::Unknown);
}

// ── define_schema ─────────────────────────────────────────────────────────────

TEST(DefineSchema, ParsesTokensInOrder) {
    auto def = must_define("name:string  age:int\temail:string");
    EXPECT_EQ(def.name, "User");
    EXPECT_EQ(def.definition, "name:string  age:int\temail:string");
    ASSERT_EQ(def.fields.size(), 3u);
    EXPECT_EQ(def.fields[0].name, "name");
    EXPECT_EQ(def.fields[1].name, "age");
    EXPECT_EQ(def.fields[1].type_name, "int");
    EXPECT_EQ(def.fields[1].type, FieldType::Integer);
    EXPECT_EQ(def.fields[2].name, "email");
}

TEST(DefineSchema, EmptyDefinitionHasNoFields) {
    auto def = must_define("   ");
    EXPECT_TRUE(def.fields.empty());
}

TEST(DefineSchema, PermissivePolicySkipsMalformedTokens) {
    auto def = must_define("name:string broken age:int a:b:c :int");
    ASSERT_EQ(def.fields.size(), 2u);
    EXPECT_EQ(def.fields[0].name, "name");
    EXPECT_EQ(def.fields[1].name, "age");
}

TEST(DefineSchema, StrictPolicyRejectsMalformedToken) {
    auto result = define_schema("User", "name:string broken", SchemaPolicy::strict());
    ASSERT_TRUE(std::holds_alternative<Error>(result));
    EXPECT_EQ(std::get<Error>(result).kind, ErrorKind::InvalidInput);
    EXPECT_NE(std::get<Error>(result).message.find("broken"), std::string::npos);
}

TEST(DefineSchema, RepeatedFieldReplacesType) {
    auto def = must_define("age:string name:string age:int");
    ASSERT_EQ(def.fields.size(), 2u);
    EXPECT_EQ(def.fields[0].name, "age");
    EXPECT_EQ(def.fields[0].type, FieldType::Integer);
    ASSERT_NE(def.find("name"), nullptr);
    EXPECT_EQ(def.find("missing"), nullptr);
}

// ── validate ──────────────────────────────────────────────────────────────────

class ValidateTest : public ::testing::Test {
protected:
    SchemaDef user_ = must_define("name:string age:int score:float admin:bool meta:object");
};

TEST_F(ValidateTest, MatchingRecordPasses) {
    auto rec = must_parse(R"({"name":"Alice","age":30,"score":9.5,"admin":true,"meta":[1]})");
    EXPECT_FALSE(validate(user_, rec).has_value());
}

TEST_F(ValidateTest, MissingFieldsAreAccepted) {
    EXPECT_FALSE(validate(user_, must_parse(R"({"name":"Bob"})")).has_value());
    EXPECT_FALSE(validate(user_, must_parse("{}")).has_value());
}

TEST_F(ValidateTest, ExtraFieldsAreAccepted) {
    EXPECT_FALSE(validate(user_, must_parse(R"({"nickname":7})")).has_value());
}

TEST_F(ValidateTest, StringMismatch) {
    auto err = validate(user_, must_parse(R"({"name":42})"));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->field, "name");
    EXPECT_EQ(err->expected_type, "string");
    EXPECT_EQ(err->actual_value, "42");
}

TEST_F(ValidateTest, IntegerAcceptsWholeFloat) {
    EXPECT_FALSE(validate(user_, must_parse(R"({"age":30.0})")).has_value());
}

TEST_F(ValidateTest, IntegerRejectsFraction) {
    auto err = validate(user_, must_parse(R"({"age":30.5})"));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->field, "age");
    EXPECT_EQ(err->expected_type, "int");
}

TEST_F(ValidateTest, IntegerRejectsString) {
    EXPECT_TRUE(validate(user_, must_parse(R"({"age":"30"})")).has_value());
}

TEST_F(ValidateTest, FloatAcceptsAnyNumber) {
    EXPECT_FALSE(validate(user_, must_parse(R"({"score":3})")).has_value());
    EXPECT_FALSE(validate(user_, must_parse(R"({"score":-0.25})")).has_value());
    EXPECT_TRUE(validate(user_, must_parse(R"({"score":"high"})")).has_value());
}

TEST_F(ValidateTest, BooleanRequiresTrueOrFalse) {
    EXPECT_FALSE(validate(user_, must_parse(R"({"admin":false})")).has_value());
    EXPECT_TRUE(validate(user_, must_parse(R"({"admin":1})")).has_value());
    EXPECT_TRUE(validate(user_, must_parse(R"({"admin":"true"})")).has_value());
}

TEST_F(ValidateTest, NullDoesNotSatisfyTypedField) {
    EXPECT_TRUE(validate(user_, must_parse(R"({"name":null})")).has_value());
    EXPECT_FALSE(validate(user_, must_parse(R"({"meta":null})")).has_value());
}

TEST_F(ValidateTest, ReportsFirstMismatchInSchemaOrder) {
    auto err = validate(user_, must_parse(R"({"admin":"no","name":1})"));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->field, "name");
    EXPECT_NE(err->message().find("name"), std::string::npos);
}

TEST(ValidatePolicy, UnknownTypeAcceptedByDefault) {
    auto def = must_define("id:uuid");
    EXPECT_FALSE(validate(def, must_parse(R"({"id":123})")).has_value());
}

TEST(ValidatePolicy, UnknownTypeRejectedWhenStrict) {
    auto def = must_define("id:uuid", SchemaPolicy::strict());
    auto err = validate(def, must_parse(R"({"id":123})"), SchemaPolicy::strict());
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->expected_type, "uuid");
}

} // namespace sdb::schema
