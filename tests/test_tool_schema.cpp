//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_tool_schema.cpp
// Purpose: Tests for tool schema translation, argument validation and normalization
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "mcpgw/validation/ToolSchema.h"

using namespace mcpgw;
using mcpgw::validation::ToolSchema;
using mcpgw::validation::ValidationMode;

namespace {

const char* kForecastSchema = R"({
    "type": "object",
    "properties": {
        "location": {"type": "string", "description": "City and state"},
        "days": {"type": "integer", "minimum": 1, "maximum": 10, "default": 3}
    },
    "required": ["location"]
})";

ToolSchema forecast(ValidationMode mode = ValidationMode::Lenient) {
    return ToolSchema::Translate(ParseJSON(kForecastSchema), mode);
}

bool hasViolation(const std::vector<errors::SchemaViolation>& v, const std::string& path, const std::string& needle) {
    for (const auto& item : v) {
        if (item.path == path && item.message.find(needle) != std::string::npos) return true;
    }
    return false;
}

} // namespace

TEST(ToolSchemaTest, AcceptsValidArgumentsAndFillsDefaults) {
    auto out = forecast().Validate(ParseJSON(R"({"location":"Brooklin, ME"})"));
    EXPECT_EQ(GetStringMember(out, "location").value_or(""), "Brooklin, ME");
    const JSONValue* days = FindMember(out, "days");
    ASSERT_NE(days, nullptr);
    EXPECT_EQ(std::get<int64_t>(days->value), 3);
}

TEST(ToolSchemaTest, MissingRequiredPropertyIsNamed) {
    try {
        forecast().Validate(ParseJSON(R"({"days":1})"));
        FAIL() << "expected SchemaValidationError";
    } catch (const errors::SchemaValidationError& e) {
        ASSERT_EQ(e.violations().size(), 1u);
        EXPECT_EQ(e.violations()[0].path, "$.location");
        EXPECT_NE(std::string(e.what()).find("location"), std::string::npos);
    }
}

TEST(ToolSchemaTest, ReportsEveryViolation) {
    auto violations = forecast().Check(ParseJSON(R"({"days":"two"})"));
    EXPECT_EQ(violations.size(), 2u);
    EXPECT_TRUE(hasViolation(violations, "$.location", "required property is missing"));
    EXPECT_TRUE(hasViolation(violations, "$.days", "expected integer, got string"));

    auto bounds = forecast().Check(ParseJSON(R"({"location":"x","days":11})"));
    ASSERT_EQ(bounds.size(), 1u);
    EXPECT_TRUE(hasViolation(bounds, "$.days", "must be <= 10"));
}

TEST(ToolSchemaTest, NullArgumentsTreatedAsEmptyObject) {
    auto schema = ToolSchema::Translate(ParseJSON(R"({"type":"object","properties":{"q":{"type":"string"}}})"));
    auto out = schema.Validate(JSONValue{});
    EXPECT_TRUE(out.isObject());

    EXPECT_THROW(forecast().Validate(JSONValue{}), errors::SchemaValidationError);
    EXPECT_THROW(forecast().Validate(ParseJSON("[1]")), errors::SchemaValidationError);
}

TEST(ToolSchemaTest, NormalizesNumbers) {
    auto schema = ToolSchema::Translate(ParseJSON(
        R"({"type":"object","properties":{"count":{"type":"integer"},"ratio":{"type":"number"}}})"));
    auto out = schema.Validate(ParseJSON(R"({"count":4.0,"ratio":2})"));
    EXPECT_TRUE(FindMember(out, "count")->isInteger());
    EXPECT_TRUE(std::holds_alternative<double>(FindMember(out, "ratio")->value));

    auto v = schema.Check(ParseJSON(R"({"count":4.5})"));
    ASSERT_EQ(v.size(), 1u);
    EXPECT_TRUE(hasViolation(v, "$.count", "non-integral"));
}

TEST(ToolSchemaTest, StrictModeRejectsUndeclaredProperties) {
    const auto args = ParseJSON(R"({"location":"Paris","units":"metric"})");
    auto lenient = forecast(ValidationMode::Lenient).Validate(args);
    EXPECT_EQ(GetStringMember(lenient, "units").value_or(""), "metric");

    auto violations = forecast(ValidationMode::Strict).Check(args);
    ASSERT_EQ(violations.size(), 1u);
    EXPECT_EQ(violations[0].path, "$.units");
}

TEST(ToolSchemaTest, AdditionalPropertiesKeyword) {
    auto closed = ToolSchema::Translate(ParseJSON(
        R"({"type":"object","properties":{"a":{"type":"string"}},"additionalProperties":false})"));
    EXPECT_TRUE(hasViolation(closed.Check(ParseJSON(R"({"a":"x","b":1})")), "$.b", "unexpected property"));

    auto typed = ToolSchema::Translate(ParseJSON(
        R"({"type":"object","additionalProperties":{"type":"integer"}})"));
    EXPECT_TRUE(typed.Check(ParseJSON(R"({"x":1,"y":2})")).empty());
    EXPECT_TRUE(hasViolation(typed.Check(ParseJSON(R"({"x":"1"})")), "$.x", "expected integer"));
}

TEST(ToolSchemaTest, UnionReportsEachAlternative) {
    auto schema = ToolSchema::Translate(ParseJSON(R"({
        "type":"object",
        "properties":{"target":{"anyOf":[{"type":"string","minLength":3},{"type":"integer","minimum":0}]}}
    })"));
    EXPECT_TRUE(schema.Check(ParseJSON(R"({"target":"abc"})")).empty());
    EXPECT_TRUE(schema.Check(ParseJSON(R"({"target":7})")).empty());

    auto v = schema.Check(ParseJSON(R"({"target":-1})"));
    ASSERT_EQ(v.size(), 1u);
    EXPECT_EQ(v[0].path, "$.target");
    EXPECT_NE(v[0].message.find("matched none of 2 alternatives"), std::string::npos);
    EXPECT_NE(v[0].message.find("#1 (string): expected string, got integer"), std::string::npos);
    EXPECT_NE(v[0].message.find("#2 (integer): must be >= 0"), std::string::npos);
}

TEST(ToolSchemaTest, TypeArrayAndOneOfFirstMatchWins) {
    auto schema = ToolSchema::Translate(ParseJSON(R"({
        "type":"object",
        "properties":{
            "id":{"type":["string","null"]},
            "n":{"oneOf":[{"type":"number"},{"type":"integer"}]}
        }
    })"));
    EXPECT_TRUE(schema.Check(ParseJSON(R"({"id":null})")).empty());
    EXPECT_FALSE(schema.Check(ParseJSON(R"({"id":3})")).empty());

    // Overlapping alternatives are accepted; the first declared one normalizes
    auto out = schema.Validate(ParseJSON(R"({"n":5})"));
    EXPECT_TRUE(std::holds_alternative<double>(FindMember(out, "n")->value));
}

TEST(ToolSchemaTest, EnumConstAndArrays) {
    auto schema = ToolSchema::Translate(ParseJSON(R"({
        "type":"object",
        "properties":{
            "unit":{"type":"string","enum":["C","F"]},
            "mode":{"const":"fast"},
            "tags":{"type":"array","items":{"type":"string"},"minItems":1,"maxItems":2}
        }
    })"));
    EXPECT_TRUE(schema.Check(ParseJSON(R"({"unit":"F","mode":"fast","tags":["a"]})")).empty());

    auto v = schema.Check(ParseJSON(R"({"unit":"K","mode":"slow","tags":["a",2,"c"]})"));
    EXPECT_TRUE(hasViolation(v, "$.unit", "is not one of [\"C\", \"F\"]"));
    EXPECT_TRUE(hasViolation(v, "$.mode", "is not one of"));
    EXPECT_TRUE(hasViolation(v, "$.tags", "more than maxItems 2"));
    EXPECT_TRUE(hasViolation(v, "$.tags[1]", "expected string, got integer"));
}

TEST(ToolSchemaTest, NestedObjectPaths) {
    auto schema = ToolSchema::Translate(ParseJSON(R"({
        "type":"object",
        "properties":{"filter":{"type":"object","properties":{"limit":{"type":"integer"}},"required":["limit"]}}
    })"));
    auto v = schema.Check(ParseJSON(R"({"filter":{}})"));
    ASSERT_EQ(v.size(), 1u);
    EXPECT_EQ(v[0].path, "$.filter.limit");
}

TEST(ToolSchemaTest, NonObjectRootAcceptsAnyArgumentObject) {
    auto schema = ToolSchema::Translate(ParseJSON(R"({"type":"string"})"));
    EXPECT_TRUE(schema.Check(ParseJSON(R"({"anything":1})")).empty());

    auto absent = ToolSchema::Translate(JSONValue{});
    EXPECT_TRUE(absent.Check(ParseJSON(R"({"x":true})")).empty());
}

TEST(ToolSchemaTest, RootOneOfKeepsObjectConstraints) {
    auto schema = ToolSchema::Translate(ParseJSON(R"({
        "type": "object",
        "properties": {"a": {"type": "string"}},
        "required": ["a"],
        "oneOf": [{"required": ["a"]}]
    })"));
    EXPECT_TRUE(hasViolation(schema.Check(ParseJSON(R"({"a":5})")), "$.a", "expected string"));
    EXPECT_TRUE(hasViolation(schema.Check(ParseJSON("{}")), "$.a", "required property is missing"));
    EXPECT_TRUE(schema.Check(ParseJSON(R"({"a":"x"})")).empty());

    auto d = schema.Describe();
    EXPECT_EQ(GetStringMember(d, "type").value_or(""), "object");
    const JSONValue* props = FindMember(d, "properties");
    ASSERT_NE(props, nullptr);
    EXPECT_NE(FindMember(*props, "a"), nullptr);
    EXPECT_TRUE(JSONEquals(*FindMember(d, "required"), ParseJSON(R"(["a"])")));
    EXPECT_NE(FindMember(d, "allOf"), nullptr);
    EXPECT_EQ(schema.RequiredProperties(), std::vector<std::string>{"a"});
}

TEST(ToolSchemaTest, RootAnyOfRequiresOneAlternative) {
    auto schema = ToolSchema::Translate(ParseJSON(R"({
        "type": "object",
        "properties": {"a": {"type": "string"}, "b": {"type": "integer"}},
        "anyOf": [{"required": ["a"]}, {"required": ["b"]}]
    })"));
    auto v = schema.Check(ParseJSON("{}"));
    ASSERT_EQ(v.size(), 1u);
    EXPECT_EQ(v[0].path, "$");
    EXPECT_NE(v[0].message.find("none of 2 alternatives"), std::string::npos);
    EXPECT_TRUE(schema.Check(ParseJSON(R"({"b":2})")).empty());

    // Property-less fragments inside the alternatives do not trip strict validation
    auto strict = ToolSchema::Translate(ParseJSON(R"({
        "type": "object",
        "properties": {"a": {"type": "string"}, "b": {"type": "integer"}},
        "anyOf": [{"required": ["a"]}, {"required": ["b"]}]
    })"), ValidationMode::Strict);
    EXPECT_TRUE(strict.Check(ParseJSON(R"({"a":"x"})")).empty());
    EXPECT_TRUE(hasViolation(strict.Check(ParseJSON(R"({"a":"x","c":1})")), "$.c", "strict"));

    auto bare = ToolSchema::Translate(ParseJSON(R"({"anyOf":[{"required":["a"]},{"required":["b"]}]})"));
    EXPECT_FALSE(bare.Check(ParseJSON("{}")).empty());
    EXPECT_TRUE(bare.Check(ParseJSON(R"({"a":1})")).empty());
}

TEST(ToolSchemaTest, RootAllOfIsEnforced) {
    auto schema = ToolSchema::Translate(ParseJSON(R"({
        "allOf": [{"type": "object", "properties": {"x": {"type": "integer"}}, "required": ["x"]}]
    })"));
    EXPECT_TRUE(hasViolation(schema.Check(ParseJSON("{}")), "$.x", "required property is missing"));
    EXPECT_TRUE(hasViolation(schema.Check(ParseJSON(R"({"x":"1"})")), "$.x", "expected integer"));
    auto normalized = schema.Validate(ParseJSON(R"({"x":2.0,"y":true})"));
    EXPECT_TRUE(JSONEquals(normalized, ParseJSON(R"({"x":2,"y":true})")));

    // A conjunction that can never match an object falls back to accepting any argument object
    auto primitive = ToolSchema::Translate(ParseJSON(R"({"allOf":[{"type":"string"}]})"));
    EXPECT_TRUE(primitive.Check(ParseJSON(R"({"z":1})")).empty());
}

TEST(ToolSchemaTest, MalformedKeywordsAreRejected) {
    EXPECT_THROW(ToolSchema::Translate(ParseJSON(R"({"type":"object","properties":5})")), errors::ProtocolError);
    EXPECT_THROW(ToolSchema::Translate(ParseJSON(R"({"type":"object","required":"location"})")), errors::ProtocolError);
    EXPECT_THROW(ToolSchema::Translate(ParseJSON(R"({"type":7})")), errors::ProtocolError);
    EXPECT_THROW(ToolSchema::Translate(ParseJSON(R"({"anyOf":[]})")), errors::ProtocolError);
    EXPECT_THROW(ToolSchema::Translate(ParseJSON(R"({"type":"object","properties":{"n":{"minimum":"low"}}})")),
                 errors::ProtocolError);
}

TEST(ToolSchemaTest, DescribeProducesNormalizedShape) {
    auto d = forecast().Describe();
    EXPECT_EQ(GetStringMember(d, "type").value_or(""), "object");
    const JSONValue* props = FindMember(d, "properties");
    ASSERT_NE(props, nullptr);
    const JSONValue* days = FindMember(*props, "days");
    ASSERT_NE(days, nullptr);
    EXPECT_EQ(GetStringMember(*days, "type").value_or(""), "integer");
    EXPECT_TRUE(JSONEquals(*FindMember(*days, "maximum"), ParseJSON("10")));
    EXPECT_TRUE(JSONEquals(*FindMember(d, "required"), ParseJSON(R"(["location"])")));
    EXPECT_EQ(forecast().RequiredProperties(), std::vector<std::string>{"location"});
}
