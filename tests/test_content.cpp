//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_content.cpp
// Purpose: Tests for content helpers and tools/call result normalization
//==========================================================================================================

#include <gtest/gtest.h>

#include "mcpgw/typed/Content.h"

using namespace mcpgw;

TEST(ContentNormalize, JoinsTextBlocksWithNewline) {
    auto result = ParseJSON(R"({"content":[{"type":"text","text":"Sunny"},{"type":"image","data":"AAA","mimeType":"image/png"},{"type":"text","text":"High 71F"}]})");
    auto out = typed::NormalizeCallToolResult(result);
    EXPECT_EQ(out.text, "Sunny\nHigh 71F");
    EXPECT_FALSE(out.isError);
    EXPECT_TRUE(JSONEquals(out.raw, result));
}

TEST(ContentNormalize, IncludesEmbeddedResourceText) {
    auto result = ParseJSON(R"({"content":[{"type":"resource","resource":{"uri":"file:///a.txt","text":"file body"}}]})");
    EXPECT_EQ(typed::NormalizeCallToolResult(result).text, "file body");
}

TEST(ContentNormalize, FallsBackToStructuredContent) {
    auto result = ParseJSON(R"({"content":[],"structuredContent":{"temp":71,"unit":"F"}})");
    EXPECT_EQ(typed::NormalizeCallToolResult(result).text, R"({"temp":71,"unit":"F"})");
}

TEST(ContentNormalize, FallsBackToWholeResult) {
    auto result = ParseJSON(R"({"content":[{"type":"image","data":"AAA"}]})");
    EXPECT_EQ(typed::NormalizeCallToolResult(result).text, SerializeJSON(result));
}

TEST(ContentNormalize, CarriesIsErrorFlag) {
    auto result = ParseJSON(R"({"content":[{"type":"text","text":"quota exceeded"}],"isError":true})");
    auto out = typed::NormalizeCallToolResult(result);
    EXPECT_TRUE(out.isError);
    EXPECT_EQ(out.text, "quota exceeded");
}

TEST(ContentBuilders, MakeTextRoundTripsThroughInspectors) {
    auto block = typed::makeText("hello");
    EXPECT_TRUE(typed::isText(block));
    ASSERT_TRUE(typed::getText(block).has_value());
    EXPECT_EQ(*typed::getText(block), "hello");
    EXPECT_FALSE(typed::getResourceText(block).has_value());
}
