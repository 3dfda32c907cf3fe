//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Content.h
// Purpose: Helpers for constructing content blocks and normalizing tools/call results into text
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "mcpgw/Protocol.h"

namespace mcpgw {
namespace typed {

//------------------------------ Builders ------------------------------
inline JSONValue makeText(const std::string& text) {
    JSONValue::Object obj;
    obj["type"] = std::make_shared<JSONValue>(std::string("text"));
    obj["text"] = std::make_shared<JSONValue>(text);
    return JSONValue{obj};
}

//------------------------------ Inspectors ------------------------------
inline bool isType(const JSONValue& v, const char* type) {
    auto t = GetStringMember(v, "type");
    return t.has_value() && *t == type;
}

inline bool isText(const JSONValue& v) {
    return isType(v, "text");
}

inline std::optional<std::string> getText(const JSONValue& v) {
    if (!isText(v)) return std::nullopt;
    return GetStringMember(v, "text");
}

// Embedded resources contribute their text payload, if any: {type:"resource", resource:{uri, text}}
inline std::optional<std::string> getResourceText(const JSONValue& v) {
    if (!isType(v, "resource")) return std::nullopt;
    const JSONValue* res = FindMember(v, "resource");
    if (res == nullptr) return std::nullopt;
    return GetStringMember(*res, "text");
}

inline std::vector<std::string> collectText(const JSONValue::Array& arr) {
    std::vector<std::string> out;
    out.reserve(arr.size());
    for (const auto& v : arr) {
        if (!v) continue;
        auto t = getText(*v);
        if (!t.has_value()) t = getResourceText(*v);
        if (t.has_value()) out.push_back(t.value());
    }
    return out;
}

//==========================================================================================================
// NormalizeCallToolResult
// Purpose: Collapses a tools/call result into a single text-bearing value.
// Args:
//   result: The JSON-RPC "result" of tools/call.
// Returns:
//   ToolCallOutput. text is the "\n"-joined text blocks; when none exist, the serialized
//   structuredContent, otherwise the serialized result. isError mirrors the result flag.
//==========================================================================================================
inline ToolCallOutput NormalizeCallToolResult(const JSONValue& result) {
    ToolCallOutput out;
    out.raw = result;
    if (const JSONValue* flag = FindMember(result, "isError"); flag != nullptr && flag->isBool()) {
        out.isError = std::get<bool>(flag->value);
    }
    std::vector<std::string> texts;
    if (const JSONValue* content = FindMember(result, "content"); content != nullptr && content->isArray()) {
        texts = collectText(std::get<JSONValue::Array>(content->value));
    }
    if (!texts.empty()) {
        for (std::size_t i = 0; i < texts.size(); ++i) {
            if (i > 0) out.text += "\n";
            out.text += texts[i];
        }
        return out;
    }
    if (const JSONValue* structured = FindMember(result, "structuredContent"); structured != nullptr && !structured->isNull()) {
        out.text = SerializeJSON(*structured);
        return out;
    }
    out.text = SerializeJSON(result);
    return out;
}

} // namespace typed
} // namespace mcpgw
