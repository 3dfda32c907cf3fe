//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Codecs for the initialize handshake and the tools/list and tools/call messages
//==========================================================================================================

#include <array>
#include <cstring>

#include "mcpgw/Protocol.h"
#include "mcpgw/errors/Errors.h"
#include "logging/Logger.h"

namespace mcpgw {

namespace {
constexpr std::array<const char*, 3> kSupportedVersions = {"2025-06-18", "2025-03-26", "2024-11-05"};

std::shared_ptr<JSONValue> str(const std::string& s) {
    return std::make_shared<JSONValue>(s);
}
} // namespace

bool IsSupportedProtocolVersion(const std::string& version) {
    for (const char* v : kSupportedVersions) {
        if (version == v) return true;
    }
    return false;
}

JSONValue BuildInitializeParams(const Implementation& clientInfo) {
    JSONValue::Object info;
    info["name"] = str(clientInfo.name);
    info["version"] = str(clientInfo.version);

    JSONValue::Object params;
    params["protocolVersion"] = str(PROTOCOL_VERSION);
    params["capabilities"] = std::make_shared<JSONValue>(JSONValue::Object{});
    params["clientInfo"] = std::make_shared<JSONValue>(std::move(info));
    return JSONValue{std::move(params)};
}

//==========================================================================================================
// ParseInitializeResult
// Purpose: Validates the gateway's capability response.
// Args:
//   result: The "result" member of the initialize reply.
// Returns:
//   InitializeResult with negotiated version, capabilities and serverInfo (serverInfo is optional on
//   the wire; missing fields stay empty).
// Throws:
//   errors::ProtocolError for a non-object result, a missing/non-string protocolVersion, a missing or
//   non-object capabilities member, or an unsupported protocol version.
//==========================================================================================================
InitializeResult ParseInitializeResult(const JSONValue& result) {
    if (!result.isObject()) {
        throw errors::ProtocolError("initialize result is not an object", SerializeJSON(result));
    }
    InitializeResult out;
    auto version = GetStringMember(result, "protocolVersion");
    if (!version.has_value()) {
        throw errors::ProtocolError("initialize result lacks protocolVersion", SerializeJSON(result));
    }
    if (!IsSupportedProtocolVersion(*version)) {
        throw errors::ProtocolError("Unsupported protocol version: " + *version);
    }
    out.protocolVersion = *version;

    const JSONValue* caps = FindMember(result, "capabilities");
    if (caps == nullptr || !caps->isObject()) {
        throw errors::ProtocolError("initialize result lacks capabilities", SerializeJSON(result));
    }
    out.capabilities = *caps;

    if (const JSONValue* info = FindMember(result, "serverInfo")) {
        out.serverInfo.name = GetStringMember(*info, "name").value_or("");
        out.serverInfo.version = GetStringMember(*info, "version").value_or("");
    }
    out.instructions = GetStringMember(result, "instructions");
    return out;
}

std::optional<JSONValue> BuildListToolsParams(const std::optional<std::string>& cursor) {
    if (!cursor.has_value()) return std::nullopt;
    JSONValue::Object params;
    params["cursor"] = str(*cursor);
    return JSONValue{std::move(params)};
}

ToolsListPage ParseToolsListResult(const JSONValue& result) {
    const JSONValue* tools = FindMember(result, "tools");
    if (tools == nullptr || !tools->isArray()) {
        throw errors::ProtocolError("tools/list result lacks a tools array", SerializeJSON(result));
    }
    ToolsListPage page;
    for (const auto& item : std::get<JSONValue::Array>(tools->value)) {
        if (!item) continue;
        auto name = GetStringMember(*item, "name");
        if (!name.has_value() || name->empty()) {
            LOG_WARN("Skipping tool entry without a name: {}", errors::ProtocolError::Excerpt(SerializeJSON(*item)));
            continue;
        }
        ToolDescriptor td;
        td.name = *name;
        td.description = GetStringMember(*item, "description").value_or("");
        td.title = GetStringMember(*item, "title");
        if (const JSONValue* schema = FindMember(*item, "inputSchema"); schema != nullptr && !schema->isNull()) {
            td.inputSchema = *schema;
        } else {
            JSONValue::Object obj;
            obj["type"] = str("object");
            td.inputSchema = JSONValue{std::move(obj)};
        }
        page.tools.push_back(std::move(td));
    }
    auto cursor = GetStringMember(result, "nextCursor");
    if (cursor.has_value() && !cursor->empty()) {
        page.nextCursor = std::move(cursor);
    }
    return page;
}

JSONValue BuildCallToolParams(const std::string& name, const JSONValue& arguments) {
    JSONValue::Object params;
    params["name"] = str(name);
    params["arguments"] = std::make_shared<JSONValue>(arguments.isNull() ? JSONValue{JSONValue::Object{}} : arguments);
    return JSONValue{std::move(params)};
}

} // namespace mcpgw
