//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures, constants and the tool-related message codecs
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <string>
#include <vector>
#include <optional>

namespace mcpgw {
//==========================================================================================================
// MCP Protocol types and constants
// Purpose: Structures, header names and method names for the streamable-HTTP tool client.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Protocol version offered in the handshake
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

// Versions accepted back from a gateway during negotiation
bool IsSupportedProtocolVersion(const std::string& version);

namespace Headers {
    constexpr const char* SessionId = "Mcp-Session-Id";
    constexpr const char* ProtocolVersion = "MCP-Protocol-Version";
}

///////////////////////////////////////// Implementation ///////////////////////////////////////////
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
// One callable capability published by the gateway.
struct ToolDescriptor {
    std::string name;
    std::string description;
    JSONValue inputSchema;          // JSON Schema for tool parameters
    std::optional<std::string> title;

    ToolDescriptor() = default;
    ToolDescriptor(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)), inputSchema(std::move(inputSchema)) {}
};

struct ToolsListPage {
    std::vector<ToolDescriptor> tools;
    std::optional<std::string> nextCursor;
};

// Normalized tools/call outcome. text is the single text-bearing result; raw keeps the original result.
struct ToolCallOutput {
    std::string text;
    JSONValue raw;
    bool isError{false};
};

struct InitializeResult {
    std::string protocolVersion;
    JSONValue capabilities;
    Implementation serverInfo;
    std::optional<std::string> instructions;
};

///////////////////////////////////////// Codecs ///////////////////////////////////////////
// Params for "initialize": {protocolVersion, capabilities:{}, clientInfo:{name, version}}
JSONValue BuildInitializeParams(const Implementation& clientInfo);

// Validates and decodes an initialize result. Throws errors::ProtocolError on missing/invalid fields.
InitializeResult ParseInitializeResult(const JSONValue& result);

// Params for "tools/list" (cursor omitted on the first page)
std::optional<JSONValue> BuildListToolsParams(const std::optional<std::string>& cursor);

// Decodes one tools/list page. Throws errors::ProtocolError when "tools" is missing or not an array.
ToolsListPage ParseToolsListResult(const JSONValue& result);

// Params for "tools/call": {name, arguments}
JSONValue BuildCallToolParams(const std::string& name, const JSONValue& arguments);

///////////////////////////////////////// Methods ///////////////////////////////////////////
namespace Methods {
    // Client to gateway
    constexpr const char* Initialize = "initialize";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* ToolListChanged = "notifications/tools/list_changed";
    constexpr const char* Log = "notifications/message";
}

} // namespace mcpgw
