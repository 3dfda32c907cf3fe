//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Gateway error taxonomy, coordinator-level failure classification and JSON-RPC error mapping
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "mcpgw/JSONRPCTypes.h"

namespace mcpgw {
namespace errors {

////////////////////////////////////////// Remote error objects //////////////////////////////////////////

// Categorization of common JSON-RPC and MCP error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    McpInvalidRequestId,
    McpMethodNotAllowed,
    McpToolNotFound,
    Unknown
};

// Typed representation of a JSON-RPC error object received from the gateway.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a JSON-RPC/MCP numeric error code to an ErrorCategory.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::InvalidRequestId: return ErrorCategory::McpInvalidRequestId;
        case JSONRPCErrorCodes::MethodNotAllowed: return ErrorCategory::McpMethodNotAllowed;
        case JSONRPCErrorCodes::ToolNotFound: return ErrorCategory::McpToolNotFound;
        default: return ErrorCategory::Unknown;
    }
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    const JSONValue* codeV = FindMember(errVal, "code");
    const JSONValue* msgV = FindMember(errVal, "message");
    if (codeV == nullptr || msgV == nullptr || !codeV->isInteger() || !msgV->isString()) {
        return std::nullopt;
    }
    McpError e;
    e.code = static_cast<int>(std::get<int64_t>(codeV->value));
    e.message = std::get<std::string>(msgV->value);
    if (const JSONValue* dataV = FindMember(errVal, "data")) {
        e.data = *dataV;
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

// Extract McpError from a JSONRPCResponse if it carries an error.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

////////////////////////////////////////// Exception taxonomy //////////////////////////////////////////

enum class ErrorKind {
    Connection,
    Auth,
    Protocol,
    ToolNotFound,
    Timeout,
    RemoteTool,
    SchemaValidation,
    Cancelled,
    Internal
};

inline const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Connection: return "Connection";
        case ErrorKind::Auth: return "Auth";
        case ErrorKind::Protocol: return "Protocol";
        case ErrorKind::ToolNotFound: return "ToolNotFound";
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::RemoteTool: return "RemoteTool";
        case ErrorKind::SchemaValidation: return "SchemaValidation";
        case ErrorKind::Cancelled: return "Cancelled";
        case ErrorKind::Internal:
        default: return "Internal";
    }
}

//==========================================================================================================
// GatewayException
// Purpose: Root of every error raised by the library. kind() identifies the failure family without
//          requiring callers to dynamic_cast.
//==========================================================================================================
class GatewayException : public std::runtime_error {
public:
    GatewayException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), errKind(kind) {}

    ErrorKind kind() const noexcept { return errKind; }

private:
    ErrorKind errKind;
};

// Network, DNS or TLS failure; also handshake timeouts, 5xx replies, expired sessions and closed transports.
class ConnectionError : public GatewayException {
public:
    explicit ConnectionError(const std::string& message, bool sessionExpired = false, bool timedOut = false)
        : GatewayException(ErrorKind::Connection, message), expired(sessionExpired), timeout(timedOut) {}

    bool sessionExpired() const noexcept { return expired; }
    bool timedOut() const noexcept { return timeout; }

private:
    bool expired;
    bool timeout;
};

// Credential rejected by the gateway (HTTP 401/403).
class AuthError : public GatewayException {
public:
    AuthError(const std::string& message, int httpStatus, std::string wwwAuthenticate = {})
        : GatewayException(ErrorKind::Auth, message), status(httpStatus), challenge(std::move(wwwAuthenticate)) {}

    int httpStatus() const noexcept { return status; }
    const std::string& wwwAuthenticate() const noexcept { return challenge; }

private:
    int status;
    std::string challenge;
};

// Malformed handshake or unparsable/unexpected response frame. fragment() holds the offending text.
class ProtocolError : public GatewayException {
public:
    static constexpr std::size_t kMaxFragment = 256;

    explicit ProtocolError(const std::string& message, const std::string& offending = {})
        : GatewayException(ErrorKind::Protocol, offending.empty() ? message : message + " | fragment: " + Excerpt(offending)),
          frag(Excerpt(offending)) {}

    const std::string& fragment() const noexcept { return frag; }

    static std::string Excerpt(const std::string& text) {
        if (text.size() <= kMaxFragment) return text;
        return text.substr(0, kMaxFragment) + "...";
    }

private:
    std::string frag;
};

// Unknown or disallowed tool name.
class ToolNotFoundError : public GatewayException {
public:
    explicit ToolNotFoundError(const std::string& toolName)
        : GatewayException(ErrorKind::ToolNotFound, "Tool not found or not allowed: " + toolName), name(toolName) {}

    const std::string& toolName() const noexcept { return name; }

private:
    std::string name;
};

// A request exceeded its ceiling (catalog refresh or generic request).
class TimeoutError : public GatewayException {
public:
    TimeoutError(const std::string& operation, unsigned int timeoutMs)
        : GatewayException(ErrorKind::Timeout, operation + " timed out after " + std::to_string(timeoutMs) + " ms"),
          op(operation), ms(timeoutMs) {}

    const std::string& operation() const noexcept { return op; }
    unsigned int timeoutMs() const noexcept { return ms; }

private:
    std::string op;
    unsigned int ms;
};

// Tool execution exceeded the execution timeout.
class ToolTimeoutError : public TimeoutError {
public:
    ToolTimeoutError(const std::string& toolName, unsigned int timeoutMs)
        : TimeoutError("Tool '" + toolName + "'", timeoutMs) {}
};

// Gateway-reported tool failure: JSON-RPC error reply or a result flagged isError.
class RemoteToolError : public GatewayException {
public:
    RemoteToolError(const std::string& toolName, std::optional<int> code, std::string remoteMessage,
                    std::optional<JSONValue> data = std::nullopt)
        : GatewayException(ErrorKind::RemoteTool, describe(toolName, code, remoteMessage)),
          errCode(code), remoteMsg(std::move(remoteMessage)), errData(std::move(data)) {}

    std::optional<int> code() const noexcept { return errCode; }
    const std::string& remoteMessage() const noexcept { return remoteMsg; }
    const std::optional<JSONValue>& data() const noexcept { return errData; }
    ErrorCategory category() const noexcept {
        return errCode.has_value() ? errorCategoryFromCode(*errCode) : ErrorCategory::Unknown;
    }

private:
    static std::string describe(const std::string& toolName, std::optional<int> code, const std::string& msg) {
        std::string out = "Tool '" + toolName + "' failed";
        if (code.has_value()) out += " (code " + std::to_string(*code) + ")";
        return out + ": " + msg;
    }

    std::optional<int> errCode;
    std::string remoteMsg;
    std::optional<JSONValue> errData;
};

using ToolExecutionError = RemoteToolError;

// One violated schema constraint. path uses "$" for the root and ".name" / "[i]" for members.
struct SchemaViolation {
    std::string path;
    std::string message;
};

// Argument validation failure listing every violated constraint.
class SchemaValidationError : public GatewayException {
public:
    explicit SchemaValidationError(std::vector<SchemaViolation> violations)
        : GatewayException(ErrorKind::SchemaValidation, describe(violations)), items(std::move(violations)) {}

    const std::vector<SchemaViolation>& violations() const noexcept { return items; }

private:
    static std::string describe(const std::vector<SchemaViolation>& v) {
        std::string out = std::to_string(v.size()) + (v.size() == 1 ? " schema violation: " : " schema violations: ");
        for (std::size_t i = 0; i < v.size(); ++i) {
            if (i > 0) out += "; ";
            out += v[i].path + ": " + v[i].message;
        }
        return out;
    }

    std::vector<SchemaViolation> items;
};

// The caller's stop token fired before the operation completed.
class OperationCancelled : public GatewayException {
public:
    explicit OperationCancelled(const std::string& what = "Operation cancelled")
        : GatewayException(ErrorKind::Cancelled, what) {}
};

////////////////////////////////////////// Coordinator classification //////////////////////////////////////////

enum class FailureKind {
    Unreachable,
    AuthFailed,
    Timeout,
    RemoteError,
    NotFound,
    InvalidArguments,
    ProtocolViolation,
    Cancelled,
    Internal
};

inline const char* toString(FailureKind kind) {
    switch (kind) {
        case FailureKind::Unreachable: return "Unreachable";
        case FailureKind::AuthFailed: return "AuthFailed";
        case FailureKind::Timeout: return "Timeout";
        case FailureKind::RemoteError: return "RemoteError";
        case FailureKind::NotFound: return "NotFound";
        case FailureKind::InvalidArguments: return "InvalidArguments";
        case FailureKind::ProtocolViolation: return "ProtocolViolation";
        case FailureKind::Cancelled: return "Cancelled";
        case FailureKind::Internal:
        default: return "Internal";
    }
}

inline FailureKind ClassifyFailure(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Connection: return FailureKind::Unreachable;
        case ErrorKind::Auth: return FailureKind::AuthFailed;
        case ErrorKind::Timeout: return FailureKind::Timeout;
        case ErrorKind::RemoteTool: return FailureKind::RemoteError;
        case ErrorKind::ToolNotFound: return FailureKind::NotFound;
        case ErrorKind::SchemaValidation: return FailureKind::InvalidArguments;
        case ErrorKind::Protocol: return FailureKind::ProtocolViolation;
        case ErrorKind::Cancelled: return FailureKind::Cancelled;
        case ErrorKind::Internal:
        default: return FailureKind::Internal;
    }
}

//==========================================================================================================
// GatewayError
// Purpose: Coordinator-level error. Wraps a transport failure with its FailureKind; kind() keeps the
//          original ErrorKind and remoteCode() survives for RemoteError.
//==========================================================================================================
class GatewayError : public GatewayException {
public:
    GatewayError(FailureKind failure, ErrorKind cause, const std::string& message,
                 std::optional<int> remoteCode = std::nullopt)
        : GatewayException(cause, message), fk(failure), code(remoteCode) {}

    FailureKind failure() const noexcept { return fk; }
    std::optional<int> remoteCode() const noexcept { return code; }

private:
    FailureKind fk;
    std::optional<int> code;
};

inline FailureKind FailureKindOf(const GatewayException& e) {
    if (const auto* ge = dynamic_cast<const GatewayError*>(&e)) {
        return ge->failure();
    }
    return ClassifyFailure(e.kind());
}

// Builds the coordinator-level error for a transport failure, prefixing the operation context.
inline GatewayError Reclassify(const GatewayException& e, const std::string& context) {
    std::optional<int> remoteCode;
    if (const auto* re = dynamic_cast<const RemoteToolError*>(&e)) {
        remoteCode = re->code();
    } else if (const auto* ge = dynamic_cast<const GatewayError*>(&e)) {
        remoteCode = ge->remoteCode();
    }
    return GatewayError(FailureKindOf(e), e.kind(), context + ": " + e.what(), remoteCode);
}

} // namespace errors
} // namespace mcpgw
