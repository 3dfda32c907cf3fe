//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Gateway transport client interface: handshake, session tracking and tool requests
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "mcpgw/JSONRPCTypes.h"
#include "mcpgw/Protocol.h"

namespace mcpgw {

namespace config {
struct GatewayConfig;
}

enum class SessionState {
    Disconnected,
    Connecting,
    Connected,
    Degraded,
    Closed
};

inline const char* toString(SessionState state) {
    switch (state) {
        case SessionState::Connecting: return "Connecting";
        case SessionState::Connected: return "Connected";
        case SessionState::Degraded: return "Degraded";
        case SessionState::Closed: return "Closed";
        case SessionState::Disconnected:
        default: return "Disconnected";
    }
}

//==========================================================================================================
// Session
// Purpose: Snapshot of the gateway session owned by one transport instance.
// Fields:
//   id: Server-issued Mcp-Session-Id (empty when the gateway issued none)
//   state: Lifecycle state
//   lastActivity: Time of the last completed exchange
//   protocolVersion: Version negotiated in the handshake
//   serverInfo: Gateway implementation name/version
//==========================================================================================================
struct Session {
    std::string id;
    SessionState state{SessionState::Disconnected};
    std::chrono::steady_clock::time_point lastActivity{};
    std::string protocolVersion;
    Implementation serverInfo;
};

//==========================================================================================================
// ITransportClient
// Purpose: One session with the gateway. Public operations return futures; failures are delivered as
//          mcpgw::errors exceptions through the future.
//==========================================================================================================
class ITransportClient {
public:
    virtual ~ITransportClient() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Performs the initialize handshake, records the session id and sends notifications/initialized.
    // Returns:
    //   Future completing when the session is Connected. Fails with ConnectionError, AuthError or
    //   ProtocolError; the state stays Disconnected on failure.
    //==========================================================================================================
    virtual std::future<void> Connect() = 0;

    //==========================================================================================================
    // Terminates the session (HTTP DELETE, only when a session id exists) and releases network resources.
    // Idempotent; never fails. Pending calls fail with ConnectionError("transport closed").
    //==========================================================================================================
    virtual std::future<void> Disconnect() = 0;

    // true while Connected or Degraded
    virtual bool IsConnected() const = 0;
    virtual SessionState GetState() const = 0;
    virtual Session GetSession() const = 0;

    /////////////////////////////////////////// Requests ///////////////////////////////////////////
    //==========================================================================================================
    // Sends one JSON-RPC request on the session.
    // Args:
    //   method/params: Request method and optional params.
    //   timeoutMs: Ceiling for the whole exchange; expiry fails with TimeoutError.
    //   stopToken: Cancels only this call (OperationCancelled).
    // Returns:
    //   Future resolving to the gateway's reply; JSON-RPC error replies are returned, not thrown.
    //==========================================================================================================
    virtual std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        const std::string& method, std::optional<JSONValue> params, unsigned int timeoutMs,
        std::stop_token stopToken = {}) = 0;

    // tools/list across all pages; timeoutMs bounds the whole listing.
    virtual std::future<std::vector<ToolDescriptor>> ListTools(unsigned int timeoutMs, std::stop_token stopToken = {}) = 0;

    //==========================================================================================================
    // tools/call. Raises RemoteToolError for a JSON-RPC error or an isError result, ToolTimeoutError on
    // expiry and OperationCancelled when stopToken fires.
    //==========================================================================================================
    virtual std::future<ToolCallOutput> CallTool(const std::string& name, const JSONValue& arguments,
                                                 unsigned int timeoutMs, std::stop_token stopToken = {}) = 0;

    /////////////////////////////////////////// Handlers ///////////////////////////////////////////
    // Invoked on the I/O thread for notifications arriving on response streams.
    using NotificationHandler = std::function<void(std::unique_ptr<JSONRPCNotification>)>;
    virtual void SetNotificationHandler(NotificationHandler handler) = 0;

    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

//==========================================================================================================
// Transport client factory interface
// Purpose: Creates a fresh transport per session; the coordinator asks for a new one on every reconnect.
//==========================================================================================================
class ITransportClientFactory {
public:
    virtual ~ITransportClientFactory() = default;
    virtual std::unique_ptr<ITransportClient> CreateTransportClient(const config::GatewayConfig& config) = 0;
};

} // namespace mcpgw
