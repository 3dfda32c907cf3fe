//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPTransport.hpp
// Purpose: Coroutine-based streamable-HTTP gateway client using Boost.Beast (JSON and SSE replies, TLS 1.2+)
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <future>

#include "mcpgw/Transport.h"
#include "mcpgw/config/GatewayConfig.h"

namespace mcpgw {

//==========================================================================================================
// HTTPTransportClient
// Purpose: ITransportClient over HTTP POST with Mcp-Session-Id tracking. Owns an io_context running on one
//          dedicated thread; every exchange is a coroutine spawned onto it.
//==========================================================================================================
class HTTPTransportClient : public ITransportClient {
public:
    explicit HTTPTransportClient(const config::GatewayConfig& config);
    ~HTTPTransportClient() override;

    std::future<void> Connect() override;
    std::future<void> Disconnect() override;
    bool IsConnected() const override;
    SessionState GetState() const override;
    Session GetSession() const override;

    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        const std::string& method, std::optional<JSONValue> params, unsigned int timeoutMs,
        std::stop_token stopToken = {}) override;
    std::future<std::vector<ToolDescriptor>> ListTools(unsigned int timeoutMs, std::stop_token stopToken = {}) override;
    std::future<ToolCallOutput> CallTool(const std::string& name, const JSONValue& arguments,
                                         unsigned int timeoutMs, std::stop_token stopToken = {}) override;

    void SetNotificationHandler(NotificationHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// HTTPTransportClientFactory
// Purpose: Factory for creating HTTP/HTTPS gateway transports.
//==========================================================================================================
class HTTPTransportClientFactory : public ITransportClientFactory {
public:
    std::unique_ptr<ITransportClient> CreateTransportClient(const config::GatewayConfig& config) override;
};

} // namespace mcpgw
