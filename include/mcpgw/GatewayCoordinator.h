//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GatewayCoordinator.h
// Purpose: Gateway connection lifecycle: setup, periodic catalog refresh with backoff, reconnection,
//          allow-list enforcement and classified tool calls
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

#include "mcpgw/ToolCatalog.h"
#include "mcpgw/Transport.h"
#include "mcpgw/config/GatewayConfig.h"

namespace mcpgw {

enum class CoordinatorState {
    Idle,
    Connecting,
    Ready,
    Degraded,
    Failed,
    Closed
};

inline const char* toString(CoordinatorState state) {
    switch (state) {
        case CoordinatorState::Connecting: return "Connecting";
        case CoordinatorState::Ready: return "Ready";
        case CoordinatorState::Degraded: return "Degraded";
        case CoordinatorState::Failed: return "Failed";
        case CoordinatorState::Closed: return "Closed";
        case CoordinatorState::Idle:
        default: return "Idle";
    }
}

//==========================================================================================================
// GatewayCoordinator
// Purpose: Owns one transport at a time and keeps the tool catalog current. Failures leaving the coordinator
//          are errors::GatewayError (classified by FailureKind), except ToolNotFoundError and
//          SchemaValidationError, which are raised before any network traffic.
// Notes:
//   Public operations are coroutines (async::Task) exposed as futures. The periodic refresh runs on a
//   scheduler thread started by a successful Setup().
//==========================================================================================================
class GatewayCoordinator {
public:
    using CatalogListener = std::function<void(std::shared_ptr<const ToolCatalog>)>;

    //==========================================================================================================
    // Args:
    //   config: Gateway settings; Validate() is applied (throws std::invalid_argument for a bad URL).
    //   factory: Transport source; defaults to HTTPTransportClientFactory.
    //==========================================================================================================
    explicit GatewayCoordinator(config::GatewayConfig config,
                                std::shared_ptr<ITransportClientFactory> factory = nullptr);
    ~GatewayCoordinator();

    GatewayCoordinator(const GatewayCoordinator&) = delete;
    GatewayCoordinator& operator=(const GatewayCoordinator&) = delete;

    ////////////////////////////////////////// Lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Setup
    // Purpose: Connects and fetches the initial catalog. On failure the transport opened by this attempt is
    //          disconnected and the state returns to Idle.
    // Returns:
    //   Future completing when the coordinator is Ready; fails with GatewayError.
    //==========================================================================================================
    std::future<void> Setup();

    // Stops the scheduler and disconnects the transport. Idempotent; never fails.
    std::future<void> Teardown();

    ////////////////////////////////////////// Tools ///////////////////////////////////////////
    //==========================================================================================================
    // CallTool
    // Purpose: Validates arguments against the cached schema and invokes the tool with the execution timeout.
    //          A session-expired failure is retried once on a fresh session.
    // Returns:
    //   Normalized tool output. Fails with ToolNotFoundError, SchemaValidationError or GatewayError.
    //==========================================================================================================
    std::future<ToolCallOutput> CallTool(const std::string& name, const JSONValue& arguments,
                                         std::stop_token stopToken = {});

    // Starts a refresh unless one is in flight; every caller shares the outstanding attempt.
    std::shared_future<void> RefreshNow();

    std::shared_ptr<const ToolCatalog> GetCatalog() const;
    CoordinatorState GetState() const;
    const config::GatewayConfig& GetConfig() const;

    // Invoked after every catalog swap (fresh or stale), outside internal locks.
    void SetCatalogListener(CatalogListener listener);

    //==========================================================================================================
    // Probe
    // Purpose: One-shot reachability and discovery check: connect, list, disconnect.
    // Returns:
    //   Names of the discovered tools permitted by the allow/block lists; fails with GatewayError.
    //==========================================================================================================
    static std::future<std::vector<std::string>> Probe(const config::GatewayConfig& config,
                                                       std::shared_ptr<ITransportClientFactory> factory = nullptr);

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace mcpgw
