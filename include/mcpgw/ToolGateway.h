//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolGateway.h
// Purpose: Publishes the coordinator's catalog to a host tool framework and dispatches classified calls
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "mcpgw/GatewayCoordinator.h"
#include "mcpgw/errors/Errors.h"

namespace mcpgw {

// Why a call failed; every failure leaving the gateway carries one.
struct CallFailure {
    errors::FailureKind kind{errors::FailureKind::Internal};
    std::string message;
    std::vector<errors::SchemaViolation> violations;   // InvalidArguments only
    std::optional<int> remoteCode;                      // RemoteError with a JSON-RPC code
};

struct ToolResult {
    bool ok{false};
    std::string text;
    std::optional<CallFailure> failure;
};

//==========================================================================================================
// PublishedTool
// Purpose: What the host framework sees for one tool.
// Fields:
//   parameters: Normalized parameter shape (validation::ToolSchema::Describe()).
//   call: Validated invocation; blocks until the tool completes.
//==========================================================================================================
struct PublishedTool {
    std::string name;
    std::string description;
    JSONValue parameters;
    std::function<ToolResult(const JSONValue& arguments)> call;
};

//==========================================================================================================
// IToolHost
// Purpose: Host framework seam. PublishTools replaces the complete tool set; it is called once on attach
//          and again after every catalog swap.
//==========================================================================================================
class IToolHost {
public:
    virtual ~IToolHost() = default;
    virtual void PublishTools(std::vector<PublishedTool> tools, std::uint64_t generation) = 0;
};

class ToolGateway {
public:
    //==========================================================================================================
    // Args:
    //   coordinator: Source of the catalog and executor of calls.
    //   host: Optional framework receiving the published tools.
    //==========================================================================================================
    explicit ToolGateway(std::shared_ptr<GatewayCoordinator> coordinator, std::shared_ptr<IToolHost> host = nullptr);
    ~ToolGateway();

    ToolGateway(const ToolGateway&) = delete;
    ToolGateway& operator=(const ToolGateway&) = delete;

    //==========================================================================================================
    // Invoke
    // Purpose: Generic dispatcher. Never throws for call failures; the result carries the classification.
    //==========================================================================================================
    ToolResult Invoke(const std::string& name, const JSONValue& arguments, std::stop_token stopToken = {});
    std::future<ToolResult> InvokeAsync(const std::string& name, const JSONValue& arguments,
                                        std::stop_token stopToken = {});

    // Tools as last published
    std::vector<PublishedTool> Tools() const;

    // Republishes the coordinator's current catalog to the host
    void Republish();

    // Guidance offered to the model alongside the tools
    std::string ApiPrompt() const;

    // Maps any call failure to its CallFailure
    static CallFailure Classify(std::exception_ptr failure);

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace mcpgw
