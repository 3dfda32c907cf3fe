//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgw/ToolGateway.cpp
// Purpose: Host-facing tool publication and dispatch
//==========================================================================================================

#include <mutex>
#include <utility>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "mcpgw/ToolGateway.h"
#include "mcpgw/async/FutureAwaitable.h"
#include "mcpgw/async/Task.h"

namespace mcpgw {

namespace {

ToolResult failedResult(std::exception_ptr failure) {
    ToolResult r;
    r.failure = ToolGateway::Classify(std::move(failure));
    r.text = r.failure->message;
    return r;
}

} // namespace

class ToolGateway::Impl : public std::enable_shared_from_this<ToolGateway::Impl> {
public:
    std::shared_ptr<GatewayCoordinator> coordinator;
    std::shared_ptr<IToolHost> host;

    mutable std::mutex mutex;
    std::vector<PublishedTool> published;
    std::shared_ptr<const ToolCatalog> publishedCatalog;

    // Serializes publication so the host sees catalogs in swap order
    std::mutex publishMutex;

    Impl(std::shared_ptr<GatewayCoordinator> c, std::shared_ptr<IToolHost> h)
        : coordinator(std::move(c)), host(std::move(h)) {}

    ToolResult invoke(const std::string& name, const JSONValue& arguments, std::stop_token stopToken) {
        FUNC_SCOPE();
        try {
            ToolCallOutput out = coordinator->CallTool(name, arguments, std::move(stopToken)).get();
            return ToolResult{true, std::move(out.text), std::nullopt};
        } catch (const std::exception& e) {
            LOG_DEBUG("Tool '{}' failed: {}", name, e.what());
            return failedResult(std::current_exception());
        }
    }

    async::Task<ToolResult> coInvoke(std::string name, JSONValue arguments, std::stop_token stopToken) {
        auto keepAlive = shared_from_this();
        std::exception_ptr failure;
        try {
            ToolCallOutput out = co_await async::makeFutureAwaitable(
                coordinator->CallTool(name, arguments, std::move(stopToken)));
            co_return ToolResult{true, std::move(out.text), std::nullopt};
        } catch (const std::exception&) {
            failure = std::current_exception();
        }
        co_return failedResult(failure);
    }

    //======================================================================================================
    // publish
    // Purpose: Builds the host-facing triples for a catalog snapshot and hands them to the host.
    // Notes:
    //   Swap notifications may arrive out of order. A snapshot that is no longer the coordinator's current
    //   one, or is older than the last published generation, is dropped: the newer one is (or will be)
    //   published by its own notification.
    //======================================================================================================
    void publish(const std::shared_ptr<const ToolCatalog>& catalog, bool force = false) {
        if (!catalog) {
            return;
        }
        std::lock_guard<std::mutex> serial(publishMutex);
        if (catalog != coordinator->GetCatalog()) {
            LOG_DEBUG("Skipping superseded catalog generation {}", catalog->Generation());
            return;
        }
        {
            std::lock_guard<std::mutex> lk(mutex);
            if ((publishedCatalog == catalog && !force) ||
                (publishedCatalog && catalog->Generation() < publishedCatalog->Generation())) {
                return;
            }
        }
        std::weak_ptr<Impl> weak = weak_from_this();
        std::vector<PublishedTool> tools;
        tools.reserve(catalog->Size());
        for (const auto& entry : catalog->Entries()) {
            PublishedTool pt;
            pt.name = entry.descriptor.name;
            pt.description = entry.descriptor.description;
            pt.parameters = entry.schema->Describe();
            pt.call = [weak, name = entry.descriptor.name](const JSONValue& arguments) {
                auto self = weak.lock();
                if (!self) {
                    ToolResult r;
                    r.failure = CallFailure{errors::FailureKind::Internal, "tool gateway released", {}, std::nullopt};
                    r.text = r.failure->message;
                    return r;
                }
                return self->invoke(name, arguments, {});
            };
            tools.push_back(std::move(pt));
        }
        {
            std::lock_guard<std::mutex> lk(mutex);
            published = tools;
            publishedCatalog = catalog;
        }
        LOG_DEBUG("Publishing {} tool(s), generation {}{}", tools.size(), catalog->Generation(),
                  catalog->IsStale() ? " (stale)" : "");
        if (host) {
            host->PublishTools(std::move(tools), catalog->Generation());
        }
    }
};

ToolGateway::ToolGateway(std::shared_ptr<GatewayCoordinator> coordinator, std::shared_ptr<IToolHost> host)
    : pImpl(std::make_shared<Impl>(std::move(coordinator), std::move(host))) {
    std::weak_ptr<Impl> weak = pImpl;
    pImpl->coordinator->SetCatalogListener([weak](std::shared_ptr<const ToolCatalog> catalog) {
        if (auto self = weak.lock()) {
            self->publish(catalog);
        }
    });
    pImpl->publish(pImpl->coordinator->GetCatalog());
}

ToolGateway::~ToolGateway() {
    pImpl->coordinator->SetCatalogListener(nullptr);
}

ToolResult ToolGateway::Invoke(const std::string& name, const JSONValue& arguments, std::stop_token stopToken) {
    return pImpl->invoke(name, arguments, std::move(stopToken));
}

std::future<ToolResult> ToolGateway::InvokeAsync(const std::string& name, const JSONValue& arguments,
                                                 std::stop_token stopToken) {
    return pImpl->coInvoke(name, arguments, std::move(stopToken)).toFuture();
}

std::vector<PublishedTool> ToolGateway::Tools() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->published;
}

void ToolGateway::Republish() {
    pImpl->publish(pImpl->coordinator->GetCatalog(), true);
}

std::string ToolGateway::ApiPrompt() const {
    return "You have access to external tools provided by an MCP gateway. "
           "Use these tools when the user's request matches their purpose. "
           "Tool results should be incorporated into your natural language response.";
}

//==========================================================================================================
// ToolGateway::Classify
// Purpose: Every failure becomes a CallFailure; unknown exception types map to Internal.
//==========================================================================================================
CallFailure ToolGateway::Classify(std::exception_ptr failure) {
    CallFailure f;
    try {
        std::rethrow_exception(failure);
    } catch (const errors::SchemaValidationError& e) {
        f.kind = errors::FailureKind::InvalidArguments;
        f.message = e.what();
        f.violations = e.violations();
    } catch (const errors::GatewayError& e) {
        f.kind = e.failure();
        f.message = e.what();
        f.remoteCode = e.remoteCode();
    } catch (const errors::RemoteToolError& e) {
        f.kind = errors::FailureKind::RemoteError;
        f.message = e.what();
        f.remoteCode = e.code();
    } catch (const errors::GatewayException& e) {
        f.kind = errors::FailureKindOf(e);
        f.message = e.what();
    } catch (const std::exception& e) {
        f.kind = errors::FailureKind::Internal;
        f.message = fmt::format("unexpected failure: {}", e.what());
    }
    return f;
}

} // namespace mcpgw
