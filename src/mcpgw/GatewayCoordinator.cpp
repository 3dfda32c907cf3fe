//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgw/GatewayCoordinator.cpp
// Purpose: Gateway connection lifecycle, catalog refresh scheduling and classified tool calls
//==========================================================================================================

#include <algorithm>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "mcpgw/Backoff.h"
#include "mcpgw/GatewayCoordinator.h"
#include "mcpgw/HTTPTransport.hpp"
#include "mcpgw/async/FutureAwaitable.h"
#include "mcpgw/async/Task.h"
#include "mcpgw/errors/Errors.h"

namespace mcpgw {

using TransportPtr = std::shared_ptr<ITransportClient>;

namespace {

//==========================================================================================================
// classify
// Purpose: Converts any failure into the coordinator-level GatewayError. Errors raised before the network
//          (unknown tool, invalid arguments) pass through unchanged.
//==========================================================================================================
std::exception_ptr classify(std::exception_ptr failure, const std::string& context) {
    try {
        std::rethrow_exception(failure);
    } catch (const errors::GatewayError&) {
        return failure;
    } catch (const errors::ToolNotFoundError&) {
        return failure;
    } catch (const errors::SchemaValidationError&) {
        return failure;
    } catch (const errors::GatewayException& e) {
        return std::make_exception_ptr(errors::Reclassify(e, context));
    } catch (const std::exception& e) {
        return std::make_exception_ptr(errors::GatewayError(errors::FailureKind::Internal, errors::ErrorKind::Internal,
                                                            context + ": " + e.what()));
    }
}

[[noreturn]] void rethrowClassified(std::exception_ptr failure, const std::string& context) {
    std::rethrow_exception(classify(std::move(failure), context));
}

bool isConnectionFailure(std::exception_ptr failure) {
    try {
        std::rethrow_exception(failure);
    } catch (const errors::GatewayException& e) {
        return e.kind() == errors::ErrorKind::Connection;
    } catch (const std::exception&) {
        return false;
    }
}

void discard(const TransportPtr& t) {
    if (!t) {
        return;
    }
    try {
        t->Disconnect().get();
    } catch (const std::exception& e) {
        LOG_WARN("Disconnecting transport failed: {}", e.what());
    }
}

template <typename T>
std::shared_future<T> failedShared(std::exception_ptr e) {
    std::promise<T> p;
    p.set_exception(std::move(e));
    return p.get_future().share();
}

std::shared_ptr<ITransportClientFactory> orDefault(std::shared_ptr<ITransportClientFactory> factory) {
    if (factory) {
        return factory;
    }
    return std::make_shared<HTTPTransportClientFactory>();
}

async::Task<std::vector<std::string>> coProbe(config::GatewayConfig cfg, std::shared_ptr<ITransportClientFactory> factory) {
    FUNC_SCOPE();
    TransportPtr t;
    try {
        cfg.Validate();
        t = TransportPtr(factory->CreateTransportClient(cfg));
    } catch (const std::invalid_argument& e) {
        throw errors::GatewayError(errors::FailureKind::Internal, errors::ErrorKind::Internal,
                                   fmt::format("Probe: {}", e.what()));
    }
    std::vector<std::string> names;
    std::exception_ptr failure;
    try {
        co_await async::makeFutureAwaitable(t->Connect());
        auto tools = co_await async::makeFutureAwaitable(t->ListTools(cfg.refreshTimeoutMs));
        for (const auto& td : tools) {
            if (cfg.IsToolAllowed(td.name)) {
                names.push_back(td.name);
            }
        }
        LOG_INFO("Probe of {} found {} tool(s), {} permitted", cfg.Endpoint().host, tools.size(), names.size());
    } catch (const std::exception&) {
        failure = std::current_exception();
    }
    discard(t);
    if (failure) {
        rethrowClassified(failure, "Probe");
    }
    co_return names;
}

} // namespace

class GatewayCoordinator::Impl : public std::enable_shared_from_this<GatewayCoordinator::Impl> {
public:
    config::GatewayConfig cfg;
    std::shared_ptr<ITransportClientFactory> factory;

    mutable std::mutex mutex;
    std::condition_variable cv;
    CoordinatorState state{CoordinatorState::Idle};
    bool closed{false};
    TransportPtr transport;
    std::shared_future<TransportPtr> connectAttempt;
    std::shared_future<void> refreshInFlight;
    std::shared_ptr<const ToolCatalog> catalog;
    CatalogListener listener;
    std::uint64_t generation{0};
    unsigned int consecutiveFailures{0};
    bool refreshRequested{false};
    std::thread scheduler;

    Impl(config::GatewayConfig c, std::shared_ptr<ITransportClientFactory> f)
        : cfg(std::move(c)), factory(orDefault(std::move(f))) {
        cfg.Validate();
    }

    ~Impl() {
        if (scheduler.joinable()) {
            scheduler.detach();
        }
    }

    void notifyListener(const CatalogListener& l, const std::shared_ptr<const ToolCatalog>& snapshot) {
        if (!l || !snapshot) {
            return;
        }
        try {
            l(snapshot);
        } catch (const std::exception& e) {
            LOG_ERROR("Catalog listener threw: {}", e.what());
        }
    }

    //======================================================================================================
    // buildCatalog
    // Purpose: Applies the allow/block lists and translates every schema. A tool whose schema cannot be
    //          translated is left out of the catalog.
    //======================================================================================================
    std::shared_ptr<const ToolCatalog> buildCatalog(const std::vector<ToolDescriptor>& tools, std::uint64_t gen) {
        std::vector<CatalogEntry> entries;
        entries.reserve(tools.size());
        for (const auto& td : tools) {
            if (!cfg.IsToolAllowed(td.name)) {
                LOG_DEBUG("Tool '{}' excluded by allow/block list", td.name);
                continue;
            }
            try {
                auto schema = std::make_shared<const validation::ToolSchema>(
                    validation::ToolSchema::Translate(td.inputSchema, cfg.validation));
                entries.push_back(CatalogEntry{td, std::move(schema)});
            } catch (const errors::ProtocolError& e) {
                LOG_WARN("Dropping tool '{}' with untranslatable schema: {}", td.name, e.what());
            }
        }
        if (cfg.allowedTools.has_value()) {
            for (const auto& wanted : *cfg.allowedTools) {
                const bool listed = std::any_of(tools.begin(), tools.end(),
                                                [&](const ToolDescriptor& td){ return td.name == wanted; });
                if (!listed) {
                    LOG_INFO("Allowed tool '{}' is not offered by the gateway", wanted);
                }
            }
        }
        return std::make_shared<const ToolCatalog>(std::move(entries), gen);
    }

    void attachHandlers(const TransportPtr& t) {
        std::weak_ptr<Impl> weak = weak_from_this();
        t->SetNotificationHandler([weak](std::unique_ptr<JSONRPCNotification> n) {
            auto self = weak.lock();
            if (!self || !n) return;
            if (n->method == Methods::ToolListChanged) {
                LOG_INFO("Gateway tool list changed; scheduling refresh");
                self->requestRefresh();
            } else if (n->method == Methods::Log) {
                LOG_DEBUG("Gateway log: {}", n->params.has_value() ? SerializeJSON(*n->params) : std::string());
            } else {
                LOG_DEBUG("Unhandled gateway notification '{}'", n->method);
            }
        });
        t->SetErrorHandler([](const std::string& error) {
            LOG_DEBUG("Transport reported: {}", error);
        });
    }

    void requestRefresh() {
        {
            std::lock_guard<std::mutex> lk(mutex);
            refreshRequested = true;
        }
        cv.notify_all();
    }

    // Drops the transport if it is still the current one, then disconnects it.
    void retireTransport(const TransportPtr& t) {
        if (!t) {
            return;
        }
        {
            std::lock_guard<std::mutex> lk(mutex);
            if (transport == t) {
                transport.reset();
            }
        }
        discard(t);
    }

    ////////////////////////////////////////// Connection //////////////////////////////////////////

    //======================================================================================================
    // ensureConnected
    // Purpose: Returns the live transport, or the single in-flight connect attempt shared by every caller
    //          that needs a session while one is being established.
    //======================================================================================================
    std::shared_future<TransportPtr> ensureConnected() {
        std::unique_lock<std::mutex> lk(mutex);
        if (closed) {
            return failedShared<TransportPtr>(std::make_exception_ptr(errors::ConnectionError("coordinator is closed")));
        }
        if (transport && transport->IsConnected()) {
            std::promise<TransportPtr> ready;
            ready.set_value(transport);
            return ready.get_future().share();
        }
        if (connectAttempt.valid()) {
            return connectAttempt;
        }
        auto slot = std::make_shared<std::promise<TransportPtr>>();
        connectAttempt = slot->get_future().share();
        auto attempt = connectAttempt;
        lk.unlock();
        coConnectInto(slot);
        return attempt;
    }

    async::Task<void> coConnectInto(std::shared_ptr<std::promise<TransportPtr>> slot) {
        auto keepAlive = shared_from_this();
        TransportPtr fresh;
        std::exception_ptr failure;
        try {
            fresh = TransportPtr(factory->CreateTransportClient(cfg));
            attachHandlers(fresh);
            co_await async::makeFutureAwaitable(fresh->Connect());
        } catch (const std::exception&) {
            failure = std::current_exception();
        }

        TransportPtr previous;
        bool closedMeanwhile = false;
        {
            std::lock_guard<std::mutex> lk(mutex);
            connectAttempt = std::shared_future<TransportPtr>();
            if (!failure) {
                if (closed) {
                    closedMeanwhile = true;
                } else {
                    previous = std::exchange(transport, fresh);
                }
            }
        }
        if (failure || closedMeanwhile) {
            discard(fresh);
            if (closedMeanwhile) {
                failure = std::make_exception_ptr(errors::ConnectionError("coordinator closed while connecting"));
            }
            slot->set_exception(failure);
            co_return;
        }
        if (previous && previous != fresh) {
            LOG_DEBUG("Replacing previous gateway session");
            discard(previous);
        }
        slot->set_value(fresh);
    }

    //======================================================================================================
    // coWithSession
    // Purpose: Runs one transport operation on a connected session, reconnecting once when the gateway
    //          reports the session expired. A stopped token suppresses the retry.
    //======================================================================================================
    template <typename T>
    async::Task<T> coWithSession(std::function<std::future<T>(const TransportPtr&)> op,
                                 std::stop_token stopToken = {}) {
        auto keepAlive = shared_from_this();
        const std::stop_token stop = co_await async::thisStopToken();
        for (int attempt = 0;; ++attempt) {
            TransportPtr t;
            std::exception_ptr failure;
            bool expired = false;
            try {
                t = co_await async::makeFutureAwaitable(ensureConnected());
                co_return co_await async::makeFutureAwaitable(op(t));
            } catch (const errors::ConnectionError& ce) {
                expired = ce.sessionExpired();
                failure = std::current_exception();
            } catch (const std::exception&) {
                failure = std::current_exception();
            }
            if (!expired || attempt > 0) {
                std::rethrow_exception(failure);
            }
            if (stop.stop_requested()) {
                throw errors::OperationCancelled("Cancelled before reconnecting an expired session");
            }
            LOG_INFO("Gateway session expired; reconnecting and retrying once");
            retireTransport(t);
        }
    }

    ////////////////////////////////////////// Setup / teardown //////////////////////////////////////////

    async::Task<void> coSetup() {
        FUNC_SCOPE();
        auto keepAlive = shared_from_this();
        {
            std::lock_guard<std::mutex> lk(mutex);
            if (closed) {
                throw errors::GatewayError(errors::FailureKind::Unreachable, errors::ErrorKind::Connection,
                                           "Setup: coordinator is closed");
            }
            if (state == CoordinatorState::Ready || state == CoordinatorState::Degraded) {
                co_return;
            }
            if (state != CoordinatorState::Idle) {
                throw errors::GatewayError(errors::FailureKind::Internal, errors::ErrorKind::Internal,
                                           fmt::format("Setup: coordinator is {}", toString(state)));
            }
            state = CoordinatorState::Connecting;
        }
        LOG_INFO("Setting up gateway coordinator: {}", cfg.ToDiagnosticString());

        std::vector<ToolDescriptor> tools;
        std::exception_ptr failure;
        try {
            TransportPtr t = co_await async::makeFutureAwaitable(ensureConnected());
            tools = co_await async::makeFutureAwaitable(t->ListTools(cfg.refreshTimeoutMs));
        } catch (const std::exception&) {
            failure = std::current_exception();
        }

        if (failure) {
            TransportPtr opened;
            {
                std::lock_guard<std::mutex> lk(mutex);
                if (state != CoordinatorState::Closed) {
                    state = CoordinatorState::Idle;
                }
                opened = std::exchange(transport, nullptr);
            }
            discard(opened);
            rethrowClassified(failure, "Setup");
        }

        std::shared_ptr<const ToolCatalog> built;
        CatalogListener l;
        {
            std::lock_guard<std::mutex> lk(mutex);
            if (closed) {
                throw errors::GatewayError(errors::FailureKind::Unreachable, errors::ErrorKind::Connection,
                                           "Setup: coordinator closed during setup");
            }
            built = buildCatalog(tools, ++generation);
            catalog = built;
            state = CoordinatorState::Ready;
            consecutiveFailures = 0;
            l = listener;
        }
        LOG_INFO("Gateway ready: {} of {} tool(s) callable", built->Size(), tools.size());
        notifyListener(l, built);
        startScheduler();
    }

    void teardown() {
        std::thread sched;
        TransportPtr t;
        {
            std::lock_guard<std::mutex> lk(mutex);
            if (closed) {
                return;
            }
            closed = true;
            state = CoordinatorState::Closed;
            sched = std::move(scheduler);
            t = std::exchange(transport, nullptr);
        }
        cv.notify_all();
        if (sched.joinable()) {
            if (sched.get_id() == std::this_thread::get_id()) {
                sched.detach();
            } else {
                sched.join();
            }
        }
        discard(t);
        LOG_INFO("Gateway coordinator closed");
    }

    ////////////////////////////////////////// Refresh //////////////////////////////////////////

    std::shared_future<void> refreshNow() {
        std::unique_lock<std::mutex> lk(mutex);
        if (refreshInFlight.valid()) {
            return refreshInFlight;
        }
        if (state != CoordinatorState::Ready && state != CoordinatorState::Degraded) {
            return failedShared<void>(std::make_exception_ptr(errors::GatewayError(
                errors::FailureKind::Unreachable, errors::ErrorKind::Connection,
                fmt::format("Catalog refresh: coordinator is {}", toString(state)))));
        }
        auto slot = std::make_shared<std::promise<void>>();
        refreshInFlight = slot->get_future().share();
        auto attempt = refreshInFlight;
        lk.unlock();
        coRefresh(slot);
        return attempt;
    }

    //======================================================================================================
    // coRefresh
    // Purpose: One catalog refresh. Success swaps in a new generation; failure republishes the current
    //          entries as Stale and degrades (or hard-fails after maxConsecutiveFailures).
    //======================================================================================================
    async::Task<void> coRefresh(std::shared_ptr<std::promise<void>> slot) {
        auto keepAlive = shared_from_this();
        std::vector<ToolDescriptor> tools;
        std::exception_ptr failure;
        try {
            tools = co_await async::makeFutureAwaitable(coWithSession<std::vector<ToolDescriptor>>(
                [this](const TransportPtr& t) { return t->ListTools(cfg.refreshTimeoutMs); }).toFuture());
        } catch (const std::exception&) {
            failure = std::current_exception();
        }

        std::shared_ptr<const ToolCatalog> published;
        CatalogListener l;
        bool dropTransport = false;
        {
            std::lock_guard<std::mutex> lk(mutex);
            if (!closed) {
                if (!failure) {
                    catalog = buildCatalog(tools, ++generation);
                    consecutiveFailures = 0;
                    if (state == CoordinatorState::Degraded) {
                        LOG_INFO("Gateway recovered");
                        state = CoordinatorState::Ready;
                    }
                    LOG_DEBUG("Catalog generation {} installed with {} tool(s)", catalog->Generation(), catalog->Size());
                } else {
                    ++consecutiveFailures;
                    if (catalog) {
                        catalog = catalog->AsStale();
                    }
                    if (cfg.maxConsecutiveFailures != 0 && consecutiveFailures >= cfg.maxConsecutiveFailures) {
                        LOG_ERROR("Gateway refresh failed {} times in a row; giving up until teardown", consecutiveFailures);
                        state = CoordinatorState::Failed;
                    } else if (state == CoordinatorState::Ready || state == CoordinatorState::Degraded) {
                        state = CoordinatorState::Degraded;
                    }
                    dropTransport = isConnectionFailure(failure);
                }
                published = catalog;
                l = listener;
            }
        }

        if (failure && dropTransport) {
            TransportPtr current;
            {
                std::lock_guard<std::mutex> lk(mutex);
                current = transport;
            }
            retireTransport(current);
        }

        // The attempt stays outstanding until its snapshot is published; callers of RefreshNow() see the
        // host already updated.
        notifyListener(l, published);
        {
            std::lock_guard<std::mutex> lk(mutex);
            refreshInFlight = std::shared_future<void>();
        }
        if (failure) {
            slot->set_exception(classify(failure, "Catalog refresh"));
        } else {
            slot->set_value();
        }
    }

    void startScheduler() {
        std::lock_guard<std::mutex> lk(mutex);
        if (scheduler.joinable() || closed) {
            return;
        }
        scheduler = std::thread([self = shared_from_this()]() { self->schedulerLoop(); });
    }

    //======================================================================================================
    // schedulerLoop
    // Purpose: Waits for the refresh interval (or the backoff delay after a failure) and refreshes. Woken
    //          early by RefreshNow-style requests and by Teardown.
    //======================================================================================================
    void schedulerLoop() {
        ExponentialBackoff backoff(ExponentialBackoff::Policy{cfg.backoffInitialMs, cfg.backoffMultiplier, cfg.backoffMaxMs});
        const std::optional<std::chrono::milliseconds> interval =
            cfg.refreshIntervalMs == 0 ? std::nullopt : std::optional<std::chrono::milliseconds>(cfg.refreshIntervalMs);
        std::optional<std::chrono::milliseconds> delay = interval;

        std::unique_lock<std::mutex> lk(mutex);
        while (!closed) {
            if (state == CoordinatorState::Failed) {
                cv.wait(lk, [this]() { return closed; });
                break;
            }
            auto wake = [this]() { return closed || refreshRequested; };
            if (delay.has_value()) {
                cv.wait_for(lk, *delay, wake);
            } else {
                cv.wait(lk, wake);
            }
            if (closed) {
                break;
            }
            refreshRequested = false;
            lk.unlock();

            bool ok = true;
            try {
                refreshNow().get();
            } catch (const std::exception& e) {
                ok = false;
                LOG_WARN("Scheduled catalog refresh failed: {}", e.what());
            }

            lk.lock();
            if (ok) {
                backoff.Reset();
                delay = interval;
            } else {
                delay = backoff.Next();
                LOG_INFO("Next refresh attempt in {} ms", delay->count());
            }
        }
        LOG_DEBUG("Refresh scheduler stopped");
    }

    ////////////////////////////////////////// Calls //////////////////////////////////////////

    async::Task<ToolCallOutput> coCallTool(std::string name, JSONValue arguments, std::stop_token callerToken) {
        FUNC_SCOPE();
        auto keepAlive = shared_from_this();
        // callerToken is chained into this task's stop source
        const std::stop_token stopToken = co_await async::thisStopToken();
        std::shared_ptr<const ToolCatalog> snapshot;
        CoordinatorState s;
        {
            std::lock_guard<std::mutex> lk(mutex);
            snapshot = catalog;
            s = state;
        }
        if (s == CoordinatorState::Closed || s == CoordinatorState::Failed) {
            throw errors::GatewayError(errors::FailureKind::Unreachable, errors::ErrorKind::Connection,
                                       fmt::format("tools/call '{}': coordinator is {}", name, toString(s)));
        }
        const CatalogEntry* entry = (snapshot && cfg.IsToolAllowed(name)) ? snapshot->Find(name) : nullptr;
        if (entry == nullptr) {
            LOG_WARN("Rejected call to unknown or disallowed tool '{}'", name);
            throw errors::ToolNotFoundError(name);
        }
        JSONValue normalized = entry->schema->Validate(arguments);
        LOG_DEBUG("Calling tool '{}' with {}", name, SerializeJSON(normalized));

        std::exception_ptr failure;
        try {
            co_return co_await async::makeFutureAwaitable(coWithSession<ToolCallOutput>(
                [this, name, normalized, stopToken](const TransportPtr& t) {
                    return t->CallTool(name, normalized, cfg.executionTimeoutMs, stopToken);
                }, stopToken).toFuture());
        } catch (const std::exception&) {
            failure = std::current_exception();
        }
        rethrowClassified(failure, fmt::format("tools/call '{}'", name));
    }
};

GatewayCoordinator::GatewayCoordinator(config::GatewayConfig config, std::shared_ptr<ITransportClientFactory> factory)
    : pImpl(std::make_shared<Impl>(std::move(config), std::move(factory))) {}

GatewayCoordinator::~GatewayCoordinator() {
    pImpl->teardown();
}

std::future<void> GatewayCoordinator::Setup() {
    FUNC_SCOPE();
    return pImpl->coSetup().toFuture();
}

std::future<void> GatewayCoordinator::Teardown() {
    FUNC_SCOPE();
    pImpl->teardown();
    std::promise<void> done;
    done.set_value();
    return done.get_future();
}

std::future<ToolCallOutput> GatewayCoordinator::CallTool(const std::string& name, const JSONValue& arguments,
                                                         std::stop_token stopToken) {
    return pImpl->coCallTool(name, arguments, std::move(stopToken)).toFuture();
}

std::shared_future<void> GatewayCoordinator::RefreshNow() {
    FUNC_SCOPE();
    return pImpl->refreshNow();
}

std::shared_ptr<const ToolCatalog> GatewayCoordinator::GetCatalog() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->catalog;
}

CoordinatorState GatewayCoordinator::GetState() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->state;
}

const config::GatewayConfig& GatewayCoordinator::GetConfig() const {
    return pImpl->cfg;
}

void GatewayCoordinator::SetCatalogListener(CatalogListener listener) {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    pImpl->listener = std::move(listener);
}

std::future<std::vector<std::string>> GatewayCoordinator::Probe(const config::GatewayConfig& config,
                                                                std::shared_ptr<ITransportClientFactory> factory) {
    return coProbe(config, orDefault(std::move(factory))).toFuture();
}

} // namespace mcpgw
