//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/support/FakeTransport.hpp
// Purpose: Scripted ITransportClient and factory for coordinator and tool gateway tests
//==========================================================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "mcpgw/Transport.h"
#include "mcpgw/errors/Errors.h"

namespace mcpgw {
namespace testing {

inline ToolDescriptor MakeTool(const std::string& name, const std::string& schemaJson = R"({"type":"object"})") {
    return ToolDescriptor(name, "Tool " + name, ParseJSON(schemaJson));
}

//==========================================================================================================
// FakeScript
// Purpose: Behaviour and counters shared by every transport a FakeTransportFactory creates. Bumping epoch
//          makes every existing session report itself disconnected.
//==========================================================================================================
struct FakeScript {
    std::atomic<int> created{0};
    std::atomic<int> connects{0};
    std::atomic<int> disconnects{0};
    std::atomic<int> listCalls{0};
    std::atomic<int> callCalls{0};
    std::atomic<int> epoch{0};
    std::chrono::milliseconds connectDelay{0};
    std::chrono::milliseconds listDelay{0};

    std::mutex mutex;
    std::function<void()> onConnect = []() {};
    std::function<std::vector<ToolDescriptor>()> onList = []() {
        return std::vector<ToolDescriptor>{MakeTool("ping")};
    };
    std::function<ToolCallOutput(const std::string&, const JSONValue&, std::stop_token)> onCall =
        [](const std::string& name, const JSONValue&, std::stop_token) {
            ToolCallOutput out;
            out.text = name == "ping" ? "pong" : name;
            return out;
        };
    ITransportClient::NotificationHandler notificationHandler;

    void SetList(std::function<std::vector<ToolDescriptor>()> fn) {
        std::lock_guard<std::mutex> lk(mutex);
        onList = std::move(fn);
    }
    void SetCall(std::function<ToolCallOutput(const std::string&, const JSONValue&, std::stop_token)> fn) {
        std::lock_guard<std::mutex> lk(mutex);
        onCall = std::move(fn);
    }
    void SetConnect(std::function<void()> fn) {
        std::lock_guard<std::mutex> lk(mutex);
        onConnect = std::move(fn);
    }
    void DropSessions() { ++epoch; }

    void Notify(const std::string& method) {
        ITransportClient::NotificationHandler h;
        {
            std::lock_guard<std::mutex> lk(mutex);
            h = notificationHandler;
        }
        if (h) h(std::make_unique<JSONRPCNotification>(method));
    }
};

class FakeTransport : public ITransportClient {
public:
    explicit FakeTransport(std::shared_ptr<FakeScript> s) : script(std::move(s)) {}

    std::future<void> Connect() override {
        ++script->connects;
        auto s = script;
        return std::async(std::launch::async, [this, s]() {
            if (s->connectDelay.count() > 0) std::this_thread::sleep_for(s->connectDelay);
            std::function<void()> fn;
            {
                std::lock_guard<std::mutex> lk(s->mutex);
                fn = s->onConnect;
            }
            fn();
            connectedEpoch = s->epoch.load();
            connected = true;
        });
    }

    std::future<void> Disconnect() override {
        if (!closed.exchange(true)) {
            ++script->disconnects;
        }
        connected = false;
        std::promise<void> p;
        p.set_value();
        return p.get_future();
    }

    bool IsConnected() const override { return connected.load() && connectedEpoch.load() == script->epoch.load(); }
    SessionState GetState() const override { return IsConnected() ? SessionState::Connected : SessionState::Disconnected; }
    Session GetSession() const override {
        Session s;
        s.id = "fake-session";
        s.state = GetState();
        return s;
    }

    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(const std::string&, std::optional<JSONValue>, unsigned int,
                                                              std::stop_token) override {
        std::promise<std::unique_ptr<JSONRPCResponse>> p;
        p.set_exception(std::make_exception_ptr(errors::ProtocolError("SendRequest is not scripted")));
        return p.get_future();
    }

    std::future<std::vector<ToolDescriptor>> ListTools(unsigned int, std::stop_token) override {
        ++script->listCalls;
        auto s = script;
        return std::async(std::launch::async, [s]() {
            if (s->listDelay.count() > 0) std::this_thread::sleep_for(s->listDelay);
            std::function<std::vector<ToolDescriptor>()> fn;
            {
                std::lock_guard<std::mutex> lk(s->mutex);
                fn = s->onList;
            }
            return fn();
        });
    }

    std::future<ToolCallOutput> CallTool(const std::string& name, const JSONValue& arguments, unsigned int,
                                         std::stop_token stopToken) override {
        ++script->callCalls;
        auto s = script;
        return std::async(std::launch::async, [s, name, arguments, stopToken]() {
            std::function<ToolCallOutput(const std::string&, const JSONValue&, std::stop_token)> fn;
            {
                std::lock_guard<std::mutex> lk(s->mutex);
                fn = s->onCall;
            }
            return fn(name, arguments, stopToken);
        });
    }

    void SetNotificationHandler(NotificationHandler handler) override {
        std::lock_guard<std::mutex> lk(script->mutex);
        script->notificationHandler = std::move(handler);
    }

    void SetErrorHandler(ErrorHandler) override {}

private:
    std::shared_ptr<FakeScript> script;
    std::atomic<bool> connected{false};
    std::atomic<bool> closed{false};
    std::atomic<int> connectedEpoch{-1};
};

class FakeTransportFactory : public ITransportClientFactory {
public:
    explicit FakeTransportFactory(std::shared_ptr<FakeScript> s) : script(std::move(s)) {}

    std::unique_ptr<ITransportClient> CreateTransportClient(const config::GatewayConfig&) override {
        ++script->created;
        return std::make_unique<FakeTransport>(script);
    }

private:
    std::shared_ptr<FakeScript> script;
};

} // namespace testing
} // namespace mcpgw
