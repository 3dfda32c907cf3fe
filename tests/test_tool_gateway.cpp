//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_tool_gateway.cpp
// Purpose: ToolGateway publication, dispatch and failure classification
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "mcpgw/ToolGateway.h"
#include "support/FakeTransport.hpp"
#include "support/MiniGateway.hpp"

using namespace mcpgw;
using mcpgw::testing::FakeScript;
using mcpgw::testing::FakeTransportFactory;
using mcpgw::testing::MakeTool;

namespace {

class RecordingHost : public IToolHost {
public:
    void PublishTools(std::vector<PublishedTool> tools, std::uint64_t generation) override {
        std::lock_guard<std::mutex> lk(mutex);
        if (publishCount > 0 && generation < lastGeneration) {
            ++regressions;
        }
        last = std::move(tools);
        lastGeneration = generation;
        ++publishCount;
    }

    std::vector<std::string> names() {
        std::lock_guard<std::mutex> lk(mutex);
        std::vector<std::string> out;
        for (const auto& t : last) out.push_back(t.name);
        return out;
    }

    std::mutex mutex;
    std::vector<PublishedTool> last;
    std::uint64_t lastGeneration{0};
    int publishCount{0};
    int regressions{0};
};

config::GatewayConfig fakeConfig() {
    config::GatewayConfig c;
    c.url = "http://gateway.test/mcp";
    c.refreshIntervalMs = 0;
    return c;
}

JSONValue args(const std::string& json) {
    return ParseJSON(json);
}

const char* kForecastSchema =
    R"({"type":"object","properties":{"location":{"type":"string"},"days":{"type":"integer","default":3}},"required":["location"]})";

} // namespace

TEST(ToolGateway, EndToEndAgainstHttpGateway) {
    mcpgw::testing::MiniGateway gw(mcpgw::testing::DefaultHandler());
    config::GatewayConfig cfg;
    cfg.url = gw.url();
    cfg.refreshIntervalMs = 0;
    auto coord = std::make_shared<GatewayCoordinator>(cfg);
    coord->Setup().get();

    auto host = std::make_shared<RecordingHost>();
    ToolGateway gateway(coord, host);
    EXPECT_EQ(host->names(), (std::vector<std::string>{"ping", "echo"}));

    ToolResult pong = gateway.Invoke("ping", args("{}"));
    EXPECT_TRUE(pong.ok);
    EXPECT_EQ(pong.text, "pong");

    ToolResult echoed = gateway.Invoke("echo", args(R"({"text":"hello"})"));
    EXPECT_TRUE(echoed.ok);
    EXPECT_EQ(echoed.text, "hello");

    ToolResult missingArg = gateway.Invoke("echo", args("{}"));
    EXPECT_FALSE(missingArg.ok);
    ASSERT_TRUE(missingArg.failure.has_value());
    EXPECT_EQ(missingArg.failure->kind, errors::FailureKind::InvalidArguments);

    coord->Teardown().get();
    EXPECT_EQ(gw.count("DELETE"), 1u);
}

TEST(ToolGateway, PublishesOnAttachAndAfterRefresh) {
    auto script = std::make_shared<FakeScript>();
    auto coord = std::make_shared<GatewayCoordinator>(fakeConfig(), std::make_shared<FakeTransportFactory>(script));
    auto host = std::make_shared<RecordingHost>();
    ToolGateway gateway(coord, host);
    // Nothing to publish before Setup
    EXPECT_EQ(host->publishCount, 0);

    coord->Setup().get();
    EXPECT_EQ(host->names(), std::vector<std::string>{"ping"});
    const std::uint64_t first = host->lastGeneration;

    script->SetList([]() { return std::vector<ToolDescriptor>{MakeTool("ping"), MakeTool("weather")}; });
    coord->RefreshNow().get();
    EXPECT_EQ(host->names(), (std::vector<std::string>{"ping", "weather"}));
    EXPECT_GT(host->lastGeneration, first);
    ASSERT_EQ(gateway.Tools().size(), 2u);
    EXPECT_EQ(gateway.Tools()[1].name, "weather");
    coord->Teardown().get();
}

TEST(ToolGateway, ConcurrentRefreshesPublishInOrder) {
    auto script = std::make_shared<FakeScript>();
    auto coord = std::make_shared<GatewayCoordinator>(fakeConfig(), std::make_shared<FakeTransportFactory>(script));
    auto host = std::make_shared<RecordingHost>();
    ToolGateway gateway(coord, host);
    coord->Setup().get();

    std::atomic<int> failures{0};
    auto worker = [&]() {
        for (int i = 0; i < 40; ++i) {
            try {
                coord->RefreshNow().get();
            } catch (const std::exception&) {
                ++failures;
            }
        }
    };
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) threads.emplace_back(worker);
    worker();
    for (auto& t : threads) t.join();

    EXPECT_EQ(failures.load(), 0);
    {
        std::lock_guard<std::mutex> lk(host->mutex);
        EXPECT_EQ(host->regressions, 0);
        // Once the refreshes settle the host holds the coordinator's latest catalog
        EXPECT_EQ(host->lastGeneration, coord->GetCatalog()->Generation());
    }
    coord->Teardown().get();
}

TEST(ToolGateway, RepublishResendsCurrentCatalog) {
    auto script = std::make_shared<FakeScript>();
    auto coord = std::make_shared<GatewayCoordinator>(fakeConfig(), std::make_shared<FakeTransportFactory>(script));
    coord->Setup().get();
    auto host = std::make_shared<RecordingHost>();
    ToolGateway gateway(coord, host);
    EXPECT_EQ(host->publishCount, 1);
    gateway.Republish();
    EXPECT_EQ(host->publishCount, 2);
    EXPECT_EQ(host->lastGeneration, coord->GetCatalog()->Generation());
    coord->Teardown().get();
}

TEST(ToolGateway, PublishedParametersAndCallable) {
    auto script = std::make_shared<FakeScript>();
    script->SetList([]() { return std::vector<ToolDescriptor>{MakeTool("get_forecast", kForecastSchema)}; });
    script->SetCall([](const std::string&, const JSONValue& a, std::stop_token) {
        ToolCallOutput out;
        out.text = GetStringMember(a, "location").value_or("?");
        return out;
    });
    auto coord = std::make_shared<GatewayCoordinator>(fakeConfig(), std::make_shared<FakeTransportFactory>(script));
    coord->Setup().get();
    auto host = std::make_shared<RecordingHost>();
    ToolGateway gateway(coord, host);

    auto tools = gateway.Tools();
    ASSERT_EQ(tools.size(), 1u);
    EXPECT_EQ(tools[0].name, "get_forecast");
    EXPECT_EQ(tools[0].description, "Tool get_forecast");
    const JSONValue* props = FindMember(tools[0].parameters, "properties");
    ASSERT_NE(props, nullptr);
    EXPECT_NE(FindMember(*props, "location"), nullptr);
    EXPECT_NE(FindMember(*props, "days"), nullptr);

    ToolResult r = tools[0].call(args(R"({"location":"Oslo"})"));
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(r.text, "Oslo");
    coord->Teardown().get();
}

TEST(ToolGateway, FailuresAreClassified) {
    auto script = std::make_shared<FakeScript>();
    script->SetList([]() {
        return std::vector<ToolDescriptor>{MakeTool("get_forecast", kForecastSchema), MakeTool("broken")};
    });
    script->SetCall([](const std::string& name, const JSONValue&, std::stop_token) -> ToolCallOutput {
        if (name == "broken") {
            throw errors::RemoteToolError(name, -32050, "upstream down");
        }
        ToolCallOutput out;
        out.text = "sunny";
        return out;
    });
    auto coord = std::make_shared<GatewayCoordinator>(fakeConfig(), std::make_shared<FakeTransportFactory>(script));
    coord->Setup().get();
    ToolGateway gateway(coord);

    ToolResult unknown = gateway.Invoke("nope", args("{}"));
    EXPECT_FALSE(unknown.ok);
    ASSERT_TRUE(unknown.failure.has_value());
    EXPECT_EQ(unknown.failure->kind, errors::FailureKind::NotFound);
    EXPECT_NE(unknown.text.find("nope"), std::string::npos);

    ToolResult invalid = gateway.Invoke("get_forecast", args(R"({"days":"three"})"));
    ASSERT_TRUE(invalid.failure.has_value());
    EXPECT_EQ(invalid.failure->kind, errors::FailureKind::InvalidArguments);
    EXPECT_EQ(invalid.failure->violations.size(), 2u);

    ToolResult remote = gateway.Invoke("broken", args("{}"));
    ASSERT_TRUE(remote.failure.has_value());
    EXPECT_EQ(remote.failure->kind, errors::FailureKind::RemoteError);
    ASSERT_TRUE(remote.failure->remoteCode.has_value());
    EXPECT_EQ(*remote.failure->remoteCode, -32050);

    EXPECT_EQ(script->callCalls.load(), 1);
    coord->Teardown().get();
}

TEST(ToolGateway, InvokeAsyncResolvesWithoutThrowing) {
    auto script = std::make_shared<FakeScript>();
    auto coord = std::make_shared<GatewayCoordinator>(fakeConfig(), std::make_shared<FakeTransportFactory>(script));
    coord->Setup().get();
    ToolGateway gateway(coord);

    auto ok = gateway.InvokeAsync("ping", args("{}"));
    auto missing = gateway.InvokeAsync("absent", args("{}"));
    ASSERT_EQ(ok.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    ToolResult r = ok.get();
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(r.text, "pong");
    ToolResult m = missing.get();
    EXPECT_FALSE(m.ok);
    EXPECT_EQ(m.failure->kind, errors::FailureKind::NotFound);
    coord->Teardown().get();
}

TEST(ToolGateway, CallsAfterTeardownFailCleanly) {
    auto script = std::make_shared<FakeScript>();
    auto coord = std::make_shared<GatewayCoordinator>(fakeConfig(), std::make_shared<FakeTransportFactory>(script));
    coord->Setup().get();
    ToolGateway gateway(coord);
    coord->Teardown().get();
    ToolResult r = gateway.Invoke("ping", args("{}"));
    EXPECT_FALSE(r.ok);
    ASSERT_TRUE(r.failure.has_value());
    EXPECT_FALSE(r.text.empty());
}

TEST(ToolGateway, ApiPromptMentionsGatewayTools) {
    auto script = std::make_shared<FakeScript>();
    auto coord = std::make_shared<GatewayCoordinator>(fakeConfig(), std::make_shared<FakeTransportFactory>(script));
    ToolGateway gateway(coord);
    const std::string prompt = gateway.ApiPrompt();
    EXPECT_NE(prompt.find("MCP gateway"), std::string::npos);
    EXPECT_NE(prompt.find("tools"), std::string::npos);
}

TEST(ToolGateway, ClassifyMapsEveryFailure) {
    auto kindOf = [](auto ex) { return ToolGateway::Classify(std::make_exception_ptr(ex)).kind; };
    EXPECT_EQ(kindOf(std::logic_error("boom")), errors::FailureKind::Internal);
    EXPECT_EQ(kindOf(errors::ConnectionError("down")), errors::FailureKind::Unreachable);
    EXPECT_EQ(kindOf(errors::AuthError("no", 403)), errors::FailureKind::AuthFailed);
    EXPECT_EQ(kindOf(errors::ToolTimeoutError("slow", 100)), errors::FailureKind::Timeout);
    EXPECT_EQ(kindOf(errors::OperationCancelled()), errors::FailureKind::Cancelled);
    EXPECT_EQ(kindOf(errors::ProtocolError("garbled", "{x")), errors::FailureKind::ProtocolViolation);
    EXPECT_EQ(kindOf(errors::GatewayError(errors::FailureKind::Unreachable, errors::ErrorKind::Protocol, "ctx")),
              errors::FailureKind::Unreachable);

    CallFailure internal = ToolGateway::Classify(std::make_exception_ptr(std::logic_error("boom")));
    EXPECT_NE(internal.message.find("boom"), std::string::npos);

    CallFailure remote = ToolGateway::Classify(
        std::make_exception_ptr(errors::GatewayError(errors::FailureKind::RemoteError, errors::ErrorKind::RemoteTool,
                                                     "calling x: failed", -32001)));
    EXPECT_EQ(remote.remoteCode, std::optional<int>(-32001));
}
