//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Gateway command-line client: probe, list the callable tools, invoke one tool
//==========================================================================================================

#include <iostream>
#include <optional>
#include <string>

#include "logging/Logger.h"
#include "mcpgw/GatewayCoordinator.h"
#include "mcpgw/ToolGateway.h"
#include "mcpgw/config/GatewayConfig.h"
#include "mcpgw/version.h"

using namespace mcpgw;

//==========================================================================================================
// getArgValue
// Purpose: Parses key=value style CLI options.
// Args:
//   argc: Argument count
//   argv: Argument vector
//   key: Key string including leading dashes (e.g., "--url")
// Returns:
//   Optional string containing the value when present
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (size_t i = 1; i < static_cast<size_t>(argc); ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos) {
            std::string k = a.substr(0, eq);
            std::string v = a.substr(eq + 1);
            if (k == key) {
                return v;
            }
        }
    }
    return std::nullopt;
}

static bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (flag == argv[i]) {
            return true;
        }
    }
    return false;
}

static void printUsage() {
    std::cout << "mcpgw_cli " << getVersionString() << "\n"
              << "Usage: mcpgw_cli --url=<gateway url> [--token=<bearer>] [--allow=a,b] [--config=\"k=v; ...\"]\n"
              << "                 [--probe] [--call=<tool> [--args=<json object>]]\n";
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::setLogLevel(LogLevel::LOG_INFO_LEVEL);
    Logger::configureFromEnvironment();

    if (hasFlag(argc, argv, "--help") || argc < 2) {
        printUsage();
        return argc < 2 ? 1 : 0;
    }

    auto cfg = config::GatewayConfig::FromString(getArgValue(argc, argv, "--config").value_or(""));
    cfg.ApplyEnvironment();
    if (auto url = getArgValue(argc, argv, "--url"); url.has_value()) {
        cfg.url = *url;
    }
    if (auto token = getArgValue(argc, argv, "--token"); token.has_value()) {
        cfg.token = *token;
    }
    if (auto allow = getArgValue(argc, argv, "--allow"); allow.has_value()) {
        cfg.allowedTools = config::GatewayConfig::FromString("allowedTools=" + *allow).allowedTools;
    }

    try {
        cfg.Validate();
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Invalid configuration: {}", e.what());
        return 2;
    }
    LOG_INFO("Configuration: {}", cfg.ToDiagnosticString());

    if (hasFlag(argc, argv, "--probe")) {
        try {
            auto names = GatewayCoordinator::Probe(cfg).get();
            std::cout << "Gateway reachable; " << names.size() << " tool(s) permitted\n";
            for (const auto& n : names) {
                std::cout << "  " << n << "\n";
            }
            return 0;
        } catch (const errors::GatewayError& e) {
            std::cerr << "Probe failed [" << errors::toString(e.failure()) << "]: " << e.what() << "\n";
            return 3;
        }
    }

    auto coordinator = std::make_shared<GatewayCoordinator>(cfg);
    try {
        coordinator->Setup().get();
    } catch (const errors::GatewayError& e) {
        std::cerr << "Setup failed [" << errors::toString(e.failure()) << "]: " << e.what() << "\n";
        return 3;
    }

    ToolGateway gateway(coordinator);
    int rc = 0;
    if (auto tool = getArgValue(argc, argv, "--call"); tool.has_value()) {
        JSONValue args{JSONValue::Object{}};
        if (auto raw = getArgValue(argc, argv, "--args"); raw.has_value()) {
            try {
                args = ParseJSON(*raw);
            } catch (const std::runtime_error& e) {
                std::cerr << "--args is not valid JSON: " << e.what() << "\n";
                coordinator->Teardown().get();
                return 2;
            }
        }
        ToolResult result = gateway.Invoke(*tool, args);
        if (result.ok) {
            std::cout << result.text << "\n";
        } else {
            std::cerr << "Call failed [" << errors::toString(result.failure->kind) << "]: " << result.failure->message << "\n";
            for (const auto& v : result.failure->violations) {
                std::cerr << "  " << v.path << ": " << v.message << "\n";
            }
            rc = 4;
        }
    } else {
        std::cout << gateway.ApiPrompt() << "\n\n";
        for (const auto& t : gateway.Tools()) {
            std::cout << t.name << " - " << t.description << "\n    parameters: " << SerializeJSON(t.parameters) << "\n";
        }
    }

    coordinator->Teardown().get();
    return rc;
}
