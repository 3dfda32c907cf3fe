//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GatewayConfig.h
// Purpose: Gateway connection settings: parsing, environment overrides, validation and redaction
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "mcpgw/validation/Validation.h"
#include "mcpgw/version.h"

namespace mcpgw {
namespace config {

//==========================================================================================================
// GatewayEndpoint
// Purpose: Components of the gateway base URL. port defaults to 443/80 by scheme; path defaults to "/".
//==========================================================================================================
struct GatewayEndpoint {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;

    bool secure() const { return scheme == "https"; }
};

// Parses http(s)://host[:port][/path]. Throws std::invalid_argument for anything else.
GatewayEndpoint ParseGatewayUrl(const std::string& url);

//==========================================================================================================
// GatewayConfig
// Purpose: Everything the core consumes from the host: URL, optional bearer token, tool filters, timeouts,
//          refresh and backoff policy, TLS trust settings and the handshake identity.
// Notes:
//   allowedTools: std::nullopt allows every discovered tool; a configured list (even an empty one)
//   restricts calls to its names. blockedTools always excludes.
//==========================================================================================================
struct GatewayConfig {
    // Clamp ranges applied by Validate()
    static constexpr unsigned int kMinConnectTimeoutMs = 5000;
    static constexpr unsigned int kMaxConnectTimeoutMs = 60000;
    static constexpr unsigned int kMinExecutionTimeoutMs = 10000;
    static constexpr unsigned int kMaxExecutionTimeoutMs = 120000;

    std::string url;
    std::string token;

    unsigned int connectTimeoutMs{10000};
    unsigned int refreshTimeoutMs{10000};
    unsigned int executionTimeoutMs{60000};
    unsigned int refreshIntervalMs{300000};   // 0 disables periodic refresh

    std::optional<std::vector<std::string>> allowedTools;
    std::vector<std::string> blockedTools;

    unsigned int backoffInitialMs{5000};
    double backoffMultiplier{2.0};
    unsigned int backoffMaxMs{300000};
    unsigned int maxConsecutiveFailures{0};   // 0 = retry forever

    bool tlsVerify{true};
    std::string caFile;
    std::string caPath;

    bool requireSessionId{true};
    validation::ValidationMode validation{validation::ValidationMode::Lenient};

    std::string clientName{CLIENT_NAME};
    std::string clientVersion{getVersionString()};

    //==========================================================================================================
    // FromString
    // Purpose: Parses a semicolon-delimited key=value string, e.g.
    //          "url=https://gw.example/mcp; token=abc; allowedTools=ping,echo; executionTimeoutMs=30000".
    //          Unknown keys are ignored with a debug log; unparsable numbers keep the default with a warning.
    //==========================================================================================================
    static GatewayConfig FromString(const std::string& config);

    // Overrides fields from MCPGW_* environment variables (MCPGW_URL, MCPGW_TOKEN, MCPGW_ALLOWED_TOOLS, ...)
    void ApplyEnvironment();

    //==========================================================================================================
    // Validate
    // Purpose: Rejects a missing or unsupported URL and clamps timeouts/backoff to their supported ranges,
    //          logging a warning for every adjustment.
    // Throws:
    //   std::invalid_argument when the URL does not parse.
    //==========================================================================================================
    void Validate();

    GatewayEndpoint Endpoint() const;
    bool IsToolAllowed(const std::string& name) const;

    // Human readable dump with the token replaced by **REDACTED**
    std::string ToDiagnosticString() const;
};

} // namespace config
} // namespace mcpgw
