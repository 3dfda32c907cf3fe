//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GatewayConfig.cpp
// Purpose: key=value parsing, MCPGW_* overrides, range clamping and redacted diagnostics
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

#include <fmt/format.h>

#include "mcpgw/config/GatewayConfig.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace mcpgw {
namespace config {

namespace {

std::string trim(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) {
        ++b;
    }
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) {
        --e;
    }
    return s.substr(b, e - b);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> splitList(const std::string& s) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= s.size()) {
        std::size_t comma = s.find(',', start);
        if (comma == std::string::npos) comma = s.size();
        std::string item = trim(s.substr(start, comma - start));
        if (!item.empty() && std::find(out.begin(), out.end(), item) == out.end()) {
            out.push_back(item);
        }
        start = comma + 1;
    }
    return out;
}

void parseUnsigned(const std::string& key, const std::string& val, unsigned int& target) {
    try {
        std::size_t used = 0;
        unsigned long v = std::stoul(val, &used);
        if (used != val.size() || val.find('-') != std::string::npos) {
            throw std::invalid_argument("trailing characters");
        }
        target = static_cast<unsigned int>(std::min<unsigned long>(v, 0xFFFFFFFFul));
    } catch (const std::exception& e) {
        LOG_WARN("Config: ignoring invalid value for {}: '{}' ({}); keeping {}", key, val, e.what(), target);
    }
}

void parseDouble(const std::string& key, const std::string& val, double& target) {
    try {
        std::size_t used = 0;
        double v = std::stod(val, &used);
        if (used != val.size() || !std::isfinite(v)) {
            throw std::invalid_argument("not a finite number");
        }
        target = v;
    } catch (const std::exception& e) {
        LOG_WARN("Config: ignoring invalid value for {}: '{}' ({}); keeping {}", key, val, e.what(), target);
    }
}

void parseBool(const std::string& key, const std::string& val, bool& target) {
    const std::string v = lower(val);
    if (v == "1" || v == "true" || v == "yes" || v == "on") {
        target = true;
    } else if (v == "0" || v == "false" || v == "no" || v == "off") {
        target = false;
    } else {
        LOG_WARN("Config: ignoring invalid boolean for {}: '{}'", key, val);
    }
}

void applyKey(GatewayConfig& cfg, const std::string& key, const std::string& val) {
    if (key == "url") {
        cfg.url = val;
    } else if (key == "token" || key == "bearerToken") {
        cfg.token = val;
    } else if (key == "connectTimeoutMs") {
        parseUnsigned(key, val, cfg.connectTimeoutMs);
    } else if (key == "refreshTimeoutMs") {
        parseUnsigned(key, val, cfg.refreshTimeoutMs);
    } else if (key == "executionTimeoutMs") {
        parseUnsigned(key, val, cfg.executionTimeoutMs);
    } else if (key == "refreshIntervalMs") {
        parseUnsigned(key, val, cfg.refreshIntervalMs);
    } else if (key == "allowedTools") {
        cfg.allowedTools = splitList(val);
    } else if (key == "blockedTools") {
        cfg.blockedTools = splitList(val);
    } else if (key == "backoffInitialMs") {
        parseUnsigned(key, val, cfg.backoffInitialMs);
    } else if (key == "backoffMultiplier") {
        parseDouble(key, val, cfg.backoffMultiplier);
    } else if (key == "backoffMaxMs") {
        parseUnsigned(key, val, cfg.backoffMaxMs);
    } else if (key == "maxConsecutiveFailures") {
        parseUnsigned(key, val, cfg.maxConsecutiveFailures);
    } else if (key == "tlsVerify") {
        parseBool(key, val, cfg.tlsVerify);
    } else if (key == "caFile") {
        cfg.caFile = val;
    } else if (key == "caPath") {
        cfg.caPath = val;
    } else if (key == "requireSessionId") {
        parseBool(key, val, cfg.requireSessionId);
    } else if (key == "validation") {
        cfg.validation = validation::parseMode(val);
    } else if (key == "clientName") {
        cfg.clientName = val;
    } else if (key == "clientVersion") {
        cfg.clientVersion = val;
    } else {
        LOG_DEBUG("Config: ignoring unknown key '{}'", key);
    }
}

unsigned int clampMs(const char* name, unsigned int value, unsigned int lo, unsigned int hi) {
    unsigned int clamped = std::clamp(value, lo, hi);
    if (clamped != value) {
        LOG_WARN("Config: {}={} outside [{}, {}]; using {}", name, value, lo, hi, clamped);
    }
    return clamped;
}

std::string joinList(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& s : items) {
        if (!out.empty()) out += ",";
        out += s;
    }
    return out;
}

} // namespace

GatewayEndpoint ParseGatewayUrl(const std::string& url) {
    const std::string u = trim(url);
    std::size_t schemeEnd = u.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Gateway URL must start with http:// or https://: '" + u + "'");
    }
    GatewayEndpoint ep;
    ep.scheme = lower(u.substr(0, schemeEnd));
    if (ep.scheme != "http" && ep.scheme != "https") {
        throw std::invalid_argument("Unsupported gateway URL scheme: " + ep.scheme);
    }
    std::size_t pos = schemeEnd + 3;
    std::size_t slash = u.find_first_of("/?#", pos);
    std::string hostPort = u.substr(pos, slash == std::string::npos ? std::string::npos : slash - pos);
    if (slash == std::string::npos) {
        ep.path = "/";
    } else {
        ep.path = u.substr(slash);
        if (ep.path[0] != '/') ep.path.insert(0, "/");
        auto hash = ep.path.find('#');
        if (hash != std::string::npos) ep.path.erase(hash);
    }
    if (hostPort.find('@') != std::string::npos) {
        throw std::invalid_argument("Gateway URL must not embed credentials");
    }

    std::size_t colon = std::string::npos;
    if (!hostPort.empty() && hostPort[0] == '[') {
        std::size_t close = hostPort.find(']');
        if (close == std::string::npos) {
            throw std::invalid_argument("Malformed IPv6 host in gateway URL: " + hostPort);
        }
        ep.host = hostPort.substr(1, close - 1);
        if (close + 1 < hostPort.size()) {
            if (hostPort[close + 1] != ':') {
                throw std::invalid_argument("Malformed gateway URL authority: " + hostPort);
            }
            colon = close + 1;
        }
    } else {
        colon = hostPort.find(':');
        ep.host = hostPort.substr(0, colon);
    }
    if (ep.host.empty()) {
        throw std::invalid_argument("Gateway URL lacks a host: '" + u + "'");
    }
    if (colon != std::string::npos) {
        ep.port = hostPort.substr(colon + 1);
        if (ep.port.empty() || ep.port.size() > 5 ||
            !std::all_of(ep.port.begin(), ep.port.end(), [](unsigned char c){ return std::isdigit(c) != 0; }) ||
            std::stoul(ep.port) == 0 || std::stoul(ep.port) > 65535) {
            throw std::invalid_argument("Invalid port in gateway URL: '" + ep.port + "'");
        }
    } else {
        ep.port = ep.secure() ? "443" : "80";
    }
    return ep;
}

GatewayConfig GatewayConfig::FromString(const std::string& config) {
    GatewayConfig cfg;
    std::size_t start = 0;
    while (start < config.size()) {
        std::size_t sep = config.find(';', start);
        if (sep == std::string::npos) {
            sep = config.size();
        }
        std::string kv = trim(config.substr(start, sep - start));
        if (!kv.empty()) {
            std::size_t eq = kv.find('=');
            if (eq != std::string::npos) {
                applyKey(cfg, trim(kv.substr(0, eq)), trim(kv.substr(eq + 1)));
            } else {
                LOG_WARN("Config: ignoring malformed entry '{}'", kv);
            }
        }
        start = sep + 1;
    }
    return cfg;
}

void GatewayConfig::ApplyEnvironment() {
    struct Override { const char* env; const char* key; };
    static const Override kOverrides[] = {
        {"MCPGW_URL", "url"},
        {"MCPGW_TOKEN", "token"},
        {"MCPGW_CONNECT_TIMEOUT_MS", "connectTimeoutMs"},
        {"MCPGW_REFRESH_TIMEOUT_MS", "refreshTimeoutMs"},
        {"MCPGW_EXECUTION_TIMEOUT_MS", "executionTimeoutMs"},
        {"MCPGW_REFRESH_INTERVAL_MS", "refreshIntervalMs"},
        {"MCPGW_ALLOWED_TOOLS", "allowedTools"},
        {"MCPGW_BLOCKED_TOOLS", "blockedTools"},
        {"MCPGW_MAX_CONSECUTIVE_FAILURES", "maxConsecutiveFailures"},
        {"MCPGW_TLS_VERIFY", "tlsVerify"},
        {"MCPGW_CA_FILE", "caFile"},
        {"MCPGW_CA_PATH", "caPath"},
        {"MCPGW_VALIDATION", "validation"},
    };
    for (const auto& o : kOverrides) {
        auto v = GetEnvOptional(o.env);
        if (v.has_value()) {
            LOG_DEBUG("Config: {} overrides {}", o.env, o.key);
            applyKey(*this, o.key, trim(*v));
        }
    }
}

void GatewayConfig::Validate() {
    FUNC_SCOPE();
    if (trim(url).empty()) {
        throw std::invalid_argument("Gateway URL is required");
    }
    (void)ParseGatewayUrl(url);

    connectTimeoutMs = clampMs("connectTimeoutMs", connectTimeoutMs, kMinConnectTimeoutMs, kMaxConnectTimeoutMs);
    executionTimeoutMs = clampMs("executionTimeoutMs", executionTimeoutMs, kMinExecutionTimeoutMs, kMaxExecutionTimeoutMs);
    if (refreshTimeoutMs == 0) {
        LOG_WARN("Config: refreshTimeoutMs=0; using {}", connectTimeoutMs);
        refreshTimeoutMs = connectTimeoutMs;
    }
    if (backoffInitialMs == 0) {
        LOG_WARN("Config: backoffInitialMs=0; using 1");
        backoffInitialMs = 1;
    }
    if (backoffMultiplier < 1.0) {
        LOG_WARN("Config: backoffMultiplier={} below 1.0; using 1.0", backoffMultiplier);
        backoffMultiplier = 1.0;
    }
    if (backoffMaxMs < backoffInitialMs) {
        LOG_WARN("Config: backoffMaxMs={} below backoffInitialMs={}; raising", backoffMaxMs, backoffInitialMs);
        backoffMaxMs = backoffInitialMs;
    }
    if (clientName.empty()) clientName = CLIENT_NAME;
    if (clientVersion.empty()) clientVersion = getVersionString();
}

GatewayEndpoint GatewayConfig::Endpoint() const {
    return ParseGatewayUrl(url);
}

bool GatewayConfig::IsToolAllowed(const std::string& name) const {
    if (std::find(blockedTools.begin(), blockedTools.end(), name) != blockedTools.end()) {
        return false;
    }
    if (!allowedTools.has_value()) {
        return true;
    }
    return std::find(allowedTools->begin(), allowedTools->end(), name) != allowedTools->end();
}

std::string GatewayConfig::ToDiagnosticString() const {
    return fmt::format(
        "url={}; token={}; connectTimeoutMs={}; refreshTimeoutMs={}; executionTimeoutMs={}; refreshIntervalMs={}; "
        "allowedTools={}; blockedTools={}; backoffInitialMs={}; backoffMultiplier={}; backoffMaxMs={}; "
        "maxConsecutiveFailures={}; tlsVerify={}; caFile={}; caPath={}; requireSessionId={}; validation={}; client={}/{}",
        url, token.empty() ? "<none>" : "**REDACTED**", connectTimeoutMs, refreshTimeoutMs, executionTimeoutMs,
        refreshIntervalMs, allowedTools.has_value() ? "[" + joinList(*allowedTools) + "]" : std::string("<all>"),
        "[" + joinList(blockedTools) + "]", backoffInitialMs, backoffMultiplier, backoffMaxMs,
        maxConsecutiveFailures, tlsVerify, caFile, caPath, requireSessionId, validation::toString(validation),
        clientName, clientVersion);
}

} // namespace config
} // namespace mcpgw
