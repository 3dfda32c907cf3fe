//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Backoff.cpp
// Purpose: ExponentialBackoff implementation
//==========================================================================================================

#include <algorithm>
#include <cmath>

#include "mcpgw/Backoff.h"
#include "logging/Logger.h"

namespace mcpgw {

namespace {
ExponentialBackoff::Policy sanitize(ExponentialBackoff::Policy p) {
    if (p.initialMs == 0) {
        p.initialMs = 1;
    }
    if (!std::isfinite(p.multiplier) || p.multiplier < 1.0) {
        LOG_WARN("Backoff multiplier {} invalid; using 1.0", p.multiplier);
        p.multiplier = 1.0;
    }
    p.maxMs = std::max(p.maxMs, p.initialMs);
    return p;
}
} // namespace

ExponentialBackoff::ExponentialBackoff() : policy(Policy{}) {}

ExponentialBackoff::ExponentialBackoff(const Policy& p) : policy(sanitize(p)) {}

std::chrono::milliseconds ExponentialBackoff::Peek() const {
    const double ceiling = static_cast<double>(policy.maxMs);
    // Exponent capped so pow() stays finite for long outages
    const double exponent = static_cast<double>(std::min(attempt, 64u));
    const double raw = static_cast<double>(policy.initialMs) * std::pow(policy.multiplier, exponent);
    const double delay = std::isfinite(raw) ? std::min(raw, ceiling) : ceiling;
    return std::chrono::milliseconds(static_cast<long long>(delay));
}

std::chrono::milliseconds ExponentialBackoff::Next() {
    auto d = Peek();
    ++attempt;
    LOG_DEBUG("Backoff: next delay {} ms (attempt {})", d.count(), attempt);
    return d;
}

} // namespace mcpgw
