//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Backoff.h
// Purpose: Bounded exponential backoff used between failed catalog refresh attempts
//==========================================================================================================

#pragma once

#include <chrono>

namespace mcpgw {

//==========================================================================================================
// ExponentialBackoff
// Purpose: Produces delays min(initial * multiplier^n, ceiling) for n = 0, 1, 2, ... The sequence is
//          non-decreasing and never exceeds the ceiling. Not thread-safe; owned by one scheduler.
//==========================================================================================================
class ExponentialBackoff {
public:
    struct Policy {
        unsigned int initialMs{5000};
        double multiplier{2.0};
        unsigned int maxMs{300000};
    };

    ExponentialBackoff();
    explicit ExponentialBackoff(const Policy& policy);

    // Returns the delay for the current attempt and advances the attempt counter.
    std::chrono::milliseconds Next();

    // Delay Next() would return, without advancing.
    std::chrono::milliseconds Peek() const;

    void Reset() { attempt = 0; }
    unsigned int Attempts() const { return attempt; }
    const Policy& GetPolicy() const { return policy; }

private:
    Policy policy;
    unsigned int attempt{0};
};

} // namespace mcpgw
