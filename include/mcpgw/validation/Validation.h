//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Validation.h
// Purpose: Validation modes for translated tool schemas (Lenient by default)
//==========================================================================================================

#pragma once

#include <string>

namespace mcpgw {
namespace validation {

// Lenient passes undeclared object properties through when a schema is silent on additionalProperties;
// Strict rejects them.
enum class ValidationMode {
    Lenient = 0,
    Strict = 1,
};

// Utility to convert to/from string for docs/config friendliness
inline const char* toString(ValidationMode mode) {
    switch (mode) {
        case ValidationMode::Strict: return "Strict";
        case ValidationMode::Lenient:
        default: return "Lenient";
    }
}

inline ValidationMode parseMode(const std::string& s) {
    if (s == "strict" || s == "Strict") return ValidationMode::Strict;
    return ValidationMode::Lenient;
}

} // namespace validation
} // namespace mcpgw
