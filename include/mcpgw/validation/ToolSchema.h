//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolSchema.h
// Purpose: Translates a tool's declared JSON schema into a validator for call arguments
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "mcpgw/JSONRPCTypes.h"
#include "mcpgw/errors/Errors.h"
#include "mcpgw/validation/Validation.h"

namespace mcpgw {
namespace validation {

enum class SchemaKind {
    Any,
    String,
    Integer,
    Number,
    Boolean,
    Array,
    Object,
    Null,
    Union
};

const char* toString(SchemaKind kind);

//==========================================================================================================
// ToolSchema
// Purpose: Immutable validator tree built from a JSON schema. Supports type / type arrays, enum, const,
//          properties, required, additionalProperties (bool or schema), items, anyOf/oneOf (declared
//          order, first match wins), allOf, numeric, string-length and array-length bounds, default.
//          Instances are cheap to copy (shared tree) and safe to use from several threads.
//==========================================================================================================
class ToolSchema {
public:
    struct Node;

    //==========================================================================================================
    // Translate
    // Purpose: Builds the validator. A root that is not an object schema yields a validator accepting any
    //          object; unknown type names translate to "any" with a warning.
    // Throws:
    //   errors::ProtocolError when a keyword has the wrong JSON shape (e.g. "properties": 5).
    //==========================================================================================================
    static ToolSchema Translate(const JSONValue& schema, ValidationMode mode = ValidationMode::Lenient);

    //==========================================================================================================
    // Validate
    // Purpose: Checks call arguments. A null value is treated as an empty argument object.
    // Returns:
    //   The normalized arguments: integral numbers become integers for "integer", integers become doubles
    //   for "number", and defaults of absent optional properties are filled in.
    // Throws:
    //   errors::SchemaValidationError listing every violated constraint with its $.path.
    //==========================================================================================================
    JSONValue Validate(const JSONValue& arguments) const;

    // Non-throwing form; an empty result means the arguments are valid.
    std::vector<errors::SchemaViolation> Check(const JSONValue& arguments) const;

    // Normalized parameter shape for the host framework.
    JSONValue Describe() const;

    std::vector<std::string> RequiredProperties() const;
    ValidationMode Mode() const { return mode; }

private:
    ToolSchema(std::shared_ptr<const Node> root, ValidationMode mode);

    std::shared_ptr<const Node> root;
    ValidationMode mode;
};

} // namespace validation
} // namespace mcpgw
