//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolSchema.cpp
// Purpose: JSON schema to validator translation, argument validation and shape description
//==========================================================================================================

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <utility>

#include <fmt/format.h>

#include "mcpgw/validation/ToolSchema.h"
#include "logging/Logger.h"

namespace mcpgw {
namespace validation {

using errors::SchemaViolation;

const char* toString(SchemaKind kind) {
    switch (kind) {
        case SchemaKind::String: return "string";
        case SchemaKind::Integer: return "integer";
        case SchemaKind::Number: return "number";
        case SchemaKind::Boolean: return "boolean";
        case SchemaKind::Array: return "array";
        case SchemaKind::Object: return "object";
        case SchemaKind::Null: return "null";
        case SchemaKind::Union: return "union";
        case SchemaKind::Any:
        default: return "any";
    }
}

struct ToolSchema::Node {
    enum class Extra { Unspecified, Allow, Deny, Schema };

    SchemaKind kind{SchemaKind::Any};
    std::string description;
    std::optional<JSONValue> defaultValue;
    std::optional<std::vector<JSONValue>> enumValues;

    std::optional<double> minimum;
    std::optional<double> maximum;
    std::optional<double> exclusiveMinimum;
    std::optional<double> exclusiveMaximum;
    std::optional<std::size_t> minLength;
    std::optional<std::size_t> maxLength;
    std::optional<std::size_t> minItems;
    std::optional<std::size_t> maxItems;

    // Object: properties sorted by name
    std::vector<std::pair<std::string, std::shared_ptr<const Node>>> properties;
    std::vector<std::string> required;
    Extra extra{Extra::Unspecified};
    std::shared_ptr<const Node> extraSchema;

    // Array
    std::shared_ptr<const Node> items;

    // Union alternatives (anyOf/oneOf/type arrays) and conjunctions (allOf)
    std::vector<std::shared_ptr<const Node>> alternatives;
    std::vector<std::shared_ptr<const Node>> allOf;
};

namespace {

using Node = ToolSchema::Node;
using NodePtr = std::shared_ptr<Node>;

////////////////////////////////////////// Translation //////////////////////////////////////////

[[noreturn]] void malformed(const std::string& path, const std::string& what) {
    throw errors::ProtocolError(fmt::format("Unsupported tool schema at {}: {}", path, what));
}

std::optional<double> numberKeyword(const JSONValue& s, const char* key, const std::string& path) {
    const JSONValue* v = FindMember(s, key);
    if (v == nullptr) return std::nullopt;
    if (v->isInteger()) return static_cast<double>(std::get<int64_t>(v->value));
    if (std::holds_alternative<double>(v->value)) return std::get<double>(v->value);
    malformed(path, fmt::format("\"{}\" must be a number", key));
}

std::optional<std::size_t> countKeyword(const JSONValue& s, const char* key, const std::string& path) {
    auto n = numberKeyword(s, key, path);
    if (!n.has_value()) return std::nullopt;
    if (*n < 0 || std::floor(*n) != *n) {
        malformed(path, fmt::format("\"{}\" must be a non-negative integer", key));
    }
    return static_cast<std::size_t>(*n);
}

SchemaKind kindFromName(const std::string& name, const std::string& path) {
    if (name == "string") return SchemaKind::String;
    if (name == "integer") return SchemaKind::Integer;
    if (name == "number") return SchemaKind::Number;
    if (name == "boolean") return SchemaKind::Boolean;
    if (name == "array") return SchemaKind::Array;
    if (name == "object") return SchemaKind::Object;
    if (name == "null") return SchemaKind::Null;
    LOG_WARN("Tool schema at {} declares unknown type '{}'; accepting any value", path, name);
    return SchemaKind::Any;
}

NodePtr translate(const JSONValue& s, const std::string& path);

void translateBounds(Node& node, const JSONValue& s, const std::string& path) {
    node.minimum = numberKeyword(s, "minimum", path);
    node.maximum = numberKeyword(s, "maximum", path);

    // Draft-4 spells exclusive bounds as booleans modifying minimum/maximum
    const JSONValue* exMin = FindMember(s, "exclusiveMinimum");
    if (exMin != nullptr && exMin->isBool()) {
        if (std::get<bool>(exMin->value) && node.minimum.has_value()) {
            node.exclusiveMinimum = node.minimum;
            node.minimum.reset();
        }
    } else {
        node.exclusiveMinimum = numberKeyword(s, "exclusiveMinimum", path);
    }
    const JSONValue* exMax = FindMember(s, "exclusiveMaximum");
    if (exMax != nullptr && exMax->isBool()) {
        if (std::get<bool>(exMax->value) && node.maximum.has_value()) {
            node.exclusiveMaximum = node.maximum;
            node.maximum.reset();
        }
    } else {
        node.exclusiveMaximum = numberKeyword(s, "exclusiveMaximum", path);
    }

    node.minLength = countKeyword(s, "minLength", path);
    node.maxLength = countKeyword(s, "maxLength", path);
    node.minItems = countKeyword(s, "minItems", path);
    node.maxItems = countKeyword(s, "maxItems", path);
}

void translateObjectKeywords(Node& node, const JSONValue& s, const std::string& path) {
    if (const JSONValue* props = FindMember(s, "properties")) {
        if (!props->isObject()) {
            malformed(path, "\"properties\" must be an object");
        }
        for (const auto& [name, sub] : std::get<JSONValue::Object>(props->value)) {
            node.properties.emplace_back(name, translate(sub ? *sub : JSONValue{true}, path + "." + name));
        }
        std::sort(node.properties.begin(), node.properties.end(),
                  [](const auto& a, const auto& b) { return a.first < b.first; });
    }
    if (const JSONValue* req = FindMember(s, "required")) {
        if (!req->isArray()) {
            malformed(path, "\"required\" must be an array of strings");
        }
        for (const auto& item : std::get<JSONValue::Array>(req->value)) {
            if (!item || !item->isString()) {
                malformed(path, "\"required\" must be an array of strings");
            }
            const auto& name = std::get<std::string>(item->value);
            if (std::find(node.required.begin(), node.required.end(), name) == node.required.end()) {
                node.required.push_back(name);
            }
        }
    }
    if (const JSONValue* extra = FindMember(s, "additionalProperties")) {
        if (extra->isBool()) {
            node.extra = std::get<bool>(extra->value) ? Node::Extra::Allow : Node::Extra::Deny;
        } else if (extra->isObject()) {
            node.extra = Node::Extra::Schema;
            node.extraSchema = translate(*extra, path + ".*");
        } else {
            malformed(path, "\"additionalProperties\" must be a boolean or a schema");
        }
    }
}

//==========================================================================================================
// translate
// Purpose: Recursive translation of one schema object. Keywords that do not apply to the resolved type
//          are kept but ignored during validation.
//==========================================================================================================
NodePtr translate(const JSONValue& s, const std::string& path) {
    auto node = std::make_shared<Node>();
    if (s.isBool()) {
        if (!std::get<bool>(s.value)) {
            node->enumValues = std::vector<JSONValue>{}; // "false" schema admits nothing
        }
        return node;
    }
    if (!s.isObject()) {
        malformed(path, fmt::format("schema must be an object or boolean, got {}", JSONTypeName(s)));
    }
    if (FindMember(s, "$ref") != nullptr) {
        LOG_WARN("Tool schema at {} uses $ref; references are not resolved", path);
    }

    node->description = GetStringMember(s, "description").value_or("");
    if (const JSONValue* d = FindMember(s, "default")) {
        node->defaultValue = *d;
    }
    if (const JSONValue* e = FindMember(s, "enum")) {
        if (!e->isArray()) {
            malformed(path, "\"enum\" must be an array");
        }
        std::vector<JSONValue> values;
        for (const auto& item : std::get<JSONValue::Array>(e->value)) {
            values.push_back(item ? *item : JSONValue{});
        }
        node->enumValues = std::move(values);
    }
    if (const JSONValue* c = FindMember(s, "const")) {
        node->enumValues = std::vector<JSONValue>{*c};
    }
    translateBounds(*node, s, path);
    translateObjectKeywords(*node, s, path);

    if (const JSONValue* items = FindMember(s, "items")) {
        if (items->isObject() || items->isBool()) {
            node->items = translate(*items, path + "[]");
        } else if (items->isArray()) {
            LOG_WARN("Tool schema at {} uses tuple-form items; element types are not checked", path);
        } else {
            malformed(path, "\"items\" must be a schema");
        }
    }

    std::vector<SchemaKind> kinds;
    const JSONValue* type = FindMember(s, "type");
    if (type != nullptr) {
        if (type->isString()) {
            kinds.push_back(kindFromName(std::get<std::string>(type->value), path));
        } else if (type->isArray()) {
            for (const auto& t : std::get<JSONValue::Array>(type->value)) {
                if (!t || !t->isString()) {
                    malformed(path, "\"type\" array must contain strings");
                }
                SchemaKind k = kindFromName(std::get<std::string>(t->value), path);
                if (std::find(kinds.begin(), kinds.end(), k) == kinds.end()) kinds.push_back(k);
            }
        } else {
            malformed(path, "\"type\" must be a string or an array of strings");
        }
    }
    const bool objectShaped = FindMember(s, "properties") != nullptr || FindMember(s, "required") != nullptr ||
                              FindMember(s, "additionalProperties") != nullptr;
    if (kinds.empty()) {
        if (objectShaped) {
            kinds.push_back(SchemaKind::Object);
        } else if (FindMember(s, "items") != nullptr) {
            kinds.push_back(SchemaKind::Array);
        } else {
            kinds.push_back(SchemaKind::Any);
        }
    }
    if (std::find(kinds.begin(), kinds.end(), SchemaKind::Any) != kinds.end()) {
        node->kind = SchemaKind::Any;
    } else if (kinds.size() == 1) {
        node->kind = kinds.front();
    } else {
        std::vector<std::shared_ptr<const Node>> alts;
        for (SchemaKind k : kinds) {
            auto alt = std::make_shared<Node>(*node);
            alt->kind = k;
            alt->description.clear();
            alt->defaultValue.reset();
            alt->enumValues.reset();
            alts.push_back(std::move(alt));
        }
        node->kind = SchemaKind::Union;
        node->alternatives = std::move(alts);
    }

    const char* altKey = "anyOf";
    const JSONValue* alts = FindMember(s, altKey);
    if (alts == nullptr) {
        altKey = "oneOf";
        alts = FindMember(s, altKey);
    }
    if (alts != nullptr) {
        if (!alts->isArray() || std::get<JSONValue::Array>(alts->value).empty()) {
            malformed(path, fmt::format("\"{}\" must be a non-empty array", altKey));
        }
        auto u = std::make_shared<Node>();
        u->kind = SchemaKind::Union;
        u->description = node->description;
        u->defaultValue = node->defaultValue;
        u->enumValues = node->enumValues;
        std::size_t i = 0;
        for (const auto& alt : std::get<JSONValue::Array>(alts->value)) {
            u->alternatives.push_back(translate(alt ? *alt : JSONValue{true}, fmt::format("{}.{}[{}]", path, altKey, i++)));
        }
        // Sibling keywords constrain every alternative
        if (type != nullptr || objectShaped || FindMember(s, "items") != nullptr) {
            node->description.clear();
            node->defaultValue.reset();
            node->enumValues.reset();
            u->allOf.push_back(node);
        }
        node = u;
    }

    if (const JSONValue* all = FindMember(s, "allOf")) {
        if (!all->isArray()) {
            malformed(path, "\"allOf\" must be an array");
        }
        std::size_t i = 0;
        for (const auto& sub : std::get<JSONValue::Array>(all->value)) {
            node->allOf.push_back(translate(sub ? *sub : JSONValue{true}, fmt::format("{}.allOf[{}]", path, i++)));
        }
    }
    return node;
}

////////////////////////////////////////// Validation //////////////////////////////////////////

std::string formatNumber(double v) {
    if (std::floor(v) == v && std::fabs(v) < 1e15) {
        return fmt::format("{}", static_cast<long long>(v));
    }
    return fmt::format("{}", v);
}

std::size_t utf8Length(const std::string& s) {
    std::size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0u) != 0x80u) ++n;
    }
    return n;
}

class Validator {
public:
    explicit Validator(ValidationMode m) : mode(m) {}

    JSONValue validate(const Node& n, const JSONValue& v, const std::string& path, std::vector<SchemaViolation>& out) const {
        const std::size_t before = out.size();
        JSONValue result = v;
        switch (n.kind) {
            case SchemaKind::Any:
                break;
            case SchemaKind::Null:
                if (!v.isNull()) mismatch(n, v, path, out);
                break;
            case SchemaKind::Boolean:
                if (!v.isBool()) mismatch(n, v, path, out);
                break;
            case SchemaKind::String:
                if (!v.isString()) {
                    mismatch(n, v, path, out);
                } else {
                    checkLength(n, std::get<std::string>(v.value), path, out);
                }
                break;
            case SchemaKind::Integer:
                result = validateInteger(n, v, path, out);
                break;
            case SchemaKind::Number:
                result = validateNumber(n, v, path, out);
                break;
            case SchemaKind::Array:
                if (!v.isArray()) {
                    mismatch(n, v, path, out);
                } else {
                    result = validateArray(n, std::get<JSONValue::Array>(v.value), path, out);
                }
                break;
            case SchemaKind::Object:
                if (!v.isObject()) {
                    mismatch(n, v, path, out);
                } else {
                    result = validateObject(n, std::get<JSONValue::Object>(v.value), path, out);
                }
                break;
            case SchemaKind::Union:
                result = validateUnion(n, v, path, out);
                break;
        }

        if (out.size() == before && n.enumValues.has_value()) {
            const auto& allowed = *n.enumValues;
            bool found = std::any_of(allowed.begin(), allowed.end(),
                                     [&](const JSONValue& candidate) { return JSONEquals(candidate, result); });
            if (!found) {
                std::string list;
                for (const auto& a : allowed) {
                    if (!list.empty()) list += ", ";
                    list += SerializeJSON(a);
                }
                out.push_back({path, fmt::format("value {} is not one of [{}]", SerializeJSON(v), list)});
            }
        }

        for (const auto& sub : n.allOf) {
            const std::size_t mark = out.size();
            JSONValue r = validate(*sub, result, path, out);
            if (out.size() == mark) {
                result = std::move(r);
            }
        }
        return result;
    }

private:
    static void mismatch(const Node& n, const JSONValue& v, const std::string& path, std::vector<SchemaViolation>& out) {
        out.push_back({path, fmt::format("expected {}, got {}", toString(n.kind), JSONTypeName(v))});
    }

    static void checkBounds(const Node& n, double x, const std::string& path, std::vector<SchemaViolation>& out) {
        if (n.minimum.has_value() && x < *n.minimum) {
            out.push_back({path, fmt::format("must be >= {}", formatNumber(*n.minimum))});
        }
        if (n.maximum.has_value() && x > *n.maximum) {
            out.push_back({path, fmt::format("must be <= {}", formatNumber(*n.maximum))});
        }
        if (n.exclusiveMinimum.has_value() && x <= *n.exclusiveMinimum) {
            out.push_back({path, fmt::format("must be > {}", formatNumber(*n.exclusiveMinimum))});
        }
        if (n.exclusiveMaximum.has_value() && x >= *n.exclusiveMaximum) {
            out.push_back({path, fmt::format("must be < {}", formatNumber(*n.exclusiveMaximum))});
        }
    }

    static void checkLength(const Node& n, const std::string& s, const std::string& path, std::vector<SchemaViolation>& out) {
        const std::size_t len = utf8Length(s);
        if (n.minLength.has_value() && len < *n.minLength) {
            out.push_back({path, fmt::format("length {} is shorter than minLength {}", len, *n.minLength)});
        }
        if (n.maxLength.has_value() && len > *n.maxLength) {
            out.push_back({path, fmt::format("length {} exceeds maxLength {}", len, *n.maxLength)});
        }
    }

    static JSONValue validateInteger(const Node& n, const JSONValue& v, const std::string& path, std::vector<SchemaViolation>& out) {
        if (v.isInteger()) {
            checkBounds(n, static_cast<double>(std::get<int64_t>(v.value)), path, out);
            return v;
        }
        if (std::holds_alternative<double>(v.value)) {
            const double d = std::get<double>(v.value);
            // 2^63 is exactly representable, so the upper check is strict
            if (std::isfinite(d) && std::floor(d) == d &&
                d >= static_cast<double>(std::numeric_limits<int64_t>::min()) && d < 9223372036854775808.0) {
                checkBounds(n, d, path, out);
                return JSONValue(static_cast<int64_t>(d));
            }
            out.push_back({path, "expected integer, got non-integral number"});
            return v;
        }
        mismatch(n, v, path, out);
        return v;
    }

    static JSONValue validateNumber(const Node& n, const JSONValue& v, const std::string& path, std::vector<SchemaViolation>& out) {
        if (v.isInteger()) {
            const double d = static_cast<double>(std::get<int64_t>(v.value));
            checkBounds(n, d, path, out);
            return JSONValue(d);
        }
        if (std::holds_alternative<double>(v.value)) {
            checkBounds(n, std::get<double>(v.value), path, out);
            return v;
        }
        mismatch(n, v, path, out);
        return v;
    }

    JSONValue validateArray(const Node& n, const JSONValue::Array& arr, const std::string& path, std::vector<SchemaViolation>& out) const {
        if (n.minItems.has_value() && arr.size() < *n.minItems) {
            out.push_back({path, fmt::format("has {} items, fewer than minItems {}", arr.size(), *n.minItems)});
        }
        if (n.maxItems.has_value() && arr.size() > *n.maxItems) {
            out.push_back({path, fmt::format("has {} items, more than maxItems {}", arr.size(), *n.maxItems)});
        }
        JSONValue::Array normalized;
        normalized.reserve(arr.size());
        for (std::size_t i = 0; i < arr.size(); ++i) {
            const JSONValue item = arr[i] ? *arr[i] : JSONValue{};
            if (n.items) {
                normalized.push_back(std::make_shared<JSONValue>(validate(*n.items, item, fmt::format("{}[{}]", path, i), out)));
            } else {
                normalized.push_back(std::make_shared<JSONValue>(item));
            }
        }
        return JSONValue{std::move(normalized)};
    }

    JSONValue validateObject(const Node& n, const JSONValue::Object& obj, const std::string& path, std::vector<SchemaViolation>& out) const {
        JSONValue::Object normalized;
        for (const auto& name : n.required) {
            if (obj.find(name) == obj.end()) {
                out.push_back({path + "." + name, "required property is missing"});
            }
        }
        for (const auto& [name, sub] : n.properties) {
            auto it = obj.find(name);
            if (it != obj.end()) {
                const JSONValue value = it->second ? *it->second : JSONValue{};
                normalized[name] = std::make_shared<JSONValue>(validate(*sub, value, path + "." + name, out));
            } else if (sub->defaultValue.has_value() &&
                       std::find(n.required.begin(), n.required.end(), name) == n.required.end()) {
                normalized[name] = std::make_shared<JSONValue>(*sub->defaultValue);
            }
        }

        std::vector<std::string> undeclared;
        for (const auto& kv : obj) {
            bool declared = std::any_of(n.properties.begin(), n.properties.end(),
                                        [&](const auto& p) { return p.first == kv.first; });
            if (!declared) undeclared.push_back(kv.first);
        }
        std::sort(undeclared.begin(), undeclared.end());
        for (const auto& key : undeclared) {
            const auto& raw = obj.at(key);
            const JSONValue value = raw ? *raw : JSONValue{};
            switch (n.extra) {
                case Node::Extra::Allow:
                    normalized[key] = std::make_shared<JSONValue>(value);
                    break;
                case Node::Extra::Deny:
                    out.push_back({path + "." + key, "unexpected property"});
                    break;
                case Node::Extra::Schema:
                    normalized[key] = std::make_shared<JSONValue>(validate(*n.extraSchema, value, path + "." + key, out));
                    break;
                case Node::Extra::Unspecified:
                    // Fragments without properties (e.g. {"required":[...]} inside anyOf) only constrain
                    if (mode == ValidationMode::Strict && !n.properties.empty()) {
                        out.push_back({path + "." + key, "unexpected property (strict validation)"});
                    } else {
                        normalized[key] = std::make_shared<JSONValue>(value);
                    }
                    break;
            }
        }
        return JSONValue{std::move(normalized)};
    }

    JSONValue validateUnion(const Node& n, const JSONValue& v, const std::string& path, std::vector<SchemaViolation>& out) const {
        std::string reasons;
        for (std::size_t i = 0; i < n.alternatives.size(); ++i) {
            std::vector<SchemaViolation> scratch;
            JSONValue r = validate(*n.alternatives[i], v, path, scratch);
            if (scratch.empty()) {
                return r;
            }
            std::string why;
            for (const auto& s : scratch) {
                if (!why.empty()) why += ", ";
                why += (s.path == path) ? s.message : s.path + " " + s.message;
            }
            if (!reasons.empty()) reasons += "; ";
            reasons += fmt::format("#{} ({}): {}", i + 1, toString(n.alternatives[i]->kind), why);
        }
        out.push_back({path, fmt::format("value matched none of {} alternatives: {}", n.alternatives.size(), reasons)});
        return v;
    }

    ValidationMode mode;
};

////////////////////////////////////////// Description //////////////////////////////////////////

std::shared_ptr<JSONValue> numberValue(double v) {
    if (std::floor(v) == v && std::fabs(v) < 1e15) {
        return std::make_shared<JSONValue>(static_cast<int64_t>(v));
    }
    return std::make_shared<JSONValue>(v);
}

JSONValue describe(const Node& n) {
    JSONValue::Object o;
    if (n.kind != SchemaKind::Any && n.kind != SchemaKind::Union) {
        o["type"] = std::make_shared<JSONValue>(std::string(toString(n.kind)));
    }
    if (!n.description.empty()) {
        o["description"] = std::make_shared<JSONValue>(n.description);
    }
    if (n.defaultValue.has_value()) {
        o["default"] = std::make_shared<JSONValue>(*n.defaultValue);
    }
    if (n.enumValues.has_value()) {
        JSONValue::Array values;
        for (const auto& e : *n.enumValues) values.push_back(std::make_shared<JSONValue>(e));
        o["enum"] = std::make_shared<JSONValue>(std::move(values));
    }
    if (n.minimum) o["minimum"] = numberValue(*n.minimum);
    if (n.maximum) o["maximum"] = numberValue(*n.maximum);
    if (n.exclusiveMinimum) o["exclusiveMinimum"] = numberValue(*n.exclusiveMinimum);
    if (n.exclusiveMaximum) o["exclusiveMaximum"] = numberValue(*n.exclusiveMaximum);
    if (n.minLength) o["minLength"] = std::make_shared<JSONValue>(static_cast<int64_t>(*n.minLength));
    if (n.maxLength) o["maxLength"] = std::make_shared<JSONValue>(static_cast<int64_t>(*n.maxLength));
    if (n.minItems) o["minItems"] = std::make_shared<JSONValue>(static_cast<int64_t>(*n.minItems));
    if (n.maxItems) o["maxItems"] = std::make_shared<JSONValue>(static_cast<int64_t>(*n.maxItems));

    if (n.kind == SchemaKind::Object) {
        JSONValue::Object props;
        for (const auto& [name, sub] : n.properties) {
            props[name] = std::make_shared<JSONValue>(describe(*sub));
        }
        o["properties"] = std::make_shared<JSONValue>(std::move(props));
        if (!n.required.empty()) {
            JSONValue::Array req;
            for (const auto& r : n.required) req.push_back(std::make_shared<JSONValue>(r));
            o["required"] = std::make_shared<JSONValue>(std::move(req));
        }
        if (n.extra == Node::Extra::Allow) {
            o["additionalProperties"] = std::make_shared<JSONValue>(true);
        } else if (n.extra == Node::Extra::Deny) {
            o["additionalProperties"] = std::make_shared<JSONValue>(false);
        } else if (n.extra == Node::Extra::Schema) {
            o["additionalProperties"] = std::make_shared<JSONValue>(describe(*n.extraSchema));
        }
    }
    if (n.kind == SchemaKind::Array && n.items) {
        o["items"] = std::make_shared<JSONValue>(describe(*n.items));
    }
    if (n.kind == SchemaKind::Union) {
        JSONValue::Array alts;
        for (const auto& a : n.alternatives) alts.push_back(std::make_shared<JSONValue>(describe(*a)));
        o["anyOf"] = std::make_shared<JSONValue>(std::move(alts));
    }
    if (!n.allOf.empty()) {
        JSONValue::Array all;
        for (const auto& a : n.allOf) all.push_back(std::make_shared<JSONValue>(describe(*a)));
        o["allOf"] = std::make_shared<JSONValue>(std::move(all));
    }
    return JSONValue{std::move(o)};
}

// true when some branch of n can accept a JSON object
bool admitsObject(const Node& n) {
    const auto admits = [](const auto& sub) { return admitsObject(*sub); };
    if (!std::all_of(n.allOf.begin(), n.allOf.end(), admits)) return false;
    if (n.kind == SchemaKind::Object || n.kind == SchemaKind::Any) return true;
    return n.kind == SchemaKind::Union && std::any_of(n.alternatives.begin(), n.alternatives.end(), admits);
}

//==========================================================================================================
// objectRoot
// Purpose: Shapes a translated root so that it validates argument objects.
//   - an object root is kept as is;
//   - anyOf/oneOf beside object keywords: the object part becomes the root and the alternatives a
//     conjunction on it, so properties and required stay visible to Describe();
//   - a bare union or allOf that can match an object is kept as a conjunction on a permissive object;
//   - anything else (untyped or primitive roots) accepts any argument object.
//==========================================================================================================
NodePtr objectRoot(NodePtr node) {
    if (node->kind == SchemaKind::Object) {
        return node;
    }
    if (node->kind == SchemaKind::Union && !node->allOf.empty() && node->allOf.front()->kind == SchemaKind::Object) {
        auto root = std::make_shared<Node>(*node->allOf.front());
        root->description = node->description;
        root->defaultValue = node->defaultValue;

        auto alternatives = std::make_shared<Node>(*node);
        alternatives->description.clear();
        alternatives->defaultValue.reset();
        alternatives->enumValues.reset();
        alternatives->allOf.clear();
        root->allOf.push_back(std::move(alternatives));
        root->allOf.insert(root->allOf.end(), node->allOf.begin() + 1, node->allOf.end());
        return root;
    }

    auto obj = std::make_shared<Node>();
    obj->kind = SchemaKind::Object;
    obj->description = node->description;
    obj->extra = Node::Extra::Allow;
    const bool constrained = node->kind == SchemaKind::Union || !node->allOf.empty();
    if (constrained && admitsObject(*node)) {
        node->description.clear();
        obj->allOf.push_back(std::move(node));
    } else if (node->kind != SchemaKind::Any) {
        LOG_WARN("Tool schema root is {} rather than object; accepting any argument object", toString(node->kind));
    }
    return obj;
}

} // namespace

////////////////////////////////////////// ToolSchema //////////////////////////////////////////

ToolSchema::ToolSchema(std::shared_ptr<const Node> r, ValidationMode m) : root(std::move(r)), mode(m) {}

ToolSchema ToolSchema::Translate(const JSONValue& schema, ValidationMode mode) {
    FUNC_SCOPE();
    NodePtr node = schema.isNull() ? std::make_shared<Node>() : translate(schema, "$");
    return ToolSchema(objectRoot(std::move(node)), mode);
}

std::vector<SchemaViolation> ToolSchema::Check(const JSONValue& arguments) const {
    std::vector<SchemaViolation> violations;
    const JSONValue args = arguments.isNull() ? JSONValue{JSONValue::Object{}} : arguments;
    (void)Validator(mode).validate(*root, args, "$", violations);
    return violations;
}

JSONValue ToolSchema::Validate(const JSONValue& arguments) const {
    std::vector<SchemaViolation> violations;
    const JSONValue args = arguments.isNull() ? JSONValue{JSONValue::Object{}} : arguments;
    JSONValue normalized = Validator(mode).validate(*root, args, "$", violations);
    if (!violations.empty()) {
        LOG_DEBUG("Argument validation failed with {} violation(s)", violations.size());
        throw errors::SchemaValidationError(std::move(violations));
    }
    return normalized;
}

JSONValue ToolSchema::Describe() const {
    return describe(*root);
}

std::vector<std::string> ToolSchema::RequiredProperties() const {
    return root->required;
}

} // namespace validation
} // namespace mcpgw
