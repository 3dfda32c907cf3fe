//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolCatalog.h
// Purpose: Immutable snapshot of the allow-list-filtered tools discovered on the gateway
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcpgw/Protocol.h"
#include "mcpgw/validation/ToolSchema.h"

namespace mcpgw {

// One callable tool: the gateway's descriptor plus its translated argument validator.
struct CatalogEntry {
    ToolDescriptor descriptor;
    std::shared_ptr<const validation::ToolSchema> schema;
};

enum class Freshness {
    Fresh,
    Stale
};

inline const char* toString(Freshness f) {
    return f == Freshness::Stale ? "Stale" : "Fresh";
}

//==========================================================================================================
// ToolCatalog
// Purpose: Ordered, immutable tool set. The coordinator publishes it as std::shared_ptr<const ToolCatalog>
//          and swaps the pointer on every refresh, so readers always see one complete generation.
//          A stale copy shares the entry sequence of the snapshot it was derived from.
//==========================================================================================================
class ToolCatalog {
public:
    using Clock = std::chrono::system_clock;

    ToolCatalog();
    ToolCatalog(std::vector<CatalogEntry> entries, std::uint64_t generation,
                Clock::time_point fetchedAt = Clock::now());

    const std::vector<CatalogEntry>& Entries() const { return *entries; }
    std::size_t Size() const { return entries->size(); }
    bool Empty() const { return entries->empty(); }

    // Returns nullptr when the catalog has no tool with this name.
    const CatalogEntry* Find(const std::string& name) const;
    std::vector<std::string> Names() const;

    std::uint64_t Generation() const { return generation; }
    Freshness GetFreshness() const { return freshness; }
    bool IsStale() const { return freshness == Freshness::Stale; }
    Clock::time_point FetchedAt() const { return fetchedAt; }

    // Same entries, generation and fetch time, flagged Stale.
    std::shared_ptr<const ToolCatalog> AsStale() const;

private:
    std::shared_ptr<const std::vector<CatalogEntry>> entries;
    std::shared_ptr<const std::unordered_map<std::string, std::size_t>> index;
    std::uint64_t generation{0};
    Freshness freshness{Freshness::Fresh};
    Clock::time_point fetchedAt{};
};

} // namespace mcpgw
