//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgw/ToolCatalog.cpp
// Purpose: Tool catalog snapshot
//==========================================================================================================

#include "mcpgw/ToolCatalog.h"

namespace mcpgw {

ToolCatalog::ToolCatalog()
    : entries(std::make_shared<const std::vector<CatalogEntry>>()),
      index(std::make_shared<const std::unordered_map<std::string, std::size_t>>()) {}

ToolCatalog::ToolCatalog(std::vector<CatalogEntry> list, std::uint64_t gen, Clock::time_point fetched)
    : generation(gen), fetchedAt(fetched) {
    auto byName = std::make_shared<std::unordered_map<std::string, std::size_t>>();
    for (std::size_t i = 0; i < list.size(); ++i) {
        byName->emplace(list[i].descriptor.name, i);
    }
    entries = std::make_shared<const std::vector<CatalogEntry>>(std::move(list));
    index = std::move(byName);
}

const CatalogEntry* ToolCatalog::Find(const std::string& name) const {
    auto it = index->find(name);
    if (it == index->end()) {
        return nullptr;
    }
    return &(*entries)[it->second];
}

std::vector<std::string> ToolCatalog::Names() const {
    std::vector<std::string> names;
    names.reserve(entries->size());
    for (const auto& e : *entries) {
        names.push_back(e.descriptor.name);
    }
    return names;
}

std::shared_ptr<const ToolCatalog> ToolCatalog::AsStale() const {
    auto copy = std::make_shared<ToolCatalog>(*this);
    copy->freshness = Freshness::Stale;
    return copy;
}

} // namespace mcpgw
