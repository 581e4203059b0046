// File: src/supervised/map_field.cpp
#include "supervised/map_field.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace resonance {

std::optional<MapTarget> MapField::Lookup(CategoryIndex source) const {
    auto it = forward_.find(source);
    if (it == forward_.end()) {
        return std::nullopt;
    }
    return it->second.target;
}

bool MapField::Associate(CategoryIndex source, MapTarget target) {
    auto it = forward_.find(source);
    if (it != forward_.end()) {
        if (it->second.target == target) {
            return false;
        }
        throw std::logic_error(
            "Map field: category " + std::to_string(source) +
            " is already mapped to " + std::to_string(it->second.target) +
            ", refusing to remap to " + std::to_string(target));
    }

    forward_.emplace(source, Entry{target, 0});
    inverse_[target].insert(source);
    return true;
}

void MapField::Reinforce(CategoryIndex source) {
    auto it = forward_.find(source);
    if (it == forward_.end()) {
        throw std::out_of_range(
            "Map field: category " + std::to_string(source) + " has no association");
    }
    ++it->second.reinforcements;
}

bool MapField::Contains(CategoryIndex source) const {
    return forward_.find(source) != forward_.end();
}

std::vector<CategoryIndex> MapField::GetSources(MapTarget target) const {
    auto it = inverse_.find(target);
    if (it == inverse_.end()) {
        return {};
    }
    return std::vector<CategoryIndex>(it->second.begin(), it->second.end());
}

uint64_t MapField::GetReinforcementCount(CategoryIndex source) const {
    auto it = forward_.find(source);
    return it == forward_.end() ? 0 : it->second.reinforcements;
}

std::vector<std::pair<CategoryIndex, MapTarget>> MapField::Entries() const {
    std::vector<std::pair<CategoryIndex, MapTarget>> entries;
    entries.reserve(forward_.size());
    for (const auto& [source, entry] : forward_) {
        entries.emplace_back(source, entry.target);
    }
    std::sort(entries.begin(), entries.end());
    return entries;
}

size_t MapField::Remap(const std::vector<CategoryIndex>& remap) {
    for (const auto& [source, entry] : forward_) {
        if (source >= remap.size()) {
            throw std::out_of_range(
                "Map field: category " + std::to_string(source) +
                " is outside a remap of " + std::to_string(remap.size()));
        }
    }

    std::unordered_map<CategoryIndex, Entry> forward;
    std::map<MapTarget, std::set<CategoryIndex>> inverse;
    size_t dropped = 0;
    for (const auto& [source, entry] : forward_) {
        CategoryIndex renumbered = remap[source];
        if (renumbered == kNoCategory) {
            ++dropped;
            continue;
        }
        forward.emplace(renumbered, entry);
        inverse[entry.target].insert(renumbered);
    }

    forward_ = std::move(forward);
    inverse_ = std::move(inverse);
    return dropped;
}

void MapField::Clear() {
    forward_.clear();
    inverse_.clear();
}

} // namespace resonance
