// File: src/supervised/map_field.hpp
#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <unordered_map>
#include <utility>
#include <vector>

namespace resonance {

/// MapField: Single-valued association from input categories to targets
///
/// The forward map sends an input-module category to one target (an
/// output-module category or a label id). An existing association is
/// never replaced: conflicts are resolved upstream by match tracking,
/// which commits a different input category instead. The inverse map
/// (target -> sources) is kept for introspection.
///
/// Not thread-safe; owned by a single Artmap.
class MapField {
public:
    MapField() = default;

    /// Target of an input category, if associated
    std::optional<MapTarget> Lookup(CategoryIndex source) const;

    /// Create a new association
    ///
    /// @return true if inserted, false if the same association already exists
    /// @throws std::logic_error if `source` is mapped to a different target
    bool Associate(CategoryIndex source, MapTarget target);

    /// Count a consistent re-activation of an association
    /// @throws std::out_of_range if `source` has no association
    void Reinforce(CategoryIndex source);

    bool Contains(CategoryIndex source) const;

    /// Every input category mapped to `target`, ascending
    std::vector<CategoryIndex> GetSources(MapTarget target) const;

    /// Number of consistent re-activations of `source` (0 if unmapped)
    uint64_t GetReinforcementCount(CategoryIndex source) const;

    /// All associations ordered by source
    std::vector<std::pair<CategoryIndex, MapTarget>> Entries() const;

    /// Renumber sources after the input module was pruned
    ///
    /// Associations whose source maps to kNoCategory are dropped; the
    /// others keep their target and reinforcement count.
    /// @return Number of associations dropped
    /// @throws std::out_of_range if a source lies outside the remap
    size_t Remap(const std::vector<CategoryIndex>& remap);

    /// Number of distinct targets
    size_t TargetCount() const { return inverse_.size(); }

    size_t Size() const { return forward_.size(); }
    bool IsEmpty() const { return forward_.empty(); }

    void Clear();

private:
    struct Entry {
        MapTarget target;
        uint64_t reinforcements;
    };

    std::unordered_map<CategoryIndex, Entry> forward_;
    std::map<MapTarget, std::set<CategoryIndex>> inverse_;
};

} // namespace resonance
