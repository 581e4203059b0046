// File: src/category/category.hpp
#pragma once

#include "core/types.hpp"
#include <chrono>
#include <cstdint>

namespace resonance {

// Category: Learned prototype plus bookkeeping
//
// Owned exclusively by the CategoryStore that created it. Everything
// outside the store refers to a category by its CategoryIndex.
struct Category {
    WeightVector weights;
    CategoryIndex creation_index{kNoCategory};  // Append sequence number, kept across prunes
    uint64_t usage_count{0};  // Commit plus resonant updates
    std::chrono::steady_clock::time_point last_used_at{};
};

// LearningState: Per-category learning-rule side state
//
// Lives in a side array of the CategoryStore, indexed like the
// categories themselves. Only BCM reads or writes it.
struct LearningState {
    static constexpr double kInitialSlidingThreshold = 0.1;

    double sliding_threshold{kInitialSlidingThreshold};
};

} // namespace resonance
