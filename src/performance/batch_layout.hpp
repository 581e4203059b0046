// File: src/performance/batch_layout.hpp
//
// Pattern-major <-> dimension-major batch layouts
//
// Pattern-major:   rows[i][d]  (one row per pattern)
// Dimension-major: rows[d][i]  (one row per component, one lane per pattern)
//
// Dimension-major rows put the same component of every pattern next to
// each other, so an element-wise operation runs as a tight loop over a
// contiguous row that the compiler can vectorize.

#pragma once

#include "core/pattern.hpp"
#include "performance/shunting_dynamics.hpp"
#include <vector>

namespace resonance {

/// Rectangular batch stored as rows
using BatchMatrix = std::vector<std::vector<double>>;

/// Layout transposition helpers
class BatchLayout {
public:
    /// @throws std::invalid_argument if empty or dimensions differ
    static BatchMatrix ToDimensionMajor(const BatchMatrix& pattern_major);
    static BatchMatrix ToDimensionMajor(const std::vector<Pattern>& patterns);

    /// Inverse of ToDimensionMajor
    /// @throws std::invalid_argument if empty or row lengths differ
    static BatchMatrix ToPatternMajor(const BatchMatrix& dimension_major);
};

/// Batch of activation vectors held dimension-major
///
/// Each operation is the element-wise counterpart of ShuntingDynamics
/// and produces the same values as applying it to every pattern.
class DimensionMajorBatch {
public:
    /// @throws std::invalid_argument if empty or dimensions differ
    explicit DimensionMajorBatch(const BatchMatrix& pattern_major);
    explicit DimensionMajorBatch(const std::vector<Pattern>& patterns);

    void ApplyDrivingStrength(double strength);
    void ApplyShuntingStep(double decay, double ceiling, double time_step);
    void ApplySaturation(double ceiling, double floor);

    /// Driving strength, Euler step and saturation in sequence
    void Evolve(const ShuntingParameters& params);

    /// Back to pattern-major rows
    BatchMatrix ToPatterns() const;

    size_t BatchSize() const { return batch_size_; }
    size_t Dimension() const { return rows_.size(); }

    const std::vector<double>& Row(size_t dimension) const { return rows_.at(dimension); }

private:
    BatchMatrix rows_;  // [dimension][batch]
    size_t batch_size_;
};

} // namespace resonance
