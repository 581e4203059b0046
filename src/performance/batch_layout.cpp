// File: src/performance/batch_layout.cpp
#include "performance/batch_layout.hpp"
#include <stdexcept>
#include <string>

namespace resonance {

namespace {

void ValidateRectangular(const BatchMatrix& rows, const char* what) {
    if (rows.empty()) {
        throw std::invalid_argument(std::string(what) + ": batch is empty");
    }
    const size_t width = rows.front().size();
    if (width == 0) {
        throw std::invalid_argument(std::string(what) + ": rows are empty");
    }
    for (size_t i = 1; i < rows.size(); ++i) {
        if (rows[i].size() != width) {
            throw std::invalid_argument(
                std::string(what) + ": row " + std::to_string(i) + " has length " +
                std::to_string(rows[i].size()) + ", expected " + std::to_string(width));
        }
    }
}

BatchMatrix Transpose(const BatchMatrix& rows) {
    const size_t outer = rows.size();
    const size_t inner = rows.front().size();

    BatchMatrix result(inner, std::vector<double>(outer));
    for (size_t i = 0; i < outer; ++i) {
        for (size_t d = 0; d < inner; ++d) {
            result[d][i] = rows[i][d];
        }
    }
    return result;
}

} // anonymous namespace

// ============================================================================
// BatchLayout
// ============================================================================

BatchMatrix BatchLayout::ToDimensionMajor(const BatchMatrix& pattern_major) {
    ValidateRectangular(pattern_major, "ToDimensionMajor");
    return Transpose(pattern_major);
}

BatchMatrix BatchLayout::ToDimensionMajor(const std::vector<Pattern>& patterns) {
    BatchMatrix rows;
    rows.reserve(patterns.size());
    for (const auto& pattern : patterns) {
        rows.push_back(pattern.Data());
    }
    return ToDimensionMajor(rows);
}

BatchMatrix BatchLayout::ToPatternMajor(const BatchMatrix& dimension_major) {
    ValidateRectangular(dimension_major, "ToPatternMajor");
    return Transpose(dimension_major);
}

// ============================================================================
// DimensionMajorBatch
// ============================================================================

DimensionMajorBatch::DimensionMajorBatch(const BatchMatrix& pattern_major)
    : rows_(BatchLayout::ToDimensionMajor(pattern_major))
    , batch_size_(pattern_major.size()) {
}

DimensionMajorBatch::DimensionMajorBatch(const std::vector<Pattern>& patterns)
    : rows_(BatchLayout::ToDimensionMajor(patterns))
    , batch_size_(patterns.size()) {
}

void DimensionMajorBatch::ApplyDrivingStrength(double strength) {
    for (auto& row : rows_) {
        for (size_t i = 0; i < batch_size_; ++i) {
            row[i] = ShuntingDynamics::Drive(row[i], strength);
        }
    }
}

void DimensionMajorBatch::ApplyShuntingStep(double decay, double ceiling, double time_step) {
    for (auto& row : rows_) {
        for (size_t i = 0; i < batch_size_; ++i) {
            row[i] = ShuntingDynamics::Integrate(row[i], decay, ceiling, time_step);
        }
    }
}

void DimensionMajorBatch::ApplySaturation(double ceiling, double floor) {
    for (auto& row : rows_) {
        for (size_t i = 0; i < batch_size_; ++i) {
            row[i] = ShuntingDynamics::Saturate(row[i], ceiling, floor);
        }
    }
}

void DimensionMajorBatch::Evolve(const ShuntingParameters& params) {
    ApplyDrivingStrength(params.driving_strength);
    ApplyShuntingStep(params.decay, params.ceiling, params.time_step);
    ApplySaturation(params.ceiling, params.floor);
}

BatchMatrix DimensionMajorBatch::ToPatterns() const {
    return BatchLayout::ToPatternMajor(rows_);
}

} // namespace resonance
