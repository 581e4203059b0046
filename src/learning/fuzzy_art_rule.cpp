// File: src/learning/fuzzy_art_rule.cpp
#include "learning/fuzzy_art_rule.hpp"
#include <algorithm>
#include <stdexcept>

namespace resonance {

FuzzyArtRule::FuzzyArtRule(const FuzzyArtParams& params)
    : LearningRule(params.bounds), params_(params) {
    if (!params_.IsValid()) {
        throw std::invalid_argument("Invalid FuzzyART parameters");
    }
}

void FuzzyArtRule::UpdateInto(
    const Pattern& input,
    const WeightVector& current,
    double /*activation*/,
    double rate,
    LearningState& /*state*/,
    WeightVector& out) const {

    ValidateUpdate(input, current, rate);
    out.resize(current.size());

    for (size_t i = 0; i < current.size(); ++i) {
        double intersection = std::min(input[i], current[i]);
        out[i] = Clamp(rate * intersection + (1.0 - rate) * current[i]);
    }
}

} // namespace resonance
