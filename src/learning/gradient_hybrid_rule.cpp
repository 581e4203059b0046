// File: src/learning/gradient_hybrid_rule.cpp
#include "learning/gradient_hybrid_rule.hpp"
#include <algorithm>
#include <stdexcept>

namespace resonance {

GradientHybridRule::GradientHybridRule(const GradientHybridParams& params)
    : LearningRule(params.bounds), params_(params) {
    if (!params_.IsValid()) {
        throw std::invalid_argument("Invalid GradientHybrid parameters");
    }
}

void GradientHybridRule::UpdateInto(
    const Pattern& input,
    const WeightVector& current,
    double /*activation*/,
    double rate,
    LearningState& /*state*/,
    WeightVector& out) const {

    ValidateUpdate(input, current, rate);
    out.resize(current.size());

    const double lambda = params_.gradient_weight;
    for (size_t i = 0; i < current.size(); ++i) {
        double gradient_step = input[i] - current[i];            // -∂/∂w ½(x - w)²
        double fuzzy_step = std::min(input[i], current[i]) - current[i];
        out[i] = Clamp(current[i] + rate * (lambda * gradient_step + (1.0 - lambda) * fuzzy_step));
    }
}

} // namespace resonance
