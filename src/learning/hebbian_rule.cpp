// File: src/learning/hebbian_rule.cpp
#include "learning/hebbian_rule.hpp"
#include <stdexcept>

namespace resonance {

HebbianRule::HebbianRule(const HebbianParams& params)
    : LearningRule(params.bounds), params_(params) {
    if (!params_.IsValid()) {
        throw std::invalid_argument("Invalid Hebbian parameters");
    }
}

void HebbianRule::UpdateInto(
    const Pattern& input,
    const WeightVector& current,
    double activation,
    double rate,
    LearningState& /*state*/,
    WeightVector& out) const {

    ValidateUpdate(input, current, rate);
    out.resize(current.size());

    const double retain = 1.0 - params_.weight_decay * rate;
    for (size_t i = 0; i < current.size(); ++i) {
        // Δw = rate·y·x on top of passive decay
        out[i] = Clamp(current[i] * retain + rate * activation * input[i]);
    }
}

} // namespace resonance
