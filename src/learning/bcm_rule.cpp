// File: src/learning/bcm_rule.cpp
#include "learning/bcm_rule.hpp"
#include <stdexcept>

namespace resonance {

BcmRule::BcmRule(const BcmParams& params)
    : LearningRule(params.bounds), params_(params) {
    if (!params_.IsValid()) {
        throw std::invalid_argument("Invalid BCM parameters");
    }
}

void BcmRule::UpdateInto(
    const Pattern& input,
    const WeightVector& current,
    double activation,
    double rate,
    LearningState& state,
    WeightVector& out) const {

    ValidateUpdate(input, current, rate);
    out.resize(current.size());

    // Slide the threshold before computing plasticity
    const double tau = params_.threshold_decay;
    state.sliding_threshold = (1.0 - tau) * state.sliding_threshold
                            + tau * activation * activation;

    const double phi = activation * (activation - state.sliding_threshold);
    const double retain = 1.0 - params_.weight_decay * rate;

    for (size_t i = 0; i < current.size(); ++i) {
        double delta = rate * phi * input[i];
        out[i] = Clamp(current[i] * retain + delta);
    }
}

} // namespace resonance
