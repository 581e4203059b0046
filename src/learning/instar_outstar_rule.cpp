// File: src/learning/instar_outstar_rule.cpp
#include "learning/instar_outstar_rule.hpp"
#include <stdexcept>

namespace resonance {

InstarOutstarRule::InstarOutstarRule(const InstarOutstarParams& params)
    : LearningRule(params.bounds), params_(params) {
    if (!params_.IsValid()) {
        throw std::invalid_argument("Invalid InstarOutstar parameters");
    }
}

void InstarOutstarRule::UpdateInto(
    const Pattern& input,
    const WeightVector& current,
    double activation,
    double rate,
    LearningState& /*state*/,
    WeightVector& out) const {

    ValidateUpdate(input, current, rate);
    out.resize(current.size());

    const bool both = params_.mode == InstarMode::BOTH;
    const double mode_weight = both ? 0.5 : 1.0;
    const double retain = 1.0 - params_.weight_decay * rate;

    for (size_t i = 0; i < current.size(); ++i) {
        double delta = rate * activation * (input[i] - current[i]);

        // First half (instar or outstar alone) carries the decay
        double updated = Clamp(current[i] * retain + delta * mode_weight);

        if (both) {
            // Outstar half adds its delta on top of the instar result
            updated = Clamp(updated + delta * mode_weight);
        }
        out[i] = updated;
    }
}

} // namespace resonance
