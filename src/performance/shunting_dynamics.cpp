// File: src/performance/shunting_dynamics.cpp
#include "performance/shunting_dynamics.hpp"
#include <cmath>
#include <stdexcept>

namespace resonance {

std::vector<std::string> ShuntingParameters::GetValidationErrors() const {
    std::vector<std::string> errors;

    if (!std::isfinite(decay) || decay < 0.0) {
        errors.push_back("decay must be finite and non-negative");
    }
    if (!std::isfinite(ceiling) || !std::isfinite(floor)) {
        errors.push_back("ceiling and floor must be finite");
    } else if (floor >= ceiling) {
        errors.push_back("floor must be below ceiling");
    }
    if (!std::isfinite(driving_strength)) {
        errors.push_back("driving_strength must be finite");
    }
    if (!(time_step > 0.0) || !std::isfinite(time_step)) {
        errors.push_back("time_step must be finite and greater than 0");
    }

    return errors;
}

ShuntingDynamics::ShuntingDynamics(const ShuntingParameters& params)
    : params_(params) {
    if (!params_.IsValid()) {
        throw std::invalid_argument("Invalid shunting parameters: " +
                                    params_.GetValidationErrors().front());
    }
}

std::vector<double> ShuntingDynamics::Step(const std::vector<double>& activations) const {
    std::vector<double> result(activations.size());
    for (size_t i = 0; i < activations.size(); ++i) {
        double x = Drive(activations[i], params_.driving_strength);
        x = Integrate(x, params_.decay, params_.ceiling, params_.time_step);
        result[i] = Saturate(x, params_.ceiling, params_.floor);
    }
    return result;
}

} // namespace resonance
