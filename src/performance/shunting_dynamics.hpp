// File: src/performance/shunting_dynamics.hpp
#pragma once

#include <algorithm>
#include <string>
#include <vector>

namespace resonance {

/// Parameters of one shunting-equation step
///
///   x ← s·x                                  (driving strength)
///   x ← x + dt·(-A·x + (B - x)·E),  E = x    (Euler step)
///   x ← B·x / (1 + x)  for x > 0             (soft saturation)
///   x ← clamp(x, floor, B)
struct ShuntingParameters {
    double decay = 0.3;             // A
    double ceiling = 1.0;           // B
    double floor = 0.0;
    double driving_strength = 1.0;  // s
    double time_step = 0.01;        // dt

    std::vector<std::string> GetValidationErrors() const;
    bool IsValid() const { return GetValidationErrors().empty(); }
};

/// Scalar reference implementation of the shunting step
///
/// The per-element helpers are shared with DimensionMajorBatch so the
/// two layouts perform identical arithmetic.
class ShuntingDynamics {
public:
    /// @throws std::invalid_argument if params are invalid
    explicit ShuntingDynamics(const ShuntingParameters& params);

    /// One full step over a single activation vector
    std::vector<double> Step(const std::vector<double>& activations) const;

    const ShuntingParameters& GetParameters() const { return params_; }

    static double Drive(double x, double strength) {
        return x * strength;
    }

    static double Integrate(double x, double decay, double ceiling, double dt) {
        double excitation = x;
        double derivative = -decay * x + (ceiling - x) * excitation;
        return x + dt * derivative;
    }

    static double Saturate(double x, double ceiling, double floor) {
        if (x > 0.0) {
            x = ceiling * x / (1.0 + x);
        }
        return std::max(floor, std::min(ceiling, x));
    }

private:
    ShuntingParameters params_;
};

} // namespace resonance
