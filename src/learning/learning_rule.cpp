// File: src/learning/learning_rule.cpp
#include "learning/learning_rule.hpp"
#include "learning/bcm_rule.hpp"
#include "learning/fuzzy_art_rule.hpp"
#include "learning/gradient_hybrid_rule.hpp"
#include "learning/hebbian_rule.hpp"
#include "learning/instar_outstar_rule.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace resonance {

namespace {

void CheckUnitInterval(double value, const char* name, std::vector<std::string>& errors) {
    if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
        errors.push_back(std::string(name) + " must be between 0.0 and 1.0");
    }
}

void AppendErrors(std::vector<std::string>& errors, const std::vector<std::string>& more) {
    errors.insert(errors.end(), more.begin(), more.end());
}

} // anonymous namespace

// ============================================================================
// Parameter Validation
// ============================================================================

std::vector<std::string> WeightBounds::GetValidationErrors() const {
    std::vector<std::string> errors;
    if (!std::isfinite(min_weight) || !std::isfinite(max_weight)) {
        errors.push_back("weight bounds must be finite");
        return errors;
    }
    if (min_weight < 0.0) {
        errors.push_back("weight_min must be >= 0.0");
    }
    if (max_weight > 1.0) {
        errors.push_back("weight_max must be <= 1.0");
    }
    if (min_weight >= max_weight) {
        errors.push_back("weight_min must be less than weight_max");
    }
    return errors;
}

std::vector<std::string> FuzzyArtParams::GetValidationErrors() const {
    return bounds.GetValidationErrors();
}

std::vector<std::string> HebbianParams::GetValidationErrors() const {
    std::vector<std::string> errors;
    CheckUnitInterval(weight_decay, "weight_decay", errors);
    AppendErrors(errors, bounds.GetValidationErrors());
    return errors;
}

BcmParams BcmParams::Competitive() {
    BcmParams params;
    params.threshold_decay = 0.8;
    params.weight_decay = 0.0001;
    return params;
}

BcmParams BcmParams::Balanced() {
    BcmParams params;
    params.threshold_decay = 0.5;
    params.weight_decay = 0.0005;
    return params;
}

BcmParams BcmParams::Homeostatic() {
    BcmParams params;
    params.threshold_decay = 0.1;
    params.weight_decay = 0.0001;
    return params;
}

std::vector<std::string> BcmParams::GetValidationErrors() const {
    std::vector<std::string> errors;
    CheckUnitInterval(threshold_decay, "threshold_decay", errors);
    CheckUnitInterval(weight_decay, "weight_decay", errors);
    AppendErrors(errors, bounds.GetValidationErrors());
    return errors;
}

std::vector<std::string> InstarOutstarParams::GetValidationErrors() const {
    std::vector<std::string> errors;
    CheckUnitInterval(weight_decay, "weight_decay", errors);
    AppendErrors(errors, bounds.GetValidationErrors());
    return errors;
}

std::vector<std::string> GradientHybridParams::GetValidationErrors() const {
    std::vector<std::string> errors;
    CheckUnitInterval(gradient_weight, "gradient_weight", errors);
    AppendErrors(errors, bounds.GetValidationErrors());
    return errors;
}

LearningRuleType GetRuleType(const LearningRuleParams& params) {
    switch (params.index()) {
        case 0: return LearningRuleType::FUZZY_ART;
        case 1: return LearningRuleType::HEBBIAN;
        case 2: return LearningRuleType::BCM;
        case 3: return LearningRuleType::INSTAR_OUTSTAR;
        default: return LearningRuleType::GRADIENT_HYBRID;
    }
}

std::vector<std::string> GetValidationErrors(const LearningRuleParams& params) {
    return std::visit([](const auto& p) { return p.GetValidationErrors(); }, params);
}

// ============================================================================
// LearningRule Base
// ============================================================================

WeightVector LearningRule::Update(
    const Pattern& input,
    const WeightVector& current,
    double activation,
    double rate,
    LearningState& state) const {

    WeightVector out;
    UpdateInto(input, current, activation, rate, state, out);
    return out;
}

WeightVector LearningRule::InitialWeights(const Pattern& input) const {
    WeightVector weights(input.Data().begin(), input.Data().end());
    for (double& w : weights) {
        w = Clamp(w);
    }
    return weights;
}

void LearningRule::ValidateUpdate(
    const Pattern& input,
    const WeightVector& current,
    double rate) {

    if (input.Dimension() != current.size()) {
        throw std::invalid_argument(
            "Dimension mismatch: pattern " + std::to_string(input.Dimension()) +
            " vs category " + std::to_string(current.size()));
    }
    if (!std::isfinite(rate) || rate < 0.0 || rate > 1.0) {
        throw std::invalid_argument("learning rate must be in [0, 1]: " + std::to_string(rate));
    }
}

double LearningRule::Clamp(double value) const {
    return std::clamp(value, bounds_.min_weight, bounds_.max_weight);
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<LearningRule> CreateLearningRule(const LearningRuleParams& params) {
    auto errors = GetValidationErrors(params);
    if (!errors.empty()) {
        std::ostringstream oss;
        oss << "Invalid " << ToString(GetRuleType(params)) << " parameters:";
        for (const auto& error : errors) {
            oss << " " << error << ";";
        }
        throw std::invalid_argument(oss.str());
    }

    switch (GetRuleType(params)) {
        case LearningRuleType::FUZZY_ART:
            return std::make_unique<FuzzyArtRule>(std::get<FuzzyArtParams>(params));
        case LearningRuleType::HEBBIAN:
            return std::make_unique<HebbianRule>(std::get<HebbianParams>(params));
        case LearningRuleType::BCM:
            return std::make_unique<BcmRule>(std::get<BcmParams>(params));
        case LearningRuleType::INSTAR_OUTSTAR:
            return std::make_unique<InstarOutstarRule>(std::get<InstarOutstarParams>(params));
        case LearningRuleType::GRADIENT_HYBRID:
            return std::make_unique<GradientHybridRule>(std::get<GradientHybridParams>(params));
    }
    throw std::invalid_argument("Unknown learning rule type");
}

} // namespace resonance
