// File: include/learning/gradient_hybrid_rule.hpp
//
// GradientHybridRule: fuzzy contraction blended with a squared-error gradient step

#ifndef RESONANCE_LEARNING_GRADIENT_HYBRID_RULE_HPP
#define RESONANCE_LEARNING_GRADIENT_HYBRID_RULE_HPP

#include "learning/learning_rule.hpp"

namespace resonance {

class GradientHybridRule : public LearningRule {
public:
    explicit GradientHybridRule(const GradientHybridParams& params = {});
    ~GradientHybridRule() override = default;

    void UpdateInto(
        const Pattern& input,
        const WeightVector& current,
        double activation,
        double rate,
        LearningState& state,
        WeightVector& out
    ) const override;

    LearningRuleType GetType() const override { return LearningRuleType::GRADIENT_HYBRID; }
    const char* GetName() const override { return "GradientHybrid"; }

    const GradientHybridParams& GetParams() const { return params_; }

private:
    GradientHybridParams params_;
};

} // namespace resonance

#endif // RESONANCE_LEARNING_GRADIENT_HYBRID_RULE_HPP
