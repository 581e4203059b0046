// File: include/learning/bcm_rule.hpp
//
// BcmRule: Bienenstock-Cooper-Munro plasticity with a per-category sliding threshold

#ifndef RESONANCE_LEARNING_BCM_RULE_HPP
#define RESONANCE_LEARNING_BCM_RULE_HPP

#include "learning/learning_rule.hpp"

namespace resonance {

/// BcmRule: Self-stabilising Hebbian variant
///
/// The modification threshold θ of each category tracks a running
/// average of its squared activation. Activity above θ potentiates
/// (LTP), activity below θ depresses (LTD):
///
///   θ_j ← (1 - τ) θ_j + τ y_j²
///   φ(y, θ) = y (y - θ)
///   w' = clamp(w (1 - decay·rate) + rate·φ·x)
///
/// θ is stored per category in LearningState, so its lifetime matches
/// the category's and Clear() on the store resets it.
class BcmRule : public LearningRule {
public:
    explicit BcmRule(const BcmParams& params = {});
    ~BcmRule() override = default;

    void UpdateInto(
        const Pattern& input,
        const WeightVector& current,
        double activation,
        double rate,
        LearningState& state,
        WeightVector& out
    ) const override;

    LearningRuleType GetType() const override { return LearningRuleType::BCM; }
    const char* GetName() const override { return "BCM"; }

    /// BCM reads and writes LearningState::sliding_threshold
    bool UsesLearningState() const override { return true; }

    const BcmParams& GetParams() const { return params_; }

private:
    BcmParams params_;
};

} // namespace resonance

#endif // RESONANCE_LEARNING_BCM_RULE_HPP
