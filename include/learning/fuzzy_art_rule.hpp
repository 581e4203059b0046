// File: include/learning/fuzzy_art_rule.hpp
//
// FuzzyArtRule: fast/slow fuzzy ART prototype contraction

#ifndef RESONANCE_LEARNING_FUZZY_ART_RULE_HPP
#define RESONANCE_LEARNING_FUZZY_ART_RULE_HPP

#include "learning/learning_rule.hpp"

namespace resonance {

/// FuzzyArtRule: Default learning rule of the resonance engine
///
/// Update: w' = β (x ∧ w) + (1 - β) w, with β = learning rate.
///
/// With fast learning (β = 1) the new prototype is exactly x ∧ w, so a
/// resonant update can only shrink a category box:
///   w' ≤ min(w, x)   component-wise.
/// With slow learning (β < 1) the prototype moves part of the way:
///   min(w, x) ≤ w' ≤ w.
///
/// The post-synaptic activation is ignored; resonance alone gates
/// learning.
class FuzzyArtRule : public LearningRule {
public:
    explicit FuzzyArtRule(const FuzzyArtParams& params = {});
    ~FuzzyArtRule() override = default;

    void UpdateInto(
        const Pattern& input,
        const WeightVector& current,
        double activation,
        double rate,
        LearningState& state,
        WeightVector& out
    ) const override;

    LearningRuleType GetType() const override { return LearningRuleType::FUZZY_ART; }
    const char* GetName() const override { return "FuzzyART"; }

    const FuzzyArtParams& GetParams() const { return params_; }

private:
    FuzzyArtParams params_;
};

} // namespace resonance

#endif // RESONANCE_LEARNING_FUZZY_ART_RULE_HPP
