// File: include/learning/instar_outstar_rule.hpp
//
// InstarOutstarRule: Grossberg instar (recognition) and outstar (prediction) laws

#ifndef RESONANCE_LEARNING_INSTAR_OUTSTAR_RULE_HPP
#define RESONANCE_LEARNING_INSTAR_OUTSTAR_RULE_HPP

#include "learning/learning_rule.hpp"

namespace resonance {

/// Instar moves bottom-up weights toward the input (template matching),
/// outstar moves top-down weights toward the expected pattern. Both use
/// Δw = rate·y·(x - w); BOTH applies each half with weight 0.5.
class InstarOutstarRule : public LearningRule {
public:
    explicit InstarOutstarRule(const InstarOutstarParams& params = {});
    ~InstarOutstarRule() override = default;

    void UpdateInto(
        const Pattern& input,
        const WeightVector& current,
        double activation,
        double rate,
        LearningState& state,
        WeightVector& out
    ) const override;

    LearningRuleType GetType() const override { return LearningRuleType::INSTAR_OUTSTAR; }
    const char* GetName() const override { return "InstarOutstar"; }

    const InstarOutstarParams& GetParams() const { return params_; }

private:
    InstarOutstarParams params_;
};

} // namespace resonance

#endif // RESONANCE_LEARNING_INSTAR_OUTSTAR_RULE_HPP
