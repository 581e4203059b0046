// File: include/learning/hebbian_rule.hpp
//
// HebbianRule: activity-correlated potentiation with passive decay

#ifndef RESONANCE_LEARNING_HEBBIAN_RULE_HPP
#define RESONANCE_LEARNING_HEBBIAN_RULE_HPP

#include "learning/learning_rule.hpp"

namespace resonance {

class HebbianRule : public LearningRule {
public:
    explicit HebbianRule(const HebbianParams& params = {});
    ~HebbianRule() override = default;

    void UpdateInto(
        const Pattern& input,
        const WeightVector& current,
        double activation,
        double rate,
        LearningState& state,
        WeightVector& out
    ) const override;

    LearningRuleType GetType() const override { return LearningRuleType::HEBBIAN; }
    const char* GetName() const override { return "Hebbian"; }

    const HebbianParams& GetParams() const { return params_; }

private:
    HebbianParams params_;
};

} // namespace resonance

#endif // RESONANCE_LEARNING_HEBBIAN_RULE_HPP
