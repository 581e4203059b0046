// File: tests/learning/hebbian_instar_gradient_test.cpp
//
// Tests for HebbianRule, InstarOutstarRule and GradientHybridRule

#include "learning/gradient_hybrid_rule.hpp"
#include "learning/hebbian_rule.hpp"
#include "learning/instar_outstar_rule.hpp"
#include <gtest/gtest.h>

using namespace resonance;

// ============================================================================
// Hebbian
// ============================================================================

TEST(HebbianRuleTest, StrengthensCoactiveInputs) {
    HebbianRule rule;
    LearningState state;
    // 0.2 (1 - 1e-4 · 0.5) + 0.5 · 1.0 · 0.4
    WeightVector w = rule.Update(Pattern{0.4, 0.0}, WeightVector{0.2, 0.2}, 1.0, 0.5, state);
    EXPECT_NEAR(0.39999, w[0], 1e-12);
    EXPECT_NEAR(0.19999, w[1], 1e-12);
}

TEST(HebbianRuleTest, SaturatesAtUpperBound) {
    HebbianRule rule;
    LearningState state;
    WeightVector w = rule.Update(Pattern{1.0}, WeightVector{0.9}, 1.0, 1.0, state);
    EXPECT_DOUBLE_EQ(1.0, w[0]);
}

// ============================================================================
// Instar / Outstar
// ============================================================================

TEST(InstarOutstarRuleTest, InstarMovesTowardInput) {
    InstarOutstarRule rule;
    LearningState state;
    // Δ = 0.5 · 1 · (0.8 - 0.2) = 0.3
    WeightVector w = rule.Update(Pattern{0.8}, WeightVector{0.2}, 1.0, 0.5, state);
    EXPECT_NEAR(0.5, w[0], 1e-12);
}

TEST(InstarOutstarRuleTest, BothModeAppliesTwoHalfSteps) {
    InstarOutstarParams params;
    params.mode = InstarMode::BOTH;
    InstarOutstarRule rule(params);
    LearningState state;

    WeightVector w = rule.Update(Pattern{0.8}, WeightVector{0.2}, 1.0, 0.5, state);
    EXPECT_NEAR(0.5, w[0], 1e-12);
}

TEST(InstarOutstarRuleTest, ZeroActivationOnlyDecays) {
    InstarOutstarParams params;
    params.weight_decay = 0.1;
    InstarOutstarRule rule(params);
    LearningState state;

    WeightVector w = rule.Update(Pattern{0.8}, WeightVector{0.5}, 0.0, 1.0, state);
    EXPECT_NEAR(0.45, w[0], 1e-12);
}

// ============================================================================
// Gradient Hybrid
// ============================================================================

TEST(GradientHybridRuleTest, PureGradientMovesToInput) {
    GradientHybridParams params;
    params.gradient_weight = 1.0;
    GradientHybridRule rule(params);
    LearningState state;

    WeightVector w = rule.Update(Pattern{0.8}, WeightVector{0.2}, 1.0, 1.0, state);
    EXPECT_NEAR(0.8, w[0], 1e-12);
}

TEST(GradientHybridRuleTest, PureFuzzyOnlyContracts) {
    GradientHybridParams params;
    params.gradient_weight = 0.0;
    GradientHybridRule rule(params);
    LearningState state;

    WeightVector w = rule.Update(Pattern{0.8, 0.1}, WeightVector{0.2, 0.5}, 1.0, 1.0, state);
    EXPECT_NEAR(0.2, w[0], 1e-12);
    EXPECT_NEAR(0.1, w[1], 1e-12);
}

TEST(GradientHybridRuleTest, BlendLiesBetweenBothTerms) {
    GradientHybridRule rule;  // λ = 0.5
    LearningState state;

    // 0.2 + 1.0 · (0.5 · 0.6 + 0.5 · 0.0) = 0.5
    WeightVector w = rule.Update(Pattern{0.8}, WeightVector{0.2}, 1.0, 1.0, state);
    EXPECT_NEAR(0.5, w[0], 1e-12);
}
