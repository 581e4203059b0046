// File: tests/learning/fuzzy_art_rule_test.cpp
#include "learning/fuzzy_art_rule.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <random>

using namespace resonance;

class FuzzyArtRuleTest : public ::testing::Test {
protected:
    FuzzyArtRule rule_;
    LearningState state_;
};

TEST_F(FuzzyArtRuleTest, FastLearningTakesIntersection) {
    WeightVector w = rule_.Update(Pattern{0.9, 0.1}, WeightVector{1.0, 0.0}, 0.9, 1.0, state_);
    EXPECT_DOUBLE_EQ(0.9, w[0]);
    EXPECT_DOUBLE_EQ(0.0, w[1]);
}

TEST_F(FuzzyArtRuleTest, ZeroRateLeavesWeightsUnchanged) {
    WeightVector current{0.3, 0.8};
    WeightVector w = rule_.Update(Pattern{0.9, 0.1}, current, 1.0, 0.0, state_);
    EXPECT_DOUBLE_EQ(0.3, w[0]);
    EXPECT_DOUBLE_EQ(0.8, w[1]);
}

TEST_F(FuzzyArtRuleTest, SlowLearningBlends) {
    // 0.5 * min(0.2, 0.6) + 0.5 * 0.6 = 0.4
    WeightVector w = rule_.Update(Pattern{0.2}, WeightVector{0.6}, 1.0, 0.5, state_);
    EXPECT_DOUBLE_EQ(0.4, w[0]);
}

TEST_F(FuzzyArtRuleTest, FastLearningContractsToIntersection) {
    std::mt19937 rng(7);
    std::uniform_real_distribution<double> dist(0.0, 1.0);

    for (int trial = 0; trial < 100; ++trial) {
        std::vector<double> x(8);
        WeightVector w(8);
        for (size_t i = 0; i < 8; ++i) {
            x[i] = dist(rng);
            w[i] = dist(rng);
        }
        Pattern p(x);
        WeightVector updated = rule_.Update(p, w, 1.0, 1.0, state_);
        for (size_t i = 0; i < 8; ++i) {
            EXPECT_LE(updated[i], std::min(w[i], x[i]));
        }
    }
}

TEST_F(FuzzyArtRuleTest, SlowLearningStaysBetweenIntersectionAndWeight) {
    std::mt19937 rng(11);
    std::uniform_real_distribution<double> dist(0.0, 1.0);

    for (double rate : {0.1, 0.5, 0.9}) {
        std::vector<double> x(6);
        WeightVector w(6);
        for (size_t i = 0; i < 6; ++i) {
            x[i] = dist(rng);
            w[i] = dist(rng);
        }
        WeightVector updated = rule_.Update(Pattern(x), w, 1.0, rate, state_);
        for (size_t i = 0; i < 6; ++i) {
            EXPECT_GE(updated[i], std::min(w[i], x[i]) - 1e-15);
            EXPECT_LE(updated[i], w[i] + 1e-15);
        }
    }
}

TEST_F(FuzzyArtRuleTest, IgnoresLearningState) {
    state_.sliding_threshold = 0.42;
    rule_.Update(Pattern{0.5}, WeightVector{0.5}, 1.0, 1.0, state_);
    EXPECT_DOUBLE_EQ(0.42, state_.sliding_threshold);
}
