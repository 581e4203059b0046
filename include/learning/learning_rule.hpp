// File: include/learning/learning_rule.hpp
//
// Learning Rule Interface for Resonance
// Pluggable synaptic update applied to a category once it resonates
//
// A learning rule maps (input pattern, current category weights,
// post-synaptic activation, learning rate) to new category weights.
// Every rule is a pure function of those inputs except BCM, which also
// reads and writes the category's sliding threshold held in the
// CategoryStore side array.
//
// Parameters form a closed set of tagged variants, one per rule. They
// are validated once, when the rule is created, rather than on every
// update.

#ifndef RESONANCE_LEARNING_LEARNING_RULE_HPP
#define RESONANCE_LEARNING_LEARNING_RULE_HPP

#include "category/category.hpp"
#include "core/pattern.hpp"
#include "core/types.hpp"
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace resonance {

/// Inclusive clamp range applied after every update
struct WeightBounds {
    double min_weight = 0.0;
    double max_weight = 1.0;

    std::vector<std::string> GetValidationErrors() const;
};

/// Fuzzy ART: w' = β (x ∧ w) + (1 - β) w
struct FuzzyArtParams {
    WeightBounds bounds;

    std::vector<std::string> GetValidationErrors() const;
    bool IsValid() const { return GetValidationErrors().empty(); }
};

/// Hebbian: w' = w (1 - decay·rate) + rate·y·x
struct HebbianParams {
    /// Passive weight decay per unit of learning rate [0, 1]
    double weight_decay = 0.0001;
    WeightBounds bounds;

    std::vector<std::string> GetValidationErrors() const;
    bool IsValid() const { return GetValidationErrors().empty(); }
};

/// BCM with sliding modification threshold
///
/// θ ← (1 - τ) θ + τ y²,  φ = y (y - θ),  w' = w (1 - decay·rate) + rate·φ·x
struct BcmParams {
    /// Threshold adaptation rate τ [0, 1]
    double threshold_decay = 0.5;
    /// Weight decay [0, 1]
    double weight_decay = 0.0005;
    WeightBounds bounds;

    /// Fast threshold, winner-take-all behaviour
    static BcmParams Competitive();
    /// Medium threshold adaptation
    static BcmParams Balanced();
    /// Slow threshold, stable feedback learning
    static BcmParams Homeostatic();

    std::vector<std::string> GetValidationErrors() const;
    bool IsValid() const { return GetValidationErrors().empty(); }
};

/// Grossberg instar / outstar: Δ = rate·y·(x - w)
struct InstarOutstarParams {
    InstarMode mode = InstarMode::INSTAR;
    /// Weight decay [0, 1]
    double weight_decay = 0.0;
    WeightBounds bounds;

    std::vector<std::string> GetValidationErrors() const;
    bool IsValid() const { return GetValidationErrors().empty(); }
};

/// Blend of the fuzzy contraction and a gradient step on ½‖x - w‖²
///
/// w' = w + rate·[λ (x - w) + (1 - λ) ((x ∧ w) - w)]
struct GradientHybridParams {
    /// λ: share of the gradient term [0, 1]
    double gradient_weight = 0.5;
    WeightBounds bounds;

    std::vector<std::string> GetValidationErrors() const;
    bool IsValid() const { return GetValidationErrors().empty(); }
};

/// Tagged parameter set selecting one learning rule
using LearningRuleParams = std::variant<
    FuzzyArtParams,
    HebbianParams,
    BcmParams,
    InstarOutstarParams,
    GradientHybridParams>;

/// Rule type selected by a parameter variant
LearningRuleType GetRuleType(const LearningRuleParams& params);

/// Validation errors for whichever variant is active
std::vector<std::string> GetValidationErrors(const LearningRuleParams& params);

/// Abstract base class for learning rules
///
/// Implementations write the updated weights into a caller-supplied
/// buffer so that the search engine can recycle buffers through a
/// WeightVectorPool instead of allocating per update.
///
/// Concurrent updates of the same category must be serialised by the
/// caller. Updates of distinct categories are independent.
class LearningRule {
public:
    virtual ~LearningRule() = default;

    /// Compute updated weights into `out`
    ///
    /// @param input Pre-synaptic pattern
    /// @param current Current category weights
    /// @param activation Post-synaptic activation y (the match value)
    /// @param rate Learning rate in [0, 1]
    /// @param state Category side state (BCM threshold)
    /// @param out Destination, resized to the input dimension
    /// @throws std::invalid_argument on dimension mismatch or bad rate
    virtual void UpdateInto(
        const Pattern& input,
        const WeightVector& current,
        double activation,
        double rate,
        LearningState& state,
        WeightVector& out
    ) const = 0;

    /// Convenience form returning fresh weights
    WeightVector Update(
        const Pattern& input,
        const WeightVector& current,
        double activation,
        double rate,
        LearningState& state
    ) const;

    /// Prototype of a freshly committed category for this input
    virtual WeightVector InitialWeights(const Pattern& input) const;

    virtual LearningRuleType GetType() const = 0;
    virtual const char* GetName() const = 0;

    /// True if the rule touches LearningState
    virtual bool UsesLearningState() const { return false; }

    const WeightBounds& GetBounds() const { return bounds_; }

protected:
    explicit LearningRule(const WeightBounds& bounds) : bounds_(bounds) {}

    /// Shared argument checks for UpdateInto
    static void ValidateUpdate(
        const Pattern& input,
        const WeightVector& current,
        double rate
    );

    double Clamp(double value) const;

private:
    WeightBounds bounds_;
};

/// Create the rule selected by `params`
///
/// @throws std::invalid_argument listing every validation error
std::unique_ptr<LearningRule> CreateLearningRule(const LearningRuleParams& params);

} // namespace resonance

#endif // RESONANCE_LEARNING_LEARNING_RULE_HPP
