// File: src/resonance/resonance_search.hpp
//
// Resonance Search Engine
//
// Given an input pattern and a vigilance ρ, decides whether the input
// resonates with an existing category, which one, and how that
// category's weights change.
//
//   Choice:  T_j = |p ∧ w_j| / (α + |w_j|)
//   Match:   M_j = |p ∧ w_j| / |p|
//
// Candidates are visited in descending T_j order, ties broken by
// ascending index (oldest category wins). The first candidate with
// M_j ≥ ρ resonates and is updated by the learning rule. Candidates that
// fail are reset for the rest of the call. If none resonates a new
// category is committed from the input, unless the store is full, in
// which case the outcome is CAPACITY_EXCEEDED and nothing changes.
//
// Every call evaluates at most Size() + 1 candidates.

#pragma once

#include "category/category_store.hpp"
#include "core/pattern.hpp"
#include "core/types.hpp"
#include "learning/learning_rule.hpp"
#include "performance/weight_vector_pool.hpp"
#include "resonance/performance_counters.hpp"
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace resonance {

/// Result of a search (and optionally a commit)
struct SearchResult {
    ResonanceOutcome outcome{ResonanceOutcome::NO_RESONANCE};
    CategoryIndex category{kNoCategory};
    double choice{0.0};               // T of the winning category
    double match{0.0};                // M of the winning category
    size_t candidates_evaluated{0};   // Match-function evaluations, +1 for a commit

    /// True for RESONANT and COMMITTED_NEW
    bool Succeeded() const {
        return outcome == ResonanceOutcome::RESONANT ||
               outcome == ResonanceOutcome::COMMITTED_NEW;
    }
};

/// Per-candidate search exclusions, indexed by category
/// Indices at or beyond size() are not excluded.
using ExclusionMask = std::vector<bool>;

/// Result of an explicit prune
struct PruneResult {
    size_t removed{0};
    IndexRemap remap;  // Old index -> new index, kNoCategory if removed
};

class ResonanceSearchEngine {
public:
    /// Configuration for a search engine
    struct Config {
        /// Pattern / weight dimension (complement-coded length when used)
        size_t dimension{0};

        /// Category store capacity
        size_t max_categories{1000};

        /// Choice parameter α > 0
        double choice_alpha{0.001};

        /// Learning rate β ∈ [0, 1]; 1.0 is fast learning
        double learning_rate{1.0};

        /// Learning rule applied on resonance
        LearningRuleParams learning_rule{FuzzyArtParams{}};

        /// Write search traces to the debug stream
        bool debug_logging{false};

        std::vector<std::string> GetValidationErrors() const;
        bool IsValid() const { return GetValidationErrors().empty(); }
    };

    /// @throws std::invalid_argument if config is invalid
    explicit ResonanceSearchEngine(const Config& config);

    // Disable copy (owns its store)
    ResonanceSearchEngine(const ResonanceSearchEngine&) = delete;
    ResonanceSearchEngine& operator=(const ResonanceSearchEngine&) = delete;

    // ========================================================================
    // Search & Learning
    // ========================================================================

    /// Find the resonant category without modifying anything
    ///
    /// @param input Pattern of Dimension() components
    /// @param vigilance ρ ∈ [0, 1]
    /// @param excluded Optional categories to skip (already disqualified)
    /// @param disqualified Optional mask that receives every candidate
    ///        reset by the vigilance test; grown to Size() if shorter.
    ///        May be the same mask as `excluded`.
    /// @return RESONANT with the winner, or NO_RESONANCE
    SearchResult FindResonance(
        const Pattern& input,
        double vigilance,
        const ExclusionMask* excluded = nullptr,
        ExclusionMask* disqualified = nullptr
    ) const;

    /// Apply the outcome of FindResonance
    ///
    /// RESONANT updates the winner in place; NO_RESONANCE appends a new
    /// category or reports CAPACITY_EXCEEDED.
    SearchResult Commit(const Pattern& input, const SearchResult& found);

    /// FindResonance followed by Commit
    SearchResult Learn(const Pattern& input, double vigilance);

    /// Learn while skipping the categories set in `excluded`
    SearchResult LearnExcluding(
        const Pattern& input,
        double vigilance,
        const ExclusionMask& excluded
    );

    /// Arg-max of the choice function: no vigilance test, no commit
    /// @throws std::logic_error if no category has been learned
    CategoryIndex Predict(const Pattern& input) const;

    // ========================================================================
    // Inspection
    // ========================================================================

    /// @throws std::invalid_argument on dimension mismatch or zero norm
    void ValidateInput(const Pattern& input) const;

    double ChoiceValue(const Pattern& input, CategoryIndex index) const;
    double MatchValue(const Pattern& input, CategoryIndex index) const;

    /// Choice value of every category, in index order
    std::vector<double> Activations(const Pattern& input) const;

    const CategoryStore& GetStore() const { return store_; }
    size_t GetCategoryCount() const { return store_.Size(); }
    size_t Dimension() const { return config_.dimension; }
    const Config& GetConfig() const { return config_; }
    const LearningRule& GetLearningRule() const { return *rule_; }

    PerformanceCounters::Snapshot GetStats() const { return counters_.GetSnapshot(); }
    PerformanceCounters& GetCounters() const { return counters_; }
    void ResetCounters() { counters_.Reset(); }

    // ========================================================================
    // Maintenance
    // ========================================================================

    /// Clear all categories and their learning state
    void Reset();

    // Pruning runs between searches, never inside one. Survivors keep
    // their relative order and are renumbered densely; callers holding
    // indices (a map field) must apply the returned remap.

    /// Remove categories used fewer than ⌊mean usage × min_usage_ratio⌋ times
    /// @throws std::invalid_argument unless min_usage_ratio ∈ [0, 1]
    PruneResult PruneByUsage(double min_usage_ratio);

    /// Remove categories not committed or resonant within max_age
    /// @throws std::invalid_argument unless max_age > 0
    PruneResult PruneByAge(std::chrono::milliseconds max_age);

    /// Keep the max_size most used categories (ties keep the older one)
    /// @throws std::invalid_argument if max_size is 0
    PruneResult PruneToSize(size_t max_size);

    /// Recycle weight buffers through a shared pool
    /// @throws std::invalid_argument if the pool dimension differs
    void SetPool(std::shared_ptr<WeightVectorPool> pool);

    /// Set debug output stream (used when debug_logging is enabled)
    void SetDebugStream(std::ostream* os) { debug_stream_ = os; }
    std::ostream* GetDebugStream() const { return debug_stream_; }

private:
    void ValidateVigilance(double vigilance) const;

    PruneResult Prune(const std::vector<bool>& keep, const char* reason);

    void LogDebug(const std::string& message) const;

    Config config_;
    CategoryStore store_;
    std::unique_ptr<LearningRule> rule_;
    std::shared_ptr<WeightVectorPool> pool_;

    mutable PerformanceCounters counters_;
    std::ostream* debug_stream_{&std::cout};
};

} // namespace resonance
