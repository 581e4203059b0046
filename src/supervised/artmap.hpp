// File: src/supervised/artmap.hpp
//
// Supervised ARTMAP
//
// Two resonance search engines (input module A, output module B) linked
// by a single-valued map field. On a map-field mismatch the vigilance of
// module A is raised just above the match of the offending category and
// the search is redone with that category excluded (match tracking):
//
//   SEARCH ─┬─> RESONANT_CONSISTENT            (commit, reinforce)
//           ├─> RESONANT_CONFLICT ─> raise ρ_A ─> SEARCH
//           └─> COMMIT_NEW                     (commit, associate)
//
// Every conflict excludes one more category, so a call runs at most
// len(A) + 1 searches. Candidates reset by any search of the call stay
// excluded, so at most len(A) + 1 candidates are evaluated in total. A
// conflicting category keeps its mapping.
//
// An instance is used either with module B (Learn) or with plain label
// ids (LearnLabel), never both.

#pragma once

#include "concurrency/worker_pool.hpp"
#include "core/pattern.hpp"
#include "core/types.hpp"
#include "resonance/resonance_search.hpp"
#include "supervised/map_field.hpp"
#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace resonance {

/// Outcome of one supervised learning step
struct LearnResult {
    ResonanceOutcome outcome{ResonanceOutcome::NO_RESONANCE};
    CategoryIndex category_a{kNoCategory};
    std::optional<MapTarget> target;       // B category or label; empty on failure
    size_t match_tracking_events{0};       // Conflicts resolved in this call
    double final_vigilance{0.0};           // ρ_A after any raising
    size_t candidates_evaluated{0};        // Module A evaluations, all searches

    bool Succeeded() const {
        return outcome == ResonanceOutcome::RESONANT ||
               outcome == ResonanceOutcome::COMMITTED_NEW;
    }
};

/// Prediction: winning input category and its mapped target
/// An empty target means the winner has no association yet.
struct Prediction {
    CategoryIndex category{kNoCategory};
    std::optional<MapTarget> target;

    bool IsMapped() const { return target.has_value(); }
};

class Artmap {
public:
    /// Training mode, fixed by the first learning call
    enum class Mode : uint8_t {
        UNSET = 0,
        MODULE_B = 1,  // Targets are module-B categories
        LABEL = 2,     // Targets are caller label ids
    };

    /// Configuration
    struct Config {
        /// Input module
        ResonanceSearchEngine::Config module_a;

        /// Output module; required only for Learn(input, output)
        std::optional<ResonanceSearchEngine::Config> module_b;

        /// Baseline vigilance ρ_A for each new input
        double baseline_vigilance{0.75};

        /// Vigilance ρ_B of the output module
        double output_vigilance{0.9};

        /// Match-tracking increment ε ∈ (0, 0.1]
        double epsilon{0.001};

        /// Ceiling for raised vigilance
        double max_vigilance{1.0};

        /// Log match-tracking decisions
        bool debug_logging{false};

        std::vector<std::string> GetValidationErrors() const;
        bool IsValid() const { return GetValidationErrors().empty(); }
    };

    /// Statistics
    struct Stats {
        uint64_t learn_calls{0};
        uint64_t match_tracking_events{0};
        uint64_t new_associations{0};
        uint64_t reinforcements{0};
        uint64_t capacity_failures{0};
        size_t map_field_size{0};
        PerformanceCounters::Snapshot module_a;
    };

    /// @throws std::invalid_argument if config is invalid
    explicit Artmap(const Config& config);

    Artmap(const Artmap&) = delete;
    Artmap& operator=(const Artmap&) = delete;

    // ========================================================================
    // Training
    // ========================================================================

    /// Learn an input/output pair
    ///
    /// With a worker pool, module B learns on a pool thread while module A
    /// runs its first search. Module B's debug output is buffered during
    /// that overlap and written to its stream afterwards.
    ///
    /// @throws std::logic_error if no module B is configured or the
    ///         instance is in label mode
    LearnResult Learn(const Pattern& input, const Pattern& output, WorkerPool* pool = nullptr);

    /// Learn an input/label pair
    /// @throws std::logic_error if the instance is in module-B mode
    LearnResult LearnLabel(const Pattern& input, MapTarget label);

    /// Clear, then learn every (input, label) pair in order
    std::vector<LearnResult> Fit(const std::vector<Pattern>& inputs,
                                 const std::vector<MapTarget>& labels);

    /// Learn every (input, label) pair in order without clearing
    ///
    /// All inputs are validated before the first one is learned.
    /// @throws std::invalid_argument on size mismatch or a bad input
    std::vector<LearnResult> PartialFit(const std::vector<Pattern>& inputs,
                                        const std::vector<MapTarget>& labels);

    // ========================================================================
    // Prediction
    // ========================================================================

    /// Arg-max over module A, then map-field lookup
    /// @throws std::logic_error if nothing has been learned
    Prediction Predict(const Pattern& input) const;

    std::vector<Prediction> PredictBatch(const std::vector<Pattern>& inputs) const;

    // ========================================================================
    // State
    // ========================================================================

    /// Forget all categories and associations; mode returns to UNSET
    void Clear();

    /// Prune module A and drop or renumber the affected associations
    /// Same rules as the ResonanceSearchEngine prunes of the same name.
    PruneResult PruneByUsage(double min_usage_ratio);
    PruneResult PruneByAge(std::chrono::milliseconds max_age);
    PruneResult PruneToSize(size_t max_size);

    bool IsTrained() const { return module_a_->GetCategoryCount() > 0; }
    size_t GetCategoryCount() const { return module_a_->GetCategoryCount(); }
    Mode GetMode() const { return mode_; }

    const MapField& GetMapField() const { return map_field_; }
    const ResonanceSearchEngine& GetModuleA() const { return *module_a_; }
    const ResonanceSearchEngine* GetModuleB() const { return module_b_.get(); }
    const Config& GetConfig() const { return config_; }

    Stats GetStats() const;
    void ResetStats();

    /// Set debug output stream for this instance and both modules
    void SetDebugStream(std::ostream* os);

private:
    void EnterMode(Mode mode);

    /// Carry a module-A prune over to the map field
    PruneResult ApplyToMapField(PruneResult pruned);

    /// Match-tracking loop starting from a completed first search
    /// `disqualified` holds the candidates reset by that first search
    LearnResult ResolveAndCommit(const Pattern& input, MapTarget target, SearchResult found,
                                 ExclusionMask& disqualified);

    void LogDebug(const std::string& message) const;

    Config config_;
    std::unique_ptr<ResonanceSearchEngine> module_a_;
    std::unique_ptr<ResonanceSearchEngine> module_b_;
    MapField map_field_;
    Mode mode_{Mode::UNSET};

    std::atomic<uint64_t> learn_calls_{0};
    std::atomic<uint64_t> match_tracking_events_{0};
    std::atomic<uint64_t> new_associations_{0};
    std::atomic<uint64_t> reinforcements_{0};
    std::atomic<uint64_t> capacity_failures_{0};

    std::ostream* debug_stream_{&std::cout};
};

/// Convert Artmap::Mode to string
const char* ToString(Artmap::Mode mode);

} // namespace resonance
