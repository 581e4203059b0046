// File: src/performance/batch_processor.hpp
#pragma once

#include "concurrency/worker_pool.hpp"
#include "core/pattern.hpp"
#include "performance/batch_layout.hpp"
#include "performance/shunting_dynamics.hpp"
#include "resonance/resonance_search.hpp"
#include <atomic>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace resonance {

/// BatchProcessor: Batched dynamics, learning and prediction
///
/// Large batches are evaluated dimension-major; small ones fall back to
/// the per-pattern path. Both paths give identical results, the
/// threshold only trades transpose overhead against loop efficiency.
///
/// Learning stays sequential within one engine (single writer per
/// store). LearnChannels() runs distinct engines in parallel.
class BatchProcessor {
public:
    struct Config {
        /// Smallest batch evaluated dimension-major
        size_t min_batch_size_for_vectorization{32};

        /// Smallest pattern dimension evaluated dimension-major
        size_t min_dimension_for_vectorization{64};

        bool debug_logging{false};
    };

    struct Stats {
        uint64_t vectorized_batches{0};
        uint64_t scalar_batches{0};
        uint64_t patterns_learned{0};
        uint64_t patterns_predicted{0};
        uint64_t channel_runs{0};
    };

    BatchProcessor();
    explicit BatchProcessor(const Config& config);

    /// One shunting step over every pattern (pattern-major in and out)
    /// @throws std::invalid_argument on empty batch, ragged rows or bad params
    BatchMatrix EvolveBatch(const BatchMatrix& patterns, const ShuntingParameters& params);

    /// Learn every pattern in order
    ///
    /// Every pattern is validated before the first one is learned. An
    /// exception thrown while learning stops the batch at that pattern;
    /// earlier commits stay.
    std::vector<SearchResult> ProcessBatch(
        ResonanceSearchEngine& engine,
        const std::vector<Pattern>& patterns,
        double vigilance);

    /// engine.Predict() for every pattern
    /// @throws std::logic_error if the engine has no categories
    std::vector<CategoryIndex> PredictBatch(
        const ResonanceSearchEngine& engine,
        const std::vector<Pattern>& patterns);

    /// Learn batches[k] into engines[k], one pool task per channel
    ///
    /// @throws std::invalid_argument if sizes differ, an engine is null or
    ///         listed twice, or any pattern is invalid for its engine
    std::vector<std::vector<SearchResult>> LearnChannels(
        const std::vector<ResonanceSearchEngine*>& engines,
        const std::vector<std::vector<Pattern>>& batches,
        double vigilance,
        WorkerPool& pool);

    /// True if a batch of this shape takes the dimension-major path
    bool ShouldVectorize(size_t batch_size, size_t dimension) const;

    const Config& GetConfig() const { return config_; }
    Stats GetStats() const;
    void ResetStats();

    void SetDebugStream(std::ostream* os) { debug_stream_ = os; }

private:
    std::vector<CategoryIndex> PredictDimensionMajor(
        const ResonanceSearchEngine& engine,
        const std::vector<Pattern>& patterns) const;

    void LogDebug(const std::string& message) const;

    Config config_;

    std::atomic<uint64_t> vectorized_batches_{0};
    std::atomic<uint64_t> scalar_batches_{0};
    std::atomic<uint64_t> patterns_learned_{0};
    std::atomic<uint64_t> patterns_predicted_{0};
    std::atomic<uint64_t> channel_runs_{0};

    std::ostream* debug_stream_{&std::cout};
};

} // namespace resonance
