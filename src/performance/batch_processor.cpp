// File: src/performance/batch_processor.cpp
#include "performance/batch_processor.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>

namespace resonance {

BatchProcessor::BatchProcessor()
    : config_() {
}

BatchProcessor::BatchProcessor(const Config& config)
    : config_(config) {
}

bool BatchProcessor::ShouldVectorize(size_t batch_size, size_t dimension) const {
    return batch_size >= config_.min_batch_size_for_vectorization &&
           dimension >= config_.min_dimension_for_vectorization;
}

// ============================================================================
// Dynamics
// ============================================================================

BatchMatrix BatchProcessor::EvolveBatch(const BatchMatrix& patterns, const ShuntingParameters& params) {
    ShuntingDynamics dynamics(params);  // validates params

    if (patterns.empty()) {
        throw std::invalid_argument("EvolveBatch: batch is empty");
    }
    const size_t dimension = patterns.front().size();

    if (ShouldVectorize(patterns.size(), dimension)) {
        DimensionMajorBatch batch(patterns);
        batch.Evolve(params);
        vectorized_batches_.fetch_add(1, std::memory_order_relaxed);
        LogDebug("EvolveBatch: dimension-major, " + std::to_string(patterns.size()) +
                 " x " + std::to_string(dimension));
        return batch.ToPatterns();
    }

    // Scalar path still rejects ragged input
    BatchLayout::ToDimensionMajor(patterns);

    BatchMatrix result;
    result.reserve(patterns.size());
    for (const auto& row : patterns) {
        result.push_back(dynamics.Step(row));
    }
    scalar_batches_.fetch_add(1, std::memory_order_relaxed);
    LogDebug("EvolveBatch: scalar, " + std::to_string(patterns.size()) +
             " x " + std::to_string(dimension));
    return result;
}

// ============================================================================
// Learning
// ============================================================================

std::vector<SearchResult> BatchProcessor::ProcessBatch(
    ResonanceSearchEngine& engine,
    const std::vector<Pattern>& patterns,
    double vigilance) {

    if (!(vigilance >= 0.0 && vigilance <= 1.0)) {
        throw std::invalid_argument("ProcessBatch: vigilance must be in [0, 1]");
    }
    for (const auto& pattern : patterns) {
        engine.ValidateInput(pattern);
    }

    std::vector<SearchResult> results;
    results.reserve(patterns.size());
    for (const auto& pattern : patterns) {
        results.push_back(engine.Learn(pattern, vigilance));
        patterns_learned_.fetch_add(1, std::memory_order_relaxed);
    }

    LogDebug("ProcessBatch: learned " + std::to_string(patterns.size()) +
             " patterns, " + std::to_string(engine.GetCategoryCount()) + " categories");
    return results;
}

std::vector<std::vector<SearchResult>> BatchProcessor::LearnChannels(
    const std::vector<ResonanceSearchEngine*>& engines,
    const std::vector<std::vector<Pattern>>& batches,
    double vigilance,
    WorkerPool& pool) {

    if (engines.size() != batches.size()) {
        throw std::invalid_argument(
            "LearnChannels: " + std::to_string(engines.size()) + " engines but " +
            std::to_string(batches.size()) + " batches");
    }
    if (!(vigilance >= 0.0 && vigilance <= 1.0)) {
        throw std::invalid_argument("LearnChannels: vigilance must be in [0, 1]");
    }

    // One writer per store
    std::set<const ResonanceSearchEngine*> seen;
    for (size_t k = 0; k < engines.size(); ++k) {
        if (!engines[k]) {
            throw std::invalid_argument("LearnChannels: engine " + std::to_string(k) + " is null");
        }
        if (!seen.insert(engines[k]).second) {
            throw std::invalid_argument("LearnChannels: engine " + std::to_string(k) +
                                        " appears more than once");
        }
        for (const auto& pattern : batches[k]) {
            engines[k]->ValidateInput(pattern);
        }
    }

    std::vector<std::vector<SearchResult>> results(engines.size());
    pool.ParallelFor(engines.size(), [&](size_t k) {
        auto& channel = results[k];
        channel.reserve(batches[k].size());
        for (const auto& pattern : batches[k]) {
            channel.push_back(engines[k]->Learn(pattern, vigilance));
        }
        patterns_learned_.fetch_add(batches[k].size(), std::memory_order_relaxed);
    });

    channel_runs_.fetch_add(1, std::memory_order_relaxed);
    LogDebug("LearnChannels: " + std::to_string(engines.size()) + " channels");
    return results;
}

// ============================================================================
// Prediction
// ============================================================================

std::vector<CategoryIndex> BatchProcessor::PredictBatch(
    const ResonanceSearchEngine& engine,
    const std::vector<Pattern>& patterns) {

    if (engine.GetCategoryCount() == 0) {
        throw std::logic_error("PredictBatch called before any category was learned");
    }
    for (const auto& pattern : patterns) {
        engine.ValidateInput(pattern);
    }
    if (patterns.empty()) {
        return {};
    }

    std::vector<CategoryIndex> predictions;
    if (ShouldVectorize(patterns.size(), engine.Dimension())) {
        predictions = PredictDimensionMajor(engine, patterns);
        for (size_t i = 0; i < patterns.size(); ++i) {
            engine.GetCounters().RecordPrediction();
        }
        vectorized_batches_.fetch_add(1, std::memory_order_relaxed);
    } else {
        predictions.reserve(patterns.size());
        for (const auto& pattern : patterns) {
            predictions.push_back(engine.Predict(pattern));
        }
        scalar_batches_.fetch_add(1, std::memory_order_relaxed);
    }

    patterns_predicted_.fetch_add(patterns.size(), std::memory_order_relaxed);
    return predictions;
}

std::vector<CategoryIndex> BatchProcessor::PredictDimensionMajor(
    const ResonanceSearchEngine& engine,
    const std::vector<Pattern>& patterns) const {

    const DimensionMajorBatch batch(patterns);
    const size_t batch_size = batch.BatchSize();
    const double alpha = engine.GetConfig().choice_alpha;

    std::vector<CategoryIndex> best(batch_size, 0);
    std::vector<double> best_choice(batch_size, -1.0);
    std::vector<double> intersection(batch_size);

    const CategoryStore& store = engine.GetStore();
    for (CategoryIndex j = 0; j < store.Size(); ++j) {
        const WeightVector& weights = store.Get(j).weights;
        const double denominator = alpha + L1Norm(weights);

        // Same summation order as Pattern::FuzzyAndNorm
        std::fill(intersection.begin(), intersection.end(), 0.0);
        for (size_t d = 0; d < batch.Dimension(); ++d) {
            const std::vector<double>& row = batch.Row(d);
            const double w = weights[d];
            for (size_t i = 0; i < batch_size; ++i) {
                intersection[i] += std::min(row[i], w);
            }
        }

        for (size_t i = 0; i < batch_size; ++i) {
            double choice = intersection[i] / denominator;
            if (choice > best_choice[i]) {
                best_choice[i] = choice;
                best[i] = j;
            }
        }
    }

    return best;
}

// ============================================================================
// Stats
// ============================================================================

BatchProcessor::Stats BatchProcessor::GetStats() const {
    Stats stats;
    stats.vectorized_batches = vectorized_batches_.load(std::memory_order_relaxed);
    stats.scalar_batches = scalar_batches_.load(std::memory_order_relaxed);
    stats.patterns_learned = patterns_learned_.load(std::memory_order_relaxed);
    stats.patterns_predicted = patterns_predicted_.load(std::memory_order_relaxed);
    stats.channel_runs = channel_runs_.load(std::memory_order_relaxed);
    return stats;
}

void BatchProcessor::ResetStats() {
    vectorized_batches_.store(0, std::memory_order_relaxed);
    scalar_batches_.store(0, std::memory_order_relaxed);
    patterns_learned_.store(0, std::memory_order_relaxed);
    patterns_predicted_.store(0, std::memory_order_relaxed);
    channel_runs_.store(0, std::memory_order_relaxed);
}

void BatchProcessor::LogDebug(const std::string& message) const {
    if (config_.debug_logging && debug_stream_) {
        *debug_stream_ << "[BatchProcessor] " << message << std::endl;
    }
}

} // namespace resonance
