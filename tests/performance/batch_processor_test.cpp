// File: tests/performance/batch_processor_test.cpp
//
// Tests for BatchProcessor (dimension-major vs per-pattern paths)

#include "performance/batch_processor.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <memory>
#include <random>
#include <sstream>
#include <stdexcept>

using namespace resonance;

// ============================================================================
// Test Fixture
// ============================================================================

class BatchProcessorTest : public ::testing::Test {
protected:
    static BatchMatrix RandomMatrix(size_t rows, size_t cols, unsigned seed) {
        std::mt19937 rng(seed);
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        BatchMatrix matrix(rows, std::vector<double>(cols));
        for (auto& row : matrix) {
            for (auto& v : row) {
                v = dist(rng);
            }
        }
        return matrix;
    }

    static std::vector<Pattern> RandomPatterns(size_t count, size_t dimension, unsigned seed) {
        std::vector<Pattern> patterns;
        for (auto& row : RandomMatrix(count, dimension, seed)) {
            row[0] += 0.01;  // keep the norm positive
            patterns.emplace_back(row);
        }
        return patterns;
    }

    static ResonanceSearchEngine::Config SearchConfig(size_t dimension) {
        ResonanceSearchEngine::Config config;
        config.dimension = dimension;
        config.max_categories = 500;
        return config;
    }

    BatchProcessor processor_;
};

// ============================================================================
// Dynamics
// ============================================================================

TEST_F(BatchProcessorTest, VectorizedEvolveMatchesScalar) {
    BatchMatrix input = RandomMatrix(64, 128, 3);
    ShuntingParameters params;
    params.driving_strength = 1.3;

    ASSERT_TRUE(processor_.ShouldVectorize(64, 128));
    BatchMatrix vectorized = processor_.EvolveBatch(input, params);
    EXPECT_EQ(1u, processor_.GetStats().vectorized_batches);

    ShuntingDynamics dynamics(params);
    for (size_t i = 0; i < input.size(); ++i) {
        std::vector<double> scalar = dynamics.Step(input[i]);
        for (size_t d = 0; d < scalar.size(); ++d) {
            EXPECT_LT(std::abs(scalar[d] - vectorized[i][d]), 1e-10);
        }
    }
}

TEST_F(BatchProcessorTest, SmallBatchUsesScalarPath) {
    BatchMatrix input = RandomMatrix(4, 8, 5);
    BatchMatrix output = processor_.EvolveBatch(input, ShuntingParameters{});

    EXPECT_EQ(4u, output.size());
    EXPECT_EQ(1u, processor_.GetStats().scalar_batches);
    EXPECT_EQ(0u, processor_.GetStats().vectorized_batches);
}

TEST_F(BatchProcessorTest, EvolveRejectsBadInput) {
    EXPECT_THROW(processor_.EvolveBatch(BatchMatrix{}, ShuntingParameters{}), std::invalid_argument);
    EXPECT_THROW(processor_.EvolveBatch(BatchMatrix{{1.0, 2.0}, {1.0}}, ShuntingParameters{}),
                 std::invalid_argument);

    ShuntingParameters bad;
    bad.time_step = -1.0;
    EXPECT_THROW(processor_.EvolveBatch(RandomMatrix(2, 2, 1), bad), std::invalid_argument);
}

// ============================================================================
// Learning
// ============================================================================

TEST_F(BatchProcessorTest, ProcessBatchMatchesSequentialLearn) {
    ResonanceSearchEngine batched(SearchConfig(6));
    ResonanceSearchEngine sequential(SearchConfig(6));
    auto patterns = RandomPatterns(50, 6, 9);

    auto results = processor_.ProcessBatch(batched, patterns, 0.7);
    ASSERT_EQ(patterns.size(), results.size());

    for (size_t i = 0; i < patterns.size(); ++i) {
        auto expected = sequential.Learn(patterns[i], 0.7);
        EXPECT_EQ(expected.category, results[i].category);
        EXPECT_EQ(expected.outcome, results[i].outcome);
    }
    EXPECT_EQ(sequential.GetCategoryCount(), batched.GetCategoryCount());
    EXPECT_EQ(50u, processor_.GetStats().patterns_learned);
}

TEST_F(BatchProcessorTest, ProcessBatchValidatesBeforeLearning) {
    ResonanceSearchEngine engine(SearchConfig(2));
    std::vector<Pattern> patterns{Pattern{1.0, 0.0}, Pattern{0.0, 1.0}, Pattern{0.0, 0.0}};

    EXPECT_THROW(processor_.ProcessBatch(engine, patterns, 0.5), std::invalid_argument);
    EXPECT_EQ(0u, engine.GetCategoryCount());

    EXPECT_THROW(processor_.ProcessBatch(engine, {Pattern{1.0, 0.0}}, 1.5), std::invalid_argument);
    EXPECT_EQ(0u, engine.GetCategoryCount());
}

TEST_F(BatchProcessorTest, ProcessEmptyBatch) {
    ResonanceSearchEngine engine(SearchConfig(2));
    EXPECT_TRUE(processor_.ProcessBatch(engine, {}, 0.5).empty());
}

// ============================================================================
// Prediction
// ============================================================================

TEST_F(BatchProcessorTest, VectorizedPredictMatchesEngine) {
    ResonanceSearchEngine engine(SearchConfig(64));
    processor_.ProcessBatch(engine, RandomPatterns(40, 64, 17), 0.8);
    ASSERT_GT(engine.GetCategoryCount(), 1u);

    auto queries = RandomPatterns(48, 64, 23);
    auto predicted = processor_.PredictBatch(engine, queries);
    EXPECT_EQ(1u, processor_.GetStats().vectorized_batches);

    ASSERT_EQ(queries.size(), predicted.size());
    for (size_t i = 0; i < queries.size(); ++i) {
        EXPECT_EQ(engine.Predict(queries[i]), predicted[i]);
    }
}

TEST_F(BatchProcessorTest, ScalarPredictMatchesEngine) {
    ResonanceSearchEngine engine(SearchConfig(4));
    processor_.ProcessBatch(engine, RandomPatterns(20, 4, 2), 0.8);

    auto queries = RandomPatterns(5, 4, 4);
    auto predicted = processor_.PredictBatch(engine, queries);
    EXPECT_EQ(1u, processor_.GetStats().scalar_batches);
    for (size_t i = 0; i < queries.size(); ++i) {
        EXPECT_EQ(engine.Predict(queries[i]), predicted[i]);
    }
}

TEST_F(BatchProcessorTest, PredictOnEmptyEngineThrows) {
    ResonanceSearchEngine engine(SearchConfig(2));
    EXPECT_THROW(processor_.PredictBatch(engine, {Pattern{1.0, 0.0}}), std::logic_error);
}

// ============================================================================
// Channels
// ============================================================================

TEST_F(BatchProcessorTest, LearnChannelsMatchesPerChannelLearning) {
    WorkerPool pool(3);
    std::vector<std::unique_ptr<ResonanceSearchEngine>> owned;
    std::vector<ResonanceSearchEngine*> engines;
    std::vector<std::vector<Pattern>> batches;
    for (unsigned k = 0; k < 3; ++k) {
        owned.push_back(std::make_unique<ResonanceSearchEngine>(SearchConfig(5)));
        engines.push_back(owned.back().get());
        batches.push_back(RandomPatterns(30, 5, 100 + k));
    }

    auto results = processor_.LearnChannels(engines, batches, 0.75, pool);
    ASSERT_EQ(3u, results.size());

    for (size_t k = 0; k < 3; ++k) {
        ResonanceSearchEngine reference(SearchConfig(5));
        for (size_t i = 0; i < batches[k].size(); ++i) {
            EXPECT_EQ(reference.Learn(batches[k][i], 0.75).category, results[k][i].category);
        }
        EXPECT_EQ(reference.GetCategoryCount(), engines[k]->GetCategoryCount());
    }
    EXPECT_EQ(90u, processor_.GetStats().patterns_learned);
    EXPECT_EQ(1u, processor_.GetStats().channel_runs);
}

TEST_F(BatchProcessorTest, LearnChannelsRejectsSharedEngine) {
    WorkerPool pool(2);
    ResonanceSearchEngine engine(SearchConfig(2));
    std::vector<ResonanceSearchEngine*> engines{&engine, &engine};
    std::vector<std::vector<Pattern>> batches{{Pattern{1.0, 0.0}}, {Pattern{0.0, 1.0}}};

    EXPECT_THROW(processor_.LearnChannels(engines, batches, 0.5, pool), std::invalid_argument);
    EXPECT_EQ(0u, engine.GetCategoryCount());
}

TEST_F(BatchProcessorTest, LearnChannelsRejectsBadInput) {
    WorkerPool pool(2);
    ResonanceSearchEngine a(SearchConfig(2));
    ResonanceSearchEngine b(SearchConfig(2));

    std::vector<ResonanceSearchEngine*> engines{&a, &b};
    std::vector<std::vector<Pattern>> batches{{Pattern{1.0, 0.0}}, {Pattern{1.0, 0.0, 0.0}}};
    EXPECT_THROW(processor_.LearnChannels(engines, batches, 0.5, pool), std::invalid_argument);
    EXPECT_EQ(0u, a.GetCategoryCount());

    std::vector<ResonanceSearchEngine*> with_null{&a, nullptr};
    EXPECT_THROW(processor_.LearnChannels(with_null, batches, 0.5, pool), std::invalid_argument);

    batches.pop_back();
    EXPECT_THROW(processor_.LearnChannels(engines, batches, 0.5, pool), std::invalid_argument);
}

TEST_F(BatchProcessorTest, DebugLoggingPrefix) {
    BatchProcessor::Config config;
    config.debug_logging = true;
    BatchProcessor processor(config);

    std::ostringstream log;
    processor.SetDebugStream(&log);
    processor.EvolveBatch(RandomMatrix(2, 2, 1), ShuntingParameters{});
    EXPECT_NE(std::string::npos, log.str().find("[BatchProcessor] EvolveBatch: scalar"));
}

TEST_F(BatchProcessorTest, DefaultConstructionUsesDefaultThresholds) {
    BatchProcessor defaulted;
    BatchProcessor::Config expected;

    EXPECT_EQ(expected.min_batch_size_for_vectorization,
              defaulted.GetConfig().min_batch_size_for_vectorization);
    EXPECT_EQ(expected.min_dimension_for_vectorization,
              defaulted.GetConfig().min_dimension_for_vectorization);
    EXPECT_FALSE(defaulted.GetConfig().debug_logging);
    EXPECT_TRUE(defaulted.ShouldVectorize(32, 64));
    EXPECT_FALSE(defaulted.ShouldVectorize(31, 64));
}
