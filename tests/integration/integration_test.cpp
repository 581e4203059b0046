// File: tests/integration/integration_test.cpp
//
// Integration tests for the resonance engine.
// Tests end-to-end workflows and component interactions.

#include "config/engine_config.hpp"
#include "performance/batch_processor.hpp"
#include "supervised/artmap.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <random>
#include <set>
#include <sstream>
#include <vector>

using namespace resonance;

// ============================================================================
// Test Utilities
// ============================================================================

/// Two well separated 2-D clusters, complement coded
struct LabeledData {
    std::vector<Pattern> inputs;
    std::vector<MapTarget> labels;
};

LabeledData GenerateClusters(size_t per_cluster, unsigned int seed) {
    std::mt19937 gen(seed);
    std::uniform_real_distribution<double> noise(-0.05, 0.05);

    const double centers[2][2] = {{0.2, 0.2}, {0.8, 0.8}};
    LabeledData data;
    for (size_t i = 0; i < per_cluster; ++i) {
        for (MapTarget label = 0; label < 2; ++label) {
            double x = centers[label][0] + noise(gen);
            double y = centers[label][1] + noise(gen);
            data.inputs.push_back(Pattern::ComplementCoded({x, y}));
            data.labels.push_back(label);
        }
    }
    return data;
}

EngineConfig LoadTestConfig() {
    std::string yaml = R"(
resonance:
  vigilance: 0.75
  dimension: 2
  complement_coding: true
  max_categories: 200

match_tracking:
  epsilon: 0.001
)";
    auto config = EngineConfig::LoadFromString(yaml);
    EXPECT_TRUE(config.has_value());
    return config.value_or(EngineConfig::Default());
}

// ============================================================================
// Supervised Workflow
// ============================================================================

TEST(IntegrationTest, ConfiguredArtmapClassifiesClusters) {
    EngineConfig config = LoadTestConfig();
    Artmap artmap(config.ToArtmapConfig());

    auto train = GenerateClusters(50, 1);
    auto results = artmap.Fit(train.inputs, train.labels);
    for (const auto& result : results) {
        ASSERT_TRUE(result.Succeeded());
    }

    auto test = GenerateClusters(25, 2);
    size_t correct = 0;
    for (size_t i = 0; i < test.inputs.size(); ++i) {
        auto prediction = artmap.Predict(test.inputs[i]);
        if (prediction.IsMapped() && *prediction.target == test.labels[i]) {
            ++correct;
        }
    }
    double accuracy = static_cast<double>(correct) / test.inputs.size();
    EXPECT_GE(accuracy, 0.95);

    // Every category belongs to exactly one class
    auto stats = artmap.GetStats();
    EXPECT_EQ(artmap.GetCategoryCount(), stats.map_field_size);
    EXPECT_EQ(100u, stats.learn_calls);
}

TEST(IntegrationTest, InterleavedLabelsTriggerMatchTracking) {
    Artmap::Config config;
    config.module_a.dimension = 4;
    config.baseline_vigilance = 0.0;  // everything resonates until tracked
    Artmap artmap(config);

    auto data = GenerateClusters(10, 3);
    artmap.Fit(data.inputs, data.labels);

    EXPECT_GT(artmap.GetStats().match_tracking_events, 0u);
    EXPECT_EQ(2u, artmap.GetMapField().TargetCount());

    // Each class keeps its own categories
    auto class0 = artmap.GetMapField().GetSources(0);
    auto class1 = artmap.GetMapField().GetSources(1);
    std::set<CategoryIndex> overlap(class0.begin(), class0.end());
    for (CategoryIndex c : class1) {
        EXPECT_EQ(0u, overlap.count(c));
    }
}

// ============================================================================
// Unsupervised Workflow
// ============================================================================

TEST(IntegrationTest, BatchClusteringWithPooledEngine) {
    EngineConfig config = LoadTestConfig();
    ResonanceSearchEngine engine(config.ToSearchConfig());
    engine.SetPool(std::make_shared<WeightVectorPool>(config.EngineDimension(),
                                                      config.performance.pool_max_size));

    BatchProcessor processor(config.ToBatchConfig());
    auto data = GenerateClusters(40, 4);
    processor.ProcessBatch(engine, data.inputs, config.resonance.vigilance);

    ASSERT_GE(engine.GetCategoryCount(), 2u);

    auto predictions = processor.PredictBatch(engine, data.inputs);
    ASSERT_EQ(data.inputs.size(), predictions.size());

    // Points of different clusters never share a category
    std::set<CategoryIndex> cluster0;
    std::set<CategoryIndex> cluster1;
    for (size_t i = 0; i < predictions.size(); ++i) {
        (data.labels[i] == 0 ? cluster0 : cluster1).insert(predictions[i]);
    }
    for (CategoryIndex c : cluster0) {
        EXPECT_EQ(0u, cluster1.count(c));
    }
}

TEST(IntegrationTest, DebugLoggingFromConfiguration) {
    EngineConfig config = LoadTestConfig();
    config.logging.debug_logging = true;

    Artmap artmap(config.ToArtmapConfig());
    std::ostringstream log;
    artmap.SetDebugStream(&log);

    artmap.LearnLabel(Pattern::ComplementCoded({0.2, 0.2}), 0);
    artmap.LearnLabel(Pattern::ComplementCoded({0.22, 0.2}), 1);

    EXPECT_NE(std::string::npos, log.str().find("[ResonanceSearch]"));
    EXPECT_NE(std::string::npos, log.str().find("[Artmap]"));
}
