// File: examples/supervised_classification.cpp
//
// Supervised classification with ARTMAP.
// Demonstrates:
// - Loading an engine configuration from YAML
// - Training on labeled inputs with match tracking
// - Predicting labels for unseen inputs
// - Reading the map field and statistics
//
// Usage: supervised_classification [config.yaml]

#include "config/engine_config.hpp"
#include "supervised/artmap.hpp"
#include <iomanip>
#include <iostream>
#include <random>
#include <vector>

using namespace resonance;

int main(int argc, char** argv) {
    std::cout << "=== Resonance Supervised Classification Example ===\n\n";

    EngineConfig config = EngineConfig::Default();
    if (argc > 1) {
        auto loaded = EngineConfig::LoadFromFile(argv[1]);
        if (!loaded) {
            std::cerr << "Could not load configuration from " << argv[1] << "\n";
            return 1;
        }
        config = *loaded;
    } else {
        config.resonance.dimension = 2;
        config.resonance.vigilance = 0.5;
    }

    if (config.resonance.dimension != 2) {
        std::cerr << "This example needs resonance.dimension = 2\n";
        return 1;
    }

    // Label 1 inside the circle of radius 0.3 around the centre
    auto label_of = [](double x, double y) -> MapTarget {
        double dx = x - 0.5;
        double dy = y - 0.5;
        return dx * dx + dy * dy < 0.09 ? 1 : 0;
    };
    auto encode = [&config](double x, double y) {
        return config.resonance.complement_coding ? Pattern::ComplementCoded({x, y})
                                                  : Pattern{x, y};
    };

    std::mt19937 rng(7);
    std::uniform_real_distribution<double> dist(0.01, 0.99);

    std::vector<Pattern> inputs;
    std::vector<MapTarget> labels;
    for (int i = 0; i < 500; ++i) {
        double x = dist(rng);
        double y = dist(rng);
        inputs.push_back(encode(x, y));
        labels.push_back(label_of(x, y));
    }

    Artmap artmap(config.ToArtmapConfig());

    std::cout << "Training on " << inputs.size() << " points...\n";
    auto results = artmap.Fit(inputs, labels);
    size_t failures = 0;
    for (const auto& result : results) {
        if (!result.Succeeded()) {
            ++failures;
        }
    }

    auto stats = artmap.GetStats();
    std::cout << "  Categories: " << artmap.GetCategoryCount() << "\n";
    std::cout << "  Match tracking events: " << stats.match_tracking_events << "\n";
    std::cout << "  New associations: " << stats.new_associations << "\n";
    std::cout << "  Reinforcements: " << stats.reinforcements << "\n";
    std::cout << "  Not learned (capacity): " << failures << "\n\n";

    std::cout << "Testing on 200 new points...\n";
    size_t correct = 0;
    for (int i = 0; i < 200; ++i) {
        double x = dist(rng);
        double y = dist(rng);
        Prediction prediction = artmap.Predict(encode(x, y));
        if (prediction.IsMapped() && *prediction.target == label_of(x, y)) {
            ++correct;
        }
    }
    std::cout << "  Accuracy: " << std::fixed << std::setprecision(1)
              << (100.0 * correct / 200.0) << "%\n";

    std::cout << "  Categories for label 0: " << artmap.GetMapField().GetSources(0).size() << "\n";
    std::cout << "  Categories for label 1: " << artmap.GetMapField().GetSources(1).size() << "\n\n";

    std::cout << "=== Example completed successfully ===\n";
    return 0;
}
