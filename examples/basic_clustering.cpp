// File: examples/basic_clustering.cpp
//
// Unsupervised clustering with a resonance search engine.
// Demonstrates:
// - Complement coding raw inputs
// - Learning at two vigilance levels
// - Inspecting choice and match values
// - Viewing engine statistics

#include "resonance/resonance_search.hpp"
#include <iomanip>
#include <iostream>
#include <vector>

using namespace resonance;

int main() {
    std::cout << "=== Resonance Basic Clustering Example ===\n\n";

    const std::vector<std::vector<double>> raw = {
        {0.10, 0.15}, {0.12, 0.10}, {0.15, 0.12},   // lower left
        {0.85, 0.90}, {0.90, 0.88}, {0.88, 0.85},   // upper right
        {0.10, 0.90}, {0.12, 0.85},                 // upper left
    };

    std::vector<Pattern> inputs;
    for (const auto& values : raw) {
        inputs.push_back(Pattern::ComplementCoded(values));
    }

    for (double vigilance : {0.6, 0.95}) {
        std::cout << "Vigilance " << std::fixed << std::setprecision(2) << vigilance << ":\n";

        ResonanceSearchEngine::Config config;
        config.dimension = 4;
        config.max_categories = 32;
        ResonanceSearchEngine engine(config);

        for (size_t i = 0; i < inputs.size(); ++i) {
            SearchResult result = engine.Learn(inputs[i], vigilance);
            std::cout << "  Input " << i << " -> " << ToString(result.outcome);
            if (result.Succeeded()) {
                std::cout << " category " << result.category
                          << " (T=" << std::setprecision(3) << result.choice
                          << ", M=" << result.match << ")";
            }
            std::cout << "\n";
        }

        std::cout << "  Categories: " << engine.GetCategoryCount() << "\n";
        std::cout << "  " << engine.GetStats().ToString() << "\n\n";
    }

    std::cout << "=== Example completed successfully ===\n";
    return 0;
}
