// File: include/config/engine_config.hpp
//
// YAML Configuration Support for Resonance
// One file configures the search engine, learning rule, match tracking,
// batch/pool sizing and logging

#ifndef RESONANCE_CONFIG_ENGINE_CONFIG_HPP
#define RESONANCE_CONFIG_ENGINE_CONFIG_HPP

#include "learning/learning_rule.hpp"
#include "performance/batch_processor.hpp"
#include "resonance/resonance_search.hpp"
#include "supervised/artmap.hpp"
#include <optional>
#include <string>
#include <vector>

namespace resonance {

/// Configuration structure for resonance engines
struct EngineConfig {
    // === Search Settings ===
    struct Resonance {
        double vigilance = 0.75;
        double choice_alpha = 0.001;
        double learning_rate = 1.0;
        size_t max_categories = 1000;
        size_t dimension = 4;            // Raw input dimension
        bool complement_coding = true;   // Engine dimension is 2x when set
    } resonance;

    // === Learning Rule Settings ===
    struct LearningRule {
        std::string type = "fuzzy_art";  // fuzzy_art, hebbian, bcm, instar_outstar, gradient_hybrid
        double weight_min = 0.0;
        double weight_max = 1.0;
        double weight_decay = 0.0001;    // hebbian, bcm, instar_outstar
        double threshold_decay = 0.5;    // bcm
        std::string instar_mode = "instar";  // instar, outstar, both
        double gradient_weight = 0.5;    // gradient_hybrid
    } learning_rule;

    // === Supervised Settings ===
    struct MatchTracking {
        double epsilon = 0.001;
        double max_vigilance = 1.0;
        double output_vigilance = 0.9;
        size_t output_dimension = 0;     // 0: label mode, no output module
    } match_tracking;

    // === Performance Settings ===
    struct Performance {
        size_t pool_max_size = 64;
        size_t worker_pool_size = 4;
        size_t min_batch_size_for_vectorization = 32;
        size_t min_dimension_for_vectorization = 64;
    } performance;

    // === Logging Settings ===
    struct Logging {
        bool debug_logging = false;
    } logging;

    /// Load configuration from YAML file
    /// @param filepath Path to YAML configuration file
    /// @return EngineConfig if successful, std::nullopt on error
    static std::optional<EngineConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// @param yaml_content YAML content as string
    /// @return EngineConfig if successful, std::nullopt on error
    static std::optional<EngineConfig> LoadFromString(const std::string& yaml_content);

    /// Save configuration to YAML file
    /// @return true if successful, false on error
    bool SaveToFile(const std::string& filepath) const;

    /// Convert to YAML string
    std::string ToYamlString() const;

    /// Validate configuration values
    bool Validate() const;

    /// Get validation errors (if any)
    std::vector<std::string> GetValidationErrors() const;

    /// Create default configuration
    static EngineConfig Default();

    // === Converters (call on a valid configuration) ===

    /// Dimension seen by the engine after optional complement coding
    size_t EngineDimension() const;

    /// @throws std::invalid_argument on an unknown rule type or mode
    LearningRuleParams ToLearningRuleParams() const;

    ResonanceSearchEngine::Config ToSearchConfig() const;
    Artmap::Config ToArtmapConfig() const;
    BatchProcessor::Config ToBatchConfig() const;
};

} // namespace resonance

#endif // RESONANCE_CONFIG_ENGINE_CONFIG_HPP
