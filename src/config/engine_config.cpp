// File: src/config/engine_config.cpp
//
// YAML Configuration Implementation for Resonance

#include "config/engine_config.hpp"
#include <yaml.h>
#include <cmath>
#include <fstream>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace resonance {

// Helper function to read string from YAML scalar
static std::string GetScalarValue(yaml_event_t* event) {
    return std::string(reinterpret_cast<char*>(event->data.scalar.value),
                      event->data.scalar.length);
}

// Helper to convert string to bool
static bool ParseBool(const std::string& value) {
    return (value == "true" || value == "True" || value == "TRUE" ||
            value == "yes" || value == "Yes" || value == "YES" ||
            value == "1" || value == "on" || value == "On" || value == "ON");
}

// Apply one key/value pair; numeric conversion errors propagate
static void ApplyValue(EngineConfig& config,
                       const std::string& section,
                       const std::string& key,
                       const std::string& value) {
    if (section == "resonance") {
        if (key == "vigilance") config.resonance.vigilance = std::stod(value);
        else if (key == "choice_alpha") config.resonance.choice_alpha = std::stod(value);
        else if (key == "learning_rate") config.resonance.learning_rate = std::stod(value);
        else if (key == "max_categories") config.resonance.max_categories = std::stoul(value);
        else if (key == "dimension") config.resonance.dimension = std::stoul(value);
        else if (key == "complement_coding") config.resonance.complement_coding = ParseBool(value);
    }
    else if (section == "learning_rule") {
        if (key == "type") config.learning_rule.type = value;
        else if (key == "weight_min") config.learning_rule.weight_min = std::stod(value);
        else if (key == "weight_max") config.learning_rule.weight_max = std::stod(value);
        else if (key == "weight_decay") config.learning_rule.weight_decay = std::stod(value);
        else if (key == "threshold_decay") config.learning_rule.threshold_decay = std::stod(value);
        else if (key == "instar_mode") config.learning_rule.instar_mode = value;
        else if (key == "gradient_weight") config.learning_rule.gradient_weight = std::stod(value);
    }
    else if (section == "match_tracking") {
        if (key == "epsilon") config.match_tracking.epsilon = std::stod(value);
        else if (key == "max_vigilance") config.match_tracking.max_vigilance = std::stod(value);
        else if (key == "output_vigilance") config.match_tracking.output_vigilance = std::stod(value);
        else if (key == "output_dimension") config.match_tracking.output_dimension = std::stoul(value);
    }
    else if (section == "performance") {
        if (key == "pool_max_size") config.performance.pool_max_size = std::stoul(value);
        else if (key == "worker_pool_size") config.performance.worker_pool_size = std::stoul(value);
        else if (key == "min_batch_size_for_vectorization") config.performance.min_batch_size_for_vectorization = std::stoul(value);
        else if (key == "min_dimension_for_vectorization") config.performance.min_dimension_for_vectorization = std::stoul(value);
    }
    else if (section == "logging") {
        if (key == "debug_logging") config.logging.debug_logging = ParseBool(value);
    }
}

std::optional<EngineConfig> EngineConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << filepath << std::endl;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

std::optional<EngineConfig> EngineConfig::LoadFromString(const std::string& yaml_content) {
    yaml_parser_t parser;
    yaml_event_t event;

    if (!yaml_parser_initialize(&parser)) {
        std::cerr << "Failed to initialize YAML parser" << std::endl;
        return std::nullopt;
    }

    // Set input string
    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    EngineConfig config = Default();
    std::string current_section;
    std::string current_key;
    int depth = 0;

    bool done = false;
    while (!done) {
        if (!yaml_parser_parse(&parser, &event)) {
            std::cerr << "YAML parse error at line " << (parser.problem_mark.line + 1)
                      << ": " << (parser.problem ? parser.problem : "unknown") << std::endl;
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        switch (event.type) {
            case YAML_STREAM_START_EVENT:
            case YAML_DOCUMENT_START_EVENT:
                break;

            case YAML_MAPPING_START_EVENT:
                depth++;
                break;

            case YAML_MAPPING_END_EVENT:
                depth--;
                if (depth == 1) {
                    current_section.clear();
                }
                break;

            case YAML_SCALAR_EVENT: {
                std::string value = GetScalarValue(&event);

                if (depth == 1) {
                    // Top-level key (section name)
                    current_section = value;
                } else if (depth == 2) {
                    if (current_key.empty()) {
                        current_key = value;
                    } else {
                        try {
                            ApplyValue(config, current_section, current_key, value);
                        } catch (const std::exception& e) {
                            std::cerr << "Invalid value for " << current_section << "."
                                      << current_key << ": '" << value << "' ("
                                      << e.what() << ")" << std::endl;
                            yaml_event_delete(&event);
                            yaml_parser_delete(&parser);
                            return std::nullopt;
                        }
                        current_key.clear();
                    }
                }
                break;
            }

            case YAML_STREAM_END_EVENT:
            case YAML_DOCUMENT_END_EVENT:
                done = true;
                break;

            default:
                break;
        }

        yaml_event_delete(&event);
    }

    yaml_parser_delete(&parser);

    // Validate configuration
    if (!config.Validate()) {
        std::cerr << "Configuration validation failed:" << std::endl;
        for (const auto& error : config.GetValidationErrors()) {
            std::cerr << "  - " << error << std::endl;
        }
        return std::nullopt;
    }

    return config;
}

bool EngineConfig::SaveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open file for writing: " << filepath << std::endl;
        return false;
    }

    file << ToYamlString();
    return true;
}

std::string EngineConfig::ToYamlString() const {
    std::ostringstream ss;
    ss.precision(17);

    ss << "# Resonance engine configuration\n\n";

    ss << "resonance:\n";
    ss << "  vigilance: " << resonance.vigilance << "\n";
    ss << "  choice_alpha: " << resonance.choice_alpha << "\n";
    ss << "  learning_rate: " << resonance.learning_rate << "\n";
    ss << "  max_categories: " << resonance.max_categories << "\n";
    ss << "  dimension: " << resonance.dimension << "\n";
    ss << "  complement_coding: " << (resonance.complement_coding ? "true" : "false") << "\n\n";

    ss << "learning_rule:\n";
    ss << "  type: \"" << learning_rule.type << "\"\n";
    ss << "  weight_min: " << learning_rule.weight_min << "\n";
    ss << "  weight_max: " << learning_rule.weight_max << "\n";
    ss << "  weight_decay: " << learning_rule.weight_decay << "\n";
    ss << "  threshold_decay: " << learning_rule.threshold_decay << "\n";
    ss << "  instar_mode: \"" << learning_rule.instar_mode << "\"\n";
    ss << "  gradient_weight: " << learning_rule.gradient_weight << "\n\n";

    ss << "match_tracking:\n";
    ss << "  epsilon: " << match_tracking.epsilon << "\n";
    ss << "  max_vigilance: " << match_tracking.max_vigilance << "\n";
    ss << "  output_vigilance: " << match_tracking.output_vigilance << "\n";
    ss << "  output_dimension: " << match_tracking.output_dimension << "\n\n";

    ss << "performance:\n";
    ss << "  pool_max_size: " << performance.pool_max_size << "\n";
    ss << "  worker_pool_size: " << performance.worker_pool_size << "\n";
    ss << "  min_batch_size_for_vectorization: " << performance.min_batch_size_for_vectorization << "\n";
    ss << "  min_dimension_for_vectorization: " << performance.min_dimension_for_vectorization << "\n\n";

    ss << "logging:\n";
    ss << "  debug_logging: " << (logging.debug_logging ? "true" : "false") << "\n";

    return ss.str();
}

bool EngineConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> EngineConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    // Range checks are written so that NaN fails them

    // Search
    if (!(resonance.vigilance >= 0.0 && resonance.vigilance <= 1.0)) {
        errors.push_back("vigilance must be between 0.0 and 1.0");
    }
    if (!(resonance.choice_alpha > 0.0) || !std::isfinite(resonance.choice_alpha)) {
        errors.push_back("choice_alpha must be a finite value greater than 0");
    }
    if (!(resonance.learning_rate >= 0.0 && resonance.learning_rate <= 1.0)) {
        errors.push_back("learning_rate must be between 0.0 and 1.0");
    }
    if (resonance.max_categories == 0) {
        errors.push_back("max_categories must be greater than 0");
    }
    if (resonance.dimension == 0) {
        errors.push_back("dimension must be greater than 0");
    }

    // Learning rule
    try {
        ParseLearningRuleType(learning_rule.type);
    } catch (const std::invalid_argument&) {
        errors.push_back("type must be one of: fuzzy_art, hebbian, bcm, instar_outstar, gradient_hybrid");
    }
    try {
        ParseInstarMode(learning_rule.instar_mode);
    } catch (const std::invalid_argument&) {
        errors.push_back("instar_mode must be one of: instar, outstar, both");
    }
    WeightBounds bounds;
    bounds.min_weight = learning_rule.weight_min;
    bounds.max_weight = learning_rule.weight_max;
    for (const auto& error : bounds.GetValidationErrors()) {
        errors.push_back(error);
    }
    if (!(learning_rule.weight_decay >= 0.0 && learning_rule.weight_decay <= 1.0)) {
        errors.push_back("weight_decay must be between 0.0 and 1.0");
    }
    if (!(learning_rule.threshold_decay >= 0.0 && learning_rule.threshold_decay <= 1.0)) {
        errors.push_back("threshold_decay must be between 0.0 and 1.0");
    }
    if (!(learning_rule.gradient_weight >= 0.0 && learning_rule.gradient_weight <= 1.0)) {
        errors.push_back("gradient_weight must be between 0.0 and 1.0");
    }

    // Match tracking
    if (!(match_tracking.epsilon > 0.0 && match_tracking.epsilon <= 0.1)) {
        errors.push_back("epsilon must be in (0, 0.1]");
    }
    if (!(match_tracking.max_vigilance > 0.0 && match_tracking.max_vigilance <= 1.0)) {
        errors.push_back("max_vigilance must be in (0, 1]");
    } else if (match_tracking.max_vigilance < resonance.vigilance) {
        errors.push_back("max_vigilance must be >= vigilance");
    }
    if (!(match_tracking.output_vigilance >= 0.0 && match_tracking.output_vigilance <= 1.0)) {
        errors.push_back("output_vigilance must be between 0.0 and 1.0");
    }

    // Performance
    if (performance.pool_max_size == 0) {
        errors.push_back("pool_max_size must be greater than 0");
    }
    if (performance.worker_pool_size == 0) {
        errors.push_back("worker_pool_size must be greater than 0");
    }

    // Anything the engines themselves would still reject
    if (errors.empty()) {
        for (const auto& error : ToArtmapConfig().GetValidationErrors()) {
            errors.push_back(error);
        }
    }

    return errors;
}

EngineConfig EngineConfig::Default() {
    return EngineConfig{};  // Uses default member initializers
}

// ============================================================================
// Converters
// ============================================================================

size_t EngineConfig::EngineDimension() const {
    return resonance.complement_coding ? 2 * resonance.dimension : resonance.dimension;
}

LearningRuleParams EngineConfig::ToLearningRuleParams() const {
    WeightBounds bounds;
    bounds.min_weight = learning_rule.weight_min;
    bounds.max_weight = learning_rule.weight_max;

    switch (ParseLearningRuleType(learning_rule.type)) {
        case LearningRuleType::FUZZY_ART: {
            FuzzyArtParams params;
            params.bounds = bounds;
            return params;
        }
        case LearningRuleType::HEBBIAN: {
            HebbianParams params;
            params.weight_decay = learning_rule.weight_decay;
            params.bounds = bounds;
            return params;
        }
        case LearningRuleType::BCM: {
            BcmParams params;
            params.threshold_decay = learning_rule.threshold_decay;
            params.weight_decay = learning_rule.weight_decay;
            params.bounds = bounds;
            return params;
        }
        case LearningRuleType::INSTAR_OUTSTAR: {
            InstarOutstarParams params;
            params.mode = ParseInstarMode(learning_rule.instar_mode);
            params.weight_decay = learning_rule.weight_decay;
            params.bounds = bounds;
            return params;
        }
        case LearningRuleType::GRADIENT_HYBRID: {
            GradientHybridParams params;
            params.gradient_weight = learning_rule.gradient_weight;
            params.bounds = bounds;
            return params;
        }
    }
    throw std::invalid_argument("Unknown learning rule type: " + learning_rule.type);
}

ResonanceSearchEngine::Config EngineConfig::ToSearchConfig() const {
    ResonanceSearchEngine::Config config;
    config.dimension = EngineDimension();
    config.max_categories = resonance.max_categories;
    config.choice_alpha = resonance.choice_alpha;
    config.learning_rate = resonance.learning_rate;
    config.learning_rule = ToLearningRuleParams();
    config.debug_logging = logging.debug_logging;
    return config;
}

Artmap::Config EngineConfig::ToArtmapConfig() const {
    Artmap::Config config;
    config.module_a = ToSearchConfig();
    if (match_tracking.output_dimension > 0) {
        ResonanceSearchEngine::Config module_b = config.module_a;
        module_b.dimension = resonance.complement_coding
            ? 2 * match_tracking.output_dimension
            : match_tracking.output_dimension;
        config.module_b = module_b;
    }
    config.baseline_vigilance = resonance.vigilance;
    config.output_vigilance = match_tracking.output_vigilance;
    config.epsilon = match_tracking.epsilon;
    config.max_vigilance = match_tracking.max_vigilance;
    config.debug_logging = logging.debug_logging;
    return config;
}

BatchProcessor::Config EngineConfig::ToBatchConfig() const {
    BatchProcessor::Config config;
    config.min_batch_size_for_vectorization = performance.min_batch_size_for_vectorization;
    config.min_dimension_for_vectorization = performance.min_dimension_for_vectorization;
    config.debug_logging = logging.debug_logging;
    return config;
}

} // namespace resonance
