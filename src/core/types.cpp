// File: src/core/types.cpp
#include "core/types.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace resonance {

namespace {

std::string ToLower(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

} // anonymous namespace

const char* ToString(ResonanceOutcome outcome) {
    switch (outcome) {
        case ResonanceOutcome::RESONANT: return "RESONANT";
        case ResonanceOutcome::COMMITTED_NEW: return "COMMITTED_NEW";
        case ResonanceOutcome::CAPACITY_EXCEEDED: return "CAPACITY_EXCEEDED";
        case ResonanceOutcome::NO_RESONANCE: return "NO_RESONANCE";
        default: return "UNKNOWN";
    }
}

const char* ToString(LearningRuleType type) {
    switch (type) {
        case LearningRuleType::FUZZY_ART: return "fuzzy_art";
        case LearningRuleType::HEBBIAN: return "hebbian";
        case LearningRuleType::BCM: return "bcm";
        case LearningRuleType::INSTAR_OUTSTAR: return "instar_outstar";
        case LearningRuleType::GRADIENT_HYBRID: return "gradient_hybrid";
        default: return "unknown";
    }
}

LearningRuleType ParseLearningRuleType(const std::string& str) {
    std::string lower = ToLower(str);
    if (lower == "fuzzy_art") return LearningRuleType::FUZZY_ART;
    if (lower == "hebbian") return LearningRuleType::HEBBIAN;
    if (lower == "bcm") return LearningRuleType::BCM;
    if (lower == "instar_outstar") return LearningRuleType::INSTAR_OUTSTAR;
    if (lower == "gradient_hybrid") return LearningRuleType::GRADIENT_HYBRID;
    throw std::invalid_argument("Unknown LearningRuleType: " + str);
}

const char* ToString(InstarMode mode) {
    switch (mode) {
        case InstarMode::INSTAR: return "instar";
        case InstarMode::OUTSTAR: return "outstar";
        case InstarMode::BOTH: return "both";
        default: return "unknown";
    }
}

InstarMode ParseInstarMode(const std::string& str) {
    std::string lower = ToLower(str);
    if (lower == "instar") return InstarMode::INSTAR;
    if (lower == "outstar") return InstarMode::OUTSTAR;
    if (lower == "both") return InstarMode::BOTH;
    throw std::invalid_argument("Unknown InstarMode: " + str);
}

} // namespace resonance
