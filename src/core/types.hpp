// File: src/core/types.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace resonance {

// CategoryIndex: Position of a category inside its CategoryStore
// Indices are stable once assigned; only an explicit prune renumbers them
using CategoryIndex = size_t;

// Sentinel for "no category"
constexpr CategoryIndex kNoCategory = std::numeric_limits<CategoryIndex>::max();

// MapTarget: Right-hand side of a map-field association
// Either a module-B category index or a caller-supplied label id
using MapTarget = uint64_t;

// WeightVector: Mutable prototype / scratch buffer
using WeightVector = std::vector<double>;

// ResonanceOutcome: Terminal state of a single search-and-commit cycle
enum class ResonanceOutcome : uint8_t {
    RESONANT = 0,           // Existing category passed the vigilance test
    COMMITTED_NEW = 1,      // No candidate resonated, a new category was appended
    CAPACITY_EXCEEDED = 2,  // No candidate resonated and the store is full
    NO_RESONANCE = 3,       // Search-only result, nothing committed yet
};

// Convert ResonanceOutcome to string
const char* ToString(ResonanceOutcome outcome);

// LearningRuleType: Closed set of synaptic learning rules
enum class LearningRuleType : uint8_t {
    FUZZY_ART = 0,
    HEBBIAN = 1,
    BCM = 2,
    INSTAR_OUTSTAR = 3,
    GRADIENT_HYBRID = 4,
};

// Convert LearningRuleType to string
const char* ToString(LearningRuleType type);

// Parse LearningRuleType from string (accepts lower-case config spelling)
LearningRuleType ParseLearningRuleType(const std::string& str);

// InstarMode: Direction of Instar/Outstar learning
enum class InstarMode : uint8_t {
    INSTAR = 0,   // Bottom-up recognition
    OUTSTAR = 1,  // Top-down prediction
    BOTH = 2,     // Bidirectional, each half weighted 0.5
};

// Convert InstarMode to string
const char* ToString(InstarMode mode);

// Parse InstarMode from string
InstarMode ParseInstarMode(const std::string& str);

} // namespace resonance
