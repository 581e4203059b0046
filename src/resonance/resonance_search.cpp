// File: src/resonance/resonance_search.cpp
//
// Implementation of ResonanceSearchEngine
//
// Key implementation details:
// - |p ∧ w_j| is computed once per category per call and shared by the
//   choice and match functions
// - Candidate order is a stable sort on descending choice, so equal
//   choices keep ascending index order
// - Updates are written into a rented buffer and swapped into place

#include "resonance/resonance_search.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace resonance {

namespace {

struct Candidate {
    CategoryIndex index;
    double intersection;  // |p ∧ w_j|
    double choice;        // T_j
};

} // anonymous namespace

// ============================================================================
// Config
// ============================================================================

std::vector<std::string> ResonanceSearchEngine::Config::GetValidationErrors() const {
    std::vector<std::string> errors;

    if (dimension == 0) {
        errors.push_back("dimension must be greater than 0");
    }
    if (max_categories == 0) {
        errors.push_back("max_categories must be greater than 0");
    }
    if (!(choice_alpha > 0.0) || !std::isfinite(choice_alpha)) {
        errors.push_back("choice_alpha must be a finite value greater than 0");
    }
    if (!(learning_rate >= 0.0 && learning_rate <= 1.0)) {
        errors.push_back("learning_rate must be in [0, 1]");
    }
    for (const auto& error : resonance::GetValidationErrors(learning_rule)) {
        errors.push_back("learning_rule: " + error);
    }

    return errors;
}

// ============================================================================
// Construction
// ============================================================================

ResonanceSearchEngine::ResonanceSearchEngine(const Config& config)
    : config_(config)
    , store_(config.dimension == 0 ? 1 : config.dimension,
             config.max_categories == 0 ? 1 : config.max_categories) {
    auto errors = config_.GetValidationErrors();
    if (!errors.empty()) {
        std::string message = "Invalid ResonanceSearchEngine configuration:";
        for (const auto& error : errors) {
            message += " " + error + ";";
        }
        throw std::invalid_argument(message);
    }

    rule_ = CreateLearningRule(config_.learning_rule);
}

// ============================================================================
// Search & Learning
// ============================================================================

SearchResult ResonanceSearchEngine::FindResonance(
    const Pattern& input,
    double vigilance,
    const ExclusionMask* excluded,
    ExclusionMask* disqualified) const {

    ValidateInput(input);
    ValidateVigilance(vigilance);
    counters_.RecordSearch();

    const double input_norm = input.L1Norm();

    std::vector<Candidate> candidates;
    candidates.reserve(store_.Size());
    for (CategoryIndex j = 0; j < store_.Size(); ++j) {
        if (excluded && j < excluded->size() && (*excluded)[j]) {
            continue;
        }
        const WeightVector& weights = store_.Get(j).weights;
        double intersection = input.FuzzyAndNorm(weights);
        double choice = intersection / (config_.choice_alpha + L1Norm(weights));
        candidates.push_back({j, intersection, choice});
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& a, const Candidate& b) {
                         return a.choice > b.choice;
                     });

    if (disqualified && disqualified->size() < store_.Size()) {
        disqualified->resize(store_.Size(), false);
    }

    SearchResult result;
    uint64_t resets = 0;

    for (const auto& candidate : candidates) {
        ++result.candidates_evaluated;
        double match = candidate.intersection / input_norm;

        if (match >= vigilance) {
            result.outcome = ResonanceOutcome::RESONANT;
            result.category = candidate.index;
            result.choice = candidate.choice;
            result.match = match;
            break;
        }
        ++resets;
        if (disqualified) {
            (*disqualified)[candidate.index] = true;
        }
    }

    counters_.RecordResets(resets);
    counters_.RecordCandidates(result.candidates_evaluated);

    if (config_.debug_logging) {
        std::ostringstream oss;
        oss << "FindResonance: rho=" << vigilance
            << " candidates=" << candidates.size()
            << " evaluated=" << result.candidates_evaluated
            << " resets=" << resets;
        if (result.outcome == ResonanceOutcome::RESONANT) {
            oss << " winner=" << result.category << " T=" << result.choice
                << " M=" << result.match;
        } else {
            oss << " no resonance";
        }
        LogDebug(oss.str());
    }

    return result;
}

SearchResult ResonanceSearchEngine::Commit(const Pattern& input, const SearchResult& found) {
    ValidateInput(input);

    SearchResult result = found;

    if (found.outcome == ResonanceOutcome::RESONANT) {
        if (found.category >= store_.Size()) {
            throw std::out_of_range(
                "Commit: category " + std::to_string(found.category) +
                " is not in the store (size " + std::to_string(store_.Size()) + ")");
        }

        Category& category = store_.GetMut(found.category);
        LearningState& state = store_.GetLearningStateMut(found.category);

        WeightVector updated = pool_ ? pool_->Rent() : WeightVector(config_.dimension);
        rule_->UpdateInto(input, category.weights, found.match,
                          config_.learning_rate, state, updated);
        std::swap(category.weights, updated);
        ++category.usage_count;
        category.last_used_at = std::chrono::steady_clock::now();

        // `updated` now holds the previous weights
        if (pool_) {
            pool_->ReturnBuffer(std::move(updated));
        }

        counters_.RecordResonance();
        return result;
    }

    if (found.outcome != ResonanceOutcome::NO_RESONANCE) {
        throw std::logic_error(
            std::string("Commit: search result already committed (") +
            ToString(found.outcome) + ")");
    }

    result.candidates_evaluated = found.candidates_evaluated + 1;
    counters_.RecordCandidates(1);

    WeightVector prototype = rule_->InitialWeights(input);
    double match = input.FuzzyAndNorm(prototype) / input.L1Norm();
    double choice = input.FuzzyAndNorm(prototype) / (config_.choice_alpha + L1Norm(prototype));

    auto index = store_.Append(std::move(prototype));
    if (!index) {
        result.outcome = ResonanceOutcome::CAPACITY_EXCEEDED;
        result.category = kNoCategory;
        counters_.RecordCapacityFailure();
        LogDebug("Commit: store full at " + std::to_string(store_.Capacity()) +
                 " categories, input not learned");
        return result;
    }

    store_.GetMut(*index).usage_count = 1;

    result.outcome = ResonanceOutcome::COMMITTED_NEW;
    result.category = *index;
    result.match = match;
    result.choice = choice;
    counters_.RecordCommit();
    LogDebug("Commit: new category " + std::to_string(*index));

    return result;
}

SearchResult ResonanceSearchEngine::Learn(const Pattern& input, double vigilance) {
    auto start = std::chrono::steady_clock::now();

    SearchResult found = FindResonance(input, vigilance);
    SearchResult result = Commit(input, found);

    auto end = std::chrono::steady_clock::now();
    counters_.RecordSearchTime(
        std::chrono::duration<double, std::micro>(end - start).count());

    return result;
}

SearchResult ResonanceSearchEngine::LearnExcluding(
    const Pattern& input,
    double vigilance,
    const ExclusionMask& excluded) {

    auto start = std::chrono::steady_clock::now();

    SearchResult found = FindResonance(input, vigilance, &excluded);
    SearchResult result = Commit(input, found);

    auto end = std::chrono::steady_clock::now();
    counters_.RecordSearchTime(
        std::chrono::duration<double, std::micro>(end - start).count());

    return result;
}

CategoryIndex ResonanceSearchEngine::Predict(const Pattern& input) const {
    ValidateInput(input);
    if (store_.IsEmpty()) {
        throw std::logic_error("Predict called before any category was learned");
    }
    counters_.RecordPrediction();

    CategoryIndex best = 0;
    double best_choice = -1.0;
    for (CategoryIndex j = 0; j < store_.Size(); ++j) {
        double choice = ChoiceValue(input, j);
        if (choice > best_choice) {
            best_choice = choice;
            best = j;
        }
    }
    return best;
}

// ============================================================================
// Inspection
// ============================================================================

double ResonanceSearchEngine::ChoiceValue(const Pattern& input, CategoryIndex index) const {
    const WeightVector& weights = store_.Get(index).weights;
    return input.FuzzyAndNorm(weights) / (config_.choice_alpha + L1Norm(weights));
}

double ResonanceSearchEngine::MatchValue(const Pattern& input, CategoryIndex index) const {
    ValidateInput(input);
    const WeightVector& weights = store_.Get(index).weights;
    return input.FuzzyAndNorm(weights) / input.L1Norm();
}

std::vector<double> ResonanceSearchEngine::Activations(const Pattern& input) const {
    ValidateInput(input);

    std::vector<double> activations;
    activations.reserve(store_.Size());
    for (CategoryIndex j = 0; j < store_.Size(); ++j) {
        activations.push_back(ChoiceValue(input, j));
    }
    return activations;
}

// ============================================================================
// Maintenance
// ============================================================================

void ResonanceSearchEngine::Reset() {
    store_.Clear();
    LogDebug("Reset: all categories cleared");
}

PruneResult ResonanceSearchEngine::PruneByUsage(double min_usage_ratio) {
    if (!(min_usage_ratio >= 0.0 && min_usage_ratio <= 1.0)) {
        throw std::invalid_argument(
            "min_usage_ratio must be in [0, 1], got " + std::to_string(min_usage_ratio));
    }
    if (store_.IsEmpty()) {
        return PruneResult{};
    }

    double total = 0.0;
    for (const auto& category : store_) {
        total += static_cast<double>(category.usage_count);
    }
    const auto threshold = static_cast<uint64_t>(total / store_.Size() * min_usage_ratio);

    std::vector<bool> keep;
    keep.reserve(store_.Size());
    for (const auto& category : store_) {
        keep.push_back(category.usage_count >= threshold);
    }
    return Prune(keep, "usage");
}

PruneResult ResonanceSearchEngine::PruneByAge(std::chrono::milliseconds max_age) {
    if (max_age.count() <= 0) {
        throw std::invalid_argument("max_age must be positive");
    }
    if (store_.IsEmpty()) {
        return PruneResult{};
    }

    const auto cutoff = std::chrono::steady_clock::now() - max_age;

    std::vector<bool> keep;
    keep.reserve(store_.Size());
    for (const auto& category : store_) {
        keep.push_back(category.last_used_at >= cutoff);
    }
    return Prune(keep, "age");
}

PruneResult ResonanceSearchEngine::PruneToSize(size_t max_size) {
    if (max_size == 0) {
        throw std::invalid_argument("max_size must be greater than 0");
    }
    if (store_.Size() <= max_size) {
        return Prune(std::vector<bool>(store_.Size(), true), "size");
    }

    std::vector<CategoryIndex> by_usage(store_.Size());
    for (CategoryIndex j = 0; j < by_usage.size(); ++j) {
        by_usage[j] = j;
    }
    std::stable_sort(by_usage.begin(), by_usage.end(),
                     [this](CategoryIndex a, CategoryIndex b) {
                         return store_.Get(a).usage_count > store_.Get(b).usage_count;
                     });

    std::vector<bool> keep(store_.Size(), false);
    for (size_t i = 0; i < max_size; ++i) {
        keep[by_usage[i]] = true;
    }
    return Prune(keep, "size");
}

void ResonanceSearchEngine::SetPool(std::shared_ptr<WeightVectorPool> pool) {
    if (pool && pool->Dimension() != config_.dimension) {
        throw std::invalid_argument(
            "Pool dimension " + std::to_string(pool->Dimension()) +
            " does not match engine dimension " + std::to_string(config_.dimension));
    }
    pool_ = std::move(pool);
}

// ============================================================================
// Private Helpers
// ============================================================================

void ResonanceSearchEngine::ValidateInput(const Pattern& input) const {
    if (input.Dimension() != config_.dimension) {
        throw std::invalid_argument(
            "Input dimension " + std::to_string(input.Dimension()) +
            " does not match engine dimension " + std::to_string(config_.dimension));
    }
    if (!(input.L1Norm() > 0.0)) {
        throw std::invalid_argument("Input pattern has zero L1 norm");
    }
}

void ResonanceSearchEngine::ValidateVigilance(double vigilance) const {
    if (!(vigilance >= 0.0 && vigilance <= 1.0)) {
        throw std::invalid_argument(
            "Vigilance must be in [0, 1], got " + std::to_string(vigilance));
    }
}

PruneResult ResonanceSearchEngine::Prune(const std::vector<bool>& keep, const char* reason) {
    // Removed prototypes go back to the pool before the store drops them
    if (pool_) {
        for (CategoryIndex j = 0; j < keep.size(); ++j) {
            if (!keep[j]) {
                pool_->ReturnBuffer(std::move(store_.GetMut(j).weights));
            }
        }
    }

    PruneResult result;
    const size_t before = store_.Size();
    result.remap = store_.Retain(keep);
    result.removed = before - store_.Size();

    counters_.RecordPruned(result.removed);
    LogDebug(std::string("Prune by ") + reason + ": removed " + std::to_string(result.removed) +
             ", " + std::to_string(store_.Size()) + " remain");
    return result;
}

void ResonanceSearchEngine::LogDebug(const std::string& message) const {
    if (config_.debug_logging && debug_stream_) {
        *debug_stream_ << "[ResonanceSearch] " << message << std::endl;
    }
}

} // namespace resonance
