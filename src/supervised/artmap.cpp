// File: src/supervised/artmap.cpp
#include "supervised/artmap.hpp"
#include <algorithm>
#include <future>
#include <sstream>
#include <stdexcept>

namespace resonance {

namespace {

/// Sends an engine's debug output to a private buffer for the lifetime
/// of the guard, then writes the buffer to the engine's previous stream
class BufferedDebugStream {
public:
    explicit BufferedDebugStream(ResonanceSearchEngine& engine)
        : engine_(engine)
        , target_(engine.GetDebugStream()) {
        engine_.SetDebugStream(&buffer_);
    }

    ~BufferedDebugStream() {
        engine_.SetDebugStream(target_);
        if (target_) {
            *target_ << buffer_.str() << std::flush;
        }
    }

    BufferedDebugStream(const BufferedDebugStream&) = delete;
    BufferedDebugStream& operator=(const BufferedDebugStream&) = delete;

private:
    ResonanceSearchEngine& engine_;
    std::ostream* target_;
    std::ostringstream buffer_;
};

} // anonymous namespace

const char* ToString(Artmap::Mode mode) {
    switch (mode) {
        case Artmap::Mode::UNSET: return "UNSET";
        case Artmap::Mode::MODULE_B: return "MODULE_B";
        case Artmap::Mode::LABEL: return "LABEL";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// Config
// ============================================================================

std::vector<std::string> Artmap::Config::GetValidationErrors() const {
    std::vector<std::string> errors;

    for (const auto& error : module_a.GetValidationErrors()) {
        errors.push_back("module_a: " + error);
    }
    if (module_b) {
        for (const auto& error : module_b->GetValidationErrors()) {
            errors.push_back("module_b: " + error);
        }
    }

    if (!(baseline_vigilance >= 0.0 && baseline_vigilance <= 1.0)) {
        errors.push_back("baseline_vigilance must be in [0, 1]");
    }
    if (!(output_vigilance >= 0.0 && output_vigilance <= 1.0)) {
        errors.push_back("output_vigilance must be in [0, 1]");
    }
    if (!(epsilon > 0.0 && epsilon <= 0.1)) {
        errors.push_back("epsilon must be in (0, 0.1]");
    }
    if (!(max_vigilance > 0.0 && max_vigilance <= 1.0)) {
        errors.push_back("max_vigilance must be in (0, 1]");
    } else if (max_vigilance < baseline_vigilance) {
        errors.push_back("max_vigilance must not be below baseline_vigilance");
    }

    return errors;
}

// ============================================================================
// Construction
// ============================================================================

Artmap::Artmap(const Config& config)
    : config_(config) {
    auto errors = config_.GetValidationErrors();
    if (!errors.empty()) {
        std::string message = "Invalid Artmap configuration:";
        for (const auto& error : errors) {
            message += " " + error + ";";
        }
        throw std::invalid_argument(message);
    }

    module_a_ = std::make_unique<ResonanceSearchEngine>(config_.module_a);
    if (config_.module_b) {
        module_b_ = std::make_unique<ResonanceSearchEngine>(*config_.module_b);
    }
}

// ============================================================================
// Training
// ============================================================================

LearnResult Artmap::Learn(const Pattern& input, const Pattern& output, WorkerPool* pool) {
    if (!module_b_) {
        throw std::logic_error("Artmap::Learn requires a module_b configuration");
    }

    // Reject bad patterns before either module changes
    module_a_->ValidateInput(input);
    module_b_->ValidateInput(output);
    EnterMode(Mode::MODULE_B);

    learn_calls_.fetch_add(1, std::memory_order_relaxed);

    SearchResult found_a;
    SearchResult result_b;
    ExclusionMask disqualified;

    if (pool) {
        // Module B must not share a stream with module A across threads
        std::optional<BufferedDebugStream> module_b_log;
        if (module_b_->GetConfig().debug_logging) {
            module_b_log.emplace(*module_b_);
        }

        auto future_b = pool->Submit([this, &output]() {
            return module_b_->Learn(output, config_.output_vigilance);
        });
        try {
            found_a = module_a_->FindResonance(input, config_.baseline_vigilance,
                                               nullptr, &disqualified);
        } catch (...) {
            // The task references `output` and the log buffer; it must
            // finish before unwinding
            future_b.wait();
            throw;
        }
        result_b = future_b.get();
    } else {
        result_b = module_b_->Learn(output, config_.output_vigilance);
        found_a = module_a_->FindResonance(input, config_.baseline_vigilance,
                                           nullptr, &disqualified);
    }

    if (!result_b.Succeeded()) {
        capacity_failures_.fetch_add(1, std::memory_order_relaxed);
        LogDebug("Learn: module B is full, pair not learned");

        LearnResult result;
        result.outcome = result_b.outcome;
        result.final_vigilance = config_.baseline_vigilance;
        result.candidates_evaluated = found_a.candidates_evaluated;
        return result;
    }

    return ResolveAndCommit(input, static_cast<MapTarget>(result_b.category), found_a,
                            disqualified);
}

LearnResult Artmap::LearnLabel(const Pattern& input, MapTarget label) {
    module_a_->ValidateInput(input);
    EnterMode(Mode::LABEL);
    learn_calls_.fetch_add(1, std::memory_order_relaxed);

    ExclusionMask disqualified;
    SearchResult found = module_a_->FindResonance(input, config_.baseline_vigilance,
                                                  nullptr, &disqualified);
    return ResolveAndCommit(input, label, found, disqualified);
}

std::vector<LearnResult> Artmap::Fit(const std::vector<Pattern>& inputs,
                                     const std::vector<MapTarget>& labels) {
    Clear();
    return PartialFit(inputs, labels);
}

std::vector<LearnResult> Artmap::PartialFit(const std::vector<Pattern>& inputs,
                                            const std::vector<MapTarget>& labels) {
    if (inputs.size() != labels.size()) {
        throw std::invalid_argument(
            "PartialFit: " + std::to_string(inputs.size()) + " inputs but " +
            std::to_string(labels.size()) + " labels");
    }

    for (const auto& input : inputs) {
        module_a_->ValidateInput(input);
    }

    std::vector<LearnResult> results;
    results.reserve(inputs.size());
    for (size_t i = 0; i < inputs.size(); ++i) {
        results.push_back(LearnLabel(inputs[i], labels[i]));
    }
    return results;
}

LearnResult Artmap::ResolveAndCommit(const Pattern& input, MapTarget target, SearchResult found,
                                     ExclusionMask& disqualified) {
    LearnResult result;
    double vigilance = config_.baseline_vigilance;

    // Vigilance only rises within a call, so a reset candidate stays
    // disqualified and each category is evaluated at most once. Each
    // conflict excludes one more category.
    const size_t max_searches = module_a_->GetCategoryCount() + 1;

    for (size_t search = 0; search < max_searches; ++search) {
        if (found.outcome == ResonanceOutcome::RESONANT) {
            auto mapped = map_field_.Lookup(found.category);
            if (mapped && *mapped != target) {
                result.candidates_evaluated += found.candidates_evaluated;
                ++result.match_tracking_events;
                match_tracking_events_.fetch_add(1, std::memory_order_relaxed);
                module_a_->GetCounters().RecordMatchTracking();

                disqualified[found.category] = true;
                vigilance = std::min(found.match + config_.epsilon, config_.max_vigilance);

                if (config_.debug_logging) {
                    std::ostringstream oss;
                    oss << "Match tracking: category " << found.category
                        << " maps to " << *mapped << ", wanted " << target
                        << "; M=" << found.match << " raise rho to " << vigilance;
                    LogDebug(oss.str());
                }

                found = module_a_->FindResonance(input, vigilance, &disqualified, &disqualified);
                continue;
            }
        }

        SearchResult committed = module_a_->Commit(input, found);
        result.candidates_evaluated += committed.candidates_evaluated;
        result.outcome = committed.outcome;
        result.final_vigilance = vigilance;

        if (committed.outcome == ResonanceOutcome::CAPACITY_EXCEEDED) {
            capacity_failures_.fetch_add(1, std::memory_order_relaxed);
            LogDebug("Learn: module A is full, input not learned");
            return result;
        }

        result.category_a = committed.category;
        result.target = target;

        if (map_field_.Associate(committed.category, target)) {
            new_associations_.fetch_add(1, std::memory_order_relaxed);
        } else {
            map_field_.Reinforce(committed.category);
            reinforcements_.fetch_add(1, std::memory_order_relaxed);
        }
        return result;
    }

    // Unreachable while FindResonance honours the exclusion mask
    throw std::logic_error("Match tracking exceeded its search bound");
}

// ============================================================================
// Prediction
// ============================================================================

Prediction Artmap::Predict(const Pattern& input) const {
    if (!IsTrained()) {
        throw std::logic_error("Artmap::Predict called before training");
    }

    Prediction prediction;
    prediction.category = module_a_->Predict(input);
    prediction.target = map_field_.Lookup(prediction.category);
    return prediction;
}

std::vector<Prediction> Artmap::PredictBatch(const std::vector<Pattern>& inputs) const {
    std::vector<Prediction> predictions;
    predictions.reserve(inputs.size());
    for (const auto& input : inputs) {
        predictions.push_back(Predict(input));
    }
    return predictions;
}

// ============================================================================
// State
// ============================================================================

void Artmap::Clear() {
    module_a_->Reset();
    if (module_b_) {
        module_b_->Reset();
    }
    map_field_.Clear();
    mode_ = Mode::UNSET;
    LogDebug("Cleared");
}

PruneResult Artmap::PruneByUsage(double min_usage_ratio) {
    return ApplyToMapField(module_a_->PruneByUsage(min_usage_ratio));
}

PruneResult Artmap::PruneByAge(std::chrono::milliseconds max_age) {
    return ApplyToMapField(module_a_->PruneByAge(max_age));
}

PruneResult Artmap::PruneToSize(size_t max_size) {
    return ApplyToMapField(module_a_->PruneToSize(max_size));
}

Artmap::Stats Artmap::GetStats() const {
    Stats stats;
    stats.learn_calls = learn_calls_.load(std::memory_order_relaxed);
    stats.match_tracking_events = match_tracking_events_.load(std::memory_order_relaxed);
    stats.new_associations = new_associations_.load(std::memory_order_relaxed);
    stats.reinforcements = reinforcements_.load(std::memory_order_relaxed);
    stats.capacity_failures = capacity_failures_.load(std::memory_order_relaxed);
    stats.map_field_size = map_field_.Size();
    stats.module_a = module_a_->GetStats();
    return stats;
}

void Artmap::ResetStats() {
    learn_calls_.store(0, std::memory_order_relaxed);
    match_tracking_events_.store(0, std::memory_order_relaxed);
    new_associations_.store(0, std::memory_order_relaxed);
    reinforcements_.store(0, std::memory_order_relaxed);
    capacity_failures_.store(0, std::memory_order_relaxed);
    module_a_->ResetCounters();
    if (module_b_) {
        module_b_->ResetCounters();
    }
}

void Artmap::SetDebugStream(std::ostream* os) {
    debug_stream_ = os;
    module_a_->SetDebugStream(os);
    if (module_b_) {
        module_b_->SetDebugStream(os);
    }
}

// ============================================================================
// Private Helpers
// ============================================================================

void Artmap::EnterMode(Mode mode) {
    if (mode_ == Mode::UNSET) {
        mode_ = mode;
        return;
    }
    if (mode_ != mode) {
        throw std::logic_error(
            std::string("Artmap is in ") + ToString(mode_) +
            " mode; cannot train in " + ToString(mode) + " mode");
    }
}

PruneResult Artmap::ApplyToMapField(PruneResult pruned) {
    if (pruned.removed == 0) {
        return pruned;
    }

    size_t dropped = map_field_.Remap(pruned.remap);
    LogDebug("Prune: removed " + std::to_string(pruned.removed) + " categories, dropped " +
             std::to_string(dropped) + " associations");
    return pruned;
}

void Artmap::LogDebug(const std::string& message) const {
    if (config_.debug_logging && debug_stream_) {
        *debug_stream_ << "[Artmap] " << message << std::endl;
    }
}

} // namespace resonance
