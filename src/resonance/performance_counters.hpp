// File: src/resonance/performance_counters.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

namespace resonance {

/// PerformanceCounters: Per-instance operation accumulators
///
/// Owned by one engine; lifetime and reset follow the owner. Counters
/// are atomics so concurrent readers never need the owner's lock.
/// Search time is tracked as an exponential moving average:
///   ema ← α·sample + (1 - α)·ema   (first sample seeds the average)
class PerformanceCounters {
public:
    /// Snapshot of all counters
    struct Snapshot {
        uint64_t searches{0};              // FindResonance calls, match-tracking re-searches included
        uint64_t predictions{0};           // Predict calls
        uint64_t resonances{0};            // Existing category updated
        uint64_t commits{0};               // New category appended
        uint64_t resets{0};                // Candidates disqualified by vigilance
        uint64_t capacity_failures{0};     // Commit refused by a full store
        uint64_t match_tracking_events{0}; // Map-field conflicts resolved by raising vigilance
        uint64_t candidates_evaluated{0};  // Match-function evaluations
        uint64_t categories_pruned{0};     // Removed by explicit prunes
        double avg_search_time_us{0.0};    // EMA of search latency

        std::string ToString() const;
    };

    /// @param ema_smoothing Weight of the newest timing sample (0, 1]
    explicit PerformanceCounters(double ema_smoothing = 0.1);

    void RecordSearch() { searches_.fetch_add(1, std::memory_order_relaxed); }
    void RecordPrediction() { predictions_.fetch_add(1, std::memory_order_relaxed); }
    void RecordResonance() { resonances_.fetch_add(1, std::memory_order_relaxed); }
    void RecordCommit() { commits_.fetch_add(1, std::memory_order_relaxed); }
    void RecordResets(uint64_t count) { resets_.fetch_add(count, std::memory_order_relaxed); }
    void RecordCapacityFailure() { capacity_failures_.fetch_add(1, std::memory_order_relaxed); }
    void RecordMatchTracking() { match_tracking_events_.fetch_add(1, std::memory_order_relaxed); }
    void RecordCandidates(uint64_t count) { candidates_evaluated_.fetch_add(count, std::memory_order_relaxed); }
    void RecordPruned(uint64_t count) { categories_pruned_.fetch_add(count, std::memory_order_relaxed); }

    /// Fold a latency sample into the moving average
    void RecordSearchTime(double microseconds);

    Snapshot GetSnapshot() const;

    /// Zero every counter
    void Reset();

private:
    double ema_smoothing_;

    std::atomic<uint64_t> searches_{0};
    std::atomic<uint64_t> predictions_{0};
    std::atomic<uint64_t> resonances_{0};
    std::atomic<uint64_t> commits_{0};
    std::atomic<uint64_t> resets_{0};
    std::atomic<uint64_t> capacity_failures_{0};
    std::atomic<uint64_t> match_tracking_events_{0};
    std::atomic<uint64_t> candidates_evaluated_{0};
    std::atomic<uint64_t> categories_pruned_{0};

    mutable std::mutex timing_mutex_;
    double avg_search_time_us_{0.0};
    bool has_timing_sample_{false};
};

} // namespace resonance
