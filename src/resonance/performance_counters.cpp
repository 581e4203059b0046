// File: src/resonance/performance_counters.cpp
#include "resonance/performance_counters.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace resonance {

PerformanceCounters::PerformanceCounters(double ema_smoothing)
    : ema_smoothing_(ema_smoothing) {
    if (ema_smoothing_ <= 0.0 || ema_smoothing_ > 1.0) {
        throw std::invalid_argument("ema_smoothing must be in (0, 1]");
    }
}

void PerformanceCounters::RecordSearchTime(double microseconds) {
    std::lock_guard<std::mutex> lock(timing_mutex_);
    if (!has_timing_sample_) {
        avg_search_time_us_ = microseconds;
        has_timing_sample_ = true;
        return;
    }
    avg_search_time_us_ = ema_smoothing_ * microseconds
                        + (1.0 - ema_smoothing_) * avg_search_time_us_;
}

PerformanceCounters::Snapshot PerformanceCounters::GetSnapshot() const {
    Snapshot snapshot;
    snapshot.searches = searches_.load(std::memory_order_relaxed);
    snapshot.predictions = predictions_.load(std::memory_order_relaxed);
    snapshot.resonances = resonances_.load(std::memory_order_relaxed);
    snapshot.commits = commits_.load(std::memory_order_relaxed);
    snapshot.resets = resets_.load(std::memory_order_relaxed);
    snapshot.capacity_failures = capacity_failures_.load(std::memory_order_relaxed);
    snapshot.match_tracking_events = match_tracking_events_.load(std::memory_order_relaxed);
    snapshot.candidates_evaluated = candidates_evaluated_.load(std::memory_order_relaxed);
    snapshot.categories_pruned = categories_pruned_.load(std::memory_order_relaxed);

    std::lock_guard<std::mutex> lock(timing_mutex_);
    snapshot.avg_search_time_us = avg_search_time_us_;
    return snapshot;
}

void PerformanceCounters::Reset() {
    searches_.store(0, std::memory_order_relaxed);
    predictions_.store(0, std::memory_order_relaxed);
    resonances_.store(0, std::memory_order_relaxed);
    commits_.store(0, std::memory_order_relaxed);
    resets_.store(0, std::memory_order_relaxed);
    capacity_failures_.store(0, std::memory_order_relaxed);
    match_tracking_events_.store(0, std::memory_order_relaxed);
    candidates_evaluated_.store(0, std::memory_order_relaxed);
    categories_pruned_.store(0, std::memory_order_relaxed);

    std::lock_guard<std::mutex> lock(timing_mutex_);
    avg_search_time_us_ = 0.0;
    has_timing_sample_ = false;
}

std::string PerformanceCounters::Snapshot::ToString() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << "searches=" << searches
        << " predictions=" << predictions
        << " resonances=" << resonances
        << " commits=" << commits
        << " resets=" << resets
        << " capacity_failures=" << capacity_failures
        << " match_tracking=" << match_tracking_events
        << " candidates=" << candidates_evaluated
        << " pruned=" << categories_pruned
        << " avg_search_us=" << avg_search_time_us;
    return oss.str();
}

} // namespace resonance
