// File: src/performance/weight_vector_pool.cpp
#include "performance/weight_vector_pool.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace resonance {

// ============================================================================
// Lease
// ============================================================================

WeightVectorPool::Lease::~Lease() {
    if (pool_ && buffer_.size() == pool_->Dimension()) {
        pool_->ReturnBuffer(std::move(buffer_));
    }
}

WeightVectorPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), buffer_(std::move(other.buffer_)) {
    other.pool_ = nullptr;
}

WeightVector WeightVectorPool::Lease::Release() {
    pool_ = nullptr;
    return std::move(buffer_);
}

// ============================================================================
// Pool
// ============================================================================

WeightVectorPool::WeightVectorPool(size_t dimension, size_t max_pool_size)
    : dimension_(dimension), max_pool_size_(max_pool_size) {
    if (dimension_ == 0) {
        throw std::invalid_argument("WeightVectorPool dimension must be greater than 0");
    }
    if (max_pool_size_ == 0) {
        throw std::invalid_argument("WeightVectorPool max_pool_size must be greater than 0");
    }
    free_list_.reserve(max_pool_size_);
}

WeightVector WeightVectorPool::Rent() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!free_list_.empty()) {
            WeightVector buffer = std::move(free_list_.back());
            free_list_.pop_back();
            reuses_.fetch_add(1, std::memory_order_relaxed);
            return buffer;
        }
    }

    allocations_.fetch_add(1, std::memory_order_relaxed);
    return WeightVector(dimension_);
}

WeightVector WeightVectorPool::RentZeroed() {
    WeightVector buffer = Rent();
    std::fill(buffer.begin(), buffer.end(), 0.0);
    return buffer;
}

void WeightVectorPool::ReturnBuffer(WeightVector&& buffer) {
    if (buffer.size() != dimension_) {
        throw std::invalid_argument(
            "Returned buffer dimension " + std::to_string(buffer.size()) +
            " does not match pool dimension " + std::to_string(dimension_));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (free_list_.size() >= max_pool_size_) {
        // Pool full: let the buffer go
        drops_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    free_list_.push_back(std::move(buffer));
    returns_.fetch_add(1, std::memory_order_relaxed);
}

size_t WeightVectorPool::Prewarm(size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t room = max_pool_size_ - free_list_.size();
    size_t to_add = std::min(count, room);
    for (size_t i = 0; i < to_add; ++i) {
        free_list_.emplace_back(dimension_);
    }
    allocations_.fetch_add(to_add, std::memory_order_relaxed);
    return to_add;
}

void WeightVectorPool::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    free_list_.clear();
}

size_t WeightVectorPool::Available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return free_list_.size();
}

WeightVectorPool::Stats WeightVectorPool::GetStats() const {
    Stats stats;
    stats.allocations = allocations_.load(std::memory_order_relaxed);
    stats.reuses = reuses_.load(std::memory_order_relaxed);
    stats.returns = returns_.load(std::memory_order_relaxed);
    stats.drops = drops_.load(std::memory_order_relaxed);
    stats.available = Available();
    stats.max_pool_size = max_pool_size_;
    return stats;
}

} // namespace resonance
