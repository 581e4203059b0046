// File: src/performance/weight_vector_pool.hpp
#pragma once

#include "core/types.hpp"
#include <atomic>
#include <cstdint>
#include <mutex>
#include <vector>

namespace resonance {

/// WeightVectorPool: Bounded pool of dimension-matched buffers
///
/// Recycles WeightVector allocations across repeated search-and-update
/// cycles. Rented buffers belong to the caller until returned; a buffer
/// must be returned at most once.
///
/// Policy when full: ReturnBuffer() silently drops the buffer (it is
/// freed, not retained) and counts the drop. Returning a buffer of the
/// wrong dimension is rejected with std::invalid_argument.
///
/// Thread-safe: any number of threads may rent and return concurrently.
/// The critical section is a push or pop on the free list; no ordering
/// between concurrent renters is guaranteed.
class WeightVectorPool {
public:
    /// Statistics structure
    struct Stats {
        uint64_t allocations{0};  // Fresh buffers created (Rent miss or Prewarm)
        uint64_t reuses{0};       // Rent served from the pool
        uint64_t returns{0};      // Buffers accepted back
        uint64_t drops{0};        // Buffers discarded because the pool was full
        size_t available{0};      // Buffers currently pooled
        size_t max_pool_size{0};
    };

    /// RAII handle returning its buffer exactly once
    class Lease {
    public:
        Lease(WeightVectorPool& pool, WeightVector buffer)
            : pool_(&pool), buffer_(std::move(buffer)) {}
        ~Lease();

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&&) = delete;

        WeightVector& Get() { return buffer_; }
        const WeightVector& Get() const { return buffer_; }

        /// Take ownership of the buffer; it will not be returned
        WeightVector Release();

    private:
        WeightVectorPool* pool_;
        WeightVector buffer_;
    };

    /// @param dimension Length of every pooled buffer (> 0)
    /// @param max_pool_size Maximum buffers retained (> 0)
    WeightVectorPool(size_t dimension, size_t max_pool_size);

    WeightVectorPool(const WeightVectorPool&) = delete;
    WeightVectorPool& operator=(const WeightVectorPool&) = delete;

    /// Rent a buffer; contents are stale, not zeroed
    WeightVector Rent();

    /// Rent a buffer filled with zeros
    WeightVector RentZeroed();

    /// Rent wrapped in an RAII lease
    Lease RentLease() { return Lease(*this, Rent()); }

    /// Give a buffer back
    /// @throws std::invalid_argument if buffer.size() != Dimension()
    void ReturnBuffer(WeightVector&& buffer);

    /// Pre-allocate up to `count` buffers (bounded by max_pool_size)
    /// @return Number of buffers added
    size_t Prewarm(size_t count);

    /// Drop every pooled buffer
    void Clear();

    size_t Available() const;
    size_t Dimension() const { return dimension_; }
    size_t MaxPoolSize() const { return max_pool_size_; }

    Stats GetStats() const;

private:
    size_t dimension_;
    size_t max_pool_size_;

    std::vector<WeightVector> free_list_;
    mutable std::mutex mutex_;

    std::atomic<uint64_t> allocations_{0};
    std::atomic<uint64_t> reuses_{0};
    std::atomic<uint64_t> returns_{0};
    std::atomic<uint64_t> drops_{0};
};

} // namespace resonance
