// File: src/concurrency/worker_pool.hpp
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace resonance {

/// WorkerPool: Fixed-size task-queue thread pool
///
/// Runs independent computations (distinct category stores, the two
/// ARTMAP modules) concurrently. The pool is owned by the caller and
/// passed to the components that need it; there is no global instance.
///
/// Shutdown() drains every queued task before joining, so futures
/// obtained from Submit() always become ready.
///
/// A task may use its own pool: Submit() called from one of the pool's
/// workers runs the new task inline instead of queueing it, so a worker
/// never blocks on a future that only another (busy) worker could fill.
class WorkerPool {
public:
    /// @param num_threads Number of worker threads (> 0)
    /// @throws std::invalid_argument if num_threads is 0
    explicit WorkerPool(size_t num_threads);

    /// Destructor - drains and joins
    ~WorkerPool();

    // Disable copy and move
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Queue a task, or run it immediately when called from a worker
    ///
    /// @return Future carrying the task's result or exception
    /// @throws std::logic_error after Shutdown()
    template <typename F>
    auto Submit(F&& task) -> std::future<std::invoke_result_t<std::decay_t<F>>>;

    /// Run body(0) ... body(count - 1) on the pool and wait
    ///
    /// Every index runs even if an earlier one throws; the first
    /// exception (by index) is rethrown after all have finished.
    void ParallelFor(size_t count, const std::function<void(size_t)>& body);

    /// Finish queued work and join all threads (idempotent)
    void Shutdown();

    size_t Size() const { return workers_.size(); }
    bool IsRunning() const { return !stopping_.load(); }

    /// Tasks queued but not yet started
    size_t PendingTasks() const;

    /// True on one of this pool's worker threads
    bool IsWorkerThread() const;

private:
    void WorkerLoop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stopping_{false};
};

// ============================================================================
// Template Implementation
// ============================================================================

template <typename F>
auto WorkerPool::Submit(F&& task) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
    using Result = std::invoke_result_t<std::decay_t<F>>;

    auto packaged = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(task));
    std::future<Result> future = packaged->get_future();

    if (IsWorkerThread()) {
        (*packaged)();
        return future;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_.load()) {
            throw std::logic_error("WorkerPool: Submit called after Shutdown");
        }
        tasks_.emplace([packaged]() { (*packaged)(); });
    }

    condition_.notify_one();
    return future;
}

} // namespace resonance
