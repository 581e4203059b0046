// File: src/concurrency/worker_pool.cpp
#include "concurrency/worker_pool.hpp"
#include <exception>

namespace resonance {

namespace {

// Pool whose WorkerLoop runs on the current thread, if any
thread_local const WorkerPool* current_pool = nullptr;

} // anonymous namespace

WorkerPool::WorkerPool(size_t num_threads) {
    if (num_threads == 0) {
        throw std::invalid_argument("WorkerPool requires at least one thread");
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&WorkerPool::WorkerLoop, this);
    }
}

WorkerPool::~WorkerPool() {
    Shutdown();
}

void WorkerPool::ParallelFor(size_t count, const std::function<void(size_t)>& body) {
    std::vector<std::future<void>> futures;
    futures.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        futures.push_back(Submit([&body, i]() { body(i); }));
    }

    std::exception_ptr first_error;
    for (auto& future : futures) {
        try {
            future.get();
        } catch (...) {
            if (!first_error) {
                first_error = std::current_exception();
            }
        }
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

void WorkerPool::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_.load() && workers_.empty()) {
            return;  // Already shut down
        }
        stopping_.store(true);
    }

    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

bool WorkerPool::IsWorkerThread() const {
    return current_pool == this;
}

size_t WorkerPool::PendingTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void WorkerPool::WorkerLoop() {
    current_pool = this;

    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            condition_.wait(lock, [this]() {
                return stopping_.load() || !tasks_.empty();
            });

            // Drain the queue before exiting
            if (tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        // packaged_task stores any exception in its future
        task();
    }
}

} // namespace resonance
