// =============================================================================
// remio - Worker Pool Implementation
// =============================================================================

#include "remio/core/worker_pool.h"

#include <algorithm>

#include "remio/common/logger.h"

namespace remio::core {

WorkerPool::WorkerPool(std::size_t workerCount) {
    workerCount = std::max<std::size_t>(workerCount, 1);
    threads_.reserve(workerCount);
    for (std::size_t i = 0; i < workerCount; ++i) {
        threads_.emplace_back([this] { workerLoop(); });
    }
    REMIO_LOG_DEBUG("WorkerPool started: workers={}", workerCount);
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::enqueue(Task task) {
    std::lock_guard lock(queueMutex_);
    if (stopping_.load(std::memory_order_acquire)) {
        throw LogicalError(ErrorCode::kInvalidState, "worker pool is shut down");
    }
    pending_.fetch_add(1, std::memory_order_acq_rel);
    queue_.push(std::move(task));
}

void WorkerPool::workerLoop() {
    while (true) {
        Task task;
        queue_.pop(task);
        if (!task) {
            // Sentinel pushed by shutdown()
            return;
        }
        active_.fetch_add(1, std::memory_order_acq_rel);
        pending_.fetch_sub(1, std::memory_order_acq_rel);
        // packaged_task stores exceptions in the future, so this does not throw
        task();
        taskFinished();
    }
}

void WorkerPool::taskFinished() {
    const auto remaining = active_.fetch_sub(1, std::memory_order_acq_rel) - 1;
    if (remaining == 0 && pending_.load(std::memory_order_acquire) == 0) {
        std::lock_guard lock(idleMutex_);
        idleCv_.notify_all();
    }
}

void WorkerPool::waitIdle() {
    std::unique_lock lock(idleMutex_);
    idleCv_.wait(lock, [this] {
        return active_.load(std::memory_order_acquire) == 0 &&
               pending_.load(std::memory_order_acquire) == 0;
    });
}

void WorkerPool::shutdown() {
    std::lock_guard lock(shutdownMutex_);
    {
        // No task can be queued behind the sentinels
        std::lock_guard queueLock(queueMutex_);
        if (stopping_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        for (std::size_t i = 0; i < threads_.size(); ++i) {
            queue_.push(Task{});
        }
    }
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    REMIO_LOG_DEBUG("WorkerPool stopped: workers={}", threads_.size());
}

}  // namespace remio::core
