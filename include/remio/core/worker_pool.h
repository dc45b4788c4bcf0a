// =============================================================================
// remio - Worker Pool
// =============================================================================
// Bounded set of threads executing network primitives for readers and
// writers.
//
// The pool holds no per-stream state: a task carries everything it needs and
// reports its outcome through the returned future. Several streams may share
// one pool; a stream created without a pool owns a private one.
//
// Tasks are queued in a TBB concurrent_bounded_queue. Shutdown enqueues one
// empty sentinel per thread after the pending work, so queued tasks still run
// before the threads exit.
// =============================================================================

#ifndef REMIO_CORE_WORKER_POOL_H
#define REMIO_CORE_WORKER_POOL_H

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include <tbb/concurrent_queue.h>

#include "remio/common/error.h"

namespace remio::core {

class WorkerPool {
public:
    /// @brief Start @p workerCount threads (at least one).
    explicit WorkerPool(std::size_t workerCount);

    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

    /// @brief Queue @p task and return a future for its result.
    /// @throws LogicalError if the pool is shutting down.
    template <typename F>
    [[nodiscard]] std::future<std::invoke_result_t<std::decay_t<F>&>> submit(F&& task) {
        using ReturnType = std::invoke_result_t<std::decay_t<F>&>;

        // std::function needs a copyable target; packaged_task is move-only
        auto packaged =
            std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(task));
        auto future = packaged->get_future();
        enqueue([packaged]() { (*packaged)(); });
        return future;
    }

    /// @brief Block until no task is queued or running.
    void waitIdle();

    /// @brief Drain queued tasks and join all threads. Idempotent.
    void shutdown();

    [[nodiscard]] std::size_t workerCount() const noexcept { return threads_.size(); }

    /// @brief Tasks currently executing.
    [[nodiscard]] std::size_t activeCount() const noexcept {
        return active_.load(std::memory_order_acquire);
    }

    /// @brief Tasks queued but not started.
    [[nodiscard]] std::size_t pendingCount() const noexcept {
        return pending_.load(std::memory_order_acquire);
    }

private:
    using Task = std::function<void()>;

    void enqueue(Task task);
    void workerLoop();
    void taskFinished();

    tbb::concurrent_bounded_queue<Task> queue_;
    std::vector<std::thread> threads_;

    std::atomic<std::size_t> active_{0};
    std::atomic<std::size_t> pending_{0};
    std::atomic<bool> stopping_{false};

    std::mutex idleMutex_;
    std::condition_variable idleCv_;
    std::mutex shutdownMutex_;

    /// @brief Orders submissions against the shutdown sentinels.
    std::mutex queueMutex_;
};

}  // namespace remio::core

#endif  // REMIO_CORE_WORKER_POOL_H
