#pragma once

/**
 * @file Thread.h
 * @brief Worker pool and ParallelFor for batch intersection
 *
 * Each curve pair is an independent task, so the only primitive needed is
 * a data-parallel loop over indices:
 * @code
 * std::vector<CurveIntersectResult> results(pairs.size());
 * ParallelFor(0, pairs.size(), [&](size_t i) {
 *     results[i] = IntersectCurves(pairs[i].first, pairs[i].second);
 * });
 * @endcode
 *
 * Exceptions thrown by a task are rethrown to the caller of ParallelFor.
 * The pool size can be fixed with the BEZCLIP_NUM_THREADS environment
 * variable, read once when the pool is first used.
 */

#include <BezClip/Core/Export.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace Bez::Clip::Platform {

/// Environment variable overriding the worker count of the global pool
constexpr const char* THREAD_COUNT_ENV = "BEZCLIP_NUM_THREADS";

// ============================================================================
// System Information
// ============================================================================

/// Logical cores reported by the system, at least 1
BEZCLIP_API size_t GetNumCores();

/**
 * @brief Worker count used for the global pool
 * @return BEZCLIP_NUM_THREADS when set to 1..256, else GetNumCores() - 1, minimum 1
 */
BEZCLIP_API size_t GetRecommendedThreadCount();

// ============================================================================
// ThreadPool
// ============================================================================

/**
 * @brief Fixed-size worker pool
 *
 * Process-wide singleton, created on first Instance() call and sized by
 * GetRecommendedThreadCount(). Tasks queued before destruction still run.
 */
class BEZCLIP_API ThreadPool {
public:
    static ThreadPool& Instance();

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    size_t Size() const { return workers_.size(); }
    bool IsRunning() const { return !stop_; }

    /**
     * @brief Queue a callable, the future carries its result or exception
     * @throws std::runtime_error if the pool is shutting down
     */
    template<typename F, typename... Args>
    auto Submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    /// Block until the queue is empty and no task is running
    void WaitAll();

    /// Queued plus running tasks
    size_t PendingTasks() const;

private:
    explicit ThreadPool(size_t numThreads);

    /// Block until a task is available; false once stopped and drained
    bool NextTask(std::function<void()>& task);
    void WorkerThread();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::condition_variable completionCondition_;
    std::atomic<bool> stop_{false};
    std::atomic<size_t> activeTasks_{0};
};

// ============================================================================
// Work Splitting
// ============================================================================

/// True when workSize reaches minItems and there is more than one core
inline bool ShouldParallelize(size_t workSize, size_t minItems) {
    return workSize >= minItems && GetNumCores() > 1;
}

/**
 * @brief Indices per ParallelFor task
 * @return About four chunks per pool worker, never below minGrain
 */
BEZCLIP_API size_t CalculateGrainSize(size_t totalWork, size_t minGrain = 1);

/**
 * @brief Call func(i) for every i in [begin, end)
 *
 * Ranges shorter than minItems run on the calling thread in index order.
 * Otherwise the range is cut into chunks of grainSize (0 = automatic) that
 * run on the global pool. Returns after every chunk has finished.
 *
 * @throws The first exception thrown by func
 */
template<typename Func>
void ParallelFor(size_t begin, size_t end, Func&& func,
                 size_t grainSize = 0, size_t minItems = 8);

// ============================================================================
// Template Implementations
// ============================================================================

template<typename F, typename... Args>
auto ThreadPool::Submit(F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type>
{
    using ReturnType = typename std::invoke_result<F, Args...>::type;

    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...));
    std::future<ReturnType> result = task->get_future();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            throw std::runtime_error("ThreadPool::Submit: pool is stopped");
        }
        tasks_.emplace([task]() { (*task)(); });
    }
    condition_.notify_one();
    return result;
}

template<typename Func>
void ParallelFor(size_t begin, size_t end, Func&& func, size_t grainSize, size_t minItems) {
    if (begin >= end) {
        return;
    }

    size_t count = end - begin;
    if (count == 1 || !ShouldParallelize(count, minItems)) {
        for (size_t i = begin; i < end; ++i) {
            func(i);
        }
        return;
    }

    size_t grain = grainSize > 0 ? grainSize : CalculateGrainSize(count);
    ThreadPool& pool = ThreadPool::Instance();

    std::vector<std::future<void>> chunks;
    chunks.reserve((count + grain - 1) / grain);
    for (size_t first = begin; first < end; first += grain) {
        size_t last = std::min(first + grain, end);
        chunks.push_back(pool.Submit([&func, first, last]() {
            for (size_t i = first; i < last; ++i) {
                func(i);
            }
        }));
    }

    // All chunks must finish before unwinding, func refers to caller state
    std::exception_ptr firstError;
    for (std::future<void>& chunk : chunks) {
        try {
            chunk.get();
        } catch (...) {
            if (!firstError) {
                firstError = std::current_exception();
            }
        }
    }
    if (firstError) {
        std::rethrow_exception(firstError);
    }
}

} // namespace Bez::Clip::Platform
