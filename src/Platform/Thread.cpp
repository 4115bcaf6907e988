/**
 * @file Thread.cpp
 * @brief Worker pool behind IntersectCurvesBatch
 */

#include <BezClip/Platform/Thread.h>
#include <BezClip/Platform/Log.h>

#include <cerrno>
#include <cstdlib>

namespace Bez::Clip::Platform {

namespace {

constexpr const char* LOG_MODULE = "Thread";

// Upper bound accepted from BEZCLIP_NUM_THREADS
constexpr long MAX_WORKERS = 256;

/// Worker count from the environment, 0 when unset or unusable
size_t ThreadCountFromEnvironment() {
    const char* value = std::getenv(THREAD_COUNT_ENV);
    if (value == nullptr || *value == '\0') {
        return 0;
    }

    errno = 0;
    char* end = nullptr;
    long parsed = std::strtol(value, &end, 10);
    if (errno != 0 || *end != '\0' || parsed < 1 || parsed > MAX_WORKERS) {
        BEZCLIP_LOG_WARNING(LOG_MODULE, "ignoring %s=\"%s\", expected 1..%ld",
                            THREAD_COUNT_ENV, value, MAX_WORKERS);
        return 0;
    }
    return static_cast<size_t>(parsed);
}

} // namespace

// ============================================================================
// System Information
// ============================================================================

size_t GetNumCores() {
    unsigned int cores = std::thread::hardware_concurrency();
    return cores > 0 ? static_cast<size_t>(cores) : 1;
}

size_t GetRecommendedThreadCount() {
    size_t configured = ThreadCountFromEnvironment();
    if (configured > 0) {
        return configured;
    }
    // Leave one core to the thread waiting on the batch
    size_t cores = GetNumCores();
    return cores > 1 ? cores - 1 : 1;
}

// ============================================================================
// ThreadPool
// ============================================================================

ThreadPool& ThreadPool::Instance() {
    static ThreadPool instance(GetRecommendedThreadCount());
    return instance;
}

ThreadPool::ThreadPool(size_t numThreads) {
    size_t count = std::max<size_t>(numThreads, 1);
    workers_.reserve(count);
    while (workers_.size() < count) {
        workers_.emplace_back([this] { WorkerThread(); });
    }
    BEZCLIP_LOG_DEBUG(LOG_MODULE, "pool started with %zu workers", count);
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    condition_.notify_all();

    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

bool ThreadPool::NextTask(std::function<void()>& task) {
    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

    // Queued work still runs after stop is requested
    if (tasks_.empty()) {
        return false;
    }
    task = std::move(tasks_.front());
    tasks_.pop();
    ++activeTasks_;
    return true;
}

void ThreadPool::WorkerThread() {
    std::function<void()> task;
    while (NextTask(task)) {
        // Tasks are packaged_task wrappers, their exceptions land in the future
        task();
        task = nullptr;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --activeTasks_;
        }
        completionCondition_.notify_all();
    }
}

void ThreadPool::WaitAll() {
    std::unique_lock<std::mutex> lock(mutex_);
    completionCondition_.wait(lock, [this] { return tasks_.empty() && activeTasks_ == 0; });
}

size_t ThreadPool::PendingTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size() + activeTasks_;
}

// ============================================================================
// Work Splitting
// ============================================================================

size_t CalculateGrainSize(size_t totalWork, size_t minGrain) {
    size_t workers = ThreadPool::Instance().Size();
    if (workers <= 1) {
        return std::max(totalWork, minGrain);
    }

    // Several chunks per worker
    size_t chunks = workers * 4;
    return std::max((totalWork + chunks - 1) / chunks, minGrain);
}

} // namespace Bez::Clip::Platform
