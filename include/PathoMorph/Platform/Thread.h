#pragma once

/**
 * @file Thread.h
 * @brief Worker pool and row-tiled parallel loops
 *
 * Usage:
 * @code
 * // One call per region
 * ParallelFor(0, regions.size(), [&](size_t i) {
 *     results[i] = Analyze(regions[i]);
 * });
 *
 * // Row tiles, the callback owns the inner loop
 * ParallelForRange(0, height, [&](size_t rowBegin, size_t rowEnd) {
 *     for (size_t y = rowBegin; y < rowEnd; ++y) {
 *         processRow(y);
 *     }
 * });
 * @endcode
 *
 * Loops issued from inside a pool worker run inline on that worker, so a
 * parallel stage may call another parallel stage without starving the pool.
 */

#include <PathoMorph/Core/Export.h>

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace Patho::Morph::Platform {

/**
 * @brief Get number of hardware threads (logical cores), minimum 1
 */
PATHOMORPH_API size_t GetNumCores();

// ============================================================================
// Worker Pool
// ============================================================================

/**
 * @brief Process-wide pool that runs batches of tile tasks
 *
 * Singleton; use Instance(). Holds no analysis state. Each Run() call is a
 * self-contained batch, so concurrent analyses can share the pool.
 */
class PATHOMORPH_API WorkerPool {
public:
    static WorkerPool& Instance();

    /// Joins all workers after the queue drains
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    size_t Size() const { return workers_.size(); }

    /**
     * @brief Run task(0) .. task(count - 1) on the workers and wait for all
     *
     * The first exception thrown by a task is rethrown on the calling thread
     * once every task of the batch has finished.
     */
    void Run(size_t count, const std::function<void(size_t)>& task);

    /// True when called from one of the pool's workers
    static bool InWorkerThread();

private:
    explicit WorkerPool(size_t numThreads);

    void WorkerLoop();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable wake_;
    bool stop_ = false;
};

// ============================================================================
// Parallel loops
// ============================================================================

/**
 * @brief Check if splitting workSize items across the pool is worthwhile
 */
inline bool ShouldParallelize(size_t workSize, size_t minWorkPerThread) {
    return workSize >= minWorkPerThread * 2 && GetNumCores() > 1 &&
           !WorkerPool::InWorkerThread();
}

/**
 * @brief Call func(rangeBegin, rangeEnd) over contiguous chunks of [begin, end)
 * @param numChunks Number of chunks (0 = twice the core count)
 *
 * Chunk sizes differ by at most one. Exceptions thrown by func are rethrown on
 * the calling thread.
 */
template<typename Func>
void ParallelForRange(size_t begin, size_t end, Func&& func, size_t numChunks = 0) {
    if (begin >= end) return;

    size_t count = end - begin;
    if (!ShouldParallelize(count, 16)) {
        func(begin, end);
        return;
    }

    if (numChunks == 0) {
        numChunks = GetNumCores() * 2;
    }
    numChunks = std::min(numChunks, count);

    const size_t chunkSize = count / numChunks;
    const size_t remainder = count % numChunks;

    WorkerPool::Instance().Run(numChunks, [&](size_t chunk) {
        size_t first = begin + chunk * chunkSize + std::min(chunk, remainder);
        size_t last = first + chunkSize + (chunk < remainder ? 1 : 0);
        func(first, last);
    });
}

/**
 * @brief Call func(i) for each i in [begin, end)
 */
template<typename Func>
void ParallelFor(size_t begin, size_t end, Func&& func) {
    ParallelForRange(begin, end, [&func](size_t first, size_t last) {
        for (size_t i = first; i < last; ++i) {
            func(i);
        }
    });
}

} // namespace Patho::Morph::Platform
