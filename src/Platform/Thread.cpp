/**
 * @file Thread.cpp
 * @brief Worker pool implementation
 */

#include <PathoMorph/Platform/Thread.h>

#include <exception>

namespace Patho::Morph::Platform {

namespace {

thread_local bool t_inWorker = false;

// Completion state of one Run() call, lives on the caller's stack
struct Batch {
    std::mutex mutex;
    std::condition_variable done;
    size_t remaining = 0;
    std::exception_ptr firstError;
};

} // anonymous namespace

size_t GetNumCores() {
    unsigned int cores = std::thread::hardware_concurrency();
    return cores > 0 ? static_cast<size_t>(cores) : 1;
}

// ============================================================================
// WorkerPool
// ============================================================================

WorkerPool& WorkerPool::Instance() {
    static WorkerPool instance(GetNumCores());
    return instance;
}

bool WorkerPool::InWorkerThread() {
    return t_inWorker;
}

WorkerPool::WorkerPool(size_t numThreads) {
    numThreads = std::max<size_t>(numThreads, 1);
    workers_.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
        workers_.emplace_back(&WorkerPool::WorkerLoop, this);
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    wake_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void WorkerPool::WorkerLoop() {
    t_inWorker = true;

    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            wake_.wait(lock, [this] { return stop_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            job = std::move(queue_.front());
            queue_.pop_front();
        }
        job();
    }
}

void WorkerPool::Run(size_t count, const std::function<void(size_t)>& task) {
    if (count == 0) return;

    Batch batch;
    batch.remaining = count;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t index = 0; index < count; ++index) {
            queue_.emplace_back([&batch, &task, index]() {
                std::exception_ptr error;
                try {
                    task(index);
                } catch (...) {
                    error = std::current_exception();
                }

                std::lock_guard<std::mutex> batchLock(batch.mutex);
                if (error && !batch.firstError) {
                    batch.firstError = error;
                }
                if (--batch.remaining == 0) {
                    batch.done.notify_all();
                }
            });
        }
    }
    wake_.notify_all();

    std::unique_lock<std::mutex> lock(batch.mutex);
    batch.done.wait(lock, [&batch] { return batch.remaining == 0; });
    if (batch.firstError) {
        std::rethrow_exception(batch.firstError);
    }
}

} // namespace Patho::Morph::Platform
