#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace IsingSim {

/**
 * Scoped guard that runs a cleanup action on every exit path
 */
class ScopeGuard {
public:
    explicit ScopeGuard(std::function<void()> cleanup) : cleanup_(std::move(cleanup)) {}
    ~ScopeGuard() { if (cleanup_) cleanup_(); }

    // Disable copy
    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

    // Enable move
    ScopeGuard(ScopeGuard&& other) noexcept : cleanup_(std::move(other.cleanup_)) {
        other.cleanup_ = nullptr;
    }

    // Drop the cleanup action
    void Dismiss() { cleanup_ = nullptr; }

private:
    std::function<void()> cleanup_;
};

/**
 * Fixed-size worker pool that runs maintenance tasks off the caller's thread.
 * Tasks are plain closures; callers that need results wrap them themselves.
 */
class TaskExecutor {
public:
    explicit TaskExecutor(size_t num_threads = 3);
    ~TaskExecutor();

    TaskExecutor(const TaskExecutor&) = delete;
    TaskExecutor& operator=(const TaskExecutor&) = delete;

    // Returns false once Stop() has been called; the task is not run
    bool Submit(std::function<void()> task);

    // Runs the queued tasks to completion, then joins the workers
    void Stop();

    size_t NumThreads() const { return workers_.size(); }
    size_t Pending() const;
    uint64_t Executed() const { return executed_.load(std::memory_order_relaxed); }

private:
    void WorkerThread(size_t index);

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;
    bool stop_ = false;   // guarded by queue_mutex_
    std::atomic<uint64_t> executed_{0};
};

} // namespace IsingSim
