#include "task_executor.h"
#include <glog/logging.h>

namespace IsingSim {

TaskExecutor::TaskExecutor(size_t num_threads) {
    if (num_threads == 0) {
        LOG(WARNING) << "TaskExecutor created with 0 threads, using 1";
        num_threads = 1;
    }
    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&TaskExecutor::WorkerThread, this, i);
    }
    VLOG(1) << "TaskExecutor started with " << num_threads << " workers";
}

TaskExecutor::~TaskExecutor() {
    Stop();
}

bool TaskExecutor::Submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_) {
            return false;
        }
        tasks_.push(std::move(task));
    }
    condition_.notify_one();
    return true;
}

size_t TaskExecutor::Pending() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return tasks_.size();
}

void TaskExecutor::Stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    VLOG(1) << "TaskExecutor stopped after " << executed_.load() << " tasks";
}

void TaskExecutor::WorkerThread(size_t index) {
    VLOG(3) << "TaskExecutor worker " << index << " running";
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
            // Drain what was queued before Stop()
            if (tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        task();
        executed_.fetch_add(1, std::memory_order_relaxed);
    }
}

} // namespace IsingSim
