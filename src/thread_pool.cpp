#include "semantic_chunker/thread_pool.h"

#include <algorithm>

namespace semantic_chunker {

size_t ThreadPool::resolve_thread_count(int requested) {
    if (requested > 0) {
        return static_cast<size_t>(requested);
    }
    return std::max(1u, std::thread::hardware_concurrency());
}

ThreadPool::ThreadPool(size_t num_threads) {
    size_t count = num_threads == 0 ? resolve_thread_count(0) : num_threads;
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    task_ready_.notify_all();

    for (auto& worker : workers_) {
        worker.join();
    }
}

void ThreadPool::worker_loop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            task_ready_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        // packaged_task stores any exception in the future
        task();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --pending_;
        }
        idle_.notify_all();
    }
}

void ThreadPool::wait_all() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return pending_ == 0; });
}

size_t ThreadPool::queue_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

size_t ThreadPool::active_tasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_ - tasks_.size();
}

} // namespace semantic_chunker
