#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace semantic_chunker {

// Fixed-size worker pool used to chunk pages of one document in parallel
class ThreadPool {
public:
    // 0 picks std::thread::hardware_concurrency() (at least one worker)
    explicit ThreadPool(size_t num_threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>>;

    // Blocks until the queue is drained and no task is running
    void wait_all();

    size_t size() const { return workers_.size(); }
    size_t queue_size() const;
    size_t active_tasks() const;

    static size_t resolve_thread_count(int requested);

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex mutex_;
    std::condition_variable task_ready_;
    std::condition_variable idle_;
    bool stop_ = false;
    size_t pending_ = 0;  // queued + running
};

template<typename F, typename... Args>
auto ThreadPool::enqueue(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
    using return_type = std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            throw std::runtime_error("enqueue on stopped ThreadPool");
        }
        ++pending_;
        tasks_.emplace([task]() { (*task)(); });
    }
    task_ready_.notify_one();
    return result;
}

} // namespace semantic_chunker
