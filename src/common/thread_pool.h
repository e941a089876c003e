#pragma once

/// @file thread_pool.h
/// @brief SupportPulse worker pool for background tasks
///
/// Used off the request path: analytics event dispatch and insight
/// generation. An optional queue bound turns overload into a rejected
/// TryExecute() instead of unbounded memory growth.

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace supportpulse {

class ThreadPool {
public:
    /// @param num_threads Number of worker threads (0 = hardware concurrency)
    /// @param max_queue Maximum queued tasks accepted by TryExecute (0 = unbounded)
    explicit ThreadPool(size_t num_threads = 0, size_t max_queue = 0);

    /// @brief Stops accepting work, drains the queue and joins the workers
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /// @brief Submit a task and get a future for its result
    /// @throws std::runtime_error if the pool is stopped
    template <typename F, typename... Args>
    auto Submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>>;

    /// @brief Queue a task without a result
    /// @throws std::runtime_error if the pool is stopped
    template <typename F>
    void Execute(F&& f);

    /// @brief Queue a task unless the pool is stopped or the queue is full
    /// @return false if the task was rejected
    template <typename F>
    bool TryExecute(F&& f);

    size_t Size() const { return workers_.size(); }

    /// @brief Queued plus running tasks
    size_t PendingTasks() const;

    /// @brief Block until the queue is empty and no task is running
    void Wait();

    /// @brief Stop accepting tasks and join the workers after draining
    void Shutdown();

    bool IsStopped() const { return stop_.load(std::memory_order_acquire); }

private:
    void WorkerLoop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    size_t max_queue_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::condition_variable completion_condition_;

    std::atomic<bool> stop_{false};
    size_t active_tasks_ = 0;  // guarded by mutex_
};

template <typename F, typename... Args>
auto ThreadPool::Submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
    using return_type = std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...));

    std::future<return_type> result = task->get_future();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_.load(std::memory_order_acquire)) {
            throw std::runtime_error("Cannot submit task to stopped thread pool");
        }
        tasks_.emplace([task]() { (*task)(); });
    }

    condition_.notify_one();
    return result;
}

template <typename F>
void ThreadPool::Execute(F&& f) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_.load(std::memory_order_acquire)) {
            throw std::runtime_error("Cannot execute task on stopped thread pool");
        }
        tasks_.emplace(std::forward<F>(f));
    }

    condition_.notify_one();
}

template <typename F>
bool ThreadPool::TryExecute(F&& f) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_.load(std::memory_order_acquire)) {
            return false;
        }
        if (max_queue_ > 0 && tasks_.size() >= max_queue_) {
            return false;
        }
        tasks_.emplace(std::forward<F>(f));
    }

    condition_.notify_one();
    return true;
}

}  // namespace supportpulse
