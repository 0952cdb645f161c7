#include "concurrency/thread_pool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace arcstream::concurrency {

ThreadPool::ThreadPool(std::size_t threadCount)
{
    if (threadCount == 0) {
        threadCount = std::max<std::size_t>(1, std::thread::hardware_concurrency());
    }

    workers_.reserve(threadCount);
    for (std::size_t i = 0; i < threadCount; ++i) {
        workers_.emplace_back([this]() { workerLoop(); });
    }
    spdlog::debug("Thread pool started with {} workers", threadCount);
}

ThreadPool::~ThreadPool()
{
    shutdown();
}

std::size_t ThreadPool::size() const noexcept
{
    return workers_.size();
}

std::size_t ThreadPool::pending() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void ThreadPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            return;
        }
        stop_ = true;
    }

    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ThreadPool::workerLoop()
{
    while (true) {
        Task task;

        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stop_ || !tasks_.empty(); });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        // packaged_task stores exceptions in the future
        task();
    }
}

} // namespace arcstream::concurrency
