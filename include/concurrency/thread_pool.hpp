#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace arcstream::concurrency {

// Fixed-size worker pool. Tasks queued before shutdown() still run;
// enqueue() after shutdown() throws.
class ThreadPool {
public:
    explicit ThreadPool(std::size_t threadCount = std::thread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    template <class Callable, class... Args>
    auto enqueue(Callable&& task, Args&&... args)
        -> std::future<std::invoke_result_t<std::decay_t<Callable>, std::decay_t<Args>...>>;

    std::size_t size() const noexcept;
    std::size_t pending() const;

    void shutdown();

private:
    using Task = std::function<void()>;

    void workerLoop();

    std::vector<std::thread> workers_;
    std::queue<Task> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ {false};
};

template <class Callable, class... Args>
auto ThreadPool::enqueue(Callable&& task, Args&&... args)
    -> std::future<std::invoke_result_t<std::decay_t<Callable>, std::decay_t<Args>...>>
{
    using Result = std::invoke_result_t<std::decay_t<Callable>, std::decay_t<Args>...>;

    auto packagedTask = std::make_shared<std::packaged_task<Result()>>(
        [callable = std::forward<Callable>(task), bound = std::make_tuple(std::forward<Args>(args)...)]() mutable {
            return std::apply(callable, std::move(bound));
        });

    auto future = packagedTask->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            throw std::runtime_error("ThreadPool is stopped");
        }
        tasks_.emplace([packagedTask]() { (*packagedTask)(); });
    }

    cv_.notify_one();
    return future;
}

} // namespace arcstream::concurrency
