#pragma once

#include "lanshare/concurrency/bounded_queue.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace lanshare::concurrency {

/**
 * @brief Fixed-size thread pool fed by a bounded task queue
 *
 * The server runs one connection per task; the batch downloader runs one
 * file per task. Tasks must not throw: an escaping exception is logged and
 * the worker keeps running.
 *
 * Usage:
 * ```cpp
 * WorkerPool pool(4, 16);
 * auto done = pool.submit([] { return 42; });
 * if (!pool.try_post([] { ... })) { ... queue full ... }
 * pool.shutdown();   // drains queued tasks, joins threads
 * ```
 */
class WorkerPool {
public:
    using Task = std::function<void()>;

    /**
     * @param thread_count Number of worker threads (at least 1)
     * @param queue_capacity Maximum queued tasks, 0 for unbounded
     * @param name Used in log lines
     */
    WorkerPool(std::size_t thread_count, std::size_t queue_capacity, std::string name = "pool");
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queue a task without waiting
     * @return false when the queue is full or the pool is shut down
     */
    bool try_post(Task task);

    /**
     * @brief Queue a task, waiting for room
     * @return false when the pool is shut down
     */
    bool post(Task task);

    /**
     * @brief Queue a callable and get a future for its result
     *
     * Waits for room in the queue. If the pool is already shut down the
     * returned future holds a std::runtime_error.
     */
    template<typename F>
    auto submit(F&& func) -> std::future<std::invoke_result_t<F>> {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(func));
        auto future = task->get_future();
        if (!post([task]() { (*task)(); })) {
            std::promise<R> rejected;
            rejected.set_exception(std::make_exception_ptr(
                std::runtime_error("worker pool '" + name_ + "' is shut down")));
            return rejected.get_future();
        }
        return future;
    }

    /**
     * @brief Stop accepting tasks, finish queued ones, join all threads
     */
    void shutdown();

    std::size_t thread_count() const noexcept { return threads_.size(); }
    std::size_t queued() const { return queue_.size(); }
    std::size_t active() const noexcept { return active_.load(std::memory_order_relaxed); }

    /**
     * @brief Default server pool size: min(32, cpu + 4)
     */
    static std::size_t default_thread_count();

private:
    void worker_loop();

    std::string name_;
    BoundedQueue<Task> queue_;
    std::vector<std::thread> threads_;
    std::atomic<std::size_t> active_{0};
    std::atomic<bool> stopped_{false};
};

} // namespace lanshare::concurrency
