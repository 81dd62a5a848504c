#include "lanshare/concurrency/worker_pool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace lanshare::concurrency {

WorkerPool::WorkerPool(std::size_t thread_count, std::size_t queue_capacity, std::string name)
    : name_(std::move(name))
    , queue_(queue_capacity) {
    const std::size_t count = std::max<std::size_t>(1, thread_count);
    threads_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        threads_.emplace_back(&WorkerPool::worker_loop, this);
    }
    spdlog::debug("Worker pool '{}' started: threads={} queue_capacity={}", name_, count, queue_capacity);
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::try_post(Task task) {
    return queue_.try_push(std::move(task));
}

bool WorkerPool::post(Task task) {
    return queue_.push(std::move(task));
}

void WorkerPool::shutdown() {
    if (stopped_.exchange(true)) {
        return;
    }

    queue_.shutdown();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    spdlog::debug("Worker pool '{}' stopped", name_);
}

std::size_t WorkerPool::default_thread_count() {
    const std::size_t cpus = std::max<std::size_t>(1, std::thread::hardware_concurrency());
    return std::min<std::size_t>(32, cpus + 4);
}

void WorkerPool::worker_loop() {
    while (true) {
        auto task = queue_.pop();
        if (!task) {
            break;  // Shut down and drained
        }

        active_.fetch_add(1, std::memory_order_relaxed);
        try {
            (*task)();
        } catch (const std::exception& e) {
            spdlog::error("Task in worker pool '{}' threw: {}", name_, e.what());
        }
        active_.fetch_sub(1, std::memory_order_relaxed);
    }
}

} // namespace lanshare::concurrency
