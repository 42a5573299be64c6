#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace grid {

// Fixed set of threads draining a bounded FIFO of blocking REST calls.
class WorkerPool {
public:
    using Task = std::function<void()>;

    WorkerPool(std::size_t threads, std::size_t queue_limit);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // False when the queue is full or the pool is shutting down.
    bool submit(Task task);

    // Runs what is already queued, then joins.
    void shutdown();

    std::size_t pending() const;
    std::size_t busy() const;

private:
    void run();

    std::size_t queue_limit_;
    std::vector<std::thread> threads_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> queue_;
    std::size_t busy_ = 0;
    bool stopping_ = false;
};

} // namespace grid
