#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// Fixed set of threads running submitted jobs in FIFO order.
// Threads inherit the signal mask of whoever calls start().
class WorkerPool {
public:
    explicit WorkerPool(size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Spawns the threads. Jobs submitted earlier wait in the queue.
    void start();

    // Returns false once stop() has been called.
    bool submit(std::function<void()> job);

    // Runs whatever is still queued, then joins the threads. Jobs of a pool
    // that was never started are dropped.
    void stop();

    size_t pending() const;

private:
    void worker_loop();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> jobs_;
    size_t thread_count_;
    bool stopping_ = false;
    std::vector<std::jthread> threads_;
};
