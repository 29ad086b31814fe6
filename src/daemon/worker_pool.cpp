#include "worker_pool.hpp"

#include <exception>
#include <print>

WorkerPool::WorkerPool(size_t threads) : thread_count_(threads == 0 ? 1 : threads) {}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::start() {
    std::lock_guard lock(mutex_);
    if (stopping_ || !threads_.empty()) return;
    threads_.reserve(thread_count_);
    for (size_t i = 0; i < thread_count_; ++i) {
        threads_.emplace_back([this] { worker_loop(); });
    }
}

bool WorkerPool::submit(std::function<void()> job) {
    {
        std::lock_guard lock(mutex_);
        if (stopping_) return false;
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
    return true;
}

void WorkerPool::stop() {
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
}

size_t WorkerPool::pending() const {
    std::lock_guard lock(mutex_);
    return jobs_.size();
}

void WorkerPool::worker_loop() {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
            if (jobs_.empty()) return;
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }

        try {
            job();
        } catch (const std::exception& e) {
            std::println(stderr, "worker: job threw: {}", e.what());
        }
    }
}
