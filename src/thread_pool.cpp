/**
 * @file thread_pool.cpp
 * @brief Worker pool
 */

#include "voxserve/thread_pool.h"

#include <algorithm>
#include <exception>
#include <iostream>
#include <system_error>

namespace voxserve {

ThreadPool::ThreadPool(size_t num_threads, std::string name, size_t max_threads)
    : name_(std::move(name))
    , max_threads_(max_threads)
{
    if (num_threads == 0) {
        num_threads = 1;
    }
    if (max_threads_ < num_threads) {
        max_threads_ = num_threads;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        spawn_worker();
    }
}

void ThreadPool::spawn_worker() {
    workers_.emplace_back(&ThreadPool::worker_loop, this);
    worker_ids_.push_back(workers_.back().get_id());
}

ThreadPool::~ThreadPool() {
    shutdown();
}

bool ThreadPool::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_.load()) {
            return false;
        }
        tasks_.push(std::move(task));
        if (tasks_.size() > idle_ && workers_.size() < max_threads_) {
            try {
                spawn_worker();
            } catch (const std::system_error& e) {
                // The task stays queued for an existing worker
                std::cerr << "[" << name_ << "] Could not start a worker: " << e.what() << std::endl;
            }
        }
    }
    cv_.notify_one();
    return true;
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_.exchange(true)) {
            return;
        }
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
            worker.join();
        } else if (worker.joinable()) {
            worker.detach();
        }
    }
}

bool ThreadPool::is_worker_thread() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto self = std::this_thread::get_id();
    return std::find(worker_ids_.begin(), worker_ids_.end(), self) != worker_ids_.end();
}

size_t ThreadPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size();
}

size_t ThreadPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void ThreadPool::worker_loop() {
    // Wait until the constructor has published every worker id
    { std::lock_guard<std::mutex> lock(mutex_); }

    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            ++idle_;
            cv_.wait(lock, [this] { return stopping_.load() || !tasks_.empty(); });
            --idle_;
            if (tasks_.empty()) {
                return;  // stopping and drained
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            std::cerr << "[" << name_ << "] Task failed: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "[" << name_ << "] Task failed with a non-standard exception" << std::endl;
        }
    }
}

} // namespace voxserve
