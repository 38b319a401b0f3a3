/**
 * @file thread_pool.h
 * @brief Worker pool with a FIFO task queue, fixed-size or growing on demand
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace voxserve {

class ThreadPool {
public:
    static constexpr size_t UNBOUNDED = static_cast<size_t>(-1);

    /**
     * @param num_threads Workers started up front
     * @param max_threads Upper bound when growing; 0 keeps the pool at
     *        num_threads. A task posted while every worker is busy starts
     *        a new worker until the bound is reached.
     */
    ThreadPool(size_t num_threads, std::string name, size_t max_threads = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Enqueue a fire-and-forget task
     * @return false when the pool is shutting down (task not queued)
     */
    bool post(std::function<void()> task);

    /**
     * @brief Enqueue a task and obtain its result
     *
     * Exceptions thrown by the task are delivered through the future. When the
     * pool is shutting down the future holds a std::runtime_error.
     */
    template<typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using R = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        std::future<R> result = task->get_future();
        if (!post([task]() { (*task)(); })) {
            std::promise<R> rejected;
            rejected.set_exception(std::make_exception_ptr(
                std::runtime_error(name_ + " is shutting down")));
            return rejected.get_future();
        }
        return result;
    }

    /**
     * @brief Stop accepting tasks, run what is queued, join workers
     */
    void shutdown();

    /** True when called from one of this pool's workers */
    bool is_worker_thread() const;

    size_t size() const;
    size_t pending() const;
    const std::string& name() const { return name_; }

private:
    void worker_loop();
    void spawn_worker();  // mutex_ held

    std::string name_;
    size_t max_threads_;
    size_t idle_ = 0;
    std::vector<std::thread> workers_;
    std::vector<std::thread::id> worker_ids_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<std::function<void()>> tasks_;
    std::atomic<bool> stopping_{false};
};

} // namespace voxserve
