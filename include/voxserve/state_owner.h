/**
 * @file state_owner.h
 * @brief Serial executor that owns the mutable application state
 *
 * Every read and write of shared application state (selected model, load
 * flag, enhancement settings) is sent here as a closure and runs on one
 * dedicated thread, in submission order. Callers never hold a lock while
 * waiting for the result, and the owner never runs long blocking work:
 * inference and diarization are dispatched to other pools and report back
 * by posting a closure.
 */

#pragma once

#include "thread_pool.h"

#include <functional>
#include <future>
#include <type_traits>
#include <utility>

namespace voxserve {

class StateOwner {
public:
    StateOwner() : executor_(1, "StateOwner") {}

    StateOwner(const StateOwner&) = delete;
    StateOwner& operator=(const StateOwner&) = delete;

    /**
     * @brief Queue a closure on the owner thread
     */
    template<typename F>
    auto call(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        return executor_.submit(std::forward<F>(fn));
    }

    /**
     * @brief Run a closure on the owner thread and wait for its result
     *
     * Called from the owner thread itself the closure runs inline, since
     * waiting on our own queue could never complete.
     */
    template<typename F>
    auto run(F&& fn) -> std::invoke_result_t<std::decay_t<F>> {
        if (on_owner_thread()) {
            return fn();
        }
        return call(std::forward<F>(fn)).get();
    }

    bool post(std::function<void()> fn) { return executor_.post(std::move(fn)); }

    bool on_owner_thread() const { return executor_.is_worker_thread(); }

    void shutdown() { executor_.shutdown(); }

private:
    ThreadPool executor_;
};

} // namespace voxserve
