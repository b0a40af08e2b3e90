/**
 * @file thread_pool.hpp
 * @brief std::jthread-based thread pool with cooperative cancellation.
 * @author Dimitris Kafetzis
 *
 * Backs the dispatcher's workers (long-running cancellable loops) and the
 * asynchronous notification fan-out (short fire-and-forget tasks).
 */

#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

namespace cluster_pilot {

/**
 * @brief Thread pool using std::jthread for automatic join and stop_token support.
 *
 * After shutdown() the pool accepts no new work; submit() then returns a
 * future holding std::runtime_error.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = 0);
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Submit a callable for execution.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    /// Submit a callable that accepts a stop_token (signalled on shutdown).
    template <std::invocable<std::stop_token> F>
    std::future<std::invoke_result_t<F, std::stop_token>> submit_cancellable(F&& func);

    /**
     * @brief Stop accepting work, signal stop to all workers and join them.
     *
     * Tasks still queued are run to completion first when drain is true,
     * otherwise they are discarded. Idempotent.
     */
    void shutdown(bool drain = true);

    [[nodiscard]] bool is_running() const noexcept { return accepting_.load(); }
    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;

private:
    using Task = std::function<void(std::stop_token)>;

    bool enqueue(Task task);
    void worker_loop(std::stop_token stop);

    std::vector<std::jthread> workers_;
    std::queue<Task> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::atomic<size_t> active_tasks_{0};
    std::atomic<bool> accepting_{true};
    bool draining_ = true;
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> ThreadPool::submit(F&& func) {
    return submit_cancellable([f = std::forward<F>(func)](std::stop_token) mutable {
        return f();
    });
}

template <std::invocable<std::stop_token> F>
std::future<std::invoke_result_t<F, std::stop_token>> ThreadPool::submit_cancellable(F&& func) {
    using ReturnType = std::invoke_result_t<F, std::stop_token>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    bool queued = enqueue([p = promise, f = std::forward<F>(func)](std::stop_token stop) mutable {
        try {
            if constexpr (std::is_void_v<ReturnType>) {
                f(stop);
                p->set_value();
            } else {
                p->set_value(f(stop));
            }
        } catch (...) {
            p->set_exception(std::current_exception());
        }
    });

    if (!queued) {
        promise->set_exception(std::make_exception_ptr(
            std::runtime_error("ThreadPool is shut down")));
    }
    return future;
}

}  // namespace cluster_pilot
