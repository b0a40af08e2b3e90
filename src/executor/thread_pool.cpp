/**
 * @file thread_pool.cpp
 * @brief ThreadPool implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/thread_pool.hpp"

namespace cluster_pilot {

ThreadPool::ThreadPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;  // fallback
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this](std::stop_token stop) {
            worker_loop(stop);
        });
    }
}

ThreadPool::~ThreadPool() {
    shutdown(false);
}

bool ThreadPool::enqueue(Task task) {
    {
        std::lock_guard lock(queue_mutex_);
        if (!accepting_.load()) return false;
        task_queue_.push(std::move(task));
    }
    queue_cv_.notify_one();
    return true;
}

void ThreadPool::shutdown(bool drain) {
    {
        std::lock_guard lock(queue_mutex_);
        accepting_.store(false);
        draining_ = drain;
        if (!drain) {
            std::queue<Task> discarded;
            task_queue_.swap(discarded);
        }
    }

    // Request stop on all jthreads first
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    // Wake all threads so they can observe the stop request
    queue_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
            worker.join();
        }
    }
}

void ThreadPool::worker_loop(std::stop_token stop) {
    while (true) {
        Task task;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !task_queue_.empty(); });

            if (task_queue_.empty()) {
                if (stop.stop_requested()) return;
                continue;
            }
            if (stop.stop_requested() && !draining_) return;

            task = std::move(task_queue_.front());
            task_queue_.pop();
        }

        ++active_tasks_;
        task(stop);
        --active_tasks_;
    }
}

size_t ThreadPool::active_count() const noexcept {
    return active_tasks_.load();
}

size_t ThreadPool::queued_count() const noexcept {
    std::lock_guard lock(queue_mutex_);
    return task_queue_.size();
}

size_t ThreadPool::thread_count() const noexcept {
    return workers_.size();
}

}  // namespace cluster_pilot
