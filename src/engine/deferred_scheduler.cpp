/**
 * @file deferred_scheduler.cpp
 * @brief DeferredScheduler implementation.
 * @author Dimitris Kafetzis
 *
 * Stop callbacks only flag an entry and wake the timer thread. They are always
 * destroyed with mutex_ released: ~stop_callback blocks while the callback is
 * running on another thread, and the callback itself takes mutex_.
 */

#include "engine/deferred_scheduler.hpp"

#include <algorithm>
#include <exception>
#include <format>

namespace cluster_pilot {

namespace {
constexpr std::string_view kComponent = "deferred";
}

DeferredScheduler::DeferredScheduler(Logger& logger)
    : logger_(logger)
    , thread_([this](std::stop_token stop) { run(stop); }) {}

DeferredScheduler::~DeferredScheduler() {
    shutdown();
}

Result<TimerId> DeferredScheduler::schedule(TimerRequest request) {
    if (request.cancel_token.stop_requested()) {
        return Error{ErrorCode::Cancelled, "Owner " + request.owner + " already cancelled"};
    }

    TimerId id = 0;
    {
        std::lock_guard lock(mutex_);
        if (shut_down_) {
            return Error{ErrorCode::ShuttingDown, "Deferred scheduler is shut down"};
        }
        id = next_id_++;
        entries_.emplace(id, Entry{
            .owner = request.owner,
            .due = std::chrono::steady_clock::now() + request.delay,
            .token = request.cancel_token,
            .fire = std::move(request.fire),
            .on_cancel = std::move(request.on_cancel),
            .cancelled = false,
            .stop_callback = nullptr
        });
        dirty_ = true;
    }
    cv_.notify_one();

    // Registered outside the lock: the callback runs inline if the token was
    // stopped in the meantime.
    std::unique_ptr<StopCallback> callback;
    if (request.cancel_token.stop_possible()) {
        callback = std::make_unique<StopCallback>(request.cancel_token,
                                                  std::function<void()>([this, id] { cancel(id); }));
    }

    {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(id);
        if (it != entries_.end()) {
            it->second.stop_callback = std::move(callback);
        }
    }
    // If the entry already fired, `callback` is released here, unlocked.

    logger_.debug(kComponent, std::format("Timer {} armed for {} ({} ms)",
                                          id, request.owner, request.delay.count()));
    return id;
}

bool DeferredScheduler::cancel(TimerId id) {
    {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end() || it->second.cancelled) return false;
        it->second.cancelled = true;
        dirty_ = true;
    }
    cv_.notify_one();
    return true;
}

void DeferredScheduler::shutdown() {
    std::vector<Entry> remaining;
    {
        std::lock_guard lock(mutex_);
        if (shut_down_) return;
        shut_down_ = true;
    }

    thread_.request_stop();
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();

    {
        std::lock_guard lock(mutex_);
        for (auto& [id, entry] : entries_) {
            entry.cancelled = true;
            remaining.push_back(std::move(entry));
        }
        entries_.clear();
    }

    if (!remaining.empty()) {
        logger_.info(kComponent, std::format("Cancelling {} pending timer(s) on shutdown",
                                             remaining.size()));
    }
    dispatch(remaining);
}

size_t DeferredScheduler::pending_count() const {
    std::lock_guard lock(mutex_);
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
        [](const auto& kv) { return !kv.second.cancelled; }));
}

size_t DeferredScheduler::pending_for(const ActionId& owner) const {
    std::lock_guard lock(mutex_);
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
        [&](const auto& kv) { return !kv.second.cancelled && kv.second.owner == owner; }));
}

void DeferredScheduler::run(std::stop_token stop) {
    std::unique_lock lock(mutex_);
    while (!stop.stop_requested()) {
        std::vector<Entry> ready;
        std::optional<SteadyTime> next_due;
        const auto now = std::chrono::steady_clock::now();

        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->second.cancelled || it->second.due <= now) {
                ready.push_back(std::move(it->second));
                it = entries_.erase(it);
            } else {
                if (!next_due || it->second.due < *next_due) next_due = it->second.due;
                ++it;
            }
        }

        if (!ready.empty()) {
            lock.unlock();
            dispatch(ready);
            lock.lock();
            continue;
        }

        dirty_ = false;
        if (next_due) {
            cv_.wait_until(lock, stop, *next_due, [this] { return dirty_; });
        } else {
            cv_.wait(lock, stop, [this] { return dirty_; });
        }
    }
}

void DeferredScheduler::dispatch(std::vector<Entry>& ready) {
    for (auto& entry : ready) {
        // Deregister first; a stop request arriving now is observed via the token.
        entry.stop_callback.reset();

        const bool cancelled = entry.cancelled || entry.token.stop_requested();
        auto& callback = cancelled ? entry.on_cancel : entry.fire;
        if (!callback) continue;

        try {
            callback();
        } catch (const std::exception& e) {
            logger_.error(kComponent, std::format("Timer callback for {} failed: {}",
                                                  entry.owner, e.what()));
        }
    }
    ready.clear();
}

}  // namespace cluster_pilot
