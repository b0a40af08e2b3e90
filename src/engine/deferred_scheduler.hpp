/**
 * @file deferred_scheduler.hpp
 * @brief Cancellable one-shot timers for grace periods.
 * @author Dimitris Kafetzis
 *
 * A single timer thread waits for the earliest due entry. A timer may be tied
 * to a std::stop_token (the scheduling action's cancellation); a stop request
 * on that token cancels the timer if it has not fired yet. Waiting out a grace
 * period therefore never occupies a dispatcher worker.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

namespace cluster_pilot {

using TimerId = uint64_t;

struct TimerRequest {
    ActionId owner;                            ///< Action that scheduled the timer
    std::chrono::milliseconds delay{0};
    std::stop_token cancel_token;              ///< Stop request cancels the timer
    std::function<void()> fire;
    std::function<void()> on_cancel;           ///< Runs instead of fire when cancelled
};

class DeferredScheduler {
public:
    explicit DeferredScheduler(Logger& logger);
    ~DeferredScheduler();

    DeferredScheduler(const DeferredScheduler&) = delete;
    DeferredScheduler& operator=(const DeferredScheduler&) = delete;

    /**
     * @brief Arm a timer.
     *
     * Fails with Cancelled if the token is already stopped and with
     * ShuttingDown after shutdown().
     */
    Result<TimerId> schedule(TimerRequest request);

    /// Cancel a pending timer. Returns false if it already fired or is unknown.
    bool cancel(TimerId id);

    /// Cancel every pending timer (running on_cancel for each) and stop the thread.
    void shutdown();

    [[nodiscard]] size_t pending_count() const;
    [[nodiscard]] size_t pending_for(const ActionId& owner) const;

private:
    using StopCallback = std::stop_callback<std::function<void()>>;

    struct Entry {
        ActionId owner;
        SteadyTime due;
        std::stop_token token;
        std::function<void()> fire;
        std::function<void()> on_cancel;
        bool cancelled = false;
        std::unique_ptr<StopCallback> stop_callback;
    };

    void run(std::stop_token stop);
    void dispatch(std::vector<Entry>& ready);

    Logger& logger_;
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::map<TimerId, Entry> entries_;
    TimerId next_id_ = 1;
    bool dirty_ = false;
    bool shut_down_ = false;
    std::jthread thread_;
};

}  // namespace cluster_pilot
