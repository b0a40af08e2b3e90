/**
 * @file dispatcher.hpp
 * @brief Dispatcher: worker pool that drives actions through lock, policies
 *        and body.
 * @author Dimitris Kafetzis
 *
 * Per action: acquire the target lock (requeue with exponential backoff while
 * busy), run PRE policies, run the body, run POST policies, release the lock,
 * record the terminal status and emit a notification. Actions for distinct
 * targets run concurrently; actions for one target run one at a time, in
 * submission order.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "engine/action_executor.hpp"
#include "engine/deferred_scheduler.hpp"
#include "engine/notification.hpp"
#include "engine/pending_queue.hpp"
#include "executor/thread_pool.hpp"
#include "lock/action_lock.hpp"
#include "policy/policy_engine.hpp"
#include "registry/target_registry.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace cluster_pilot {

struct DispatcherOptions {
    size_t worker_count = 4;
    std::string worker_prefix = "engine-01";
    uint32_t max_attempts = 10;
    std::chrono::milliseconds base_backoff{20};
    std::chrono::milliseconds max_backoff{2000};
    std::chrono::milliseconds drain_timeout{5000};
    size_t retained_actions = 10000;   ///< Finished actions kept for get()/wait(); 0 keeps all
};

struct DispatcherStats {
    uint64_t submitted = 0;
    uint64_t succeeded = 0;
    uint64_t failed = 0;
    uint64_t cancelled = 0;
    uint64_t lock_retries = 0;
    size_t queued = 0;
    size_t running = 0;
};

class Dispatcher {
public:
    Dispatcher(ActionLockManager& locks, PolicyEngine& policies, ActionExecutor& executor,
               ITargetRegistry& registry, DeferredScheduler& deferred, Logger& logger,
               DispatcherOptions options = {});
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // ── Lifecycle ────────────────────────────

    /// Spawn the workers. Actions submitted earlier are already queued.
    Result<void> start();

    /**
     * @brief Stop accepting work and wind down.
     *
     * Waits up to drain_timeout for queued and running actions, cancels what
     * is left (including pending grace-period timers) and joins the workers.
     * Idempotent.
     */
    void shutdown();

    [[nodiscard]] bool is_running() const noexcept { return started_.load() && accepting_.load(); }

    // ── Actions ──────────────────────────────

    /// Queue an INIT action. ShuttingDown after shutdown().
    Result<ActionId> submit(ActionPtr action);

    /**
     * @brief Request cancellation.
     *
     * Queued actions finish CANCELLED immediately; running actions stop at
     * their next checkpoint. For a finished action, pending deferred timers
     * are cancelled. NotFound for unknown ids, InvalidState when there is
     * nothing left to cancel.
     */
    Result<void> cancel(const ActionId& action_id);

    /**
     * @brief Forget every finished action that owns no pending deferred work.
     *
     * Lookups for a forgotten id return NotFound. Returns the number removed.
     */
    size_t purge_finished();

    [[nodiscard]] ActionPtr find(const ActionId& action_id) const;
    [[nodiscard]] Result<ActionSnapshot> get(const ActionId& action_id) const;

    /// Block until the action is terminal or the timeout passes.
    std::optional<ActionStatus> wait(const ActionId& action_id,
                                     std::chrono::milliseconds timeout) const;

    void add_sink(std::shared_ptr<INotificationSink> sink);

    [[nodiscard]] DispatcherStats stats() const;
    [[nodiscard]] const DispatcherOptions& options() const noexcept { return options_; }

private:
    void worker_loop(std::stop_token stop, const WorkerId& worker);
    void process(PendingEntry entry, const WorkerId& worker);
    BodyOutcome run_locked(const ActionPtr& action);
    void complete(const ActionPtr& action, ActionStatus status, ActionReason reason);
    void notify(const Action& action);

    /// Record a finished action and drop the oldest beyond retained_actions.
    void retire(const ActionId& action_id);
    size_t evict(std::vector<ActionId> candidates);

    /// Cluster whose bindings apply: the target itself, or the node's owner.
    ClusterId policy_cluster(const Action& action) const;
    std::chrono::milliseconds backoff_for(uint32_t attempts) const;

    ActionLockManager& locks_;
    PolicyEngine& policies_;
    ActionExecutor& executor_;
    ITargetRegistry& registry_;
    DeferredScheduler& deferred_;
    Logger& logger_;
    DispatcherOptions options_;

    PendingQueue queue_;

    mutable std::shared_mutex actions_mutex_;
    std::unordered_map<ActionId, ActionPtr> actions_;
    std::deque<ActionId> finished_;     // completion order; guarded by actions_mutex_

    mutable std::mutex sinks_mutex_;
    std::vector<std::shared_ptr<INotificationSink>> sinks_;

    std::atomic<bool> started_{false};
    std::atomic<bool> accepting_{true};
    std::once_flag shutdown_once_;

    std::atomic<uint64_t> submitted_{0};
    std::atomic<uint64_t> succeeded_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> cancelled_{0};
    std::atomic<uint64_t> lock_retries_{0};
    std::atomic<size_t> running_{0};

    ThreadPool notifier_{1};
    std::unique_ptr<ThreadPool> workers_;
};

}  // namespace cluster_pilot
