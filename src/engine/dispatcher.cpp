/**
 * @file dispatcher.cpp
 * @brief Dispatcher implementation.
 * @author Dimitris Kafetzis
 */

#include "engine/dispatcher.hpp"
#include "model/action_keys.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <iterator>

namespace cluster_pilot {

namespace {
constexpr std::string_view kComponent = "dispatcher";

void record_warnings(Action& action, const PolicyEvaluation& evaluation) {
    for (auto& warning : evaluation.warnings()) {
        action.append_output(keys::kPolicyWarnings, std::move(warning));
    }
}

ActionReason rejection_reason(const Action& action, const PolicyResult& rejection) {
    return ActionReason{
        .code = ErrorCode::PolicyRejected,
        .message = std::format("{} rejected {} ({}): {}", rejection.policy_type,
                               to_string(action.type()), to_string(rejection.raw),
                               rejection.reason),
        .policy_id = rejection.policy_id
    };
}
}  // namespace

Dispatcher::Dispatcher(ActionLockManager& locks, PolicyEngine& policies, ActionExecutor& executor,
                       ITargetRegistry& registry, DeferredScheduler& deferred, Logger& logger,
                       DispatcherOptions options)
    : locks_(locks)
    , policies_(policies)
    , executor_(executor)
    , registry_(registry)
    , deferred_(deferred)
    , logger_(logger)
    , options_(std::move(options)) {
    options_.worker_count = std::max<size_t>(options_.worker_count, 1);
    options_.max_attempts = std::max<uint32_t>(options_.max_attempts, 1);
}

Dispatcher::~Dispatcher() {
    shutdown();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> Dispatcher::start() {
    if (!accepting_.load()) {
        return Error{ErrorCode::ShuttingDown, "Dispatcher has been shut down"};
    }
    if (started_.exchange(true)) {
        return Error{ErrorCode::InvalidState, "Dispatcher already started"};
    }

    workers_ = std::make_unique<ThreadPool>(options_.worker_count);
    for (size_t i = 0; i < options_.worker_count; ++i) {
        WorkerId worker = std::format("{}-w{:02}", options_.worker_prefix, i);
        // Worker loops run until shutdown; their futures carry nothing.
        workers_->submit_cancellable([this, worker](std::stop_token stop) {
            worker_loop(stop, worker);
        });
    }

    logger_.info(kComponent, std::format("Started {} worker(s)", options_.worker_count));
    return Result<void>{};
}

void Dispatcher::shutdown() {
    std::call_once(shutdown_once_, [this] {
        accepting_.store(false);
        queue_.close();
        logger_.info(kComponent, std::format("Shutting down: {} queued, {} running",
                                             queue_.size(), running_.load()));

        if (started_.load()) {
            const auto deadline = std::chrono::steady_clock::now() + options_.drain_timeout;
            if (!queue_.wait_idle(deadline)) {
                logger_.warn(kComponent, "Drain timeout reached; cancelling remaining actions");
            }
        }

        for (auto& entry : queue_.drain()) {
            entry.action->request_cancel();
            executor_.abandon(*entry.action);
            complete(entry.action, ActionStatus::Cancelled,
                     {ErrorCode::ShuttingDown, "Engine shutting down", {}});
        }

        {
            std::shared_lock lock(actions_mutex_);
            for (const auto& [id, action] : actions_) {
                if (!action->is_finished()) action->request_cancel();
            }
        }

        deferred_.shutdown();

        if (workers_) workers_->shutdown(false);
        notifier_.shutdown(true);

        logger_.info(kComponent, std::format("Stopped: {} succeeded, {} failed, {} cancelled",
                                             succeeded_.load(), failed_.load(), cancelled_.load()));
    });
}

// ─────────────────────────────────────────────
// Actions
// ─────────────────────────────────────────────

Result<ActionId> Dispatcher::submit(ActionPtr action) {
    if (!action) {
        return Error{ErrorCode::InvalidArgument, "Null action"};
    }
    if (!accepting_.load()) {
        return Error{ErrorCode::ShuttingDown, "Dispatcher is not accepting actions"};
    }
    if (!action->mark_waiting()) {
        return Error{ErrorCode::InvalidState,
                     std::format("Action {} was already submitted", action->id())};
    }

    {
        std::unique_lock lock(actions_mutex_);
        actions_.emplace(action->id(), action);
    }

    // Emit WAITING before a worker can see the action.
    notify(*action);

    if (!queue_.push(action)) {
        complete(action, ActionStatus::Cancelled,
                 {ErrorCode::ShuttingDown, "Engine shutting down", {}});
        return Error{ErrorCode::ShuttingDown, "Dispatcher is not accepting actions"};
    }

    ++submitted_;
    logger_.debug(kComponent, std::format("Queued {} {} on {}", action->id(),
                                          to_string(action->type()), action->target()));
    return action->id();
}

Result<void> Dispatcher::cancel(const ActionId& action_id) {
    auto action = find(action_id);
    if (!action) {
        return Error{ErrorCode::NotFound, "Action " + action_id + " not found"};
    }

    if (action->is_finished()) {
        if (deferred_.pending_for(action_id) > 0) {
            action->request_cancel();
            logger_.info(kComponent, std::format("Cancelled deferred work of {}", action_id));
            return Result<void>{};
        }
        return Error{ErrorCode::InvalidState,
                     std::format("Action {} is already {}", action_id, to_string(action->status()))};
    }

    action->request_cancel();
    if (auto entry = queue_.remove(action_id)) {
        executor_.abandon(*action);
        complete(action, ActionStatus::Cancelled,
                 {ErrorCode::Cancelled, "Cancelled while queued", {}});
    } else {
        logger_.info(kComponent, std::format("Cancellation requested for running {}", action_id));
    }
    return Result<void>{};
}

size_t Dispatcher::purge_finished() {
    std::vector<ActionId> candidates;
    {
        std::unique_lock lock(actions_mutex_);
        candidates.assign(std::make_move_iterator(finished_.begin()),
                          std::make_move_iterator(finished_.end()));
        finished_.clear();
    }
    const size_t removed = evict(std::move(candidates));
    logger_.debug(kComponent, std::format("Purged {} finished action(s)", removed));
    return removed;
}

ActionPtr Dispatcher::find(const ActionId& action_id) const {
    std::shared_lock lock(actions_mutex_);
    auto it = actions_.find(action_id);
    return it == actions_.end() ? nullptr : it->second;
}

Result<ActionSnapshot> Dispatcher::get(const ActionId& action_id) const {
    auto action = find(action_id);
    if (!action) {
        return Error{ErrorCode::NotFound, "Action " + action_id + " not found"};
    }
    return action->snapshot();
}

std::optional<ActionStatus> Dispatcher::wait(const ActionId& action_id,
                                             std::chrono::milliseconds timeout) const {
    auto action = find(action_id);
    if (!action) return std::nullopt;
    return action->wait_for_terminal(timeout);
}

void Dispatcher::add_sink(std::shared_ptr<INotificationSink> sink) {
    if (!sink) return;
    std::lock_guard lock(sinks_mutex_);
    sinks_.push_back(std::move(sink));
}

DispatcherStats Dispatcher::stats() const {
    return DispatcherStats{
        .submitted = submitted_.load(),
        .succeeded = succeeded_.load(),
        .failed = failed_.load(),
        .cancelled = cancelled_.load(),
        .lock_retries = lock_retries_.load(),
        .queued = queue_.size(),
        .running = running_.load()
    };
}

// ─────────────────────────────────────────────
// Worker side
// ─────────────────────────────────────────────

void Dispatcher::worker_loop(std::stop_token stop, const WorkerId& worker) {
    logger_.debug(kComponent, "Worker " + worker + " started");
    while (auto entry = queue_.pop(stop)) {
        process(std::move(*entry), worker);
    }
    logger_.debug(kComponent, "Worker " + worker + " stopped");
}

void Dispatcher::process(PendingEntry entry, const WorkerId& worker) {
    const ActionPtr action = entry.action;
    const TargetId target = action->target();

    if (action->is_finished()) {
        queue_.release(target);
        return;
    }

    if (action->cancel_requested()) {
        executor_.abandon(*action);
        complete(action, ActionStatus::Cancelled,
                 {ErrorCode::Cancelled, "Cancelled before start", {}});
        queue_.release(target);
        return;
    }

    if (auto lock = locks_.acquire(target, action->id(), worker); !lock) {
        ++lock_retries_;
        ++entry.attempts;
        if (entry.attempts >= options_.max_attempts) {
            complete(action, ActionStatus::Failed,
                     {ErrorCode::LockBusy,
                      std::format("{} still locked after {} attempts: {}", target,
                                  entry.attempts, lock.error().message), {}});
            queue_.release(target);
            return;
        }
        const auto delay = backoff_for(entry.attempts);
        logger_.debug(kComponent, std::format("{} busy, retrying {} in {} ms (attempt {})",
                                              target, action->id(), delay.count(), entry.attempts));
        queue_.requeue(std::move(entry), delay);
        return;
    }

    if (!action->mark_running(worker)) {
        // Finished by another thread between pop and lock.
        if (auto released = locks_.release(target, action->id()); !released) {
            locks_.purge(action->id());
        }
        queue_.release(target);
        return;
    }
    notify(*action);
    ++running_;

    BodyOutcome outcome;
    try {
        outcome = run_locked(action);
    } catch (const std::exception& e) {
        logger_.critical(kComponent, std::format("Unhandled exception in {}: {}",
                                                 action->id(), e.what()));
        outcome = BodyOutcome::failed(ErrorCode::Unknown, e.what());
    }

    if (auto released = locks_.release(target, action->id()); !released) {
        locks_.purge(action->id());
        outcome = BodyOutcome::failed(ErrorCode::InconsistentLockRelease,
                                      released.error().message);
    }

    --running_;
    complete(action, outcome.status, std::move(outcome.reason));
    queue_.release(target);
}

BodyOutcome Dispatcher::run_locked(const ActionPtr& action) {
    if (action->cancel_requested()) {
        executor_.abandon(*action);
        return BodyOutcome::cancelled("Cancelled before start");
    }

    // Resolved once: the body may delete the node and with it the link to its cluster.
    const ClusterId cluster_id = policy_cluster(*action);

    auto pre = policies_.evaluate(cluster_id, *action, PolicyPhase::Pre);
    record_warnings(*action, pre);
    if (const auto* rejection = pre.rejection()) {
        executor_.abandon(*action);
        return {ActionStatus::Failed, rejection_reason(*action, *rejection)};
    }

    if (action->cancel_requested()) {
        executor_.abandon(*action);
        return BodyOutcome::cancelled("Cancelled before body");
    }

    BodyOutcome body = executor_.execute(action);

    auto post = policies_.evaluate(cluster_id, *action, PolicyPhase::Post);
    record_warnings(*action, post);
    if (const auto* rejection = post.rejection(); rejection && body.ok()) {
        return {ActionStatus::Failed, rejection_reason(*action, *rejection)};
    }
    return body;
}

void Dispatcher::complete(const ActionPtr& action, ActionStatus status, ActionReason reason) {
    const std::string message = reason.message;
    if (!action->finish(status, std::move(reason))) return;

    switch (status) {
        case ActionStatus::Succeeded:
            ++succeeded_;
            logger_.info(kComponent, std::format("{} {} on {} succeeded", action->id(),
                                                 to_string(action->type()), action->target()));
            break;
        case ActionStatus::Failed:
            ++failed_;
            logger_.warn(kComponent, std::format("{} {} on {} failed: {}", action->id(),
                                                 to_string(action->type()), action->target(),
                                                 message));
            break;
        case ActionStatus::Cancelled:
            ++cancelled_;
            logger_.info(kComponent, std::format("{} {} on {} cancelled: {}", action->id(),
                                                 to_string(action->type()), action->target(),
                                                 message));
            break;
        default:
            break;
    }
    notify(*action);
    retire(action->id());
}

void Dispatcher::retire(const ActionId& action_id) {
    std::vector<ActionId> candidates;
    {
        std::unique_lock lock(actions_mutex_);
        finished_.push_back(action_id);
        if (options_.retained_actions == 0) return;
        while (finished_.size() > options_.retained_actions) {
            candidates.push_back(std::move(finished_.front()));
            finished_.pop_front();
        }
    }
    if (!candidates.empty()) evict(std::move(candidates));
}

size_t Dispatcher::evict(std::vector<ActionId> candidates) {
    // Timer checks run outside actions_mutex_; a firing timer submits through it.
    std::vector<ActionId> busy;
    std::erase_if(candidates, [&](const ActionId& id) {
        if (deferred_.pending_for(id) == 0) return false;
        busy.push_back(id);
        return true;
    });

    std::unique_lock lock(actions_mutex_);
    for (const auto& id : candidates) actions_.erase(id);
    // Actions with timers still pending are reconsidered on a later completion.
    finished_.insert(finished_.end(), busy.begin(), busy.end());
    return candidates.size();
}

void Dispatcher::notify(const Action& action) {
    std::vector<std::shared_ptr<INotificationSink>> sinks;
    {
        std::lock_guard lock(sinks_mutex_);
        if (sinks_.empty()) return;
        sinks = sinks_;
    }
    if (!notifier_.is_running()) return;

    // Fire-and-forget; a throwing sink only poisons its own future.
    notifier_.submit([sinks = std::move(sinks), event = make_event(action)] {
        for (const auto& sink : sinks) sink->emit(event);
    });
}

ClusterId Dispatcher::policy_cluster(const Action& action) const {
    if (action.target_kind() == TargetKind::Cluster) return action.target();
    if (action.type() == ActionType::NodeJoin) {
        return action.inputs().get_string(keys::kClusterId).value_or(ClusterId{});
    }
    auto node = registry_.get_node(action.target());
    return node ? node->cluster_id : ClusterId{};
}

std::chrono::milliseconds Dispatcher::backoff_for(uint32_t attempts) const {
    return LockRetry{options_.max_attempts, options_.base_backoff, options_.max_backoff}
        .delay_after(attempts);
}

}  // namespace cluster_pilot
