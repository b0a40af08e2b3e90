/**
 * @file action_executor.hpp
 * @brief Built-in action bodies: translate an action into driver calls and
 *        registry updates.
 * @author Dimitris Kafetzis
 *
 * The executor runs with the target lock already held by the dispatcher.
 * Cluster-level bodies operate on member nodes through derived node actions;
 * each derived operation takes the node's lock for the duration of its driver
 * call. A node locked by another action is retried with backoff; once the
 * retries run out the node is left untouched and reported under
 * `nodes.locked`. Bodies poll cancellation between nodes and report partial
 * progress through outputs (see model/action_keys.hpp).
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "driver/driver.hpp"
#include "engine/deferred_scheduler.hpp"
#include "lock/action_lock.hpp"
#include "model/action.hpp"
#include "model/cluster.hpp"
#include "policy/policy_engine.hpp"
#include "registry/target_registry.hpp"

#include <functional>
#include <string>

namespace cluster_pilot {

/**
 * @brief Terminal status proposed by an action body.
 */
struct BodyOutcome {
    ActionStatus status = ActionStatus::Succeeded;
    ActionReason reason;

    static BodyOutcome succeeded() { return {}; }
    static BodyOutcome failed(ErrorCode code, std::string message) {
        return {ActionStatus::Failed, {code, std::move(message), {}}};
    }
    static BodyOutcome cancelled(std::string message) {
        return {ActionStatus::Cancelled, {ErrorCode::Cancelled, std::move(message), {}}};
    }

    [[nodiscard]] bool ok() const noexcept { return status == ActionStatus::Succeeded; }
};

class ActionExecutor {
public:
    /// Hands a derived action to the dispatcher.
    using SubmitFn = std::function<Result<ActionId>(ActionPtr)>;

    ActionExecutor(ITargetRegistry& registry, ActionLockManager& locks, IDriver& driver,
                   PolicyEngine& policies, DeferredScheduler& deferred, Logger& logger,
                   LockRetry node_lock_retry = {});

    ActionExecutor(const ActionExecutor&) = delete;
    ActionExecutor& operator=(const ActionExecutor&) = delete;

    /// Required before any deletion with a grace period runs.
    void set_submitter(SubmitFn submit);

    /// Run the body for action->type(). The caller holds the target lock.
    BodyOutcome execute(const ActionPtr& action);

    /**
     * @brief Undo side effects staged for an action that is cancelled before
     *        its body ran.
     *
     * A deferred node deletion marks its node DELETING when it is scheduled;
     * the node is returned to ACTIVE here.
     */
    void abandon(const Action& action);

private:
    // ── Cluster bodies ───────────────────────
    BodyOutcome cluster_create(Action& action);
    BodyOutcome cluster_delete(const ActionPtr& action);
    BodyOutcome cluster_update(Action& action);
    BodyOutcome cluster_add_nodes(Action& action);
    BodyOutcome cluster_del_nodes(const ActionPtr& action);
    BodyOutcome cluster_scale_out(Action& action);
    BodyOutcome cluster_scale_in(const ActionPtr& action);
    BodyOutcome cluster_check(Action& action);
    BodyOutcome cluster_recover(Action& action);
    BodyOutcome cluster_attach_policy(Action& action);
    BodyOutcome cluster_detach_policy(Action& action);
    BodyOutcome cluster_update_policy(Action& action);

    // ── Node bodies ──────────────────────────
    BodyOutcome node_create(Action& action);
    BodyOutcome node_delete(const ActionPtr& action);
    BodyOutcome node_update(Action& action);
    BodyOutcome node_check(Action& action);
    BodyOutcome node_recover(Action& action);
    BodyOutcome node_join(Action& action);
    BodyOutcome node_leave(Action& action);

    // ── Helpers ──────────────────────────────

    /**
     * @brief Take a node's lock for `holder`, retrying while another action has it.
     *
     * LockBusy once node_lock_retry.max_attempts are used up; Cancelled when
     * `parent` is cancelled during a backoff pause.
     */
    Result<void> lock_node(const Action& parent, const NodeId& node_id, const ActionId& holder);

    /// Derived action for one node, returned with the node lock held.
    Result<ActionPtr> begin_node_op(Action& parent, ActionType type, const NodeId& node_id,
                                    Params inputs = {});
    void end_node_op(const ActionPtr& child);

    /// Run one node operation on behalf of a cluster action, under the node lock.
    Result<DriverOutcome> run_node_op(Action& parent, ActionType type, const NodeId& node_id,
                                      Params inputs = {});

    /// Create a member node and build it through the driver.
    BodyOutcome create_member(Action& action, const Cluster& cluster);

    /// Delete or detach candidates now, or schedule them when a grace period applies.
    BodyOutcome delete_candidates(const ActionPtr& action, const StringList& candidates,
                                  bool destroy_default, bool allow_deferral);

    BodyOutcome remove_now(Action& action, const StringList& candidates, bool destroy);
    BodyOutcome defer_removal(const ActionPtr& action, const StringList& candidates,
                              int64_t grace_seconds);

    /// Recompute the cluster status from its members' health.
    ClusterStatus refresh_cluster_status(const ClusterId& cluster_id, std::string reason);

    void set_node_status(const NodeId& node_id, NodeStatus status, std::string reason);
    void set_cluster_status(const ClusterId& cluster_id, ClusterStatus status, std::string reason);
    void adjust_capacity(Action& action, const ClusterId& cluster_id, int64_t delta);

    ITargetRegistry& registry_;
    ActionLockManager& locks_;
    IDriver& driver_;
    PolicyEngine& policies_;
    DeferredScheduler& deferred_;
    Logger& logger_;
    LockRetry node_lock_retry_;
    SubmitFn submit_;
};

}  // namespace cluster_pilot
