/**
 * @file action_executor.cpp
 * @brief ActionExecutor implementation.
 * @author Dimitris Kafetzis
 */

#include "engine/action_executor.hpp"
#include "model/action_keys.hpp"
#include "policy/deletion_policy.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <format>
#include <mutex>
#include <set>

namespace cluster_pilot {

namespace {
constexpr std::string_view kComponent = "executor";
constexpr char kDefaultRecovery[] = "RECREATE";

BodyOutcome from_error(const Error& error) {
    return BodyOutcome::failed(error.code, error.message);
}

/// Status a node returns to when a pending deletion is abandoned.
NodeStatus restored_status(NodeStatus current) {
    return current == NodeStatus::Deleting ? NodeStatus::Active : current;
}

/// Wait out `delay` unless the action is cancelled first. False when cancelled.
bool pause_unless_cancelled(const Action& action, std::chrono::milliseconds delay) {
    constexpr auto kSlice = std::chrono::milliseconds(5);
    const auto deadline = std::chrono::steady_clock::now() + delay;
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    while (!action.cancel_requested()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return true;
        // The own token wakes us at once; a parent's cancellation is seen within a slice.
        cv.wait_until(lock, action.stop_token(), std::min(deadline, now + kSlice),
                      [] { return false; });
    }
    return false;
}
}  // namespace

ActionExecutor::ActionExecutor(ITargetRegistry& registry, ActionLockManager& locks,
                               IDriver& driver, PolicyEngine& policies,
                               DeferredScheduler& deferred, Logger& logger,
                               LockRetry node_lock_retry)
    : registry_(registry)
    , locks_(locks)
    , driver_(driver)
    , policies_(policies)
    , deferred_(deferred)
    , logger_(logger)
    , node_lock_retry_(node_lock_retry) {
    node_lock_retry_.max_attempts = std::max<uint32_t>(node_lock_retry_.max_attempts, 1);
}

void ActionExecutor::set_submitter(SubmitFn submit) {
    submit_ = std::move(submit);
}

BodyOutcome ActionExecutor::execute(const ActionPtr& action) {
    switch (action->type()) {
        case ActionType::ClusterCreate:       return cluster_create(*action);
        case ActionType::ClusterDelete:       return cluster_delete(action);
        case ActionType::ClusterUpdate:       return cluster_update(*action);
        case ActionType::ClusterAddNodes:     return cluster_add_nodes(*action);
        case ActionType::ClusterDelNodes:     return cluster_del_nodes(action);
        case ActionType::ClusterScaleOut:     return cluster_scale_out(*action);
        case ActionType::ClusterScaleIn:      return cluster_scale_in(action);
        case ActionType::ClusterCheck:        return cluster_check(*action);
        case ActionType::ClusterRecover:      return cluster_recover(*action);
        case ActionType::ClusterAttachPolicy: return cluster_attach_policy(*action);
        case ActionType::ClusterDetachPolicy: return cluster_detach_policy(*action);
        case ActionType::ClusterUpdatePolicy: return cluster_update_policy(*action);
        case ActionType::NodeCreate:          return node_create(*action);
        case ActionType::NodeDelete:          return node_delete(action);
        case ActionType::NodeUpdate:          return node_update(*action);
        case ActionType::NodeCheck:           return node_check(*action);
        case ActionType::NodeRecover:         return node_recover(*action);
        case ActionType::NodeJoin:            return node_join(*action);
        case ActionType::NodeLeave:           return node_leave(*action);
    }
    return BodyOutcome::failed(ErrorCode::InvalidArgument,
                               std::format("No body for action type {}",
                                           static_cast<int>(action->type())));
}

void ActionExecutor::abandon(const Action& action) {
    if (action.type() != ActionType::NodeDelete) return;
    if (!action.inputs().get_bool(keys::kDeletionDeferred).value_or(false)) return;

    auto node = registry_.get_node(action.target());
    if (node && node->status == NodeStatus::Deleting) {
        set_node_status(node->id, NodeStatus::Active, "Deferred deletion cancelled");
    }
}

// ─────────────────────────────────────────────
// Cluster bodies
// ─────────────────────────────────────────────

BodyOutcome ActionExecutor::cluster_create(Action& action) {
    auto cluster = registry_.get_cluster(action.target());
    if (!cluster) return from_error(cluster.error());

    if (!cluster->within_bounds(cluster->desired_capacity)) {
        set_cluster_status(cluster->id, ClusterStatus::Error, "Desired capacity out of bounds");
        return BodyOutcome::failed(ErrorCode::CapacityExceeded,
            std::format("Desired capacity {} outside [{}, {}]", cluster->desired_capacity,
                        cluster->min_size, cluster->max_size));
    }

    const int64_t missing = cluster->desired_capacity - static_cast<int64_t>(cluster->size());
    size_t failures = 0;
    for (int64_t i = 0; i < missing; ++i) {
        if (action.cancel_requested()) {
            set_cluster_status(cluster->id, ClusterStatus::Error, "Creation cancelled");
            return BodyOutcome::cancelled(std::format("Cancelled after {} of {} node(s)", i, missing));
        }
        auto created = create_member(action, *cluster);
        if (created.status == ActionStatus::Cancelled) {
            set_cluster_status(cluster->id, ClusterStatus::Error, "Creation cancelled");
            return created;
        }
        if (!created.ok()) ++failures;
    }

    if (failures > 0) {
        set_cluster_status(cluster->id, ClusterStatus::Error,
                           std::format("{} node(s) failed to build", failures));
        action.set_output(keys::kClusterStatus, std::string(to_string(ClusterStatus::Error)));
        return BodyOutcome::failed(ErrorCode::DriverError,
            std::format("{} of {} node creation(s) failed", failures, missing));
    }

    set_cluster_status(cluster->id, ClusterStatus::Active, "Cluster creation succeeded");
    action.set_output(keys::kClusterStatus, std::string(to_string(ClusterStatus::Active)));
    return BodyOutcome::succeeded();
}

BodyOutcome ActionExecutor::cluster_delete(const ActionPtr& action) {
    auto cluster = registry_.get_cluster(action->target());
    if (!cluster) return from_error(cluster.error());

    const ClusterStatus previous = cluster->status;
    set_cluster_status(cluster->id, ClusterStatus::Deleting, "Deletion in progress");

    const StringList candidates = action->inputs().get_list(keys::kDeletionCandidates)
                                      .value_or(cluster->nodes);
    auto removal = delete_candidates(action, candidates, true, false);
    if (removal.status == ActionStatus::Cancelled) {
        set_cluster_status(cluster->id, previous, "Deletion cancelled");
        return removal;
    }
    if (!removal.ok()) {
        set_cluster_status(cluster->id, ClusterStatus::Error, removal.reason.message);
        return removal;
    }

    if (auto erased = registry_.delete_cluster(cluster->id); !erased) {
        set_cluster_status(cluster->id, ClusterStatus::Error, erased.error().message);
        return from_error(erased.error());
    }
    logger_.info(kComponent, std::format("Cluster {} deleted", cluster->id));
    return BodyOutcome::succeeded();
}

BodyOutcome ActionExecutor::cluster_update(Action& action) {
    auto cluster = registry_.get_cluster(action.target());
    if (!cluster) return from_error(cluster.error());

    const Params& inputs = action.inputs();
    const std::string profile_id = inputs.get_string(keys::kProfileId).value_or(cluster->profile_id);
    const int64_t version = inputs.get_int(keys::kProfileVersion)
                                .value_or(cluster->profile_version + 1);
    if (profile_id.empty()) {
        return BodyOutcome::failed(ErrorCode::InvalidArgument, "profile_id is required");
    }
    if (version < 0) {
        return BodyOutcome::failed(ErrorCode::InvalidArgument,
                                   std::format("Invalid profile version {}", version));
    }

    // New members are built from the new profile even if a node update below fails.
    if (auto stored = registry_.update_cluster_profile(cluster->id, profile_id, version); !stored) {
        return from_error(stored.error());
    }
    action.set_output(keys::kProfileId, profile_id);
    action.set_output(keys::kProfileVersion, version);

    const Params node_inputs{{keys::kProfileId, profile_id}, {keys::kProfileVersion, version}};
    int64_t updated = 0;
    size_t failures = 0;
    size_t busy = 0;
    for (const auto& node : registry_.list_nodes(cluster->id)) {
        if (node.status == NodeStatus::Deleting || node.status == NodeStatus::Creating) continue;
        if (node.profile_id == profile_id && node.profile_version == version) continue;
        if (action.cancel_requested()) {
            refresh_cluster_status(cluster->id, "Update cancelled");
            return BodyOutcome::cancelled(std::format("Cancelled after updating {} node(s)", updated));
        }

        auto outcome = run_node_op(action, ActionType::NodeUpdate, node.id, node_inputs);
        if (!outcome) {
            if (outcome.error().is(ErrorCode::Cancelled)) {
                refresh_cluster_status(cluster->id, "Update cancelled");
                return BodyOutcome::cancelled(outcome.error().message);
            }
            action.append_output(keys::kNodesLocked, node.id);
            ++busy;
            continue;
        }
        if (outcome->status == DriverStatus::Cancelled) {
            refresh_cluster_status(cluster->id, "Update cancelled");
            return BodyOutcome::cancelled(outcome->detail);
        }
        if (!outcome->ok()) {
            set_node_status(node.id, NodeStatus::Error, outcome->detail);
            action.append_output(keys::kNodesFailed, node.id);
            ++failures;
            continue;
        }
        if (auto stored = registry_.update_node_profile(node.id, profile_id, version); !stored) {
            action.append_output(keys::kNodesFailed, node.id);
            ++failures;
            continue;
        }
        action.append_output(keys::kNodesUpdated, node.id);
        ++updated;
    }

    auto status = refresh_cluster_status(cluster->id, "Cluster update completed");
    action.set_output(keys::kClusterStatus, std::string(to_string(status)));
    logger_.info(kComponent, std::format("Cluster {} moved to {} v{}: {} node(s) updated",
                                         cluster->id, profile_id, version, updated));

    if (failures > 0) {
        return BodyOutcome::failed(ErrorCode::DriverError,
                                   std::format("{} node update(s) failed", failures));
    }
    if (busy > 0) {
        return BodyOutcome::failed(ErrorCode::LockBusy,
            std::format("{} node(s) held by other actions were not updated", busy));
    }
    return BodyOutcome::succeeded();
}

BodyOutcome ActionExecutor::cluster_add_nodes(Action& action) {
    auto requested = action.inputs().get_list(keys::kNodes);
    if (!requested || requested->empty()) {
        return BodyOutcome::failed(ErrorCode::InvalidArgument, "No nodes specified");
    }

    auto cluster = registry_.get_cluster(action.target());
    if (!cluster) return from_error(cluster.error());

    // Validate everything before changing anything.
    std::set<NodeId> seen;
    for (const auto& node_id : *requested) {
        if (!seen.insert(node_id).second) {
            return BodyOutcome::failed(ErrorCode::InvalidArgument,
                                       std::format("Node {} listed twice", node_id));
        }
        auto node = registry_.get_node(node_id);
        if (!node) return from_error(node.error());
        if (!node->is_orphan()) {
            return BodyOutcome::failed(ErrorCode::InvalidArgument,
                std::format("Node {} is already owned by cluster {}", node_id, node->cluster_id));
        }
        if (node->status != NodeStatus::Active) {
            return BodyOutcome::failed(ErrorCode::InvalidArgument,
                std::format("Node {} is not ACTIVE", node_id));
        }
        if (!node->profile_id.empty() && node->profile_id != cluster->profile_id) {
            return BodyOutcome::failed(ErrorCode::InvalidArgument,
                std::format("Node {} profile {} does not match cluster profile {}",
                            node_id, node->profile_id, cluster->profile_id));
        }
    }

    const auto added_count = static_cast<int64_t>(requested->size());
    if (!cluster->within_bounds(cluster->desired_capacity + added_count)) {
        return BodyOutcome::failed(ErrorCode::CapacityExceeded,
            std::format("Adding {} node(s) exceeds max_size {}", added_count, cluster->max_size));
    }

    int64_t added = 0;
    for (const auto& node_id : *requested) {
        if (action.cancel_requested()) {
            adjust_capacity(action, cluster->id, added);
            return BodyOutcome::cancelled(std::format("Cancelled after adding {} node(s)", added));
        }
        if (auto lock = lock_node(action, node_id, action.id()); !lock) {
            if (lock.error().is(ErrorCode::Cancelled)) {
                adjust_capacity(action, cluster->id, added);
                return BodyOutcome::cancelled(std::format("Cancelled after adding {} node(s)", added));
            }
            action.append_output(keys::kNodesLocked, node_id);
            continue;
        }
        auto joined = registry_.set_node_cluster(node_id, cluster->id);
        if (auto released = locks_.release(node_id, action.id()); !released) {
            // The cluster lock is held under the same id, so no purge here.
            logger_.warn(kComponent, std::format("{} lost node lock on {}: {}", action.id(),
                                                 node_id, released.error().message));
        }
        if (!joined) {
            action.append_output(keys::kNodesFailed, node_id);
            continue;
        }
        action.append_output(keys::kNodesAdded, node_id);
        ++added;
    }

    adjust_capacity(action, cluster->id, added);
    if (added != added_count) {
        return BodyOutcome::failed(ErrorCode::LockBusy,
            std::format("{} of {} node(s) could not be added", added_count - added, added_count));
    }
    return BodyOutcome::succeeded();
}

BodyOutcome ActionExecutor::cluster_del_nodes(const ActionPtr& action) {
    auto requested = action->inputs().get_list(keys::kNodes);
    if (!requested || requested->empty()) {
        return BodyOutcome::failed(ErrorCode::InvalidArgument, "No nodes specified");
    }

    auto cluster = registry_.get_cluster(action->target());
    if (!cluster) return from_error(cluster.error());

    for (const auto& node_id : *requested) {
        auto node = registry_.get_node(node_id);
        if (!node) return from_error(node.error());
        if (node->cluster_id != cluster->id) {
            return BodyOutcome::failed(ErrorCode::InvalidArgument,
                std::format("Node {} is not a member of cluster {}", node_id, cluster->id));
        }
    }

    const bool policy_engaged = action->inputs().contains(keys::kDeletionCandidates);
    if (!policy_engaged) {
        const auto count = static_cast<int64_t>(requested->size());
        if (!cluster->within_bounds(cluster->desired_capacity - count)) {
            return BodyOutcome::failed(ErrorCode::CapacityExceeded,
                std::format("Removing {} node(s) goes below min_size {}", count, cluster->min_size));
        }
    }

    const StringList candidates = action->inputs().get_list(keys::kDeletionCandidates)
                                      .value_or(*requested);
    auto removal = delete_candidates(action, candidates, false, true);

    if (!policy_engaged) {
        const int64_t removed = action->outputs().get_int(keys::kDeletionRemoved).value_or(0);
        if (removed > 0) adjust_capacity(*action, cluster->id, -removed);
    }
    return removal;
}

BodyOutcome ActionExecutor::cluster_scale_out(Action& action) {
    const int64_t count = action.inputs().get_int(keys::kCount).value_or(1);
    if (count < 0) {
        return BodyOutcome::failed(ErrorCode::InvalidArgument,
                                   std::format("Invalid count {}", count));
    }

    auto cluster = registry_.get_cluster(action.target());
    if (!cluster) return from_error(cluster.error());
    if (count == 0) {
        action.set_output(keys::kDesiredCapacity, cluster->desired_capacity);
        return BodyOutcome::succeeded();
    }

    if (cluster->max_size != kUnboundedSize
        && cluster->desired_capacity + count > cluster->max_size) {
        return BodyOutcome::failed(ErrorCode::CapacityExceeded,
            std::format("Scaling out by {} exceeds max_size {}", count, cluster->max_size));
    }

    int64_t created = 0;
    size_t failures = 0;
    bool cancelled = false;
    for (int64_t i = 0; i < count; ++i) {
        if (action.cancel_requested()) {
            cancelled = true;
            break;
        }
        auto outcome = create_member(action, *cluster);
        if (outcome.status == ActionStatus::Cancelled) {
            cancelled = true;
            break;
        }
        if (outcome.ok()) {
            ++created;
        } else {
            ++failures;
        }
    }

    if (created > 0) adjust_capacity(action, cluster->id, created);

    if (cancelled) {
        return BodyOutcome::cancelled(std::format("Cancelled after creating {} of {} node(s)",
                                                  created, count));
    }
    if (failures > 0) {
        return BodyOutcome::failed(ErrorCode::DriverError,
            std::format("{} of {} node creation(s) failed", failures, count));
    }
    return BodyOutcome::succeeded();
}

BodyOutcome ActionExecutor::cluster_scale_in(const ActionPtr& action) {
    auto cluster = registry_.get_cluster(action->target());
    if (!cluster) return from_error(cluster.error());

    const Params& inputs = action->inputs();
    const bool policy_engaged = inputs.contains(keys::kDeletionCandidates);

    StringList candidates;
    if (policy_engaged) {
        candidates = inputs.get_list(keys::kDeletionCandidates).value_or(StringList{});
    } else {
        const int64_t count = inputs.get_int(keys::kCount).value_or(1);
        if (count < 0) {
            return BodyOutcome::failed(ErrorCode::InvalidArgument,
                                       std::format("Invalid count {}", count));
        }
        if (count == 0) {
            action->set_output(keys::kDeletionRemoved, int64_t{0});
            return BodyOutcome::succeeded();
        }
        if (cluster->desired_capacity - count < cluster->min_size) {
            return BodyOutcome::failed(ErrorCode::CapacityExceeded,
                std::format("Scaling in by {} goes below min_size {}", count, cluster->min_size));
        }

        if (auto explicit_nodes = inputs.get_list(keys::kNodes)) {
            candidates = *explicit_nodes;
        } else {
            auto members = registry_.list_nodes(cluster->id);
            std::erase_if(members, [](const Node& n) { return n.status == NodeStatus::Deleting; });
            candidates = select_candidates(members, DeletionCriteria::Random,
                                           static_cast<size_t>(count));
        }
    }

    auto removal = delete_candidates(action, candidates, true, true);

    if (!policy_engaged) {
        const int64_t removed = action->outputs().get_int(keys::kDeletionRemoved).value_or(0);
        if (removed > 0) adjust_capacity(*action, cluster->id, -removed);
    }
    return removal;
}

BodyOutcome ActionExecutor::cluster_check(Action& action) {
    auto cluster = registry_.get_cluster(action.target());
    if (!cluster) return from_error(cluster.error());

    size_t busy = 0;
    for (const auto& node : registry_.list_nodes(cluster->id)) {
        if (action.cancel_requested()) {
            return BodyOutcome::cancelled("Cluster check cancelled");
        }
        if (node.status == NodeStatus::Deleting || node.status == NodeStatus::Creating) continue;

        auto outcome = run_node_op(action, ActionType::NodeCheck, node.id);
        if (!outcome) {
            if (outcome.error().is(ErrorCode::Cancelled)) {
                return BodyOutcome::cancelled(outcome.error().message);
            }
            action.append_output(keys::kNodesLocked, node.id);
            ++busy;
            continue;
        }
        if (outcome->status == DriverStatus::Cancelled) {
            return BodyOutcome::cancelled(outcome->detail);
        }
        if (!outcome->ok()) {
            set_node_status(node.id, NodeStatus::Error, outcome->detail);
        } else if (outcome->observed) {
            set_node_status(node.id, *outcome->observed,
                            *outcome->observed == NodeStatus::Active
                                ? std::string{}
                                : std::format("Health check reported {}",
                                              to_string(*outcome->observed)));
        }
    }

    auto status = refresh_cluster_status(cluster->id, "Cluster check completed");
    action.set_output(keys::kClusterStatus, std::string(to_string(status)));
    if (busy > 0) {
        return BodyOutcome::failed(ErrorCode::LockBusy,
            std::format("{} node(s) held by other actions were not checked", busy));
    }
    return BodyOutcome::succeeded();
}

BodyOutcome ActionExecutor::cluster_recover(Action& action) {
    auto cluster = registry_.get_cluster(action.target());
    if (!cluster) return from_error(cluster.error());

    const std::string operation = action.inputs().get_string(keys::kRecoverOperation)
                                      .value_or(kDefaultRecovery);
    if (operation == "NONE") {
        action.set_output(keys::kClusterStatus, std::string(to_string(cluster->status)));
        return BodyOutcome::succeeded();
    }

    size_t failures = 0;
    size_t busy = 0;
    for (const auto& node : registry_.list_nodes(cluster->id)) {
        if (node.status != NodeStatus::Error && node.status != NodeStatus::Warning) continue;
        if (action.cancel_requested()) {
            refresh_cluster_status(cluster->id, "Recovery cancelled");
            return BodyOutcome::cancelled("Cluster recovery cancelled");
        }

        auto outcome = run_node_op(action, ActionType::NodeRecover, node.id,
                                   Params{{keys::kRecoverOperation, operation}});
        if (!outcome) {
            if (outcome.error().is(ErrorCode::Cancelled)) {
                refresh_cluster_status(cluster->id, "Recovery cancelled");
                return BodyOutcome::cancelled(outcome.error().message);
            }
            action.append_output(keys::kNodesLocked, node.id);
            ++busy;
            continue;
        }
        if (outcome->status == DriverStatus::Cancelled) {
            refresh_cluster_status(cluster->id, "Recovery cancelled");
            return BodyOutcome::cancelled(outcome->detail);
        }
        if (!outcome->ok()) {
            set_node_status(node.id, NodeStatus::Error, outcome->detail);
            action.append_output(keys::kNodesFailed, node.id);
            ++failures;
            continue;
        }
        set_node_status(node.id, NodeStatus::Active, std::format("Recovered by {}", operation));
        action.append_output(keys::kNodesRecovered, node.id);
    }

    auto status = refresh_cluster_status(cluster->id, "Cluster recovery completed");
    action.set_output(keys::kClusterStatus, std::string(to_string(status)));
    if (failures > 0) {
        return BodyOutcome::failed(ErrorCode::DriverError,
                                   std::format("{} node(s) failed to recover", failures));
    }
    if (busy > 0) {
        return BodyOutcome::failed(ErrorCode::LockBusy,
            std::format("{} node(s) held by other actions were not recovered", busy));
    }
    return BodyOutcome::succeeded();
}

BodyOutcome ActionExecutor::cluster_attach_policy(Action& action) {
    const Params& inputs = action.inputs();
    auto policy_id = inputs.get_string(keys::kPolicyId);
    if (!policy_id) return BodyOutcome::failed(ErrorCode::InvalidArgument, "policy.id is required");

    AttachOptions options;
    if (auto level = inputs.get_string(keys::kPolicyLevel)) {
        options.level = parse_enforcement_level(*level);
        if (!options.level) {
            return BodyOutcome::failed(ErrorCode::InvalidArgument,
                                       std::format("Unknown enforcement level '{}'", *level));
        }
    }
    if (auto priority = inputs.get_int(keys::kPolicyPriority)) {
        options.priority = static_cast<int32_t>(*priority);
    }
    options.enabled = inputs.get_bool(keys::kPolicyEnabled).value_or(true);

    auto binding = policies_.attach(action.target(), *policy_id, options);
    if (!binding) return from_error(binding.error());

    action.set_output(keys::kPolicyId, binding->policy_id);
    action.set_output(keys::kPolicyLevel, std::string(to_string(binding->level)));
    action.set_output(keys::kPolicyPriority, int64_t{binding->priority});
    return BodyOutcome::succeeded();
}

BodyOutcome ActionExecutor::cluster_detach_policy(Action& action) {
    auto policy_id = action.inputs().get_string(keys::kPolicyId);
    if (!policy_id) return BodyOutcome::failed(ErrorCode::InvalidArgument, "policy.id is required");

    if (auto detached = policies_.detach(action.target(), *policy_id); !detached) {
        return from_error(detached.error());
    }
    action.set_output(keys::kPolicyId, *policy_id);
    return BodyOutcome::succeeded();
}

BodyOutcome ActionExecutor::cluster_update_policy(Action& action) {
    const Params& inputs = action.inputs();
    auto policy_id = inputs.get_string(keys::kPolicyId);
    if (!policy_id) return BodyOutcome::failed(ErrorCode::InvalidArgument, "policy.id is required");

    BindingUpdate update;
    if (auto level = inputs.get_string(keys::kPolicyLevel)) {
        update.level = parse_enforcement_level(*level);
        if (!update.level) {
            return BodyOutcome::failed(ErrorCode::InvalidArgument,
                                       std::format("Unknown enforcement level '{}'", *level));
        }
    }
    if (auto priority = inputs.get_int(keys::kPolicyPriority)) {
        update.priority = static_cast<int32_t>(*priority);
    }
    update.enabled = inputs.get_bool(keys::kPolicyEnabled);

    auto binding = policies_.update_binding(action.target(), *policy_id, update);
    if (!binding) return from_error(binding.error());

    action.set_output(keys::kPolicyId, binding->policy_id);
    action.set_output(keys::kPolicyLevel, std::string(to_string(binding->level)));
    action.set_output(keys::kPolicyPriority, int64_t{binding->priority});
    action.set_output(keys::kPolicyEnabled, binding->enabled);
    return BodyOutcome::succeeded();
}

// ─────────────────────────────────────────────
// Node bodies
// ─────────────────────────────────────────────

BodyOutcome ActionExecutor::node_create(Action& action) {
    auto node = registry_.get_node(action.target());
    if (!node) return from_error(node.error());

    if (!node->is_orphan()) {
        auto cluster = registry_.get_cluster(node->cluster_id);
        if (!cluster) return from_error(cluster.error());
        if (cluster->max_size != kUnboundedSize
            && cluster->desired_capacity + 1 > cluster->max_size) {
            set_node_status(node->id, NodeStatus::Error, "Cluster is at max_size");
            return BodyOutcome::failed(ErrorCode::CapacityExceeded,
                std::format("Cluster {} is at max_size {}", cluster->id, cluster->max_size));
        }
    }

    set_node_status(node->id, NodeStatus::Creating, "Creation in progress");
    auto outcome = driver_.execute(action, action.cancel_query());
    if (outcome.status == DriverStatus::Cancelled) {
        if (auto erased = registry_.delete_node(node->id); !erased) {
            logger_.warn(kComponent, std::format("Could not discard cancelled node {}: {}",
                                                 node->id, erased.error().message));
        }
        return BodyOutcome::cancelled(outcome.detail);
    }
    if (!outcome.ok()) {
        set_node_status(node->id, NodeStatus::Error, outcome.detail);
        action.append_output(keys::kNodesFailed, node->id);
        return BodyOutcome::failed(ErrorCode::DriverError, outcome.detail);
    }

    set_node_status(node->id, NodeStatus::Active, "Creation succeeded");
    action.append_output(keys::kNodesCreated, node->id);
    if (!node->is_orphan()) adjust_capacity(action, node->cluster_id, 1);
    return BodyOutcome::succeeded();
}

BodyOutcome ActionExecutor::node_delete(const ActionPtr& action_ptr) {
    Action& action = *action_ptr;
    auto node = registry_.get_node(action.target());
    if (!node) return from_error(node.error());

    const int64_t grace = action.inputs().get_int(keys::kDeletionGracePeriod).value_or(0);
    if (grace > 0 && !action.inputs().get_bool(keys::kDeletionDeferred).value_or(false)) {
        return defer_removal(action_ptr, {node->id}, grace);
    }

    const bool destroy = action.inputs().get_bool(keys::kDeletionDestroy).value_or(true);
    const NodeStatus restore = restored_status(node->status);
    set_node_status(node->id, NodeStatus::Deleting, "Deletion in progress");

    if (destroy) {
        auto outcome = driver_.execute(action, action.cancel_query());
        if (outcome.status == DriverStatus::Cancelled) {
            set_node_status(node->id, restore, "Deletion cancelled");
            action.set_output(keys::kDeletionRemoved, int64_t{0});
            return BodyOutcome::cancelled(outcome.detail);
        }
        if (!outcome.ok()) {
            set_node_status(node->id, NodeStatus::Error, outcome.detail);
            action.append_output(keys::kNodesFailed, node->id);
            action.set_output(keys::kDeletionRemoved, int64_t{0});
            return BodyOutcome::failed(ErrorCode::DriverError, outcome.detail);
        }
        if (auto erased = registry_.delete_node(node->id); !erased) {
            action.set_output(keys::kDeletionRemoved, int64_t{0});
            return from_error(erased.error());
        }
    } else {
        if (auto left = registry_.set_node_cluster(node->id, {}); !left) {
            set_node_status(node->id, restore, left.error().message);
            action.set_output(keys::kDeletionRemoved, int64_t{0});
            return from_error(left.error());
        }
        set_node_status(node->id, restore, "Removed from cluster");
    }

    action.append_output(keys::kNodesDeleted, node->id);
    action.set_output(keys::kDeletionRemoved, int64_t{1});
    return BodyOutcome::succeeded();
}

BodyOutcome ActionExecutor::node_update(Action& action) {
    auto node = registry_.get_node(action.target());
    if (!node) return from_error(node.error());

    std::string profile_id = node->profile_id;
    int64_t version = node->profile_version + 1;
    std::optional<Cluster> cluster;
    if (!node->is_orphan()) {
        auto owner = registry_.get_cluster(node->cluster_id);
        if (!owner) return from_error(owner.error());
        cluster = std::move(*owner);
        profile_id = cluster->profile_id;
        version = cluster->profile_version;
    }

    Params& inputs = action.inputs();
    profile_id = inputs.get_string(keys::kProfileId).value_or(profile_id);
    version = inputs.get_int(keys::kProfileVersion).value_or(version);
    if (profile_id.empty()) {
        return BodyOutcome::failed(ErrorCode::InvalidArgument, "profile_id is required");
    }
    if (cluster && profile_id != cluster->profile_id) {
        return BodyOutcome::failed(ErrorCode::InvalidArgument,
            std::format("Node {} must stay on its cluster's profile {}", node->id,
                        cluster->profile_id));
    }
    inputs.set(keys::kProfileId, profile_id);
    inputs.set(keys::kProfileVersion, version);

    auto outcome = driver_.execute(action, action.cancel_query());
    if (outcome.status == DriverStatus::Cancelled) return BodyOutcome::cancelled(outcome.detail);
    if (!outcome.ok()) {
        set_node_status(node->id, NodeStatus::Error, outcome.detail);
        return BodyOutcome::failed(ErrorCode::DriverError, outcome.detail);
    }
    if (auto stored = registry_.update_node_profile(node->id, profile_id, version); !stored) {
        return from_error(stored.error());
    }

    set_node_status(node->id, NodeStatus::Active, "Update succeeded");
    action.set_output(keys::kProfileId, profile_id);
    action.set_output(keys::kProfileVersion, version);
    action.set_output(keys::kNodeStatus, std::string(to_string(NodeStatus::Active)));
    if (cluster) refresh_cluster_status(cluster->id, "Node updated");
    return BodyOutcome::succeeded();
}

BodyOutcome ActionExecutor::node_check(Action& action) {
    auto node = registry_.get_node(action.target());
    if (!node) return from_error(node.error());

    auto outcome = driver_.execute(action, action.cancel_query());
    if (outcome.status == DriverStatus::Cancelled) return BodyOutcome::cancelled(outcome.detail);

    NodeStatus status = NodeStatus::Error;
    std::string reason = outcome.detail;
    if (outcome.ok()) {
        status = outcome.observed.value_or(NodeStatus::Active);
        reason = status == NodeStatus::Active
            ? std::string{}
            : std::format("Health check reported {}", to_string(status));
    }
    set_node_status(node->id, status, reason);
    action.set_output(keys::kNodeStatus, std::string(to_string(status)));
    if (!node->is_orphan()) refresh_cluster_status(node->cluster_id, "Node check completed");
    return BodyOutcome::succeeded();
}

BodyOutcome ActionExecutor::node_recover(Action& action) {
    auto node = registry_.get_node(action.target());
    if (!node) return from_error(node.error());

    if (!action.inputs().contains(keys::kRecoverOperation)) {
        action.inputs().set(keys::kRecoverOperation, std::string(kDefaultRecovery));
    }
    auto outcome = driver_.execute(action, action.cancel_query());
    if (outcome.status == DriverStatus::Cancelled) return BodyOutcome::cancelled(outcome.detail);
    if (!outcome.ok()) {
        set_node_status(node->id, NodeStatus::Error, outcome.detail);
        return BodyOutcome::failed(ErrorCode::DriverError, outcome.detail);
    }

    set_node_status(node->id, NodeStatus::Active, "Recovery succeeded");
    action.set_output(keys::kNodeStatus, std::string(to_string(NodeStatus::Active)));
    if (!node->is_orphan()) refresh_cluster_status(node->cluster_id, "Node recovered");
    return BodyOutcome::succeeded();
}

BodyOutcome ActionExecutor::node_join(Action& action) {
    auto cluster_id = action.inputs().get_string(keys::kClusterId);
    if (!cluster_id || cluster_id->empty()) {
        return BodyOutcome::failed(ErrorCode::InvalidArgument, "cluster_id is required");
    }

    auto node = registry_.get_node(action.target());
    if (!node) return from_error(node.error());
    auto cluster = registry_.get_cluster(*cluster_id);
    if (!cluster) return from_error(cluster.error());

    if (!node->is_orphan()) {
        return BodyOutcome::failed(ErrorCode::InvalidState,
            std::format("Node {} already belongs to cluster {}", node->id, node->cluster_id));
    }
    if (!node->profile_id.empty() && node->profile_id != cluster->profile_id) {
        return BodyOutcome::failed(ErrorCode::InvalidArgument,
            std::format("Node {} profile {} does not match cluster profile {}",
                        node->id, node->profile_id, cluster->profile_id));
    }
    if (!cluster->within_bounds(cluster->desired_capacity + 1)) {
        return BodyOutcome::failed(ErrorCode::CapacityExceeded,
            std::format("Cluster {} is at max_size {}", cluster->id, cluster->max_size));
    }

    if (auto joined = registry_.set_node_cluster(node->id, cluster->id); !joined) {
        return from_error(joined.error());
    }
    adjust_capacity(action, cluster->id, 1);
    return BodyOutcome::succeeded();
}

BodyOutcome ActionExecutor::node_leave(Action& action) {
    auto node = registry_.get_node(action.target());
    if (!node) return from_error(node.error());
    if (node->is_orphan()) {
        return BodyOutcome::failed(ErrorCode::InvalidState,
                                   std::format("Node {} is not a cluster member", node->id));
    }

    auto cluster = registry_.get_cluster(node->cluster_id);
    if (!cluster) return from_error(cluster.error());
    if (cluster->desired_capacity - 1 < cluster->min_size) {
        return BodyOutcome::failed(ErrorCode::CapacityExceeded,
            std::format("Cluster {} is at min_size {}", cluster->id, cluster->min_size));
    }

    if (auto left = registry_.set_node_cluster(node->id, {}); !left) {
        return from_error(left.error());
    }
    adjust_capacity(action, cluster->id, -1);
    return BodyOutcome::succeeded();
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

Result<void> ActionExecutor::lock_node(const Action& parent, const NodeId& node_id,
                                       const ActionId& holder) {
    for (uint32_t attempt = 1;; ++attempt) {
        auto lock = locks_.acquire(node_id, holder, parent.owner());
        if (lock || !lock.error().is(ErrorCode::LockBusy)) return lock;

        if (attempt >= node_lock_retry_.max_attempts) {
            return Error{ErrorCode::LockBusy,
                         std::format("Node {} still locked after {} attempts: {}",
                                     node_id, attempt, lock.error().message)};
        }
        const auto delay = node_lock_retry_.delay_after(attempt);
        logger_.debug(kComponent, std::format("{} waiting {} ms for node {} (attempt {})",
                                              parent.id(), delay.count(), node_id, attempt));
        if (!pause_unless_cancelled(parent, delay)) {
            return Error{ErrorCode::Cancelled,
                         std::format("Cancelled while waiting for node {}", node_id)};
        }
    }
}

Result<ActionPtr> ActionExecutor::begin_node_op(Action& parent, ActionType type,
                                                const NodeId& node_id, Params inputs) {
    auto child = Action::create(type, node_id, std::move(inputs), ActionCause::Derived);
    child->set_parent(parent.id(), parent.stop_token());

    if (auto lock = lock_node(parent, node_id, child->id()); !lock) return lock.error();
    return child;
}

void ActionExecutor::end_node_op(const ActionPtr& child) {
    if (auto released = locks_.release(child->target(), child->id()); !released) {
        locks_.purge(child->id());
    }
}

Result<DriverOutcome> ActionExecutor::run_node_op(Action& parent, ActionType type,
                                                  const NodeId& node_id, Params inputs) {
    auto child = begin_node_op(parent, type, node_id, std::move(inputs));
    if (!child) return child.error();

    auto outcome = driver_.execute(**child, parent.cancel_query());
    end_node_op(*child);
    return outcome;
}

BodyOutcome ActionExecutor::create_member(Action& action, const Cluster& cluster) {
    NodeSpec spec;
    spec.cluster_id = cluster.id;
    spec.profile_id = cluster.profile_id;
    spec.profile_version = cluster.profile_version;
    spec.status = NodeStatus::Creating;

    auto node = registry_.create_node(std::move(spec));
    if (!node) return from_error(node.error());

    auto discard = [&] {
        if (auto erased = registry_.delete_node(node->id); !erased) {
            logger_.warn(kComponent, std::format("Could not discard node {}: {}",
                                                 node->id, erased.error().message));
        }
    };

    auto outcome = run_node_op(action, ActionType::NodeCreate, node->id);
    if (!outcome) {
        discard();
        if (outcome.error().is(ErrorCode::Cancelled)) {
            return BodyOutcome::cancelled(outcome.error().message);
        }
        return from_error(outcome.error());
    }
    if (outcome->status == DriverStatus::Cancelled) {
        discard();
        return BodyOutcome::cancelled(outcome->detail);
    }
    if (!outcome->ok()) {
        set_node_status(node->id, NodeStatus::Error, outcome->detail);
        action.append_output(keys::kNodesFailed, node->id);
        return BodyOutcome::failed(ErrorCode::DriverError, outcome->detail);
    }

    set_node_status(node->id, NodeStatus::Active, "Creation succeeded");
    action.append_output(keys::kNodesCreated, node->id);
    return BodyOutcome::succeeded();
}

BodyOutcome ActionExecutor::delete_candidates(const ActionPtr& action, const StringList& candidates,
                                              bool destroy_default, bool allow_deferral) {
    const Params& inputs = action->inputs();
    const bool destroy = inputs.get_bool(keys::kDeletionDestroy).value_or(destroy_default);
    const int64_t grace = inputs.get_int(keys::kDeletionGracePeriod).value_or(0);

    if (allow_deferral && grace > 0 && !candidates.empty()) {
        return defer_removal(action, candidates, grace);
    }
    return remove_now(*action, candidates, destroy);
}

BodyOutcome ActionExecutor::remove_now(Action& action, const StringList& candidates, bool destroy) {
    int64_t removed = 0;
    size_t failures = 0;
    size_t busy = 0;
    bool cancelled = false;

    for (const auto& node_id : candidates) {
        if (action.cancel_requested()) {
            cancelled = true;
            break;
        }

        // Node state is only read and changed while its lock is held.
        auto op = begin_node_op(action, destroy ? ActionType::NodeDelete : ActionType::NodeLeave,
                                node_id);
        if (!op) {
            if (op.error().is(ErrorCode::Cancelled)) {
                cancelled = true;
                break;
            }
            logger_.warn(kComponent, std::format("{} skipped node {}: {}", action.id(), node_id,
                                                 op.error().message));
            action.append_output(keys::kNodesLocked, node_id);
            ++busy;
            continue;
        }

        auto node = registry_.get_node(node_id);
        if (!node) {
            end_node_op(*op);
            action.append_output(keys::kNodesFailed, node_id);
            ++failures;
            continue;
        }
        const NodeStatus restore = restored_status(node->status);
        set_node_status(node_id, NodeStatus::Deleting, "Deletion in progress");

        if (destroy) {
            auto outcome = driver_.execute(**op, action.cancel_query());
            if (outcome.status == DriverStatus::Cancelled) {
                set_node_status(node_id, restore, "Deletion cancelled");
                end_node_op(*op);
                cancelled = true;
                break;
            }
            if (!outcome.ok()) {
                set_node_status(node_id, NodeStatus::Error, outcome.detail);
                end_node_op(*op);
                action.append_output(keys::kNodesFailed, node_id);
                ++failures;
                continue;
            }
            auto erased = registry_.delete_node(node_id);
            end_node_op(*op);
            if (!erased) {
                logger_.warn(kComponent, std::format("Node {} destroyed but record kept: {}",
                                                     node_id, erased.error().message));
                action.append_output(keys::kNodesFailed, node_id);
                ++failures;
                continue;
            }
        } else {
            auto left = registry_.set_node_cluster(node_id, {});
            set_node_status(node_id, restore, left ? "Removed from cluster" : left.error().message);
            end_node_op(*op);
            if (!left) {
                action.append_output(keys::kNodesFailed, node_id);
                ++failures;
                continue;
            }
        }

        action.append_output(keys::kNodesDeleted, node_id);
        ++removed;
    }

    action.set_output(keys::kDeletionRemoved, removed);
    logger_.debug(kComponent, std::format("{} removed {} of {} candidate(s)",
                                          action.id(), removed, candidates.size()));

    if (cancelled) {
        return BodyOutcome::cancelled(std::format("Cancelled after removing {} of {} node(s)",
                                                  removed, candidates.size()));
    }
    if (failures > 0) {
        return BodyOutcome::failed(ErrorCode::DriverError,
            std::format("{} of {} node deletion(s) failed", failures, candidates.size()));
    }
    if (busy > 0) {
        return BodyOutcome::failed(ErrorCode::LockBusy,
            std::format("{} of {} node(s) held by other actions were not removed",
                        busy, candidates.size()));
    }
    return BodyOutcome::succeeded();
}

BodyOutcome ActionExecutor::defer_removal(const ActionPtr& action, const StringList& candidates,
                                          int64_t grace_seconds) {
    if (!submit_) {
        return BodyOutcome::failed(ErrorCode::InvalidState,
                                   "Deferred deletion requested but no dispatcher is attached");
    }

    const Params& inputs = action->inputs();
    const bool destroy = inputs.get_bool(keys::kDeletionDestroy).value_or(true);
    const bool reduce = inputs.get_bool(keys::kDeletionReduceCapacity).value_or(false);
    std::weak_ptr<Action> parent = action;

    size_t scheduled = 0;
    for (const auto& node_id : candidates) {
        auto node = registry_.get_node(node_id);
        if (!node) {
            action->append_output(keys::kNodesFailed, node_id);
            continue;
        }
        const NodeStatus restore = restored_status(node->status);

        Params child_inputs{
            {keys::kDeletionCandidates, StringList{node_id}},
            {keys::kDeletionDestroy, destroy},
            {keys::kDeletionGracePeriod, int64_t{0}},
            {keys::kDeletionReduceCapacity, reduce},
            {keys::kDeletionDeferred, true}
        };
        auto child = Action::create(ActionType::NodeDelete, node_id, std::move(child_inputs),
                                    ActionCause::Derived);
        child->set_parent(action->id(), action->stop_token());

        set_node_status(node_id, NodeStatus::Deleting,
                        std::format("Deletion in {} s", grace_seconds));

        auto timer = deferred_.schedule(TimerRequest{
            .owner = action->id(),
            .delay = std::chrono::seconds(grace_seconds),
            .cancel_token = action->stop_token(),
            .fire = [this, child, restore] {
                auto submitted = submit_(child);
                if (!submitted) {
                    logger_.warn(kComponent, std::format("Deferred deletion of {} dropped: {}",
                                                         child->target(),
                                                         submitted.error().message));
                    set_node_status(child->target(), restore, "Deferred deletion dropped");
                }
            },
            .on_cancel = [this, parent, node_id, restore] {
                set_node_status(node_id, restore, "Deferred deletion cancelled");
                if (auto owner = parent.lock()) {
                    owner->append_output(keys::kDeferredCancelled, node_id);
                }
                logger_.info(kComponent, std::format("Deferred deletion of {} cancelled", node_id));
            }
        });

        if (!timer) {
            set_node_status(node_id, restore, timer.error().message);
            if (timer.error().is(ErrorCode::Cancelled)) {
                action->set_output(keys::kDeletionRemoved, int64_t{0});
                return BodyOutcome::cancelled(std::format("Cancelled after scheduling {} deletion(s)",
                                                          scheduled));
            }
            action->append_output(keys::kNodesFailed, node_id);
            continue;
        }
        action->append_output(keys::kDeferredScheduled, node_id);
        ++scheduled;
    }

    // Removal happens in the deferred children; they account for capacity themselves.
    action->set_output(keys::kDeletionRemoved, int64_t{0});
    logger_.info(kComponent, std::format("{} scheduled {} deletion(s) in {} s",
                                         action->id(), scheduled, grace_seconds));
    return BodyOutcome::succeeded();
}

ClusterStatus ActionExecutor::refresh_cluster_status(const ClusterId& cluster_id, std::string reason) {
    const auto nodes = registry_.list_nodes(cluster_id);
    const auto active = std::count_if(nodes.begin(), nodes.end(),
        [](const Node& n) { return n.status == NodeStatus::Active; });

    ClusterStatus status = ClusterStatus::Active;
    if (!nodes.empty() && active == 0) {
        status = ClusterStatus::Error;
    } else if (static_cast<size_t>(active) < nodes.size()) {
        status = ClusterStatus::Warning;
    }
    set_cluster_status(cluster_id, status, std::move(reason));
    return status;
}

void ActionExecutor::set_node_status(const NodeId& node_id, NodeStatus status, std::string reason) {
    if (auto updated = registry_.update_node_status(node_id, status, std::move(reason)); !updated) {
        logger_.warn(kComponent, std::format("Node {} status not updated to {}: {}",
                                             node_id, to_string(status), updated.error().message));
    }
}

void ActionExecutor::set_cluster_status(const ClusterId& cluster_id, ClusterStatus status,
                                        std::string reason) {
    if (auto updated = registry_.update_cluster_status(cluster_id, status, std::move(reason));
        !updated) {
        logger_.warn(kComponent, std::format("Cluster {} status not updated to {}: {}",
                                             cluster_id, to_string(status),
                                             updated.error().message));
    }
}

void ActionExecutor::adjust_capacity(Action& action, const ClusterId& cluster_id, int64_t delta) {
    if (delta == 0) return;
    auto capacity = registry_.update_cluster_capacity(cluster_id, delta);
    if (!capacity) {
        logger_.warn(kComponent, std::format("Capacity of {} not adjusted by {}: {}",
                                             cluster_id, delta, capacity.error().message));
        return;
    }
    action.set_output(keys::kDesiredCapacity, *capacity);
}

}  // namespace cluster_pilot
