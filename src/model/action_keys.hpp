/**
 * @file action_keys.hpp
 * @brief Well-known keys of action inputs and outputs.
 * @author Dimitris Kafetzis
 *
 * Policies and action bodies communicate through these keys: a PRE hook
 * writes `deletion.*` inputs, the body reports progress in outputs, and a POST
 * hook reads those outputs.
 */

#pragma once

namespace cluster_pilot::keys {

// ── Caller inputs ────────────────────────────
inline constexpr char kCount[] = "count";                  ///< Nodes to add or remove
inline constexpr char kNodes[] = "nodes";                  ///< Explicit node list
inline constexpr char kClusterId[] = "cluster_id";         ///< NODE_CREATE / NODE_JOIN
inline constexpr char kProfileId[] = "profile_id";         ///< CLUSTER_UPDATE / NODE_UPDATE target profile
inline constexpr char kProfileVersion[] = "profile_version";
inline constexpr char kPolicyId[] = "policy.id";
inline constexpr char kPolicyLevel[] = "policy.level";
inline constexpr char kPolicyPriority[] = "policy.priority";
inline constexpr char kPolicyEnabled[] = "policy.enabled";

// ── Written by DeletionPolicy (PRE) ──────────
inline constexpr char kDeletionCandidates[] = "deletion.candidates";
inline constexpr char kDeletionDestroy[] = "deletion.destroy";
inline constexpr char kDeletionGracePeriod[] = "deletion.grace_period";
inline constexpr char kDeletionReduceCapacity[] = "deletion.reduce_desired_capacity";
inline constexpr char kDeletionDeferred[] = "deletion.deferred";   ///< Set on deferred children

// ── Written by ScalingPolicy / HealthPolicy ──
inline constexpr char kRecoverOperation[] = "recover.operation";
inline constexpr char kHealthUnhealthy[] = "health.unhealthy";

// ── Outputs ──────────────────────────────────
inline constexpr char kDeletionRemoved[] = "deletion.removed";    ///< Nodes actually removed
inline constexpr char kNodesDeleted[] = "nodes.deleted";
inline constexpr char kNodesFailed[] = "nodes.failed";
inline constexpr char kNodesCreated[] = "nodes.created";
inline constexpr char kNodesRecovered[] = "nodes.recovered";
inline constexpr char kNodesAdded[] = "nodes.added";
inline constexpr char kNodesUpdated[] = "nodes.updated";
inline constexpr char kNodesLocked[] = "nodes.locked";           ///< Held by other actions past every retry
inline constexpr char kNodeStatus[] = "node.status";
inline constexpr char kDeferredScheduled[] = "deferred.scheduled";
inline constexpr char kDeferredCancelled[] = "deferred.cancelled";
inline constexpr char kPolicyWarnings[] = "policy.warnings";
inline constexpr char kDesiredCapacity[] = "cluster.desired_capacity";
inline constexpr char kClusterStatus[] = "cluster.status";

}  // namespace cluster_pilot::keys
