/**
 * @file types.hpp
 * @brief Fundamental vocabulary types used throughout ClusterPilot.
 * @author Dimitris Kafetzis
 *
 * Defines identifiers, action/target enumerations, status enums and their
 * string conversions. All types are value types.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cluster_pilot {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using ActionId = std::string;
using ClusterId = std::string;
using NodeId = std::string;
using PolicyId = std::string;
using TargetId = std::string;
using WorkerId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Action Types
// ─────────────────────────────────────────────

enum class ActionType : uint8_t {
    ClusterCreate,
    ClusterDelete,
    ClusterUpdate,
    ClusterAddNodes,
    ClusterDelNodes,
    ClusterScaleOut,
    ClusterScaleIn,
    ClusterCheck,
    ClusterRecover,
    ClusterAttachPolicy,
    ClusterDetachPolicy,
    ClusterUpdatePolicy,
    NodeCreate,
    NodeDelete,
    NodeUpdate,
    NodeCheck,
    NodeRecover,
    NodeJoin,
    NodeLeave
};

[[nodiscard]] constexpr std::string_view to_string(ActionType type) noexcept {
    switch (type) {
        case ActionType::ClusterCreate:       return "CLUSTER_CREATE";
        case ActionType::ClusterDelete:       return "CLUSTER_DELETE";
        case ActionType::ClusterUpdate:       return "CLUSTER_UPDATE";
        case ActionType::ClusterAddNodes:     return "CLUSTER_ADD_NODES";
        case ActionType::ClusterDelNodes:     return "CLUSTER_DEL_NODES";
        case ActionType::ClusterScaleOut:     return "CLUSTER_SCALE_OUT";
        case ActionType::ClusterScaleIn:      return "CLUSTER_SCALE_IN";
        case ActionType::ClusterCheck:        return "CLUSTER_CHECK";
        case ActionType::ClusterRecover:      return "CLUSTER_RECOVER";
        case ActionType::ClusterAttachPolicy: return "CLUSTER_ATTACH_POLICY";
        case ActionType::ClusterDetachPolicy: return "CLUSTER_DETACH_POLICY";
        case ActionType::ClusterUpdatePolicy: return "CLUSTER_UPDATE_POLICY";
        case ActionType::NodeCreate:          return "NODE_CREATE";
        case ActionType::NodeDelete:          return "NODE_DELETE";
        case ActionType::NodeUpdate:          return "NODE_UPDATE";
        case ActionType::NodeCheck:           return "NODE_CHECK";
        case ActionType::NodeRecover:         return "NODE_RECOVER";
        case ActionType::NodeJoin:            return "NODE_JOIN";
        case ActionType::NodeLeave:           return "NODE_LEAVE";
    }
    return "UNKNOWN";
}

/**
 * @brief Parse an action name such as "CLUSTER_SCALE_IN".
 */
std::optional<ActionType> parse_action_type(std::string_view name) noexcept;

enum class TargetKind : uint8_t {
    Cluster,
    Node
};

[[nodiscard]] constexpr std::string_view to_string(TargetKind kind) noexcept {
    return kind == TargetKind::Cluster ? "cluster" : "node";
}

[[nodiscard]] constexpr TargetKind target_kind_of(ActionType type) noexcept {
    switch (type) {
        case ActionType::NodeCreate:
        case ActionType::NodeDelete:
        case ActionType::NodeUpdate:
        case ActionType::NodeCheck:
        case ActionType::NodeRecover:
        case ActionType::NodeJoin:
        case ActionType::NodeLeave:
            return TargetKind::Node;
        default:
            return TargetKind::Cluster;
    }
}

// ─────────────────────────────────────────────
// Action Status
// ─────────────────────────────────────────────

enum class ActionStatus : uint8_t {
    Init,          ///< Created, not yet submitted
    Waiting,       ///< Queued, waiting for a worker and the target lock
    Running,       ///< Lock held, policies/body executing
    Succeeded,
    Failed,
    Cancelled
};

[[nodiscard]] constexpr std::string_view to_string(ActionStatus status) noexcept {
    switch (status) {
        case ActionStatus::Init:      return "INIT";
        case ActionStatus::Waiting:   return "WAITING";
        case ActionStatus::Running:   return "RUNNING";
        case ActionStatus::Succeeded: return "SUCCEEDED";
        case ActionStatus::Failed:    return "FAILED";
        case ActionStatus::Cancelled: return "CANCELLED";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr bool is_terminal(ActionStatus status) noexcept {
    return status == ActionStatus::Succeeded
        || status == ActionStatus::Failed
        || status == ActionStatus::Cancelled;
}

enum class ActionCause : uint8_t {
    User,          ///< Requested through the API layer
    Derived        ///< Spawned by another action (e.g. deferred node delete)
};

// ─────────────────────────────────────────────
// Cluster / Node Status
// ─────────────────────────────────────────────

enum class ClusterStatus : uint8_t {
    Init,
    Active,
    Warning,
    Error,
    Deleting
};

[[nodiscard]] constexpr std::string_view to_string(ClusterStatus status) noexcept {
    switch (status) {
        case ClusterStatus::Init:     return "INIT";
        case ClusterStatus::Active:   return "ACTIVE";
        case ClusterStatus::Warning:  return "WARNING";
        case ClusterStatus::Error:    return "ERROR";
        case ClusterStatus::Deleting: return "DELETING";
    }
    return "UNKNOWN";
}

enum class NodeStatus : uint8_t {
    Init,
    Creating,
    Active,
    Warning,
    Error,
    Deleting
};

[[nodiscard]] constexpr std::string_view to_string(NodeStatus status) noexcept {
    switch (status) {
        case NodeStatus::Init:     return "INIT";
        case NodeStatus::Creating: return "CREATING";
        case NodeStatus::Active:   return "ACTIVE";
        case NodeStatus::Warning:  return "WARNING";
        case NodeStatus::Error:    return "ERROR";
        case NodeStatus::Deleting: return "DELETING";
    }
    return "UNKNOWN";
}

// ─────────────────────────────────────────────
// Policy Enums
// ─────────────────────────────────────────────

enum class PolicyPhase : uint8_t {
    Pre,
    Post
};

[[nodiscard]] constexpr std::string_view to_string(PolicyPhase phase) noexcept {
    return phase == PolicyPhase::Pre ? "PRE" : "POST";
}

/**
 * @brief Severity of a policy check. Ordered from least to most severe.
 */
enum class CheckStatus : uint8_t {
    Ok,
    Warning,
    Error,
    Critical
};

[[nodiscard]] constexpr std::string_view to_string(CheckStatus status) noexcept {
    switch (status) {
        case CheckStatus::Ok:       return "OK";
        case CheckStatus::Warning:  return "WARNING";
        case CheckStatus::Error:    return "ERROR";
        case CheckStatus::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

/**
 * @brief Per-binding enforcement level applied to a policy's raw result.
 */
enum class EnforcementLevel : uint8_t {
    Ignore,
    Warning,
    Error,
    Critical
};

[[nodiscard]] constexpr std::string_view to_string(EnforcementLevel level) noexcept {
    switch (level) {
        case EnforcementLevel::Ignore:   return "IGNORE";
        case EnforcementLevel::Warning:  return "WARNING";
        case EnforcementLevel::Error:    return "ERROR";
        case EnforcementLevel::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

std::optional<EnforcementLevel> parse_enforcement_level(std::string_view name) noexcept;

}  // namespace cluster_pilot
