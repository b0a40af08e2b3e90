/**
 * @file cluster.hpp
 * @brief Cluster, Node and PolicyBinding records.
 * @author Dimitris Kafetzis
 *
 * These are plain snapshots handed out by the Target Registry. Mutation goes
 * through the registry so that concurrent writers stay consistent.
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace cluster_pilot {

/// max_size value meaning "no upper bound".
inline constexpr int64_t kUnboundedSize = -1;

/**
 * @brief Association of a policy with a cluster.
 */
struct PolicyBinding {
    ClusterId cluster_id;
    PolicyId policy_id;
    std::string policy_type;
    EnforcementLevel level = EnforcementLevel::Critical;
    bool enabled = true;
    int32_t priority = 50;          ///< Lower runs first
    uint64_t sequence = 0;          ///< Attach order, breaks priority ties
};

/// Strict ordering used by the Policy Engine.
[[nodiscard]] inline bool binding_before(const PolicyBinding& a, const PolicyBinding& b) noexcept {
    if (a.priority != b.priority) return a.priority < b.priority;
    return a.sequence < b.sequence;
}

struct Cluster {
    ClusterId id;
    std::string name;
    std::string profile_id;
    int64_t profile_version = 0;    ///< Bumped by every CLUSTER_UPDATE; new members are built from it
    int64_t desired_capacity = 0;
    int64_t min_size = 0;
    int64_t max_size = kUnboundedSize;
    ClusterStatus status = ClusterStatus::Init;
    std::string status_reason;
    std::vector<PolicyBinding> bindings;   ///< Sorted by binding_before
    std::vector<NodeId> nodes;
    Timestamp created_at;

    [[nodiscard]] size_t size() const noexcept { return nodes.size(); }

    /// Whether a desired capacity lies within [min_size, max_size].
    [[nodiscard]] bool within_bounds(int64_t capacity) const noexcept {
        if (capacity < min_size) return false;
        if (max_size != kUnboundedSize && capacity > max_size) return false;
        return true;
    }
};

struct Node {
    NodeId id;
    std::string name;
    ClusterId cluster_id;           ///< Empty for orphan nodes
    std::string profile_id;
    int64_t profile_version = 0;    ///< Index of the profile version the node was built from
    int64_t index = 0;              ///< Ordinal within the owning cluster
    NodeStatus status = NodeStatus::Init;
    std::string status_reason;
    Timestamp created_at;

    [[nodiscard]] bool is_orphan() const noexcept { return cluster_id.empty(); }
};

}  // namespace cluster_pilot
