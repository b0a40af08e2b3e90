/**
 * @file target_registry.hpp
 * @brief Repository-style contract for cluster and node state.
 * @author Dimitris Kafetzis
 *
 * The engine never talks to a store directly; it goes through ITargetRegistry.
 * Implementations must make update_cluster_capacity() atomic with respect to
 * concurrent callers (no lost updates).
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "model/cluster.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cluster_pilot {

struct ClusterSpec {
    std::string name;
    std::string profile_id;
    int64_t profile_version = 0;
    int64_t desired_capacity = 0;
    int64_t min_size = 0;
    int64_t max_size = kUnboundedSize;
};

struct NodeSpec {
    std::string name;
    ClusterId cluster_id;                     ///< Empty creates an orphan node
    std::string profile_id;
    int64_t profile_version = 0;
    NodeStatus status = NodeStatus::Init;
    std::optional<Timestamp> created_at;      ///< Defaults to now
};

/**
 * @brief Abstract interface for target state (runtime polymorphism).
 *
 * Virtual dispatch: the backing store is chosen once at startup.
 */
class ITargetRegistry {
public:
    virtual ~ITargetRegistry() = default;

    // ── Clusters ─────────────────────────────
    virtual Result<Cluster> create_cluster(ClusterSpec spec) = 0;
    [[nodiscard]] virtual Result<Cluster> get_cluster(const ClusterId& id) const = 0;
    virtual Result<void> delete_cluster(const ClusterId& id) = 0;
    virtual Result<void> update_cluster_status(const ClusterId& id, ClusterStatus status,
                                               std::string reason) = 0;

    /**
     * @brief Atomically add delta to desired_capacity; returns the new value.
     *
     * Fails with InvalidArgument if the result would be negative.
     */
    virtual Result<int64_t> update_cluster_capacity(const ClusterId& id, int64_t delta) = 0;

    /// Profile that members created from now on are built from.
    virtual Result<void> update_cluster_profile(const ClusterId& id, std::string profile_id,
                                                int64_t profile_version) = 0;

    // ── Nodes ────────────────────────────────
    virtual Result<Node> create_node(NodeSpec spec) = 0;
    [[nodiscard]] virtual Result<Node> get_node(const NodeId& id) const = 0;
    [[nodiscard]] virtual std::vector<Node> list_nodes(const ClusterId& cluster_id) const = 0;
    virtual Result<void> update_node_status(const NodeId& id, NodeStatus status,
                                            std::string reason = {}) = 0;

    virtual Result<void> update_node_profile(const NodeId& id, std::string profile_id,
                                             int64_t profile_version) = 0;

    /// Move a node into a cluster, or out of any cluster when cluster_id is empty.
    virtual Result<void> set_node_cluster(const NodeId& id, const ClusterId& cluster_id) = 0;
    virtual Result<void> delete_node(const NodeId& id) = 0;

    // ── Policy bindings ──────────────────────

    /// Insert a binding, or replace the existing binding for the same policy.
    virtual Result<void> put_binding(PolicyBinding binding) = 0;
    virtual Result<void> remove_binding(const ClusterId& cluster_id, const PolicyId& policy_id) = 0;
    [[nodiscard]] virtual std::vector<ClusterId> clusters_bound_to(const PolicyId& policy_id) const = 0;
};

}  // namespace cluster_pilot
