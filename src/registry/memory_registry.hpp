/**
 * @file memory_registry.hpp
 * @brief In-process ITargetRegistry used by tests, the demo and single-node deployments.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "registry/target_registry.hpp"

#include <atomic>
#include <memory>
#include <shared_mutex>
#include <unordered_map>

namespace cluster_pilot {

/**
 * @brief Thread-safe in-memory registry.
 *
 * Structural changes (create/delete, membership, bindings) take the exclusive
 * lock. Capacity updates take the shared lock and apply a compare-and-swap on
 * the cluster's atomic counter, so concurrent scale actions never serialize on
 * the registry and never lose updates.
 */
class MemoryRegistry : public ITargetRegistry {
public:
    Result<Cluster> create_cluster(ClusterSpec spec) override;
    [[nodiscard]] Result<Cluster> get_cluster(const ClusterId& id) const override;
    Result<void> delete_cluster(const ClusterId& id) override;
    Result<void> update_cluster_status(const ClusterId& id, ClusterStatus status,
                                       std::string reason) override;
    Result<int64_t> update_cluster_capacity(const ClusterId& id, int64_t delta) override;
    Result<void> update_cluster_profile(const ClusterId& id, std::string profile_id,
                                        int64_t profile_version) override;

    Result<Node> create_node(NodeSpec spec) override;
    [[nodiscard]] Result<Node> get_node(const NodeId& id) const override;
    [[nodiscard]] std::vector<Node> list_nodes(const ClusterId& cluster_id) const override;
    Result<void> update_node_status(const NodeId& id, NodeStatus status,
                                    std::string reason = {}) override;
    Result<void> update_node_profile(const NodeId& id, std::string profile_id,
                                     int64_t profile_version) override;
    Result<void> set_node_cluster(const NodeId& id, const ClusterId& cluster_id) override;
    Result<void> delete_node(const NodeId& id) override;

    Result<void> put_binding(PolicyBinding binding) override;
    Result<void> remove_binding(const ClusterId& cluster_id, const PolicyId& policy_id) override;
    [[nodiscard]] std::vector<ClusterId> clusters_bound_to(const PolicyId& policy_id) const override;

    [[nodiscard]] size_t cluster_count() const;
    [[nodiscard]] size_t node_count() const;

private:
    struct ClusterRecord {
        Cluster data;                          ///< desired_capacity lives in `capacity`
        std::atomic<int64_t> capacity{0};
        int64_t next_index = 1;
        uint64_t next_binding_sequence = 1;
    };

    Cluster materialize(const ClusterRecord& record) const;

    mutable std::shared_mutex mutex_;
    std::unordered_map<ClusterId, std::unique_ptr<ClusterRecord>> clusters_;
    std::unordered_map<NodeId, Node> nodes_;
};

}  // namespace cluster_pilot
