/**
 * @file memory_registry.cpp
 * @brief MemoryRegistry implementation.
 * @author Dimitris Kafetzis
 */

#include "registry/memory_registry.hpp"
#include "core/ids.hpp"

#include <algorithm>
#include <format>
#include <mutex>

namespace cluster_pilot {

Cluster MemoryRegistry::materialize(const ClusterRecord& record) const {
    Cluster cluster = record.data;
    cluster.desired_capacity = record.capacity.load(std::memory_order_acquire);
    return cluster;
}

// ── Clusters ─────────────────────────────────

Result<Cluster> MemoryRegistry::create_cluster(ClusterSpec spec) {
    if (spec.min_size < 0) {
        return Error{ErrorCode::InvalidArgument, "min_size must be non-negative"};
    }
    if (spec.max_size != kUnboundedSize && spec.max_size < spec.min_size) {
        return Error{ErrorCode::InvalidArgument, "max_size must not be smaller than min_size"};
    }

    auto record = std::make_unique<ClusterRecord>();
    record->data.id = generate_id("cluster");
    record->data.name = spec.name.empty() ? record->data.id : std::move(spec.name);
    record->data.profile_id = std::move(spec.profile_id);
    record->data.profile_version = spec.profile_version;
    record->data.min_size = spec.min_size;
    record->data.max_size = spec.max_size;
    record->data.status = ClusterStatus::Init;
    record->data.created_at = std::chrono::system_clock::now();
    record->capacity.store(spec.desired_capacity);

    if (!record->data.within_bounds(spec.desired_capacity)) {
        return Error{ErrorCode::CapacityExceeded,
                     std::format("desired_capacity {} outside [{}, {}]", spec.desired_capacity,
                                 spec.min_size, spec.max_size)};
    }

    std::unique_lock lock(mutex_);
    auto cluster = materialize(*record);
    clusters_.emplace(cluster.id, std::move(record));
    return cluster;
}

Result<Cluster> MemoryRegistry::get_cluster(const ClusterId& id) const {
    std::shared_lock lock(mutex_);
    auto it = clusters_.find(id);
    if (it == clusters_.end()) {
        return Error{ErrorCode::NotFound, "Cluster not found: " + id};
    }
    return materialize(*it->second);
}

Result<void> MemoryRegistry::delete_cluster(const ClusterId& id) {
    std::unique_lock lock(mutex_);
    auto it = clusters_.find(id);
    if (it == clusters_.end()) {
        return Error{ErrorCode::NotFound, "Cluster not found: " + id};
    }
    if (!it->second->data.nodes.empty()) {
        return Error{ErrorCode::InvalidState,
                     std::format("Cluster {} still has {} nodes", id, it->second->data.nodes.size())};
    }
    clusters_.erase(it);
    return {};
}

Result<void> MemoryRegistry::update_cluster_status(const ClusterId& id, ClusterStatus status,
                                                   std::string reason) {
    std::unique_lock lock(mutex_);
    auto it = clusters_.find(id);
    if (it == clusters_.end()) {
        return Error{ErrorCode::NotFound, "Cluster not found: " + id};
    }
    it->second->data.status = status;
    it->second->data.status_reason = std::move(reason);
    return {};
}

Result<int64_t> MemoryRegistry::update_cluster_capacity(const ClusterId& id, int64_t delta) {
    std::shared_lock lock(mutex_);
    auto it = clusters_.find(id);
    if (it == clusters_.end()) {
        return Error{ErrorCode::NotFound, "Cluster not found: " + id};
    }

    auto& capacity = it->second->capacity;
    int64_t current = capacity.load(std::memory_order_acquire);
    int64_t next = 0;
    do {
        next = current + delta;
        if (next < 0) {
            return Error{ErrorCode::InvalidArgument,
                         std::format("Capacity of {} cannot drop below zero ({} {:+})",
                                     id, current, delta)};
        }
    } while (!capacity.compare_exchange_weak(current, next,
                                             std::memory_order_acq_rel,
                                             std::memory_order_acquire));
    return next;
}

Result<void> MemoryRegistry::update_cluster_profile(const ClusterId& id, std::string profile_id,
                                                    int64_t profile_version) {
    if (profile_id.empty()) {
        return Error{ErrorCode::InvalidArgument, "profile_id must not be empty"};
    }
    std::unique_lock lock(mutex_);
    auto it = clusters_.find(id);
    if (it == clusters_.end()) {
        return Error{ErrorCode::NotFound, "Cluster not found: " + id};
    }
    it->second->data.profile_id = std::move(profile_id);
    it->second->data.profile_version = profile_version;
    return {};
}

// ── Nodes ────────────────────────────────────

Result<Node> MemoryRegistry::create_node(NodeSpec spec) {
    std::unique_lock lock(mutex_);

    Node node;
    node.id = generate_id("node");
    node.profile_id = std::move(spec.profile_id);
    node.profile_version = spec.profile_version;
    node.status = spec.status;
    node.created_at = spec.created_at.value_or(std::chrono::system_clock::now());

    if (!spec.cluster_id.empty()) {
        auto it = clusters_.find(spec.cluster_id);
        if (it == clusters_.end()) {
            return Error{ErrorCode::NotFound, "Cluster not found: " + spec.cluster_id};
        }
        auto& record = *it->second;
        node.cluster_id = spec.cluster_id;
        node.index = record.next_index++;
        if (node.profile_id.empty()) {
            node.profile_id = record.data.profile_id;
            node.profile_version = record.data.profile_version;
        }
        record.data.nodes.push_back(node.id);
    }

    node.name = spec.name.empty()
        ? std::format("node-{}-{:03}", node.cluster_id.empty()
                          ? std::string{"orphan"}
                          : node.cluster_id.substr(0, std::min<size_t>(node.cluster_id.size(), 16)),
                      node.index)
        : std::move(spec.name);

    nodes_.emplace(node.id, node);
    return node;
}

Result<Node> MemoryRegistry::get_node(const NodeId& id) const {
    std::shared_lock lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return Error{ErrorCode::NotFound, "Node not found: " + id};
    }
    return it->second;
}

std::vector<Node> MemoryRegistry::list_nodes(const ClusterId& cluster_id) const {
    std::shared_lock lock(mutex_);
    std::vector<Node> result;
    auto it = clusters_.find(cluster_id);
    if (it == clusters_.end()) return result;

    result.reserve(it->second->data.nodes.size());
    for (const auto& node_id : it->second->data.nodes) {
        auto node_it = nodes_.find(node_id);
        if (node_it != nodes_.end()) result.push_back(node_it->second);
    }
    std::sort(result.begin(), result.end(),
              [](const Node& a, const Node& b) { return a.index < b.index; });
    return result;
}

Result<void> MemoryRegistry::update_node_status(const NodeId& id, NodeStatus status,
                                                std::string reason) {
    std::unique_lock lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return Error{ErrorCode::NotFound, "Node not found: " + id};
    }
    it->second.status = status;
    it->second.status_reason = std::move(reason);
    return {};
}

Result<void> MemoryRegistry::update_node_profile(const NodeId& id, std::string profile_id,
                                                 int64_t profile_version) {
    if (profile_id.empty()) {
        return Error{ErrorCode::InvalidArgument, "profile_id must not be empty"};
    }
    std::unique_lock lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return Error{ErrorCode::NotFound, "Node not found: " + id};
    }
    it->second.profile_id = std::move(profile_id);
    it->second.profile_version = profile_version;
    return {};
}

Result<void> MemoryRegistry::set_node_cluster(const NodeId& id, const ClusterId& cluster_id) {
    std::unique_lock lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return Error{ErrorCode::NotFound, "Node not found: " + id};
    }
    auto& node = it->second;
    if (node.cluster_id == cluster_id) return {};

    ClusterRecord* target = nullptr;
    if (!cluster_id.empty()) {
        auto cit = clusters_.find(cluster_id);
        if (cit == clusters_.end()) {
            return Error{ErrorCode::NotFound, "Cluster not found: " + cluster_id};
        }
        target = cit->second.get();
    }

    if (!node.cluster_id.empty()) {
        if (auto old = clusters_.find(node.cluster_id); old != clusters_.end()) {
            auto& members = old->second->data.nodes;
            members.erase(std::remove(members.begin(), members.end(), id), members.end());
        }
    }

    node.cluster_id = cluster_id;
    if (target != nullptr) {
        node.index = target->next_index++;
        target->data.nodes.push_back(id);
    } else {
        node.index = 0;
    }
    return {};
}

Result<void> MemoryRegistry::delete_node(const NodeId& id) {
    std::unique_lock lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return Error{ErrorCode::NotFound, "Node not found: " + id};
    }
    if (!it->second.cluster_id.empty()) {
        if (auto cit = clusters_.find(it->second.cluster_id); cit != clusters_.end()) {
            auto& members = cit->second->data.nodes;
            members.erase(std::remove(members.begin(), members.end(), id), members.end());
        }
    }
    nodes_.erase(it);
    return {};
}

// ── Bindings ─────────────────────────────────

Result<void> MemoryRegistry::put_binding(PolicyBinding binding) {
    std::unique_lock lock(mutex_);
    auto it = clusters_.find(binding.cluster_id);
    if (it == clusters_.end()) {
        return Error{ErrorCode::NotFound, "Cluster not found: " + binding.cluster_id};
    }
    auto& record = *it->second;
    auto& bindings = record.data.bindings;

    auto existing = std::find_if(bindings.begin(), bindings.end(), [&](const PolicyBinding& b) {
        return b.policy_id == binding.policy_id;
    });
    if (existing != bindings.end()) {
        binding.sequence = existing->sequence;
        *existing = std::move(binding);
    } else {
        binding.sequence = record.next_binding_sequence++;
        bindings.push_back(std::move(binding));
    }
    std::sort(bindings.begin(), bindings.end(), binding_before);
    return {};
}

Result<void> MemoryRegistry::remove_binding(const ClusterId& cluster_id, const PolicyId& policy_id) {
    std::unique_lock lock(mutex_);
    auto it = clusters_.find(cluster_id);
    if (it == clusters_.end()) {
        return Error{ErrorCode::NotFound, "Cluster not found: " + cluster_id};
    }
    auto& bindings = it->second->data.bindings;
    auto pos = std::find_if(bindings.begin(), bindings.end(), [&](const PolicyBinding& b) {
        return b.policy_id == policy_id;
    });
    if (pos == bindings.end()) {
        return Error{ErrorCode::NotFound,
                     std::format("Policy {} is not attached to cluster {}", policy_id, cluster_id)};
    }
    bindings.erase(pos);
    return {};
}

std::vector<ClusterId> MemoryRegistry::clusters_bound_to(const PolicyId& policy_id) const {
    std::shared_lock lock(mutex_);
    std::vector<ClusterId> result;
    for (const auto& [id, record] : clusters_) {
        for (const auto& b : record->data.bindings) {
            if (b.policy_id == policy_id) {
                result.push_back(id);
                break;
            }
        }
    }
    return result;
}

size_t MemoryRegistry::cluster_count() const {
    std::shared_lock lock(mutex_);
    return clusters_.size();
}

size_t MemoryRegistry::node_count() const {
    std::shared_lock lock(mutex_);
    return nodes_.size();
}

}  // namespace cluster_pilot
