/**
 * @file test_memory_registry.cpp
 * @brief Unit tests for the in-memory target registry.
 * @author Dimitris Kafetzis
 */

#include "registry/memory_registry.hpp"

#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace cluster_pilot;

class MemoryRegistryTest : public ::testing::Test {
protected:
    MemoryRegistry registry_;

    ClusterId make_cluster(int64_t desired = 0, int64_t min_size = 0,
                           int64_t max_size = kUnboundedSize) {
        auto cluster = registry_.create_cluster(ClusterSpec{
            .name = "c", .profile_id = "p1", .desired_capacity = desired,
            .min_size = min_size, .max_size = max_size});
        EXPECT_TRUE(cluster.has_value());
        return cluster->id;
    }
};

TEST_F(MemoryRegistryTest, CreateAndGetCluster) {
    auto id = make_cluster(3, 1, 5);
    auto cluster = registry_.get_cluster(id);
    ASSERT_TRUE(cluster.has_value());
    EXPECT_EQ(cluster->desired_capacity, 3);
    EXPECT_EQ(cluster->status, ClusterStatus::Init);
    EXPECT_EQ(cluster->min_size, 1);
    EXPECT_EQ(cluster->max_size, 5);
}

TEST_F(MemoryRegistryTest, RejectsCapacityOutsideBounds) {
    auto cluster = registry_.create_cluster(ClusterSpec{
        .name = "c", .profile_id = "p", .desired_capacity = 9, .min_size = 0, .max_size = 4});
    ASSERT_FALSE(cluster.has_value());
    EXPECT_EQ(cluster.error().code, ErrorCode::CapacityExceeded);

    auto inverted = registry_.create_cluster(ClusterSpec{
        .name = "c", .profile_id = "p", .desired_capacity = 0, .min_size = 3, .max_size = 1});
    EXPECT_EQ(inverted.error().code, ErrorCode::InvalidArgument);
}

TEST_F(MemoryRegistryTest, MissingTargetsAreNotFound) {
    EXPECT_EQ(registry_.get_cluster("nope").error().code, ErrorCode::NotFound);
    EXPECT_EQ(registry_.get_node("nope").error().code, ErrorCode::NotFound);
    EXPECT_EQ(registry_.update_cluster_capacity("nope", 1).error().code, ErrorCode::NotFound);
    EXPECT_TRUE(registry_.list_nodes("nope").empty());
}

TEST_F(MemoryRegistryTest, NodesJoinClusterInIndexOrder) {
    auto cluster_id = make_cluster();
    auto a = registry_.create_node(NodeSpec{.cluster_id = cluster_id});
    auto b = registry_.create_node(NodeSpec{.cluster_id = cluster_id});
    ASSERT_TRUE(a.has_value() && b.has_value());
    EXPECT_EQ(a->index, 1);
    EXPECT_EQ(b->index, 2);
    EXPECT_EQ(a->profile_id, "p1");   // inherited from the cluster

    auto nodes = registry_.list_nodes(cluster_id);
    ASSERT_EQ(nodes.size(), 2u);
    EXPECT_EQ(nodes[0].id, a->id);
    EXPECT_EQ(registry_.get_cluster(cluster_id)->size(), 2u);
}

TEST_F(MemoryRegistryTest, MoveNodeBetweenClusters) {
    auto first = make_cluster();
    auto second = make_cluster();
    auto node = registry_.create_node(NodeSpec{.cluster_id = first});
    ASSERT_TRUE(node.has_value());

    ASSERT_TRUE(registry_.set_node_cluster(node->id, second).has_value());
    EXPECT_TRUE(registry_.list_nodes(first).empty());
    EXPECT_EQ(registry_.list_nodes(second).size(), 1u);

    ASSERT_TRUE(registry_.set_node_cluster(node->id, "").has_value());
    EXPECT_TRUE(registry_.get_node(node->id)->is_orphan());
    EXPECT_TRUE(registry_.list_nodes(second).empty());
}

TEST_F(MemoryRegistryTest, DeleteClusterRequiresNoMembers) {
    auto id = make_cluster();
    auto node = registry_.create_node(NodeSpec{.cluster_id = id});
    EXPECT_EQ(registry_.delete_cluster(id).error().code, ErrorCode::InvalidState);

    ASSERT_TRUE(registry_.delete_node(node->id).has_value());
    EXPECT_TRUE(registry_.delete_cluster(id).has_value());
    EXPECT_EQ(registry_.cluster_count(), 0u);
    EXPECT_EQ(registry_.node_count(), 0u);
}

TEST_F(MemoryRegistryTest, ProfileUpdatesApplyToLaterMembers) {
    auto cluster_id = make_cluster();
    auto before = registry_.create_node(NodeSpec{.cluster_id = cluster_id});
    ASSERT_TRUE(before.has_value());

    ASSERT_TRUE(registry_.update_cluster_profile(cluster_id, "p2", 5).has_value());
    auto after = registry_.create_node(NodeSpec{.cluster_id = cluster_id});
    ASSERT_TRUE(after.has_value());

    EXPECT_EQ(registry_.get_cluster(cluster_id)->profile_version, 5);
    EXPECT_EQ(after->profile_id, "p2");
    EXPECT_EQ(after->profile_version, 5);
    EXPECT_EQ(registry_.get_node(before->id)->profile_id, "p1");
    EXPECT_EQ(registry_.get_node(before->id)->profile_version, 0);

    ASSERT_TRUE(registry_.update_node_profile(before->id, "p2", 5).has_value());
    EXPECT_EQ(registry_.get_node(before->id)->profile_version, 5);
}

TEST_F(MemoryRegistryTest, ProfileUpdateRejectsEmptyProfileAndMissingTarget) {
    auto cluster_id = make_cluster();
    EXPECT_EQ(registry_.update_cluster_profile(cluster_id, "", 1).error().code,
              ErrorCode::InvalidArgument);
    EXPECT_EQ(registry_.update_cluster_profile("nope", "p1", 1).error().code,
              ErrorCode::NotFound);
    EXPECT_EQ(registry_.update_node_profile("nope", "p1", 1).error().code, ErrorCode::NotFound);
    EXPECT_EQ(registry_.get_cluster(cluster_id)->profile_id, "p1");
}

TEST_F(MemoryRegistryTest, CapacityCannotGoNegative) {
    auto id = make_cluster(1);
    EXPECT_EQ(*registry_.update_cluster_capacity(id, -1), 0);
    auto below = registry_.update_cluster_capacity(id, -1);
    ASSERT_FALSE(below.has_value());
    EXPECT_EQ(below.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(registry_.get_cluster(id)->desired_capacity, 0);
}

TEST_F(MemoryRegistryTest, ConcurrentCapacityUpdatesLoseNothing) {
    auto id = make_cluster(1000);
    constexpr int kThreads = 8;
    constexpr int kPerThread = 100;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i) {
                auto r = registry_.update_cluster_capacity(id, t % 2 == 0 ? -1 : +2);
                EXPECT_TRUE(r.has_value());
            }
        });
    }
    for (auto& t : threads) t.join();

    // 4 threads × 100 × (−1) + 4 threads × 100 × (+2)
    EXPECT_EQ(registry_.get_cluster(id)->desired_capacity, 1000 - 400 + 800);
}

TEST_F(MemoryRegistryTest, BindingsOrderedByPriorityThenAttachOrder) {
    auto id = make_cluster();
    ASSERT_TRUE(registry_.put_binding(PolicyBinding{.cluster_id = id, .policy_id = "late",
                                                    .priority = 50}).has_value());
    ASSERT_TRUE(registry_.put_binding(PolicyBinding{.cluster_id = id, .policy_id = "early",
                                                    .priority = 10}).has_value());
    ASSERT_TRUE(registry_.put_binding(PolicyBinding{.cluster_id = id, .policy_id = "tie",
                                                    .priority = 50}).has_value());

    auto bindings = registry_.get_cluster(id)->bindings;
    ASSERT_EQ(bindings.size(), 3u);
    EXPECT_EQ(bindings[0].policy_id, "early");
    EXPECT_EQ(bindings[1].policy_id, "late");
    EXPECT_EQ(bindings[2].policy_id, "tie");

    // Replacing keeps the original attach sequence.
    ASSERT_TRUE(registry_.put_binding(PolicyBinding{.cluster_id = id, .policy_id = "late",
                                                    .enabled = false, .priority = 50})
                    .has_value());
    bindings = registry_.get_cluster(id)->bindings;
    ASSERT_EQ(bindings.size(), 3u);
    EXPECT_EQ(bindings[1].policy_id, "late");
    EXPECT_FALSE(bindings[1].enabled);

    EXPECT_EQ(registry_.clusters_bound_to("tie"), std::vector<ClusterId>{id});
    ASSERT_TRUE(registry_.remove_binding(id, "tie").has_value());
    EXPECT_EQ(registry_.remove_binding(id, "tie").error().code, ErrorCode::NotFound);
}
