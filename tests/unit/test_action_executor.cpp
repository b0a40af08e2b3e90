/**
 * @file test_action_executor.cpp
 * @brief Unit tests for action bodies, driven without the dispatcher.
 * @author Dimitris Kafetzis
 */

#include "driver/simulated_driver.hpp"
#include "engine/action_executor.hpp"
#include "model/action_keys.hpp"
#include "policy/policy_spec.hpp"
#include "registry/memory_registry.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace cluster_pilot;
using namespace std::chrono_literals;

namespace {

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 3s) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(2ms);
    }
    return pred();
}

}  // namespace

class ActionExecutorTest : public ::testing::Test {
protected:
    Logger logger_{std::make_unique<NullSink>()};
    MemoryRegistry registry_;
    ActionLockManager locks_{logger_};
    SimulatedDriver driver_;
    PolicyEngine policies_{registry_, logger_};
    DeferredScheduler deferred_{logger_};
    ActionExecutor executor_{registry_, locks_, driver_, policies_, deferred_, logger_,
                             LockRetry{8, 2ms, 20ms}};

    void TearDown() override { deferred_.shutdown(); }

    /// Create a cluster record and build its members through CLUSTER_CREATE.
    ClusterId make_cluster(int64_t desired, int64_t min_size = 0, int64_t max_size = 10) {
        auto cluster = registry_.create_cluster(ClusterSpec{
            .name = "c1", .profile_id = "p1", .desired_capacity = desired,
            .min_size = min_size, .max_size = max_size});
        EXPECT_TRUE(cluster.has_value());
        auto action = Action::create(ActionType::ClusterCreate, cluster->id);
        EXPECT_TRUE(executor_.execute(action).ok());
        driver_.reset_calls();
        return cluster->id;
    }

    int64_t desired(const ClusterId& id) const {
        return registry_.get_cluster(id)->desired_capacity;
    }

    size_t members(const ClusterId& id) const {
        return registry_.list_nodes(id).size();
    }
};

// ─────────────────────────────────────────────
// Creation and scale-out
// ─────────────────────────────────────────────

TEST_F(ActionExecutorTest, ClusterCreateBuildsMissingNodes) {
    auto id = make_cluster(3);

    auto cluster = registry_.get_cluster(id);
    ASSERT_TRUE(cluster.has_value());
    EXPECT_EQ(cluster->status, ClusterStatus::Active);
    EXPECT_EQ(cluster->desired_capacity, 3);
    ASSERT_EQ(members(id), 3u);
    for (const auto& node : registry_.list_nodes(id)) {
        EXPECT_EQ(node.status, NodeStatus::Active);
        EXPECT_EQ(node.profile_id, "p1");
    }
    EXPECT_EQ(locks_.lock_count(), 0u);
}

TEST_F(ActionExecutorTest, ClusterCreateReportsDriverFailure) {
    auto cluster = registry_.create_cluster(ClusterSpec{
        .name = "c1", .profile_id = "p1", .desired_capacity = 2});
    ASSERT_TRUE(cluster.has_value());
    driver_.fail_next(ActionType::NodeCreate);

    auto action = Action::create(ActionType::ClusterCreate, cluster->id);
    auto outcome = executor_.execute(action);

    EXPECT_EQ(outcome.status, ActionStatus::Failed);
    EXPECT_EQ(outcome.reason.code, ErrorCode::DriverError);
    EXPECT_EQ(registry_.get_cluster(cluster->id)->status, ClusterStatus::Error);
    EXPECT_EQ(action->outputs().get_list(keys::kNodesFailed)->size(), 1u);
}

TEST_F(ActionExecutorTest, ClusterCreateRejectsOutOfBoundsCapacity) {
    auto cluster = registry_.create_cluster(ClusterSpec{
        .name = "c1", .profile_id = "p1", .desired_capacity = 1, .min_size = 2, .max_size = 4});
    ASSERT_TRUE(cluster.has_value());

    auto action = Action::create(ActionType::ClusterCreate, cluster->id);
    auto outcome = executor_.execute(action);

    EXPECT_EQ(outcome.reason.code, ErrorCode::CapacityExceeded);
    EXPECT_EQ(driver_.call_count(), 0u);
}

TEST_F(ActionExecutorTest, ScaleOutRaisesCapacity) {
    auto id = make_cluster(2);

    auto action = Action::create(ActionType::ClusterScaleOut, id,
                                 Params{{keys::kCount, int64_t{2}}});
    ASSERT_TRUE(executor_.execute(action).ok());

    EXPECT_EQ(desired(id), 4);
    EXPECT_EQ(members(id), 4u);
    EXPECT_EQ(driver_.call_count(ActionType::NodeCreate), 2u);
    EXPECT_EQ(action->outputs().get_int(keys::kDesiredCapacity), 4);
}

TEST_F(ActionExecutorTest, ScaleOutBeyondMaxSizeFails) {
    auto id = make_cluster(3, 0, 4);

    auto action = Action::create(ActionType::ClusterScaleOut, id,
                                 Params{{keys::kCount, int64_t{2}}});
    auto outcome = executor_.execute(action);

    EXPECT_EQ(outcome.reason.code, ErrorCode::CapacityExceeded);
    EXPECT_EQ(desired(id), 3);
    EXPECT_EQ(driver_.call_count(), 0u);
}

TEST_F(ActionExecutorTest, ScaleOutRejectsNegativeCount) {
    auto id = make_cluster(1);
    auto action = Action::create(ActionType::ClusterScaleOut, id,
                                 Params{{keys::kCount, int64_t{-1}}});
    EXPECT_EQ(executor_.execute(action).reason.code, ErrorCode::InvalidArgument);
}

// ─────────────────────────────────────────────
// Scale-in and deletion
// ─────────────────────────────────────────────

TEST_F(ActionExecutorTest, ScaleInWithoutPolicyRemovesAndReduces) {
    auto id = make_cluster(4);

    auto action = Action::create(ActionType::ClusterScaleIn, id,
                                 Params{{keys::kCount, int64_t{1}}});
    ASSERT_TRUE(executor_.execute(action).ok());

    EXPECT_EQ(action->outputs().get_int(keys::kDeletionRemoved), 1);
    EXPECT_EQ(members(id), 3u);
    EXPECT_EQ(desired(id), 3);
    EXPECT_EQ(driver_.call_count(ActionType::NodeDelete), 1u);
    EXPECT_EQ(registry_.node_count(), 3u);
}

TEST_F(ActionExecutorTest, ScaleInBelowMinSizeFails) {
    auto id = make_cluster(2, 2);

    auto action = Action::create(ActionType::ClusterScaleIn, id,
                                 Params{{keys::kCount, int64_t{1}}});
    auto outcome = executor_.execute(action);

    EXPECT_EQ(outcome.reason.code, ErrorCode::CapacityExceeded);
    EXPECT_EQ(members(id), 2u);
}

TEST_F(ActionExecutorTest, ScaleInWithPolicyCandidatesLeavesCapacityToPolicy) {
    auto id = make_cluster(3);
    const auto victim = registry_.list_nodes(id).front().id;

    auto action = Action::create(ActionType::ClusterScaleIn, id, Params{
        {keys::kDeletionCandidates, StringList{victim}},
        {keys::kDeletionDestroy, false},
        {keys::kDeletionGracePeriod, int64_t{0}}
    });
    ASSERT_TRUE(executor_.execute(action).ok());

    // Without destroy the node survives as an orphan.
    auto node = registry_.get_node(victim);
    ASSERT_TRUE(node.has_value());
    EXPECT_TRUE(node->is_orphan());
    EXPECT_EQ(node->status, NodeStatus::Active);
    EXPECT_EQ(driver_.call_count(ActionType::NodeDelete), 0u);
    EXPECT_EQ(members(id), 2u);
    EXPECT_EQ(desired(id), 3);
}

TEST_F(ActionExecutorTest, DeletionDriverFailureMarksNodeError) {
    auto id = make_cluster(2);
    const auto victim = registry_.list_nodes(id).front().id;
    driver_.fail_target(victim, ActionType::NodeDelete);

    auto action = Action::create(ActionType::ClusterDelNodes, id, Params{
        {keys::kNodes, StringList{victim}},
        {keys::kDeletionDestroy, true}
    });
    auto outcome = executor_.execute(action);

    EXPECT_EQ(outcome.status, ActionStatus::Failed);
    EXPECT_EQ(outcome.reason.code, ErrorCode::DriverError);
    EXPECT_EQ(registry_.get_node(victim)->status, NodeStatus::Error);
    EXPECT_EQ(desired(id), 2);
}

TEST_F(ActionExecutorTest, CancelDuringDeletionRestoresNode) {
    auto id = make_cluster(2);
    const auto victim = registry_.list_nodes(id).front().id;

    auto action = Action::create(ActionType::ClusterDelNodes, id, Params{
        {keys::kNodes, StringList{victim}},
        {keys::kDeletionDestroy, true}
    });
    driver_.on_call([action](const Action&) { action->request_cancel(); });

    auto outcome = executor_.execute(action);

    EXPECT_EQ(outcome.status, ActionStatus::Cancelled);
    auto node = registry_.get_node(victim);
    ASSERT_TRUE(node.has_value());
    EXPECT_EQ(node->status, NodeStatus::Active);
    EXPECT_EQ(desired(id), 2);
    EXPECT_EQ(locks_.lock_count(), 0u);
}

TEST_F(ActionExecutorTest, GracePeriodWithoutSubmitterFails) {
    auto id = make_cluster(2);
    auto action = Action::create(ActionType::ClusterScaleIn, id, Params{
        {keys::kDeletionCandidates, StringList{registry_.list_nodes(id).front().id}},
        {keys::kDeletionGracePeriod, int64_t{30}}
    });
    EXPECT_EQ(executor_.execute(action).reason.code, ErrorCode::InvalidState);
}

TEST_F(ActionExecutorTest, GracePeriodSchedulesDeferredDeletions) {
    std::mutex mutex;
    std::vector<ActionPtr> submitted;
    executor_.set_submitter([&](ActionPtr child) -> Result<ActionId> {
        std::lock_guard lock(mutex);
        submitted.push_back(child);
        return child->id();
    });

    auto id = make_cluster(3);
    const auto nodes = registry_.list_nodes(id);
    auto action = Action::create(ActionType::ClusterScaleIn, id, Params{
        {keys::kDeletionCandidates, StringList{nodes[0].id, nodes[1].id}},
        {keys::kDeletionGracePeriod, int64_t{1}},
        {keys::kDeletionReduceCapacity, true}
    });
    ASSERT_TRUE(executor_.execute(action).ok());

    EXPECT_EQ(action->outputs().get_int(keys::kDeletionRemoved), 0);
    EXPECT_EQ(action->outputs().get_list(keys::kDeferredScheduled)->size(), 2u);
    EXPECT_EQ(registry_.get_node(nodes[0].id)->status, NodeStatus::Deleting);
    EXPECT_EQ(driver_.call_count(), 0u);

    ASSERT_TRUE(eventually([&] {
        std::lock_guard lock(mutex);
        return submitted.size() == 2;
    }));
    std::lock_guard lock(mutex);
    for (const auto& child : submitted) {
        EXPECT_EQ(child->type(), ActionType::NodeDelete);
        EXPECT_EQ(child->parent_id(), action->id());
        EXPECT_EQ(child->inputs().get_bool(keys::kDeletionDeferred), true);
        EXPECT_EQ(child->inputs().get_bool(keys::kDeletionReduceCapacity), true);
    }
}

TEST_F(ActionExecutorTest, CancellingParentRestoresDeferredNodes) {
    std::atomic<int> submitted{0};
    executor_.set_submitter([&](ActionPtr child) -> Result<ActionId> {
        submitted.fetch_add(1);
        return child->id();
    });

    auto id = make_cluster(2);
    const auto victim = registry_.list_nodes(id).front().id;
    auto action = Action::create(ActionType::ClusterScaleIn, id, Params{
        {keys::kDeletionCandidates, StringList{victim}},
        {keys::kDeletionGracePeriod, int64_t{60}}
    });
    ASSERT_TRUE(executor_.execute(action).ok());
    ASSERT_EQ(deferred_.pending_for(action->id()), 1u);

    action->request_cancel();

    ASSERT_TRUE(eventually([&] {
        return registry_.get_node(victim)->status == NodeStatus::Active;
    }));
    EXPECT_TRUE(eventually([&] {
        return action->outputs().get_list(keys::kDeferredCancelled).has_value();
    }));
    EXPECT_EQ(submitted.load(), 0);
    EXPECT_EQ(deferred_.pending_count(), 0u);
    EXPECT_EQ(members(id), 2u);
}

TEST_F(ActionExecutorTest, NodeDeleteRemovesAndReportsOne) {
    auto id = make_cluster(2);
    const auto victim = registry_.list_nodes(id).front().id;

    auto action = Action::create(ActionType::NodeDelete, victim);
    ASSERT_TRUE(executor_.execute(action).ok());

    EXPECT_EQ(action->outputs().get_int(keys::kDeletionRemoved), 1);
    EXPECT_FALSE(registry_.get_node(victim).has_value());
    // No policy accounting for a bare NODE_DELETE.
    EXPECT_EQ(desired(id), 2);
}

TEST_F(ActionExecutorTest, AbandonedDeferredDeleteRestoresNode) {
    auto id = make_cluster(2);
    const auto victim = registry_.list_nodes(id).front().id;
    ASSERT_TRUE(registry_.update_node_status(victim, NodeStatus::Deleting, "pending").has_value());

    auto child = Action::create(ActionType::NodeDelete, victim,
                                Params{{keys::kDeletionDeferred, true}});
    executor_.abandon(*child);

    EXPECT_EQ(registry_.get_node(victim)->status, NodeStatus::Active);
}

TEST_F(ActionExecutorTest, NodeDeleteWithGracePeriodDefers) {
    std::mutex mutex;
    std::vector<ActionPtr> submitted;
    executor_.set_submitter([&](ActionPtr child) -> Result<ActionId> {
        std::lock_guard lock(mutex);
        submitted.push_back(child);
        return child->id();
    });

    auto id = make_cluster(2);
    const auto victim = registry_.list_nodes(id).front().id;
    auto action = Action::create(ActionType::NodeDelete, victim,
                                 Params{{keys::kDeletionGracePeriod, int64_t{1}}});
    ASSERT_TRUE(executor_.execute(action).ok());

    EXPECT_EQ(registry_.get_node(victim)->status, NodeStatus::Deleting);
    EXPECT_EQ(action->outputs().get_int(keys::kDeletionRemoved), 0);
    EXPECT_EQ(action->outputs().get_list(keys::kDeferredScheduled), StringList{victim});
    EXPECT_EQ(driver_.call_count(), 0u);

    ASSERT_TRUE(eventually([&] {
        std::lock_guard lock(mutex);
        return submitted.size() == 1;
    }));
    std::lock_guard lock(mutex);
    EXPECT_EQ(submitted[0]->type(), ActionType::NodeDelete);
    EXPECT_EQ(submitted[0]->target(), victim);
    EXPECT_EQ(submitted[0]->inputs().get_bool(keys::kDeletionDeferred), true);

    // The deferred child removes the node when it runs.
    ASSERT_TRUE(executor_.execute(submitted[0]).ok());
    EXPECT_FALSE(registry_.get_node(victim).has_value());
}

TEST_F(ActionExecutorTest, CancelledNodeDeleteGraceRestoresNode) {
    executor_.set_submitter([](ActionPtr child) -> Result<ActionId> { return child->id(); });

    auto id = make_cluster(2);
    const auto victim = registry_.list_nodes(id).front().id;
    auto action = Action::create(ActionType::NodeDelete, victim,
                                 Params{{keys::kDeletionGracePeriod, int64_t{60}}});
    ASSERT_TRUE(executor_.execute(action).ok());
    ASSERT_EQ(registry_.get_node(victim)->status, NodeStatus::Deleting);

    action->request_cancel();

    EXPECT_TRUE(eventually([&] {
        return registry_.get_node(victim)->status == NodeStatus::Active;
    }));
    EXPECT_EQ(members(id), 2u);
}

// ─────────────────────────────────────────────
// Node locks held by other actions
// ─────────────────────────────────────────────

TEST_F(ActionExecutorTest, ScaleInWaitsForBusyNode) {
    auto id = make_cluster(2);
    const auto victim = registry_.list_nodes(id).front().id;
    ASSERT_TRUE(locks_.acquire(victim, "act-other", "w-other").has_value());

    std::jthread holder([&] {
        std::this_thread::sleep_for(10ms);
        EXPECT_TRUE(locks_.release(victim, "act-other").has_value());
    });

    auto action = Action::create(ActionType::ClusterScaleIn, id, Params{
        {keys::kCount, int64_t{1}},
        {keys::kNodes, StringList{victim}}
    });
    auto outcome = executor_.execute(action);
    holder.join();

    EXPECT_TRUE(outcome.ok());
    EXPECT_FALSE(registry_.get_node(victim).has_value());
    EXPECT_EQ(desired(id), 1);
    EXPECT_EQ(locks_.lock_count(), 0u);
}

TEST_F(ActionExecutorTest, ScaleInLeavesLockedNodeUntouched) {
    auto id = make_cluster(2);
    const auto victim = registry_.list_nodes(id).front().id;
    ASSERT_TRUE(locks_.acquire(victim, "act-other", "w-other").has_value());

    auto action = Action::create(ActionType::ClusterScaleIn, id, Params{
        {keys::kCount, int64_t{1}},
        {keys::kNodes, StringList{victim}}
    });
    auto outcome = executor_.execute(action);

    EXPECT_EQ(outcome.status, ActionStatus::Failed);
    EXPECT_EQ(outcome.reason.code, ErrorCode::LockBusy);
    auto node = registry_.get_node(victim);
    ASSERT_TRUE(node.has_value());
    EXPECT_EQ(node->status, NodeStatus::Active);
    EXPECT_EQ(action->outputs().get_list(keys::kNodesLocked), StringList{victim});
    EXPECT_EQ(action->outputs().get_int(keys::kDeletionRemoved), 0);
    EXPECT_EQ(desired(id), 2);
    EXPECT_EQ(driver_.call_count(ActionType::NodeDelete), 0u);

    auto record = locks_.is_locked(victim);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->action_id, "act-other");
}

TEST_F(ActionExecutorTest, CheckSkipsLockedNode) {
    auto id = make_cluster(2);
    const auto nodes = registry_.list_nodes(id);
    ASSERT_TRUE(locks_.acquire(nodes[0].id, "act-other", "w-other").has_value());
    driver_.set_node_health(nodes[0].id, NodeStatus::Error);

    auto action = Action::create(ActionType::ClusterCheck, id);
    auto outcome = executor_.execute(action);

    EXPECT_EQ(outcome.reason.code, ErrorCode::LockBusy);
    EXPECT_EQ(registry_.get_node(nodes[0].id)->status, NodeStatus::Active);
    EXPECT_EQ(action->outputs().get_list(keys::kNodesLocked), StringList{nodes[0].id});
    EXPECT_EQ(driver_.call_count(ActionType::NodeCheck), 1u);
}

TEST_F(ActionExecutorTest, CancelWhileWaitingForNodeLock) {
    auto id = make_cluster(1);
    const auto victim = registry_.list_nodes(id).front().id;
    ASSERT_TRUE(locks_.acquire(victim, "act-other", "w-other").has_value());

    auto action = Action::create(ActionType::ClusterDelNodes, id,
                                 Params{{keys::kNodes, StringList{victim}}});
    std::jthread canceller([action] {
        std::this_thread::sleep_for(5ms);
        action->request_cancel();
    });

    auto outcome = executor_.execute(action);
    canceller.join();

    EXPECT_EQ(outcome.status, ActionStatus::Cancelled);
    EXPECT_EQ(registry_.get_node(victim)->status, NodeStatus::Active);
    EXPECT_EQ(locks_.is_locked(victim)->action_id, "act-other");
}

// ─────────────────────────────────────────────
// Profile updates
// ─────────────────────────────────────────────

TEST_F(ActionExecutorTest, ClusterUpdateMovesMembersToNewVersion) {
    auto id = make_cluster(3);
    ASSERT_EQ(registry_.get_cluster(id)->profile_version, 0);

    auto action = Action::create(ActionType::ClusterUpdate, id);
    ASSERT_TRUE(executor_.execute(action).ok());

    auto cluster = registry_.get_cluster(id);
    EXPECT_EQ(cluster->profile_id, "p1");
    EXPECT_EQ(cluster->profile_version, 1);
    EXPECT_EQ(action->outputs().get_int(keys::kProfileVersion), 1);
    EXPECT_EQ(action->outputs().get_list(keys::kNodesUpdated)->size(), 3u);
    EXPECT_EQ(driver_.call_count(ActionType::NodeUpdate), 3u);
    for (const auto& node : registry_.list_nodes(id)) {
        EXPECT_EQ(node.profile_version, 1);
        EXPECT_EQ(node.status, NodeStatus::Active);
    }
    EXPECT_EQ(locks_.lock_count(), 0u);
}

TEST_F(ActionExecutorTest, NewMembersFollowUpdatedProfile) {
    auto id = make_cluster(1);
    auto update = Action::create(ActionType::ClusterUpdate, id, Params{
        {keys::kProfileId, std::string("p2")},
        {keys::kProfileVersion, int64_t{4}}
    });
    ASSERT_TRUE(executor_.execute(update).ok());

    auto grow = Action::create(ActionType::ClusterScaleOut, id,
                               Params{{keys::kCount, int64_t{1}}});
    ASSERT_TRUE(executor_.execute(grow).ok());

    ASSERT_EQ(members(id), 2u);
    for (const auto& node : registry_.list_nodes(id)) {
        EXPECT_EQ(node.profile_id, "p2");
        EXPECT_EQ(node.profile_version, 4);
    }
}

TEST_F(ActionExecutorTest, ClusterUpdateDriverFailureMarksNodeError) {
    auto id = make_cluster(2);
    const auto broken = registry_.list_nodes(id).front().id;
    driver_.fail_target(broken, ActionType::NodeUpdate);

    auto action = Action::create(ActionType::ClusterUpdate, id);
    auto outcome = executor_.execute(action);

    EXPECT_EQ(outcome.reason.code, ErrorCode::DriverError);
    auto node = registry_.get_node(broken);
    EXPECT_EQ(node->status, NodeStatus::Error);
    EXPECT_EQ(node->profile_version, 0);
    EXPECT_EQ(action->outputs().get_list(keys::kNodesFailed), StringList{broken});
    EXPECT_EQ(action->outputs().get_list(keys::kNodesUpdated)->size(), 1u);
    EXPECT_EQ(registry_.get_cluster(id)->status, ClusterStatus::Warning);
}

TEST_F(ActionExecutorTest, NodeUpdateFollowsClusterProfile) {
    auto id = make_cluster(2);
    ASSERT_TRUE(registry_.update_cluster_profile(id, "p1", 3).has_value());
    const auto stale = registry_.list_nodes(id).front().id;

    auto action = Action::create(ActionType::NodeUpdate, stale);
    ASSERT_TRUE(executor_.execute(action).ok());

    EXPECT_EQ(registry_.get_node(stale)->profile_version, 3);
    EXPECT_EQ(action->outputs().get_string(keys::kNodeStatus), "ACTIVE");

    auto mismatch = Action::create(ActionType::NodeUpdate, stale,
                                   Params{{keys::kProfileId, std::string("p9")}});
    EXPECT_EQ(executor_.execute(mismatch).reason.code, ErrorCode::InvalidArgument);
    EXPECT_EQ(registry_.get_node(stale)->profile_id, "p1");
}

TEST_F(ActionExecutorTest, OldestProfileFirstPicksStaleNodeAfterUpdate) {
    auto id = make_cluster(3);
    const auto nodes = registry_.list_nodes(id);
    const auto stale = nodes[1].id;
    driver_.fail_target(stale, ActionType::NodeUpdate);
    auto update = Action::create(ActionType::ClusterUpdate, id);
    EXPECT_FALSE(executor_.execute(update).ok());
    ASSERT_TRUE(registry_.update_node_status(stale, NodeStatus::Active, "repaired").has_value());

    auto spec = parse_policy_spec("criteria: OLDEST_PROFILE_FIRST\n");
    ASSERT_TRUE(spec.has_value());
    auto policy = policies_.create_policy("dp", "DeletionPolicy", *spec);
    ASSERT_TRUE(policy.has_value());
    ASSERT_TRUE(policies_.attach(id, policy->id, {}).has_value());

    auto action = Action::create(ActionType::ClusterScaleIn, id,
                                 Params{{keys::kCount, int64_t{1}}});
    auto evaluation = policies_.evaluate(id, *action, PolicyPhase::Pre);
    ASSERT_FALSE(evaluation.rejected());

    EXPECT_EQ(action->inputs().get_list(keys::kDeletionCandidates), StringList{stale});
}

// ─────────────────────────────────────────────
// Health
// ─────────────────────────────────────────────

TEST_F(ActionExecutorTest, ClusterCheckRecordsObservedHealth) {
    auto id = make_cluster(3);
    const auto sick = registry_.list_nodes(id).front().id;
    driver_.set_node_health(sick, NodeStatus::Error);

    auto action = Action::create(ActionType::ClusterCheck, id);
    ASSERT_TRUE(executor_.execute(action).ok());

    EXPECT_EQ(registry_.get_node(sick)->status, NodeStatus::Error);
    EXPECT_EQ(registry_.get_cluster(id)->status, ClusterStatus::Warning);
    EXPECT_EQ(action->outputs().get_string(keys::kClusterStatus), "WARNING");
    EXPECT_EQ(driver_.call_count(ActionType::NodeCheck), 3u);
}

TEST_F(ActionExecutorTest, ClusterRecoverRepairsFailedNodes) {
    auto id = make_cluster(2);
    const auto sick = registry_.list_nodes(id).front().id;
    ASSERT_TRUE(registry_.update_node_status(sick, NodeStatus::Error, "down").has_value());

    auto action = Action::create(ActionType::ClusterRecover, id);
    ASSERT_TRUE(executor_.execute(action).ok());

    EXPECT_EQ(registry_.get_node(sick)->status, NodeStatus::Active);
    EXPECT_EQ(action->outputs().get_list(keys::kNodesRecovered), StringList{sick});
    EXPECT_EQ(driver_.call_count(ActionType::NodeRecover), 1u);
    EXPECT_EQ(registry_.get_cluster(id)->status, ClusterStatus::Active);
}

TEST_F(ActionExecutorTest, RecoverNoneChangesNothing) {
    auto id = make_cluster(1);
    const auto sick = registry_.list_nodes(id).front().id;
    ASSERT_TRUE(registry_.update_node_status(sick, NodeStatus::Error, "down").has_value());

    auto action = Action::create(ActionType::ClusterRecover, id,
                                 Params{{keys::kRecoverOperation, std::string("NONE")}});
    ASSERT_TRUE(executor_.execute(action).ok());

    EXPECT_EQ(registry_.get_node(sick)->status, NodeStatus::Error);
    EXPECT_EQ(driver_.call_count(), 0u);
}

// ─────────────────────────────────────────────
// Membership and bindings
// ─────────────────────────────────────────────

TEST_F(ActionExecutorTest, NodeJoinAndLeaveAdjustCapacity) {
    auto id = make_cluster(1);
    auto orphan = registry_.create_node(NodeSpec{
        .name = "spare", .profile_id = "p1", .status = NodeStatus::Active});
    ASSERT_TRUE(orphan.has_value());

    auto join = Action::create(ActionType::NodeJoin, orphan->id,
                               Params{{keys::kClusterId, id}});
    ASSERT_TRUE(executor_.execute(join).ok());
    EXPECT_EQ(desired(id), 2);
    EXPECT_EQ(registry_.get_node(orphan->id)->cluster_id, id);

    auto leave = Action::create(ActionType::NodeLeave, orphan->id);
    ASSERT_TRUE(executor_.execute(leave).ok());
    EXPECT_EQ(desired(id), 1);
    EXPECT_TRUE(registry_.get_node(orphan->id)->is_orphan());
}

TEST_F(ActionExecutorTest, AddNodesRejectsProfileMismatch) {
    auto id = make_cluster(1);
    auto stranger = registry_.create_node(NodeSpec{
        .name = "other", .profile_id = "p2", .status = NodeStatus::Active});
    ASSERT_TRUE(stranger.has_value());

    auto action = Action::create(ActionType::ClusterAddNodes, id,
                                 Params{{keys::kNodes, StringList{stranger->id}}});
    EXPECT_EQ(executor_.execute(action).reason.code, ErrorCode::InvalidArgument);
    EXPECT_TRUE(registry_.get_node(stranger->id)->is_orphan());
    EXPECT_EQ(desired(id), 1);
}

TEST_F(ActionExecutorTest, AttachPolicyUsesInputs) {
    auto id = make_cluster(1);
    auto spec = parse_policy_spec("criteria: OLDEST_FIRST\n");
    ASSERT_TRUE(spec.has_value());
    auto policy = policies_.create_policy("dp", "DeletionPolicy", *spec);
    ASSERT_TRUE(policy.has_value());

    auto action = Action::create(ActionType::ClusterAttachPolicy, id, Params{
        {keys::kPolicyId, policy->id},
        {keys::kPolicyLevel, std::string("WARNING")},
        {keys::kPolicyPriority, int64_t{10}}
    });
    ASSERT_TRUE(executor_.execute(action).ok());

    auto cluster = registry_.get_cluster(id);
    ASSERT_EQ(cluster->bindings.size(), 1u);
    EXPECT_EQ(cluster->bindings[0].level, EnforcementLevel::Warning);
    EXPECT_EQ(cluster->bindings[0].priority, 10);

    auto bad = Action::create(ActionType::ClusterAttachPolicy, id, Params{
        {keys::kPolicyId, policy->id},
        {keys::kPolicyLevel, std::string("LOUD")}
    });
    EXPECT_EQ(executor_.execute(bad).reason.code, ErrorCode::InvalidArgument);
}
