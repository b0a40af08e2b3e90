/**
 * @file test_dispatcher.cpp
 * @brief Unit tests for the dispatcher: ordering, lock retries, cancellation, policies.
 * @author Dimitris Kafetzis
 */

#include "driver/simulated_driver.hpp"
#include "engine/dispatcher.hpp"
#include "model/action_keys.hpp"
#include "policy/policy_spec.hpp"
#include "registry/memory_registry.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
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

class CaptureSink : public INotificationSink {
public:
    void emit(const ActionEvent& event) override {
        std::lock_guard lock(mutex_);
        events_.push_back(event);
    }

    std::vector<ActionStatus> statuses_for(const ActionId& id) const {
        std::lock_guard lock(mutex_);
        std::vector<ActionStatus> out;
        for (const auto& e : events_) {
            if (e.action_id == id) out.push_back(e.status);
        }
        return out;
    }

private:
    mutable std::mutex mutex_;
    std::vector<ActionEvent> events_;
};

}  // namespace

class DispatcherTest : public ::testing::Test {
protected:
    Logger logger_{std::make_unique<NullSink>()};
    MemoryRegistry registry_;
    ActionLockManager locks_{logger_};
    SimulatedDriver driver_;
    PolicyEngine policies_{registry_, logger_};
    DeferredScheduler deferred_{logger_};
    ActionExecutor executor_{registry_, locks_, driver_, policies_, deferred_, logger_};
    std::unique_ptr<Dispatcher> dispatcher_;

    void TearDown() override {
        if (dispatcher_) dispatcher_->shutdown();
        deferred_.shutdown();
    }

    /// Start once per test; shutdown also stops the deferred scheduler.
    void start(DispatcherOptions options = {}) {
        dispatcher_ = std::make_unique<Dispatcher>(locks_, policies_, executor_, registry_,
                                                   deferred_, logger_, std::move(options));
        executor_.set_submitter([this](ActionPtr child) { return dispatcher_->submit(child); });
        ASSERT_TRUE(dispatcher_->start().has_value());
    }

    Dispatcher& dispatcher() {
        if (!dispatcher_) start();
        return *dispatcher_;
    }

    ClusterId make_cluster(int64_t desired, const std::string& name = "c1") {
        auto cluster = registry_.create_cluster(ClusterSpec{
            .name = name, .profile_id = "p1", .desired_capacity = desired});
        EXPECT_TRUE(cluster.has_value());
        run(Action::create(ActionType::ClusterCreate, cluster->id));
        driver_.reset_calls();
        return cluster->id;
    }

    /// Submit and wait for a terminal status.
    ActionStatus run(ActionPtr action) {
        auto id = dispatcher().submit(action);
        EXPECT_TRUE(id.has_value());
        return dispatcher().wait(*id, 5s).value_or(ActionStatus::Running);
    }

    PolicyId attach_deletion_policy(const ClusterId& cluster_id, std::string_view yaml) {
        auto spec = parse_policy_spec(yaml);
        EXPECT_TRUE(spec.has_value());
        auto policy = policies_.create_policy("dp", "DeletionPolicy", *spec);
        EXPECT_TRUE(policy.has_value());
        EXPECT_TRUE(policies_.attach(cluster_id, policy->id, {}).has_value());
        return policy->id;
    }
};

// ─────────────────────────────────────────────
// Execution
// ─────────────────────────────────────────────

TEST_F(DispatcherTest, RunsActionToSuccess) {
    auto id = make_cluster(1);

    auto action = Action::create(ActionType::ClusterScaleOut, id,
                                 Params{{keys::kCount, int64_t{2}}});
    EXPECT_EQ(run(action), ActionStatus::Succeeded);

    EXPECT_EQ(registry_.get_cluster(id)->desired_capacity, 3);
    EXPECT_EQ(locks_.lock_count(), 0u);
    EXPECT_FALSE(action->owner().empty());
    EXPECT_TRUE(action->started_at().has_value());
    EXPECT_TRUE(action->ended_at().has_value());

    auto stats = dispatcher().stats();
    EXPECT_GE(stats.succeeded, 2u);
    EXPECT_EQ(stats.running, 0u);
}

TEST_F(DispatcherTest, SameTargetRunsInSubmissionOrder) {
    auto id = make_cluster(0);
    driver_.set_latency(5ms);

    std::vector<ActionId> submitted;
    for (int i = 0; i < 5; ++i) {
        auto result = dispatcher().submit(Action::create(ActionType::ClusterScaleOut, id,
                                                         Params{{keys::kCount, int64_t{1}}}));
        ASSERT_TRUE(result.has_value());
        submitted.push_back(*result);
    }
    for (const auto& action_id : submitted) {
        EXPECT_EQ(dispatcher().wait(action_id, 5s), ActionStatus::Succeeded);
    }

    std::vector<ActionId> executed;
    for (const auto& call : driver_.calls()) executed.push_back(call.parent_id);
    EXPECT_EQ(executed, submitted);
    EXPECT_EQ(driver_.max_concurrency(), 1u);
    EXPECT_EQ(registry_.get_cluster(id)->desired_capacity, 5);
}

TEST_F(DispatcherTest, DistinctTargetsRunConcurrently) {
    auto a = make_cluster(0, "a");
    auto b = make_cluster(0, "b");
    driver_.set_latency(100ms);

    auto first = dispatcher().submit(Action::create(ActionType::ClusterScaleOut, a));
    auto second = dispatcher().submit(Action::create(ActionType::ClusterScaleOut, b));
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());

    EXPECT_EQ(dispatcher().wait(*first, 5s), ActionStatus::Succeeded);
    EXPECT_EQ(dispatcher().wait(*second, 5s), ActionStatus::Succeeded);
    EXPECT_EQ(driver_.max_concurrency(), 2u);
}

TEST_F(DispatcherTest, DriverErrorFailsAction) {
    auto id = make_cluster(1);
    driver_.fail_next(ActionType::NodeCreate);

    auto action = Action::create(ActionType::ClusterScaleOut, id);
    EXPECT_EQ(run(action), ActionStatus::Failed);
    EXPECT_EQ(action->reason().code, ErrorCode::DriverError);
    EXPECT_EQ(locks_.lock_count(), 0u);
}

TEST_F(DispatcherTest, SubmitTwiceIsRejected) {
    auto id = make_cluster(1);
    auto action = Action::create(ActionType::ClusterCheck, id);
    ASSERT_TRUE(dispatcher().submit(action).has_value());

    auto again = dispatcher().submit(action);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::InvalidState);
}

TEST_F(DispatcherTest, SubmitAfterShutdownIsRejected) {
    dispatcher().shutdown();
    auto result = dispatcher().submit(Action::create(ActionType::ClusterCheck, "c-x"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ShuttingDown);
    EXPECT_FALSE(dispatcher().is_running());
}

TEST_F(DispatcherTest, NotifiesEveryTransition) {
    auto sink = std::make_shared<CaptureSink>();
    dispatcher().add_sink(sink);
    auto id = make_cluster(1);

    auto action = Action::create(ActionType::ClusterCheck, id);
    ASSERT_EQ(run(action), ActionStatus::Succeeded);

    const std::vector<ActionStatus> expected{
        ActionStatus::Waiting, ActionStatus::Running, ActionStatus::Succeeded};
    EXPECT_TRUE(eventually([&] { return sink->statuses_for(action->id()) == expected; }));
}

// ─────────────────────────────────────────────
// Lock contention
// ─────────────────────────────────────────────

TEST_F(DispatcherTest, LockBusyExhaustsAttempts) {
    start(DispatcherOptions{.worker_count = 2, .max_attempts = 3,
                            .base_backoff = 1ms, .max_backoff = 5ms});
    auto id = make_cluster(1);
    ASSERT_TRUE(locks_.acquire(id, "act-foreign", "other-worker").has_value());

    auto action = Action::create(ActionType::ClusterCheck, id);
    EXPECT_EQ(run(action), ActionStatus::Failed);
    EXPECT_EQ(action->reason().code, ErrorCode::LockBusy);
    EXPECT_EQ(dispatcher().stats().lock_retries, 3u);

    // The foreign lock is untouched.
    auto record = locks_.is_locked(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->action_id, "act-foreign");
}

TEST_F(DispatcherTest, RetriesUntilLockIsReleased) {
    start(DispatcherOptions{.worker_count = 2, .max_attempts = 100,
                            .base_backoff = 2ms, .max_backoff = 10ms});
    auto id = make_cluster(1);
    ASSERT_TRUE(locks_.acquire(id, "act-foreign", "other-worker").has_value());

    auto action = Action::create(ActionType::ClusterCheck, id);
    auto submitted = dispatcher().submit(action);
    ASSERT_TRUE(submitted.has_value());

    ASSERT_TRUE(eventually([&] { return dispatcher().stats().lock_retries >= 2; }));
    EXPECT_EQ(action->status(), ActionStatus::Waiting);
    ASSERT_TRUE(locks_.release(id, "act-foreign").has_value());

    EXPECT_EQ(dispatcher().wait(*submitted, 5s), ActionStatus::Succeeded);
}

TEST_F(DispatcherTest, LostTargetLockFailsAction) {
    auto id = make_cluster(1);
    const auto node_id = registry_.list_nodes(id).front().id;

    // Another holder takes the cluster lock while the body is running.
    driver_.on_call([&](const Action& call) {
        if (call.type() != ActionType::NodeCheck) return;
        EXPECT_TRUE(locks_.steal(id).has_value());
        EXPECT_TRUE(locks_.acquire(id, "act-intruder", "w-intruder").has_value());
    });

    auto action = Action::create(ActionType::ClusterCheck, id);
    EXPECT_EQ(run(action), ActionStatus::Failed);
    EXPECT_EQ(action->reason().code, ErrorCode::InconsistentLockRelease);
    EXPECT_EQ(driver_.call_count(ActionType::NodeCheck), 1u);

    auto record = locks_.is_locked(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->action_id, "act-intruder");
    EXPECT_FALSE(locks_.is_locked(node_id).has_value());
    EXPECT_EQ(locks_.purge(action->id()), 0u);
}

TEST_F(DispatcherTest, ForgetsOldestFinishedActionsBeyondRetention) {
    start(DispatcherOptions{.worker_count = 1, .retained_actions = 2});
    auto id = make_cluster(0);

    auto first = Action::create(ActionType::ClusterCheck, id);
    auto second = Action::create(ActionType::ClusterCheck, id);
    auto third = Action::create(ActionType::ClusterCheck, id);
    ASSERT_EQ(run(first), ActionStatus::Succeeded);
    ASSERT_EQ(run(second), ActionStatus::Succeeded);
    ASSERT_EQ(run(third), ActionStatus::Succeeded);

    // The oldest record is dropped once the completion after it has been retired.
    ASSERT_TRUE(eventually([&] { return !dispatcher().get(first->id()).has_value(); }));
    EXPECT_EQ(dispatcher().get(first->id()).error().code, ErrorCode::NotFound);
    EXPECT_EQ(dispatcher().cancel(first->id()).error().code, ErrorCode::NotFound);
    EXPECT_TRUE(dispatcher().get(second->id()).has_value());
    EXPECT_TRUE(dispatcher().get(third->id()).has_value());

    EXPECT_EQ(dispatcher().purge_finished(), 2u);
    EXPECT_EQ(dispatcher().find(third->id()), nullptr);
}

TEST_F(DispatcherTest, RetentionKeepsActionsWithPendingTimers) {
    start(DispatcherOptions{.worker_count = 1, .retained_actions = 1});
    auto id = make_cluster(2);
    const auto victim = registry_.list_nodes(id).front().id;

    auto scale_in = Action::create(ActionType::ClusterScaleIn, id, Params{
        {keys::kDeletionCandidates, StringList{victim}},
        {keys::kDeletionGracePeriod, int64_t{60}}
    });
    ASSERT_EQ(run(scale_in), ActionStatus::Succeeded);
    ASSERT_EQ(run(Action::create(ActionType::ClusterCheck, id)), ActionStatus::Succeeded);

    EXPECT_NE(dispatcher().find(scale_in->id()), nullptr);
    ASSERT_TRUE(dispatcher().cancel(scale_in->id()).has_value());
    EXPECT_TRUE(eventually([&] {
        return registry_.get_node(victim)->status == NodeStatus::Active;
    }));
}

// ─────────────────────────────────────────────
// Cancellation
// ─────────────────────────────────────────────

TEST_F(DispatcherTest, CancelQueuedAction) {
    start(DispatcherOptions{.worker_count = 1, .max_attempts = 1000,
                            .base_backoff = 20ms, .max_backoff = 20ms});
    auto id = make_cluster(1);
    ASSERT_TRUE(locks_.acquire(id, "act-foreign", "other-worker").has_value());

    auto action = Action::create(ActionType::ClusterScaleOut, id);
    auto submitted = dispatcher().submit(action);
    ASSERT_TRUE(submitted.has_value());

    ASSERT_TRUE(dispatcher().cancel(*submitted).has_value());
    EXPECT_EQ(dispatcher().wait(*submitted, 5s), ActionStatus::Cancelled);
    EXPECT_EQ(action->reason().code, ErrorCode::Cancelled);
    EXPECT_EQ(driver_.call_count(), 0u);

    ASSERT_TRUE(locks_.release(id, "act-foreign").has_value());
}

TEST_F(DispatcherTest, CancelRunningActionStopsAtCheckpoint) {
    auto id = make_cluster(1);
    driver_.set_latency(5s);

    auto action = Action::create(ActionType::ClusterScaleOut, id);
    auto submitted = dispatcher().submit(action);
    ASSERT_TRUE(submitted.has_value());
    ASSERT_TRUE(eventually([&] { return driver_.max_concurrency() == 1; }));

    const auto start = std::chrono::steady_clock::now();
    ASSERT_TRUE(dispatcher().cancel(*submitted).has_value());
    EXPECT_EQ(dispatcher().wait(*submitted, 3s), ActionStatus::Cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);

    // The half-built node is discarded and capacity is unchanged.
    EXPECT_EQ(registry_.list_nodes(id).size(), 1u);
    EXPECT_EQ(registry_.get_cluster(id)->desired_capacity, 1);
    EXPECT_EQ(locks_.lock_count(), 0u);
}

TEST_F(DispatcherTest, CancelUnknownOrFinished) {
    auto unknown = dispatcher().cancel("act-missing");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code, ErrorCode::NotFound);

    auto id = make_cluster(1);
    auto action = Action::create(ActionType::ClusterCheck, id);
    ASSERT_EQ(run(action), ActionStatus::Succeeded);

    auto finished = dispatcher().cancel(action->id());
    ASSERT_FALSE(finished.has_value());
    EXPECT_EQ(finished.error().code, ErrorCode::InvalidState);
}

// ─────────────────────────────────────────────
// Policies
// ─────────────────────────────────────────────

TEST_F(DispatcherTest, CriticalPreCheckPreventsBody) {
    auto id = make_cluster(2);
    auto policy_id = attach_deletion_policy(id, "criteria: RANDOM\n");

    auto action = Action::create(ActionType::ClusterScaleIn, id,
                                 Params{{keys::kCount, int64_t{-1}}});
    EXPECT_EQ(run(action), ActionStatus::Failed);

    auto reason = action->reason();
    EXPECT_EQ(reason.code, ErrorCode::PolicyRejected);
    EXPECT_EQ(reason.policy_id, policy_id);
    EXPECT_EQ(driver_.call_count(), 0u);
    EXPECT_EQ(registry_.list_nodes(id).size(), 2u);
}

TEST_F(DispatcherTest, PolicyWarningIsRecordedAndActionProceeds) {
    auto id = make_cluster(2);
    attach_deletion_policy(id, "criteria: OLDEST_FIRST\nreduce_desired_capacity: true\n");

    auto action = Action::create(ActionType::ClusterScaleIn, id,
                                 Params{{keys::kCount, int64_t{5}}});
    EXPECT_EQ(run(action), ActionStatus::Succeeded);

    auto warnings = action->outputs().get_list(keys::kPolicyWarnings);
    ASSERT_TRUE(warnings.has_value());
    EXPECT_EQ(warnings->size(), 1u);
    EXPECT_EQ(action->outputs().get_int(keys::kDeletionRemoved), 2);
    EXPECT_EQ(registry_.get_cluster(id)->desired_capacity, 0);
}

TEST_F(DispatcherTest, DeletionPolicyReducesCapacityAfterRemoval) {
    auto id = make_cluster(4);
    attach_deletion_policy(id, "criteria: OLDEST_FIRST\nreduce_desired_capacity: true\n");
    const auto oldest = registry_.list_nodes(id).front().id;

    auto action = Action::create(ActionType::ClusterScaleIn, id);
    EXPECT_EQ(run(action), ActionStatus::Succeeded);

    EXPECT_EQ(action->outputs().get_list(keys::kNodesDeleted), StringList{oldest});
    EXPECT_EQ(registry_.get_cluster(id)->desired_capacity, 3);
    EXPECT_FALSE(registry_.get_node(oldest).has_value());
}
