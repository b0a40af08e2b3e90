/**
 * @file test_scaling_policy.cpp
 * @brief Unit tests for ScalingPolicy.
 * @author Dimitris Kafetzis
 */

#include "model/action_keys.hpp"
#include "policy/scaling_policy.hpp"
#include "registry/memory_registry.hpp"

#include <gtest/gtest.h>

using namespace cluster_pilot;

TEST(AdjustmentCountTest, ChangeInCapacity) {
    ScalingPolicyConfig config{.adjustment_type = AdjustmentType::ChangeInCapacity, .number = 3};
    EXPECT_EQ(adjustment_count(config, 10), 3);
}

TEST(AdjustmentCountTest, ExactCapacity) {
    ScalingPolicyConfig config{.adjustment_type = AdjustmentType::ExactCapacity, .number = 4};
    EXPECT_EQ(adjustment_count(config, 10), 6);
    EXPECT_EQ(adjustment_count(config, 1), 3);
}

TEST(AdjustmentCountTest, PercentageRoundsUpWithMinStep) {
    ScalingPolicyConfig config{.adjustment_type = AdjustmentType::ChangeInPercentage,
                               .number = 25, .min_step = 1};
    EXPECT_EQ(adjustment_count(config, 10), 3);    // ceil(2.5)
    EXPECT_EQ(adjustment_count(config, 0), 1);     // min_step floor

    config.min_step = 5;
    EXPECT_EQ(adjustment_count(config, 10), 5);
}

TEST(ScalingPolicyFactoryTest, Validation) {
    PolicySpec bad_event;
    bad_event.properties.set("event", std::string("NODE_CREATE"));
    EXPECT_EQ(ScalingPolicy::create(bad_event).error().code, ErrorCode::InvalidPolicyConfig);

    PolicySpec bad_type;
    bad_type.properties.set("adjustment.type", std::string("DOUBLE"));
    EXPECT_EQ(ScalingPolicy::create(bad_type).error().code, ErrorCode::InvalidPolicyConfig);

    PolicySpec negative;
    negative.properties.set("adjustment.number", -1.0);
    EXPECT_EQ(ScalingPolicy::create(negative).error().code, ErrorCode::InvalidPolicyConfig);

    EXPECT_TRUE(ScalingPolicy::create(PolicySpec{}).has_value());
}

class ScalingPolicyTest : public ::testing::Test {
protected:
    MemoryRegistry registry_;
    ClusterId cluster_id_;

    void SetUp() override {
        cluster_id_ = registry_.create_cluster(ClusterSpec{
            .name = "c", .profile_id = "p", .desired_capacity = 4,
            .min_size = 2, .max_size = 6})->id;
    }

    std::shared_ptr<IPolicy> make(Params properties) {
        auto policy = ScalingPolicy::create(PolicySpec{.type = "", .version = "",
                                                       .properties = std::move(properties)});
        EXPECT_TRUE(policy.has_value()) << policy.error().message;
        return *policy;
    }

    PolicyContext ctx() { return PolicyContext{PolicyPhase::Pre, cluster_id_, registry_}; }
};

TEST_F(ScalingPolicyTest, HooksConfiguredEventOnly) {
    auto policy = make({{"event", std::string("CLUSTER_SCALE_OUT")}});
    EXPECT_TRUE(policy->handles(ActionType::ClusterScaleOut, PolicyPhase::Pre));
    EXPECT_FALSE(policy->handles(ActionType::ClusterScaleOut, PolicyPhase::Post));
    EXPECT_FALSE(policy->handles(ActionType::ClusterScaleIn, PolicyPhase::Pre));
}

TEST_F(ScalingPolicyTest, ComputesCountWhenAbsent) {
    auto policy = make({{"event", std::string("CLUSTER_SCALE_OUT")},
                        {"adjustment.type", std::string("CHANGE_IN_PERCENTAGE")},
                        {"adjustment.number", int64_t{50}}});
    Action action(ActionType::ClusterScaleOut, cluster_id_);
    EXPECT_EQ(policy->check(ctx(), action).status, CheckStatus::Ok);
    EXPECT_EQ(action.inputs().get_int(keys::kCount), 2);
}

TEST_F(ScalingPolicyTest, ExplicitCountWins) {
    auto policy = make({{"adjustment.number", int64_t{2}}});
    Action action(ActionType::ClusterScaleIn, cluster_id_, Params{{keys::kCount, int64_t{1}}});
    EXPECT_EQ(policy->check(ctx(), action).status, CheckStatus::Ok);
    EXPECT_EQ(action.inputs().get_int(keys::kCount), 1);
}

TEST_F(ScalingPolicyTest, BoundViolationIsCritical) {
    auto policy = make({{"adjustment.number", int64_t{3}}});
    Action action(ActionType::ClusterScaleIn, cluster_id_);
    EXPECT_EQ(policy->check(ctx(), action).status, CheckStatus::Critical);
}

TEST_F(ScalingPolicyTest, BestEffortClampsToBound) {
    auto policy = make({{"event", std::string("CLUSTER_SCALE_OUT")},
                        {"adjustment.number", int64_t{5}},
                        {"adjustment.best_effort", true}});
    Action action(ActionType::ClusterScaleOut, cluster_id_);
    EXPECT_EQ(policy->check(ctx(), action).status, CheckStatus::Warning);
    EXPECT_EQ(action.inputs().get_int(keys::kCount), 2);   // 6 - 4
}
