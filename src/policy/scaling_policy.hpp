/**
 * @file scaling_policy.hpp
 * @brief ScalingPolicy: computes how many nodes a scale action adds or removes.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "policy/policy.hpp"

#include <optional>
#include <string_view>

namespace cluster_pilot {

enum class AdjustmentType : uint8_t {
    ChangeInCapacity,
    ExactCapacity,
    ChangeInPercentage
};

[[nodiscard]] constexpr std::string_view to_string(AdjustmentType type) noexcept {
    switch (type) {
        case AdjustmentType::ChangeInCapacity:   return "CHANGE_IN_CAPACITY";
        case AdjustmentType::ExactCapacity:      return "EXACT_CAPACITY";
        case AdjustmentType::ChangeInPercentage: return "CHANGE_IN_PERCENTAGE";
    }
    return "UNKNOWN";
}

std::optional<AdjustmentType> parse_adjustment_type(std::string_view name) noexcept;

struct ScalingPolicyConfig {
    ActionType event = ActionType::ClusterScaleIn;     ///< ClusterScaleIn or ClusterScaleOut
    AdjustmentType adjustment_type = AdjustmentType::ChangeInCapacity;
    double number = 1.0;
    int64_t min_step = 1;                              ///< Floor for percentage adjustments
    bool best_effort = false;                          ///< Clamp to bounds instead of rejecting
};

/**
 * @brief Number of nodes an adjustment moves a cluster of the given capacity.
 */
[[nodiscard]] int64_t adjustment_count(const ScalingPolicyConfig& config, int64_t current);

class ScalingPolicy : public IPolicy {
public:
    static constexpr std::string_view kTypeName = "ScalingPolicy";

    static Result<std::shared_ptr<IPolicy>> create(const PolicySpec& spec);

    ScalingPolicy(ScalingPolicyConfig config, PolicySpec spec);

    [[nodiscard]] std::string_view type_name() const noexcept override { return kTypeName; }
    [[nodiscard]] bool handles(ActionType type, PolicyPhase phase) const noexcept override;
    PolicyOutcome check(const PolicyContext& ctx, Action& action) override;
    [[nodiscard]] const PolicySpec& spec() const noexcept override { return spec_; }
    /// Sizes the request before a deletion policy picks victims.
    [[nodiscard]] std::optional<int32_t> default_priority() const noexcept override { return 100; }

    [[nodiscard]] const ScalingPolicyConfig& config() const noexcept { return config_; }

private:
    ScalingPolicyConfig config_;
    PolicySpec spec_;
};

}  // namespace cluster_pilot
