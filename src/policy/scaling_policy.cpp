/**
 * @file scaling_policy.cpp
 * @brief ScalingPolicy implementation.
 * @author Dimitris Kafetzis
 */

#include "policy/scaling_policy.hpp"
#include "model/action_keys.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <format>

namespace cluster_pilot {

std::optional<AdjustmentType> parse_adjustment_type(std::string_view name) noexcept {
    if (name == "CHANGE_IN_CAPACITY")   return AdjustmentType::ChangeInCapacity;
    if (name == "EXACT_CAPACITY")       return AdjustmentType::ExactCapacity;
    if (name == "CHANGE_IN_PERCENTAGE") return AdjustmentType::ChangeInPercentage;
    return std::nullopt;
}

int64_t adjustment_count(const ScalingPolicyConfig& config, int64_t current) {
    switch (config.adjustment_type) {
        case AdjustmentType::ChangeInCapacity:
            return static_cast<int64_t>(std::llround(std::fabs(config.number)));

        case AdjustmentType::ExactCapacity:
            return std::abs(static_cast<int64_t>(std::llround(config.number)) - current);

        case AdjustmentType::ChangeInPercentage: {
            auto count = static_cast<int64_t>(
                std::ceil(static_cast<double>(current) * std::fabs(config.number) / 100.0));
            return std::max(count, config.min_step);
        }
    }
    return 0;
}

Result<std::shared_ptr<IPolicy>> ScalingPolicy::create(const PolicySpec& spec) {
    auto known = reject_unknown_keys(spec, {"event", "adjustment.type", "adjustment.number",
                                            "adjustment.min_step", "adjustment.best_effort"});
    if (!known) return known.error();

    ScalingPolicyConfig config;

    auto event = read_string(spec, "event", std::string(to_string(config.event)));
    if (!event) return event.error();
    auto event_type = parse_action_type(*event);
    if (!event_type || (*event_type != ActionType::ClusterScaleIn
                        && *event_type != ActionType::ClusterScaleOut)) {
        return Error{ErrorCode::InvalidPolicyConfig,
                     "event must be CLUSTER_SCALE_IN or CLUSTER_SCALE_OUT (got '" + *event + "')"};
    }
    config.event = *event_type;

    auto type = read_string(spec, "adjustment.type", std::string(to_string(config.adjustment_type)));
    if (!type) return type.error();
    auto adjustment = parse_adjustment_type(*type);
    if (!adjustment) {
        return Error{ErrorCode::InvalidPolicyConfig, "Invalid adjustment.type '" + *type + "'"};
    }
    config.adjustment_type = *adjustment;

    auto number = read_double(spec, "adjustment.number", config.number);
    if (!number) return number.error();
    if (*number < 0) {
        return Error{ErrorCode::InvalidPolicyConfig,
                     std::format("adjustment.number must be >= 0 (got {})", *number)};
    }
    config.number = *number;

    auto min_step = read_int(spec, "adjustment.min_step", config.min_step);
    if (!min_step) return min_step.error();
    if (*min_step < 0) {
        return Error{ErrorCode::InvalidPolicyConfig, "adjustment.min_step must be >= 0"};
    }
    config.min_step = *min_step;

    auto best_effort = read_bool(spec, "adjustment.best_effort", config.best_effort);
    if (!best_effort) return best_effort.error();
    config.best_effort = *best_effort;

    return std::shared_ptr<IPolicy>(std::make_shared<ScalingPolicy>(config, spec));
}

ScalingPolicy::ScalingPolicy(ScalingPolicyConfig config, PolicySpec spec)
    : config_(config), spec_(std::move(spec)) {}

bool ScalingPolicy::handles(ActionType type, PolicyPhase phase) const noexcept {
    return phase == PolicyPhase::Pre && type == config_.event;
}

PolicyOutcome ScalingPolicy::check(const PolicyContext& ctx, Action& action) {
    auto cluster = ctx.registry.get_cluster(ctx.cluster_id);
    if (!cluster) return PolicyOutcome::critical(cluster.error().message);

    auto& inputs = action.inputs();
    const int64_t current = cluster->desired_capacity;

    int64_t count = 0;
    if (auto explicit_count = inputs.get_int(keys::kCount)) {
        count = *explicit_count;
    } else {
        count = adjustment_count(config_, current);
    }
    if (count < 0) return PolicyOutcome::critical(std::format("Invalid count {}", count));

    const bool shrinking = config_.event == ActionType::ClusterScaleIn;
    const int64_t target = shrinking ? current - count : current + count;

    if (cluster->within_bounds(target)) {
        inputs.set(keys::kCount, count);
        return PolicyOutcome::ok(std::format("count {} ({} -> {})", count, current, target));
    }

    const int64_t bound = shrinking ? cluster->min_size : cluster->max_size;
    if (!config_.best_effort) {
        return PolicyOutcome::critical(std::format(
            "Desired capacity {} would violate {} {}", target,
            shrinking ? "min_size" : "max_size", bound));
    }

    const int64_t clamped = std::max<int64_t>(0, shrinking ? current - bound : bound - current);
    inputs.set(keys::kCount, clamped);
    return PolicyOutcome::warning(std::format(
        "count clamped from {} to {} to respect {} {}", count, clamped,
        shrinking ? "min_size" : "max_size", bound));
}

}  // namespace cluster_pilot
