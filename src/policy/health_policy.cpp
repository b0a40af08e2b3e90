/**
 * @file health_policy.cpp
 * @brief HealthPolicy implementation.
 * @author Dimitris Kafetzis
 */

#include "policy/health_policy.hpp"
#include "model/action_keys.hpp"

#include <format>

namespace cluster_pilot {

std::optional<RecoveryAction> parse_recovery_action(std::string_view name) noexcept {
    if (name == "REBOOT")   return RecoveryAction::Reboot;
    if (name == "RECREATE") return RecoveryAction::Recreate;
    if (name == "NONE")     return RecoveryAction::None;
    return std::nullopt;
}

Result<std::shared_ptr<IPolicy>> HealthPolicy::create(const PolicySpec& spec) {
    auto known = reject_unknown_keys(spec, {"recovery.action", "max_unhealthy_percent"});
    if (!known) return known.error();

    HealthPolicyConfig config;

    auto action = read_string(spec, "recovery.action", std::string(to_string(config.recovery)));
    if (!action) return action.error();
    auto recovery = parse_recovery_action(*action);
    if (!recovery) {
        return Error{ErrorCode::InvalidPolicyConfig,
                     "recovery.action must be REBOOT, RECREATE or NONE (got '" + *action + "')"};
    }
    config.recovery = *recovery;

    auto percent = read_int(spec, "max_unhealthy_percent", config.max_unhealthy_percent);
    if (!percent) return percent.error();
    if (*percent < 0 || *percent > 100) {
        return Error{ErrorCode::InvalidPolicyConfig,
                     std::format("max_unhealthy_percent must be within [0, 100] (got {})", *percent)};
    }
    config.max_unhealthy_percent = *percent;

    return std::shared_ptr<IPolicy>(std::make_shared<HealthPolicy>(config, spec));
}

HealthPolicy::HealthPolicy(HealthPolicyConfig config, PolicySpec spec)
    : config_(config), spec_(std::move(spec)) {}

bool HealthPolicy::handles(ActionType type, PolicyPhase phase) const noexcept {
    if (phase == PolicyPhase::Pre) {
        return type == ActionType::ClusterRecover || type == ActionType::ClusterScaleOut;
    }
    return type == ActionType::ClusterCheck;
}

PolicyOutcome HealthPolicy::check(const PolicyContext& ctx, Action& action) {
    switch (action.type()) {
        case ActionType::ClusterRecover:  return on_recover(action);
        case ActionType::ClusterCheck:    return on_check(ctx, action);
        case ActionType::ClusterScaleOut: return on_scale_out(ctx);
        default:                          return PolicyOutcome::ok();
    }
}

PolicyOutcome HealthPolicy::on_recover(Action& action) {
    auto& inputs = action.inputs();
    if (!inputs.contains(keys::kRecoverOperation)) {
        inputs.set(keys::kRecoverOperation, std::string(to_string(config_.recovery)));
    }
    if (config_.recovery == RecoveryAction::None) {
        return PolicyOutcome::warning("Recovery is disabled by policy");
    }
    return PolicyOutcome::ok();
}

PolicyOutcome HealthPolicy::on_check(const PolicyContext& ctx, Action& action) {
    auto nodes = ctx.registry.list_nodes(ctx.cluster_id);
    if (nodes.empty()) return PolicyOutcome::ok();

    StringList unhealthy;
    for (const auto& node : nodes) {
        if (node.status == NodeStatus::Error || node.status == NodeStatus::Warning) {
            unhealthy.push_back(node.id);
        }
    }
    action.set_output(keys::kHealthUnhealthy, unhealthy);

    const auto percent = static_cast<int64_t>(unhealthy.size() * 100 / nodes.size());
    if (percent > config_.max_unhealthy_percent) {
        return PolicyOutcome::error(std::format("{}% of nodes unhealthy (limit {}%)",
                                                percent, config_.max_unhealthy_percent));
    }
    return PolicyOutcome::ok();
}

PolicyOutcome HealthPolicy::on_scale_out(const PolicyContext& ctx) {
    auto cluster = ctx.registry.get_cluster(ctx.cluster_id);
    if (cluster && cluster->status == ClusterStatus::Error) {
        return PolicyOutcome::warning("Scaling out a cluster in ERROR state");
    }
    return PolicyOutcome::ok();
}

}  // namespace cluster_pilot
