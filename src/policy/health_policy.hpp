/**
 * @file health_policy.hpp
 * @brief HealthPolicy: recovery strategy and unhealthy-node threshold.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "policy/policy.hpp"

#include <optional>
#include <string_view>

namespace cluster_pilot {

enum class RecoveryAction : uint8_t {
    Reboot,
    Recreate,
    None
};

[[nodiscard]] constexpr std::string_view to_string(RecoveryAction action) noexcept {
    switch (action) {
        case RecoveryAction::Reboot:   return "REBOOT";
        case RecoveryAction::Recreate: return "RECREATE";
        case RecoveryAction::None:     return "NONE";
    }
    return "UNKNOWN";
}

std::optional<RecoveryAction> parse_recovery_action(std::string_view name) noexcept;

struct HealthPolicyConfig {
    RecoveryAction recovery = RecoveryAction::Recreate;
    int64_t max_unhealthy_percent = 50;
};

class HealthPolicy : public IPolicy {
public:
    static constexpr std::string_view kTypeName = "HealthPolicy";

    static Result<std::shared_ptr<IPolicy>> create(const PolicySpec& spec);

    HealthPolicy(HealthPolicyConfig config, PolicySpec spec);

    [[nodiscard]] std::string_view type_name() const noexcept override { return kTypeName; }
    [[nodiscard]] bool handles(ActionType type, PolicyPhase phase) const noexcept override;
    PolicyOutcome check(const PolicyContext& ctx, Action& action) override;
    [[nodiscard]] const PolicySpec& spec() const noexcept override { return spec_; }
    [[nodiscard]] std::optional<int32_t> default_priority() const noexcept override { return 600; }

    [[nodiscard]] const HealthPolicyConfig& config() const noexcept { return config_; }

private:
    PolicyOutcome on_recover(Action& action);
    PolicyOutcome on_check(const PolicyContext& ctx, Action& action);
    PolicyOutcome on_scale_out(const PolicyContext& ctx);

    HealthPolicyConfig config_;
    PolicySpec spec_;
};

}  // namespace cluster_pilot
