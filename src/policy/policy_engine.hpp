/**
 * @file policy_engine.hpp
 * @brief Policy Engine: policy objects, cluster bindings and PRE/POST evaluation.
 * @author Dimitris Kafetzis
 *
 * Policy objects live in the engine (policy_id → instance). Bindings are
 * stored on the cluster record in the Target Registry, already ordered by
 * (priority, attach sequence).
 *
 * Enforcement: a binding's level bounds the raw result of its policy.
 *
 *   raw       IGNORE  WARNING  ERROR    CRITICAL
 *   OK        OK      OK       OK       OK
 *   WARNING   OK      WARNING  WARNING  WARNING
 *   ERROR     OK      WARNING  ERROR    CRITICAL
 *   CRITICAL  OK      WARNING  ERROR    CRITICAL
 *
 * Only an effective CRITICAL stops evaluation and rejects the action.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "model/action.hpp"
#include "model/cluster.hpp"
#include "policy/policy.hpp"
#include "policy/policy_registry.hpp"
#include "registry/target_registry.hpp"

#include <memory>
#include <optional>
#include <shared_mutex>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cluster_pilot {

/// Combine a raw policy result with the binding's enforcement level.
[[nodiscard]] constexpr CheckStatus apply_enforcement(CheckStatus raw,
                                                      EnforcementLevel level) noexcept {
    if (raw == CheckStatus::Ok) return CheckStatus::Ok;
    switch (level) {
        case EnforcementLevel::Ignore:
            return CheckStatus::Ok;
        case EnforcementLevel::Warning:
            return CheckStatus::Warning;
        case EnforcementLevel::Error:
            return raw == CheckStatus::Warning ? CheckStatus::Warning : CheckStatus::Error;
        case EnforcementLevel::Critical:
            return raw == CheckStatus::Warning ? CheckStatus::Warning : CheckStatus::Critical;
    }
    return raw;
}

struct PolicyRecord {
    PolicyId id;
    std::string name;
    std::string type;
    std::shared_ptr<IPolicy> policy;
    Timestamp created_at;
};

struct AttachOptions {
    std::optional<EnforcementLevel> level;     ///< Defaults to [policy].default_level
    std::optional<int32_t> priority;           ///< Defaults to IPolicy::default_priority()
    bool enabled = true;
};

struct BindingUpdate {
    std::optional<EnforcementLevel> level;
    std::optional<int32_t> priority;
    std::optional<bool> enabled;
};

/**
 * @brief Outcome of one binding during evaluation.
 */
struct PolicyResult {
    PolicyId policy_id;
    std::string policy_type;
    EnforcementLevel level = EnforcementLevel::Critical;
    CheckStatus raw = CheckStatus::Ok;
    CheckStatus effective = CheckStatus::Ok;
    std::string reason;
    std::vector<std::string> mutated_inputs;
};

struct PolicyEvaluation {
    PolicyPhase phase = PolicyPhase::Pre;
    std::vector<PolicyResult> results;

    /// The result that stopped evaluation, if any.
    [[nodiscard]] const PolicyResult* rejection() const noexcept;
    [[nodiscard]] bool rejected() const noexcept { return rejection() != nullptr; }

    /// Most severe effective status (OK when nothing ran).
    [[nodiscard]] CheckStatus worst() const noexcept;

    /// "<type>/<id>: <STATUS> <reason>" for each WARNING or ERROR result.
    [[nodiscard]] std::vector<std::string> warnings() const;
};

class PolicyEngine {
public:
    PolicyEngine(ITargetRegistry& registry, Logger& logger,
                 PolicyConfig defaults = {},
                 PolicyRegistry& types = PolicyRegistry::global());

    PolicyEngine(const PolicyEngine&) = delete;
    PolicyEngine& operator=(const PolicyEngine&) = delete;

    // ── Policy objects ───────────────────────

    /**
     * @brief Build and store a policy from a validated spec.
     *
     * An empty type falls back to spec.type. Unknown types are NotFound;
     * spec problems are InvalidPolicyConfig.
     */
    Result<PolicyRecord> create_policy(std::string name, std::string type, const PolicySpec& spec);

    /// InvalidState while the policy is attached to any cluster.
    Result<void> delete_policy(const PolicyId& policy_id);

    [[nodiscard]] Result<PolicyRecord> get_policy(const PolicyId& policy_id) const;
    [[nodiscard]] std::vector<PolicyRecord> list_policies() const;

    // ── Bindings ─────────────────────────────

    /**
     * @brief Bind a policy to a cluster.
     *
     * Attaching the same policy again is an idempotent no-op returning the
     * existing binding. A different policy of the same type is PolicyConflict.
     */
    Result<PolicyBinding> attach(const ClusterId& cluster_id, const PolicyId& policy_id,
                                 AttachOptions options = {});

    Result<void> detach(const ClusterId& cluster_id, const PolicyId& policy_id);

    Result<PolicyBinding> update_binding(const ClusterId& cluster_id, const PolicyId& policy_id,
                                         BindingUpdate update);

    /// Bindings in evaluation order.
    [[nodiscard]] Result<std::vector<PolicyBinding>> bindings(const ClusterId& cluster_id) const;

    // ── Evaluation ───────────────────────────

    /**
     * @brief Run every enabled binding of the cluster that hooks this action/phase.
     *
     * Hooks may mutate action.inputs(). A cluster that does not exist (orphan
     * node targets) has no bindings and evaluates to an empty result list.
     */
    PolicyEvaluation evaluate(const ClusterId& cluster_id, Action& action, PolicyPhase phase);

private:
    std::shared_ptr<IPolicy> find_policy(const PolicyId& policy_id) const;

    ITargetRegistry& registry_;
    Logger& logger_;
    PolicyConfig defaults_;
    PolicyRegistry& types_;

    mutable std::shared_mutex policies_mutex_;
    std::unordered_map<PolicyId, PolicyRecord> policies_;

    // Serializes binding changes so the same-type check and the insert are atomic.
    std::mutex binding_mutex_;
};

}  // namespace cluster_pilot
