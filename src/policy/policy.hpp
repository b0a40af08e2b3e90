/**
 * @file policy.hpp
 * @brief Policy Object capability interface.
 * @author Dimitris Kafetzis
 *
 * A policy declares which (action type, phase) pairs it hooks and implements
 * check() for them. check() may mutate the action's inputs; the engine records
 * which keys changed.
 */

#pragma once

#include "core/types.hpp"
#include "model/action.hpp"
#include "policy/policy_spec.hpp"
#include "registry/target_registry.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cluster_pilot {

/**
 * @brief Raw result of one policy hook, before binding enforcement.
 */
struct PolicyOutcome {
    CheckStatus status = CheckStatus::Ok;
    std::string reason;

    static PolicyOutcome ok(std::string reason = {}) {
        return {CheckStatus::Ok, std::move(reason)};
    }
    static PolicyOutcome warning(std::string reason) {
        return {CheckStatus::Warning, std::move(reason)};
    }
    static PolicyOutcome error(std::string reason) {
        return {CheckStatus::Error, std::move(reason)};
    }
    static PolicyOutcome critical(std::string reason) {
        return {CheckStatus::Critical, std::move(reason)};
    }
};

/**
 * @brief What a hook gets to see besides the action itself.
 */
struct PolicyContext {
    PolicyPhase phase;
    ClusterId cluster_id;           ///< Cluster whose bindings are being evaluated
    ITargetRegistry& registry;
};

/**
 * @brief Abstract interface for policy objects (runtime polymorphism).
 *
 * Instances are shared between every cluster they are attached to, so check()
 * must not keep per-action state in members.
 */
class IPolicy {
public:
    virtual ~IPolicy() = default;

    [[nodiscard]] virtual std::string_view type_name() const noexcept = 0;

    /// Whether check() implements this action type at this phase.
    [[nodiscard]] virtual bool handles(ActionType type, PolicyPhase phase) const noexcept = 0;

    virtual PolicyOutcome check(const PolicyContext& ctx, Action& action) = 0;

    /// The validated spec the policy was built from.
    [[nodiscard]] virtual const PolicySpec& spec() const noexcept = 0;

    /**
     * @brief Binding priority used when an attach names none (lower runs first).
     *
     * nullopt defers to [policy].default_priority.
     */
    [[nodiscard]] virtual std::optional<int32_t> default_priority() const noexcept {
        return std::nullopt;
    }
};

}  // namespace cluster_pilot
