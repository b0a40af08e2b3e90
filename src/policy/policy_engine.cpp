/**
 * @file policy_engine.cpp
 * @brief PolicyEngine implementation.
 * @author Dimitris Kafetzis
 */

#include "policy/policy_engine.hpp"
#include "core/ids.hpp"

#include <algorithm>
#include <exception>
#include <format>

namespace cluster_pilot {

namespace {
constexpr std::string_view kComponent = "policy";
}

// ─────────────────────────────────────────────
// PolicyEvaluation
// ─────────────────────────────────────────────

const PolicyResult* PolicyEvaluation::rejection() const noexcept {
    for (const auto& result : results) {
        if (result.effective == CheckStatus::Critical) return &result;
    }
    return nullptr;
}

CheckStatus PolicyEvaluation::worst() const noexcept {
    CheckStatus worst = CheckStatus::Ok;
    for (const auto& result : results) worst = std::max(worst, result.effective);
    return worst;
}

std::vector<std::string> PolicyEvaluation::warnings() const {
    std::vector<std::string> out;
    for (const auto& result : results) {
        if (result.effective == CheckStatus::Warning || result.effective == CheckStatus::Error) {
            out.push_back(std::format("{}/{}: {} {}", result.policy_type, result.policy_id,
                                      to_string(result.effective), result.reason));
        }
    }
    return out;
}

// ─────────────────────────────────────────────
// PolicyEngine
// ─────────────────────────────────────────────

PolicyEngine::PolicyEngine(ITargetRegistry& registry, Logger& logger,
                           PolicyConfig defaults, PolicyRegistry& types)
    : registry_(registry)
    , logger_(logger)
    , defaults_(defaults)
    , types_(types) {}

// ── Policy objects ───────────────────────────

Result<PolicyRecord> PolicyEngine::create_policy(std::string name, std::string type,
                                                 const PolicySpec& spec) {
    if (type.empty()) type = spec.type;
    if (type.empty()) {
        return Error{ErrorCode::InvalidPolicyConfig, "Policy type not specified"};
    }
    if (!spec.type.empty() && spec.type != type) {
        return Error{ErrorCode::InvalidPolicyConfig,
                     std::format("Spec declares type {} but {} was requested", spec.type, type)};
    }

    auto policy = types_.create(type, spec);
    if (!policy) {
        logger_.warn(kComponent, std::format("Policy '{}' rejected: {}", name,
                                             policy.error().message));
        return policy.error();
    }

    PolicyRecord record{
        .id = generate_id("policy"),
        .name = name.empty() ? type : std::move(name),
        .type = std::move(type),
        .policy = std::move(*policy),
        .created_at = std::chrono::system_clock::now()
    };

    {
        std::unique_lock lock(policies_mutex_);
        policies_.emplace(record.id, record);
    }
    logger_.info(kComponent, std::format("Created {} policy {} ({})",
                                         record.type, record.id, record.name));
    return record;
}

Result<void> PolicyEngine::delete_policy(const PolicyId& policy_id) {
    std::lock_guard binding_lock(binding_mutex_);

    auto bound = registry_.clusters_bound_to(policy_id);
    if (!bound.empty()) {
        return Error{ErrorCode::InvalidState,
                     std::format("Policy {} is still attached to {} cluster(s)",
                                 policy_id, bound.size())};
    }

    std::unique_lock lock(policies_mutex_);
    if (policies_.erase(policy_id) == 0) {
        return Error{ErrorCode::NotFound, "Policy not found: " + policy_id};
    }
    return {};
}

Result<PolicyRecord> PolicyEngine::get_policy(const PolicyId& policy_id) const {
    std::shared_lock lock(policies_mutex_);
    auto it = policies_.find(policy_id);
    if (it == policies_.end()) {
        return Error{ErrorCode::NotFound, "Policy not found: " + policy_id};
    }
    return it->second;
}

std::vector<PolicyRecord> PolicyEngine::list_policies() const {
    std::shared_lock lock(policies_mutex_);
    std::vector<PolicyRecord> out;
    out.reserve(policies_.size());
    for (const auto& [id, record] : policies_) out.push_back(record);
    std::sort(out.begin(), out.end(), [](const PolicyRecord& a, const PolicyRecord& b) {
        return a.created_at < b.created_at;
    });
    return out;
}

std::shared_ptr<IPolicy> PolicyEngine::find_policy(const PolicyId& policy_id) const {
    std::shared_lock lock(policies_mutex_);
    auto it = policies_.find(policy_id);
    return it == policies_.end() ? nullptr : it->second.policy;
}

// ── Bindings ─────────────────────────────────

Result<PolicyBinding> PolicyEngine::attach(const ClusterId& cluster_id, const PolicyId& policy_id,
                                           AttachOptions options) {
    auto record = get_policy(policy_id);
    if (!record) return record.error();

    std::lock_guard binding_lock(binding_mutex_);

    auto cluster = registry_.get_cluster(cluster_id);
    if (!cluster) return cluster.error();

    for (const auto& existing : cluster->bindings) {
        if (existing.policy_id == policy_id) {
            logger_.debug(kComponent, std::format("Policy {} already attached to {}",
                                                  policy_id, cluster_id));
            return existing;
        }
        if (existing.policy_type == record->type) {
            return Error{ErrorCode::PolicyConflict,
                         std::format("Cluster {} already has a {} ({})",
                                     cluster_id, record->type, existing.policy_id)};
        }
    }

    PolicyBinding binding{
        .cluster_id = cluster_id,
        .policy_id = policy_id,
        .policy_type = record->type,
        .level = options.level.value_or(defaults_.default_level),
        .enabled = options.enabled,
        .priority = options.priority.value_or(
            record->policy->default_priority().value_or(defaults_.default_priority)),
        .sequence = 0
    };

    auto stored = registry_.put_binding(binding);
    if (!stored) return stored.error();

    logger_.info(kComponent, std::format("Attached {} {} to {} (level={}, priority={})",
                                         record->type, policy_id, cluster_id,
                                         to_string(binding.level), binding.priority));

    // Read back to report the assigned attach sequence.
    auto refreshed = registry_.get_cluster(cluster_id);
    if (refreshed) {
        for (const auto& b : refreshed->bindings) {
            if (b.policy_id == policy_id) return b;
        }
    }
    return binding;
}

Result<void> PolicyEngine::detach(const ClusterId& cluster_id, const PolicyId& policy_id) {
    std::lock_guard binding_lock(binding_mutex_);
    auto removed = registry_.remove_binding(cluster_id, policy_id);
    if (removed) {
        logger_.info(kComponent, std::format("Detached {} from {}", policy_id, cluster_id));
    }
    return removed;
}

Result<PolicyBinding> PolicyEngine::update_binding(const ClusterId& cluster_id,
                                                   const PolicyId& policy_id,
                                                   BindingUpdate update) {
    std::lock_guard binding_lock(binding_mutex_);

    auto cluster = registry_.get_cluster(cluster_id);
    if (!cluster) return cluster.error();

    auto it = std::find_if(cluster->bindings.begin(), cluster->bindings.end(),
                           [&](const PolicyBinding& b) { return b.policy_id == policy_id; });
    if (it == cluster->bindings.end()) {
        return Error{ErrorCode::NotFound,
                     std::format("Policy {} is not attached to cluster {}", policy_id, cluster_id)};
    }

    PolicyBinding binding = *it;
    if (update.level) binding.level = *update.level;
    if (update.priority) binding.priority = *update.priority;
    if (update.enabled) binding.enabled = *update.enabled;

    auto stored = registry_.put_binding(binding);
    if (!stored) return stored.error();

    logger_.info(kComponent, std::format("Updated binding {} on {} (level={}, priority={}, enabled={})",
                                         policy_id, cluster_id, to_string(binding.level),
                                         binding.priority, binding.enabled));
    return binding;
}

Result<std::vector<PolicyBinding>> PolicyEngine::bindings(const ClusterId& cluster_id) const {
    auto cluster = registry_.get_cluster(cluster_id);
    if (!cluster) return cluster.error();
    return cluster->bindings;
}

// ── Evaluation ───────────────────────────────

PolicyEvaluation PolicyEngine::evaluate(const ClusterId& cluster_id, Action& action,
                                        PolicyPhase phase) {
    PolicyEvaluation evaluation;
    evaluation.phase = phase;

    if (cluster_id.empty()) return evaluation;
    auto cluster = registry_.get_cluster(cluster_id);
    if (!cluster) return evaluation;

    PolicyContext ctx{.phase = phase, .cluster_id = cluster_id, .registry = registry_};

    for (const auto& binding : cluster->bindings) {
        if (!binding.enabled) continue;

        auto policy = find_policy(binding.policy_id);
        if (!policy) {
            logger_.warn(kComponent, std::format("Binding on {} references unknown policy {}",
                                                 cluster_id, binding.policy_id));
            continue;
        }
        if (!policy->handles(action.type(), phase)) continue;

        const Params before = action.inputs();
        PolicyOutcome outcome;
        try {
            outcome = policy->check(ctx, action);
        } catch (const std::exception& e) {
            outcome = PolicyOutcome::critical(std::string("Policy check threw: ") + e.what());
        }

        PolicyResult result{
            .policy_id = binding.policy_id,
            .policy_type = binding.policy_type,
            .level = binding.level,
            .raw = outcome.status,
            .effective = apply_enforcement(outcome.status, binding.level),
            .reason = std::move(outcome.reason),
            .mutated_inputs = Params::diff_keys(before, action.inputs())
        };

        auto line = std::format("{} {} {} on {}: raw={} effective={} {}",
                                to_string(phase), result.policy_type, result.policy_id,
                                action.id(), to_string(result.raw),
                                to_string(result.effective), result.reason);
        if (result.effective == CheckStatus::Ok) {
            logger_.debug(kComponent, line);
        } else {
            logger_.warn(kComponent, line);
        }

        const bool stop = result.effective == CheckStatus::Critical;
        evaluation.results.push_back(std::move(result));
        if (stop) break;
    }
    return evaluation;
}

}  // namespace cluster_pilot
