/**
 * @file deletion_policy.cpp
 * @brief DeletionPolicy implementation.
 * @author Dimitris Kafetzis
 */

#include "policy/deletion_policy.hpp"
#include "model/action_keys.hpp"

#include <algorithm>
#include <format>
#include <numeric>
#include <random>
#include <tuple>

namespace cluster_pilot {

std::optional<DeletionCriteria> parse_deletion_criteria(std::string_view name) noexcept {
    if (name == "OLDEST_FIRST")         return DeletionCriteria::OldestFirst;
    if (name == "OLDEST_PROFILE_FIRST") return DeletionCriteria::OldestProfileFirst;
    if (name == "YOUNGEST_FIRST")       return DeletionCriteria::YoungestFirst;
    if (name == "RANDOM")               return DeletionCriteria::Random;
    return std::nullopt;
}

// ─────────────────────────────────────────────
// Candidate selection
// ─────────────────────────────────────────────

std::vector<NodeId> select_candidates(std::span<const Node> eligible,
                                      DeletionCriteria criteria, size_t count) {
    count = std::min(count, eligible.size());
    if (count == 0) return {};

    std::vector<const Node*> ranked;
    ranked.reserve(eligible.size());
    for (const auto& node : eligible) ranked.push_back(&node);

    auto tiebreak = [](const Node* n) { return std::tie(n->index, n->id); };

    switch (criteria) {
        case DeletionCriteria::OldestFirst:
            std::sort(ranked.begin(), ranked.end(), [&](const Node* a, const Node* b) {
                if (a->created_at != b->created_at) return a->created_at < b->created_at;
                return tiebreak(a) < tiebreak(b);
            });
            break;

        case DeletionCriteria::YoungestFirst:
            std::sort(ranked.begin(), ranked.end(), [&](const Node* a, const Node* b) {
                if (a->created_at != b->created_at) return a->created_at > b->created_at;
                return tiebreak(a) < tiebreak(b);
            });
            break;

        case DeletionCriteria::OldestProfileFirst:
            std::sort(ranked.begin(), ranked.end(), [&](const Node* a, const Node* b) {
                if (a->profile_version != b->profile_version) {
                    return a->profile_version < b->profile_version;
                }
                if (a->created_at != b->created_at) return a->created_at < b->created_at;
                return tiebreak(a) < tiebreak(b);
            });
            break;

        case DeletionCriteria::Random: {
            // Policies are shared across workers; one engine per thread.
            thread_local std::mt19937_64 engine{std::random_device{}()};
            // Partial Fisher-Yates: the first `count` slots are a uniform sample.
            for (size_t i = 0; i < count; ++i) {
                std::uniform_int_distribution<size_t> pick(i, ranked.size() - 1);
                std::swap(ranked[i], ranked[pick(engine)]);
            }
            break;
        }
    }

    std::vector<NodeId> result;
    result.reserve(count);
    for (size_t i = 0; i < count; ++i) result.push_back(ranked[i]->id);
    return result;
}

// ─────────────────────────────────────────────
// DeletionPolicy
// ─────────────────────────────────────────────

Result<std::shared_ptr<IPolicy>> DeletionPolicy::create(const PolicySpec& spec) {
    auto known = reject_unknown_keys(spec, {"criteria", "destroy_after_deletion",
                                            "grace_period", "reduce_desired_capacity"});
    if (!known) return known.error();

    DeletionPolicyConfig config;

    auto criteria = read_string(spec, "criteria", std::string(to_string(config.criteria)));
    if (!criteria) return criteria.error();
    auto parsed = parse_deletion_criteria(*criteria);
    if (!parsed) {
        return Error{ErrorCode::InvalidPolicyConfig,
                     std::format("Invalid criteria '{}'; expected OLDEST_FIRST, "
                                 "OLDEST_PROFILE_FIRST, YOUNGEST_FIRST or RANDOM", *criteria)};
    }
    config.criteria = *parsed;

    auto destroy = read_bool(spec, "destroy_after_deletion", config.destroy_after_deletion);
    if (!destroy) return destroy.error();
    config.destroy_after_deletion = *destroy;

    auto grace = read_int(spec, "grace_period", config.grace_period);
    if (!grace) return grace.error();
    if (*grace < 0) {
        return Error{ErrorCode::InvalidPolicyConfig,
                     std::format("grace_period must be >= 0 (got {})", *grace)};
    }
    config.grace_period = *grace;

    auto reduce = read_bool(spec, "reduce_desired_capacity", config.reduce_desired_capacity);
    if (!reduce) return reduce.error();
    config.reduce_desired_capacity = *reduce;

    return std::shared_ptr<IPolicy>(std::make_shared<DeletionPolicy>(config, spec));
}

DeletionPolicy::DeletionPolicy(DeletionPolicyConfig config, PolicySpec spec)
    : config_(config), spec_(std::move(spec)) {}

bool DeletionPolicy::handles(ActionType type, PolicyPhase /*phase*/) const noexcept {
    switch (type) {
        case ActionType::ClusterScaleIn:
        case ActionType::ClusterDelNodes:
        case ActionType::ClusterDelete:
        case ActionType::NodeDelete:
            return true;
        default:
            return false;
    }
}

PolicyOutcome DeletionPolicy::check(const PolicyContext& ctx, Action& action) {
    return ctx.phase == PolicyPhase::Pre ? pre_op(ctx, action) : post_op(ctx, action);
}

PolicyOutcome DeletionPolicy::pre_op(const PolicyContext& ctx, Action& action) {
    auto& inputs = action.inputs();

    auto stamp = [&](StringList candidates) {
        inputs.set(keys::kDeletionCandidates, std::move(candidates));
        inputs.set(keys::kDeletionDestroy, config_.destroy_after_deletion);
        inputs.set(keys::kDeletionReduceCapacity, config_.reduce_desired_capacity);
        inputs.set(keys::kDeletionGracePeriod, config_.grace_period);
    };

    // Deferred children arrive with their candidate already chosen.
    if (inputs.contains(keys::kDeletionCandidates)) {
        return PolicyOutcome::ok("candidates already selected");
    }

    switch (action.type()) {
        case ActionType::NodeDelete:
            stamp({action.target()});
            return PolicyOutcome::ok();

        case ActionType::ClusterDelNodes: {
            auto nodes = inputs.get_list(keys::kNodes);
            if (!nodes) return PolicyOutcome::ok("no nodes specified");
            stamp(std::move(*nodes));
            return PolicyOutcome::ok();
        }

        case ActionType::ClusterDelete: {
            StringList all;
            for (const auto& node : ctx.registry.list_nodes(ctx.cluster_id)) {
                all.push_back(node.id);
            }
            stamp(std::move(all));
            return PolicyOutcome::ok();
        }

        case ActionType::ClusterScaleIn:
            break;

        default:
            return PolicyOutcome::ok();
    }

    if (auto nodes = inputs.get_list(keys::kNodes)) {
        stamp(std::move(*nodes));
        return PolicyOutcome::ok();
    }

    const int64_t count = inputs.get_int(keys::kCount).value_or(1);
    if (count < 0) {
        return PolicyOutcome::critical(std::format("Invalid count {}", count));
    }
    if (count == 0) {
        stamp({});
        return PolicyOutcome::ok("nothing to delete");
    }

    std::vector<Node> eligible;
    for (auto& node : ctx.registry.list_nodes(ctx.cluster_id)) {
        if (node.status != NodeStatus::Deleting) eligible.push_back(std::move(node));
    }

    auto candidates = select_candidates(eligible, config_.criteria, static_cast<size_t>(count));
    const auto selected = static_cast<int64_t>(candidates.size());
    stamp(std::move(candidates));

    if (selected < count) {
        return PolicyOutcome::warning(std::format(
            "Only {} of {} requested nodes are eligible for deletion", selected, count));
    }
    return PolicyOutcome::ok(std::format("{} candidate(s) selected by {}",
                                         selected, to_string(config_.criteria)));
}

PolicyOutcome DeletionPolicy::post_op(const PolicyContext& ctx, Action& action) {
    if (!config_.reduce_desired_capacity) return PolicyOutcome::ok();

    // Only act on deletions this policy prepared.
    if (!action.inputs().contains(keys::kDeletionCandidates)) return PolicyOutcome::ok();
    if (action.inputs().get_bool(keys::kDeletionReduceCapacity) == false) {
        return PolicyOutcome::ok();
    }

    const int64_t removed = action.outputs().get_int(keys::kDeletionRemoved).value_or(0);
    if (removed <= 0) return PolicyOutcome::ok();

    // The cluster record is gone once CLUSTER_DELETE succeeds.
    if (action.type() == ActionType::ClusterDelete) return PolicyOutcome::ok();

    auto capacity = ctx.registry.update_cluster_capacity(ctx.cluster_id, -removed);
    if (!capacity) {
        return PolicyOutcome::error("Cannot reduce desired capacity: " + capacity.error().message);
    }
    action.set_output(keys::kDesiredCapacity, *capacity);
    return PolicyOutcome::ok(std::format("desired capacity reduced by {} to {}",
                                         removed, *capacity));
}

}  // namespace cluster_pilot
