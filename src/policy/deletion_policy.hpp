/**
 * @file deletion_policy.hpp
 * @brief DeletionPolicy: chooses which nodes a shrinking action removes.
 * @author Dimitris Kafetzis
 *
 * PRE of CLUSTER_SCALE_IN, CLUSTER_DEL_NODES, CLUSTER_DELETE and NODE_DELETE:
 * selects candidates and writes the `deletion.*` inputs the action body acts
 * on. POST of the same actions: reduces the cluster's desired capacity by the
 * number of nodes actually removed, when configured to.
 */

#pragma once

#include "model/cluster.hpp"
#include "policy/policy.hpp"

#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace cluster_pilot {

enum class DeletionCriteria : uint8_t {
    OldestFirst,
    OldestProfileFirst,
    YoungestFirst,
    Random
};

[[nodiscard]] constexpr std::string_view to_string(DeletionCriteria criteria) noexcept {
    switch (criteria) {
        case DeletionCriteria::OldestFirst:        return "OLDEST_FIRST";
        case DeletionCriteria::OldestProfileFirst: return "OLDEST_PROFILE_FIRST";
        case DeletionCriteria::YoungestFirst:      return "YOUNGEST_FIRST";
        case DeletionCriteria::Random:             return "RANDOM";
    }
    return "UNKNOWN";
}

std::optional<DeletionCriteria> parse_deletion_criteria(std::string_view name) noexcept;

struct DeletionPolicyConfig {
    DeletionCriteria criteria = DeletionCriteria::OldestFirst;
    bool destroy_after_deletion = true;
    int64_t grace_period = 0;                 ///< Seconds
    bool reduce_desired_capacity = false;
};

/**
 * @brief Rank nodes by criteria and return the ids of the first `count`.
 *
 * Ties are broken by index, then id. Returns fewer ids when fewer nodes are
 * given. Exposed for testing.
 */
std::vector<NodeId> select_candidates(std::span<const Node> eligible,
                                      DeletionCriteria criteria, size_t count);

class DeletionPolicy : public IPolicy {
public:
    static constexpr std::string_view kTypeName = "DeletionPolicy";

    /// Validate the spec; InvalidPolicyConfig on unknown keys or bad values.
    static Result<std::shared_ptr<IPolicy>> create(const PolicySpec& spec);

    DeletionPolicy(DeletionPolicyConfig config, PolicySpec spec);

    [[nodiscard]] std::string_view type_name() const noexcept override { return kTypeName; }
    [[nodiscard]] bool handles(ActionType type, PolicyPhase phase) const noexcept override;
    PolicyOutcome check(const PolicyContext& ctx, Action& action) override;
    [[nodiscard]] const PolicySpec& spec() const noexcept override { return spec_; }
    [[nodiscard]] std::optional<int32_t> default_priority() const noexcept override { return 400; }

    [[nodiscard]] const DeletionPolicyConfig& config() const noexcept { return config_; }

private:
    PolicyOutcome pre_op(const PolicyContext& ctx, Action& action);
    PolicyOutcome post_op(const PolicyContext& ctx, Action& action);

    DeletionPolicyConfig config_;
    PolicySpec spec_;
};

}  // namespace cluster_pilot
