/**
 * @file policy_registry.hpp
 * @brief Typed registry mapping a policy-type name to a factory.
 * @author Dimitris Kafetzis
 *
 * Built-in types are registered when the global registry is first used. New
 * policy types are added by registering a factory at process initialization;
 * the Policy Engine only ever sees IPolicy.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "policy/policy.hpp"
#include "policy/policy_spec.hpp"

#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace cluster_pilot {

using PolicyFactory = std::function<Result<std::shared_ptr<IPolicy>>(const PolicySpec&)>;

class PolicyRegistry {
public:
    PolicyRegistry() = default;

    PolicyRegistry(const PolicyRegistry&) = delete;
    PolicyRegistry& operator=(const PolicyRegistry&) = delete;

    /// Process-wide registry, pre-populated with the built-in policy types.
    static PolicyRegistry& global();

    /// Register the built-in DeletionPolicy, ScalingPolicy and HealthPolicy.
    Result<void> register_builtins();

    /// InvalidArgument if the name is empty or already registered.
    Result<void> register_type(std::string type_name, PolicyFactory factory);

    template <PolicyType T>
    Result<void> register_type() {
        return register_type(std::string(T::kTypeName),
                             [](const PolicySpec& spec) { return T::create(spec); });
    }

    /// Build a validated policy instance. NotFound for unknown types.
    Result<std::shared_ptr<IPolicy>> create(std::string_view type_name,
                                            const PolicySpec& spec) const;

    [[nodiscard]] bool contains(std::string_view type_name) const;
    [[nodiscard]] std::vector<std::string> type_names() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, PolicyFactory, std::less<>> factories_;
};

}  // namespace cluster_pilot
