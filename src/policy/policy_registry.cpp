/**
 * @file policy_registry.cpp
 * @brief PolicyRegistry implementation.
 * @author Dimitris Kafetzis
 */

#include "policy/policy_registry.hpp"
#include "policy/deletion_policy.hpp"
#include "policy/health_policy.hpp"
#include "policy/scaling_policy.hpp"

#include <mutex>

namespace cluster_pilot {

PolicyRegistry& PolicyRegistry::global() {
    static PolicyRegistry registry;
    static const bool builtins_ready = registry.register_builtins().has_value();
    (void)builtins_ready;
    return registry;
}

Result<void> PolicyRegistry::register_builtins() {
    if (auto r = register_type<DeletionPolicy>(); !r) return r;
    if (auto r = register_type<ScalingPolicy>(); !r) return r;
    return register_type<HealthPolicy>();
}

Result<void> PolicyRegistry::register_type(std::string type_name, PolicyFactory factory) {
    if (type_name.empty() || !factory) {
        return Error{ErrorCode::InvalidArgument, "Policy type needs a name and a factory"};
    }
    std::unique_lock lock(mutex_);
    auto [it, inserted] = factories_.try_emplace(std::move(type_name), std::move(factory));
    if (!inserted) {
        return Error{ErrorCode::InvalidArgument,
                     "Policy type already registered: " + it->first};
    }
    return {};
}

Result<std::shared_ptr<IPolicy>> PolicyRegistry::create(std::string_view type_name,
                                                        const PolicySpec& spec) const {
    PolicyFactory factory;
    {
        std::shared_lock lock(mutex_);
        auto it = factories_.find(type_name);
        if (it == factories_.end()) {
            return Error{ErrorCode::NotFound,
                         "Unknown policy type: " + std::string(type_name)};
        }
        factory = it->second;
    }
    return factory(spec);
}

bool PolicyRegistry::contains(std::string_view type_name) const {
    std::shared_lock lock(mutex_);
    return factories_.find(type_name) != factories_.end();
}

std::vector<std::string> PolicyRegistry::type_names() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> names;
    names.reserve(factories_.size());
    for (const auto& [name, factory] : factories_) names.push_back(name);
    return names;
}

}  // namespace cluster_pilot
