/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for ClusterPilot extension points.
 * @author Dimitris Kafetzis
 *
 * Built-in policy types and drivers are plugged in through templates that
 * check these constraints at compile time; the engine itself only sees the
 * virtual interfaces.
 */

#pragma once

#include "core/result.hpp"

#include <concepts>
#include <memory>
#include <string_view>

namespace cluster_pilot {

// Forward declarations
class IPolicy;
struct PolicySpec;

// ─────────────────────────────────────────────
// PolicyType
// ─────────────────────────────────────────────

/**
 * @concept PolicyType
 * @brief Constrains policy classes that can be registered by type.
 *
 * A policy type names itself and validates a spec into an instance:
 *
 *   static constexpr std::string_view kTypeName = "DeletionPolicy";
 *   static Result<std::shared_ptr<IPolicy>> create(const PolicySpec& spec);
 */
template <typename T>
concept PolicyType = std::derived_from<T, IPolicy> && requires(const PolicySpec& spec) {
    { T::kTypeName } -> std::convertible_to<std::string_view>;
    { T::create(spec) } -> std::same_as<Result<std::shared_ptr<IPolicy>>>;
};

}  // namespace cluster_pilot
