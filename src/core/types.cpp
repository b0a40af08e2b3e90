/**
 * @file types.cpp
 * @brief String parsing for the vocabulary enums.
 * @author Dimitris Kafetzis
 */

#include "core/types.hpp"

#include <array>

namespace cluster_pilot {

std::optional<ActionType> parse_action_type(std::string_view name) noexcept {
    static constexpr std::array kAll = {
        ActionType::ClusterCreate,   ActionType::ClusterDelete,
        ActionType::ClusterUpdate,
        ActionType::ClusterAddNodes, ActionType::ClusterDelNodes,
        ActionType::ClusterScaleOut, ActionType::ClusterScaleIn,
        ActionType::ClusterCheck,    ActionType::ClusterRecover,
        ActionType::ClusterAttachPolicy, ActionType::ClusterDetachPolicy,
        ActionType::ClusterUpdatePolicy,
        ActionType::NodeCreate,  ActionType::NodeDelete,
        ActionType::NodeUpdate,
        ActionType::NodeCheck,   ActionType::NodeRecover,
        ActionType::NodeJoin,    ActionType::NodeLeave,
    };
    for (auto type : kAll) {
        if (to_string(type) == name) return type;
    }
    return std::nullopt;
}

std::optional<EnforcementLevel> parse_enforcement_level(std::string_view name) noexcept {
    if (name == "IGNORE")   return EnforcementLevel::Ignore;
    if (name == "WARNING")  return EnforcementLevel::Warning;
    if (name == "ERROR")    return EnforcementLevel::Error;
    if (name == "CRITICAL") return EnforcementLevel::Critical;
    return std::nullopt;
}

}  // namespace cluster_pilot
