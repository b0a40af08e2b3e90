/**
 * @file driver.hpp
 * @brief Driver contract: the collaborator that actually touches resources.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"
#include "model/action.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace cluster_pilot {

enum class DriverStatus : uint8_t {
    Succeeded,
    Failed,
    Cancelled
};

[[nodiscard]] constexpr std::string_view to_string(DriverStatus status) noexcept {
    switch (status) {
        case DriverStatus::Succeeded: return "SUCCEEDED";
        case DriverStatus::Failed:    return "FAILED";
        case DriverStatus::Cancelled: return "CANCELLED";
    }
    return "UNKNOWN";
}

struct DriverOutcome {
    DriverStatus status = DriverStatus::Succeeded;
    std::string detail;
    std::optional<NodeStatus> observed;       ///< Node health reported by NODE_CHECK

    [[nodiscard]] bool ok() const noexcept { return status == DriverStatus::Succeeded; }
};

/**
 * @brief Abstract interface for resource drivers (runtime polymorphism).
 *
 * execute() performs one node-level operation (NODE_CREATE, NODE_DELETE,
 * NODE_CHECK, NODE_RECOVER) for the given action. Implementations poll
 * `cancelled` at safe checkpoints, clean up partial effects and report
 * Cancelled when it returns true.
 */
class IDriver {
public:
    virtual ~IDriver() = default;

    virtual DriverOutcome execute(const Action& action, const CancelQuery& cancelled) = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace cluster_pilot
