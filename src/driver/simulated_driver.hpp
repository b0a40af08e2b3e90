/**
 * @file simulated_driver.hpp
 * @brief In-process driver with configurable latency and failure injection.
 * @author Dimitris Kafetzis
 *
 * Stands in for a cloud backend in tests, the demo and the benchmark. Every
 * call is recorded so tests can assert which operations reached the driver.
 */

#pragma once

#include "core/config.hpp"
#include "driver/driver.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <set>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cluster_pilot {

struct DriverCall {
    ActionId action_id;
    ActionId parent_id;
    ActionType type;
    TargetId target;
    DriverStatus status = DriverStatus::Succeeded;
    SteadyTime started;
    SteadyTime finished;
};

class SimulatedDriver : public IDriver {
public:
    using CallHook = std::function<void(const Action&)>;

    explicit SimulatedDriver(DriverConfig config = {});

    DriverOutcome execute(const Action& action, const CancelQuery& cancelled) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "simulated"; }

    // ── Behaviour knobs ──────────────────────
    void set_latency(std::chrono::milliseconds latency);

    /// Fail every call of `type` against `target`.
    void fail_target(const TargetId& target, ActionType type);

    /// Fail the next `times` calls of `type`, whatever the target.
    void fail_next(ActionType type, size_t times = 1);

    /// Health reported by NODE_CHECK for a node (ACTIVE when unset).
    void set_node_health(const NodeId& node, NodeStatus status);

    /// Invoked at the start of every call, outside the driver's lock.
    void on_call(CallHook hook);

    // ── Observation ──────────────────────────
    [[nodiscard]] std::vector<DriverCall> calls() const;
    [[nodiscard]] size_t call_count() const;
    [[nodiscard]] size_t call_count(ActionType type) const;
    [[nodiscard]] size_t max_concurrency() const;
    void reset_calls();

private:
    bool should_fail(const Action& action);

    mutable std::mutex mutex_;
    std::chrono::milliseconds latency_;
    std::chrono::milliseconds checkpoint_interval_;
    std::set<std::pair<TargetId, ActionType>> failing_targets_;
    std::unordered_map<ActionType, size_t> fail_budget_;
    std::unordered_map<NodeId, NodeStatus> health_;
    CallHook hook_;
    std::vector<DriverCall> calls_;
    size_t in_flight_ = 0;
    size_t max_in_flight_ = 0;
};

}  // namespace cluster_pilot
