/**
 * @file simulated_driver.cpp
 * @brief SimulatedDriver implementation.
 * @author Dimitris Kafetzis
 */

#include "driver/simulated_driver.hpp"

#include <algorithm>
#include <format>
#include <thread>

namespace cluster_pilot {

SimulatedDriver::SimulatedDriver(DriverConfig config)
    : latency_(config.latency_ms)
    , checkpoint_interval_(std::max<uint32_t>(config.checkpoint_interval_ms, 1)) {}

void SimulatedDriver::set_latency(std::chrono::milliseconds latency) {
    std::lock_guard lock(mutex_);
    latency_ = latency;
}

void SimulatedDriver::fail_target(const TargetId& target, ActionType type) {
    std::lock_guard lock(mutex_);
    failing_targets_.emplace(target, type);
}

void SimulatedDriver::fail_next(ActionType type, size_t times) {
    std::lock_guard lock(mutex_);
    fail_budget_[type] += times;
}

void SimulatedDriver::set_node_health(const NodeId& node, NodeStatus status) {
    std::lock_guard lock(mutex_);
    health_[node] = status;
}

void SimulatedDriver::on_call(CallHook hook) {
    std::lock_guard lock(mutex_);
    hook_ = std::move(hook);
}

bool SimulatedDriver::should_fail(const Action& action) {
    if (failing_targets_.contains({action.target(), action.type()})) return true;
    auto it = fail_budget_.find(action.type());
    if (it != fail_budget_.end() && it->second > 0) {
        --it->second;
        return true;
    }
    return false;
}

DriverOutcome SimulatedDriver::execute(const Action& action, const CancelQuery& cancelled) {
    const auto started = std::chrono::steady_clock::now();

    CallHook hook;
    std::chrono::milliseconds latency{0};
    std::chrono::milliseconds interval{1};
    bool fail = false;
    {
        std::lock_guard lock(mutex_);
        hook = hook_;
        latency = latency_;
        interval = checkpoint_interval_;
        fail = should_fail(action);
        max_in_flight_ = std::max(max_in_flight_, ++in_flight_);
    }

    if (hook) hook(action);

    DriverOutcome outcome;
    const auto deadline = started + latency;
    while (true) {
        if (cancelled && cancelled()) {
            outcome = {DriverStatus::Cancelled,
                       std::format("{} on {} cancelled at checkpoint",
                                   to_string(action.type()), action.target()), std::nullopt};
            break;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) break;
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
            interval, deadline - now));
    }

    if (outcome.status != DriverStatus::Cancelled) {
        if (fail) {
            outcome = {DriverStatus::Failed,
                       std::format("Injected failure: {} on {}",
                                   to_string(action.type()), action.target()), std::nullopt};
        } else if (action.type() == ActionType::NodeCheck) {
            std::lock_guard lock(mutex_);
            auto it = health_.find(action.target());
            outcome.observed = it == health_.end() ? NodeStatus::Active : it->second;
        } else if (action.type() == ActionType::NodeRecover) {
            std::lock_guard lock(mutex_);
            health_.erase(action.target());
            outcome.observed = NodeStatus::Active;
        }
    }

    std::lock_guard lock(mutex_);
    --in_flight_;
    calls_.push_back(DriverCall{
        .action_id = action.id(),
        .parent_id = action.parent_id(),
        .type = action.type(),
        .target = action.target(),
        .status = outcome.status,
        .started = started,
        .finished = std::chrono::steady_clock::now()
    });
    return outcome;
}

std::vector<DriverCall> SimulatedDriver::calls() const {
    std::lock_guard lock(mutex_);
    return calls_;
}

size_t SimulatedDriver::call_count() const {
    std::lock_guard lock(mutex_);
    return calls_.size();
}

size_t SimulatedDriver::call_count(ActionType type) const {
    std::lock_guard lock(mutex_);
    return static_cast<size_t>(std::count_if(calls_.begin(), calls_.end(),
        [type](const DriverCall& c) { return c.type == type; }));
}

size_t SimulatedDriver::max_concurrency() const {
    std::lock_guard lock(mutex_);
    return max_in_flight_;
}

void SimulatedDriver::reset_calls() {
    std::lock_guard lock(mutex_);
    calls_.clear();
    max_in_flight_ = in_flight_;
}

}  // namespace cluster_pilot
