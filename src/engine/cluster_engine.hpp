/**
 * @file cluster_engine.hpp
 * @brief Top-level ClusterEngine facade: ties all modules together.
 * @author Dimitris Kafetzis
 *
 * Provides a single entry point for:
 *   1. Registering clusters, nodes and policies
 *   2. Submitting and cancelling actions
 *   3. Observing action state, locks and telemetry
 *
 * The registry and driver are injected as interfaces so tests can supply
 * their own; by default an in-memory registry and a simulated driver are used.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "driver/driver.hpp"
#include "driver/simulated_driver.hpp"
#include "engine/action_executor.hpp"
#include "engine/deferred_scheduler.hpp"
#include "engine/dispatcher.hpp"
#include "lock/action_lock.hpp"
#include "policy/policy_engine.hpp"
#include "registry/target_registry.hpp"
#include "telemetry/event_recorder.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace cluster_pilot {

/**
 * @brief A registered target together with the action that builds it.
 */
struct Submission {
    TargetId target;
    ActionId action;
};

class ClusterEngine {
public:
    struct Options {
        Config config;
        std::unique_ptr<ILogSink> log_sink;
        LogLevel log_level = LogLevel::Info;
        std::unique_ptr<ITargetRegistry> registry;     ///< MemoryRegistry when null
        std::unique_ptr<IDriver> driver;               ///< SimulatedDriver when null
        std::unique_ptr<ILogSink> event_sink;          ///< From [telemetry] when null
    };

    explicit ClusterEngine(Options opts);
    ~ClusterEngine();

    // Non-copyable, non-movable
    ClusterEngine(const ClusterEngine&) = delete;
    ClusterEngine& operator=(const ClusterEngine&) = delete;

    // ── Lifecycle ────────────────────────────
    Result<void> start();
    void shutdown();
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    // ── Targets ──────────────────────────────

    /// Register a cluster (INIT) and submit CLUSTER_CREATE for it.
    Result<Submission> create_cluster(ClusterSpec spec);

    /// Register a node (INIT) and submit NODE_CREATE for it.
    Result<Submission> create_node(NodeSpec spec);

    // ── Policies ─────────────────────────────

    /// Parse a YAML policy document and create the policy.
    Result<PolicyRecord> create_policy(std::string name, std::string type,
                                       std::string_view yaml_document);

    Result<ActionId> attach_policy(const ClusterId& cluster_id, const PolicyId& policy_id,
                                   AttachOptions options = {});
    Result<ActionId> detach_policy(const ClusterId& cluster_id, const PolicyId& policy_id);

    // ── Actions ──────────────────────────────
    Result<ActionId> submit(ActionType type, TargetId target, Params inputs = {});
    Result<ActionId> submit(ActionPtr action);
    Result<void> cancel(const ActionId& action_id);
    [[nodiscard]] Result<ActionSnapshot> action(const ActionId& action_id) const;
    std::optional<ActionStatus> wait(const ActionId& action_id,
                                     std::chrono::milliseconds timeout) const;

    /// Administrative lock override; the steal is logged and recorded.
    std::optional<LockRecord> steal_lock(const TargetId& target_id);

    // ── Accessors (for testing) ─────────────
    ITargetRegistry& registry() { return *registry_; }
    IDriver& driver() { return *driver_; }
    /// Null when a custom driver was injected.
    SimulatedDriver* simulated_driver() { return simulated_; }
    ActionLockManager& locks() { return locks_; }
    PolicyEngine& policies() { return policies_; }
    DeferredScheduler& deferred() { return deferred_; }
    Dispatcher& dispatcher() { return dispatcher_; }
    EventRecorder& events() { return *events_; }
    Logger& logger() { return logger_; }
    const Config& config() const { return config_; }

private:
    Config config_;
    Logger logger_;
    std::unique_ptr<ITargetRegistry> registry_;
    std::unique_ptr<IDriver> driver_;
    SimulatedDriver* simulated_ = nullptr;
    std::shared_ptr<EventRecorder> events_;

    ActionLockManager locks_;
    PolicyEngine policies_;
    DeferredScheduler deferred_;
    ActionExecutor executor_;
    Dispatcher dispatcher_;

    std::atomic<bool> running_{false};
};

/// Dispatcher settings derived from [engine], [dispatcher] and [lock].
DispatcherOptions dispatcher_options(const Config& config);

}  // namespace cluster_pilot
