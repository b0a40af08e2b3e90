/**
 * @file cluster_engine.cpp
 * @brief ClusterEngine implementation.
 * @author Dimitris Kafetzis
 */

#include "engine/cluster_engine.hpp"
#include "model/action_keys.hpp"
#include "policy/policy_spec.hpp"
#include "registry/memory_registry.hpp"
#include "telemetry/json_sink.hpp"

#include <format>
#include <thread>

namespace cluster_pilot {

namespace {
constexpr std::string_view kComponent = "engine";

std::unique_ptr<ILogSink> log_sink_or_null(std::unique_ptr<ILogSink> sink) {
    if (sink) return sink;
    return std::make_unique<NullSink>();
}

std::unique_ptr<ITargetRegistry> registry_or_memory(std::unique_ptr<ITargetRegistry> registry) {
    if (registry) return registry;
    return std::make_unique<MemoryRegistry>();
}

std::unique_ptr<IDriver> driver_or_simulated(std::unique_ptr<IDriver> driver,
                                             const DriverConfig& config) {
    if (driver) return driver;
    return std::make_unique<SimulatedDriver>(config);
}

std::unique_ptr<ILogSink> event_sink(const TelemetryConfig& telemetry,
                                     std::unique_ptr<ILogSink> injected) {
    if (injected) return injected;
    if (!telemetry.record_events) return std::make_unique<NullSink>();
    return std::make_unique<JsonFileSink>(telemetry.log_dir, "events",
                                          telemetry.max_file_size_mb, telemetry.rotate_count);
}
}  // namespace

DispatcherOptions dispatcher_options(const Config& config) {
    size_t workers = config.dispatcher.worker_count;
    if (workers == 0) {
        workers = std::thread::hardware_concurrency();
        if (workers == 0) workers = 4;  // fallback
    }
    return DispatcherOptions{
        .worker_count = workers,
        .worker_prefix = config.engine.id,
        .max_attempts = config.lock.max_attempts,
        .base_backoff = std::chrono::milliseconds(config.lock.base_backoff_ms),
        .max_backoff = std::chrono::milliseconds(config.lock.max_backoff_ms),
        .drain_timeout = std::chrono::milliseconds(config.dispatcher.drain_timeout_ms),
        .retained_actions = config.dispatcher.retained_actions
    };
}

ClusterEngine::ClusterEngine(Options opts)
    : config_(std::move(opts.config))
    , logger_(log_sink_or_null(std::move(opts.log_sink)), opts.log_level)
    , registry_(registry_or_memory(std::move(opts.registry)))
    , driver_(driver_or_simulated(std::move(opts.driver), config_.driver))
    , simulated_(dynamic_cast<SimulatedDriver*>(driver_.get()))
    , events_(std::make_shared<EventRecorder>(event_sink(config_.telemetry,
                                                         std::move(opts.event_sink))))
    , locks_(logger_, config_.lock.shard_count)
    , policies_(*registry_, logger_, config_.policy)
    , deferred_(logger_)
    , executor_(*registry_, locks_, *driver_, policies_, deferred_, logger_,
                LockRetry{config_.lock.max_attempts,
                          std::chrono::milliseconds(config_.lock.base_backoff_ms),
                          std::chrono::milliseconds(config_.lock.max_backoff_ms)})
    , dispatcher_(locks_, policies_, executor_, *registry_, deferred_, logger_,
                  dispatcher_options(config_)) {
    executor_.set_submitter([this](ActionPtr action) {
        return dispatcher_.submit(std::move(action));
    });
    dispatcher_.add_sink(events_);
}

ClusterEngine::~ClusterEngine() {
    shutdown();
}

Result<void> ClusterEngine::start() {
    if (running_.exchange(true)) {
        return Error{ErrorCode::InvalidState, "Already running"};
    }

    logger_.info(kComponent, std::format("ClusterEngine starting: id={} driver={} workers={}",
                                         config_.engine.id, driver_->name(),
                                         dispatcher_.options().worker_count));

    if (auto started = dispatcher_.start(); !started) {
        running_.store(false);
        return started.error();
    }

    events_->record_custom("engine_started",
        std::format(R"({{"id":"{}","workers":{}}})", json_escape(config_.engine.id),
                    dispatcher_.options().worker_count));
    logger_.info(kComponent, "ClusterEngine started successfully");
    return Result<void>{};
}

void ClusterEngine::shutdown() {
    if (!running_.exchange(false)) {
        // Never started: still stop the timer thread and reject submissions.
        dispatcher_.shutdown();
        return;
    }

    logger_.info(kComponent, "ClusterEngine shutting down...");
    dispatcher_.shutdown();

    const auto stats = dispatcher_.stats();
    events_->record_custom("engine_stopped",
        std::format(R"({{"submitted":{},"succeeded":{},"failed":{},"cancelled":{},"lock_retries":{}}})",
                    stats.submitted, stats.succeeded, stats.failed, stats.cancelled,
                    stats.lock_retries));
    events_->flush();
    logger_.info(kComponent, "ClusterEngine stopped");
    logger_.flush();
}

// ─────────────────────────────────────────────
// Targets
// ─────────────────────────────────────────────

Result<Submission> ClusterEngine::create_cluster(ClusterSpec spec) {
    auto cluster = registry_->create_cluster(std::move(spec));
    if (!cluster) return cluster.error();

    auto action = submit(ActionType::ClusterCreate, cluster->id);
    if (!action) return action.error();
    return Submission{cluster->id, *action};
}

Result<Submission> ClusterEngine::create_node(NodeSpec spec) {
    spec.status = NodeStatus::Init;
    auto node = registry_->create_node(std::move(spec));
    if (!node) return node.error();

    auto action = submit(ActionType::NodeCreate, node->id);
    if (!action) return action.error();
    return Submission{node->id, *action};
}

// ─────────────────────────────────────────────
// Policies
// ─────────────────────────────────────────────

Result<PolicyRecord> ClusterEngine::create_policy(std::string name, std::string type,
                                                  std::string_view yaml_document) {
    auto spec = parse_policy_spec(yaml_document);
    if (!spec) return spec.error();
    return policies_.create_policy(std::move(name), std::move(type), *spec);
}

Result<ActionId> ClusterEngine::attach_policy(const ClusterId& cluster_id,
                                              const PolicyId& policy_id,
                                              AttachOptions options) {
    Params inputs{{keys::kPolicyId, policy_id}, {keys::kPolicyEnabled, options.enabled}};
    if (options.level) inputs.set(keys::kPolicyLevel, std::string(to_string(*options.level)));
    if (options.priority) inputs.set(keys::kPolicyPriority, int64_t{*options.priority});
    return submit(ActionType::ClusterAttachPolicy, cluster_id, std::move(inputs));
}

Result<ActionId> ClusterEngine::detach_policy(const ClusterId& cluster_id,
                                              const PolicyId& policy_id) {
    return submit(ActionType::ClusterDetachPolicy, cluster_id,
                  Params{{keys::kPolicyId, policy_id}});
}

// ─────────────────────────────────────────────
// Actions
// ─────────────────────────────────────────────

Result<ActionId> ClusterEngine::submit(ActionType type, TargetId target, Params inputs) {
    if (target.empty()) {
        return Error{ErrorCode::InvalidArgument, "Empty target id"};
    }
    return dispatcher_.submit(Action::create(type, std::move(target), std::move(inputs)));
}

Result<ActionId> ClusterEngine::submit(ActionPtr action) {
    return dispatcher_.submit(std::move(action));
}

Result<void> ClusterEngine::cancel(const ActionId& action_id) {
    return dispatcher_.cancel(action_id);
}

Result<ActionSnapshot> ClusterEngine::action(const ActionId& action_id) const {
    return dispatcher_.get(action_id);
}

std::optional<ActionStatus> ClusterEngine::wait(const ActionId& action_id,
                                                std::chrono::milliseconds timeout) const {
    return dispatcher_.wait(action_id, timeout);
}

std::optional<LockRecord> ClusterEngine::steal_lock(const TargetId& target_id) {
    auto previous = locks_.steal(target_id);
    if (previous) events_->record_lock_steal(target_id, previous->action_id);
    return previous;
}

}  // namespace cluster_pilot
