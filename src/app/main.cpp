/**
 * @file main.cpp
 * @brief ClusterPilot daemon entry point.
 * @author Dimitris Kafetzis
 *
 * Wires all modules into a running control-plane engine:
 *   Config → Logger → Registry → Locks → Policies → Executor → Dispatcher → Telemetry
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "engine/cluster_engine.hpp"
#include "model/action_keys.hpp"
#include "policy/policy_registry.hpp"
#include "policy/policy_spec.hpp"
#include "telemetry/json_sink.hpp"

#include <charconv>
#include <csignal>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

using namespace cluster_pilot;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║            ClusterPilot v1.0.0            ║
  ║   Cluster Lifecycle Control-Plane Engine  ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::optional<uint32_t> workers;
    std::string log_dir;
    bool demo_mode = false;
    std::string validate_type;
    std::filesystem::path validate_path;
};

void print_usage() {
    std::cout << "Usage: cluster_pilot [OPTIONS]\n"
              << "  --config <path>                  Configuration file (default: config/default.toml)\n"
              << "  --workers <n>                    Dispatcher worker count\n"
              << "  --log-dir <path>                 Log output directory\n"
              << "  --demo                           Run a scale-in demo, then exit\n"
              << "  --validate-policy <type> <file>  Validate a policy document, then exit\n"
              << "  --help, -h                       Show this help message\n";
}

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--workers" && i + 1 < argc) {
            std::string_view value = argv[++i];
            uint32_t workers = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), workers);
            if (ec != std::errc{} || ptr != value.data() + value.size()) {
                return Error{ErrorCode::InvalidArgument,
                             "--workers expects a number, got '" + std::string(value) + "'"};
            }
            args.workers = workers;
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--validate-policy" && i + 2 < argc) {
            args.validate_type = argv[++i];
            args.validate_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            return Error{ErrorCode::InvalidArgument, "Unknown or incomplete option: " + arg};
        }
    }
    return args;
}

/**
 * @brief Parse and validate a policy document without starting the engine.
 */
int validate_policy(const std::string& type, const std::filesystem::path& path) {
    auto spec = load_policy_spec(path);
    if (!spec) {
        std::cerr << "Invalid policy document: " << spec.error().message << std::endl;
        return 1;
    }
    auto policy = PolicyRegistry::global().create(type, *spec);
    if (!policy) {
        std::cerr << to_string(policy.error().code) << ": " << policy.error().message << std::endl;
        return 1;
    }
    std::cout << type << " " << path.string() << ": OK" << std::endl;
    for (const auto& [key, value] : spec->properties) {
        std::cout << "  " << key << " = " << to_string(value) << std::endl;
    }
    return 0;
}

void print_cluster(ClusterEngine& engine, const ClusterId& cluster_id) {
    auto cluster = engine.registry().get_cluster(cluster_id);
    if (!cluster) {
        std::cout << "  cluster " << cluster_id << ": " << cluster.error().message << std::endl;
        return;
    }
    std::cout << std::format("  cluster {} status={} desired={} size={}\n", cluster->name,
                             to_string(cluster->status), cluster->desired_capacity,
                             cluster->size());
    for (const auto& node : engine.registry().list_nodes(cluster_id)) {
        std::cout << std::format("    {} index={} status={}\n", node.name, node.index,
                                 to_string(node.status));
    }
}

bool await(ClusterEngine& engine, const Result<ActionId>& action, std::string_view what) {
    if (!action) {
        engine.logger().error("demo", std::format("{} not submitted: {}", what,
                                                  action.error().message));
        return false;
    }
    auto status = engine.wait(*action, std::chrono::seconds(30));
    auto snap = engine.action(*action);
    std::cout << std::format("{} -> {}", what, status ? to_string(*status) : "TIMEOUT");
    if (snap && snap->status != ActionStatus::Succeeded) {
        std::cout << " (" << snap->reason.message << ")";
    }
    std::cout << std::endl;
    return status == ActionStatus::Succeeded;
}

/**
 * @brief Run a single demo: build a cluster, attach a deletion policy,
 *        scale in synchronously, then scale in with a grace period and cancel.
 */
int run_demo(ClusterEngine& engine) {
    engine.logger().info("demo", "=== Demo Mode ===");

    auto created = engine.create_cluster(ClusterSpec{
        .name = "web", .profile_id = "profile-web", .desired_capacity = 4,
        .min_size = 1, .max_size = 8});
    if (!created) {
        std::cerr << "Cluster not created: " << created.error().message << std::endl;
        return 1;
    }
    const ClusterId cluster_id = created->target;
    if (!await(engine, created->action, "CLUSTER_CREATE")) return 1;
    print_cluster(engine, cluster_id);

    auto policy = engine.create_policy("delete-oldest", "DeletionPolicy", R"(
type: DeletionPolicy
version: "1.0"
properties:
  criteria: OLDEST_FIRST
  destroy_after_deletion: true
  grace_period: 0
  reduce_desired_capacity: true
)");
    if (!policy) {
        std::cerr << "Policy not created: " << policy.error().message << std::endl;
        return 1;
    }
    if (!await(engine, engine.attach_policy(cluster_id, policy->id), "CLUSTER_ATTACH_POLICY")) {
        return 1;
    }

    await(engine, engine.submit(ActionType::ClusterScaleIn, cluster_id,
                                Params{{keys::kCount, int64_t{1}}}),
          "CLUSTER_SCALE_IN count=1");
    print_cluster(engine, cluster_id);

    // Same scale-in with a grace period, cancelled before the timers fire.
    await(engine, engine.detach_policy(cluster_id, policy->id), "CLUSTER_DETACH_POLICY");
    auto graceful = engine.create_policy("delete-graceful", "DeletionPolicy", R"(
criteria: YOUNGEST_FIRST
grace_period: 60
reduce_desired_capacity: true
)");
    if (graceful) {
        await(engine, engine.attach_policy(cluster_id, graceful->id), "CLUSTER_ATTACH_POLICY");
        auto deferred = engine.submit(ActionType::ClusterScaleIn, cluster_id,
                                      Params{{keys::kCount, int64_t{2}}});
        await(engine, deferred, "CLUSTER_SCALE_IN count=2 grace=60s");
        print_cluster(engine, cluster_id);
        if (deferred) {
            auto cancelled = engine.cancel(*deferred);
            std::cout << "cancel deferred deletions -> "
                      << (cancelled ? "OK" : cancelled.error().message) << std::endl;
        }
        print_cluster(engine, cluster_id);
    }

    engine.logger().info("demo", "=== Demo Complete ===");
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        std::cerr << parsed.error().message << std::endl;
        print_usage();
        return 2;
    }
    auto args = *parsed;

    if (!args.validate_type.empty()) {
        return validate_policy(args.validate_type, args.validate_path);
    }

    print_banner();

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (args.workers) config.dispatcher.worker_count = *args.workers;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    // ── Initialize Engine ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (args.demo_mode) {
        log_sink = std::make_unique<StdoutSink>();
    } else if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "cluster_pilot",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }

    ClusterEngine engine(ClusterEngine::Options{
        .config = config,
        .log_sink = std::move(log_sink),
        .log_level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info),
        .registry = nullptr,
        .driver = nullptr,
        .event_sink = nullptr
    });

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (auto started = engine.start(); !started) {
        std::cerr << "Failed to start: " << started.error().message << std::endl;
        return 1;
    }

    // ── Demo mode shortcut ───────────────────
    if (args.demo_mode) {
        int rc = run_demo(engine);
        engine.shutdown();
        return rc;
    }

    // ── Main Loop ────────────────────────────
    engine.logger().info("main", "Entering main loop. Press Ctrl+C to shutdown.");

    uint64_t loop_count = 0;
    while (!g_shutdown_requested) {
        // Periodic status logging (every 30 seconds at 100ms intervals)
        if (loop_count % 300 == 0 && loop_count > 0) {
            auto stats = engine.dispatcher().stats();
            engine.logger().info("main", std::format(
                "Status: {} queued, {} running, {} succeeded, {} failed, {} locks held, {} timers",
                stats.queued, stats.running, stats.succeeded, stats.failed,
                engine.locks().lock_count(), engine.deferred().pending_count()));
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        ++loop_count;
    }

    // ── Graceful Shutdown ────────────────────
    engine.logger().info("main", "Shutdown requested. Cleaning up...");
    engine.shutdown();
    return 0;
}
