/**
 * @file config.hpp
 * @brief Engine configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"
#include "core/types.hpp"

namespace cluster_pilot {

struct EngineConfig {
    std::string id = "engine-01";          ///< Prefix for worker identities
};

struct DispatcherConfig {
    uint32_t worker_count = 0;             ///< 0 = hardware_concurrency
    uint32_t drain_timeout_ms = 5000;      ///< Shutdown drain budget
    uint32_t retained_actions = 10000;     ///< Finished actions kept queryable; 0 keeps all
};

struct LockConfig {
    uint32_t shard_count = 16;
    uint32_t max_attempts = 10;            ///< Acquisition attempts before LockBusy
    uint32_t base_backoff_ms = 20;
    uint32_t max_backoff_ms = 2000;
};

struct PolicyConfig {
    EnforcementLevel default_level = EnforcementLevel::Critical;
    int32_t default_priority = 50;
};

struct DriverConfig {
    uint32_t latency_ms = 0;               ///< Simulated per-call latency
    uint32_t checkpoint_interval_ms = 5;   ///< Cancellation polling granularity
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
    bool record_events = true;             ///< Write action events as NDJSON
};

/**
 * @brief Top-level engine configuration.
 */
struct Config {
    EngineConfig engine;
    DispatcherConfig dispatcher;
    LockConfig lock;
    PolicyConfig policy;
    DriverConfig driver;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Parse configuration from TOML text.
 */
Result<Config> parse_config(std::string_view toml_text);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace cluster_pilot
