/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

namespace cluster_pilot {

namespace {

Result<Config> from_table(const toml::table& tbl) {
    Config config;

    // [engine]
    if (auto engine = tbl["engine"]; engine.is_table()) {
        config.engine.id = engine["id"].value_or(std::string{"engine-01"});
    }

    // [dispatcher]
    if (auto dispatcher = tbl["dispatcher"]; dispatcher.is_table()) {
        config.dispatcher.worker_count = static_cast<uint32_t>(
            dispatcher["worker_count"].value_or(int64_t{0}));
        config.dispatcher.drain_timeout_ms = static_cast<uint32_t>(
            dispatcher["drain_timeout_ms"].value_or(int64_t{5000}));
        config.dispatcher.retained_actions = static_cast<uint32_t>(
            dispatcher["retained_actions"].value_or(int64_t{10000}));
    }

    // [lock]
    if (auto lock = tbl["lock"]; lock.is_table()) {
        config.lock.shard_count = static_cast<uint32_t>(
            lock["shard_count"].value_or(int64_t{16}));
        config.lock.max_attempts = static_cast<uint32_t>(
            lock["max_attempts"].value_or(int64_t{10}));
        config.lock.base_backoff_ms = static_cast<uint32_t>(
            lock["base_backoff_ms"].value_or(int64_t{20}));
        config.lock.max_backoff_ms = static_cast<uint32_t>(
            lock["max_backoff_ms"].value_or(int64_t{2000}));
        if (config.lock.shard_count == 0) {
            return Error{ErrorCode::ConfigError, "lock.shard_count must be positive"};
        }
        if (config.lock.max_attempts == 0) {
            return Error{ErrorCode::ConfigError, "lock.max_attempts must be positive"};
        }
    }

    // [policy]
    if (auto policy = tbl["policy"]; policy.is_table()) {
        auto level_name = policy["default_level"].value_or(std::string{"CRITICAL"});
        auto level = parse_enforcement_level(level_name);
        if (!level) {
            return Error{ErrorCode::ConfigError,
                         "policy.default_level is not a valid level: " + level_name};
        }
        config.policy.default_level = *level;
        config.policy.default_priority = static_cast<int32_t>(
            policy["default_priority"].value_or(int64_t{50}));
    }

    // [driver]
    if (auto driver = tbl["driver"]; driver.is_table()) {
        config.driver.latency_ms = static_cast<uint32_t>(
            driver["latency_ms"].value_or(int64_t{0}));
        config.driver.checkpoint_interval_ms = static_cast<uint32_t>(
            driver["checkpoint_interval_ms"].value_or(int64_t{5}));
    }

    // [telemetry]
    if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
        config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
        config.telemetry.max_file_size_mb = static_cast<uint32_t>(
            telemetry["max_file_size_mb"].value_or(int64_t{50}));
        config.telemetry.rotate_count = static_cast<uint32_t>(
            telemetry["rotate_count"].value_or(int64_t{5}));
        config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        config.telemetry.record_events = telemetry["record_events"].value_or(true);
    }

    return config;
}

}  // namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::ConfigError, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ConfigError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<Config> parse_config(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ConfigError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace cluster_pilot
