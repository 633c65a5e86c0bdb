/**
 * @file config.hpp
 * @brief Daemon configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"

namespace agent_dispatch {

struct SchedulerConfig {
    uint32_t max_concurrent_tasks = 10;     ///< Worker pool size and RUNNING bound
    uint32_t lane_depth_limit = 1000;       ///< Per-lane cap for new submissions
    uint32_t default_max_retries = 3;
    uint32_t max_retries_ceiling = 20;      ///< Larger per-task values are rejected
    uint32_t default_timeout_ms = 30000;
    uint32_t retry_base_delay_ms = 1000;
    uint32_t retry_max_delay_ms = 60000;
};

struct RouterConfig {
    double confidence_weight = 0.7;
    double latency_weight = 0.3;
};

struct RegistryConfig {
    double latency_ema_weight = 0.3;        ///< Weight of the newest latency sample
};

struct HealthConfig {
    bool enabled = true;
    uint32_t probe_interval_ms = 30000;
    uint32_t probe_timeout_ms = 5000;
    uint32_t failure_threshold = 3;         ///< Consecutive failures before UNREACHABLE
    uint32_t max_backoff_ms = 300000;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
    bool record_events = true;              ///< Write lifecycle events to events.ndjson
};

/**
 * @brief Top-level daemon configuration.
 */
struct Config {
    SchedulerConfig scheduler;
    RouterConfig router;
    RegistryConfig registry;
    HealthConfig health;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing sections and keys keep their defaults. The result is not
 * validated; call validate_config() before use.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Reject configurations the scheduler cannot run with.
 */
Result<void> validate_config(const Config& config);

}  // namespace agent_dispatch
