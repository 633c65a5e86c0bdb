/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <toml++/toml.hpp>

#include <limits>
#include <optional>
#include <string_view>

namespace agent_dispatch {

namespace {

/// Counts and durations must be non-negative and fit in 32 bits.
Result<uint32_t> read_u32(toml::node_view<toml::node> table,
                          std::string_view section,
                          std::string_view key,
                          uint32_t fallback) {
    int64_t raw = table[key].value_or(static_cast<int64_t>(fallback));
    if (raw < 0 || raw > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
        return Error{ErrorCode::Config, std::string{section} + "." + std::string{key}
                     + " out of range: " + std::to_string(raw)};
    }
    return static_cast<uint32_t>(raw);
}

/// Each concurrent slot owns a worker thread.
constexpr uint32_t kMaxConcurrentTasks = 1024;

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::Config, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        std::optional<Error> range_error;
        auto u32 = [&](toml::node_view<toml::node> table, std::string_view section,
                       std::string_view key, uint32_t fallback) {
            auto value = read_u32(table, section, key, fallback);
            if (!value) {
                if (!range_error) range_error = value.error();
                return fallback;
            }
            return *value;
        };

        // [scheduler]
        if (auto scheduler = tbl["scheduler"]; scheduler.is_table()) {
            auto& s = config.scheduler;
            s.max_concurrent_tasks = u32(scheduler, "scheduler", "max_concurrent_tasks", 10);
            s.lane_depth_limit = u32(scheduler, "scheduler", "lane_depth_limit", 1000);
            s.default_max_retries = u32(scheduler, "scheduler", "default_max_retries", 3);
            s.max_retries_ceiling = u32(scheduler, "scheduler", "max_retries_ceiling", 20);
            s.default_timeout_ms = u32(scheduler, "scheduler", "default_timeout_ms", 30000);
            s.retry_base_delay_ms = u32(scheduler, "scheduler", "retry_base_delay_ms", 1000);
            s.retry_max_delay_ms = u32(scheduler, "scheduler", "retry_max_delay_ms", 60000);
        }

        // [router]
        if (auto router = tbl["router"]; router.is_table()) {
            config.router.confidence_weight = router["confidence_weight"].value_or(0.7);
            config.router.latency_weight = router["latency_weight"].value_or(0.3);
        }

        // [registry]
        if (auto registry = tbl["registry"]; registry.is_table()) {
            config.registry.latency_ema_weight = registry["latency_ema_weight"].value_or(0.3);
        }

        // [health]
        if (auto health = tbl["health"]; health.is_table()) {
            auto& h = config.health;
            h.enabled = health["enabled"].value_or(true);
            h.probe_interval_ms = u32(health, "health", "probe_interval_ms", 30000);
            h.probe_timeout_ms = u32(health, "health", "probe_timeout_ms", 5000);
            h.failure_threshold = u32(health, "health", "failure_threshold", 3);
            h.max_backoff_ms = u32(health, "health", "max_backoff_ms", 300000);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            config.telemetry.max_file_size_mb = u32(telemetry, "telemetry", "max_file_size_mb", 50);
            config.telemetry.rotate_count = u32(telemetry, "telemetry", "rotate_count", 5);
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            config.telemetry.record_events = telemetry["record_events"].value_or(true);
        }

        if (range_error) {
            return *range_error;
        }
        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Config,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

Result<void> validate_config(const Config& config) {
    const auto& s = config.scheduler;
    if (s.max_concurrent_tasks == 0) {
        return Error{ErrorCode::Config, "scheduler.max_concurrent_tasks must be positive"};
    }
    if (s.max_concurrent_tasks > kMaxConcurrentTasks) {
        return Error{ErrorCode::Config, "scheduler.max_concurrent_tasks must not exceed "
                     + std::to_string(kMaxConcurrentTasks)};
    }
    if (s.lane_depth_limit == 0) {
        return Error{ErrorCode::Config, "scheduler.lane_depth_limit must be positive"};
    }
    if (s.default_timeout_ms == 0) {
        return Error{ErrorCode::Config, "scheduler.default_timeout_ms must be positive"};
    }
    if (s.retry_base_delay_ms == 0) {
        return Error{ErrorCode::Config, "scheduler.retry_base_delay_ms must be positive"};
    }
    if (s.retry_max_delay_ms < s.retry_base_delay_ms) {
        return Error{ErrorCode::Config,
                     "scheduler.retry_max_delay_ms must not be below retry_base_delay_ms"};
    }
    if (s.default_max_retries > s.max_retries_ceiling) {
        return Error{ErrorCode::Config,
                     "scheduler.default_max_retries exceeds max_retries_ceiling"};
    }

    const auto& r = config.router;
    if (r.confidence_weight < 0.0 || r.confidence_weight > 1.0
        || r.latency_weight < 0.0 || r.latency_weight > 1.0) {
        return Error{ErrorCode::Config, "router weights must lie in [0, 1]"};
    }

    if (config.registry.latency_ema_weight <= 0.0 || config.registry.latency_ema_weight > 1.0) {
        return Error{ErrorCode::Config, "registry.latency_ema_weight must lie in (0, 1]"};
    }

    const auto& h = config.health;
    if (h.probe_interval_ms == 0) {
        return Error{ErrorCode::Config, "health.probe_interval_ms must be positive"};
    }
    if (h.probe_timeout_ms == 0) {
        return Error{ErrorCode::Config, "health.probe_timeout_ms must be positive"};
    }
    if (h.failure_threshold == 0) {
        return Error{ErrorCode::Config, "health.failure_threshold must be positive"};
    }
    if (h.max_backoff_ms < h.probe_interval_ms) {
        return Error{ErrorCode::Config, "health.max_backoff_ms must not be below probe_interval_ms"};
    }

    if (!parse_log_level(config.telemetry.log_level)) {
        return Error{ErrorCode::Config, "unknown telemetry.log_level: " + config.telemetry.log_level};
    }

    return {};
}

}  // namespace agent_dispatch
