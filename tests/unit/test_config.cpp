/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading and validation.
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

using namespace agent_dispatch;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "ad_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.scheduler.max_concurrent_tasks, 10u);
    EXPECT_EQ(config.scheduler.default_max_retries, 3u);
    EXPECT_EQ(config.scheduler.retry_base_delay_ms, 1000u);
    EXPECT_EQ(config.scheduler.retry_max_delay_ms, 60000u);
    EXPECT_DOUBLE_EQ(config.router.confidence_weight, 0.7);
    EXPECT_DOUBLE_EQ(config.router.latency_weight, 0.3);
    EXPECT_DOUBLE_EQ(config.registry.latency_ema_weight, 0.3);
    EXPECT_EQ(config.health.probe_interval_ms, 30000u);
    EXPECT_EQ(config.health.failure_threshold, 3u);
    EXPECT_EQ(config.health.max_backoff_ms, 300000u);
    EXPECT_TRUE(validate_config(config).has_value());
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [scheduler]
        max_concurrent_tasks = 4
        lane_depth_limit = 16
        default_max_retries = 2
        max_retries_ceiling = 5
        default_timeout_ms = 1500
        retry_base_delay_ms = 10
        retry_max_delay_ms = 80

        [router]
        confidence_weight = 0.5
        latency_weight = 0.5

        [registry]
        latency_ema_weight = 0.6

        [health]
        enabled = false
        probe_interval_ms = 200
        probe_timeout_ms = 50
        failure_threshold = 2
        max_backoff_ms = 1600

        [telemetry]
        log_dir = "/tmp/ad_logs"
        log_level = "debug"
        record_events = false
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.scheduler.max_concurrent_tasks, 4u);
    EXPECT_EQ(config.scheduler.lane_depth_limit, 16u);
    EXPECT_EQ(config.scheduler.default_max_retries, 2u);
    EXPECT_EQ(config.scheduler.max_retries_ceiling, 5u);
    EXPECT_EQ(config.scheduler.default_timeout_ms, 1500u);
    EXPECT_EQ(config.scheduler.retry_base_delay_ms, 10u);
    EXPECT_EQ(config.scheduler.retry_max_delay_ms, 80u);
    EXPECT_DOUBLE_EQ(config.router.confidence_weight, 0.5);
    EXPECT_DOUBLE_EQ(config.registry.latency_ema_weight, 0.6);
    EXPECT_FALSE(config.health.enabled);
    EXPECT_EQ(config.health.probe_interval_ms, 200u);
    EXPECT_EQ(config.health.failure_threshold, 2u);
    EXPECT_EQ(config.telemetry.log_dir, std::filesystem::path{"/tmp/ad_logs"});
    EXPECT_EQ(config.telemetry.log_level, "debug");
    EXPECT_FALSE(config.telemetry.record_events);
    EXPECT_TRUE(validate_config(config).has_value());
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [scheduler]
        max_concurrent_tasks = 2
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_EQ(result->scheduler.max_concurrent_tasks, 2u);
    // Defaults for everything else
    EXPECT_EQ(result->scheduler.lane_depth_limit, 1000u);
    EXPECT_DOUBLE_EQ(result->router.latency_weight, 0.3);
    EXPECT_TRUE(result->health.enabled);
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Config);
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Config);
}

TEST_F(ConfigTest, RejectsZeroConcurrency) {
    auto config = default_config();
    config.scheduler.max_concurrent_tasks = 0;
    auto valid = validate_config(config);
    ASSERT_FALSE(valid.has_value());
    EXPECT_EQ(valid.error().code, ErrorCode::Config);
}

TEST_F(ConfigTest, RejectsCapBelowBaseDelay) {
    auto config = default_config();
    config.scheduler.retry_base_delay_ms = 500;
    config.scheduler.retry_max_delay_ms = 100;
    EXPECT_FALSE(validate_config(config).has_value());
}

TEST_F(ConfigTest, RejectsWeightsOutsideUnitInterval) {
    auto config = default_config();
    config.router.confidence_weight = 1.5;
    EXPECT_FALSE(validate_config(config).has_value());

    config = default_config();
    config.router.latency_weight = -0.1;
    EXPECT_FALSE(validate_config(config).has_value());
}

TEST_F(ConfigTest, RejectsEmaWeightOfZero) {
    auto config = default_config();
    config.registry.latency_ema_weight = 0.0;
    EXPECT_FALSE(validate_config(config).has_value());

    config.registry.latency_ema_weight = 1.0;
    EXPECT_TRUE(validate_config(config).has_value());
}

TEST_F(ConfigTest, RejectsZeroProbeIntervalAndThreshold) {
    auto config = default_config();
    config.health.probe_interval_ms = 0;
    EXPECT_FALSE(validate_config(config).has_value());

    config = default_config();
    config.health.failure_threshold = 0;
    EXPECT_FALSE(validate_config(config).has_value());
}

TEST_F(ConfigTest, RejectsUnknownLogLevel) {
    auto config = default_config();
    config.telemetry.log_level = "verbose";
    EXPECT_FALSE(validate_config(config).has_value());
}

TEST_F(ConfigTest, NegativeIntegerIsRejectedNotWrapped) {
    auto path = write_toml(R"(
        [scheduler]
        max_concurrent_tasks = -1
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Config);
    EXPECT_NE(result.error().message.find("scheduler.max_concurrent_tasks"), std::string::npos);
}

TEST_F(ConfigTest, IntegerBeyondThirtyTwoBitsIsRejected) {
    auto path = write_toml(R"(
        [scheduler]
        default_timeout_ms = 5000000000
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Config);
    EXPECT_NE(result.error().message.find("scheduler.default_timeout_ms"), std::string::npos);
}

TEST_F(ConfigTest, RejectsExcessiveConcurrency) {
    auto config = default_config();
    config.scheduler.max_concurrent_tasks = 1024;
    EXPECT_TRUE(validate_config(config).has_value());

    config.scheduler.max_concurrent_tasks = 1025;
    auto valid = validate_config(config);
    ASSERT_FALSE(valid.has_value());
    EXPECT_EQ(valid.error().code, ErrorCode::Config);
}
