/**
 * @file test_registry.cpp
 * @brief Unit tests for CapabilityRegistry.
 */

#include "registry/capability_registry.hpp"

#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace agent_dispatch;

namespace {

AgentDescriptor make_agent(const AgentId& id,
                           std::vector<CapabilityDeclaration> caps,
                           std::vector<std::string> tags = {}) {
    AgentDescriptor agent;
    agent.agent_id = id;
    agent.endpoint = "inproc://" + id;
    agent.capabilities = std::move(caps);
    agent.tags = std::move(tags);
    return agent;
}

/// Wall time that only moves when told to.
class ManualClock : public IClock {
public:
    SteadyTime now() const override { return SteadyTime{} + offset_; }
    Timestamp wall_now() const override { return Timestamp{} + offset_; }
    void advance(Duration by) { offset_ += by; }

private:
    Duration offset_{1000};
};

}  // namespace

TEST(CapabilityRegistryTest, RegisterAndFind) {
    CapabilityRegistry registry;
    ASSERT_TRUE(registry.register_agent(make_agent("b", {{"x", 0.5}})).has_value());
    ASSERT_TRUE(registry.register_agent(make_agent("a", {{"x", 0.9}, {"y", 0.4}})).has_value());

    auto matches = registry.find_by_capability("x");
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0].agent.agent_id, "a");
    EXPECT_DOUBLE_EQ(matches[0].declared_confidence, 0.9);
    EXPECT_EQ(matches[1].agent.agent_id, "b");
    EXPECT_EQ(matches[0].agent.health, HealthStatus::Unknown);

    EXPECT_TRUE(registry.find_by_capability("z").empty());
}

TEST(CapabilityRegistryTest, RejectsInvalidDescriptors) {
    CapabilityRegistry registry;

    auto empty_id = registry.register_agent(make_agent("", {{"x", 0.5}}));
    ASSERT_FALSE(empty_id.has_value());
    EXPECT_EQ(empty_id.error().code, ErrorCode::Validation);

    auto bad_conf = registry.register_agent(make_agent("a", {{"x", 1.2}}));
    ASSERT_FALSE(bad_conf.has_value());
    EXPECT_EQ(bad_conf.error().code, ErrorCode::Validation);

    EXPECT_EQ(registry.size(), 0u);
}

TEST(CapabilityRegistryTest, ReRegistrationIsIdempotentUpsert) {
    CapabilityRegistry registry;
    ASSERT_TRUE(registry.register_agent(make_agent("a", {{"x", 0.9}}, {"gpu"})).has_value());
    ASSERT_TRUE(registry.update_health("a", HealthStatus::Healthy, Duration{40}));

    ASSERT_TRUE(registry.register_agent(make_agent("a", {{"y", 0.6}}, {"cpu"})).has_value());
    ASSERT_TRUE(registry.register_agent(make_agent("a", {{"y", 0.6}}, {"cpu"})).has_value());

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_TRUE(registry.find_by_capability("x").empty());
    ASSERT_EQ(registry.find_by_capability("y").size(), 1u);
    EXPECT_TRUE(registry.find_by_tag("gpu").empty());
    EXPECT_EQ(registry.find_by_tag("cpu").size(), 1u);

    auto agent = registry.get_agent("a");
    ASSERT_TRUE(agent.has_value());
    EXPECT_EQ(agent->health, HealthStatus::Unknown);
    EXPECT_FALSE(agent->last_probe_time.has_value());
    EXPECT_EQ(agent->avg_response_time, Duration{0});
}

TEST(CapabilityRegistryTest, DuplicateDeclarationsKeepTheLast) {
    CapabilityRegistry registry;
    ASSERT_TRUE(registry.register_agent(make_agent("a", {{"x", 0.2}, {"x", 0.8}})).has_value());

    auto agent = registry.get_agent("a");
    ASSERT_TRUE(agent.has_value());
    ASSERT_EQ(agent->capabilities.size(), 1u);
    EXPECT_DOUBLE_EQ(agent->confidence_for("x").value_or(0.0), 0.8);
}

TEST(CapabilityRegistryTest, DeregisterRemovesIndexEntries) {
    CapabilityRegistry registry;
    ASSERT_TRUE(registry.register_agent(make_agent("a", {{"x", 0.9}}, {"t"})).has_value());

    EXPECT_TRUE(registry.deregister_agent("a"));
    EXPECT_FALSE(registry.deregister_agent("a"));
    EXPECT_TRUE(registry.find_by_capability("x").empty());
    EXPECT_TRUE(registry.find_by_tag("t").empty());
    EXPECT_FALSE(registry.has_agent("a"));
    EXPECT_EQ(registry.stats().total_capabilities, 0u);
}

TEST(CapabilityRegistryTest, LatencyEmaSeedsThenBlends) {
    CapabilityRegistry registry(0.3);
    ASSERT_TRUE(registry.register_agent(make_agent("a", {{"x", 0.9}})).has_value());

    registry.update_health("a", HealthStatus::Healthy, Duration{100});
    EXPECT_EQ(registry.get_agent("a")->avg_response_time, Duration{100});

    registry.update_health("a", HealthStatus::Healthy, Duration{200});
    EXPECT_EQ(registry.get_agent("a")->avg_response_time, Duration{130});   // 0.3*200 + 0.7*100

    // A failed probe carries no sample and leaves the average alone.
    registry.update_health("a", HealthStatus::Degraded);
    auto agent = registry.get_agent("a");
    EXPECT_EQ(agent->avg_response_time, Duration{130});
    EXPECT_EQ(agent->health, HealthStatus::Degraded);
    EXPECT_TRUE(agent->last_probe_time.has_value());
}

TEST(CapabilityRegistryTest, HealthTimestampComesFromInjectedClock) {
    ManualClock clock;
    CapabilityRegistry registry(0.3, clock);
    ASSERT_TRUE(registry.register_agent(make_agent("a", {{"x", 0.9}})).has_value());
    EXPECT_FALSE(registry.get_agent("a")->last_probe_time.has_value());

    registry.update_health("a", HealthStatus::Healthy, Duration{10});
    EXPECT_EQ(registry.get_agent("a")->last_probe_time, std::optional<Timestamp>{Timestamp{} + Duration{1000}});

    clock.advance(Duration{250});
    registry.update_health("a", HealthStatus::Degraded);
    EXPECT_EQ(registry.get_agent("a")->last_probe_time, std::optional<Timestamp>{Timestamp{} + Duration{1250}});
}

TEST(CapabilityRegistryTest, UpdateHealthOfUnknownAgentIsNoOp) {
    CapabilityRegistry registry;
    EXPECT_FALSE(registry.update_health("ghost", HealthStatus::Healthy, Duration{5}));
    EXPECT_EQ(registry.size(), 0u);
}

TEST(CapabilityRegistryTest, StatsCountHealthAndCoverage) {
    CapabilityRegistry registry;
    ASSERT_TRUE(registry.register_agent(make_agent("a", {{"x", 0.9}, {"y", 0.5}})).has_value());
    ASSERT_TRUE(registry.register_agent(make_agent("b", {{"x", 0.7}})).has_value());
    ASSERT_TRUE(registry.register_agent(make_agent("c", {{"z", 0.7}})).has_value());
    registry.update_health("a", HealthStatus::Healthy, Duration{10});
    registry.update_health("b", HealthStatus::Unreachable);

    auto stats = registry.stats();
    EXPECT_EQ(stats.total_agents, 3u);
    EXPECT_EQ(stats.healthy, 1u);
    EXPECT_EQ(stats.unreachable, 1u);
    EXPECT_EQ(stats.unknown, 1u);
    EXPECT_EQ(stats.degraded, 0u);
    EXPECT_EQ(stats.total_capabilities, 3u);
    EXPECT_EQ(stats.capability_coverage.at("x"), 2u);
    EXPECT_EQ(stats.capability_coverage.at("z"), 1u);
}

TEST(CapabilityRegistryTest, ListingsAreSortedById) {
    CapabilityRegistry registry;
    for (const auto* id : {"m", "c", "x"}) {
        ASSERT_TRUE(registry.register_agent(make_agent(id, {{"cap", 0.5}})).has_value());
    }
    EXPECT_EQ(registry.agent_ids(), (std::vector<AgentId>{"c", "m", "x"}));
    auto listed = registry.list_agents();
    ASSERT_EQ(listed.size(), 3u);
    EXPECT_EQ(listed.front().agent_id, "c");
}

TEST(CapabilityRegistryTest, ConcurrentUpsertsAndLookups) {
    CapabilityRegistry registry;
    std::vector<std::jthread> threads;

    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&registry, t] {
            for (int i = 0; i < 200; ++i) {
                auto id = "agent-" + std::to_string(t);
                (void)registry.register_agent(make_agent(id, {{"shared", 0.5}, {"own-" + std::to_string(i % 3), 0.5}}));
                auto matches = registry.find_by_capability("shared");
                EXPECT_LE(matches.size(), 4u);
            }
        });
    }
    threads.clear();

    EXPECT_EQ(registry.size(), 4u);
    EXPECT_EQ(registry.find_by_capability("shared").size(), 4u);
}
