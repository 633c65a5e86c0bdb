/**
 * @file capability_registry.hpp
 * @brief Thread-safe store of agents, their capabilities and health.
 *
 * Written by registration and by the HealthMonitor, read by the
 * CapabilityRouter. Readers take a shared lock, writers an exclusive one,
 * so an upsert that rebuilds an agent's index entries is never observed
 * half-done.
 */

#pragma once

#include "core/clock.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace agent_dispatch {

struct CapabilityDeclaration {
    CapabilityId capability_id;
    double confidence = 1.0;              ///< Self-declared, in [0, 1]

    bool operator==(const CapabilityDeclaration&) const = default;
};

/**
 * @brief A registered worker.
 *
 * Health fields are owned by the registry: values passed to
 * register_agent() are ignored and reset to Unknown.
 */
struct AgentDescriptor {
    AgentId agent_id;
    std::string endpoint;                 ///< Opaque to the core
    std::vector<CapabilityDeclaration> capabilities;
    std::vector<std::string> tags;

    HealthStatus health = HealthStatus::Unknown;
    std::optional<Timestamp> last_probe_time;
    Duration avg_response_time{0};
    uint64_t latency_samples{0};

    [[nodiscard]] std::optional<double> confidence_for(const CapabilityId& capability) const;
};

/**
 * @brief One lookup hit: the agent plus the confidence it declared for
 *        the requested capability.
 */
struct CapabilityMatch {
    AgentDescriptor agent;
    double declared_confidence = 0.0;
};

struct RegistryStats {
    size_t total_agents = 0;
    size_t unknown = 0;
    size_t healthy = 0;
    size_t degraded = 0;
    size_t unreachable = 0;
    size_t total_capabilities = 0;
    std::map<CapabilityId, size_t> capability_coverage;   ///< agents per capability
};

class CapabilityRegistry {
public:
    explicit CapabilityRegistry(double latency_ema_weight = 0.3);

    /// `clock` stamps last_probe_time and must outlive the registry.
    CapabilityRegistry(double latency_ema_weight, const IClock& clock);

    // ── Mutation ──────────────────────────────
    Result<void> register_agent(AgentDescriptor descriptor);
    bool deregister_agent(const AgentId& id);

    /**
     * @brief Record a probe outcome.
     *
     * A latency sample updates avg_response_time with an exponential moving
     * average; the first sample seeds it. Unknown ids are ignored.
     *
     * @return false if the agent is not registered.
     */
    bool update_health(const AgentId& id,
                       HealthStatus status,
                       std::optional<Duration> latency_sample = std::nullopt);

    // ── Queries ───────────────────────────────
    [[nodiscard]] std::vector<CapabilityMatch> find_by_capability(const CapabilityId& capability) const;
    [[nodiscard]] std::vector<AgentDescriptor> find_by_tag(const std::string& tag) const;
    [[nodiscard]] std::optional<AgentDescriptor> get_agent(const AgentId& id) const;
    [[nodiscard]] std::vector<AgentDescriptor> list_agents() const;
    [[nodiscard]] std::vector<AgentId> agent_ids() const;
    [[nodiscard]] bool has_agent(const AgentId& id) const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] RegistryStats stats() const;

private:
    void unindex_locked(const AgentDescriptor& agent);
    void index_locked(const AgentDescriptor& agent);

    double ema_weight_;
    SteadyClock default_clock_;
    const IClock& clock_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<AgentId, AgentDescriptor> agents_;
    std::unordered_map<CapabilityId, std::set<AgentId>> capability_index_;
    std::unordered_map<std::string, std::set<AgentId>> tag_index_;
};

}  // namespace agent_dispatch
