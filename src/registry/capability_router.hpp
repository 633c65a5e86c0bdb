/**
 * @file capability_router.hpp
 * @brief Selects the best live agent for a capability.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "registry/capability_registry.hpp"

#include <vector>

namespace agent_dispatch {

struct ScoredCandidate {
    AgentDescriptor agent;
    double declared_confidence = 0.0;
    double normalized_latency = 0.0;
    double score = 0.0;
};

/**
 * @brief Deterministic capability router.
 *
 * Reads the registry on every call and keeps no state of its own, so a
 * route always reflects the latest health snapshot.
 */
class CapabilityRouter {
public:
    explicit CapabilityRouter(const CapabilityRegistry& registry,
                              RouterConfig config = RouterConfig{});

    /// Best candidate, or a NotFound error when no live agent declares the capability.
    [[nodiscard]] Result<AgentDescriptor> route(const CapabilityId& capability) const;

    /// All eligible candidates, best first.
    [[nodiscard]] std::vector<ScoredCandidate> rank(const CapabilityId& capability) const;

    [[nodiscard]] const RouterConfig& config() const noexcept { return config_; }

private:
    const CapabilityRegistry& registry_;
    RouterConfig config_;
};

}  // namespace agent_dispatch
