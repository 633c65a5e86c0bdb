/**
 * @file capability_router.cpp
 * @brief CapabilityRouter: scores candidates by declared confidence and
 *        observed latency.
 *
 * Algorithm:
 *   candidates = HEALTHY or UNKNOWN agents declaring the capability
 *   if none: candidates = HEALTHY, UNKNOWN or DEGRADED agents
 *   score(a) = w_conf * confidence(a) + w_lat * (1 - latency(a) / max_latency)
 *   pick argmax(score), ties broken by the smallest agent_id
 *
 * UNREACHABLE agents are never candidates.
 */

#include "registry/capability_router.hpp"

#include <algorithm>

namespace agent_dispatch {

namespace {

bool is_preferred(HealthStatus status) {
    return status == HealthStatus::Healthy || status == HealthStatus::Unknown;
}

std::vector<CapabilityMatch> filter(const std::vector<CapabilityMatch>& matches, bool allow_degraded) {
    std::vector<CapabilityMatch> out;
    for (const auto& m : matches) {
        if (is_preferred(m.agent.health)
            || (allow_degraded && m.agent.health == HealthStatus::Degraded)) {
            out.push_back(m);
        }
    }
    return out;
}

}  // anonymous namespace

CapabilityRouter::CapabilityRouter(const CapabilityRegistry& registry, RouterConfig config)
    : registry_(registry), config_(config) {}

std::vector<ScoredCandidate> CapabilityRouter::rank(const CapabilityId& capability) const {
    auto matches = registry_.find_by_capability(capability);

    auto eligible = filter(matches, false);
    if (eligible.empty()) {
        eligible = filter(matches, true);
    }

    std::vector<ScoredCandidate> scored;
    if (eligible.empty()) return scored;

    Duration max_latency{0};
    for (const auto& m : eligible) {
        max_latency = std::max(max_latency, m.agent.avg_response_time);
    }

    scored.reserve(eligible.size());
    for (auto& m : eligible) {
        double normalized = 0.0;
        if (eligible.size() > 1 && max_latency.count() > 0) {
            normalized = static_cast<double>(m.agent.avg_response_time.count())
                       / static_cast<double>(max_latency.count());
        }
        double score = config_.confidence_weight * m.declared_confidence
                     + config_.latency_weight * (1.0 - normalized);
        scored.push_back(ScoredCandidate{
            .agent = std::move(m.agent),
            .declared_confidence = m.declared_confidence,
            .normalized_latency = normalized,
            .score = score
        });
    }

    std::sort(scored.begin(), scored.end(), [](const ScoredCandidate& a, const ScoredCandidate& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.agent.agent_id < b.agent.agent_id;
    });
    return scored;
}

Result<AgentDescriptor> CapabilityRouter::route(const CapabilityId& capability) const {
    auto ranked = rank(capability);
    if (ranked.empty()) {
        return Error{ErrorCode::NotFound, "no live agent for capability " + capability};
    }
    return std::move(ranked.front().agent);
}

}  // namespace agent_dispatch
