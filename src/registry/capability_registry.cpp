/**
 * @file capability_registry.cpp
 * @brief CapabilityRegistry implementation.
 */

#include "registry/capability_registry.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>

namespace agent_dispatch {

std::optional<double> AgentDescriptor::confidence_for(const CapabilityId& capability) const {
    for (const auto& decl : capabilities) {
        if (decl.capability_id == capability) return decl.confidence;
    }
    return std::nullopt;
}

CapabilityRegistry::CapabilityRegistry(double latency_ema_weight)
    : ema_weight_(latency_ema_weight), clock_(default_clock_) {}

CapabilityRegistry::CapabilityRegistry(double latency_ema_weight, const IClock& clock)
    : ema_weight_(latency_ema_weight), clock_(clock) {}

// ─────────────────────────────────────────────
// Mutation
// ─────────────────────────────────────────────

Result<void> CapabilityRegistry::register_agent(AgentDescriptor descriptor) {
    if (descriptor.agent_id.empty()) {
        return Error{ErrorCode::Validation, "agent_id must not be empty"};
    }

    // Collapse duplicate declarations, keeping the last one.
    std::vector<CapabilityDeclaration> unique_caps;
    for (auto it = descriptor.capabilities.rbegin(); it != descriptor.capabilities.rend(); ++it) {
        if (it->capability_id.empty()) {
            return Error{ErrorCode::Validation,
                         "agent " + descriptor.agent_id + " declares an empty capability"};
        }
        if (it->confidence < 0.0 || it->confidence > 1.0) {
            return Error{ErrorCode::Validation,
                         "confidence for " + it->capability_id + " must lie in [0, 1]"};
        }
        bool seen = std::any_of(unique_caps.begin(), unique_caps.end(),
            [&](const CapabilityDeclaration& d) { return d.capability_id == it->capability_id; });
        if (!seen) unique_caps.push_back(*it);
    }
    std::reverse(unique_caps.begin(), unique_caps.end());
    descriptor.capabilities = std::move(unique_caps);

    descriptor.health = HealthStatus::Unknown;
    descriptor.last_probe_time.reset();
    descriptor.avg_response_time = Duration{0};
    descriptor.latency_samples = 0;

    std::unique_lock lock(mutex_);
    if (auto it = agents_.find(descriptor.agent_id); it != agents_.end()) {
        unindex_locked(it->second);
        it->second = std::move(descriptor);
        index_locked(it->second);
    } else {
        auto [inserted, _] = agents_.emplace(descriptor.agent_id, std::move(descriptor));
        index_locked(inserted->second);
    }
    return {};
}

bool CapabilityRegistry::deregister_agent(const AgentId& id) {
    std::unique_lock lock(mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) return false;
    unindex_locked(it->second);
    agents_.erase(it);
    return true;
}

bool CapabilityRegistry::update_health(const AgentId& id,
                                       HealthStatus status,
                                       std::optional<Duration> latency_sample) {
    std::unique_lock lock(mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) return false;

    auto& agent = it->second;
    agent.health = status;
    agent.last_probe_time = clock_.wall_now();

    if (latency_sample) {
        if (agent.latency_samples == 0) {
            agent.avg_response_time = *latency_sample;
        } else {
            double blended = ema_weight_ * static_cast<double>(latency_sample->count())
                           + (1.0 - ema_weight_) * static_cast<double>(agent.avg_response_time.count());
            agent.avg_response_time = Duration{static_cast<Duration::rep>(blended + 0.5)};
        }
        ++agent.latency_samples;
    }
    return true;
}

void CapabilityRegistry::unindex_locked(const AgentDescriptor& agent) {
    for (const auto& decl : agent.capabilities) {
        if (auto it = capability_index_.find(decl.capability_id); it != capability_index_.end()) {
            it->second.erase(agent.agent_id);
            if (it->second.empty()) capability_index_.erase(it);
        }
    }
    for (const auto& tag : agent.tags) {
        if (auto it = tag_index_.find(tag); it != tag_index_.end()) {
            it->second.erase(agent.agent_id);
            if (it->second.empty()) tag_index_.erase(it);
        }
    }
}

void CapabilityRegistry::index_locked(const AgentDescriptor& agent) {
    for (const auto& decl : agent.capabilities) {
        capability_index_[decl.capability_id].insert(agent.agent_id);
    }
    for (const auto& tag : agent.tags) {
        tag_index_[tag].insert(agent.agent_id);
    }
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

std::vector<CapabilityMatch> CapabilityRegistry::find_by_capability(const CapabilityId& capability) const {
    std::shared_lock lock(mutex_);
    std::vector<CapabilityMatch> matches;

    auto it = capability_index_.find(capability);
    if (it == capability_index_.end()) return matches;

    matches.reserve(it->second.size());
    for (const auto& agent_id : it->second) {   // std::set keeps agent_id order
        const auto& agent = agents_.at(agent_id);
        matches.push_back(CapabilityMatch{
            .agent = agent,
            .declared_confidence = agent.confidence_for(capability).value_or(0.0)
        });
    }
    return matches;
}

std::vector<AgentDescriptor> CapabilityRegistry::find_by_tag(const std::string& tag) const {
    std::shared_lock lock(mutex_);
    std::vector<AgentDescriptor> result;
    if (auto it = tag_index_.find(tag); it != tag_index_.end()) {
        for (const auto& agent_id : it->second) {
            result.push_back(agents_.at(agent_id));
        }
    }
    return result;
}

std::optional<AgentDescriptor> CapabilityRegistry::get_agent(const AgentId& id) const {
    std::shared_lock lock(mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) return std::nullopt;
    return it->second;
}

std::vector<AgentDescriptor> CapabilityRegistry::list_agents() const {
    std::shared_lock lock(mutex_);
    std::vector<AgentDescriptor> result;
    result.reserve(agents_.size());
    for (const auto& [id, agent] : agents_) {
        result.push_back(agent);
    }
    std::sort(result.begin(), result.end(),
              [](const AgentDescriptor& a, const AgentDescriptor& b) { return a.agent_id < b.agent_id; });
    return result;
}

std::vector<AgentId> CapabilityRegistry::agent_ids() const {
    std::shared_lock lock(mutex_);
    std::vector<AgentId> ids;
    ids.reserve(agents_.size());
    for (const auto& [id, _] : agents_) ids.push_back(id);
    std::sort(ids.begin(), ids.end());
    return ids;
}

bool CapabilityRegistry::has_agent(const AgentId& id) const {
    std::shared_lock lock(mutex_);
    return agents_.count(id) > 0;
}

size_t CapabilityRegistry::size() const {
    std::shared_lock lock(mutex_);
    return agents_.size();
}

RegistryStats CapabilityRegistry::stats() const {
    std::shared_lock lock(mutex_);
    RegistryStats stats;
    stats.total_agents = agents_.size();
    for (const auto& [id, agent] : agents_) {
        switch (agent.health) {
            case HealthStatus::Unknown:     ++stats.unknown; break;
            case HealthStatus::Healthy:     ++stats.healthy; break;
            case HealthStatus::Degraded:    ++stats.degraded; break;
            case HealthStatus::Unreachable: ++stats.unreachable; break;
        }
    }
    stats.total_capabilities = capability_index_.size();
    for (const auto& [capability, ids] : capability_index_) {
        stats.capability_coverage[capability] = ids.size();
    }
    return stats;
}

}  // namespace agent_dispatch
