/**
 * @file agent_invoker.hpp
 * @brief Boundary to the transport that actually reaches agents.
 *
 * The task manager and health monitor depend only on this interface. A
 * transport (HTTP, JSON-RPC, in-process) implements it once.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "registry/capability_registry.hpp"

#include <stop_token>

namespace agent_dispatch {

/**
 * @brief One dispatch of a task to an agent.
 *
 * `stop` is signalled when the task times out, is cancelled, or the
 * manager shuts down. Implementations should abandon the call promptly
 * when it fires; the caller does not wait for them to do so.
 */
struct Invocation {
    TaskId task_id;
    uint32_t attempt = 0;
    AgentDescriptor agent;
    CapabilityId capability_id;
    Payload payload;
    Duration timeout{0};
    std::stop_token stop;
};

struct HealthSample {
    Duration latency{0};
};

/**
 * @brief Abstract transport to remote agents.
 *
 * Both calls block the calling worker thread; the task manager and the
 * health monitor run them on their own pools.
 */
class IAgentInvoker {
public:
    virtual ~IAgentInvoker() = default;

    /// Execute the capability on the agent; an error is a retryable dispatch failure.
    virtual Result<Payload> invoke(const Invocation& call) = 0;

    /// Liveness check bounded by `timeout`.
    virtual Result<HealthSample> probe(const AgentDescriptor& agent, Duration timeout) = 0;
};

}  // namespace agent_dispatch
