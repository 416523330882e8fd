#include "agent.h"

#include "agent_events.h"
#include "config.h"
#include "logger.h"
#include "mqtt_transport.h"

static_assert(CFG_EVENT_QUEUE_DEPTH > 0u, "CFG_EVENT_QUEUE_DEPTH must be > 0");
static_assert(CFG_SHUTDOWN_GRACE_MS > 0u, "CFG_SHUTDOWN_GRACE_MS must be > 0");

bool agent_begin(Agent *agent, const AgentSettings &settings, ReadingRandomFn rng)
{
    if (!agent || !rng)
    {
        return false;
    }
    if (agent->started)
    {
        return true;
    }

    agent->settings = settings;
    agent->rng = rng;
    shared_state_init(&agent->shared);

    agent->lifecycle = xEventGroupCreate();
    if (!agent->lifecycle)
    {
        LOG_ERROR(LogDomain::SYSTEM, "Agent event group create failed");
        return false;
    }

    agent->inbound = xQueueCreate((UBaseType_t)CFG_EVENT_QUEUE_DEPTH, sizeof(AgentEvent));
    if (!agent->inbound)
    {
        LOG_ERROR(LogDomain::SYSTEM, "Agent queue create failed depth=%u item_bytes=%u",
                  (unsigned)CFG_EVENT_QUEUE_DEPTH, (unsigned)sizeof(AgentEvent));
        vEventGroupDelete(agent->lifecycle);
        agent->lifecycle = nullptr;
        return false;
    }

    const MqttConfig mqttCfg{agent->settings.host, agent->settings.port, agent->settings.clientId,
                             agent->settings.accessToken};
    if (!mqtt_begin(mqttCfg, agent->inbound))
    {
        vQueueDelete(agent->inbound);
        agent->inbound = nullptr;
        vEventGroupDelete(agent->lifecycle);
        agent->lifecycle = nullptr;
        return false;
    }

    const RuntimeConfig cfg = shared_state_readConfig(&agent->shared);
    LOG_INFO(LogDomain::CONFIG, "Runtime config defaults interval=%lus enabled=%s firmware_version=%s",
             (unsigned long)cfg.intervalSeconds, cfg.enabled ? "true" : "false", cfg.firmwareVersion);

    // Publisher first: it blocks on SESSION_READY, so ordering is still connect -> publish.
    if (!publisher_taskBegin(agent))
    {
        return false;
    }
    if (!supervisor_taskBegin(agent))
    {
        // Publisher is parked on the event group; let it exit cleanly.
        xEventGroupSetBits(agent->lifecycle, AGENT_BIT_SHUTDOWN_REQUESTED);
        return false;
    }

    agent->started = true;
    LOG_INFO(LogDomain::SYSTEM, "Agent started queue_depth=%u", (unsigned)CFG_EVENT_QUEUE_DEPTH);
    return true;
}

void agent_requestShutdown(Agent *agent)
{
    if (!agent || !agent->lifecycle)
    {
        return;
    }
    if ((xEventGroupGetBits(agent->lifecycle) & AGENT_BIT_SHUTDOWN_REQUESTED) == 0)
    {
        LOG_INFO(LogDomain::SYSTEM, "Shutdown requested");
    }
    xEventGroupSetBits(agent->lifecycle, AGENT_BIT_SHUTDOWN_REQUESTED);
}

bool agent_isShutdownRequested(const Agent *agent)
{
    if (!agent || !agent->lifecycle)
    {
        return false;
    }
    return (xEventGroupGetBits(agent->lifecycle) & AGENT_BIT_SHUTDOWN_REQUESTED) != 0;
}

bool agent_waitStopped(Agent *agent, uint32_t graceMs)
{
    if (!agent || !agent->lifecycle)
    {
        return true;
    }
    const EventBits_t want = AGENT_BIT_SUPERVISOR_DONE | AGENT_BIT_PUBLISHER_DONE;
    const EventBits_t bits = xEventGroupWaitBits(agent->lifecycle, want, pdFALSE, pdTRUE, pdMS_TO_TICKS(graceMs));
    const bool stopped = (bits & want) == want;
    if (!stopped)
    {
        LOG_WARN(LogDomain::SYSTEM, "Shutdown grace expired grace_ms=%lu supervisor_done=%s publisher_done=%s",
                 (unsigned long)graceMs,
                 (bits & AGENT_BIT_SUPERVISOR_DONE) ? "true" : "false",
                 (bits & AGENT_BIT_PUBLISHER_DONE) ? "true" : "false");
    }
    return stopped;
}
