#include <Arduino.h>
#include <WiFi.h>
#include <freertos/FreeRTOS.h>
#include <freertos/event_groups.h>
#include <freertos/queue.h>
#include <freertos/task.h>

#include "agent.h"
#include "agent_events.h"
#include "attributes.h"
#include "config.h"
#include "logger.h"
#include "mqtt_transport.h"
#include "supervisor.h"
#include "topics.h"

struct SupervisorContext
{
    Agent *agent;
    SupervisorState sup;
    uint32_t nextRequestId;
    bool sessionReadySignalled;
};

// Only the supervisor task touches this; kept off the task stack.
static AgentEvent s_event;

static void mirrorPhase(SupervisorContext &ctx)
{
    shared_state_setConnection(&ctx.agent->shared, ctx.sup.phase, ctx.sup.retryCount);
}

static bool connectOnce()
{
    if (WiFi.status() != WL_CONNECTED)
    {
        LOG_WARN(LogDomain::WIFI, "Connect attempt skipped reason=wifi_down status=%d", (int)WiFi.status());
        return false;
    }
    return mqtt_connect();
}

static bool subscribeAll()
{
    // Both are needed before the snapshot request goes out.
    if (!mqtt_subscribe(TOPIC_ATTRIBUTES))
    {
        return false;
    }
    return mqtt_subscribe(TOPIC_ATTRIBUTES_RESPONSE_FILTER);
}

static void requestSnapshot(SupervisorContext &ctx)
{
    char topic[TOPIC_MAX];
    const uint32_t id = ++ctx.nextRequestId;
    if (!topics::buildRequest(id, topic, sizeof(topic)))
    {
        LOG_ERROR(LogDomain::SUPERVISOR, "Attribute request topic too long id=%lu", (unsigned long)id);
        return;
    }
    if (mqtt_publish(topic, ATTRIBUTES_REQUEST_BODY))
    {
        LOG_INFO(LogDomain::SUPERVISOR, "Attribute snapshot requested topic=%s", topic);
    }
    else
    {
        // Push updates still arrive; the next reconnect asks again.
        LOG_WARN(LogDomain::SUPERVISOR, "Attribute snapshot request failed topic=%s", topic);
    }
}

// Executes one action set. Returns true and fills next when an action produced a
// follow-up event (connect result, subscribe failure).
static bool executeActions(SupervisorContext &ctx, const SupervisorActions &actions, SupervisorEvent *next)
{
    if (actions.flags & SUP_ACT_DISCONNECT)
    {
        mqtt_disconnect();
    }
    if (actions.flags & SUP_ACT_CANCEL_RETRY)
    {
        LOG_DEBUG(LogDomain::SUPERVISOR, "Pending reconnect cancelled");
    }
    if (actions.flags & SUP_ACT_CONNECT)
    {
        *next = connectOnce() ? SupervisorEvent::CONNECT_OK : SupervisorEvent::CONNECT_FAILED;
        return true;
    }
    if (actions.flags & SUP_ACT_SUBSCRIBE)
    {
        if (!subscribeAll())
        {
            *next = SupervisorEvent::SUBSCRIBE_FAILED;
            return true;
        }
    }
    if (actions.flags & SUP_ACT_REQUEST_SNAPSHOT)
    {
        requestSnapshot(ctx);
        LOG_INFO(LogDomain::SUPERVISOR, "Session ready connects=%lu", (unsigned long)ctx.sup.connectCount);
        if (!ctx.sessionReadySignalled)
        {
            ctx.sessionReadySignalled = true;
            xEventGroupSetBits(ctx.agent->lifecycle, AGENT_BIT_SESSION_READY);
        }
    }
    if (actions.flags & SUP_ACT_SCHEDULE_RETRY)
    {
        LOG_DEBUG(LogDomain::SUPERVISOR, "Retry armed in %lu ms", (unsigned long)actions.retryDelayMs);
    }
    return false;
}

static void dispatch(SupervisorContext &ctx, SupervisorEvent ev)
{
    SupervisorActions actions = supervisor_handle(&ctx.sup, ev, millis(), ctx.agent->rng());
    mirrorPhase(ctx);

    SupervisorEvent next = SupervisorEvent::START;
    while (executeActions(ctx, actions, &next))
    {
        actions = supervisor_handle(&ctx.sup, next, millis(), ctx.agent->rng());
        mirrorPhase(ctx);
    }
}

static void handleAttributeMessage(SupervisorContext &ctx, const AgentEvent &ev)
{
    const AttributeSource source = topics::classify(ev.topic);
    if (source == AttributeSource::UNKNOWN)
    {
        LOG_DEBUG(LogDomain::MQTT, "Message on unexpected topic dropped topic=%s len=%u", ev.topic, (unsigned)ev.len);
        return;
    }

    AttributePatch patch{};
    const AttributeParseResult r = attributes_parse(ev.payload, ev.len, &patch);
    if (r != AttributeParseResult::OK)
    {
        LOG_DEBUG(LogDomain::CONFIG, "Attribute message ignored source=%s reason=%s len=%u",
                  topics::sourceToString(source), attributes_parseResultToString(r), (unsigned)ev.len);
        return;
    }

    AttributeChanges changes{};
    const uint8_t changed = shared_state_applyPatch(&ctx.agent->shared, patch, &changes);
    attributes_logChanges(changes, source);
    if (changed > 0)
    {
        xEventGroupSetBits(ctx.agent->lifecycle, AGENT_BIT_CONFIG_CHANGED);
    }
}

static void drainInbound(SupervisorContext &ctx)
{
    while (xQueueReceive(ctx.agent->inbound, &s_event, 0) == pdTRUE)
    {
        switch (s_event.type)
        {
        case AgentEventType::MESSAGE:
            handleAttributeMessage(ctx, s_event);
            break;
        case AgentEventType::CONNECTION_LOST:
            LOG_WARN(LogDomain::SUPERVISOR, "Connection lost state=%d (%s)",
                     s_event.transportState, mqtt_stateToString(s_event.transportState));
            dispatch(ctx, SupervisorEvent::CONNECTION_LOST);
            break;
        }
    }
}

// Sleeps until timeoutMs elapses or shutdown is requested. Returns true on shutdown.
static bool waitForShutdown(const Agent *agent, uint32_t timeoutMs)
{
    const EventBits_t bits = xEventGroupWaitBits(agent->lifecycle, AGENT_BIT_SHUTDOWN_REQUESTED, pdFALSE, pdFALSE,
                                                 pdMS_TO_TICKS(timeoutMs));
    return (bits & AGENT_BIT_SHUTDOWN_REQUESTED) != 0;
}

static void supervisorTask(void *arg)
{
    Agent *agent = static_cast<Agent *>(arg);
    SupervisorContext ctx{};
    ctx.agent = agent;
    supervisor_init(&ctx.sup, agent->settings.backoff, agent->settings.maxAttempts);
    mirrorPhase(ctx);

    LOG_INFO(LogDomain::SUPERVISOR, "supervisorTask started core=%d stack_bytes=%u prio=%u max_attempts=%lu",
             xPortGetCoreID(), (unsigned)CFG_SUPERVISOR_TASK_STACK_BYTES, (unsigned)CFG_SUPERVISOR_TASK_PRIORITY,
             (unsigned long)agent->settings.maxAttempts);

    dispatch(ctx, SupervisorEvent::START);

    for (;;)
    {
        if (agent_isShutdownRequested(agent))
        {
            break;
        }

        if (ctx.sup.phase == ConnectionPhase::CONNECTED)
        {
            mqtt_service();
        }
        drainInbound(ctx);

        // Covers a drop whose event could not be queued. A busy client is not a drop.
        if (supervisor_isLinkLost(ctx.sup, mqtt_linkStatus()))
        {
            dispatch(ctx, SupervisorEvent::CONNECTION_LOST);
        }

        uint32_t waitMs = CFG_SUPERVISOR_PUMP_MS;
        if (ctx.sup.retryPending)
        {
            const uint32_t untilRetry = supervisor_msUntilRetry(ctx.sup, millis());
            if (untilRetry == 0)
            {
                dispatch(ctx, SupervisorEvent::RETRY_DUE);
                continue;
            }
            waitMs = untilRetry;
        }
        else if (ctx.sup.gaveUp)
        {
            logger_logEvery("sup_gave_up", 60000, LogLevel::ERROR, LogDomain::SUPERVISOR,
                            "Reconnect attempts exhausted; waiting for stop command");
            waitMs = 1000;
        }

        // Backoff and pump waits both end immediately on shutdown.
        if (waitForShutdown(agent, waitMs))
        {
            break;
        }
    }

    dispatch(ctx, SupervisorEvent::SHUTDOWN);
    LOG_INFO(LogDomain::SUPERVISOR, "supervisorTask exited connects=%lu", (unsigned long)ctx.sup.connectCount);
    xEventGroupSetBits(agent->lifecycle, AGENT_BIT_SUPERVISOR_DONE);
    vTaskDelete(nullptr);
}

bool supervisor_taskBegin(Agent *agent)
{
    if (!agent || agent->supervisorTask)
    {
        return agent != nullptr;
    }
    const BaseType_t created = xTaskCreate(supervisorTask, "supervisorTask", (uint32_t)CFG_SUPERVISOR_TASK_STACK_BYTES,
                                           agent, (UBaseType_t)CFG_SUPERVISOR_TASK_PRIORITY, &agent->supervisorTask);
    if (created != pdPASS)
    {
        LOG_ERROR(LogDomain::SUPERVISOR, "supervisorTask create failed stack_bytes=%u",
                  (unsigned)CFG_SUPERVISOR_TASK_STACK_BYTES);
        agent->supervisorTask = nullptr;
        return false;
    }
    return true;
}
