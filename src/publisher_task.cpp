#include <Arduino.h>
#include <freertos/FreeRTOS.h>
#include <freertos/event_groups.h>
#include <freertos/task.h>

#include "agent.h"
#include "config.h"
#include "logger.h"
#include "mqtt_transport.h"
#include "publish_cycle.h"

static bool publishTelemetry(void *ctx, const char *topic, const char *payload)
{
    Agent *agent = static_cast<Agent *>(ctx);
    const bool ok = mqtt_publish(topic, payload);
    shared_state_countPublish(&agent->shared, ok);
    return ok;
}

static void publisherTask(void *arg)
{
    Agent *agent = static_cast<Agent *>(arg);
    const EventBits_t startBits = AGENT_BIT_SESSION_READY | AGENT_BIT_SHUTDOWN_REQUESTED;

    LOG_INFO(LogDomain::TELEMETRY, "publisherTask started stack_bytes=%u prio=%u; waiting for session",
             (unsigned)CFG_PUBLISHER_TASK_STACK_BYTES, (unsigned)CFG_PUBLISHER_TASK_PRIORITY);

    // First cycle starts only after connect -> subscribe -> snapshot request.
    const EventBits_t started = xEventGroupWaitBits(agent->lifecycle, startBits, pdFALSE, pdFALSE, portMAX_DELAY);

    if ((started & AGENT_BIT_SHUTDOWN_REQUESTED) == 0)
    {
        const PublishDeps deps{agent->rng, publishTelemetry, agent};
        const EventBits_t wakeBits = AGENT_BIT_SHUTDOWN_REQUESTED | AGENT_BIT_CONFIG_CHANGED;
        uint32_t cycleStartMs = millis();
        bool resuming = false;
        for (;;)
        {
            // Clear before reading so a change that lands after the read still wakes us.
            xEventGroupClearBits(agent->lifecycle, AGENT_BIT_CONFIG_CHANGED);
            const RuntimeConfig cfg = shared_state_readConfig(&agent->shared);
            const CyclePlan plan = publish_planCycle(cfg, agent->settings.disabledPollMs, resuming);
            if (plan.action == CycleAction::POLL_DISABLED)
            {
                resuming = true;
                LOG_DEBUG_EVERY("tele_disabled", 30000, LogDomain::TELEMETRY,
                                "Telemetry disabled; polling every %lu ms", (unsigned long)plan.waitMs);
            }

            const uint32_t waitMs = publish_remainingMs(plan, cycleStartMs, millis());
            const EventBits_t bits = xEventGroupWaitBits(agent->lifecycle, wakeBits, pdFALSE, pdFALSE,
                                                         pdMS_TO_TICKS(waitMs));
            if (bits & AGENT_BIT_SHUTDOWN_REQUESTED)
            {
                break;
            }
            if (bits & AGENT_BIT_CONFIG_CHANGED)
            {
                // New interval counts from the start of this cycle (the last publish).
                continue;
            }
            if (plan.action != CycleAction::WAIT_THEN_PUBLISH)
            {
                cycleStartMs = millis();
                continue;
            }

            // Fresh read: a disable that landed during the wait wins.
            const RuntimeConfig cfgNow = shared_state_readConfig(&agent->shared);
            publish_finishCycle(cfgNow, shared_state_phase(&agent->shared), deps);
            cycleStartMs = millis();
            resuming = false;
        }
    }

    LOG_INFO(LogDomain::TELEMETRY, "publisherTask exited");
    xEventGroupSetBits(agent->lifecycle, AGENT_BIT_PUBLISHER_DONE);
    vTaskDelete(nullptr);
}

bool publisher_taskBegin(Agent *agent)
{
    if (!agent || agent->publisherTask)
    {
        return agent != nullptr;
    }
    const BaseType_t created = xTaskCreate(publisherTask, "publisherTask", (uint32_t)CFG_PUBLISHER_TASK_STACK_BYTES,
                                           agent, (UBaseType_t)CFG_PUBLISHER_TASK_PRIORITY, &agent->publisherTask);
    if (created != pdPASS)
    {
        LOG_ERROR(LogDomain::TELEMETRY, "publisherTask create failed stack_bytes=%u",
                  (unsigned)CFG_PUBLISHER_TASK_STACK_BYTES);
        agent->publisherTask = nullptr;
        return false;
    }
    return true;
}
