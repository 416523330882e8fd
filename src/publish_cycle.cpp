#include "publish_cycle.h"

#include "logger.h"
#include "telemetry_json.h"
#include "topics.h"

CyclePlan publish_planCycle(const RuntimeConfig &cfg, uint32_t disabledPollMs, bool resuming)
{
    if (!cfg.enabled)
    {
        return CyclePlan{CycleAction::POLL_DISABLED, disabledPollMs};
    }

    uint32_t seconds = cfg.intervalSeconds;
    if (!runtime_config_isValidInterval(seconds))
    {
        // Unreachable through attributes_apply; guards a hand-built config.
        seconds = seconds < RUNTIME_INTERVAL_MIN_S ? RUNTIME_INTERVAL_MIN_S : runtime_config_maxIntervalSeconds();
    }
    const uint32_t intervalMs = seconds * 1000u;
    if (resuming && disabledPollMs < intervalMs)
    {
        return CyclePlan{CycleAction::WAIT_THEN_PUBLISH, disabledPollMs};
    }
    return CyclePlan{CycleAction::WAIT_THEN_PUBLISH, intervalMs};
}

uint32_t publish_remainingMs(const CyclePlan &plan, uint32_t cycleStartMs, uint32_t nowMs)
{
    const uint32_t elapsed = nowMs - cycleStartMs;
    return elapsed >= plan.waitMs ? 0 : plan.waitMs - elapsed;
}

PublishOutcome publish_finishCycle(const RuntimeConfig &cfgNow, ConnectionPhase phase, const PublishDeps &deps,
                                   TelemetrySample *sent)
{
    if (!cfgNow.enabled)
    {
        LOG_DEBUG(LogDomain::TELEMETRY, "Telemetry skipped: disabled");
        return PublishOutcome::SKIPPED_DISABLED;
    }

    if (phase != ConnectionPhase::CONNECTED)
    {
        LOG_WARN_EVERY("tele_skip_disc", 10000, LogDomain::TELEMETRY, "Telemetry skipped: not connected phase=%s",
                       supervisor_phaseToString(phase));
        return PublishOutcome::SKIPPED_DISCONNECTED;
    }

    const TelemetrySample sample = readings_sample(deps.rng);
    char payload[TELEMETRY_JSON_MAX];
    const TelemetryJsonError err = telemetry_buildJson(sample, payload, sizeof(payload));
    if (err != TelemetryJsonError::OK)
    {
        LOG_ERROR(LogDomain::TELEMETRY, "Telemetry encode failed err=%s", telemetry_jsonErrorToString(err));
        return PublishOutcome::ENCODE_FAILED;
    }

    if (!deps.publish || !deps.publish(deps.ctx, TOPIC_TELEMETRY, payload))
    {
        LOG_WARN(LogDomain::TELEMETRY, "Telemetry publish failed topic=%s payload=%s (dropped, next cycle retries)",
                 TOPIC_TELEMETRY, payload);
        return PublishOutcome::PUBLISH_FAILED;
    }

    LOG_INFO(LogDomain::TELEMETRY, "Telemetry published topic=%s payload=%s interval=%lus",
             TOPIC_TELEMETRY, payload, (unsigned long)cfgNow.intervalSeconds);
    if (sent)
    {
        *sent = sample;
    }
    return PublishOutcome::PUBLISHED;
}

const char *publish_outcomeToString(PublishOutcome outcome)
{
    switch (outcome)
    {
    case PublishOutcome::PUBLISHED:
        return "published";
    case PublishOutcome::SKIPPED_DISABLED:
        return "skipped_disabled";
    case PublishOutcome::SKIPPED_DISCONNECTED:
        return "skipped_disconnected";
    case PublishOutcome::ENCODE_FAILED:
        return "encode_failed";
    case PublishOutcome::PUBLISH_FAILED:
        return "publish_failed";
    }
    return "unknown";
}
