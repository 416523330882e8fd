#pragma once
#include <stdint.h>

#include "readings.h"
#include "runtime_config.h"
#include "supervisor.h"

// One publish cycle: plan (wait length) -> cancellable wait -> finish (maybe publish).

enum class CycleAction : uint8_t
{
    POLL_DISABLED = 0, // short wait, then re-check; nothing is published
    WAIT_THEN_PUBLISH
};

struct CyclePlan
{
    CycleAction action;
    uint32_t waitMs;
};

enum class PublishOutcome : uint8_t
{
    PUBLISHED = 0,
    SKIPPED_DISABLED,
    SKIPPED_DISCONNECTED,
    ENCODE_FAILED,
    PUBLISH_FAILED
};

struct PublishDeps
{
    ReadingRandomFn rng;
    // publish(ctx, topic, payload) -> accepted by the transport
    bool (*publish)(void *, const char *, const char *);
    void *ctx;
};

// Fresh decision from the current config. Re-planned whenever the config changes mid-wait.
// resuming: the loop polled as disabled since its last publish. The first enabled cycle
// after that is due at the next poll boundary instead of a full interval later.
CyclePlan publish_planCycle(const RuntimeConfig &cfg, uint32_t disabledPollMs, bool resuming = false);

// Time left in a cycle that started at cycleStartMs (wrap-safe). 0 = due now.
uint32_t publish_remainingMs(const CyclePlan &plan, uint32_t cycleStartMs, uint32_t nowMs);

// cfgNow is re-read after the wait so a disable during the wait suppresses the publish.
// sent (optional) receives the sample when PUBLISHED.
PublishOutcome publish_finishCycle(const RuntimeConfig &cfgNow, ConnectionPhase phase, const PublishDeps &deps,
                                   TelemetrySample *sent = nullptr);

const char *publish_outcomeToString(PublishOutcome outcome);
