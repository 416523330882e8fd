#include "backoff.h"

#include "config.h"

static_assert(CFG_RECONNECT_BASE_MS > 0u, "CFG_RECONNECT_BASE_MS must be > 0");
static_assert(CFG_RECONNECT_MAX_MS >= CFG_RECONNECT_BASE_MS, "CFG_RECONNECT_MAX_MS must be >= CFG_RECONNECT_BASE_MS");
static_assert(CFG_RECONNECT_JITTER_PCT <= 100u, "CFG_RECONNECT_JITTER_PCT must be 0..100");

BackoffPolicy backoff_defaultPolicy()
{
    return BackoffPolicy{CFG_RECONNECT_BASE_MS, CFG_RECONNECT_MAX_MS, (uint8_t)CFG_RECONNECT_JITTER_PCT};
}

uint32_t backoff_nominalDelayMs(const BackoffPolicy &policy, uint32_t failures)
{
    if (failures == 0)
    {
        return 0;
    }

    uint64_t delay = policy.baseMs;
    // Doubling stops as soon as the ceiling is hit, so the shift never overflows.
    for (uint32_t i = 1; i < failures && delay < policy.maxMs; ++i)
    {
        delay <<= 1;
    }
    return delay > policy.maxMs ? policy.maxMs : (uint32_t)delay;
}

uint32_t backoff_delayMs(const BackoffPolicy &policy, uint32_t failures, uint32_t randomValue)
{
    const uint32_t nominal = backoff_nominalDelayMs(policy, failures);
    if (nominal == 0)
    {
        return 0;
    }

    int64_t delay = nominal;
    if (policy.jitterPct > 0)
    {
        const int64_t span = ((int64_t)nominal * policy.jitterPct) / 100; // one side of the window
        if (span > 0)
        {
            const int64_t offset = (int64_t)(randomValue % (uint32_t)(2 * span + 1)) - span;
            delay += offset;
        }
    }

    if (delay < 1)
    {
        delay = 1;
    }
    if (delay > (int64_t)policy.maxMs)
    {
        delay = policy.maxMs;
    }
    return (uint32_t)delay;
}
