#pragma once
#include <stdint.h>

struct BackoffPolicy
{
    uint32_t baseMs;
    uint32_t maxMs;   // ceiling, reached regardless of the failure count
    uint8_t jitterPct; // +/- percent applied to the nominal delay
};

BackoffPolicy backoff_defaultPolicy();

// min(base * 2^(failures-1), max). Returns 0 when failures == 0.
uint32_t backoff_nominalDelayMs(const BackoffPolicy &policy, uint32_t failures);

// Nominal delay with jitter derived from randomValue (any uint32_t), clamped to [1, max].
uint32_t backoff_delayMs(const BackoffPolicy &policy, uint32_t failures, uint32_t randomValue);
