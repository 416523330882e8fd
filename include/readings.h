#pragma once
#include <stdint.h>

// Simulated environment sensor. Stateless; randomness comes from the caller.

static constexpr double READING_TEMPERATURE_MIN_C = 15.0;
static constexpr double READING_TEMPERATURE_MAX_C = 26.0;
static constexpr double READING_HUMIDITY_MIN_PCT = 35.0;
static constexpr double READING_HUMIDITY_MAX_PCT = 66.0;

struct TelemetrySample
{
    double temperature; // degC, 2 decimals
    double humidity;    // %RH, 2 decimals
};

using ReadingRandomFn = uint32_t (*)();

// Contract: rng must be non-null; only called from the publish task.
TelemetrySample readings_sample(ReadingRandomFn rng);
