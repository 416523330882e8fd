#pragma once
#include <stddef.h>
#include <stdint.h>

#include "readings.h"

static constexpr size_t TELEMETRY_JSON_MAX = 96;

enum class TelemetryJsonError : uint8_t
{
    OK = 0,
    OUT_TOO_SMALL,
    SERIALIZE_FAILED
};

// Writes exactly {"temperature":<n>,"humidity":<n>} into outBuf (null-terminated).
TelemetryJsonError telemetry_buildJson(const TelemetrySample &sample, char *outBuf, size_t outSize);

const char *telemetry_jsonErrorToString(TelemetryJsonError err);
