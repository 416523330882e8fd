#include "telemetry_json.h"

#include <ArduinoJson.h>

TelemetryJsonError telemetry_buildJson(const TelemetrySample &sample, char *outBuf, size_t outSize)
{
    if (!outBuf || outSize == 0)
    {
        return TelemetryJsonError::OUT_TOO_SMALL;
    }
    outBuf[0] = '\0';

    StaticJsonDocument<JSON_OBJECT_SIZE(2)> doc;
    doc["temperature"] = sample.temperature;
    doc["humidity"] = sample.humidity;
    if (doc.overflowed())
    {
        return TelemetryJsonError::SERIALIZE_FAILED;
    }

    const size_t required = measureJson(doc);
    if (required + 1 > outSize)
    {
        return TelemetryJsonError::OUT_TOO_SMALL;
    }

    const size_t written = serializeJson(doc, outBuf, outSize);
    if (written == 0 || written != required)
    {
        outBuf[0] = '\0';
        return TelemetryJsonError::SERIALIZE_FAILED;
    }
    return TelemetryJsonError::OK;
}

const char *telemetry_jsonErrorToString(TelemetryJsonError err)
{
    switch (err)
    {
    case TelemetryJsonError::OK:
        return "ok";
    case TelemetryJsonError::OUT_TOO_SMALL:
        return "out_too_small";
    case TelemetryJsonError::SERIALIZE_FAILED:
        return "serialize_failed";
    }
    return "unknown";
}
