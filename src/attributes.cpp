#include "attributes.h"

#include <ArduinoJson.h>
#include <ctype.h>
#include <errno.h>
#include <math.h>
#include <stdlib.h>
#include <string.h>

#include "logger.h"

static constexpr const char *kKeyInterval = "interval";
static constexpr const char *kKeyEnabled = "enabled";
static constexpr const char *kKeyFirmware = "firmware_version";
static constexpr size_t kValuePreviewMax = 48;

namespace
{
// Renders a JSON value for log lines; long values are cut.
static void describeValue(JsonVariantConst v, char *out, size_t outSize)
{
    const size_t written = serializeJson(v, out, outSize);
    if (written == 0 && outSize > 0)
    {
        out[0] = '\0';
    }
}

static bool equalsIgnoreCase(const char *a, const char *b)
{
    for (; *a && *b; ++a, ++b)
    {
        if (tolower((unsigned char)*a) != tolower((unsigned char)*b))
        {
            return false;
        }
    }
    return *a == '\0' && *b == '\0';
}

// Accepts optional surrounding whitespace and an optional '+' sign.
static bool parseDecimalString(const char *s, long long &out)
{
    if (!s)
    {
        return false;
    }
    while (isspace((unsigned char)*s))
    {
        ++s;
    }
    if (*s == '\0')
    {
        return false;
    }

    errno = 0;
    char *end = nullptr;
    const long long value = strtoll(s, &end, 10);
    if (end == s || errno == ERANGE)
    {
        return false;
    }
    while (isspace((unsigned char)*end))
    {
        ++end;
    }
    if (*end != '\0')
    {
        return false;
    }
    out = value;
    return true;
}

static bool coerceInterval(JsonVariantConst v, uint32_t &out, const char *&reason)
{
    long long candidate = 0;
    if (v.is<bool>())
    {
        reason = "not_a_number";
        return false;
    }
    if (v.is<long>())
    {
        candidate = v.as<long>();
    }
    else if (v.is<double>())
    {
        const double d = v.as<double>();
        if (!isfinite(d) || d > 4294967295.0 || d < -4294967295.0)
        {
            reason = "out_of_range";
            return false;
        }
        candidate = (long long)d; // truncates toward zero
    }
    else if (v.is<const char *>())
    {
        if (!parseDecimalString(v.as<const char *>(), candidate))
        {
            reason = "not_an_integer";
            return false;
        }
    }
    else
    {
        reason = "not_a_number";
        return false;
    }

    if (candidate < (long long)RUNTIME_INTERVAL_MIN_S)
    {
        reason = "not_positive";
        return false;
    }
    if (candidate > (long long)runtime_config_maxIntervalSeconds())
    {
        reason = "above_max";
        return false;
    }
    out = (uint32_t)candidate;
    return true;
}

static bool coerceEnabled(JsonVariantConst v, bool &out, const char *&reason)
{
    if (v.is<bool>())
    {
        out = v.as<bool>();
        return true;
    }
    if (v.is<long>())
    {
        const long long n = v.as<long>();
        if (n == 0 || n == 1)
        {
            out = n == 1;
            return true;
        }
        reason = "not_0_or_1";
        return false;
    }
    if (v.is<const char *>())
    {
        const char *s = v.as<const char *>();
        static constexpr const char *kTrue[] = {"true", "1", "on", "yes"};
        static constexpr const char *kFalse[] = {"false", "0", "off", "no"};
        for (const char *t : kTrue)
        {
            if (equalsIgnoreCase(s, t))
            {
                out = true;
                return true;
            }
        }
        for (const char *f : kFalse)
        {
            if (equalsIgnoreCase(s, f))
            {
                out = false;
                return true;
            }
        }
        reason = "unrecognized_string";
        return false;
    }
    reason = "not_a_bool";
    return false;
}

static bool coerceFirmware(JsonVariantConst v, char *out, size_t outSize, bool &truncated, const char *&reason)
{
    truncated = false;
    if (v.isNull() || v.is<JsonObjectConst>() || v.is<JsonArrayConst>())
    {
        reason = "not_a_scalar";
        return false;
    }

    if (v.is<const char *>())
    {
        const char *s = v.as<const char *>();
        strncpy(out, s, outSize);
        out[outSize - 1] = '\0';
        truncated = strlen(s) >= outSize;
        return true;
    }

    // Numbers and bools keep their JSON text ("2", "1.5", "true").
    char scratch[kValuePreviewMax];
    const size_t written = serializeJson(v, scratch, sizeof(scratch));
    if (written == 0)
    {
        reason = "serialize_failed";
        return false;
    }
    strncpy(out, scratch, outSize);
    out[outSize - 1] = '\0';
    truncated = written >= outSize;
    return true;
}

static void logRejected(const char *key, JsonVariantConst v, const char *reason)
{
    char preview[kValuePreviewMax];
    describeValue(v, preview, sizeof(preview));
    LOG_WARN(LogDomain::CONFIG, "Config field rejected key=%s value=%s reason=%s (keeping previous value)",
             key, preview, reason ? reason : "invalid");
}

// A rejected occurrence never overrides an accepted one from the same payload.
static void markRejected(FieldVerdict &verdict, AttributePatch &patch)
{
    ++patch.rejectedKeys;
    if (verdict != FieldVerdict::ACCEPTED)
    {
        verdict = FieldVerdict::REJECTED;
    }
}

static void mergeObject(JsonObjectConst obj, AttributePatch &patch)
{
    for (JsonPairConst kv : obj)
    {
        const char *key = kv.key().c_str();
        JsonVariantConst value = kv.value();
        const char *reason = nullptr;

        if (strcmp(key, kKeyInterval) == 0)
        {
            ++patch.recognizedKeys;
            uint32_t seconds = 0;
            if (coerceInterval(value, seconds, reason))
            {
                patch.interval = FieldVerdict::ACCEPTED;
                patch.intervalSeconds = seconds;
            }
            else
            {
                logRejected(key, value, reason);
                markRejected(patch.interval, patch);
            }
        }
        else if (strcmp(key, kKeyEnabled) == 0)
        {
            ++patch.recognizedKeys;
            bool enabled = false;
            if (coerceEnabled(value, enabled, reason))
            {
                patch.enabled = FieldVerdict::ACCEPTED;
                patch.enabledValue = enabled;
            }
            else
            {
                logRejected(key, value, reason);
                markRejected(patch.enabled, patch);
            }
        }
        else if (strcmp(key, kKeyFirmware) == 0)
        {
            ++patch.recognizedKeys;
            char buf[FIRMWARE_VERSION_MAX] = {0};
            bool truncated = false;
            if (coerceFirmware(value, buf, sizeof(buf), truncated, reason))
            {
                patch.firmwareVersion = FieldVerdict::ACCEPTED;
                memcpy(patch.firmwareVersionValue, buf, sizeof(buf));
                patch.firmwareVersionTruncated = truncated;
            }
            else
            {
                logRejected(key, value, reason);
                markRejected(patch.firmwareVersion, patch);
            }
        }
        // Unknown keys are ignored.
    }
}
} // namespace

AttributeParseResult attributes_parse(const uint8_t *payload, size_t len, AttributePatch *out)
{
    if (!out)
    {
        return AttributeParseResult::EMPTY;
    }
    *out = AttributePatch{};

    if (!payload || len == 0)
    {
        LOG_WARN(LogDomain::CONFIG, "Attribute payload empty; nothing applied");
        return AttributeParseResult::EMPTY;
    }

    StaticJsonDocument<1024> doc;
    const DeserializationError err = deserializeJson(doc, reinterpret_cast<const char *>(payload), len);
    if (err)
    {
        LOG_WARN(LogDomain::CONFIG, "Attribute payload rejected: invalid JSON err=%s len=%u", err.c_str(), (unsigned)len);
        return AttributeParseResult::INVALID_JSON;
    }

    JsonObjectConst root = doc.as<JsonObjectConst>();
    if (root.isNull())
    {
        LOG_WARN(LogDomain::CONFIG, "Attribute payload rejected: root is not an object len=%u", (unsigned)len);
        return AttributeParseResult::NOT_OBJECT;
    }

    JsonObjectConst client = root["client"].as<JsonObjectConst>();
    JsonObjectConst shared = root["shared"].as<JsonObjectConst>();
    if (!client.isNull() || !shared.isNull())
    {
        // Snapshot response envelope: shared attributes win over client ones.
        if (!client.isNull())
        {
            mergeObject(client, *out);
        }
        if (!shared.isNull())
        {
            mergeObject(shared, *out);
        }
    }
    else
    {
        mergeObject(root, *out);
    }
    return AttributeParseResult::OK;
}

uint8_t attributes_apply(RuntimeConfig &cfg, const AttributePatch &patch, AttributeChanges *changes)
{
    AttributeChanges local{};
    AttributeChanges &c = changes ? *changes : local;
    c = AttributeChanges{};
    c.recognizedKeys = patch.recognizedKeys;
    c.rejectedKeys = patch.rejectedKeys;

    uint8_t changedCount = 0;

    if (patch.interval == FieldVerdict::ACCEPTED && runtime_config_isValidInterval(patch.intervalSeconds))
    {
        c.intervalWritten = true;
        c.intervalOld = cfg.intervalSeconds;
        c.intervalNew = patch.intervalSeconds;
        if (cfg.intervalSeconds != patch.intervalSeconds)
        {
            cfg.intervalSeconds = patch.intervalSeconds;
            ++changedCount;
        }
    }

    if (patch.enabled == FieldVerdict::ACCEPTED)
    {
        c.enabledWritten = true;
        c.enabledOld = cfg.enabled;
        c.enabledNew = patch.enabledValue;
        if (cfg.enabled != patch.enabledValue)
        {
            cfg.enabled = patch.enabledValue;
            ++changedCount;
        }
    }

    if (patch.firmwareVersion == FieldVerdict::ACCEPTED)
    {
        c.firmwareWritten = true;
        c.firmwareTruncated = patch.firmwareVersionTruncated;
        memcpy(c.firmwareOld, cfg.firmwareVersion, sizeof(c.firmwareOld));
        memcpy(c.firmwareNew, patch.firmwareVersionValue, sizeof(c.firmwareNew));
        if (strcmp(cfg.firmwareVersion, patch.firmwareVersionValue) != 0)
        {
            runtime_config_setFirmwareVersion(cfg, patch.firmwareVersionValue);
            ++changedCount;
        }
    }

    return changedCount;
}

void attributes_logChanges(const AttributeChanges &changes, AttributeSource source)
{
    const char *src = topics::sourceToString(source);

    if (changes.recognizedKeys == 0)
    {
        LOG_DEBUG(LogDomain::CONFIG, "Attribute update source=%s had no recognized keys; no-op", src);
        return;
    }

    if (changes.intervalWritten)
    {
        if (changes.intervalOld != changes.intervalNew)
        {
            LOG_INFO(LogDomain::CONFIG, "Config updated key=interval old=%lus new=%lus source=%s",
                     (unsigned long)changes.intervalOld, (unsigned long)changes.intervalNew, src);
        }
        else
        {
            LOG_DEBUG(LogDomain::CONFIG, "Config unchanged key=interval old=%lus new=%lus source=%s",
                      (unsigned long)changes.intervalOld, (unsigned long)changes.intervalNew, src);
        }
    }

    if (changes.enabledWritten)
    {
        if (changes.enabledOld != changes.enabledNew)
        {
            LOG_INFO(LogDomain::CONFIG, "Config updated key=enabled old=%s new=%s source=%s",
                     changes.enabledOld ? "true" : "false", changes.enabledNew ? "true" : "false", src);
        }
        else
        {
            LOG_DEBUG(LogDomain::CONFIG, "Config unchanged key=enabled old=%s new=%s source=%s",
                      changes.enabledOld ? "true" : "false", changes.enabledNew ? "true" : "false", src);
        }
    }

    if (changes.firmwareWritten)
    {
        if (changes.firmwareTruncated)
        {
            LOG_WARN(LogDomain::CONFIG, "Config key=firmware_version truncated to %u chars",
                     (unsigned)(FIRMWARE_VERSION_MAX - 1));
        }
        if (strcmp(changes.firmwareOld, changes.firmwareNew) != 0)
        {
            LOG_INFO(LogDomain::CONFIG, "Config updated key=firmware_version old=%s new=%s source=%s",
                     changes.firmwareOld, changes.firmwareNew, src);
            LOG_INFO(LogDomain::SYSTEM, "OTA simulation start target=%s", changes.firmwareNew);
            LOG_INFO(LogDomain::SYSTEM, "OTA simulation complete version=%s", changes.firmwareNew);
        }
        else
        {
            LOG_DEBUG(LogDomain::CONFIG, "Config unchanged key=firmware_version old=%s new=%s source=%s",
                      changes.firmwareOld, changes.firmwareNew, src);
        }
    }
}

const char *attributes_parseResultToString(AttributeParseResult r)
{
    switch (r)
    {
    case AttributeParseResult::OK:
        return "ok";
    case AttributeParseResult::EMPTY:
        return "empty";
    case AttributeParseResult::INVALID_JSON:
        return "invalid_json";
    case AttributeParseResult::NOT_OBJECT:
        return "not_object";
    }
    return "unknown";
}
