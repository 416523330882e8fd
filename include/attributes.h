#pragma once
#include <stddef.h>
#include <stdint.h>

#include "runtime_config.h"
#include "topics.h"

// Inbound shared-attribute payloads ("interval", "enabled", "firmware_version").
// Snapshot responses ({"client":{..},"shared":{..}}) and flat push updates merge the same
// way: present keys overwrite, absent keys leave the runtime config untouched.

enum class FieldVerdict : uint8_t
{
    ABSENT = 0,
    ACCEPTED,
    REJECTED
};

enum class AttributeParseResult : uint8_t
{
    OK = 0,
    EMPTY,
    INVALID_JSON,
    NOT_OBJECT
};

struct AttributePatch
{
    FieldVerdict interval = FieldVerdict::ABSENT;
    uint32_t intervalSeconds = 0;

    FieldVerdict enabled = FieldVerdict::ABSENT;
    bool enabledValue = false;

    FieldVerdict firmwareVersion = FieldVerdict::ABSENT;
    char firmwareVersionValue[FIRMWARE_VERSION_MAX] = {0};
    bool firmwareVersionTruncated = false;

    uint8_t recognizedKeys = 0; // occurrences of known keys, valid or not
    uint8_t rejectedKeys = 0;
};

struct AttributeChanges
{
    bool intervalWritten = false;
    uint32_t intervalOld = 0;
    uint32_t intervalNew = 0;

    bool enabledWritten = false;
    bool enabledOld = false;
    bool enabledNew = false;

    bool firmwareWritten = false;
    char firmwareOld[FIRMWARE_VERSION_MAX] = {0};
    char firmwareNew[FIRMWARE_VERSION_MAX] = {0};
    bool firmwareTruncated = false;

    uint8_t recognizedKeys = 0;
    uint8_t rejectedKeys = 0;
};

// Parses raw MQTT bytes (not null terminated). Never fails hard: malformed fields are
// marked REJECTED and logged, the remaining fields are still usable.
AttributeParseResult attributes_parse(const uint8_t *payload, size_t len, AttributePatch *out);

// Writes every ACCEPTED field into cfg. Returns the number of fields whose value changed.
// Contract: caller holds whatever lock guards cfg; no logging happens here.
uint8_t attributes_apply(RuntimeConfig &cfg, const AttributePatch &patch, AttributeChanges *changes);

// Logs the outcome of one apply (old -> new per written field, simulated OTA on a new firmware tag).
void attributes_logChanges(const AttributeChanges &changes, AttributeSource source);

const char *attributes_parseResultToString(AttributeParseResult r);
