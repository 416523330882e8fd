#pragma once

#include <stddef.h>
#include <stdint.h>

// ThingsBoard device API topics.
static constexpr const char *TOPIC_TELEMETRY = "v1/devices/me/telemetry";
static constexpr const char *TOPIC_ATTRIBUTES = "v1/devices/me/attributes";
static constexpr const char *TOPIC_ATTRIBUTES_REQUEST_PREFIX = "v1/devices/me/attributes/request/";
static constexpr const char *TOPIC_ATTRIBUTES_RESPONSE_PREFIX = "v1/devices/me/attributes/response/";
static constexpr const char *TOPIC_ATTRIBUTES_RESPONSE_FILTER = "v1/devices/me/attributes/response/+";

static constexpr size_t TOPIC_MAX = 96;

enum class AttributeSource : uint8_t
{
    UNKNOWN = 0,
    PUSH_UPDATE,
    SNAPSHOT_RESPONSE
};

// Body sent to TOPIC_ATTRIBUTES_REQUEST_PREFIX<id> asking for the current values.
static constexpr const char *ATTRIBUTES_REQUEST_BODY =
    "{\"clientKeys\":\"interval,enabled,firmware_version\","
    "\"sharedKeys\":\"interval,enabled,firmware_version\"}";

namespace topics
{
// Writes "<request prefix><requestId>". Returns false if out is too small.
bool buildRequest(uint32_t requestId, char *out, size_t outSize);

// Maps an inbound topic to the attribute message kind.
AttributeSource classify(const char *topic);

const char *sourceToString(AttributeSource source);
} // namespace topics
