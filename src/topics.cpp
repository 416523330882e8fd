#include "topics.h"

#include <stdio.h>
#include <string.h>

namespace
{
static bool hasPrefix(const char *s, const char *prefix)
{
    return strncmp(s, prefix, strlen(prefix)) == 0;
}

static bool isDecimal(const char *s)
{
    if (!s || *s == '\0')
    {
        return false;
    }
    for (; *s; ++s)
    {
        if (*s < '0' || *s > '9')
        {
            return false;
        }
    }
    return true;
}
} // namespace

namespace topics
{
bool buildRequest(uint32_t requestId, char *out, size_t outSize)
{
    if (!out || outSize == 0)
    {
        return false;
    }
    const int n = snprintf(out, outSize, "%s%lu", TOPIC_ATTRIBUTES_REQUEST_PREFIX, (unsigned long)requestId);
    if (n <= 0 || (size_t)n >= outSize)
    {
        out[0] = '\0';
        return false;
    }
    return true;
}

AttributeSource classify(const char *topic)
{
    if (!topic)
    {
        return AttributeSource::UNKNOWN;
    }
    if (strcmp(topic, TOPIC_ATTRIBUTES) == 0)
    {
        return AttributeSource::PUSH_UPDATE;
    }
    if (hasPrefix(topic, TOPIC_ATTRIBUTES_RESPONSE_PREFIX) &&
        isDecimal(topic + strlen(TOPIC_ATTRIBUTES_RESPONSE_PREFIX)))
    {
        return AttributeSource::SNAPSHOT_RESPONSE;
    }
    return AttributeSource::UNKNOWN;
}

const char *sourceToString(AttributeSource source)
{
    switch (source)
    {
    case AttributeSource::PUSH_UPDATE:
        return "push_update";
    case AttributeSource::SNAPSHOT_RESPONSE:
        return "snapshot_response";
    case AttributeSource::UNKNOWN:
        return "unknown";
    }
    return "unknown";
}
} // namespace topics
