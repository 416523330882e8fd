#pragma once
#include <stddef.h>
#include <stdint.h>

#include "topics.h"

#ifndef CFG_EVENT_PAYLOAD_MAX
#define CFG_EVENT_PAYLOAD_MAX 512u
#endif

// Items on the inbound queue (transport -> supervisor task). Payload bytes are copied
// because PubSubClient reuses its receive buffer.
enum class AgentEventType : uint8_t
{
    MESSAGE = 0,
    CONNECTION_LOST
};

struct AgentEvent
{
    AgentEventType type = AgentEventType::MESSAGE;
    int transportState = 0; // PubSubClient state() for CONNECTION_LOST
    char topic[TOPIC_MAX] = {0};
    uint16_t len = 0;
    uint8_t payload[CFG_EVENT_PAYLOAD_MAX] = {0};
};
