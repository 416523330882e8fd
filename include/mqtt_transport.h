#pragma once
#include <stddef.h>
#include <stdint.h>

#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>

#include "supervisor.h"

struct MqttConfig
{
    const char *host;
    uint16_t port;
    const char *clientId;
    const char *user; // ThingsBoard access token; password stays empty
};

// Contract: inboundQueue carries AgentEvent items; the transport only ever sends to it
// (non-blocking) and never calls application code from the network callback.
bool mqtt_begin(const MqttConfig &cfg, QueueHandle_t inboundQueue);

// One connect attempt. Blocks for at most the socket timeout.
bool mqtt_connect();

bool mqtt_subscribe(const char *topicFilter);

// Non-retained publish. Fails fast when the session is busy or down.
bool mqtt_publish(const char *topic, const char *payload);

// Pumps PubSubClient; queues a CONNECTION_LOST event when the session drops.
void mqtt_service();

void mqtt_disconnect();

// UNKNOWN when the client lock could not be taken in time (a publish is in flight).
LinkStatus mqtt_linkStatus();
int mqtt_state();
const char *mqtt_stateToString(int state);
