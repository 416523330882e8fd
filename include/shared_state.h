#pragma once
#include <stdint.h>

#include <freertos/FreeRTOS.h>

#include "attributes.h"
#include "runtime_config.h"
#include "supervisor.h"

// State shared by the supervisor task (writer) and the publisher task (reader).
// Owned by Agent and handed to both tasks; never a file-level global.
// Every access goes through the functions below, which copy whole values under the mux.
struct SharedState
{
    portMUX_TYPE mux;
    RuntimeConfig config;
    ConnectionPhase phase;
    uint32_t retryCount;
    uint32_t publishCount;
    uint32_t publishFailCount;
};

// Read-only copy for status output.
struct SharedStateSnapshot
{
    RuntimeConfig config;
    ConnectionPhase phase;
    uint32_t retryCount;
    uint32_t publishCount;
    uint32_t publishFailCount;
};

void shared_state_init(SharedState *s);

RuntimeConfig shared_state_readConfig(SharedState *s);

// Applies an attribute patch atomically. Returns the number of changed fields.
uint8_t shared_state_applyPatch(SharedState *s, const AttributePatch &patch, AttributeChanges *changes);

void shared_state_setConnection(SharedState *s, ConnectionPhase phase, uint32_t retryCount);
ConnectionPhase shared_state_phase(SharedState *s);

void shared_state_countPublish(SharedState *s, bool ok);

SharedStateSnapshot shared_state_snapshot(SharedState *s);
