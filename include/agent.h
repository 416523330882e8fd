#pragma once
#include <stdint.h>

#include <freertos/FreeRTOS.h>
#include <freertos/event_groups.h>
#include <freertos/queue.h>
#include <freertos/task.h>

#include "agent_settings.h"
#include "readings.h"
#include "shared_state.h"

// Lifecycle event group bits.
static constexpr EventBits_t AGENT_BIT_SHUTDOWN_REQUESTED = (1 << 0);
static constexpr EventBits_t AGENT_BIT_SESSION_READY = (1 << 1); // first connect+subscribe+snapshot done
static constexpr EventBits_t AGENT_BIT_SUPERVISOR_DONE = (1 << 2);
static constexpr EventBits_t AGENT_BIT_PUBLISHER_DONE = (1 << 3);
static constexpr EventBits_t AGENT_BIT_CONFIG_CHANGED = (1 << 4); // wakes the publisher to re-plan its wait

// Owns everything both tasks share. Lives for the whole program (static in main.cpp).
struct Agent
{
    AgentSettings settings{};
    SharedState shared{};
    QueueHandle_t inbound = nullptr;
    EventGroupHandle_t lifecycle = nullptr;
    TaskHandle_t supervisorTask = nullptr;
    TaskHandle_t publisherTask = nullptr;
    ReadingRandomFn rng = nullptr;
    bool started = false;
};

// Contract: settings already passed agent_validateSettings().
bool agent_begin(Agent *agent, const AgentSettings &settings, ReadingRandomFn rng);

void agent_requestShutdown(Agent *agent);
bool agent_isShutdownRequested(const Agent *agent);

// Waits for both tasks to acknowledge shutdown. Returns false on timeout.
bool agent_waitStopped(Agent *agent, uint32_t graceMs);

// Task entry points (supervisor_task.cpp / publisher_task.cpp).
bool supervisor_taskBegin(Agent *agent);
bool publisher_taskBegin(Agent *agent);
