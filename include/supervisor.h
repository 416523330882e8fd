#pragma once
#include <stdint.h>

#include "backoff.h"

// Connection lifecycle state machine. Pure: the supervisor task feeds it events and
// executes the returned actions against the MQTT transport.

enum class ConnectionPhase : uint8_t
{
    DISCONNECTED_NEVER = 0,
    CONNECTING,
    CONNECTED,
    DISCONNECTED_LOST,
    STOPPED
};

enum class SupervisorEvent : uint8_t
{
    START = 0,
    CONNECT_OK,
    CONNECT_FAILED,
    SUBSCRIBE_FAILED,
    CONNECTION_LOST,
    RETRY_DUE,
    SHUTDOWN
};

// Result of asking the transport whether the session is up. UNKNOWN when the client was
// busy (another task held it) and the answer could not be read.
enum class LinkStatus : uint8_t
{
    UNKNOWN = 0,
    UP,
    DOWN
};

// Action bits, executed in this order: DISCONNECT, CANCEL_RETRY, CONNECT, SUBSCRIBE,
// REQUEST_SNAPSHOT, SCHEDULE_RETRY.
static constexpr uint8_t SUP_ACT_CONNECT = (1 << 0);
static constexpr uint8_t SUP_ACT_SUBSCRIBE = (1 << 1);
static constexpr uint8_t SUP_ACT_REQUEST_SNAPSHOT = (1 << 2);
static constexpr uint8_t SUP_ACT_SCHEDULE_RETRY = (1 << 3);
static constexpr uint8_t SUP_ACT_CANCEL_RETRY = (1 << 4);
static constexpr uint8_t SUP_ACT_DISCONNECT = (1 << 5);

struct SupervisorActions
{
    uint8_t flags = 0;
    uint32_t retryDelayMs = 0;
};

struct SupervisorState
{
    ConnectionPhase phase = ConnectionPhase::DISCONNECTED_NEVER;
    uint32_t retryCount = 0; // consecutive failures since the last successful connect
    bool retryPending = false;
    uint32_t retryAtMs = 0;
    uint32_t lastDelayMs = 0;
    uint32_t connectCount = 0;
    uint32_t maxAttempts = 0; // 0 = unlimited
    bool gaveUp = false;
    BackoffPolicy policy{};
};

void supervisor_init(SupervisorState *s, const BackoffPolicy &policy, uint32_t maxAttempts);

// randomValue feeds the backoff jitter; pass any uint32_t.
SupervisorActions supervisor_handle(SupervisorState *s, SupervisorEvent ev, uint32_t nowMs, uint32_t randomValue);

bool supervisor_isRetryDue(const SupervisorState &s, uint32_t nowMs);

// 0 if a retry is due now or none is pending.
uint32_t supervisor_msUntilRetry(const SupervisorState &s, uint32_t nowMs);

// True only when a CONNECTED session is positively reported DOWN.
bool supervisor_isLinkLost(const SupervisorState &s, LinkStatus link);

const char *supervisor_phaseToString(ConnectionPhase phase);
const char *supervisor_eventToString(SupervisorEvent ev);
