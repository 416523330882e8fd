#include "supervisor.h"

#include "logger.h"

static bool isDisconnected(ConnectionPhase p)
{
    return p == ConnectionPhase::DISCONNECTED_NEVER || p == ConnectionPhase::DISCONNECTED_LOST;
}

static void scheduleAfterFailure(SupervisorState *s, SupervisorActions &out, uint32_t nowMs, uint32_t randomValue,
                                 const char *cause)
{
    s->phase = ConnectionPhase::DISCONNECTED_LOST;
    ++s->retryCount;

    if (s->maxAttempts != 0 && s->retryCount > s->maxAttempts)
    {
        s->retryPending = false;
        s->gaveUp = true;
        LOG_ERROR(LogDomain::SUPERVISOR, "Reconnect attempts exhausted cause=%s failures=%lu max=%lu",
                  cause, (unsigned long)s->retryCount, (unsigned long)s->maxAttempts);
        return;
    }

    const uint32_t delay = backoff_delayMs(s->policy, s->retryCount, randomValue);
    s->retryPending = true;
    s->retryAtMs = nowMs + delay;
    s->lastDelayMs = delay;
    out.flags |= SUP_ACT_SCHEDULE_RETRY;
    out.retryDelayMs = delay;
    LOG_INFO(LogDomain::SUPERVISOR, "Reconnect scheduled cause=%s attempt=%lu delay_ms=%lu",
             cause, (unsigned long)s->retryCount, (unsigned long)delay);
}

void supervisor_init(SupervisorState *s, const BackoffPolicy &policy, uint32_t maxAttempts)
{
    if (!s)
    {
        return;
    }
    *s = SupervisorState{};
    s->policy = policy;
    s->maxAttempts = maxAttempts;
}

SupervisorActions supervisor_handle(SupervisorState *s, SupervisorEvent ev, uint32_t nowMs, uint32_t randomValue)
{
    SupervisorActions out{};
    if (!s || s->phase == ConnectionPhase::STOPPED)
    {
        return out;
    }

    const ConnectionPhase before = s->phase;
    switch (ev)
    {
    case SupervisorEvent::START:
        if (s->phase == ConnectionPhase::DISCONNECTED_NEVER && !s->retryPending)
        {
            s->phase = ConnectionPhase::CONNECTING;
            out.flags |= SUP_ACT_CONNECT;
        }
        break;

    case SupervisorEvent::CONNECT_OK:
        if (s->phase == ConnectionPhase::CONNECTING)
        {
            s->phase = ConnectionPhase::CONNECTED;
            s->retryCount = 0;
            s->retryPending = false;
            s->lastDelayMs = 0;
            s->gaveUp = false;
            ++s->connectCount;
            // Subscribe first: a snapshot response sent before the subscription exists is lost.
            out.flags |= SUP_ACT_SUBSCRIBE | SUP_ACT_REQUEST_SNAPSHOT;
        }
        break;

    case SupervisorEvent::CONNECT_FAILED:
        if (s->phase == ConnectionPhase::CONNECTING)
        {
            scheduleAfterFailure(s, out, nowMs, randomValue, "connect_failed");
        }
        break;

    case SupervisorEvent::SUBSCRIBE_FAILED:
        if (s->phase == ConnectionPhase::CONNECTED)
        {
            out.flags |= SUP_ACT_DISCONNECT;
            scheduleAfterFailure(s, out, nowMs, randomValue, "subscribe_failed");
        }
        break;

    case SupervisorEvent::CONNECTION_LOST:
        if (s->phase == ConnectionPhase::CONNECTED || s->phase == ConnectionPhase::CONNECTING)
        {
            scheduleAfterFailure(s, out, nowMs, randomValue, "connection_lost");
        }
        break;

    case SupervisorEvent::RETRY_DUE:
        if (isDisconnected(s->phase) && supervisor_isRetryDue(*s, nowMs))
        {
            s->retryPending = false;
            s->phase = ConnectionPhase::CONNECTING;
            out.flags |= SUP_ACT_CONNECT;
        }
        break;

    case SupervisorEvent::SHUTDOWN:
        s->phase = ConnectionPhase::STOPPED;
        s->retryPending = false;
        out.flags |= SUP_ACT_CANCEL_RETRY | SUP_ACT_DISCONNECT;
        break;
    }

    if (s->phase != before)
    {
        LOG_DEBUG(LogDomain::SUPERVISOR, "Phase %s -> %s event=%s retry_count=%lu",
                  supervisor_phaseToString(before), supervisor_phaseToString(s->phase),
                  supervisor_eventToString(ev), (unsigned long)s->retryCount);
    }
    return out;
}

bool supervisor_isRetryDue(const SupervisorState &s, uint32_t nowMs)
{
    return s.retryPending && (int32_t)(nowMs - s.retryAtMs) >= 0;
}

uint32_t supervisor_msUntilRetry(const SupervisorState &s, uint32_t nowMs)
{
    if (!s.retryPending || supervisor_isRetryDue(s, nowMs))
    {
        return 0;
    }
    return s.retryAtMs - nowMs;
}

bool supervisor_isLinkLost(const SupervisorState &s, LinkStatus link)
{
    return s.phase == ConnectionPhase::CONNECTED && link == LinkStatus::DOWN;
}

const char *supervisor_phaseToString(ConnectionPhase phase)
{
    switch (phase)
    {
    case ConnectionPhase::DISCONNECTED_NEVER:
        return "disconnected_never";
    case ConnectionPhase::CONNECTING:
        return "connecting";
    case ConnectionPhase::CONNECTED:
        return "connected";
    case ConnectionPhase::DISCONNECTED_LOST:
        return "disconnected_lost";
    case ConnectionPhase::STOPPED:
        return "stopped";
    }
    return "unknown";
}

const char *supervisor_eventToString(SupervisorEvent ev)
{
    switch (ev)
    {
    case SupervisorEvent::START:
        return "start";
    case SupervisorEvent::CONNECT_OK:
        return "connect_ok";
    case SupervisorEvent::CONNECT_FAILED:
        return "connect_failed";
    case SupervisorEvent::SUBSCRIBE_FAILED:
        return "subscribe_failed";
    case SupervisorEvent::CONNECTION_LOST:
        return "connection_lost";
    case SupervisorEvent::RETRY_DUE:
        return "retry_due";
    case SupervisorEvent::SHUTDOWN:
        return "shutdown";
    }
    return "unknown";
}
