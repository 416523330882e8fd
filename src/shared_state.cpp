#include "shared_state.h"

void shared_state_init(SharedState *s)
{
    if (!s)
        return;
    portMUX_INITIALIZE(&s->mux);
    s->config = runtime_config_defaults();
    s->phase = ConnectionPhase::DISCONNECTED_NEVER;
    s->retryCount = 0;
    s->publishCount = 0;
    s->publishFailCount = 0;
}

RuntimeConfig shared_state_readConfig(SharedState *s)
{
    portENTER_CRITICAL(&s->mux);
    const RuntimeConfig copy = s->config;
    portEXIT_CRITICAL(&s->mux);
    return copy;
}

uint8_t shared_state_applyPatch(SharedState *s, const AttributePatch &patch, AttributeChanges *changes)
{
    portENTER_CRITICAL(&s->mux);
    const uint8_t changed = attributes_apply(s->config, patch, changes);
    portEXIT_CRITICAL(&s->mux);
    return changed;
}

void shared_state_setConnection(SharedState *s, ConnectionPhase phase, uint32_t retryCount)
{
    portENTER_CRITICAL(&s->mux);
    s->phase = phase;
    s->retryCount = retryCount;
    portEXIT_CRITICAL(&s->mux);
}

ConnectionPhase shared_state_phase(SharedState *s)
{
    portENTER_CRITICAL(&s->mux);
    const ConnectionPhase phase = s->phase;
    portEXIT_CRITICAL(&s->mux);
    return phase;
}

void shared_state_countPublish(SharedState *s, bool ok)
{
    portENTER_CRITICAL(&s->mux);
    if (ok)
        s->publishCount++;
    else
        s->publishFailCount++;
    portEXIT_CRITICAL(&s->mux);
}

SharedStateSnapshot shared_state_snapshot(SharedState *s)
{
    SharedStateSnapshot snap{};
    portENTER_CRITICAL(&s->mux);
    snap.config = s->config;
    snap.phase = s->phase;
    snap.retryCount = s->retryCount;
    snap.publishCount = s->publishCount;
    snap.publishFailCount = s->publishFailCount;
    portEXIT_CRITICAL(&s->mux);
    return snap;
}
