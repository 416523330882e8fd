#include "agent_settings.h"

#include <string.h>

#include "config.h"
#include "secrets.h"

bool agent_settings_setString(char *dst, size_t dstSize, const char *src)
{
    if (!dst || dstSize == 0)
    {
        return false;
    }
    if (!src)
    {
        dst[0] = '\0';
        return false;
    }
    const size_t n = strlen(src);
    const size_t copyLen = (n < dstSize - 1) ? n : (dstSize - 1);
    memcpy(dst, src, copyLen);
    dst[copyLen] = '\0';
    return copyLen == n;
}

AgentSettings agent_settings_fromConfig()
{
    AgentSettings s{};
    agent_settings_setString(s.host, sizeof(s.host), CFG_BROKER_HOST);
    s.port = (uint16_t)CFG_BROKER_PORT;
    agent_settings_setString(s.clientId, sizeof(s.clientId), CFG_DEVICE_NAME);
    agent_settings_setString(s.accessToken, sizeof(s.accessToken), DEVICE_ACCESS_TOKEN);
    s.backoff = backoff_defaultPolicy();
    s.maxAttempts = CFG_RECONNECT_MAX_ATTEMPTS;
    s.disabledPollMs = CFG_DISABLED_POLL_MS;
    s.shutdownGraceMs = CFG_SHUTDOWN_GRACE_MS;
    return s;
}

AgentSettingsError agent_validateSettings(const AgentSettings &s)
{
    if (s.accessToken[0] == '\0')
        return AgentSettingsError::MISSING_TOKEN;
    if (s.host[0] == '\0')
        return AgentSettingsError::MISSING_HOST;
    if (s.port == 0)
        return AgentSettingsError::INVALID_PORT;
    if (s.clientId[0] == '\0')
        return AgentSettingsError::MISSING_CLIENT_ID;
    if (s.backoff.baseMs == 0)
        return AgentSettingsError::INVALID_BACKOFF_BASE;
    if (s.backoff.maxMs < s.backoff.baseMs)
        return AgentSettingsError::INVALID_BACKOFF_MAX;
    if (s.backoff.jitterPct > 100)
        return AgentSettingsError::INVALID_JITTER;
    if (s.disabledPollMs == 0)
        return AgentSettingsError::INVALID_POLL_INTERVAL;
    return AgentSettingsError::OK;
}

const char *agent_settingsErrorToString(AgentSettingsError err)
{
    switch (err)
    {
    case AgentSettingsError::OK:
        return "ok";
    case AgentSettingsError::MISSING_TOKEN:
        return "missing_access_token";
    case AgentSettingsError::MISSING_HOST:
        return "missing_host";
    case AgentSettingsError::INVALID_PORT:
        return "invalid_port";
    case AgentSettingsError::MISSING_CLIENT_ID:
        return "missing_client_id";
    case AgentSettingsError::INVALID_BACKOFF_BASE:
        return "invalid_backoff_base";
    case AgentSettingsError::INVALID_BACKOFF_MAX:
        return "invalid_backoff_max";
    case AgentSettingsError::INVALID_JITTER:
        return "invalid_jitter";
    case AgentSettingsError::INVALID_POLL_INTERVAL:
        return "invalid_poll_interval";
    }
    return "unknown";
}
