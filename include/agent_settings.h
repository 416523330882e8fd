#pragma once
#include <stddef.h>
#include <stdint.h>

#include "backoff.h"

static constexpr size_t AGENT_HOST_MAX = 64;
static constexpr size_t AGENT_TOKEN_MAX = 64;
static constexpr size_t AGENT_CLIENT_ID_MAX = 48;

// Everything the agent needs at boot. Built from config.h / secrets.h, validated once.
struct AgentSettings
{
    char host[AGENT_HOST_MAX];
    uint16_t port;
    char clientId[AGENT_CLIENT_ID_MAX];
    char accessToken[AGENT_TOKEN_MAX];
    BackoffPolicy backoff;
    uint32_t maxAttempts; // 0 = unlimited
    uint32_t disabledPollMs;
    uint32_t shutdownGraceMs;
};

enum class AgentSettingsError : uint8_t
{
    OK = 0,
    MISSING_TOKEN,
    MISSING_HOST,
    INVALID_PORT,
    MISSING_CLIENT_ID,
    INVALID_BACKOFF_BASE,
    INVALID_BACKOFF_MAX,
    INVALID_JITTER,
    INVALID_POLL_INTERVAL
};

// Compile-time defaults; token comes from secrets.h (may be empty).
AgentSettings agent_settings_fromConfig();

// Copies into a bounded field. Returns false if src was null or truncated.
bool agent_settings_setString(char *dst, size_t dstSize, const char *src);

// Fatal-configuration check; anything but OK must stop the firmware before it connects.
AgentSettingsError agent_validateSettings(const AgentSettings &s);

const char *agent_settingsErrorToString(AgentSettingsError err);
