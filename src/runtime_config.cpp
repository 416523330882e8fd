#include "runtime_config.h"

#include <string.h>
#include "config.h"

static_assert(CFG_DEFAULT_INTERVAL_S >= RUNTIME_INTERVAL_MIN_S, "CFG_DEFAULT_INTERVAL_S must be >= 1");
static_assert(CFG_DEFAULT_INTERVAL_S <= CFG_INTERVAL_MAX_S, "CFG_DEFAULT_INTERVAL_S exceeds CFG_INTERVAL_MAX_S");
static_assert(CFG_INTERVAL_MAX_S <= 4294967u, "CFG_INTERVAL_MAX_S * 1000 must fit in uint32_t");
static_assert(sizeof(CFG_DEFAULT_FW_VERSION) <= FIRMWARE_VERSION_MAX, "CFG_DEFAULT_FW_VERSION too long");

RuntimeConfig runtime_config_defaults()
{
    RuntimeConfig cfg{};
    cfg.intervalSeconds = CFG_DEFAULT_INTERVAL_S;
    cfg.enabled = CFG_DEFAULT_ENABLED != 0;
    runtime_config_setFirmwareVersion(cfg, CFG_DEFAULT_FW_VERSION);
    return cfg;
}

uint32_t runtime_config_maxIntervalSeconds()
{
    return CFG_INTERVAL_MAX_S;
}

bool runtime_config_isValidInterval(uint32_t seconds)
{
    return seconds >= RUNTIME_INTERVAL_MIN_S && seconds <= CFG_INTERVAL_MAX_S;
}

bool runtime_config_setFirmwareVersion(RuntimeConfig &cfg, const char *src)
{
    const char *value = src ? src : "";
    strncpy(cfg.firmwareVersion, value, sizeof(cfg.firmwareVersion));
    cfg.firmwareVersion[sizeof(cfg.firmwareVersion) - 1] = '\0';
    return strlen(value) < sizeof(cfg.firmwareVersion);
}
