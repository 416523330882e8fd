#pragma once
#include <stddef.h>
#include <stdint.h>

static constexpr size_t FIRMWARE_VERSION_MAX = 32; // including NUL
static constexpr uint32_t RUNTIME_INTERVAL_MIN_S = 1;

// Remotely adjustable runtime configuration.
// Invariant: RUNTIME_INTERVAL_MIN_S <= intervalSeconds <= CFG_INTERVAL_MAX_S.
struct RuntimeConfig
{
    uint32_t intervalSeconds;
    bool enabled;
    char firmwareVersion[FIRMWARE_VERSION_MAX];
};

RuntimeConfig runtime_config_defaults();

uint32_t runtime_config_maxIntervalSeconds();
bool runtime_config_isValidInterval(uint32_t seconds);

// Copies src into the firmware tag buffer; returns false if it had to be truncated.
bool runtime_config_setFirmwareVersion(RuntimeConfig &cfg, const char *src);
