#pragma once
#include <stddef.h>
#include <stdint.h>

#include "logger.h"

// Firmware log sinks: Serial (human-readable lines) and a LittleFS JSON-lines file.
// Contract: call log_sinks_begin() once from setup() before any task is created.
bool log_sinks_begin(bool color, LogLevel minLevel);

// Mounts LittleFS and adds the file sink. Returns false (and keeps Serial logging) on failure.
bool log_sinks_beginFile(const char *path, uint32_t maxBytes);

// Drains Serial; file records are closed after every write.
void log_sinks_flush();
