#pragma once

#include <stddef.h>
#include <stdint.h>

// Contract: the logger core holds no platform state; sinks do the I/O.
// Multi-task callers must install lock hooks (see LoggerConfig) before the tasks start.

// Logging levels
enum class LogLevel : uint8_t
{
    DEBUG = 0,
    INFO,
    WARN,
    ERROR
};

// Logging domains
enum class LogDomain : uint8_t
{
    SYSTEM = 0,
    WIFI,
    MQTT,
    CONFIG,
    TELEMETRY,
    SUPERVISOR
};

struct LogRecord
{
    uint32_t tsMs;
    LogLevel lvl;
    LogDomain dom;
    const char *msg;
};

using LoggerSinkFn = void (*)(const LogRecord &rec);
using LoggerClockFn = uint32_t (*)();
using LoggerLockFn = void (*)();

struct LoggerConfig
{
    LogLevel minLevel;
    LoggerClockFn clockMs; // nullptr -> timestamps are 0
    LoggerLockFn lock;     // optional; guards sinks and the throttle table
    LoggerLockFn unlock;
};

static constexpr size_t LOGGER_MAX_SINKS = 4;

void logger_begin(const LoggerConfig &cfg);
bool logger_addSink(LoggerSinkFn sink);
void logger_clearSinks();
void logger_setMinLevel(LogLevel lvl);

void logger_log(LogLevel lvl, LogDomain dom, const char *fmt, ...) __attribute__((format(printf, 3, 4)));
void logger_logEvery(const char *key, uint32_t intervalMs, LogLevel lvl, LogDomain dom, const char *fmt, ...)
    __attribute__((format(printf, 5, 6)));

const char *logger_levelToString(LogLevel lvl);
const char *logger_domainToString(LogDomain dom);

// Human-readable line: "[ssssss] LEVEL   DOMAIN    : msg". Returns bytes written (excl. NUL).
size_t logger_formatLine(const LogRecord &rec, bool color, char *out, size_t outSize);

// One JSON object per record: {"ts":<s>,"lvl":"..","dom":"..","msg":".."}.
bool logger_formatJson(const LogRecord &rec, char *out, size_t outSize);

#define LOG_DEBUG(dom, fmt, ...) logger_log(LogLevel::DEBUG, dom, fmt, ##__VA_ARGS__)
#define LOG_INFO(dom, fmt, ...) logger_log(LogLevel::INFO, dom, fmt, ##__VA_ARGS__)
#define LOG_WARN(dom, fmt, ...) logger_log(LogLevel::WARN, dom, fmt, ##__VA_ARGS__)
#define LOG_ERROR(dom, fmt, ...) logger_log(LogLevel::ERROR, dom, fmt, ##__VA_ARGS__)

#define LOG_DEBUG_EVERY(key, intervalMs, dom, fmt, ...) logger_logEvery(key, intervalMs, LogLevel::DEBUG, dom, fmt, ##__VA_ARGS__)
#define LOG_INFO_EVERY(key, intervalMs, dom, fmt, ...) logger_logEvery(key, intervalMs, LogLevel::INFO, dom, fmt, ##__VA_ARGS__)
#define LOG_WARN_EVERY(key, intervalMs, dom, fmt, ...) logger_logEvery(key, intervalMs, LogLevel::WARN, dom, fmt, ##__VA_ARGS__)
#define LOG_ERROR_EVERY(key, intervalMs, dom, fmt, ...) logger_logEvery(key, intervalMs, LogLevel::ERROR, dom, fmt, ##__VA_ARGS__)
