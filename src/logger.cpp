#include "logger.h"

#include <stdarg.h>
#include <stdio.h>
#include <string.h>

static LoggerConfig s_cfg = {LogLevel::INFO, nullptr, nullptr, nullptr};
static LoggerSinkFn s_sinks[LOGGER_MAX_SINKS] = {};
static size_t s_sinkCount = 0;

static constexpr size_t kThrottleSlots = 16;
static constexpr size_t kThrottleKeyLen = 24;
static constexpr size_t kMsgBufSize = 256;
static constexpr const char *kAnsiReset = "\x1B[0m";
static constexpr const char *kAnsiDim = "\x1B[2m\x1B[90m";

// Keys longer than kThrottleKeyLen - 1 share a slot with their prefix.
struct ThrottleSlot
{
    char key[kThrottleKeyLen];
    uint32_t lastMs;
};
static ThrottleSlot s_throttle[kThrottleSlots] = {};

static void lockLogger()
{
    if (s_cfg.lock)
        s_cfg.lock();
}

static void unlockLogger()
{
    if (s_cfg.unlock)
        s_cfg.unlock();
}

static uint32_t nowMs()
{
    return s_cfg.clockMs ? s_cfg.clockMs() : 0u;
}

static bool levelEnabled(LogLevel lvl)
{
    return (uint8_t)lvl >= (uint8_t)s_cfg.minLevel;
}

const char *logger_levelToString(LogLevel lvl)
{
    switch (lvl)
    {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARN:
        return "WARN";
    case LogLevel::ERROR:
        return "ERROR";
    }
    return "UNK";
}

const char *logger_domainToString(LogDomain dom)
{
    switch (dom)
    {
    case LogDomain::SYSTEM:
        return "SYSTEM";
    case LogDomain::WIFI:
        return "WIFI";
    case LogDomain::MQTT:
        return "MQTT";
    case LogDomain::CONFIG:
        return "CONFIG";
    case LogDomain::TELEMETRY:
        return "TELEMETRY";
    case LogDomain::SUPERVISOR:
        return "SUPERVISOR";
    }
    return "UNK";
}

static const char *levelToStyle(LogLevel lvl)
{
    switch (lvl)
    {
    case LogLevel::ERROR:
        return "\x1B[1m\x1B[31m";
    case LogLevel::WARN:
        return "\x1B[1m\x1B[33m";
    case LogLevel::DEBUG:
        return "\x1B[2m\x1B[36m";
    default:
        return "";
    }
}

// One colour per domain so interleaved task output stays readable.
static const char *domainToStyle(LogDomain dom)
{
    static const char *const kStyles[] = {
        "\x1B[2m\x1B[90m", // SYSTEM
        "\x1B[34m",        // WIFI
        "\x1B[35m",        // MQTT
        "\x1B[36m",        // CONFIG
        "\x1B[32m",        // TELEMETRY
        "\x1B[33m",        // SUPERVISOR
    };
    const size_t idx = (size_t)dom;
    return idx < sizeof(kStyles) / sizeof(kStyles[0]) ? kStyles[idx] : kAnsiDim;
}

// Overwrites the tail of a full buffer with "...".
static void markTruncated(char *buf, size_t bufSize)
{
    if (!buf || bufSize < 4)
        return;
    memcpy(buf + bufSize - 4, "...", 4);
}

// Writes the JSON escape for c into esc (NUL-terminated). Returns its length.
static size_t escapeJsonChar(unsigned char c, char esc[7])
{
    switch (c)
    {
    case '\\':
    case '"':
        esc[0] = '\\';
        esc[1] = (char)c;
        esc[2] = '\0';
        return 2;
    case '\n':
        memcpy(esc, "\\n", 3);
        return 2;
    case '\r':
        memcpy(esc, "\\r", 3);
        return 2;
    case '\t':
        memcpy(esc, "\\t", 3);
        return 2;
    default:
        break;
    }
    if (c < 0x20)
    {
        snprintf(esc, 7, "\\u%04X", (unsigned)c);
        return 6;
    }
    esc[0] = (char)c;
    esc[1] = '\0';
    return 1;
}

bool logger_formatJson(const LogRecord &rec, char *out, size_t outSize)
{
    if (!out || outSize < 8)
        return false;

    const int head = snprintf(out, outSize, "{\"ts\":%lu,\"lvl\":\"%s\",\"dom\":\"%s\",\"msg\":\"",
                              (unsigned long)(rec.tsMs / 1000u), logger_levelToString(rec.lvl),
                              logger_domainToString(rec.dom));
    // Closing quote, brace and NUL must still fit.
    if (head <= 0 || (size_t)head + 3 > outSize)
        return false;

    size_t pos = (size_t)head;
    size_t safeEnd = pos; // last escape boundary that still leaves room for "..."
    const size_t limit = outSize - 3;
    for (const char *p = rec.msg ? rec.msg : ""; *p; ++p)
    {
        char esc[7];
        const size_t n = escapeJsonChar((unsigned char)*p, esc);
        if (pos + n > limit)
        {
            pos = safeEnd;
            if (pos + 3 <= limit)
            {
                memcpy(out + pos, "...", 3);
                pos += 3;
            }
            break;
        }
        memcpy(out + pos, esc, n);
        pos += n;
        if (pos + 3 <= limit)
            safeEnd = pos;
    }
    out[pos++] = '"';
    out[pos++] = '}';
    out[pos] = '\0';
    return true;
}

size_t logger_formatLine(const LogRecord &rec, bool color, char *out, size_t outSize)
{
    if (!out || outSize == 0)
        return 0;

    const unsigned long tsSec = (unsigned long)(rec.tsMs / 1000u);
    const char *lvl = rec.lvl == LogLevel::WARN ? "WARNING" : logger_levelToString(rec.lvl);
    const char *dom = logger_domainToString(rec.dom);
    const char *msg = rec.msg ? rec.msg : "";

    const int n = color ? snprintf(out, outSize, "%s[%6lu]%s %s%-7.7s%s %s%-10.10s%s: %s", kAnsiDim, tsSec,
                                   kAnsiReset, levelToStyle(rec.lvl), lvl, kAnsiReset, domainToStyle(rec.dom), dom,
                                   kAnsiReset, msg)
                        : snprintf(out, outSize, "[%6lu] %-7.7s %-10.10s: %s", tsSec, lvl, dom, msg);
    if (n < 0)
    {
        out[0] = '\0';
        return 0;
    }
    if ((size_t)n >= outSize)
    {
        markTruncated(out, outSize);
        return outSize - 1;
    }
    return (size_t)n;
}

void logger_begin(const LoggerConfig &cfg)
{
    s_cfg = cfg;
}

bool logger_addSink(LoggerSinkFn sink)
{
    if (!sink)
        return false;

    lockLogger();
    const bool added = s_sinkCount < LOGGER_MAX_SINKS;
    if (added)
        s_sinks[s_sinkCount++] = sink;
    unlockLogger();
    return added;
}

// Also forgets throttle history so tests start clean.
void logger_clearSinks()
{
    lockLogger();
    memset(s_sinks, 0, sizeof(s_sinks));
    s_sinkCount = 0;
    memset(s_throttle, 0, sizeof(s_throttle));
    unlockLogger();
}

void logger_setMinLevel(LogLevel lvl)
{
    s_cfg.minLevel = lvl;
}

// Formats into msg and fans out to every sink. Caller holds the logger lock.
static void emit(uint32_t tsMs, LogLevel lvl, LogDomain dom, const char *fmt, va_list args)
{
    char msg[kMsgBufSize];
    const int needed = vsnprintf(msg, sizeof(msg), fmt, args);
    if (needed < 0)
        msg[0] = '\0';
    else if ((size_t)needed >= sizeof(msg))
        markTruncated(msg, sizeof(msg));

    const LogRecord rec{tsMs, lvl, dom, msg};
    for (size_t i = 0; i < s_sinkCount; ++i)
    {
        s_sinks[i](rec);
    }
}

void logger_log(LogLevel lvl, LogDomain dom, const char *fmt, ...)
{
    if (!levelEnabled(lvl))
        return;

    const uint32_t ts = nowMs();
    va_list args;
    va_start(args, fmt);
    lockLogger();
    emit(ts, lvl, dom, fmt, args);
    unlockLogger();
    va_end(args);
}

// Returns true when key may log now, and records the time. Caller holds the logger lock.
static bool throttleAllows(const char *key, uint32_t intervalMs, uint32_t now)
{
    if (!key || key[0] == '\0' || intervalMs == 0)
        return true;

    ThrottleSlot *slot = nullptr;
    ThrottleSlot *stalest = &s_throttle[0];
    for (size_t i = 0; i < kThrottleSlots; ++i)
    {
        ThrottleSlot &s = s_throttle[i];
        if (s.key[0] != '\0' && strncmp(s.key, key, kThrottleKeyLen - 1) == 0)
        {
            if ((uint32_t)(now - s.lastMs) < intervalMs)
                return false;
            slot = &s;
            break;
        }
        if (!slot && s.key[0] == '\0')
            slot = &s;
        if (s.key[0] != '\0' && (uint32_t)(now - s.lastMs) > (uint32_t)(now - stalest->lastMs))
            stalest = &s;
    }

    // Table full: evict the key that logged longest ago.
    if (!slot)
        slot = stalest;
    strncpy(slot->key, key, kThrottleKeyLen - 1);
    slot->key[kThrottleKeyLen - 1] = '\0';
    slot->lastMs = now;
    return true;
}

void logger_logEvery(const char *key, uint32_t intervalMs, LogLevel lvl, LogDomain dom, const char *fmt, ...)
{
    if (!levelEnabled(lvl))
        return;

    const uint32_t now = nowMs();
    lockLogger();
    if (throttleAllows(key, intervalMs, now))
    {
        va_list args;
        va_start(args, fmt);
        emit(now, lvl, dom, fmt, args);
        va_end(args);
    }
    unlockLogger();
}
