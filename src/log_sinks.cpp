#include "log_sinks.h"

#include <Arduino.h>
#include <LittleFS.h>
#include <string.h>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>

static constexpr size_t LINE_MAX = 320;
static constexpr size_t PATH_MAX_LEN = 64;

static SemaphoreHandle_t s_lock = nullptr;
static bool s_color = false;
static bool s_fileReady = false;
static char s_path[PATH_MAX_LEN] = {0};
static char s_rotatedPath[PATH_MAX_LEN + 2] = {0};
static uint32_t s_maxBytes = 0;
static uint32_t s_fileWriteErrors = 0;

static void lockSinks()
{
    if (s_lock)
    {
        xSemaphoreTake(s_lock, portMAX_DELAY);
    }
}

static void unlockSinks()
{
    if (s_lock)
    {
        xSemaphoreGive(s_lock);
    }
}

static uint32_t clockMs()
{
    return millis();
}

static void serialSink(const LogRecord &rec)
{
    char line[LINE_MAX];
    const size_t n = logger_formatLine(rec, s_color, line, sizeof(line));
    if (n == 0)
    {
        return;
    }
    Serial.println(line);
}

static void rotateIfNeeded(File &f)
{
    if (s_maxBytes == 0 || f.size() < s_maxBytes)
    {
        return;
    }
    f.close();
    if (LittleFS.exists(s_rotatedPath))
    {
        LittleFS.remove(s_rotatedPath);
    }
    if (!LittleFS.rename(s_path, s_rotatedPath))
    {
        // Rename failed; start over rather than grow without bound.
        LittleFS.remove(s_path);
    }
    f = LittleFS.open(s_path, FILE_APPEND);
}

// Runs under the logger lock, so it must not log itself; failures are counted instead.
static void fileSink(const LogRecord &rec)
{
    if (!s_fileReady)
    {
        return;
    }
    char line[LINE_MAX];
    if (!logger_formatJson(rec, line, sizeof(line)))
    {
        ++s_fileWriteErrors;
        return;
    }

    File f = LittleFS.open(s_path, FILE_APPEND);
    if (!f)
    {
        ++s_fileWriteErrors;
        return;
    }
    rotateIfNeeded(f);
    if (!f)
    {
        ++s_fileWriteErrors;
        return;
    }
    const size_t len = strlen(line);
    if (f.write(reinterpret_cast<const uint8_t *>(line), len) != len || f.write('\n') != 1)
    {
        ++s_fileWriteErrors;
    }
    f.close();
}

bool log_sinks_begin(bool color, LogLevel minLevel)
{
    if (!s_lock)
    {
        s_lock = xSemaphoreCreateMutex();
    }
    s_color = color;

    LoggerConfig cfg{};
    cfg.minLevel = minLevel;
    cfg.clockMs = clockMs;
    cfg.lock = s_lock ? lockSinks : nullptr;
    cfg.unlock = s_lock ? unlockSinks : nullptr;
    logger_begin(cfg);

    if (!logger_addSink(serialSink))
    {
        return false;
    }
    if (!s_lock)
    {
        LOG_WARN(LogDomain::SYSTEM, "Log lock create failed; logging is not task-safe");
        return false;
    }
    return true;
}

static void makeParentDir(const char *path)
{
    const char *slash = strrchr(path, '/');
    if (!slash || slash == path)
    {
        return;
    }
    char dir[PATH_MAX_LEN];
    const size_t n = (size_t)(slash - path);
    if (n >= sizeof(dir))
    {
        return;
    }
    memcpy(dir, path, n);
    dir[n] = '\0';
    if (!LittleFS.exists(dir))
    {
        LittleFS.mkdir(dir);
    }
}

bool log_sinks_beginFile(const char *path, uint32_t maxBytes)
{
    if (!path || path[0] != '/' || strlen(path) >= sizeof(s_path))
    {
        LOG_WARN(LogDomain::SYSTEM, "Log file disabled: invalid path");
        return false;
    }

    // Format on first boot so a blank flash still gets a log.
    if (!LittleFS.begin(true))
    {
        LOG_WARN(LogDomain::SYSTEM, "Log file disabled: LittleFS mount failed");
        return false;
    }

    strncpy(s_path, path, sizeof(s_path));
    s_path[sizeof(s_path) - 1] = '\0';
    snprintf(s_rotatedPath, sizeof(s_rotatedPath), "%s.1", s_path);
    s_maxBytes = maxBytes;
    makeParentDir(s_path);

    s_fileReady = true;
    if (!logger_addSink(fileSink))
    {
        s_fileReady = false;
        LOG_WARN(LogDomain::SYSTEM, "Log file disabled: no free sink slot");
        return false;
    }
    LOG_INFO(LogDomain::SYSTEM, "Log file sink path=%s max_bytes=%lu rotated=%s",
             s_path, (unsigned long)s_maxBytes, s_rotatedPath);
    return true;
}

void log_sinks_flush()
{
    lockSinks();
    if (s_fileWriteErrors > 0)
    {
        Serial.printf("log file write errors=%lu\n", (unsigned long)s_fileWriteErrors);
    }
    Serial.flush();
    unlockSinks();
}
