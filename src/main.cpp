#include <Arduino.h>
#include <WiFi.h>
#include <ctype.h>
#include <string.h>
#include <esp_system.h>

#include "main.h"
#include "agent.h"
#include "agent_settings.h"
#include "config.h"
#include "log_sinks.h"
#include "logger.h"
#include "secrets.h"
#include "supervisor.h"

// =============================================================================
// Virtual environment sensor -> ThingsBoard (MQTT)
//
// 1) Validates the device settings (config.h / secrets.h); stops here if unusable
// 2) Starts WiFi with auto-reconnect
// 3) supervisorTask: connect, subscribe, request attribute snapshot, reconnect with backoff
// 4) publisherTask: every `interval` seconds publish {"temperature","humidity"}
// 5) Serial commands: stop | status | help
// =============================================================================

static constexpr size_t SERIAL_CMD_BUF = 64;
static constexpr char SERIAL_CMD_DELIMS[] = " \t";

enum class AppState : uint8_t
{
  RUNNING = 0,
  HALTED_CONFIG, // fatal configuration error, nothing started
  STOPPED
};

static Agent s_agent;
static AppState s_appState = AppState::RUNNING;

static uint32_t hardwareRandom()
{
  return esp_random();
}

static const char *appStateToString(AppState st)
{
  switch (st)
  {
  case AppState::RUNNING:
    return "running";
  case AppState::HALTED_CONFIG:
    return "halted_config";
  case AppState::STOPPED:
    return "stopped";
  }
  return "unknown";
}

static bool readSerialLine(char *buf, size_t bufSize)
{
  if (!buf || bufSize < 2 || !Serial.available())
  {
    return false;
  }

  size_t len = Serial.readBytesUntil('\n', buf, bufSize - 1);
  if (len == 0)
  {
    return false;
  }

  while (len > 0 && (buf[len - 1] == '\r' || buf[len - 1] == '\n' || buf[len - 1] == ' ' || buf[len - 1] == '\t'))
  {
    len--;
  }
  buf[len] = '\0';

  size_t start = 0;
  while (buf[start] != '\0' && (buf[start] == ' ' || buf[start] == '\t'))
  {
    start++;
  }
  if (start > 0)
  {
    memmove(buf, buf + start, len - start + 1);
    len -= start;
  }

  for (size_t i = 0; i < len; i++)
  {
    buf[i] = (char)tolower((unsigned char)buf[i]);
  }

  return buf[0] != '\0';
}

static void printHelpMenu()
{
  Serial.println();
  Serial.println("Commands:");
  Serial.println("  status   show connection, runtime config and publish counters");
  Serial.println("  stop     disconnect and stop publishing");
  Serial.println("  help     this menu");
  Serial.println();
}

static void printStatus()
{
  if (s_appState != AppState::RUNNING)
  {
    LOG_INFO(LogDomain::SYSTEM, "Status app=%s", appStateToString(s_appState));
    return;
  }
  const SharedStateSnapshot snap = shared_state_snapshot(&s_agent.shared);
  LOG_INFO(LogDomain::SYSTEM,
           "Status app=%s phase=%s retry_count=%lu wifi=%s rssi=%d interval=%lus enabled=%s firmware_version=%s "
           "published=%lu publish_failed=%lu heap_free=%lu",
           appStateToString(s_appState),
           supervisor_phaseToString(snap.phase),
           (unsigned long)snap.retryCount,
           WiFi.isConnected() ? "up" : "down",
           (int)WiFi.RSSI(),
           (unsigned long)snap.config.intervalSeconds,
           snap.config.enabled ? "true" : "false",
           snap.config.firmwareVersion,
           (unsigned long)snap.publishCount,
           (unsigned long)snap.publishFailCount,
           (unsigned long)ESP.getFreeHeap());
}

static void stopAgent(const char *source)
{
  if (s_appState != AppState::RUNNING)
  {
    LOG_INFO(LogDomain::SYSTEM, "Stop ignored app=%s", appStateToString(s_appState));
    return;
  }
  LOG_INFO(LogDomain::SYSTEM, "Stop requested source=%s", source);
  agent_requestShutdown(&s_agent);
  const bool clean = agent_waitStopped(&s_agent, s_agent.settings.shutdownGraceMs);
  s_appState = AppState::STOPPED;
  LOG_INFO(LogDomain::SYSTEM, "Agent exited status=%d clean=%s", clean ? 0 : 1, clean ? "true" : "false");
  log_sinks_flush();
}

static void handleSerialCommands()
{
  char line[SERIAL_CMD_BUF];
  if (!readSerialLine(line, sizeof(line)))
  {
    return;
  }

  char *save = nullptr;
  char *cmd = strtok_r(line, SERIAL_CMD_DELIMS, &save);
  if (!cmd || *cmd == '\0')
  {
    return;
  }

  if (strcmp(cmd, "stop") == 0)
  {
    stopAgent("serial");
    return;
  }
  if (strcmp(cmd, "status") == 0)
  {
    printStatus();
    return;
  }
  if (strcmp(cmd, "help") != 0)
  {
    LOG_WARN(LogDomain::SYSTEM, "Unknown serial command cmd=%s", cmd);
  }
  printHelpMenu();
}

static void startWifi()
{
  WiFi.mode(WIFI_STA);
  WiFi.setAutoReconnect(true);
  WiFi.begin(WIFI_SSID, WIFI_PASS);
  LOG_INFO(LogDomain::WIFI, "WiFi connecting ssid=%s", WIFI_SSID);

  const uint32_t start = millis();
  while (WiFi.status() != WL_CONNECTED && (uint32_t)(millis() - start) < CFG_WIFI_CONNECT_WAIT_MS)
  {
    delay(250);
  }
  if (WiFi.status() == WL_CONNECTED)
  {
    LOG_INFO(LogDomain::WIFI, "WiFi connected ip=%s rssi=%d", WiFi.localIP().toString().c_str(), (int)WiFi.RSSI());
  }
  else
  {
    // Connect attempts count as failures until the radio comes up; backoff handles it.
    LOG_WARN(LogDomain::WIFI, "WiFi not connected after %lu ms; continuing with auto-reconnect",
             (unsigned long)CFG_WIFI_CONNECT_WAIT_MS);
  }
}

void appSetup()
{
  Serial.begin(CFG_SERIAL_BAUD);
  delay(500);
  log_sinks_begin(CFG_LOG_COLOR != 0, (LogLevel)CFG_LOG_MIN_LEVEL);
  LOG_INFO(LogDomain::SYSTEM, "BOOT virtual_sensor device=%s", CFG_DEVICE_NAME);
  log_sinks_beginFile(CFG_LOG_FILE, CFG_LOG_FILE_MAX_BYTES);

  const AgentSettings settings = agent_settings_fromConfig();
  const AgentSettingsError err = agent_validateSettings(settings);
  if (err != AgentSettingsError::OK)
  {
    s_appState = AppState::HALTED_CONFIG;
    LOG_ERROR(LogDomain::CONFIG, "Fatal configuration error=%s; not connecting", agent_settingsErrorToString(err));
    if (err == AgentSettingsError::MISSING_TOKEN)
    {
      LOG_ERROR(LogDomain::CONFIG, "Set DEVICE_ACCESS_TOKEN in secrets.h");
    }
    log_sinks_flush();
    return;
  }

  LOG_INFO(LogDomain::CONFIG,
           "Settings host=%s port=%u clientId=%s backoff_base_ms=%lu backoff_max_ms=%lu jitter_pct=%u max_attempts=%lu",
           settings.host, (unsigned)settings.port, settings.clientId,
           (unsigned long)settings.backoff.baseMs, (unsigned long)settings.backoff.maxMs,
           (unsigned)settings.backoff.jitterPct, (unsigned long)settings.maxAttempts);

  startWifi();

  if (!agent_begin(&s_agent, settings, hardwareRandom))
  {
    s_appState = AppState::HALTED_CONFIG;
    LOG_ERROR(LogDomain::SYSTEM, "Agent start failed; not connecting");
    log_sinks_flush();
    return;
  }
  printHelpMenu();
}

void appLoop()
{
  handleSerialCommands();
  if (s_appState == AppState::HALTED_CONFIG)
  {
    logger_logEvery("app_halted", 60000, LogLevel::ERROR, LogDomain::SYSTEM,
                    "Halted: fix configuration and reflash");
  }
  delay(20);
}
