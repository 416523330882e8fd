#include <WiFi.h>
#include <PubSubClient.h>
#include <Arduino.h>
#include <string.h>
#include <ctype.h>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>

#include "mqtt_transport.h"
#include "agent_events.h"
#include "config.h"
#include "logger.h"

static WiFiClient wifiClient;
static PubSubClient mqtt(wifiClient);

static MqttConfig s_cfg{};
static QueueHandle_t s_inbound = nullptr;
static SemaphoreHandle_t s_lock = nullptr;
static bool s_initialized = false;
static bool s_lastConnected = false;

// Scratch for the callback; only touched from inside mqtt.loop(), which runs under s_lock.
static AgentEvent s_rxEvent;

const char *mqtt_stateToString(int state)
{
    switch (state)
    {
    case -4:
        return "MQTT_CONNECTION_TIMEOUT";
    case -3:
        return "MQTT_CONNECTION_LOST";
    case -2:
        return "MQTT_CONNECT_FAILED";
    case -1:
        return "MQTT_DISCONNECTED";
    case 0:
        return "MQTT_CONNECTED";
    case 1:
        return "MQTT_CONNECT_BAD_PROTOCOL";
    case 2:
        return "MQTT_CONNECT_BAD_CLIENT_ID";
    case 3:
        return "MQTT_CONNECT_UNAVAILABLE";
    case 4:
        return "MQTT_CONNECT_BAD_CREDENTIALS";
    case 5:
        return "MQTT_CONNECT_UNAUTHORIZED";
    default:
        return "unknown";
    }
}

static bool lockFor(uint32_t timeoutMs)
{
    if (!s_lock)
        return false;
    const TickType_t ticks = (timeoutMs == UINT32_MAX) ? portMAX_DELAY : pdMS_TO_TICKS(timeoutMs);
    return xSemaphoreTake(s_lock, ticks) == pdTRUE;
}

static void unlock()
{
    xSemaphoreGive(s_lock);
}

static void buildPayloadPreview(const uint8_t *payload, size_t len, char *out, size_t outSize)
{
    if (!out || outSize == 0)
        return;
    const size_t cap = outSize - 1;
    size_t n = len < cap ? len : cap;
    for (size_t i = 0; i < n; ++i)
    {
        char c = static_cast<char>(payload[i]);
        if (isprint(static_cast<unsigned char>(c)) && c != '\n' && c != '\r')
            out[i] = c;
        else
            out[i] = '.';
    }
    out[n] = '\0';
}

static void pushEvent(const AgentEvent &ev)
{
    if (!s_inbound)
        return;
    if (xQueueSend(s_inbound, &ev, 0) != pdTRUE)
    {
        LOG_WARN_EVERY("mqtt_rx_queue_full", 5000, LogDomain::MQTT,
                       "MQTT inbound queue full, dropped type=%u topic=%s",
                       (unsigned)ev.type, ev.topic);
    }
}

// PubSubClient reuses its buffer for incoming payloads, so the bytes are copied into an
// AgentEvent before anything else runs. Processing happens in the supervisor task.
static void mqttCallback(char *topic, byte *payload, unsigned int length)
{
    AgentEvent &ev = s_rxEvent;
    ev.type = AgentEventType::MESSAGE;
    ev.transportState = 0;
    if (topic)
    {
        strncpy(ev.topic, topic, sizeof(ev.topic));
        ev.topic[sizeof(ev.topic) - 1] = '\0';
    }
    else
    {
        ev.topic[0] = '\0';
    }

    if (length > sizeof(ev.payload))
    {
        LOG_WARN(LogDomain::MQTT, "MQTT message rejected: payload too large topic=%s len=%u max=%u",
                 ev.topic, length, (unsigned)sizeof(ev.payload));
        return;
    }
    if (length > 0)
    {
        memcpy(ev.payload, payload, length);
    }
    ev.len = (uint16_t)length;

    char preview[121];
    buildPayloadPreview(ev.payload, ev.len, preview, sizeof(preview));
    LOG_DEBUG(LogDomain::MQTT, "MQTT received topic=%s len=%u payload_preview='%s'", ev.topic, length, preview);

    pushEvent(ev);
}

bool mqtt_begin(const MqttConfig &cfg, QueueHandle_t inboundQueue)
{
    if (s_initialized)
    {
        return true;
    }
    s_lock = xSemaphoreCreateMutex();
    if (!s_lock)
    {
        LOG_ERROR(LogDomain::MQTT, "MQTT lock create failed");
        return false;
    }

    s_cfg = cfg;
    s_inbound = inboundQueue;

    mqtt.setServer(cfg.host, cfg.port);
    mqtt.setKeepAlive((uint16_t)CFG_MQTT_KEEPALIVE_S);
    mqtt.setSocketTimeout((uint16_t)CFG_MQTT_SOCKET_TIMEOUT_S);
    if (!mqtt.setBufferSize((uint16_t)CFG_MQTT_BUFFER_SIZE))
    {
        LOG_WARN(LogDomain::MQTT, "MQTT buffer resize failed size=%u", (unsigned)CFG_MQTT_BUFFER_SIZE);
    }
    mqtt.setCallback(mqttCallback);
    s_initialized = true;

    LOG_INFO(LogDomain::MQTT, "MQTT init host=%s port=%u clientId=%s keepalive=%us",
             s_cfg.host, (unsigned)s_cfg.port, s_cfg.clientId, (unsigned)CFG_MQTT_KEEPALIVE_S);
    return true;
}

bool mqtt_connect()
{
    if (!s_initialized)
    {
        return false;
    }

    const bool hasUser = (s_cfg.user && s_cfg.user[0] != '\0');
    LOG_INFO(LogDomain::MQTT, "MQTT connecting host=%s port=%u clientId=%s auth=%s",
             s_cfg.host, (unsigned)s_cfg.port, s_cfg.clientId, hasUser ? "token" : "none");

    if (!lockFor(UINT32_MAX))
    {
        return false;
    }
    // Token as username, no password.
    const bool ok = mqtt.connect(s_cfg.clientId, hasUser ? s_cfg.user : nullptr, nullptr);
    const int state = mqtt.state();
    s_lastConnected = ok;
    unlock();

    if (ok)
    {
        LOG_INFO(LogDomain::MQTT, "MQTT connected host=%s port=%u", s_cfg.host, (unsigned)s_cfg.port);
        return true;
    }

    LOG_WARN(LogDomain::MQTT, "MQTT connect failed state=%d (%s)", state, mqtt_stateToString(state));
    if (state == 4 || state == 5)
    {
        LOG_WARN_EVERY("mqtt_connect_auth_hint", 30000, LogDomain::MQTT,
                       "Check DEVICE_ACCESS_TOKEN (secrets.h) and the device profile on the broker");
    }
    return false;
}

bool mqtt_subscribe(const char *topicFilter)
{
    if (!lockFor(UINT32_MAX))
    {
        return false;
    }
    const bool ok = mqtt.connected() && mqtt.subscribe(topicFilter);
    unlock();

    if (ok)
    {
        LOG_INFO(LogDomain::MQTT, "MQTT subscribed topic=%s", topicFilter);
    }
    else
    {
        LOG_WARN(LogDomain::MQTT, "MQTT subscribe failed topic=%s", topicFilter);
    }
    return ok;
}

bool mqtt_publish(const char *topic, const char *payload)
{
    if (!topic || !payload)
    {
        return false;
    }
    if (!lockFor(CFG_MQTT_LOCK_TIMEOUT_MS))
    {
        LOG_WARN_EVERY("mqtt_publish_busy", 5000, LogDomain::MQTT,
                       "MQTT publish skipped topic=%s reason=session_busy", topic);
        return false;
    }
    bool ok = false;
    int stateCode = 0;
    if (mqtt.connected())
    {
        ok = mqtt.publish(topic, payload, false);
    }
    stateCode = mqtt.state();
    unlock();

    if (!ok)
    {
        LOG_WARN_EVERY("mqtt_publish_fail", 5000, LogDomain::MQTT,
                       "MQTT publish failed topic=%s bytes=%u state=%d (%s)",
                       topic, (unsigned)strlen(payload), stateCode, mqtt_stateToString(stateCode));
    }
    return ok;
}

void mqtt_service()
{
    if (!s_initialized || !lockFor(UINT32_MAX))
    {
        return;
    }
    mqtt.loop();
    const bool connected = mqtt.connected();
    const int state = mqtt.state();
    const bool dropped = s_lastConnected && !connected;
    s_lastConnected = connected;
    unlock();

    if (dropped)
    {
        LOG_WARN(LogDomain::MQTT, "MQTT disconnected state=%d (%s)", state, mqtt_stateToString(state));
        AgentEvent ev{};
        ev.type = AgentEventType::CONNECTION_LOST;
        ev.transportState = state;
        pushEvent(ev);
    }
}

void mqtt_disconnect()
{
    if (!s_initialized || !lockFor(UINT32_MAX))
    {
        return;
    }
    const bool wasConnected = mqtt.connected();
    mqtt.disconnect();
    s_lastConnected = false;
    unlock();

    if (wasConnected)
    {
        LOG_INFO(LogDomain::MQTT, "MQTT disconnected (requested)");
    }
}

LinkStatus mqtt_linkStatus()
{
    if (!s_initialized)
    {
        return LinkStatus::DOWN;
    }
    if (!lockFor(CFG_MQTT_LOCK_TIMEOUT_MS))
    {
        return LinkStatus::UNKNOWN;
    }
    const bool connected = mqtt.connected();
    unlock();
    return connected ? LinkStatus::UP : LinkStatus::DOWN;
}

int mqtt_state()
{
    if (!s_initialized || !lockFor(CFG_MQTT_LOCK_TIMEOUT_MS))
    {
        return -1;
    }
    const int state = mqtt.state();
    unlock();
    return state;
}
