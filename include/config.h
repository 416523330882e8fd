// Build-time defaults for virtual_sensor.
// Contract: values must be sane/positive; override any of them with -D flags.
#pragma once

// --- Broker / device identity ---
#ifndef CFG_BROKER_HOST
#define CFG_BROKER_HOST "eu.thingsboard.cloud"
#endif
#ifndef CFG_BROKER_PORT
#define CFG_BROKER_PORT 1883u
#endif
#ifndef CFG_DEVICE_NAME
#define CFG_DEVICE_NAME "VirtualSensor01"
#endif
#ifndef CFG_MQTT_KEEPALIVE_S
#define CFG_MQTT_KEEPALIVE_S 60u
#endif
#ifndef CFG_MQTT_SOCKET_TIMEOUT_S
#define CFG_MQTT_SOCKET_TIMEOUT_S 5u
#endif
#ifndef CFG_MQTT_BUFFER_SIZE
#define CFG_MQTT_BUFFER_SIZE 1024u
#endif
#ifndef CFG_MQTT_LOCK_TIMEOUT_MS
#define CFG_MQTT_LOCK_TIMEOUT_MS 250u // publish gives up if the session is busy connecting
#endif

// --- Runtime configuration defaults (overridable remotely via shared attributes) ---
#ifndef CFG_DEFAULT_INTERVAL_S
#define CFG_DEFAULT_INTERVAL_S 5u
#endif
#ifndef CFG_DEFAULT_ENABLED
#define CFG_DEFAULT_ENABLED 1
#endif
#ifndef CFG_DEFAULT_FW_VERSION
#define CFG_DEFAULT_FW_VERSION "1.0"
#endif
#ifndef CFG_INTERVAL_MAX_S
#define CFG_INTERVAL_MAX_S 86400u // one day; keeps interval * 1000 inside uint32_t
#endif

// --- Publish loop ---
#ifndef CFG_DISABLED_POLL_MS
#define CFG_DISABLED_POLL_MS 1000u // re-enable latency while telemetry is disabled
#endif

// --- Reconnect backoff ---
#ifndef CFG_RECONNECT_BASE_MS
#define CFG_RECONNECT_BASE_MS 1000u
#endif
#ifndef CFG_RECONNECT_MAX_MS
#define CFG_RECONNECT_MAX_MS 60000u
#endif
#ifndef CFG_RECONNECT_JITTER_PCT
#define CFG_RECONNECT_JITTER_PCT 20u
#endif
#ifndef CFG_RECONNECT_MAX_ATTEMPTS
#define CFG_RECONNECT_MAX_ATTEMPTS 0u // 0 = retry forever
#endif

// --- Shutdown ---
#ifndef CFG_SHUTDOWN_GRACE_MS
#define CFG_SHUTDOWN_GRACE_MS 5000u
#endif

// --- Tasks / queues ---
#ifndef CFG_EVENT_QUEUE_DEPTH
#define CFG_EVENT_QUEUE_DEPTH 8u
#endif
#ifndef CFG_SUPERVISOR_TASK_STACK_BYTES
#define CFG_SUPERVISOR_TASK_STACK_BYTES 8192u
#endif
#ifndef CFG_SUPERVISOR_TASK_PRIORITY
#define CFG_SUPERVISOR_TASK_PRIORITY 2u
#endif
#ifndef CFG_PUBLISHER_TASK_STACK_BYTES
#define CFG_PUBLISHER_TASK_STACK_BYTES 6144u
#endif
#ifndef CFG_PUBLISHER_TASK_PRIORITY
#define CFG_PUBLISHER_TASK_PRIORITY 1u
#endif
#ifndef CFG_SUPERVISOR_PUMP_MS
#define CFG_SUPERVISOR_PUMP_MS 50u // mqtt.loop() cadence while connected
#endif

// --- WiFi ---
#ifndef CFG_WIFI_CONNECT_WAIT_MS
#define CFG_WIFI_CONNECT_WAIT_MS 10000u
#endif

// --- Logging ---
#ifndef CFG_LOG_COLOR
#define CFG_LOG_COLOR 0 // ANSI colorized Serial logs (0=off, 1=on)
#endif
#ifndef CFG_LOG_MIN_LEVEL
#define CFG_LOG_MIN_LEVEL 1 // 0=DEBUG 1=INFO 2=WARN 3=ERROR
#endif
#ifndef CFG_LOG_FILE
#define CFG_LOG_FILE "/logs/sensor.log"
#endif
#ifndef CFG_LOG_FILE_MAX_BYTES
#define CFG_LOG_FILE_MAX_BYTES 65536u
#endif
#ifndef CFG_SERIAL_BAUD
#define CFG_SERIAL_BAUD 115200u
#endif
