#ifndef CONFIG_H
#define CONFIG_H

// ============================================
// WiFi Configuration (defaults, overridden by /doorbell.json)
// ============================================
#define WIFI_SSID "doorbell-net"
#define WIFI_PASSWORD "change-me"
#define WIFI_CONNECT_TIMEOUT_MS 10000
#define WIFI_RECONNECT_INTERVAL_MS 30000

// ============================================
// MQTT Broker Configuration (defaults)
// ============================================
#define MQTT_HOST "homeassistant.local"
#define MQTT_PORT 1883
#define MQTT_USERNAME ""
#define MQTT_PASSWORD ""
#define MQTT_CLIENT_ID "doorbell-bridge"
#define MQTT_KEEPALIVE_S 60
#define MQTT_SOCKET_TIMEOUT_S 2
#define MQTT_BUFFER_SIZE 4096  // Discovery document is ~2.9KB with the longest accepted prefix and id

#define MQTT_RECONNECT_MIN_MS 1000
#define MQTT_RECONNECT_MAX_MS 30000

// ============================================
// Topics
// ============================================
#define TOPIC_PREFIX "home/doorbell"
#define DISCOVERY_PREFIX "homeassistant"

#define PAYLOAD_ON "ON"
#define PAYLOAD_OFF "OFF"
#define PAYLOAD_PRESS "PRESS"
#define PAYLOAD_ONLINE "online"
#define PAYLOAD_OFFLINE "offline"

// ============================================
// Device Identity (discovery)
// ============================================
#define DEVICE_ID "doorbell1234"
#define DEVICE_NAME "Interfono"
#define DEVICE_MANUFACTURER "PRIM, S.A."
#define DEVICE_MODEL "UltraGuard"
#define DEVICE_HW_VERSION "v1"
#define ORIGIN_NAME "Doorbell Bridge"
#define FIRMWARE_VERSION "1.0.0"

// ============================================
// Hardware Pin Configuration
// ============================================
// Inputs come from the logic-level converter, active HIGH
#define PIN_VIDEO_SENSOR 4
#define PIN_VIDEO_BUTTON 15
#define PIN_DOOR_BUTTON 14     // -1 to disable
#define PIN_DOOR_SENSOR 2      // -1 to disable
#define INPUT_PULL_UP false    // Pull-down: converter drives HIGH when active

// Door relay (opens the door while energized)
#define PIN_DOOR_RELAY 26
#define RELAY_ACTIVE_LOW true  // LOW-trigger relay module

#define GPIO_PIN_MAX 39

// ============================================
// Timing
// ============================================
#define RELAY_PULSE_MS 800
#define RELAY_PULSE_MIN_MS 100
#define RELAY_PULSE_MAX_MS 5000

#define VIDEO_REQUEST_PULSE_MS 200  // Video button line held LOW on a remote request

#define INPUT_DEBOUNCE_MS 50
#define INPUT_DEBOUNCE_MIN_MS 5
#define INPUT_DEBOUNCE_MAX_MS 500

#define PUBLISH_RETRY_INTERVAL_MS 1000
#define FATAL_RESTART_DELAY_MS 5000

// ============================================
// Settings File
// ============================================
#define CONFIG_FILE_PATH "/doorbell.json"
#define CONFIG_FILE_MAX_SIZE 2048

// ============================================
// Event Loop (FreeRTOS task)
// ============================================
#define DOORBELL_TICK_MS 10
#define DOORBELL_TASK_STACK_SIZE 8192
#define DOORBELL_TASK_PRIORITY 1
#define DOORBELL_TASK_CORE 1

#define EVENT_QUEUE_SIZE 16
#define EVENT_TOPIC_MAX_LEN 128
#define EVENT_PAYLOAD_MAX_LEN 64

#define DISCOVERY_PAYLOAD_MAX_LEN (MQTT_BUFFER_SIZE - EVENT_TOPIC_MAX_LEN)

#define LOG_LINE_MAX_LEN 256

#endif // CONFIG_H
