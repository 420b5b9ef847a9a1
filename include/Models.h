#ifndef MODELS_H
#define MODELS_H

#include <stdint.h>
#include "config.h"

// ============================================
// Log levels
// ============================================
enum class LogLevel : uint8_t {
    Debug = 0,
    Info,
    Warn,
    Error
};

// ============================================
// Doorbell signals
// ============================================
enum class SignalId : uint8_t {
    VideoSensor = 0,
    VideoButton,
    DoorButton,
    DoorSensor,
    Count
};

static const uint8_t SIGNAL_COUNT = static_cast<uint8_t>(SignalId::Count);

// Home Assistant component description
struct ComponentInfo {
    const char* name;       // "Video Sensor"
    const char* objectId;   // "video_sensor"
    const char* topicId;    // Topic segment, shared when two components drive one line
    const char* platform;   // "binary_sensor", "button"
};

// ============================================
// Runtime configuration (settings file + defaults)
// ============================================
struct DoorbellConfiguration {
    // WiFi Settings
    char wifi_ssid[33];
    char wifi_password[65];

    // Broker Settings
    char broker_host[64];
    uint16_t broker_port;
    char username[64];
    char password[64];
    char client_id[32];

    // Topics & Identity
    char topic_prefix[64];
    char discovery_prefix[32];
    char device_id[32];

    // GPIO
    int8_t video_sensor_pin;
    int8_t video_button_pin;
    int8_t door_button_pin;     // -1 = not wired
    int8_t door_sensor_pin;     // -1 = not wired
    int8_t relay_pin;
    bool relay_active_low;
    bool input_pull_up;

    // Timing
    uint32_t pulse_duration_ms;
    uint16_t debounce_ms;

    LogLevel log_level;
};

// ============================================
// Event loop messages
// ============================================
enum class BusEventType : uint8_t {
    InputChanged,   // Debounced input transition
    Message         // Message received from the broker
};

struct BusEvent {
    BusEventType type;

    // InputChanged
    SignalId signal;
    bool level;
    uint32_t timestamp;

    // Message
    char topic[EVENT_TOPIC_MAX_LEN];
    char payload[EVENT_PAYLOAD_MAX_LEN];
};

#endif
