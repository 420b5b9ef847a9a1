#include "ConfigManager.h"
#include "Log.h"
#include "config.h"
#include <ArduinoJson.h>
#include <stdlib.h>
#include <string.h>

static const char* const KNOWN_KEYS[] = {
    "wifiSsid", "wifiPassword",
    "brokerHost", "host", "brokerPort", "port",
    "username", "password", "clientId",
    "topicPrefix", "discoveryPrefix", "deviceId",
    "videoSensorPin", "videoButtonPin", "doorButtonPin", "doorSensorPin", "relayPin",
    "relayActiveLow", "inputPullUp",
    "pulseDurationMs", "debounceMs", "logLevel"
};

static bool isKnownKey(const char* key) {
    for (size_t i = 0; i < sizeof(KNOWN_KEYS) / sizeof(KNOWN_KEYS[0]); i++) {
        if (strcmp(KNOWN_KEYS[i], key) == 0) {
            return true;
        }
    }
    return false;
}

static bool readString(JsonObjectConst root, const char* key, char* out, size_t size) {
    JsonVariantConst value = root[key];
    if (value.isNull()) {
        return true;
    }
    if (!value.is<const char*>()) {
        logError("ConfigManager", "'%s' must be a string", key);
        return false;
    }

    const char* str = value.as<const char*>();
    if (strlen(str) >= size) {
        logError("ConfigManager", "'%s' is longer than %u characters", key, (unsigned)(size - 1));
        return false;
    }
    strncpy(out, str, size - 1);
    out[size - 1] = '\0';
    return true;
}

static bool readBool(JsonObjectConst root, const char* key, bool& out) {
    JsonVariantConst value = root[key];
    if (value.isNull()) {
        return true;
    }
    if (!value.is<bool>()) {
        logError("ConfigManager", "'%s' must be true or false", key);
        return false;
    }
    out = value.as<bool>();
    return true;
}

// Accepts numbers and numeric strings ("1883")
static bool readInteger(JsonObjectConst root, const char* key, long minValue, long maxValue, long& out,
                        bool& present) {
    JsonVariantConst value = root[key];
    present = !value.isNull();
    if (!present) {
        return true;
    }

    long parsed;
    if (value.is<long>()) {
        parsed = value.as<long>();
    } else if (value.is<const char*>()) {
        const char* str = value.as<const char*>();
        char* end = NULL;
        parsed = strtol(str, &end, 10);
        if (end == str || *end != '\0') {
            logError("ConfigManager", "'%s' is not a number: %s", key, str);
            return false;
        }
    } else {
        logError("ConfigManager", "'%s' must be an integer", key);
        return false;
    }

    if (parsed < minValue || parsed > maxValue) {
        logError("ConfigManager", "'%s' out of range (%ld..%ld): %ld", key, minValue, maxValue, parsed);
        return false;
    }
    out = parsed;
    return true;
}

static bool readPin(JsonObjectConst root, const char* key, bool optional, int8_t& out) {
    long value = 0;
    bool present = false;
    if (!readInteger(root, key, optional ? -1 : 0, GPIO_PIN_MAX, value, present)) {
        return false;
    }
    if (present) {
        out = (int8_t)value;
    }
    return true;
}

ConfigManager::ConfigManager()
    : mounted(false) {
}

bool ConfigManager::parse(const char* json, size_t length, DoorbellConfiguration& config) {
    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, json, length);
    if (err) {
        logError("ConfigManager", "Settings file is not valid JSON: %s", err.c_str());
        return false;
    }
    if (!doc.is<JsonObject>()) {
        logError("ConfigManager", "Settings file must contain a JSON object");
        return false;
    }

    JsonObjectConst root = doc.as<JsonObjectConst>();

    for (JsonPairConst kv : root) {
        if (!isKnownKey(kv.key().c_str())) {
            logWarn("ConfigManager", "Ignoring unknown option '%s'", kv.key().c_str());
        }
    }

    bool ok = true;

    // WiFi
    ok = readString(root, "wifiSsid", config.wifi_ssid, sizeof(config.wifi_ssid)) && ok;
    ok = readString(root, "wifiPassword", config.wifi_password, sizeof(config.wifi_password)) && ok;

    // Broker ("host"/"port" are the keys of the older mqtt_config.json)
    ok = readString(root, "host", config.broker_host, sizeof(config.broker_host)) && ok;
    ok = readString(root, "brokerHost", config.broker_host, sizeof(config.broker_host)) && ok;

    long port = 0;
    bool present = false;
    ok = readInteger(root, "port", 1, 65535, port, present) && ok;
    if (present) {
        config.broker_port = (uint16_t)port;
    }
    ok = readInteger(root, "brokerPort", 1, 65535, port, present) && ok;
    if (present) {
        config.broker_port = (uint16_t)port;
    }

    ok = readString(root, "username", config.username, sizeof(config.username)) && ok;
    ok = readString(root, "password", config.password, sizeof(config.password)) && ok;
    ok = readString(root, "clientId", config.client_id, sizeof(config.client_id)) && ok;

    // Topics & identity
    ok = readString(root, "topicPrefix", config.topic_prefix, sizeof(config.topic_prefix)) && ok;
    ok = readString(root, "discoveryPrefix", config.discovery_prefix, sizeof(config.discovery_prefix)) && ok;
    ok = readString(root, "deviceId", config.device_id, sizeof(config.device_id)) && ok;

    // GPIO
    ok = readPin(root, "videoSensorPin", false, config.video_sensor_pin) && ok;
    ok = readPin(root, "videoButtonPin", false, config.video_button_pin) && ok;
    ok = readPin(root, "doorButtonPin", true, config.door_button_pin) && ok;
    ok = readPin(root, "doorSensorPin", true, config.door_sensor_pin) && ok;
    ok = readPin(root, "relayPin", false, config.relay_pin) && ok;
    ok = readBool(root, "relayActiveLow", config.relay_active_low) && ok;
    ok = readBool(root, "inputPullUp", config.input_pull_up) && ok;

    // Timing
    long value = 0;
    ok = readInteger(root, "pulseDurationMs", RELAY_PULSE_MIN_MS, RELAY_PULSE_MAX_MS, value, present) && ok;
    if (present) {
        config.pulse_duration_ms = (uint32_t)value;
    }
    ok = readInteger(root, "debounceMs", INPUT_DEBOUNCE_MIN_MS, INPUT_DEBOUNCE_MAX_MS, value, present) && ok;
    if (present) {
        config.debounce_ms = (uint16_t)value;
    }

    JsonVariantConst level = root["logLevel"];
    if (!level.isNull()) {
        if (!level.is<const char*>() || !parseLogLevel(level.as<const char*>(), config.log_level)) {
            logError("ConfigManager", "'logLevel' must be one of debug, info, warn, error");
            ok = false;
        }
    }

    return ok;
}

void ConfigManager::getDefaults(DoorbellConfiguration& config) {
    memset(&config, 0, sizeof(config));

    // WiFi defaults (from config.h)
    strncpy(config.wifi_ssid, WIFI_SSID, sizeof(config.wifi_ssid) - 1);
    strncpy(config.wifi_password, WIFI_PASSWORD, sizeof(config.wifi_password) - 1);

    // Broker defaults
    strncpy(config.broker_host, MQTT_HOST, sizeof(config.broker_host) - 1);
    config.broker_port = MQTT_PORT;
    strncpy(config.username, MQTT_USERNAME, sizeof(config.username) - 1);
    strncpy(config.password, MQTT_PASSWORD, sizeof(config.password) - 1);
    strncpy(config.client_id, MQTT_CLIENT_ID, sizeof(config.client_id) - 1);

    // Topics & identity
    strncpy(config.topic_prefix, TOPIC_PREFIX, sizeof(config.topic_prefix) - 1);
    strncpy(config.discovery_prefix, DISCOVERY_PREFIX, sizeof(config.discovery_prefix) - 1);
    strncpy(config.device_id, DEVICE_ID, sizeof(config.device_id) - 1);

    // Pins
    config.video_sensor_pin = PIN_VIDEO_SENSOR;
    config.video_button_pin = PIN_VIDEO_BUTTON;
    config.door_button_pin = PIN_DOOR_BUTTON;
    config.door_sensor_pin = PIN_DOOR_SENSOR;
    config.relay_pin = PIN_DOOR_RELAY;
    config.relay_active_low = RELAY_ACTIVE_LOW;
    config.input_pull_up = INPUT_PULL_UP;

    // Timing
    config.pulse_duration_ms = RELAY_PULSE_MS;
    config.debounce_ms = INPUT_DEBOUNCE_MS;

    config.log_level = LogLevel::Info;
}

bool ConfigManager::validate(const DoorbellConfiguration& config) {
    if (strlen(config.broker_host) == 0) {
        logError("ConfigManager", "Validation failed: broker host is empty");
        return false;
    }

    if (config.broker_port == 0) {
        logError("ConfigManager", "Validation failed: broker port is 0");
        return false;
    }

    if (strlen(config.client_id) == 0) {
        logError("ConfigManager", "Validation failed: client id is empty");
        return false;
    }

    if (strlen(config.device_id) == 0) {
        logError("ConfigManager", "Validation failed: device id is empty");
        return false;
    }

    if (strlen(config.topic_prefix) == 0 || strchr(config.topic_prefix, '#') != NULL ||
        strchr(config.topic_prefix, '+') != NULL) {
        logError("ConfigManager", "Validation failed: topic prefix '%s' is not usable", config.topic_prefix);
        return false;
    }

    if (strlen(config.discovery_prefix) == 0) {
        logError("ConfigManager", "Validation failed: discovery prefix is empty");
        return false;
    }

    // Pins
    // Optional pins last, -1 disables them
    const int8_t pins[] = {
        config.video_sensor_pin, config.video_button_pin, config.relay_pin,
        config.door_button_pin, config.door_sensor_pin
    };
    const char* names[] = { "videoSensorPin", "videoButtonPin", "relayPin", "doorButtonPin", "doorSensorPin" };
    const size_t pinCount = sizeof(pins) / sizeof(pins[0]);
    const size_t requiredPins = 3;

    for (size_t i = 0; i < pinCount; i++) {
        bool optional = (i >= requiredPins);
        if (pins[i] > GPIO_PIN_MAX || pins[i] < (optional ? -1 : 0)) {
            logError("ConfigManager", "Validation failed: %s=%d is not a GPIO", names[i], pins[i]);
            return false;
        }
        for (size_t j = i + 1; j < pinCount; j++) {
            if (pins[i] >= 0 && pins[i] == pins[j]) {
                logError("ConfigManager", "Validation failed: %s and %s share GPIO %d",
                         names[i], names[j], pins[i]);
                return false;
            }
        }
    }

    if (config.pulse_duration_ms < RELAY_PULSE_MIN_MS || config.pulse_duration_ms > RELAY_PULSE_MAX_MS) {
        logError("ConfigManager", "Validation failed: pulse duration %lu ms out of range",
                 (unsigned long)config.pulse_duration_ms);
        return false;
    }

    if (config.debounce_ms < INPUT_DEBOUNCE_MIN_MS || config.debounce_ms > INPUT_DEBOUNCE_MAX_MS) {
        logError("ConfigManager", "Validation failed: debounce %u ms out of range", config.debounce_ms);
        return false;
    }

    return true;
}

bool ConfigManager::parseLogLevel(const char* name, LogLevel& outLevel) {
    static const LogLevel levels[] = { LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error };
    for (size_t i = 0; i < sizeof(levels) / sizeof(levels[0]); i++) {
        if (strcmp(name, logLevelName(levels[i])) == 0) {
            outLevel = levels[i];
            return true;
        }
    }
    return false;
}
