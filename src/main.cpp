/******************************************************
 * Doorbell MQTT Bridge
 *
 * - Publishes the doorbell's video sensor, video request button,
 *   door button and door sensor as retained ON/OFF states
 * - Pulses the door relay on "PRESS" from the home-automation side
 * - Drives the video request line on a remote "PRESS"
 * - Announces itself through Home Assistant MQTT discovery
 *
 * Settings: /doorbell.json on LittleFS, defaults in config.h
 ******************************************************/

#include <Arduino.h>
#include <WiFi.h>
#include <esp_system.h>

#include "config.h"
#include "Models.h"
#include "Log.h"
#include "ConfigManager.h"
#include "WiFiManager.h"
#include "ArduinoGpio.h"
#include "MqttBus.h"
#include "DoorbellAdapter.h"
#include "DoorbellTask.h"

ConfigManager configManager;
DoorbellConfiguration deviceConfig;

WiFiManager wifiManager;
ArduinoGpio gpio;
MqttBus mqttBus(deviceConfig);

// Set once in setup(), used by the restart hook
static DoorbellAdapter* doorbell = NULL;

// Runs inside esp_restart(), whoever triggered it
static void onSystemShutdown() {
    if (doorbell != NULL) {
        doorbell->releaseRelay();
    }
}

static void fatalRestart(const char* reason) {
    if (doorbell != NULL) {
        doorbell->releaseRelay();
    }
    logError("INIT", "Fatal: %s. Restarting in %d ms", reason, FATAL_RESTART_DELAY_MS);
    delay(FATAL_RESTART_DELAY_MS);
    ESP.restart();
}

void setup() {
    Serial.begin(115200);
    Serial.println("\n\n==========================================");
    Serial.println("Doorbell MQTT Bridge");
    Serial.println("Firmware: " FIRMWARE_VERSION);
    Serial.println("==========================================\n");

    logInfo("INIT", "Loading configuration...");
    configManager.begin();

    ConfigLoadResult result = configManager.load(deviceConfig);
    if (result == ConfigLoadResult::Invalid) {
        fatalRestart("configuration rejected");
    }
    setLogLevel(deviceConfig.log_level);

    logInfo("INIT", "Device ID: %s", deviceConfig.device_id);
    logInfo("INIT", "Broker: %s:%u", deviceConfig.broker_host, deviceConfig.broker_port);
    logInfo("INIT", "Topic prefix: %s", deviceConfig.topic_prefix);
    logInfo("INIT", "Log level: %s", logLevelName(deviceConfig.log_level));

    // Hardware
    static DoorbellAdapter adapter(deviceConfig, gpio, mqttBus);
    doorbell = &adapter;

    if (!adapter.begin(millis())) {
        fatalRestart("GPIO setup failed");
    }

    if (esp_register_shutdown_handler(onSystemShutdown) != ESP_OK) {
        logWarn("INIT", "Could not register relay shutdown hook");
    }

    // Network
    wifiManager.setCredentials(deviceConfig.wifi_ssid, deviceConfig.wifi_password);
    wifiManager.begin(deviceConfig.client_id);
    if (!wifiManager.connect()) {
        logWarn("INIT", "WiFi not up yet, retrying in the background");
    }

    mqttBus.begin();

    static DoorbellTask doorbellTask(adapter);
    if (!doorbellTask.begin()) {
        fatalRestart("could not start doorbell task");
    }

    logInfo("INIT", "System ready");
}

void loop() {
    if (!wifiManager.isConnected()) {
        wifiManager.reconnect();
    }

    delay(100);
}
