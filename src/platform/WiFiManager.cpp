#include "WiFiManager.h"
#include "Log.h"
#include "config.h"

WiFiManager::WiFiManager()
    : lastReconnectAttempt(0), wasConnected(false) {
}

void WiFiManager::begin(const char* hostname) {
    WiFi.mode(WIFI_STA);
    WiFi.setHostname(hostname);
    WiFi.setAutoReconnect(true);
}

bool WiFiManager::connect() {
    logInfo("WiFi", "Connecting to %s", ssid.c_str());

    WiFi.begin(ssid.c_str(), password.c_str());

    uint32_t startTime = millis();
    while (WiFi.status() != WL_CONNECTED) {
        if (millis() - startTime > WIFI_CONNECT_TIMEOUT_MS) {
            logWarn("WiFi", "Connection timeout");
            return false;
        }
        delay(500);
    }

    wasConnected = true;
    logInfo("WiFi", "Connected! IP: %s, RSSI %d dBm", WiFi.localIP().toString().c_str(), WiFi.RSSI());
    return true;
}

bool WiFiManager::isConnected() {
    bool connected = (WiFi.status() == WL_CONNECTED);
    if (connected && !wasConnected) {
        logInfo("WiFi", "Link up, IP: %s", WiFi.localIP().toString().c_str());
    } else if (!connected && wasConnected) {
        logWarn("WiFi", "Link lost");
    }
    wasConnected = connected;
    return connected;
}

void WiFiManager::reconnect() {
    uint32_t now = millis();

    // Throttle reconnect attempts
    if (now - lastReconnectAttempt < WIFI_RECONNECT_INTERVAL_MS) {
        return;
    }

    lastReconnectAttempt = now;

    if (!isConnected()) {
        logInfo("WiFi", "Reconnecting...");
        WiFi.disconnect();
        WiFi.reconnect();
    }
}

void WiFiManager::setCredentials(const char* newSSID, const char* newPassword) {
    ssid = newSSID;
    password = newPassword;
    logInfo("WiFi", "Credentials updated");
}
