#ifndef WIFI_MANAGER_H
#define WIFI_MANAGER_H

#include <Arduino.h>
#include <WiFi.h>

class WiFiManager {
public:
    WiFiManager();

    void begin(const char* hostname);
    bool connect();
    bool isConnected();
    void reconnect();

    void setCredentials(const char* newSSID, const char* newPassword);

private:
    String ssid;
    String password;
    uint32_t lastReconnectAttempt;
    bool wasConnected;
};

#endif
