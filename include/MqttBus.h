#ifndef MQTTBUS_H
#define MQTTBUS_H

#include <Arduino.h>
#include <WiFi.h>
#include <PubSubClient.h>
#include "MessageBus.h"
#include "Models.h"

class MqttBus : public MessageBus {
public:
    MqttBus(const DoorbellConfiguration& config);
    void begin();

    bool connect(const char* willTopic, const char* willPayload) override;
    bool isConnected() override;
    void disconnect() override;

    bool publish(const char* topic, const char* payload, bool retained) override;
    bool subscribe(const char* topic) override;
    bool unsubscribe(const char* topic) override;

    void loop() override;

private:
    const DoorbellConfiguration& config;
    WiFiClient netClient;
    PubSubClient mqtt;
    bool wasConnected;

    void handleMessage(char* topic, uint8_t* payload, unsigned int length);
    static const char* describeState(int state);
};

#endif
