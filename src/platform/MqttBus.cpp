#include "MqttBus.h"
#include "Log.h"
#include "config.h"

MqttBus::MqttBus(const DoorbellConfiguration& config)
    : config(config), mqtt(netClient), wasConnected(false) {
}

void MqttBus::begin() {
    mqtt.setServer(config.broker_host, config.broker_port);
    mqtt.setKeepAlive(MQTT_KEEPALIVE_S);
    mqtt.setSocketTimeout(MQTT_SOCKET_TIMEOUT_S);

    if (!mqtt.setBufferSize(MQTT_BUFFER_SIZE)) {
        logWarn("MQTT", "Could not allocate %d byte buffer, discovery may not fit", MQTT_BUFFER_SIZE);
    }

    mqtt.setCallback([this](char* topic, uint8_t* payload, unsigned int length) {
        this->handleMessage(topic, payload, length);
    });

    logInfo("MQTT", "Broker %s:%u, client id %s", config.broker_host, config.broker_port, config.client_id);
}

bool MqttBus::connect(const char* willTopic, const char* willPayload) {
    if (WiFi.status() != WL_CONNECTED) {
        logDebug("MQTT", "WiFi down, skipping connect");
        return false;
    }

    logInfo("MQTT", "Connecting to %s:%u...", config.broker_host, config.broker_port);

    bool hasCredentials = strlen(config.username) > 0;
    bool ok = mqtt.connect(
        config.client_id,
        hasCredentials ? config.username : NULL,
        hasCredentials ? config.password : NULL,
        willTopic, 1, true, willPayload
    );

    if (!ok) {
        logWarn("MQTT", "Connect failed, rc=%d (%s)", mqtt.state(), describeState(mqtt.state()));
        return false;
    }

    wasConnected = true;
    logInfo("MQTT", "Connected");
    return true;
}

bool MqttBus::isConnected() {
    bool connected = mqtt.connected();
    if (wasConnected && !connected) {
        logWarn("MQTT", "Connection lost, rc=%d (%s)", mqtt.state(), describeState(mqtt.state()));
        wasConnected = false;
    }
    return connected;
}

void MqttBus::disconnect() {
    if (mqtt.connected()) {
        mqtt.disconnect();
        logInfo("MQTT", "Disconnected");
    }
    wasConnected = false;
}

bool MqttBus::publish(const char* topic, const char* payload, bool retained) {
    if (!mqtt.connected()) {
        return false;
    }
    return mqtt.publish(topic, payload, retained);
}

bool MqttBus::subscribe(const char* topic) {
    return mqtt.subscribe(topic, 1);
}

bool MqttBus::unsubscribe(const char* topic) {
    return mqtt.unsubscribe(topic);
}

void MqttBus::loop() {
    mqtt.loop();
}

void MqttBus::handleMessage(char* topic, uint8_t* payload, unsigned int length) {
    if (inbox == NULL) {
        return;
    }
    if (!inbox->pushMessage(topic, payload, length)) {
        logWarn("MQTT", "Message on %s dropped", topic);
    }
}

const char* MqttBus::describeState(int state) {
    switch (state) {
        case MQTT_CONNECTION_TIMEOUT:      return "connection timeout";
        case MQTT_CONNECTION_LOST:         return "connection lost";
        case MQTT_CONNECT_FAILED:          return "network connect failed";
        case MQTT_DISCONNECTED:            return "disconnected";
        case MQTT_CONNECTED:               return "connected";
        case MQTT_CONNECT_BAD_PROTOCOL:    return "bad protocol";
        case MQTT_CONNECT_BAD_CLIENT_ID:   return "client id rejected";
        case MQTT_CONNECT_UNAVAILABLE:     return "server unavailable";
        case MQTT_CONNECT_BAD_CREDENTIALS: return "bad credentials";
        case MQTT_CONNECT_UNAUTHORIZED:    return "unauthorized";
        default:                           return "unknown";
    }
}
