#include "HomeAssistantDiscovery.h"
#include "Log.h"
#include <ArduinoJson.h>
#include <stdio.h>
#include <string.h>

static bool formatTopic(char* out, size_t len, int written) {
    if (written < 0 || (size_t)written >= len) {
        logError("DISCOVERY", "Topic does not fit into %u bytes", (unsigned)len);
        return false;
    }
    return true;
}

HomeAssistantDiscovery::HomeAssistantDiscovery(const DoorbellConfiguration& config)
    : config(config) {
}

bool HomeAssistantDiscovery::componentTopic(char* out, size_t len, const char* topicId,
                                            const char* subtopic) const {
    int written = snprintf(out, len, "%s/%s/%s", config.topic_prefix, topicId, subtopic);
    return formatTopic(out, len, written);
}

bool HomeAssistantDiscovery::deviceAvailabilityTopic(char* out, size_t len) const {
    int written = snprintf(out, len, "%s/%s", config.topic_prefix, TOPIC_SUB_AVAILABILITY);
    return formatTopic(out, len, written);
}

bool HomeAssistantDiscovery::discoveryTopic(char* out, size_t len) const {
    int written = snprintf(out, len, "%s/device/%s/config", config.discovery_prefix, config.device_id);
    return formatTopic(out, len, written);
}

size_t HomeAssistantDiscovery::buildPayload(char* out, size_t len, const ComponentInfo* components,
                                            size_t count) const {
    JsonDocument doc;

    JsonObject dev = doc["dev"].to<JsonObject>();
    dev["ids"] = config.device_id;
    dev["name"] = DEVICE_NAME;
    dev["mf"] = DEVICE_MANUFACTURER;
    dev["mdl"] = DEVICE_MODEL;
    dev["sw"] = FIRMWARE_VERSION;
    dev["hw"] = DEVICE_HW_VERSION;

    JsonObject origin = doc["o"].to<JsonObject>();
    origin["name"] = ORIGIN_NAME;
    origin["sw"] = FIRMWARE_VERSION;

    JsonObject cmps = doc["cmps"].to<JsonObject>();
    char topic[EVENT_TOPIC_MAX_LEN];
    char uniqueId[64];

    for (size_t i = 0; i < count; i++) {
        const ComponentInfo& info = components[i];
        JsonObject cmp = cmps[info.objectId].to<JsonObject>();

        cmp["p"] = info.platform;
        cmp["name"] = info.name;
        cmp["object_id"] = info.objectId;
        snprintf(uniqueId, sizeof(uniqueId), "%s_%s", config.device_id, info.objectId);
        cmp["unique_id"] = uniqueId;

        if (componentTopic(topic, sizeof(topic), info.topicId, TOPIC_SUB_AVAILABILITY)) {
            cmp["availability_topic"] = topic;
        }

        if (strcmp(info.platform, "button") == 0) {
            if (componentTopic(topic, sizeof(topic), info.topicId, TOPIC_SUB_COMMAND)) {
                cmp["command_topic"] = topic;
            }
            cmp["payload_press"] = PAYLOAD_PRESS;
        } else {
            if (componentTopic(topic, sizeof(topic), info.topicId, TOPIC_SUB_STATE)) {
                cmp["state_topic"] = topic;
            }
            cmp["payload_on"] = PAYLOAD_ON;
            cmp["payload_off"] = PAYLOAD_OFF;
        }
    }

    doc["qos"] = 1;

    if (doc.overflowed()) {
        logError("DISCOVERY", "Out of memory while building payload");
        return 0;
    }

    size_t required = measureJson(doc);
    if (required >= len) {
        logError("DISCOVERY", "Payload needs %u bytes, buffer has %u", (unsigned)required, (unsigned)len);
        return 0;
    }

    return serializeJson(doc, out, len);
}
