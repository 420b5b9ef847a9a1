#include <gtest/gtest.h>
#include <ArduinoJson.h>
#include <string.h>
#include "ConfigManager.h"
#include "HomeAssistantDiscovery.h"

static const ComponentInfo COMPONENTS[] = {
    { "Video Sensor", "video_sensor", "video_sensor", "binary_sensor" },
    { "Door Opener", "door_opener", "door_opener", "button" }
};

// Everything the bridge announces when every input is wired
static const ComponentInfo ALL_COMPONENTS[] = {
    { "Video Sensor", "video_sensor", "video_sensor", "binary_sensor" },
    { "Video Button", "video_button", "video_button", "binary_sensor" },
    { "Door Button", "door_button", "door_button", "binary_sensor" },
    { "Door Sensor", "door_sensor", "door_sensor", "binary_sensor" },
    { "Door Opener", "door_opener", "door_opener", "button" },
    { "Video Request", "video_request", "video_button", "button" },
    { "Restart", "restart", "restart", "button" }
};

class DiscoveryTest : public ::testing::Test {
protected:
    DiscoveryTest() : discovery(config) {}

    void SetUp() override {
        ConfigManager configManager;
        configManager.getDefaults(config);
    }

    DoorbellConfiguration config;
    HomeAssistantDiscovery discovery;
};

TEST_F(DiscoveryTest, TopicLayout) {
    char topic[EVENT_TOPIC_MAX_LEN];

    ASSERT_TRUE(discovery.componentTopic(topic, sizeof(topic), "video_sensor", TOPIC_SUB_STATE));
    EXPECT_STREQ("home/doorbell/video_sensor/state", topic);

    ASSERT_TRUE(discovery.componentTopic(topic, sizeof(topic), "door_opener", TOPIC_SUB_COMMAND));
    EXPECT_STREQ("home/doorbell/door_opener/command", topic);

    ASSERT_TRUE(discovery.deviceAvailabilityTopic(topic, sizeof(topic)));
    EXPECT_STREQ("home/doorbell/availability", topic);

    ASSERT_TRUE(discovery.discoveryTopic(topic, sizeof(topic)));
    EXPECT_STREQ("homeassistant/device/doorbell1234/config", topic);
}

TEST_F(DiscoveryTest, TopicFollowsConfiguredPrefix) {
    strcpy(config.topic_prefix, "flat/bell");
    char topic[EVENT_TOPIC_MAX_LEN];

    ASSERT_TRUE(discovery.componentTopic(topic, sizeof(topic), "video_button", TOPIC_SUB_STATE));
    EXPECT_STREQ("flat/bell/video_button/state", topic);
}

TEST_F(DiscoveryTest, TruncatedTopicFails) {
    char topic[16];
    EXPECT_FALSE(discovery.componentTopic(topic, sizeof(topic), "video_sensor", TOPIC_SUB_STATE));
}

TEST_F(DiscoveryTest, PayloadDescribesDeviceAndComponents) {
    char payload[2048];
    size_t length = discovery.buildPayload(payload, sizeof(payload), COMPONENTS, 2);
    ASSERT_GT(length, 0u);
    EXPECT_EQ(strlen(payload), length);

    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, payload);
    ASSERT_TRUE(err == DeserializationError::Ok) << err.c_str();

    EXPECT_STREQ("doorbell1234", doc["dev"]["ids"].as<const char*>());
    EXPECT_STREQ(DEVICE_NAME, doc["dev"]["name"].as<const char*>());
    EXPECT_STREQ(FIRMWARE_VERSION, doc["dev"]["sw"].as<const char*>());
    EXPECT_STREQ(ORIGIN_NAME, doc["o"]["name"].as<const char*>());
    EXPECT_EQ(1, doc["qos"].as<int>());

    JsonObject sensor = doc["cmps"]["video_sensor"];
    ASSERT_FALSE(sensor.isNull());
    EXPECT_STREQ("binary_sensor", sensor["p"].as<const char*>());
    EXPECT_STREQ("doorbell1234_video_sensor", sensor["unique_id"].as<const char*>());
    EXPECT_STREQ("home/doorbell/video_sensor/state", sensor["state_topic"].as<const char*>());
    EXPECT_STREQ("home/doorbell/video_sensor/availability", sensor["availability_topic"].as<const char*>());
    EXPECT_STREQ("ON", sensor["payload_on"].as<const char*>());
    EXPECT_STREQ("OFF", sensor["payload_off"].as<const char*>());
    EXPECT_TRUE(sensor["command_topic"].isNull());

    JsonObject opener = doc["cmps"]["door_opener"];
    ASSERT_FALSE(opener.isNull());
    EXPECT_STREQ("button", opener["p"].as<const char*>());
    EXPECT_STREQ("home/doorbell/door_opener/command", opener["command_topic"].as<const char*>());
    EXPECT_STREQ("PRESS", opener["payload_press"].as<const char*>());
    EXPECT_TRUE(opener["state_topic"].isNull());
}

TEST_F(DiscoveryTest, PayloadTooLargeForBuffer) {
    char payload[64];
    EXPECT_EQ(0u, discovery.buildPayload(payload, sizeof(payload), COMPONENTS, 2));
}

TEST_F(DiscoveryTest, SharedLineUsesOwnerTopics) {
    char payload[DISCOVERY_PAYLOAD_MAX_LEN];
    ASSERT_GT(discovery.buildPayload(payload, sizeof(payload), ALL_COMPONENTS, 7), 0u);

    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, payload);
    ASSERT_TRUE(err == DeserializationError::Ok) << err.c_str();

    JsonObject request = doc["cmps"]["video_request"];
    ASSERT_FALSE(request.isNull());
    EXPECT_STREQ("doorbell1234_video_request", request["unique_id"].as<const char*>());
    EXPECT_STREQ("home/doorbell/video_button/command", request["command_topic"].as<const char*>());
    EXPECT_STREQ("home/doorbell/video_button/availability", request["availability_topic"].as<const char*>());
}

TEST_F(DiscoveryTest, LongestAcceptedNamesFitDiscoveryBuffer) {
    memset(config.topic_prefix, 'p', sizeof(config.topic_prefix) - 1);
    config.topic_prefix[sizeof(config.topic_prefix) - 1] = '\0';
    memset(config.device_id, 'd', sizeof(config.device_id) - 1);
    config.device_id[sizeof(config.device_id) - 1] = '\0';
    memset(config.discovery_prefix, 'h', sizeof(config.discovery_prefix) - 1);
    config.discovery_prefix[sizeof(config.discovery_prefix) - 1] = '\0';

    ConfigManager configManager;
    ASSERT_TRUE(configManager.validate(config));

    char topic[EVENT_TOPIC_MAX_LEN];
    ASSERT_TRUE(discovery.discoveryTopic(topic, sizeof(topic)));
    ASSERT_TRUE(discovery.componentTopic(topic, sizeof(topic), "video_request", TOPIC_SUB_AVAILABILITY));

    char payload[DISCOVERY_PAYLOAD_MAX_LEN];
    size_t length = discovery.buildPayload(payload, sizeof(payload), ALL_COMPONENTS, 7);
    ASSERT_GT(length, 0u);

    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, payload);
    ASSERT_TRUE(err == DeserializationError::Ok) << err.c_str();
    EXPECT_EQ(7u, doc["cmps"].as<JsonObject>().size());
}
