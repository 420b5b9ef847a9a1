#include <gtest/gtest.h>
#include <string.h>
#include <string>
#include "EventQueue.h"
#include "support/LogCapture.h"

static bool pushText(EventQueue& queue, const char* topic, const char* payload) {
    return queue.pushMessage(topic, reinterpret_cast<const uint8_t*>(payload), strlen(payload));
}

TEST(EventQueueTest, EventsComeOutInOrder) {
    EventQueue queue;
    ASSERT_TRUE(queue.pushInput(SignalId::VideoSensor, true, 10));
    ASSERT_TRUE(pushText(queue, "home/doorbell/door_opener/command", "PRESS"));
    ASSERT_TRUE(queue.pushInput(SignalId::VideoButton, false, 20));
    EXPECT_EQ(3u, queue.size());

    BusEvent event;
    ASSERT_TRUE(queue.pop(event));
    EXPECT_EQ(BusEventType::InputChanged, event.type);
    EXPECT_EQ(SignalId::VideoSensor, event.signal);
    EXPECT_TRUE(event.level);
    EXPECT_EQ(10u, event.timestamp);

    ASSERT_TRUE(queue.pop(event));
    EXPECT_EQ(BusEventType::Message, event.type);
    EXPECT_STREQ("home/doorbell/door_opener/command", event.topic);
    EXPECT_STREQ("PRESS", event.payload);

    ASSERT_TRUE(queue.pop(event));
    EXPECT_EQ(SignalId::VideoButton, event.signal);
    EXPECT_FALSE(event.level);

    EXPECT_FALSE(queue.pop(event));
    EXPECT_TRUE(queue.isEmpty());
}

TEST(EventQueueTest, PayloadIsTerminated) {
    EventQueue queue;
    const uint8_t raw[] = { 'O', 'N', 'X' };
    ASSERT_TRUE(queue.pushMessage("t", raw, 2));

    BusEvent event;
    ASSERT_TRUE(queue.pop(event));
    EXPECT_STREQ("ON", event.payload);
}

TEST(EventQueueTest, FullQueueDropsNewEvents) {
    EventQueue queue;
    clearCapturedLogs();

    for (uint32_t i = 0; i < EVENT_QUEUE_SIZE; i++) {
        ASSERT_TRUE(queue.pushInput(SignalId::VideoSensor, (i % 2) == 0, i));
    }
    EXPECT_FALSE(queue.pushInput(SignalId::VideoButton, true, 999));
    EXPECT_EQ(1u, queue.getDroppedCount());
    EXPECT_EQ((size_t)EVENT_QUEUE_SIZE, queue.size());
    EXPECT_TRUE(logContains("Event queue full"));

    // Oldest events are kept
    BusEvent event;
    ASSERT_TRUE(queue.pop(event));
    EXPECT_EQ(0u, event.timestamp);

    // Room again after a pop, ring wraps
    EXPECT_TRUE(queue.pushInput(SignalId::DoorButton, true, 1000));
    uint32_t last = 0;
    while (queue.pop(event)) {
        last = event.timestamp;
    }
    EXPECT_EQ(1000u, last);
}

TEST(EventQueueTest, OversizedMessageIsDropped) {
    EventQueue queue;
    std::string payload(EVENT_PAYLOAD_MAX_LEN, 'x');
    std::string topic(EVENT_TOPIC_MAX_LEN, 't');

    EXPECT_FALSE(pushText(queue, "home/doorbell/door_opener/command", payload.c_str()));
    EXPECT_FALSE(pushText(queue, topic.c_str(), "PRESS"));
    EXPECT_TRUE(queue.isEmpty());
    EXPECT_EQ(2u, queue.getDroppedCount());
}

TEST(EventQueueTest, ClearEmptiesQueue) {
    EventQueue queue;
    queue.pushInput(SignalId::VideoSensor, true, 1);
    queue.pushInput(SignalId::VideoSensor, false, 2);
    queue.clear();

    BusEvent event;
    EXPECT_FALSE(queue.pop(event));
    EXPECT_EQ(0u, queue.size());
}
