#include "EventQueue.h"
#include "Log.h"
#include <string.h>

EventQueue::EventQueue()
    : head(0), count(0), dropped(0) {
}

bool EventQueue::pushInput(SignalId signal, bool level, uint32_t timestamp) {
    BusEvent* event = reserve();
    if (event == NULL) {
        return false;
    }

    event->type = BusEventType::InputChanged;
    event->signal = signal;
    event->level = level;
    event->timestamp = timestamp;
    event->topic[0] = '\0';
    event->payload[0] = '\0';
    return true;
}

bool EventQueue::pushMessage(const char* topic, const uint8_t* payload, size_t length) {
    if (strlen(topic) >= EVENT_TOPIC_MAX_LEN || length >= EVENT_PAYLOAD_MAX_LEN) {
        logWarn("QUEUE", "Message on %.40s too large, dropped", topic);
        dropped++;
        return false;
    }

    BusEvent* event = reserve();
    if (event == NULL) {
        return false;
    }

    event->type = BusEventType::Message;
    event->signal = SignalId::Count;
    event->level = false;
    event->timestamp = 0;
    strncpy(event->topic, topic, sizeof(event->topic) - 1);
    event->topic[sizeof(event->topic) - 1] = '\0';
    memcpy(event->payload, payload, length);
    event->payload[length] = '\0';
    return true;
}

bool EventQueue::pop(BusEvent& outEvent) {
    if (count == 0) {
        return false;
    }

    outEvent = events[head];
    head = (head + 1) % EVENT_QUEUE_SIZE;
    count--;
    return true;
}

size_t EventQueue::size() const {
    return count;
}

bool EventQueue::isEmpty() const {
    return count == 0;
}

void EventQueue::clear() {
    head = 0;
    count = 0;
}

uint32_t EventQueue::getDroppedCount() const {
    return dropped;
}

BusEvent* EventQueue::reserve() {
    if (count >= EVENT_QUEUE_SIZE) {
        dropped++;
        logWarn("QUEUE", "Event queue full, event dropped (%lu total)", (unsigned long)dropped);
        return NULL;
    }

    size_t tail = (head + count) % EVENT_QUEUE_SIZE;
    count++;
    return &events[tail];
}
