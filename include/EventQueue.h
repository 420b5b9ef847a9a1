#ifndef EVENTQUEUE_H
#define EVENTQUEUE_H

#include <stddef.h>
#include <stdint.h>
#include "Models.h"

// Fixed-size FIFO feeding the doorbell loop. Producers are the input poller
// and the MQTT callback; the loop is the only consumer.
class EventQueue {
public:
    EventQueue();

    bool pushInput(SignalId signal, bool level, uint32_t timestamp);
    bool pushMessage(const char* topic, const uint8_t* payload, size_t length);

    bool pop(BusEvent& outEvent);

    size_t size() const;
    bool isEmpty() const;
    void clear();
    uint32_t getDroppedCount() const;

private:
    BusEvent events[EVENT_QUEUE_SIZE];
    size_t head;
    size_t count;
    uint32_t dropped;

    BusEvent* reserve();
};

#endif
