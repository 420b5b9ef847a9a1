#ifndef MESSAGEBUS_H
#define MESSAGEBUS_H

#include <stddef.h>
#include "EventQueue.h"

// Publish/subscribe connection used by the doorbell loop.
// Received messages are copied into the inbox during loop().
class MessageBus {
public:
    virtual ~MessageBus() {}

    // One time-bounded attempt. The will is published by the broker if the
    // connection drops without disconnect().
    virtual bool connect(const char* willTopic, const char* willPayload) = 0;
    virtual bool isConnected() = 0;
    virtual void disconnect() = 0;

    virtual bool publish(const char* topic, const char* payload, bool retained) = 0;
    virtual bool subscribe(const char* topic) = 0;
    virtual bool unsubscribe(const char* topic) = 0;

    // Pumps network I/O without blocking
    virtual void loop() = 0;

    void setInbox(EventQueue* queue) {
        inbox = queue;
    }

protected:
    MessageBus() : inbox(NULL) {}

    EventQueue* inbox;
};

#endif
