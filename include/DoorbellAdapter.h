#ifndef DOORBELLADAPTER_H
#define DOORBELLADAPTER_H

#include <stdint.h>
#include "config.h"
#include "Models.h"
#include "GpioPort.h"
#include "MessageBus.h"
#include "EventQueue.h"
#include "SignalInput.h"
#include "RelayControl.h"
#include "ReconnectBackoff.h"
#include "HomeAssistantDiscovery.h"

// Bridges the doorbell lines to the broker:
// - debounced inputs are published as retained ON/OFF state
// - PRESS on the door opener command topic pulses the relay
// - PRESS on the video request command topic briefly drives the video
//   button line, which is an input the rest of the time
// - the broker connection is re-established with backoff and all
//   current states are republished after every connect
class DoorbellAdapter {
public:
    DoorbellAdapter(const DoorbellConfiguration& configuration, GpioPort& gpio, MessageBus& bus);

    // Configure pins and attach to the bus. False means the hardware is unusable.
    bool begin(uint32_t now);

    // One loop tick
    void update(uint32_t now);

    // Release the relay, announce offline, leave the broker
    void shutdown();

    // Relay fail-safe, usable from a shutdown hook
    void releaseRelay();

    bool isRestartRequested() const;
    bool isConnected() const;
    bool isRelayPulsing() const;
    bool isSignalEnabled(SignalId id) const;
    bool getSignalState(SignalId id) const;
    bool getReportedState(SignalId id, bool& outState) const;

    bool isVideoRequestActive() const;

private:
    struct SignalChannel {
        const ComponentInfo* info;
        SignalInput* input;
        bool enabled;
        bool currentState;
        bool lastReportedState;
        bool reported;
        uint32_t lastPublishAttempt;
        char stateTopic[EVENT_TOPIC_MAX_LEN];
    };

    DoorbellConfiguration config;
    MessageBus& bus;
    HomeAssistantDiscovery discovery;
    EventQueue queue;
    ReconnectBackoff backoff;

    SignalInput videoSensor;
    SignalInput videoButton;
    SignalInput doorButton;
    SignalInput doorSensor;
    RelayControl relay;
    RelayControl videoRequest;

    SignalChannel channels[SIGNAL_COUNT];
    ComponentInfo components[SIGNAL_COUNT + 3];
    size_t componentCount;

    char availabilityTopic[EVENT_TOPIC_MAX_LEN];
    char openerCommandTopic[EVENT_TOPIC_MAX_LEN];
    char videoRequestCommandTopic[EVENT_TOPIC_MAX_LEN];
    char restartCommandTopic[EVENT_TOPIC_MAX_LEN];
    char discoveryBuffer[DISCOVERY_PAYLOAD_MAX_LEN];

    bool started;
    bool stopped;
    bool connected;
    bool restartRequested;
    bool videoRequestActive;

    bool buildTopics();
    void pollInputs(uint32_t now);
    void maintainConnection(uint32_t now);
    bool isOutputPulsing() const;
    void onConnected(uint32_t now);
    void processEvents(uint32_t now);
    void handleInputChanged(const BusEvent& event, uint32_t now);
    void handleMessage(const BusEvent& event, uint32_t now);
    void resyncStates(uint32_t now);

    void startVideoRequest(uint32_t now);
    void updateVideoRequest(uint32_t now);
    void restoreVideoButton(uint32_t now);

    bool publishState(SignalChannel& channel, uint32_t now);
    void publishAvailability(const char* payload);
    void publishDiscovery();
};

#endif
