#include "DoorbellAdapter.h"
#include "Log.h"
#include <string.h>

static const ComponentInfo SIGNAL_COMPONENTS[SIGNAL_COUNT] = {
    { "Video Sensor", "video_sensor", "video_sensor", "binary_sensor" },
    { "Video Button", "video_button", "video_button", "binary_sensor" },
    { "Door Button",  "door_button",  "door_button",  "binary_sensor" },
    { "Door Sensor",  "door_sensor",  "door_sensor",  "binary_sensor" }
};

static const ComponentInfo DOOR_OPENER_COMPONENT = { "Door Opener", "door_opener", "door_opener", "button" };
static const ComponentInfo VIDEO_REQUEST_COMPONENT = { "Video Request", "video_request", "video_button", "button" };
static const ComponentInfo RESTART_COMPONENT = { "Restart", "restart", "restart", "button" };

static uint8_t pinOrZero(int8_t pin) {
    return pin < 0 ? 0 : (uint8_t)pin;
}

DoorbellAdapter::DoorbellAdapter(const DoorbellConfiguration& configuration, GpioPort& gpio, MessageBus& bus)
    : config(configuration), bus(bus), discovery(config),
      backoff(MQTT_RECONNECT_MIN_MS, MQTT_RECONNECT_MAX_MS),
      videoSensor(gpio, pinOrZero(configuration.video_sensor_pin), configuration.input_pull_up, configuration.debounce_ms),
      videoButton(gpio, pinOrZero(configuration.video_button_pin), configuration.input_pull_up, configuration.debounce_ms),
      doorButton(gpio, pinOrZero(configuration.door_button_pin), configuration.input_pull_up, configuration.debounce_ms),
      doorSensor(gpio, pinOrZero(configuration.door_sensor_pin), configuration.input_pull_up, configuration.debounce_ms),
      relay(gpio, pinOrZero(configuration.relay_pin), configuration.relay_active_low, configuration.pulse_duration_ms),
      videoRequest(gpio, pinOrZero(configuration.video_button_pin), true, VIDEO_REQUEST_PULSE_MS),
      componentCount(0), started(false), stopped(false), connected(false), restartRequested(false),
      videoRequestActive(false) {

    SignalInput* inputs[SIGNAL_COUNT] = { &videoSensor, &videoButton, &doorButton, &doorSensor };

    for (uint8_t i = 0; i < SIGNAL_COUNT; i++) {
        SignalChannel& channel = channels[i];
        channel.info = &SIGNAL_COMPONENTS[i];
        channel.input = inputs[i];
        channel.enabled = true;
        channel.currentState = false;
        channel.lastReportedState = false;
        channel.reported = false;
        channel.lastPublishAttempt = 0;
        channel.stateTopic[0] = '\0';
    }
    channels[(uint8_t)SignalId::DoorButton].enabled = (configuration.door_button_pin >= 0);
    channels[(uint8_t)SignalId::DoorSensor].enabled = (configuration.door_sensor_pin >= 0);

    availabilityTopic[0] = '\0';
    openerCommandTopic[0] = '\0';
    videoRequestCommandTopic[0] = '\0';
    restartCommandTopic[0] = '\0';
}

bool DoorbellAdapter::begin(uint32_t now) {
    if (started) {
        logWarn("DOORBELL", "Already started");
        return true;
    }

    // Relay first, so it is released as early as possible
    if (!relay.begin()) {
        logError("DOORBELL", "Relay pin %d unusable", config.relay_pin);
        return false;
    }

    for (uint8_t i = 0; i < SIGNAL_COUNT; i++) {
        SignalChannel& channel = channels[i];
        if (!channel.enabled) {
            logInfo("DOORBELL", "%s not wired, skipped", channel.info->name);
            continue;
        }
        if (!channel.input->begin(now)) {
            logError("DOORBELL", "%s pin %u unusable", channel.info->name, channel.input->getPin());
            return false;
        }
        channel.currentState = channel.input->isActive();
        logInfo("DOORBELL", "%s on GPIO %u, initial state %s", channel.info->name,
                channel.input->getPin(), channel.currentState ? PAYLOAD_ON : PAYLOAD_OFF);
    }

    if (!buildTopics()) {
        return false;
    }

    bus.setInbox(&queue);
    started = true;

    logInfo("DOORBELL", "Relay on GPIO %d, pulse %lu ms, debounce %u ms", config.relay_pin,
            (unsigned long)config.pulse_duration_ms, config.debounce_ms);
    return true;
}

bool DoorbellAdapter::buildTopics() {
    bool ok = discovery.deviceAvailabilityTopic(availabilityTopic, sizeof(availabilityTopic));
    ok = discovery.componentTopic(openerCommandTopic, sizeof(openerCommandTopic),
                                  DOOR_OPENER_COMPONENT.topicId, TOPIC_SUB_COMMAND) && ok;
    ok = discovery.componentTopic(videoRequestCommandTopic, sizeof(videoRequestCommandTopic),
                                  VIDEO_REQUEST_COMPONENT.topicId, TOPIC_SUB_COMMAND) && ok;
    ok = discovery.componentTopic(restartCommandTopic, sizeof(restartCommandTopic),
                                  RESTART_COMPONENT.topicId, TOPIC_SUB_COMMAND) && ok;

    componentCount = 0;
    for (uint8_t i = 0; i < SIGNAL_COUNT; i++) {
        SignalChannel& channel = channels[i];
        if (!channel.enabled) {
            continue;
        }
        ok = discovery.componentTopic(channel.stateTopic, sizeof(channel.stateTopic),
                                      channel.info->topicId, TOPIC_SUB_STATE) && ok;
        components[componentCount++] = *channel.info;
    }
    components[componentCount++] = DOOR_OPENER_COMPONENT;
    components[componentCount++] = VIDEO_REQUEST_COMPONENT;
    components[componentCount++] = RESTART_COMPONENT;

    if (!ok) {
        logError("DOORBELL", "Topic prefix '%s' too long", config.topic_prefix);
    }
    return ok;
}

void DoorbellAdapter::update(uint32_t now) {
    if (!started || stopped) {
        return;
    }

    // Pulse timer runs before anything else and is never reset by events
    relay.update(now);
    updateVideoRequest(now);

    pollInputs(now);
    maintainConnection(now);
    processEvents(now);
    resyncStates(now);
}

void DoorbellAdapter::pollInputs(uint32_t now) {
    for (uint8_t i = 0; i < SIGNAL_COUNT; i++) {
        SignalChannel& channel = channels[i];
        if (!channel.enabled) {
            continue;
        }
        // The line is being driven by a video request
        if (videoRequestActive && channel.input == &videoButton) {
            continue;
        }
        if (!channel.input->poll(now)) {
            continue;
        }
        if (!queue.pushInput((SignalId)i, channel.input->isActive(), now)) {
            // Queue full: keep the level so the resync sweep reports it
            channel.currentState = channel.input->isActive();
        }
    }
}

void DoorbellAdapter::maintainConnection(uint32_t now) {
    if (connected) {
        bus.loop();
        if (bus.isConnected()) {
            return;
        }
        connected = false;
        logWarn("DOORBELL", "Broker connection lost, states will be republished on reconnect");
    }

    if (!backoff.isDue(now)) {
        return;
    }

    // A connect attempt can block for seconds, so never start one while a pulse is running
    if (isOutputPulsing()) {
        logDebug("DOORBELL", "Pulse in progress, connect deferred");
        return;
    }

    if (!bus.connect(availabilityTopic, PAYLOAD_OFFLINE)) {
        backoff.recordFailure(now);
        logInfo("DOORBELL", "Broker unreachable, next attempt in %lu ms",
                (unsigned long)backoff.getCurrentDelay());
        return;
    }

    connected = true;
    backoff.reset();
    onConnected(now);
}

bool DoorbellAdapter::isOutputPulsing() const {
    return relay.isPulsing() || videoRequestActive;
}

void DoorbellAdapter::onConnected(uint32_t now) {
    const char* commandTopics[] = { openerCommandTopic, videoRequestCommandTopic, restartCommandTopic };
    for (size_t i = 0; i < sizeof(commandTopics) / sizeof(commandTopics[0]); i++) {
        if (!bus.subscribe(commandTopics[i])) {
            logError("DOORBELL", "Subscribe to %s failed", commandTopics[i]);
        } else {
            logInfo("DOORBELL", "Subscribed to %s", commandTopics[i]);
        }
    }

    publishDiscovery();
    publishAvailability(PAYLOAD_ONLINE);

    // Current-value semantics: whatever happened while offline, send what is true now
    for (uint8_t i = 0; i < SIGNAL_COUNT; i++) {
        if (channels[i].enabled) {
            publishState(channels[i], now);
        }
    }
}

void DoorbellAdapter::processEvents(uint32_t now) {
    BusEvent event;
    while (queue.pop(event)) {
        switch (event.type) {
            case BusEventType::InputChanged:
                handleInputChanged(event, now);
                break;
            case BusEventType::Message:
                handleMessage(event, now);
                break;
        }
    }
}

void DoorbellAdapter::handleInputChanged(const BusEvent& event, uint32_t now) {
    if (event.signal >= SignalId::Count) {
        return;
    }

    SignalChannel& channel = channels[(uint8_t)event.signal];
    channel.currentState = event.level;
    logInfo("DOORBELL", "%s %s", channel.info->name, event.level ? PAYLOAD_ON : PAYLOAD_OFF);

    if (channel.reported && channel.currentState == channel.lastReportedState) {
        return;
    }

    if (!connected) {
        logDebug("DOORBELL", "Offline, %s will be published on reconnect", channel.info->name);
        return;
    }

    publishState(channel, now);
}

void DoorbellAdapter::handleMessage(const BusEvent& event, uint32_t now) {
    logDebug("DOORBELL", "Received %s on %s", event.payload, event.topic);

    if (strcmp(event.topic, openerCommandTopic) == 0) {
        if (strcmp(event.payload, PAYLOAD_PRESS) != 0) {
            logWarn("DOORBELL", "Unknown door opener command: %s", event.payload);
            return;
        }
        logInfo("DOORBELL", "Door open requested");
        relay.trigger(now);
        return;
    }

    if (strcmp(event.topic, videoRequestCommandTopic) == 0) {
        if (strcmp(event.payload, PAYLOAD_PRESS) != 0) {
            logWarn("DOORBELL", "Unknown video request command: %s", event.payload);
            return;
        }
        startVideoRequest(now);
        return;
    }

    if (strcmp(event.topic, restartCommandTopic) == 0) {
        if (strcmp(event.payload, PAYLOAD_PRESS) != 0) {
            logWarn("DOORBELL", "Unknown restart command: %s", event.payload);
            return;
        }
        logInfo("DOORBELL", "Restart requested");
        restartRequested = true;
        return;
    }

    logDebug("DOORBELL", "No handler for %s", event.topic);
}

void DoorbellAdapter::startVideoRequest(uint32_t now) {
    if (videoRequestActive) {
        logInfo("DOORBELL", "Video request in progress, ignored");
        return;
    }

    logInfo("DOORBELL", "Video requested on GPIO %d", config.video_button_pin);

    if (!videoRequest.begin()) {
        logError("DOORBELL", "Video button pin %d cannot be driven", config.video_button_pin);
        restoreVideoButton(now);
        return;
    }
    videoRequestActive = true;

    if (!videoRequest.trigger(now)) {
        videoRequestActive = false;
        restoreVideoButton(now);
    }
}

void DoorbellAdapter::updateVideoRequest(uint32_t now) {
    if (!videoRequestActive) {
        return;
    }

    videoRequest.update(now);
    if (videoRequest.isPulsing()) {
        return;
    }

    videoRequestActive = false;
    restoreVideoButton(now);
}

void DoorbellAdapter::restoreVideoButton(uint32_t now) {
    SignalChannel& channel = channels[(uint8_t)SignalId::VideoButton];
    if (!channel.input->begin(now)) {
        logError("DOORBELL", "Video button pin %u could not be switched back to input", channel.input->getPin());
        channel.enabled = false;
        return;
    }
    // Anything that changed meanwhile is picked up by the resync sweep
    channel.currentState = channel.input->isActive();
}

void DoorbellAdapter::resyncStates(uint32_t now) {
    if (!connected) {
        return;
    }

    for (uint8_t i = 0; i < SIGNAL_COUNT; i++) {
        SignalChannel& channel = channels[i];
        if (!channel.enabled) {
            continue;
        }
        if (channel.reported && channel.currentState == channel.lastReportedState) {
            continue;
        }
        if (now - channel.lastPublishAttempt < PUBLISH_RETRY_INTERVAL_MS) {
            continue;
        }
        logInfo("DOORBELL", "Retrying %s state", channel.info->name);
        publishState(channel, now);
    }
}

bool DoorbellAdapter::publishState(SignalChannel& channel, uint32_t now) {
    channel.lastPublishAttempt = now;
    bool state = channel.currentState;

    if (!bus.publish(channel.stateTopic, state ? PAYLOAD_ON : PAYLOAD_OFF, true)) {
        logWarn("DOORBELL", "Publish to %s failed", channel.stateTopic);
        return false;
    }

    channel.lastReportedState = state;
    channel.reported = true;
    logDebug("DOORBELL", "Published %s to %s", state ? PAYLOAD_ON : PAYLOAD_OFF, channel.stateTopic);
    return true;
}

void DoorbellAdapter::publishAvailability(const char* payload) {
    if (!bus.publish(availabilityTopic, payload, true)) {
        logWarn("DOORBELL", "Publish to %s failed", availabilityTopic);
    }

    char topic[EVENT_TOPIC_MAX_LEN];
    for (size_t i = 0; i < componentCount; i++) {
        // Shares the topic of the component owning the line
        if (strcmp(components[i].topicId, components[i].objectId) != 0) {
            continue;
        }
        if (!discovery.componentTopic(topic, sizeof(topic), components[i].topicId, TOPIC_SUB_AVAILABILITY)) {
            continue;
        }
        if (!bus.publish(topic, payload, true)) {
            logWarn("DOORBELL", "Publish to %s failed", topic);
        }
    }

    logInfo("DOORBELL", "Availability status published: %s", payload);
}

void DoorbellAdapter::publishDiscovery() {
    char topic[EVENT_TOPIC_MAX_LEN];
    if (!discovery.discoveryTopic(topic, sizeof(topic))) {
        return;
    }

    size_t length = discovery.buildPayload(discoveryBuffer, sizeof(discoveryBuffer), components, componentCount);
    if (length == 0) {
        logWarn("DOORBELL", "Discovery payload not published");
        return;
    }

    if (!bus.publish(topic, discoveryBuffer, true)) {
        logWarn("DOORBELL", "Discovery publish to %s failed", topic);
        return;
    }

    logInfo("DOORBELL", "Discovery payload published in topic %s (%u bytes)", topic, (unsigned)length);
}

void DoorbellAdapter::shutdown() {
    if (stopped) {
        return;
    }
    stopped = true;

    // Never leave the door relay energized
    relay.release();
    if (videoRequestActive) {
        videoRequest.release();
        videoRequestActive = false;
        restoreVideoButton(0);
    }

    if (connected && bus.isConnected()) {
        publishAvailability(PAYLOAD_OFFLINE);
        bool unsubscribed = bus.unsubscribe(openerCommandTopic);
        unsubscribed = bus.unsubscribe(videoRequestCommandTopic) && unsubscribed;
        unsubscribed = bus.unsubscribe(restartCommandTopic) && unsubscribed;
        if (!unsubscribed) {
            logWarn("DOORBELL", "Unsubscribe failed, disconnecting anyway");
        }
        bus.disconnect();
    }
    connected = false;
    queue.clear();

    logInfo("DOORBELL", "Shut down");
}

void DoorbellAdapter::releaseRelay() {
    relay.release();
    if (videoRequestActive) {
        videoRequest.release();
    }
}

bool DoorbellAdapter::isRestartRequested() const {
    return restartRequested;
}

bool DoorbellAdapter::isConnected() const {
    return connected;
}

bool DoorbellAdapter::isRelayPulsing() const {
    return relay.isPulsing();
}

bool DoorbellAdapter::isSignalEnabled(SignalId id) const {
    if (id >= SignalId::Count) {
        return false;
    }
    return channels[(uint8_t)id].enabled;
}

bool DoorbellAdapter::getSignalState(SignalId id) const {
    if (id >= SignalId::Count) {
        return false;
    }
    return channels[(uint8_t)id].currentState;
}

bool DoorbellAdapter::getReportedState(SignalId id, bool& outState) const {
    if (id >= SignalId::Count || !channels[(uint8_t)id].reported) {
        return false;
    }
    outState = channels[(uint8_t)id].lastReportedState;
    return true;
}

bool DoorbellAdapter::isVideoRequestActive() const {
    return videoRequestActive;
}
