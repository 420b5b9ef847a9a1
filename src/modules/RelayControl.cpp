#include "RelayControl.h"
#include "Log.h"

#define RELEASE_ATTEMPTS 3

RelayControl::RelayControl(GpioPort& gpio, uint8_t pin, bool activeLow, uint32_t pulseMs)
    : gpio(gpio), pin(pin), activeLow(activeLow), pulseMs(pulseMs),
      state(State::Idle), pulseStart(0), energized(false) {
}

bool RelayControl::begin() {
    // Start released
    bool releasedLevel = activeLow;
    if (!gpio.configureOutput(pin, releasedLevel)) {
        return false;
    }
    energized = false;
    state = State::Idle;
    return true;
}

bool RelayControl::trigger(uint32_t now) {
    if (state == State::Pulsing) {
        logInfo("RELAY", "Pulse in progress, trigger ignored");
        return false;
    }

    if (!setState(true)) {
        logError("RELAY", "Failed to energize relay on pin %u", pin);
        setState(false);
        return false;
    }

    pulseStart = now;
    state = State::Pulsing;
    logInfo("RELAY", "Pin %u energized for %lu ms", pin, (unsigned long)pulseMs);
    return true;
}

void RelayControl::update(uint32_t now) {
    if (state != State::Pulsing) {
        return;
    }

    uint32_t elapsed = now - pulseStart;
    if (elapsed < pulseMs) {
        return;
    }

    if (!setState(false)) {
        // Stay in Pulsing so the next tick retries the release
        logError("RELAY", "Failed to release relay on pin %u, retrying", pin);
        return;
    }

    state = State::Idle;
    logInfo("RELAY", "Pin %u released after %lu ms", pin, (unsigned long)elapsed);
}

void RelayControl::release() {
    bool wasPulsing = (state == State::Pulsing);

    bool released = false;
    for (int attempt = 0; attempt < RELEASE_ATTEMPTS && !released; attempt++) {
        released = setState(false);
    }

    state = State::Idle;

    if (!released) {
        logError("RELAY", "Relay on pin %u could not be released", pin);
    } else if (wasPulsing) {
        logWarn("RELAY", "Pulse aborted, relay released");
    }
}

RelayControl::State RelayControl::getState() const {
    return state;
}

bool RelayControl::isPulsing() const {
    return state == State::Pulsing;
}

bool RelayControl::isEnergized() const {
    return energized;
}

uint32_t RelayControl::getPulseDuration() const {
    return pulseMs;
}

bool RelayControl::setState(bool on) {
    bool level = on ? !activeLow : activeLow;
    if (!gpio.write(pin, level)) {
        return false;
    }
    energized = on;
    return true;
}
