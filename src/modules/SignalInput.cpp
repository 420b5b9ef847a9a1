#include "SignalInput.h"

SignalInput::SignalInput(GpioPort& gpio, uint8_t pin, bool pullUp, uint16_t debounceMs)
    : gpio(gpio), pin(pin), pullUp(pullUp), debounceMs(debounceMs),
      lastChangeTime(0), lastReading(false), stableState(false) {
}

bool SignalInput::begin(uint32_t now) {
    if (!gpio.configureInput(pin, pullUp)) {
        return false;
    }

    stableState = readActive();
    lastReading = stableState;
    lastChangeTime = now;
    return true;
}

bool SignalInput::poll(uint32_t now) {
    bool currentReading = readActive();

    // Detect raw change, restart the hold window
    if (currentReading != lastReading) {
        lastChangeTime = now;
        lastReading = currentReading;
    }

    // Debounce
    if (currentReading != stableState && now - lastChangeTime >= debounceMs) {
        stableState = currentReading;
        return true;
    }

    return false;
}

bool SignalInput::isActive() const {
    return stableState;
}

uint8_t SignalInput::getPin() const {
    return pin;
}

bool SignalInput::readActive() {
    bool level = gpio.read(pin);
    return pullUp ? !level : level;
}
