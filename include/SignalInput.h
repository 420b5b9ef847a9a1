#ifndef SIGNALINPUT_H
#define SIGNALINPUT_H

#include <stdint.h>
#include "GpioPort.h"

// Debounced digital input. With pull-up wiring the signal is active LOW,
// otherwise active HIGH.
class SignalInput {
public:
    SignalInput(GpioPort& gpio, uint8_t pin, bool pullUp, uint16_t debounceMs);

    bool begin(uint32_t now);

    // Samples the pin. Returns true when the debounced state changed.
    bool poll(uint32_t now);

    bool isActive() const;
    uint8_t getPin() const;

private:
    GpioPort& gpio;
    uint8_t pin;
    bool pullUp;
    uint16_t debounceMs;
    uint32_t lastChangeTime;
    bool lastReading;
    bool stableState;

    bool readActive();
};

#endif
