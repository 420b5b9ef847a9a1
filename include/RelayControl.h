#ifndef RELAYCONTROL_H
#define RELAYCONTROL_H

#include <stdint.h>
#include "GpioPort.h"

// Output driven as a fixed-length pulse (door relay, video request line).
// Idle -> Pulsing on trigger(), Pulsing -> Idle once the pulse elapsed.
// Triggers while Pulsing are ignored.
class RelayControl {
public:
    enum class State : uint8_t {
        Idle,
        Pulsing
    };

    RelayControl(GpioPort& gpio, uint8_t pin, bool activeLow, uint32_t pulseMs);
    bool begin();

    bool trigger(uint32_t now);
    void update(uint32_t now);

    // Forces Idle with the relay released. Safe to call from any state.
    void release();

    State getState() const;
    bool isPulsing() const;
    bool isEnergized() const;
    uint32_t getPulseDuration() const;

private:
    GpioPort& gpio;
    uint8_t pin;
    bool activeLow;
    uint32_t pulseMs;
    volatile State state;
    uint32_t pulseStart;
    bool energized;

    bool setState(bool on);
};

#endif
