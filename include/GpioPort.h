#ifndef GPIOPORT_H
#define GPIOPORT_H

#include <stdint.h>

// Pin access used by SignalInput and RelayControl.
// Levels are electrical: true = HIGH, false = LOW.
class GpioPort {
public:
    virtual ~GpioPort() {}

    virtual bool configureInput(uint8_t pin, bool pullUp) = 0;
    virtual bool configureOutput(uint8_t pin, bool initialLevel) = 0;
    virtual bool read(uint8_t pin) = 0;
    virtual bool write(uint8_t pin, bool level) = 0;
};

#endif
