#ifndef ARDUINOGPIO_H
#define ARDUINOGPIO_H

#include <Arduino.h>
#include "GpioPort.h"

class ArduinoGpio : public GpioPort {
public:
    bool configureInput(uint8_t pin, bool pullUp) override;
    bool configureOutput(uint8_t pin, bool initialLevel) override;
    bool read(uint8_t pin) override;
    bool write(uint8_t pin, bool level) override;
};

#endif
