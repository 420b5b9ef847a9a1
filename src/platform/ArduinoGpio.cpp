#include "ArduinoGpio.h"
#include "Log.h"
#include <driver/gpio.h>

bool ArduinoGpio::configureInput(uint8_t pin, bool pullUp) {
    if (!digitalPinIsValid(pin)) {
        logError("GPIO", "Pin %u is not a valid GPIO", pin);
        return false;
    }

    pinMode(pin, pullUp ? INPUT_PULLUP : INPUT_PULLDOWN);
    return true;
}

bool ArduinoGpio::configureOutput(uint8_t pin, bool initialLevel) {
    if (!digitalPinCanOutput(pin)) {
        logError("GPIO", "Pin %u cannot be used as output", pin);
        return false;
    }

    // Latch the level before enabling the driver so the relay never glitches
    if (gpio_set_level((gpio_num_t)pin, initialLevel ? 1 : 0) != ESP_OK) {
        logError("GPIO", "Failed to preset level on pin %u", pin);
        return false;
    }
    pinMode(pin, OUTPUT);
    return write(pin, initialLevel);
}

bool ArduinoGpio::read(uint8_t pin) {
    return digitalRead(pin) == HIGH;
}

bool ArduinoGpio::write(uint8_t pin, bool level) {
    esp_err_t err = gpio_set_level((gpio_num_t)pin, level ? 1 : 0);
    if (err != ESP_OK) {
        logError("GPIO", "Write to pin %u failed: %s", pin, esp_err_to_name(err));
        return false;
    }
    return true;
}
