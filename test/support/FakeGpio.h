#ifndef FAKEGPIO_H
#define FAKEGPIO_H

#include <map>
#include <set>
#include "GpioPort.h"

// In-memory pins. setLevel() drives the external line seen by an input,
// level() reports what the pin shows: the driven level while it is an
// output, the external line otherwise.
class FakeGpio : public GpioPort {
public:
    FakeGpio() : writeCount(0), failWrites(false) {}

    bool configureInput(uint8_t pin, bool pullUp) override {
        if (badPins.count(pin)) {
            return false;
        }
        outputMode.erase(pin);
        inputs.insert(pin);
        if (pullUp && external.find(pin) == external.end()) {
            external[pin] = true;
        }
        return true;
    }

    bool configureOutput(uint8_t pin, bool initialLevel) override {
        if (badPins.count(pin)) {
            return false;
        }
        outputMode.insert(pin);
        outputs.insert(pin);
        driven[pin] = initialLevel;
        return true;
    }

    bool read(uint8_t pin) override {
        return level(pin);
    }

    bool write(uint8_t pin, bool value) override {
        if (failWrites) {
            return false;
        }
        writeCount++;
        driven[pin] = value;
        return true;
    }

    void setLevel(uint8_t pin, bool value) {
        external[pin] = value;
    }

    bool level(uint8_t pin) const {
        const std::map<uint8_t, bool>& source = outputMode.count(pin) ? driven : external;
        std::map<uint8_t, bool>::const_iterator it = source.find(pin);
        return it != source.end() && it->second;
    }

    // Ever configured that way
    bool isInput(uint8_t pin) const { return inputs.count(pin) > 0; }
    bool isOutput(uint8_t pin) const { return outputs.count(pin) > 0; }

    // Current direction
    bool isDrivenOutput(uint8_t pin) const { return outputMode.count(pin) > 0; }

    void rejectPin(uint8_t pin) { badPins.insert(pin); }

    int writeCount;
    bool failWrites;

private:
    std::map<uint8_t, bool> external;
    std::map<uint8_t, bool> driven;
    std::set<uint8_t> outputMode;
    std::set<uint8_t> inputs;
    std::set<uint8_t> outputs;
    std::set<uint8_t> badPins;
};

#endif
