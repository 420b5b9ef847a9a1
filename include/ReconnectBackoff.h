#ifndef RECONNECTBACKOFF_H
#define RECONNECTBACKOFF_H

#include <stdint.h>

// Schedules connection attempts: the first one immediately, then with a
// delay doubling after every failure up to maxDelayMs.
class ReconnectBackoff {
public:
    ReconnectBackoff(uint32_t minDelayMs, uint32_t maxDelayMs);

    bool isDue(uint32_t now) const;
    void recordFailure(uint32_t now);
    void reset();

    uint32_t getCurrentDelay() const;
    uint32_t getFailureCount() const;

private:
    uint32_t minDelayMs;
    uint32_t maxDelayMs;
    uint32_t currentDelayMs;
    uint32_t lastAttempt;
    uint32_t failures;
};

#endif
