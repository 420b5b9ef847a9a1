#include "ReconnectBackoff.h"

ReconnectBackoff::ReconnectBackoff(uint32_t minDelayMs, uint32_t maxDelayMs)
    : minDelayMs(minDelayMs), maxDelayMs(maxDelayMs), currentDelayMs(0),
      lastAttempt(0), failures(0) {
}

bool ReconnectBackoff::isDue(uint32_t now) const {
    if (failures == 0) {
        return true;
    }
    return now - lastAttempt >= currentDelayMs;
}

void ReconnectBackoff::recordFailure(uint32_t now) {
    lastAttempt = now;
    failures++;

    if (currentDelayMs == 0) {
        currentDelayMs = minDelayMs;
    } else if (currentDelayMs < maxDelayMs) {
        currentDelayMs *= 2;
    }
    if (currentDelayMs > maxDelayMs) {
        currentDelayMs = maxDelayMs;
    }
}

void ReconnectBackoff::reset() {
    currentDelayMs = 0;
    failures = 0;
}

uint32_t ReconnectBackoff::getCurrentDelay() const {
    return currentDelayMs;
}

uint32_t ReconnectBackoff::getFailureCount() const {
    return failures;
}
