#include <gtest/gtest.h>
#include "ReconnectBackoff.h"

TEST(ReconnectBackoffTest, FirstAttemptIsImmediate) {
    ReconnectBackoff backoff(1000, 30000);
    EXPECT_TRUE(backoff.isDue(0));
    EXPECT_EQ(0u, backoff.getFailureCount());
}

TEST(ReconnectBackoffTest, DelayDoublesUpToMaximum) {
    ReconnectBackoff backoff(1000, 30000);
    const uint32_t expected[] = { 1000, 2000, 4000, 8000, 16000, 30000, 30000 };

    uint32_t now = 0;
    for (size_t i = 0; i < sizeof(expected) / sizeof(expected[0]); i++) {
        backoff.recordFailure(now);
        EXPECT_EQ(expected[i], backoff.getCurrentDelay());
        EXPECT_FALSE(backoff.isDue(now + expected[i] - 1));
        EXPECT_TRUE(backoff.isDue(now + expected[i]));
        now += expected[i];
    }
    EXPECT_EQ(7u, backoff.getFailureCount());
}

TEST(ReconnectBackoffTest, ResetAfterSuccess) {
    ReconnectBackoff backoff(1000, 30000);
    backoff.recordFailure(0);
    backoff.recordFailure(1000);
    backoff.reset();

    EXPECT_TRUE(backoff.isDue(1001));
    EXPECT_EQ(0u, backoff.getCurrentDelay());

    backoff.recordFailure(5000);
    EXPECT_EQ(1000u, backoff.getCurrentDelay());
}

TEST(ReconnectBackoffTest, HandlesMillisWraparound) {
    ReconnectBackoff backoff(1000, 30000);
    uint32_t now = 0xFFFFFE00u;
    backoff.recordFailure(now);

    EXPECT_FALSE(backoff.isDue(now + 999));
    EXPECT_TRUE(backoff.isDue(now + 1000));
}
