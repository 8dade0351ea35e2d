#include <gtest/gtest.h>

#include <chrono>

#include "lw/watch/backoff.hpp"

using lw::watch::Backoff;
using namespace std::chrono_literals;

TEST(BackoffTest, DoublesUpToMaximum) {
    Backoff backoff(1ms, 10ms);
    EXPECT_EQ(backoff.advance(), 1ms);
    EXPECT_EQ(backoff.advance(), 2ms);
    EXPECT_EQ(backoff.advance(), 4ms);
    EXPECT_EQ(backoff.advance(), 8ms);
    EXPECT_EQ(backoff.advance(), 10ms);
    EXPECT_EQ(backoff.advance(), 10ms);
    EXPECT_EQ(backoff.current(), 10ms);
}

TEST(BackoffTest, ResetReturnsToInitialDelay) {
    Backoff backoff(5ms, 1000ms);
    backoff.advance();
    backoff.advance();
    EXPECT_EQ(backoff.current(), 20ms);

    backoff.reset();
    EXPECT_EQ(backoff.current(), 5ms);
    EXPECT_EQ(backoff.advance(), 5ms);
}

TEST(BackoffTest, ZeroInitialDelayIsRaisedToOneMillisecond) {
    Backoff backoff(0ms, 4ms);
    EXPECT_EQ(backoff.advance(), 1ms);
    EXPECT_EQ(backoff.advance(), 2ms);
}

TEST(BackoffTest, MaximumBelowInitialPinsDelay) {
    Backoff backoff(50ms, 10ms);
    EXPECT_EQ(backoff.advance(), 50ms);
    EXPECT_EQ(backoff.advance(), 50ms);
}
