/**
 * @file test_retry_backoff.cpp
 * @brief Unit tests for RetryBackoff
 */

#include <gtest/gtest.h>
#include <airvol/core/retry_backoff.hpp>

#include <chrono>
#include <vector>

using namespace airvol::core;
using std::chrono::milliseconds;

class RetryBackoffTest : public ::testing::Test {
protected:
    RetryPolicy policy_;
};

TEST_F(RetryBackoffTest, StartsAtMinimum) {
    RetryBackoff backoff(policy_, 1);
    EXPECT_EQ(backoff.current(), milliseconds(50));
}

TEST_F(RetryBackoffTest, DefaultSequence) {
    RetryBackoff backoff(policy_, 1);
    const std::vector<long long> expected = {50, 75, 112, 168, 252, 378, 567, 850, 1000, 1000};

    for (long long value : expected) {
        EXPECT_EQ(backoff.current().count(), value);
        backoff.advance();
    }
}

TEST_F(RetryBackoffTest, NonDecreasingAndBounded) {
    policy_.min_delay = milliseconds(10);
    policy_.max_delay = milliseconds(333);
    policy_.multiplier = 2.7;
    RetryBackoff backoff(policy_, 7);

    milliseconds previous = backoff.current();
    for (int i = 0; i < 50; ++i) {
        backoff.advance();
        EXPECT_GE(backoff.current(), previous);
        EXPECT_GE(backoff.current(), policy_.min_delay);
        EXPECT_LE(backoff.current(), policy_.max_delay);
        previous = backoff.current();
    }
    EXPECT_EQ(backoff.current(), milliseconds(333));
}

TEST_F(RetryBackoffTest, MultiplierBelowOneStaysAtMinimum) {
    policy_.multiplier = 0.5;
    RetryBackoff backoff(policy_, 1);
    backoff.advance();
    EXPECT_EQ(backoff.current(), policy_.min_delay);
}

TEST_F(RetryBackoffTest, ResetReturnsToMinimum) {
    RetryBackoff backoff(policy_, 1);
    for (int i = 0; i < 6; ++i) {
        backoff.advance();
    }
    ASSERT_GT(backoff.current(), policy_.min_delay);

    backoff.reset();
    EXPECT_EQ(backoff.current(), milliseconds(50));
}

TEST_F(RetryBackoffTest, JitterWithinBounds) {
    RetryBackoff backoff(policy_, 42);
    for (int i = 0; i < 5; ++i) {
        backoff.advance();
    }

    for (int i = 0; i < 500; ++i) {
        milliseconds d = backoff.sleepDuration();
        EXPECT_GE(d, backoff.current() - policy_.jitter);
        EXPECT_LE(d, backoff.current() + policy_.jitter);
    }
}

TEST_F(RetryBackoffTest, JitterNeverNegative) {
    policy_.min_delay = milliseconds(10);
    policy_.jitter = milliseconds(50);
    RetryBackoff backoff(policy_, 3);

    for (int i = 0; i < 500; ++i) {
        EXPECT_GE(backoff.sleepDuration(), milliseconds(0));
    }
}

TEST_F(RetryBackoffTest, ZeroJitterIsExact) {
    policy_.jitter = milliseconds(0);
    RetryBackoff backoff(policy_);
    EXPECT_EQ(backoff.sleepDuration(), milliseconds(50));
}

TEST_F(RetryBackoffTest, SameSeedSameJitter) {
    RetryBackoff a(policy_, 99);
    RetryBackoff b(policy_, 99);
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(a.sleepDuration(), b.sleepDuration());
    }
}

TEST_F(RetryBackoffTest, MaxBelowMinIsRaised) {
    policy_.min_delay = milliseconds(200);
    policy_.max_delay = milliseconds(100);
    RetryBackoff backoff(policy_, 1);

    EXPECT_EQ(backoff.policy().max_delay, milliseconds(200));
    backoff.advance();
    EXPECT_EQ(backoff.current(), milliseconds(200));
}
