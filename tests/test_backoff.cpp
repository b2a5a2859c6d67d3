#include <gtest/gtest.h>
#include <core/backoff.hpp>

using std::chrono::milliseconds;

TEST(Backoff, ExponentialDoublesFromInitial) {
    BackoffPolicy p(BackoffPolicy::Mode::Exponential, milliseconds(1000), milliseconds(30000), 0);
    EXPECT_EQ(p.delay_for(1).count(), 1000);
    EXPECT_EQ(p.delay_for(2).count(), 2000);
    EXPECT_EQ(p.delay_for(3).count(), 4000);
    EXPECT_EQ(p.delay_for(4).count(), 8000);
}

TEST(Backoff, ExponentialCapsAtMax) {
    BackoffPolicy p(BackoffPolicy::Mode::Exponential, milliseconds(1000), milliseconds(5000), 0);
    EXPECT_EQ(p.delay_for(3).count(), 4000);
    EXPECT_EQ(p.delay_for(4).count(), 5000);
    EXPECT_EQ(p.delay_for(60).count(), 5000);
}

TEST(Backoff, FixedIgnoresRetryNumber) {
    BackoffPolicy p(BackoffPolicy::Mode::Fixed, milliseconds(2000), milliseconds(30000), 0);
    EXPECT_EQ(p.delay_for(1).count(), 2000);
    EXPECT_EQ(p.delay_for(7).count(), 2000);
}

TEST(Backoff, ZeroMaxRetriesNeverExhausts) {
    BackoffPolicy p(BackoffPolicy::Mode::Exponential, milliseconds(0), milliseconds(0), 0);
    EXPECT_FALSE(p.exhausted(1));
    EXPECT_FALSE(p.exhausted(100000));
}

TEST(Backoff, ExhaustedAfterBudgetSpent) {
    BackoffPolicy p(BackoffPolicy::Mode::Exponential, milliseconds(1000), milliseconds(30000), 2);
    EXPECT_FALSE(p.exhausted(1));
    EXPECT_FALSE(p.exhausted(2));
    EXPECT_TRUE(p.exhausted(3));
}

TEST(Backoff, FromConfigFixedPinsMaxToInitial) {
    ReconnectionConfig rc;
    rc.use_exponential_backoff = false;
    rc.initial_delay_secs = 3;
    rc.max_delay_secs = 60;
    rc.max_retries = 5;

    auto p = BackoffPolicy::from_config(rc);
    EXPECT_EQ(p.mode(), BackoffPolicy::Mode::Fixed);
    EXPECT_EQ(p.delay_for(4).count(), 3000);
    EXPECT_EQ(p.max_delay().count(), 3000);
    EXPECT_EQ(p.max_retries(), 5);
}

TEST(Backoff, FromConfigDefaults) {
    auto p = BackoffPolicy::from_config(ReconnectionConfig{});
    EXPECT_EQ(p.mode(), BackoffPolicy::Mode::Exponential);
    EXPECT_EQ(p.initial_delay().count(), 1000);
    EXPECT_EQ(p.max_delay().count(), 30000);
    EXPECT_EQ(p.max_retries(), 0);
}

TEST(Backoff, MaxBelowInitialIsRaised) {
    BackoffPolicy p(BackoffPolicy::Mode::Exponential, milliseconds(4000), milliseconds(1000), 0);
    EXPECT_EQ(p.delay_for(1).count(), 4000);
    EXPECT_EQ(p.delay_for(2).count(), 4000);
}
