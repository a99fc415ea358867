#include <gtest/gtest.h>
#include "progress/RateEstimator.hpp"

using namespace LineGauge;
using std::chrono::milliseconds;
using std::chrono::seconds;

static const Clock::time_point t0 = Clock::time_point{} + seconds(1000);

TEST(RateEstimator, no_samples) {
    RateEstimator rate;
    EXPECT_EQ(0.0, rate.rate(t0));
    EXPECT_FALSE(rate.eta(10, t0).has_value());
}

TEST(RateEstimator, steady_rate) {
    RateEstimator rate;
    rate.record(0, t0);
    rate.record(50, t0 + seconds(10));
    EXPECT_DOUBLE_EQ(5.0, rate.rate(t0 + seconds(10)));
}

TEST(RateEstimator, eta_from_rate) {
    RateEstimator rate;
    rate.record(0, t0);
    rate.record(50, t0 + seconds(10));
    auto eta = rate.eta(50, t0 + seconds(10));
    ASSERT_TRUE(eta.has_value());
    EXPECT_DOUBLE_EQ(10.0, *eta);
}

TEST(RateEstimator, steady_between_samples) {
    RateEstimator rate;
    rate.record(0, t0);
    rate.record(50, t0 + seconds(10));
    EXPECT_DOUBLE_EQ(5.0, rate.rate(t0 + seconds(20)));
    EXPECT_DOUBLE_EQ(5.0, rate.rate(t0 + seconds(110)));

    auto eta = rate.eta(50, t0 + seconds(20));
    ASSERT_TRUE(eta.has_value());
    EXPECT_DOUBLE_EQ(10.0, *eta);
}

TEST(RateEstimator, nothing_remaining) {
    RateEstimator rate;
    rate.record(0, t0);
    auto eta = rate.eta(0, t0);
    ASSERT_TRUE(eta.has_value());
    EXPECT_EQ(0.0, *eta);
}

TEST(RateEstimator, too_little_time) {
    RateEstimator rate;
    rate.record(0, t0);
    rate.record(100, t0);
    EXPECT_EQ(0.0, rate.rate(t0));
    EXPECT_FALSE(rate.eta(5, t0).has_value());
}

TEST(RateEstimator, stalled) {
    RateEstimator rate;
    rate.record(10, t0);
    rate.record(10, t0 + seconds(5));
    EXPECT_EQ(0.0, rate.rate(t0 + seconds(5)));
    EXPECT_FALSE(rate.eta(5, t0 + seconds(5)).has_value());
}

TEST(RateEstimator, window_drops_old_samples) {
    RateEstimator rate(4);
    // slow start, then 10 items per second
    rate.record(0, t0);
    rate.record(1, t0 + seconds(10));
    for (int i = 1; i <= 4; i++) {
        rate.record(1 + i * 10, t0 + seconds(10 + i));
    }
    EXPECT_EQ(4, rate.samples());
    EXPECT_DOUBLE_EQ(10.0, rate.rate(t0 + seconds(14)));
}

TEST(RateEstimator, reset) {
    RateEstimator rate;
    rate.record(0, t0);
    rate.record(10, t0 + milliseconds(500));
    rate.reset();
    EXPECT_EQ(0, rate.samples());
    EXPECT_EQ(0.0, rate.rate(t0 + seconds(1)));
}
