#include <gtest/gtest.h>

#include <stdexcept>

#include "fastpass/random_variates.hpp"

using namespace fastpass;

TEST(RandomVariateSource, SameSeedSameSequence) {
    RandomVariateSource a(12345), b(12345);
    for (int i = 0; i < 1000; ++i) {
        EXPECT_EQ(a.nextInterarrival(0.7), b.nextInterarrival(0.7));
        EXPECT_EQ(a.nextIsPriority(0.4), b.nextIsPriority(0.4));
        EXPECT_EQ(a.nextServiceTime(1.0), b.nextServiceTime(1.0));
    }
}

TEST(RandomVariateSource, DifferentSeedsDiverge) {
    RandomVariateSource a(1), b(2);
    int same = 0;
    for (int i = 0; i < 100; ++i)
        if (a.nextServiceTime(1.0) == b.nextServiceTime(1.0)) ++same;
    EXPECT_LT(same, 5);
}

TEST(RandomVariateSource, DrawsAreStrictlyPositive) {
    RandomVariateSource rng(7);
    for (int i = 0; i < 100000; ++i) {
        ASSERT_GT(rng.nextInterarrival(50.0), 0.0);
        ASSERT_GT(rng.nextServiceTime(0.01), 0.0);
    }
}

TEST(RandomVariateSource, ExponentialMeanMatchesRate) {
    RandomVariateSource rng(99);
    const int n = 200000;
    double sum = 0.0;
    for (int i = 0; i < n; ++i) sum += rng.nextInterarrival(0.5);
    EXPECT_NEAR(sum / n, 2.0, 0.05);
}

TEST(RandomVariateSource, BernoulliFrequency) {
    RandomVariateSource rng(5);
    const int n = 100000;
    int hits = 0;
    for (int i = 0; i < n; ++i)
        if (rng.nextIsPriority(0.3)) ++hits;
    EXPECT_NEAR(static_cast<double>(hits) / n, 0.3, 0.01);
}

TEST(RandomVariateSource, ZeroFractionNeverPriority) {
    RandomVariateSource rng(5);
    for (int i = 0; i < 10000; ++i) ASSERT_FALSE(rng.nextIsPriority(0.0));
}

TEST(RandomVariateSource, RejectsNonPositiveRate) {
    RandomVariateSource rng(1);
    EXPECT_THROW(rng.nextInterarrival(0.0), std::invalid_argument);
    EXPECT_THROW(rng.nextServiceTime(-1.0), std::invalid_argument);
}
