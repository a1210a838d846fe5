#include <gtest/gtest.h>

#include "arank/math/preference_model.hpp"
#include "arank/math/random.hpp"

using namespace arank::math;

// ---------------------------------------------------------------------------
// sigmoid / winProbability
// ---------------------------------------------------------------------------

TEST(PreferenceModelTest, HalfAtZero) {
    EXPECT_DOUBLE_EQ(sigmoid(0.0), 0.5);
    EXPECT_DOUBLE_EQ(winProbability(1.3, 1.3), 0.5);
}

TEST(PreferenceModelTest, Saturates) {
    EXPECT_GT(sigmoid(20.0), 0.999999);
    EXPECT_LT(sigmoid(-20.0), 1e-6);
}

TEST(PreferenceModelTest, Symmetric) {
    for (double x : {-7.5, -2.0, -0.3, 0.1, 1.0, 4.2, 12.0}) {
        EXPECT_NEAR(sigmoid(x) + sigmoid(-x), 1.0, 1e-15) << "x=" << x;
    }
}

TEST(PreferenceModelTest, StrictlyIncreasing) {
    double prev = sigmoid(-10.0);
    for (double x = -9.5; x <= 10.0; x += 0.5) {
        double cur = sigmoid(x);
        EXPECT_GT(cur, prev) << "x=" << x;
        prev = cur;
    }
}

TEST(PreferenceModelTest, DependsOnlyOnDifference) {
    EXPECT_DOUBLE_EQ(winProbability(2.0, 1.0), sigmoid(1.0));
    EXPECT_NEAR(winProbability(5.0, 4.0), winProbability(1.0, 0.0), 1e-15);
}

// ---------------------------------------------------------------------------
// Random source
// ---------------------------------------------------------------------------

TEST(Xorshift32Test, ZeroSeedIsRemapped) {
    Xorshift32 zero(0);
    Xorshift32 one(1);
    EXPECT_EQ(zero.state(), 1u);
    EXPECT_DOUBLE_EQ(zero.next(), one.next());
}

TEST(Xorshift32Test, UniformsStayInsideUnitInterval) {
    Xorshift32 rng(42);
    for (int i = 0; i < 10000; ++i) {
        double u = rng.next();
        ASSERT_GT(u, 0.0);
        ASSERT_LT(u, 1.0);
    }
}

TEST(Xorshift32Test, SameSeedSameStream) {
    Xorshift32 a(1234);
    Xorshift32 b(1234);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(a.next(), b.next());
    }
}

TEST(BoxMullerTest, RoughlyStandardNormal) {
    Xorshift32 rng(7);
    constexpr int kDraws = 20000;
    double sum = 0.0;
    double sumSq = 0.0;
    for (int i = 0; i < kDraws; ++i) {
        double z = boxMuller(rng);
        sum += z;
        sumSq += z * z;
    }
    double mean = sum / kDraws;
    double var = sumSq / kDraws - mean * mean;
    EXPECT_NEAR(mean, 0.0, 0.05);
    EXPECT_NEAR(var, 1.0, 0.05);
}

TEST(DeriveSeedTest, DeterministicAndRoundDependent) {
    EXPECT_EQ(deriveSeed(0, 5), deriveSeed(0, 5));
    EXPECT_NE(deriveSeed(0, 5), deriveSeed(0, 6));
    EXPECT_NE(deriveSeed(1, 5), deriveSeed(2, 5));
    // fmix32 maps 0 to 0; Xorshift32 remaps that seed.
    EXPECT_EQ(deriveSeed(0, 0), 0u);
}
