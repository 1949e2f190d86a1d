#include <gtest/gtest.h>
#include "crypto/random.hpp"
#include "padlock/error.hpp"
#include "scripted_byte_source.hpp"
#include <cmath>
#include <vector>

using namespace padlock;
using namespace padlock::crypto;
using padlock::test_support::ScriptedByteSource;

TEST(UniformSamplerTest, SampleByteReturnsScriptedValue) {
    ScriptedByteSource source({0x00, 0x7f, 0xff});
    UniformSampler sampler(source);

    EXPECT_EQ(sampler.sample_byte(), 0);
    EXPECT_EQ(sampler.sample_byte(), 127);
    EXPECT_EQ(sampler.sample_byte(), 255);
}

TEST(UniformSamplerTest, RejectsDrawsAboveAcceptBound) {
    // range 3: accept bound is 85 * 3 = 255, so 255 must be redrawn
    ScriptedByteSource source({255, 254});
    UniformSampler sampler(source);

    EXPECT_EQ(sampler.random_int(3), 254 % 3);
    EXPECT_EQ(source.consumed(), 2u);
}

TEST(UniformSamplerTest, RejectsWholeBiasedTail) {
    // range 129: accept bound is 129, draws 129..255 are all rejected
    ScriptedByteSource source({129, 200, 255, 128});
    UniformSampler sampler(source);

    EXPECT_EQ(sampler.random_int(129), 128);
    EXPECT_EQ(source.consumed(), 4u);
}

TEST(UniformSamplerTest, ReducesAcceptedDrawModuloRange) {
    ScriptedByteSource source({10, 249});
    UniformSampler sampler(source);

    // range 10: accept bound is 250
    EXPECT_EQ(sampler.random_int(10), 0);
    EXPECT_EQ(sampler.random_int(10), 9);
}

TEST(UniformSamplerTest, RangeOneAlwaysReturnsZero) {
    ScriptedByteSource source({0, 1, 128, 255});
    UniformSampler sampler(source);

    for (int i = 0; i < 4; ++i) {
        EXPECT_EQ(sampler.random_int(1), 0);
    }
    EXPECT_EQ(source.consumed(), 4u);
}

TEST(UniformSamplerTest, Range256NeverRejects) {
    ScriptedByteSource source({255});
    UniformSampler sampler(source);

    EXPECT_EQ(sampler.random_int(256), 255);
}

TEST(UniformSamplerTest, RangeAboveMaximumIsOutOfRange) {
    ScriptedByteSource source(bytes{});
    UniformSampler sampler(source);

    try {
        sampler.random_int(257);
        FAIL() << "expected PadlockException";
    } catch (const PadlockException& e) {
        EXPECT_EQ(e.code(), ErrorCode::OutOfRange);
        EXPECT_STREQ(e.what(), "Range cannot be more than 256");
    }
    EXPECT_EQ(source.consumed(), 0u);
}

TEST(UniformSamplerTest, NonPositiveRangeIsInvalidArgument) {
    ScriptedByteSource source(bytes{});
    UniformSampler sampler(source);

    for (int range : {0, -1, -256}) {
        try {
            sampler.random_int(range);
            FAIL() << "expected PadlockException for range " << range;
        } catch (const PadlockException& e) {
            EXPECT_EQ(e.code(), ErrorCode::InvalidArgument);
        }
    }
    EXPECT_EQ(source.consumed(), 0u);
}

TEST(UniformSamplerTest, SystemSourceBoundaries) {
    UniformSampler sampler;

    EXPECT_THROW(sampler.random_int(257), PadlockException);
    for (int i = 0; i < 100; ++i) {
        int value = sampler.random_int(256);
        EXPECT_GE(value, 0);
        EXPECT_LT(value, 256);
    }
}

// Upper-tail chi-squared critical value via the Wilson-Hilferty approximation.
// z = 4.75 corresponds to p ~ 1e-6.
static double chi_squared_critical(double df, double z = 4.75) {
    const double a = 2.0 / (9.0 * df);
    const double t = 1.0 - a + z * std::sqrt(a);
    return df * t * t * t;
}

// Chi-squared goodness of fit against the uniform distribution on [0, range)
class UniformityTest : public ::testing::TestWithParam<int> {};

TEST_P(UniformityTest, ChiSquaredWithinTolerance) {
    const int range = GetParam();
    const int samples = 100000;

    UniformSampler sampler;
    std::vector<int> counts(range, 0);
    for (int i = 0; i < samples; ++i) {
        int value = sampler.random_int(range);
        ASSERT_GE(value, 0);
        ASSERT_LT(value, range);
        ++counts[value];
    }

    const double expected = static_cast<double>(samples) / range;
    double chi_squared = 0.0;
    for (int count : counts) {
        double diff = count - expected;
        chi_squared += diff * diff / expected;
    }

    const double df = range - 1;
    EXPECT_LT(chi_squared, chi_squared_critical(df))
        << "range=" << range;
}

INSTANTIATE_TEST_SUITE_P(Ranges, UniformityTest,
                         ::testing::Values(2, 3, 5, 7, 13, 255, 256));

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
