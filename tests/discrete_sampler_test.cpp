#include <gtest/gtest.h>

#include <limits>
#include <numeric>
#include <random>
#include <stdexcept>
#include <vector>

#include "discrete_sampler.hpp"

TEST(DiscreteSamplerTest, ProbabilitiesAreNormalized) {
    DiscreteSampler sampler({2.0, 1.0, 1.0});
    std::vector<double> probs = sampler.Probabilities();

    ASSERT_EQ(probs.size(), 3u);
    EXPECT_NEAR(probs[0], 0.5, 1e-12);
    EXPECT_NEAR(probs[1], 0.25, 1e-12);
    EXPECT_NEAR(probs[2], 0.25, 1e-12);
    EXPECT_NEAR(std::accumulate(probs.begin(), probs.end(), 0.0), 1.0, 1e-12);
}

TEST(DiscreteSamplerTest, PickFollowsRegistrationOrder) {
    DiscreteSampler sampler({0.5, 0.3, 0.2});

    EXPECT_EQ(sampler.Pick(0.0), 0u);
    EXPECT_EQ(sampler.Pick(0.49), 0u);
    EXPECT_EQ(sampler.Pick(0.5), 1u);
    EXPECT_EQ(sampler.Pick(0.79), 1u);
    EXPECT_EQ(sampler.Pick(0.8), 2u);
    EXPECT_EQ(sampler.Pick(0.999999), 2u);
}

TEST(DiscreteSamplerTest, ZeroWeightEntriesAreNeverPicked) {
    DiscreteSampler sampler({0.0, 1.0, 0.0, 1.0, 0.0});

    // Boundaries land on the following positive entry, never on a zero one.
    EXPECT_EQ(sampler.Pick(0.0), 1u);
    EXPECT_EQ(sampler.Pick(0.5), 3u);
    EXPECT_EQ(sampler.Pick(1.0), 3u);

    std::mt19937 gen(7);
    for (int i = 0; i < 10000; ++i) {
        std::size_t idx = sampler.Sample(gen);
        EXPECT_TRUE(idx == 1 || idx == 3) << "picked " << idx;
    }
}

TEST(DiscreteSamplerTest, SingleEntryAlwaysPicked) {
    DiscreteSampler sampler({0.3});
    std::mt19937 gen(1);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(sampler.Sample(gen), 0u);
    }
}

TEST(DiscreteSamplerTest, FrequenciesTrackWeights) {
    DiscreteSampler sampler({0.6, 0.3, 0.1});
    std::mt19937 gen(42);
    std::vector<int> counts(3, 0);
    const int draws = 100000;
    for (int i = 0; i < draws; ++i) {
        counts[sampler.Sample(gen)]++;
    }
    EXPECT_NEAR(counts[0] / static_cast<double>(draws), 0.6, 0.01);
    EXPECT_NEAR(counts[1] / static_cast<double>(draws), 0.3, 0.01);
    EXPECT_NEAR(counts[2] / static_cast<double>(draws), 0.1, 0.01);
}

TEST(DiscreteSamplerTest, RejectsUnusableWeights) {
    EXPECT_THROW(DiscreteSampler({}), std::invalid_argument);
    EXPECT_THROW(DiscreteSampler({0.0, 0.0}), std::invalid_argument);
    EXPECT_THROW(DiscreteSampler({1.0, -0.1}), std::invalid_argument);
    EXPECT_THROW(DiscreteSampler({1.0, std::numeric_limits<double>::infinity()}), std::invalid_argument);
    EXPECT_THROW(DiscreteSampler({std::numeric_limits<double>::quiet_NaN()}), std::invalid_argument);
}
