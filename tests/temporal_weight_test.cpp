// temporal_weight_test.cpp - exponential recency weight

#include <gtest/gtest.h>

#include "aggregation/temporal_weight.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

TEST(TemporalWeightTest, AgeZeroIsOne) {
    EXPECT_DOUBLE_EQ(temporal_weight(0.0, 0.1), 1.0);
    EXPECT_DOUBLE_EQ(temporal_weight(0.0, 5.0), 1.0);
}

TEST(TemporalWeightTest, MatchesExponential) {
    EXPECT_NEAR(temporal_weight(14.0, 0.1), std::exp(-1.4), 1e-15);
    EXPECT_NEAR(temporal_weight(7.0, 0.1), std::exp(-0.7), 1e-15);
    EXPECT_NEAR(temporal_weight(14.0, 0.1), 0.2466, 1e-4);
    EXPECT_NEAR(temporal_weight(7.0, 0.1), 0.4966, 1e-4);
}

TEST(TemporalWeightTest, DefaultAlphaIsPointOne) {
    EXPECT_DOUBLE_EQ(DEFAULT_ALPHA, 0.1);
    EXPECT_DOUBLE_EQ(temporal_weight(10.0), std::exp(-1.0));
}

TEST(TemporalWeightTest, WeightsInUnitIntervalAndStrictlyDecreasing) {
    for (double alpha : {0.01, 0.1, 0.5, 1.0}) {
        double prev = 2.0;
        for (int age = 0; age <= 365; ++age) {
            double w = temporal_weight(age, alpha);
            EXPECT_GT(w, 0.0) << "alpha=" << alpha << " age=" << age;
            EXPECT_LE(w, 1.0) << "alpha=" << alpha << " age=" << age;
            EXPECT_LT(w, prev) << "alpha=" << alpha << " age=" << age;
            prev = w;
        }
    }
}

TEST(TemporalWeightTest, NeverExactlyZero) {
    EXPECT_GT(temporal_weight(1e6, 10.0), 0.0);
}

TEST(TemporalWeightTest, FractionalAges) {
    EXPECT_NEAR(temporal_weight(0.5, 0.2), std::exp(-0.1), 1e-15);
}

TEST(TemporalWeightTest, RejectsNegativeAge) {
    EXPECT_THROW(temporal_weight(-1.0, 0.1), std::invalid_argument);
    EXPECT_THROW(temporal_weight(-1e-9, 0.1), std::invalid_argument);
}

TEST(TemporalWeightTest, RejectsInvalidAlpha) {
    EXPECT_THROW(temporal_weight(1.0, 0.0), std::invalid_argument);
    EXPECT_THROW(temporal_weight(1.0, -0.1), std::invalid_argument);
    EXPECT_THROW(temporal_weight(1.0, std::numeric_limits<double>::quiet_NaN()),
                 std::invalid_argument);
}

TEST(TemporalWeightTest, RejectsNonFiniteAge) {
    EXPECT_THROW(temporal_weight(std::numeric_limits<double>::infinity(), 0.1),
                 std::invalid_argument);
    EXPECT_THROW(temporal_weight(std::numeric_limits<double>::quiet_NaN(), 0.1),
                 std::invalid_argument);
}
