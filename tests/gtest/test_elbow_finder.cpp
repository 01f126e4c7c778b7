// =============================================================================
// Profile Likelihood Elbow Finder Tests
// =============================================================================

#include <gtest/gtest.h>
#include "graphembed/elbow_finder.hpp"

#include <Eigen/Dense>
#include <vector>

using namespace graphembed;

TEST(ElbowFinderTest, LinearSequence) {
    const std::vector<double> values{2, 3, 4, 5, 6, 7, 8, 9};

    EXPECT_EQ(find_elbows(values, 1), (std::vector<size_t>{4}));
    EXPECT_EQ(find_elbows(values, 2), (std::vector<size_t>{4, 6}));
    EXPECT_EQ(find_elbows(values, 3), (std::vector<size_t>{4, 6, 7}));
}

TEST(ElbowFinderTest, InputOrderDoesNotMatter) {
    const std::vector<double> values{9, 2, 7, 4, 5, 3, 8, 6};
    EXPECT_EQ(find_elbows(values, 1), (std::vector<size_t>{4}));
}

TEST(ElbowFinderTest, ClearSpectralGap) {
    const std::vector<double> values{10, 9.5, 9, 1, 0.9, 0.8, 0.1, 0.05};

    EXPECT_EQ(find_elbows(values, 1), (std::vector<size_t>{3}));
    EXPECT_EQ(find_elbows(values, 2), (std::vector<size_t>{3, 6}));
    // The search runs out before five elbows and appends the sequence length
    EXPECT_EQ(find_elbows(values, 5), (std::vector<size_t>{3, 6, 7, 8}));
}

TEST(ElbowFinderTest, TwoValues) {
    EXPECT_EQ(find_elbows(std::vector<double>{2, 10}, 1), (std::vector<size_t>{1}));
}

TEST(ElbowFinderTest, ThresholdDropsValues) {
    // Only 5, 4 and 3 are strictly above zero
    const std::vector<double> values{5, 4, 3, 0, -1};
    EXPECT_EQ(find_elbows(values, 1, 0.0), (std::vector<size_t>{1}));
}

TEST(ElbowFinderTest, MoreElbowsThanValues) {
    EXPECT_EQ(find_elbows(std::vector<double>{3, 2, 1}, 10), (std::vector<size_t>{1, 2, 3}));
}

TEST(ElbowFinderTest, DegenerateInputs) {
    EXPECT_TRUE(find_elbows(std::vector<double>{}, 1).empty());
    EXPECT_TRUE(find_elbows(std::vector<double>{-1, -2}, 1).empty());
    EXPECT_TRUE(find_elbows(std::vector<double>{3, 2, 1}, 0).empty());

    EXPECT_EQ(find_elbows(std::vector<double>{7}, 3), (std::vector<size_t>{1}));
}

TEST(ElbowFinderTest, ConstantSequenceReturnsLength) {
    EXPECT_EQ(find_elbows(std::vector<double>{2, 2, 2, 2}, 1), (std::vector<size_t>{4}));
}

TEST(ElbowFinderTest, MatrixUsesColumnStandardDeviations) {
    // Column standard deviations (population): 0.5, 1.5, 2.5, 3.5
    Eigen::MatrixXd values(2, 4);
    values << 0, 0, 0, 0,
              1, 3, 5, 7;

    const std::vector<double> deviations{0.5, 1.5, 2.5, 3.5};
    EXPECT_EQ(find_elbows(values, 1), find_elbows(deviations, 1));
    EXPECT_EQ(find_elbows(values, 2), find_elbows(deviations, 2));
}
