#include "alica/plugins/statistics.hpp"

#include <gtest/gtest.h>

#include <cmath>

namespace alica::plugins {
namespace gtest {

TEST(Statistics, Mean) {
	EXPECT_DOUBLE_EQ(mean({1.0, 2.0, 3.0, 6.0}), 3.0);
	EXPECT_TRUE(std::isnan(mean({})));
}

TEST(Statistics, Median) {
	EXPECT_DOUBLE_EQ(median({5.0, 1.0, 3.0}), 3.0);
	EXPECT_DOUBLE_EQ(median({4.0, 1.0, 3.0, 2.0}), 2.5);
	EXPECT_DOUBLE_EQ(median({7.0}), 7.0);
	EXPECT_TRUE(std::isnan(median({})));
}

TEST(Statistics, MedianIgnoresOutlier) {
	EXPECT_DOUBLE_EQ(median({10.0, 11.0, 9.0, 1000.0, 10.0}), 10.0);
}

TEST(Statistics, Spread) {
	EXPECT_DOUBLE_EQ(variance({2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0}), 4.0);
	EXPECT_DOUBLE_EQ(stddev({2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0}), 2.0);
	EXPECT_DOUBLE_EQ(variance({3.0}), 0.0);
}

} // namespace gtest
} // namespace alica::plugins
