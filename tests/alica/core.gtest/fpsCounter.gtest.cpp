#include "alica/core/fpsCounter.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace alica::core {
namespace gtest {

TEST(FpsCounter, NoValueWithinFirstSecond) {
	FpsCounter counter;
	counter.reset(0);

	for (std::int64_t t = 100; t < 1000; t += 100) {
		EXPECT_FALSE(counter.addFrame(t).has_value());
	}
	EXPECT_EQ(counter.lastFps(), 0);
}

TEST(FpsCounter, SteadyTenHertz) {
	FpsCounter counter;
	counter.reset(0);

	// 10 Hz for 5 s.
	std::vector<int> published;
	for (std::int64_t t = 100; t <= 5000; t += 100) {
		if (const auto fps = counter.addFrame(t)) {
			published.push_back(*fps);
		}
	}

	ASSERT_EQ(published.size(), 5u);
	for (const int fps: published) {
		EXPECT_NEAR(fps, 10, 1);
	}
	EXPECT_EQ(counter.lastFps(), published.back());
}

TEST(FpsCounter, ResetRestartsWindow) {
	FpsCounter counter;
	counter.reset(0);
	counter.addFrame(500);

	counter.reset(10000);
	EXPECT_FALSE(counter.addFrame(10500).has_value());
	EXPECT_EQ(counter.lastFps(), 0);

	const auto fps = counter.addFrame(11000);
	ASSERT_TRUE(fps.has_value());
	EXPECT_EQ(*fps, 2);
}

} // namespace gtest
} // namespace alica::core
