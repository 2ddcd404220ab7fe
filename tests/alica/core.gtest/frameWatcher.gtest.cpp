#include "alica/core/frameWatcher.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

namespace alica::core {
namespace gtest {

using namespace std::chrono_literals;

TEST(FrameWatcher, TimeoutWithoutFrame) {
	FrameWatcher watcher;

	const auto start = std::chrono::steady_clock::now();
	EXPECT_FALSE(watcher.awaitNext(20ms).has_value());
	EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);
}

TEST(FrameWatcher, LatestWins) {
	FrameWatcher watcher;
	watcher.publish(1);
	watcher.publish(2);
	watcher.publish(3);

	const auto id = watcher.awaitNext(10ms);
	ASSERT_TRUE(id.has_value());
	EXPECT_EQ(*id, 3u);
	EXPECT_EQ(watcher.overwrittenCount(), 2u);

	// Slot is cleared by the consumer.
	EXPECT_FALSE(watcher.awaitNext(5ms).has_value());
}

TEST(FrameWatcher, WakesWaitingConsumer) {
	FrameWatcher watcher;

	std::thread producer([&watcher]() {
		std::this_thread::sleep_for(20ms);
		watcher.publish(7);
	});

	const auto id = watcher.awaitNext(2s);
	producer.join();

	ASSERT_TRUE(id.has_value());
	EXPECT_EQ(*id, 7u);
}

TEST(FrameWatcher, InterruptReturnsNothing) {
	FrameWatcher watcher;

	std::thread interrupter([&watcher]() {
		std::this_thread::sleep_for(20ms);
		watcher.interrupt();
	});

	const auto start = std::chrono::steady_clock::now();
	EXPECT_FALSE(watcher.awaitNext(5s).has_value());
	EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
	interrupter.join();
}

TEST(FrameWatcher, ResetDropsPending) {
	FrameWatcher watcher;
	watcher.publish(4);
	watcher.reset();

	EXPECT_FALSE(watcher.awaitNext(5ms).has_value());
}

} // namespace gtest
} // namespace alica::core
