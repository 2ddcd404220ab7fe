#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace alica::core {

//! Monotonic millisecond clock counting from the start of a run. Shared by all loops of a run.
class RunClock {
public:
	RunClock();

	void restart();                 //!< Set time zero to now.
	std::int64_t elapsedMs() const; //!< Milliseconds since the last restart().

private:
	std::atomic<std::chrono::steady_clock::rep> m_startTicks; //!< steady_clock ticks at time zero.
};

} // namespace alica::core
