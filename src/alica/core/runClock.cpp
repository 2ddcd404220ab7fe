#include "alica/core/runClock.hpp"

namespace alica::core {

RunClock::RunClock() : m_startTicks(std::chrono::steady_clock::now().time_since_epoch().count()) {
}

void RunClock::restart() {
	m_startTicks.store(std::chrono::steady_clock::now().time_since_epoch().count());
}

std::int64_t RunClock::elapsedMs() const {
	const std::chrono::steady_clock::duration start{m_startTicks.load()};
	const auto elapsed = std::chrono::steady_clock::now().time_since_epoch() - start;
	return std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
}

} // namespace alica::core
