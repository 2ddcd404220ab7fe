#include "alica/core/fpsCounter.hpp"

namespace alica::core {

void FpsCounter::reset(const std::int64_t nowMs) {
	m_windowStartMs = nowMs;
	m_count         = 0;
	m_lastFps       = 0;
}

std::optional<int> FpsCounter::addFrame(const std::int64_t nowMs) {
	++m_count;
	if (nowMs - m_windowStartMs < WINDOW_MS) {
		return std::nullopt;
	}

	m_lastFps       = m_count;
	m_count         = 0;
	m_windowStartMs = nowMs;
	return m_lastFps;
}

} // namespace alica::core
