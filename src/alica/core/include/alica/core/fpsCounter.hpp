#pragma once

#include <cstdint>
#include <optional>

namespace alica::core {

//! Counts frames in fixed one second windows of loop time.
class FpsCounter {
public:
	static constexpr std::int64_t WINDOW_MS = 1000;

	//! Restart counting at the given time.
	void reset(std::int64_t nowMs);

	/*! Count one frame processed at nowMs.
	 * \return The number of frames in the window that just closed, if at least WINDOW_MS passed since the window opened.
	 *         The counter then restarts at nowMs.
	 */
	std::optional<int> addFrame(std::int64_t nowMs);

	int lastFps() const { return m_lastFps; } //!< Value of the last closed window (0 before the first one).

private:
	std::int64_t m_windowStartMs{0};
	int m_count{0};
	int m_lastFps{0};
};

} // namespace alica::core
