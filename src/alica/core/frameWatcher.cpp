#include "alica/core/frameWatcher.hpp"

namespace alica::core {

void FrameWatcher::publish(const FrameId id) {
	{
		std::lock_guard lock(m_mutex);
		if (m_pending.has_value()) {
			++m_overwritten;
		}
		m_pending = id;
	}
	m_condition.notify_one();
}

std::optional<FrameId> FrameWatcher::awaitNext(const std::chrono::milliseconds timeout) {
	std::unique_lock lock(m_mutex);
	const std::uint64_t interruptSequence = m_interruptSequence;

	// The predicate is re-evaluated after every wake-up, so spurious wake-ups do not yield a frame.
	const bool ready = m_condition.wait_for(lock, timeout, [&] { return m_pending.has_value() || m_interruptSequence != interruptSequence; });
	if (!ready || !m_pending.has_value()) {
		return std::nullopt;
	}

	const FrameId id = *m_pending;
	m_pending.reset();
	return id;
}

void FrameWatcher::interrupt() {
	{
		std::lock_guard lock(m_mutex);
		++m_interruptSequence;
	}
	m_condition.notify_all();
}

void FrameWatcher::reset() {
	std::lock_guard lock(m_mutex);
	m_pending.reset();
}

std::uint64_t FrameWatcher::overwrittenCount() const {
	std::lock_guard lock(m_mutex);
	return m_overwritten;
}

} // namespace alica::core
