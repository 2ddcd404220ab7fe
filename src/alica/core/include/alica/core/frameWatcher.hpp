#pragma once

#include "alica/core/frame.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace alica::core {

/*! Single-slot handoff between a push frame source and the analysis consumer.
 *  The slot holds at most one pending frame identity. Publishing while the slot is occupied overwrites the older identity
 *  (latest wins). Under load the consumer sees fewer, fresher frames and never a backlog.
 */
class FrameWatcher {
public:
	//! Store a new identity and wake the consumer. Called from the notifier thread.
	void publish(FrameId id);

	/*! Block until an identity is pending, then take it and clear the slot.
	 * \param [in] timeout Maximum time to wait.
	 * \return     The most recently published identity, or nothing on timeout or interrupt().
	 */
	std::optional<FrameId> awaitNext(std::chrono::milliseconds timeout);

	//! Wake a consumer blocked in awaitNext() without publishing. The waiting call returns nothing.
	void interrupt();

	void reset(); //!< Drop a pending identity.

	std::uint64_t overwrittenCount() const; //!< Number of identities discarded because a newer one arrived first.

private:
	mutable std::mutex m_mutex;
	std::condition_variable m_condition;
	std::optional<FrameId> m_pending{};   //!< Latest unconsumed identity.
	std::uint64_t m_interruptSequence{0}; //!< Incremented by interrupt(). Lets a waiter detect that it was interrupted.
	std::uint64_t m_overwritten{0};
};

} // namespace alica::core
