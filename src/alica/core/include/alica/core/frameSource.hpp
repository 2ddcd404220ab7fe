#pragma once

#include "alica/core/frame.hpp"

#include <functional>
#include <optional>
#include <string>

namespace alica::core {

//! Source that is queried synchronously for its newest frame.
class PollingFrameSource {
public:
	virtual ~PollingFrameSource() = default;

	//! Return the newest frame, or nothing if no frame has been acquired yet.
	//! The caller compares Frame::id to detect repeated frames.
	//! \throws TransientAcquisitionError if the frame is temporarily unavailable.
	virtual std::optional<Frame> getLatestFrame() = 0;

	virtual std::string getName() const = 0;
};

/*! Source that notifies when a frame becomes available.
 *  Notifications only carry the frame identity. The pixel buffer is fetched by identity from the frame store of the source.
 *  Callbacks are invoked on the thread of the source and must return quickly.
 */
class PushFrameSource {
public:
	struct Callbacks {
		std::function<void(FrameId)> onNewFrame;    //!< A frame with this identity is ready in the frame store.
		std::function<void()> onAcquisitionStarted; //!< A new acquisition (or live stream) begins.
		std::function<void()> onAcquisitionEnded;   //!< The running acquisition finished.
	};

public:
	virtual ~PushFrameSource() = default;

	virtual void connect(Callbacks callbacks) = 0; //!< Register for notifications. Replaces previous callbacks.
	virtual void disconnect()                 = 0; //!< Stop notifications. No callback runs after this returns.

	//! Fetch the pixel buffer of a notified frame.
	//! \throws TransientAcquisitionError if the frame is no longer (or not yet) in the store.
	virtual Frame fetchFrame(FrameId id) = 0;

	virtual std::string getName() const = 0;
};

} // namespace alica::core
