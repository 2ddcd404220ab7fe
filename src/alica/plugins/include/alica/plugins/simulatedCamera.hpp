#pragma once

#include "alica/core/frameSource.hpp"
#include "alica/core/worker.hpp"

#include <opencv2/core.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace alica::plugins {

//! Synthetic camera parameters.
struct SimulatedCameraConfig {
	int width{256};
	int height{256};
	double fps{20.0};
	double pixelSizeUm{0.1};            //!< Reported pixel size. 0 -> unknown.
	int spotCount{30};                  //!< Emitters per frame. Changeable at runtime with setSpotCount().
	double spotAmplitude{150.0};        //!< Peak grey value of a spot above the background.
	double spotSigmaPx{1.2};            //!< Width of the point spread function.
	double background{20.0};            //!< Mean background grey value.
	double noiseSigma{4.0};             //!< Gaussian read noise.
	std::size_t storeSize{8};           //!< Frames kept for fetchFrame(). Older frames are dropped.
	std::uint64_t acquisitionFrames{0}; //!< Frames per acquisition. 0 -> endless live stream.
	std::uint64_t seed{42};
};

//! \throws ConfigurationError naming the first violated constraint.
void validate(const SimulatedCameraConfig& config);

/*! Camera simulation rendering blinking point emitters on a noisy background.
 *  Serves as polling and as push source. Frames are produced on an own thread at the configured frame rate and kept in
 *  a bounded store, so fetchFrame() fails for frames that were overwritten in the meantime.
 *  With acquisitionFrames set the camera emits acquisition started, delivers the given number of frames, emits
 *  acquisition ended and stops.
 */
class SimulatedCamera : public core::PollingFrameSource, public core::PushFrameSource, public core::Worker {
public:
	//! \throws ConfigurationError if the configuration is invalid.
	explicit SimulatedCamera(SimulatedCameraConfig config = {});
	~SimulatedCamera() override;

	std::optional<core::Frame> getLatestFrame() override;

	void connect(core::PushFrameSource::Callbacks callbacks) override;
	void disconnect() override;
	core::Frame fetchFrame(core::FrameId id) override;

	std::string getName() const override { return "SimulatedCamera"; }

	void setSpotCount(int count); //!< Thread-safe. Applies from the next frame on.
	int spotCount() const { return m_spotCount.load(); }

	std::uint64_t framesProduced() const { return m_produced.load(); }

	//! Render a single frame synchronously. Does not touch the frame store.
	cv::Mat render(int spotCount);

protected:
	void run() override;

private:
	void store(core::Frame frame);

	void notifyFrame(core::FrameId id);
	void notifyAcquisitionStarted();
	void notifyAcquisitionEnded();

private:
	const SimulatedCameraConfig m_config;
	std::atomic<int> m_spotCount;
	std::atomic<std::uint64_t> m_produced{0};

	std::mutex m_renderMutex; //!< Guards the random generator and the scratch images.
	cv::RNG m_rng;
	cv::Mat m_canvas;
	cv::Mat m_noise;

	std::mutex m_storeMutex;
	std::deque<core::Frame> m_store; //!< Oldest first.
	core::FrameId m_nextId{1};

	std::mutex m_callbackMutex; //!< Held while a callback runs, so disconnect() waits for it.
	core::PushFrameSource::Callbacks m_callbacks{};
};

} // namespace alica::plugins
