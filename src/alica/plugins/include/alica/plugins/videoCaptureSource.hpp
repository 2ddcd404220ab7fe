#pragma once

#include "alica/core/frameSource.hpp"

#include <opencv2/videoio.hpp>

#include <mutex>
#include <string>

namespace alica::plugins {

//! Camera or video file opened through OpenCV.
struct VideoCaptureConfig {
	int deviceIndex{0}; //!< Used if path is empty.
	std::string path{}; //!< Video file or stream URL.
	double pixelSizeUm{0.0};
};

/*! Polling source reading from a cv::VideoCapture.
 *  Every successful read is a new frame. Frames are converted to 8-bit grey.
 */
class VideoCaptureSource : public core::PollingFrameSource {
public:
	//! \throws ConfigurationError if the device or file cannot be opened.
	explicit VideoCaptureSource(VideoCaptureConfig config);

	//! \throws TransientAcquisitionError if no frame could be read.
	std::optional<core::Frame> getLatestFrame() override;

	std::string getName() const override;

private:
	const VideoCaptureConfig m_config;

	std::mutex m_mutex;
	cv::VideoCapture m_capture;
	cv::Mat m_buffer;
	core::FrameId m_frameCount{0};
};

} // namespace alica::plugins
