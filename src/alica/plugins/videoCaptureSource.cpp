#include "alica/plugins/videoCaptureSource.hpp"

#include "alica/core/errors.hpp"
#include "alica/plugins/imageUtils.hpp"

#include <opencv2/core.hpp>

#include <spdlog/spdlog.h>

#include <format>
#include <utility>

namespace alica::plugins {

VideoCaptureSource::VideoCaptureSource(VideoCaptureConfig config) : m_config(std::move(config)) {
	const bool opened = m_config.path.empty() ? m_capture.open(m_config.deviceIndex) : m_capture.open(m_config.path);
	if (!opened || !m_capture.isOpened()) {
		throw core::ConfigurationError(std::format("Could not open video source {}.", getName()));
	}
	spdlog::info("VideoCaptureSource: Opened {} ({}x{}).", getName(), m_capture.get(cv::CAP_PROP_FRAME_WIDTH),
	             m_capture.get(cv::CAP_PROP_FRAME_HEIGHT));
}

std::optional<core::Frame> VideoCaptureSource::getLatestFrame() {
	std::lock_guard lock(m_mutex);

	try {
		if (!m_capture.read(m_buffer) || m_buffer.empty()) {
			throw core::TransientAcquisitionError(std::format("No frame available from {}.", getName()));
		}
	} catch (const cv::Exception& ex) {
		throw core::TransientAcquisitionError(std::format("Reading from {} failed: {}", getName(), ex.what()));
	}

	core::Frame frame;
	toGrey(m_buffer).convertTo(frame.pixels, CV_8U);
	frame.id          = ++m_frameCount;
	frame.pixelSizeUm = m_config.pixelSizeUm;
	return frame;
}

std::string VideoCaptureSource::getName() const {
	return m_config.path.empty() ? std::format("camera {}", m_config.deviceIndex) : m_config.path;
}

} // namespace alica::plugins
