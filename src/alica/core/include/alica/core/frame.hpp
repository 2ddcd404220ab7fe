#pragma once

#include <opencv2/core/mat.hpp>

#include <cstdint>

namespace alica::core {

//! Monotonically increasing frame index assigned by the frame source.
using FrameId = std::uint64_t;

//! One camera image plus acquisition metadata.
//! The pixel buffer is shared (cv::Mat reference counting). Consumers must not write into it.
struct Frame {
	cv::Mat pixels;              //!< Raw pixel buffer. cols = width, rows = height.
	FrameId id{0};               //!< Identity used to detect repeated frames when polling.
	double pixelSizeUm{0.0};     //!< Physical pixel size in micrometres. 0 -> unknown.
	std::int64_t timestampMs{0}; //!< Acquisition time in ms since the run started.

	int width() const { return pixels.cols; }
	int height() const { return pixels.rows; }
	bool empty() const { return pixels.empty(); }
};

} // namespace alica::core
