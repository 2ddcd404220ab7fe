#include "alica/plugins/imageUtils.hpp"

#include "alica/core/errors.hpp"

#include <opencv2/imgproc.hpp>

#include <format>

namespace alica::plugins {

cv::Rect clipRoi(const cv::Rect& roi, const cv::Size& imageSize) {
	const cv::Rect whole(0, 0, imageSize.width, imageSize.height);
	if (roi.empty()) {
		return whole;
	}
	return roi & whole;
}

cv::Mat toGrey(const cv::Mat& image) {
	switch (image.channels()) {
	case 1: return image;
	case 3: {
		cv::Mat grey;
		cv::cvtColor(image, grey, cv::COLOR_BGR2GRAY);
		return grey;
	}
	case 4: {
		cv::Mat grey;
		cv::cvtColor(image, grey, cv::COLOR_BGRA2GRAY);
		return grey;
	}
	default: throw core::AnalysisError(std::format("Unsupported number of image channels: {}", image.channels()));
	}
}

} // namespace alica::plugins
