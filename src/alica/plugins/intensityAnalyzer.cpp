#include "alica/plugins/intensityAnalyzer.hpp"

#include "alica/core/errors.hpp"
#include "alica/plugins/imageUtils.hpp"
#include "alica/plugins/statistics.hpp"

#include <opencv2/core.hpp>

#include <format>

namespace alica::plugins {

void IntensityAnalyzer::processImage(const cv::Mat& image, double /*pixelSizeUm*/, std::int64_t /*timestampMs*/) {
	if (image.empty()) {
		throw core::AnalysisError("Empty image.");
	}

	const cv::Rect roi = clipRoi(m_roi, image.size());
	if (roi.empty()) {
		throw core::AnalysisError(std::format("ROI {}x{} at ({}, {}) outside of {}x{} image.", m_roi.width, m_roi.height, m_roi.x, m_roi.y,
		                                      image.cols, image.rows));
	}

	m_lastValue = cv::mean(toGrey(image)(roi))[0];
	m_pending.push_back(m_lastValue);
}

double IntensityAnalyzer::getIntermittentOutput() {
	return m_lastValue;
}

double IntensityAnalyzer::getBatchOutput() {
	if (!m_pending.empty()) {
		m_lastBatch = mean(m_pending);
		m_pending.clear();
	}
	return m_lastBatch;
}

void IntensityAnalyzer::setRoi(const cv::Rect& roi) {
	m_roi = roi;
}

void IntensityAnalyzer::dispose() {
	m_pending.clear();
	m_pending.shrink_to_fit();
}

} // namespace alica::plugins
