#include "alica/plugins/spotCounter.hpp"

#include "alica/core/errors.hpp"
#include "alica/plugins/imageUtils.hpp"
#include "alica/plugins/statistics.hpp"

#include <opencv2/imgproc.hpp>

#include <cmath>
#include <format>

namespace alica::plugins {

namespace {

constexpr double DENSITY_AREA_UM2 = 100.0; //!< Reference area of the density output.

} // namespace

void validate(const SpotCounterConfig& config) {
	if (!std::isfinite(config.blurSigma) || config.blurSigma < 0.0) {
		throw core::ConfigurationError(std::format("Spot blur sigma must be >= 0, got {}.", config.blurSigma));
	}
	if (!std::isfinite(config.thresholdSigma) || config.thresholdSigma <= 0.0) {
		throw core::ConfigurationError(std::format("Spot threshold must be > 0 sigma, got {}.", config.thresholdSigma));
	}
	if (config.minArea < 1 || config.maxArea < config.minArea) {
		throw core::ConfigurationError(std::format("Invalid spot area range [{}, {}].", config.minArea, config.maxArea));
	}
}

SpotCounter::SpotCounter(const SpotCounterConfig config) : m_config(config) {
	validate(m_config);
}

void SpotCounter::processImage(const cv::Mat& image, const double pixelSizeUm, std::int64_t /*timestampMs*/) {
	if (image.empty()) {
		throw core::AnalysisError("Empty image.");
	}

	const cv::Rect roi = clipRoi(m_roi, image.size());
	if (roi.empty()) {
		throw core::AnalysisError(std::format("ROI {}x{} at ({}, {}) outside of {}x{} image.", m_roi.width, m_roi.height, m_roi.x, m_roi.y,
		                                      image.cols, image.rows));
	}

	m_lastCount = countSpots(toGrey(image)(roi));

	m_densityOutput = pixelSizeUm > 0.0;
	if (m_densityOutput) {
		const double areaUm2 = static_cast<double>(roi.area()) * pixelSizeUm * pixelSizeUm;
		m_lastValue          = m_lastCount * DENSITY_AREA_UM2 / areaUm2;
	} else {
		m_lastValue = m_lastCount;
	}
	m_pending.push_back(m_lastValue);
}

int SpotCounter::countSpots(const cv::Mat& grey) {
	grey.convertTo(m_blurred, CV_32F);
	if (m_config.blurSigma > 0.0) {
		cv::GaussianBlur(m_blurred, m_blurred, cv::Size(), m_config.blurSigma);
	}

	cv::Scalar mean, sigma;
	cv::meanStdDev(m_blurred, mean, sigma);
	if (sigma[0] <= 0.0) {
		return 0; // Flat image.
	}

	const double threshold = mean[0] + m_config.thresholdSigma * sigma[0];
	cv::threshold(m_blurred, m_mask, threshold, 255.0, cv::THRESH_BINARY);
	m_mask.convertTo(m_mask, CV_8U);

	const int labels = cv::connectedComponentsWithStats(m_mask, m_labels, m_stats, m_centroids, 8, CV_32S);

	int spots = 0;
	for (int i = 1; i < labels; ++i) { // Label 0 is the background.
		const int area = m_stats.at<int>(i, cv::CC_STAT_AREA);
		if (area >= m_config.minArea && area <= m_config.maxArea) {
			++spots;
		}
	}
	return spots;
}

double SpotCounter::getIntermittentOutput() {
	return m_lastValue;
}

double SpotCounter::getBatchOutput() {
	if (!m_pending.empty()) {
		m_lastBatch = median(m_pending);
		m_pending.clear();
	}
	return m_lastBatch;
}

void SpotCounter::setRoi(const cv::Rect& roi) {
	m_roi = roi;
}

void SpotCounter::dispose() {
	m_pending.clear();
	m_blurred.release();
	m_mask.release();
	m_labels.release();
	m_stats.release();
	m_centroids.release();
}

std::string SpotCounter::getShortDescription() const {
	return m_densityOutput ? "spots/100um^2" : "spots/frame";
}

} // namespace alica::plugins
