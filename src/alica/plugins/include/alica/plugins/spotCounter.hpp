#pragma once

#include "alica/core/analyzer.hpp"

#include <limits>
#include <vector>

namespace alica::plugins {

//! Spot detection parameters.
struct SpotCounterConfig {
	double blurSigma{1.0};      //!< Gaussian pre-filter in pixels. 0 -> no filtering.
	double thresholdSigma{3.0}; //!< Detection threshold in standard deviations above the ROI mean.
	int minArea{2};             //!< Smallest accepted spot in pixels.
	int maxArea{200};           //!< Largest accepted spot in pixels. Larger blobs are clusters or debris.
};

//! \throws ConfigurationError naming the first violated constraint.
void validate(const SpotCounterConfig& config);

/*! Counts bright spots (single molecule emissions) per frame.
 *  Output is spots per frame, or spots per 100 um^2 if the pixel size of the frame is known.
 *  The batch output is the median over the frames since the last batch query, robust against single outlier frames.
 */
class SpotCounter : public core::Analyzer {
public:
	//! \throws ConfigurationError if the configuration is invalid.
	explicit SpotCounter(SpotCounterConfig config = {});

	void processImage(const cv::Mat& image, double pixelSizeUm, std::int64_t timestampMs) override;

	double getIntermittentOutput() override;
	double getBatchOutput() override;

	void setRoi(const cv::Rect& roi) override;
	void dispose() override;

	std::string getName() const override { return "SpotCounter"; }
	std::string getShortDescription() const override;

	int lastSpotCount() const { return m_lastCount; }

private:
	int countSpots(const cv::Mat& grey);

private:
	const SpotCounterConfig m_config;
	cv::Rect m_roi{};
	bool m_densityOutput{false}; //!< Last frame carried a pixel size.

	// Reused between frames.
	cv::Mat m_blurred;
	cv::Mat m_mask;
	cv::Mat m_labels;
	cv::Mat m_stats;
	cv::Mat m_centroids;

	int m_lastCount{0};
	double m_lastValue{std::numeric_limits<double>::quiet_NaN()};
	double m_lastBatch{std::numeric_limits<double>::quiet_NaN()};
	std::vector<double> m_pending;
};

} // namespace alica::plugins
