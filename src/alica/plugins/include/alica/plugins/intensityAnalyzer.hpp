#pragma once

#include "alica/core/analyzer.hpp"

#include <limits>
#include <vector>

namespace alica::plugins {

//! Mean grey value inside the region of interest.
class IntensityAnalyzer : public core::Analyzer {
public:
	void processImage(const cv::Mat& image, double pixelSizeUm, std::int64_t timestampMs) override;

	double getIntermittentOutput() override;
	double getBatchOutput() override; //!< Mean of the frame values since the last call. Repeats the last batch if no frame arrived.

	void setRoi(const cv::Rect& roi) override;
	void dispose() override;

	std::string getName() const override { return "IntensityAnalyzer"; }
	std::string getShortDescription() const override { return "mean intensity"; }

private:
	cv::Rect m_roi{};
	double m_lastValue{std::numeric_limits<double>::quiet_NaN()};
	double m_lastBatch{std::numeric_limits<double>::quiet_NaN()};
	std::vector<double> m_pending; //!< Frame values since the last batch query.
};

} // namespace alica::plugins
