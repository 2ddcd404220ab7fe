#pragma once

#include <opencv2/core/mat.hpp>
#include <opencv2/core/types.hpp>

#include <cstdint>
#include <string>

namespace alica::core {

/*! Image analysis algorithm turning frames into a scalar signal.
 *  Implementations are not required to be thread-safe. The AnalysisLoop serialises every call through its own lock.
 */
class Analyzer {
public:
	virtual ~Analyzer() = default;

	/*! Analyse one frame and update the internal state.
	 * \param [in] image       Raw pixels. Width and height are image.cols and image.rows.
	 * \param [in] pixelSizeUm Physical size of a pixel in micrometres (0 if unknown).
	 * \param [in] timestampMs Acquisition time in ms since the run started.
	 * \throws     AnalysisError on malformed input.
	 */
	virtual void processImage(const cv::Mat& image, double pixelSizeUm, std::int64_t timestampMs) = 0;

	virtual double getIntermittentOutput() = 0; //!< Cheap value of the last processed frame (live display).
	virtual double getBatchOutput()        = 0; //!< Aggregate over the frames since the previous call. Resets the aggregation.

	//! Restrict the analysis to a region. An empty rectangle selects the whole image.
	virtual void setRoi(const cv::Rect& roi) = 0;

	//! Release resources held by the analyzer. Idempotent. The analyzer can process images again afterwards.
	virtual void dispose() = 0;

	virtual std::string getName() const             = 0;
	virtual std::string getShortDescription() const = 0; //!< Describes the output value, e.g. "spots/frame".
};

} // namespace alica::core
