#pragma once

#include <opencv2/core/mat.hpp>
#include <opencv2/core/types.hpp>

namespace alica::plugins {

//! Intersect the region with the image. An empty region selects the whole image.
//! \returns Empty rectangle if the region lies completely outside the image.
cv::Rect clipRoi(const cv::Rect& roi, const cv::Size& imageSize);

//! Single channel view of the image. Colour images are converted to grey, grey images are returned as is.
cv::Mat toGrey(const cv::Mat& image);

} // namespace alica::plugins
