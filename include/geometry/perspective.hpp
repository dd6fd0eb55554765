#pragma once

#include <string>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include "geometry/geometry_utils.hpp"

namespace vdcam {

// Output size of the rectified image: the longer of each pair of opposite edges.
cv::Size rectifiedSize(const Quad& pixels);

// Homography mapping the quadrilateral onto an upright rectangle of `out_size`.
cv::Mat rectifyingHomography(const Quad& pixels, const cv::Size& out_size);

// Rectifies a frame-normalized quadrilateral out of `src`. Fails when the
// quadrilateral's bounding box is not contained in the image.
bool perspectiveCorrect(
    const cv::Mat& src,
    const Quad& normalized,
    cv::Mat& dst,
    std::string& error,
    int interpolation = cv::INTER_LINEAR);

bool perspectiveCorrectPixels(
    const cv::Mat& src,
    const Quad& pixels,
    cv::Mat& dst,
    std::string& error,
    int interpolation = cv::INTER_LINEAR);

}  // namespace vdcam
