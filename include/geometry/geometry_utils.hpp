#pragma once

#include <array>
#include <vector>

#include <opencv2/core.hpp>

namespace vdcam {

// Four corners of a detected quadrilateral. Coordinates are either
// frame-normalized ([0,1], y down) or pixels, depending on the producer.
struct Quad {
    cv::Point2f top_left{0.0F, 0.0F};
    cv::Point2f top_right{0.0F, 0.0F};
    cv::Point2f bottom_left{0.0F, 0.0F};
    cv::Point2f bottom_right{0.0F, 0.0F};
};

bool operator==(const Quad& a, const Quad& b);
bool operator!=(const Quad& a, const Quad& b);

// Clockwise from the top-left: TL, TR, BR, BL.
std::array<cv::Point2f, 4> cornerPoints(const Quad& quad);
Quad quadFromCornerPoints(const std::array<cv::Point2f, 4>& clockwise_from_top_left);
Quad quadFromRect(const cv::Rect2f& rect);

cv::Point2f scalePoint(const cv::Point2f& normalized, const cv::Size& size);
cv::Rect2f scaleRect(const cv::Rect2f& normalized, const cv::Size& size);
Quad scaleQuad(const Quad& normalized, const cv::Size& size);
Quad normalizeQuad(const Quad& pixels, const cv::Size& size);

// Converts between bottom-left and top-left origin normalized coordinates.
// Corner roles are kept: the result's top_left is the input's bottom_left mirrored.
cv::Point2f flipNormalizedY(const cv::Point2f& p);
Quad flipNormalizedY(const Quad& quad);

cv::Matx23d identityTransform();
cv::Matx23d scaleTransform(double sx, double sy);
cv::Point2f transformPoint(const cv::Point2f& p, const cv::Matx23d& transform);
Quad transformQuad(const Quad& quad, const cv::Matx23d& transform);
Quad translateQuad(const Quad& quad, const cv::Point2f& delta);

// Union of the four corners taken as zero-size rectangles.
cv::Rect2f unionOfCorners(const Quad& quad);

// Closed outline TL, BL, BR, TR, TL with the transform applied to every vertex.
std::vector<cv::Point2f> quadrilateralPath(
    const cv::Point2f& top_left,
    const cv::Point2f& bottom_left,
    const cv::Point2f& bottom_right,
    const cv::Point2f& top_right,
    const cv::Matx23d& transform);
std::vector<cv::Point2f> quadrilateralPath(const Quad& quad, const cv::Matx23d& transform);

cv::Mat quadMask(const cv::Size& size, const Quad& pixels);

}  // namespace vdcam
