#include "geometry/geometry_utils.hpp"

#include <algorithm>
#include <cmath>

#include <opencv2/imgproc.hpp>

namespace vdcam {

namespace {

std::vector<cv::Point> toIntPoints(const std::vector<cv::Point2f>& pts) {
    std::vector<cv::Point> out;
    out.reserve(pts.size());
    for (const auto& p : pts) {
        out.emplace_back(static_cast<int>(std::lround(p.x)), static_cast<int>(std::lround(p.y)));
    }
    return out;
}

}  // namespace

bool operator==(const Quad& a, const Quad& b) {
    return a.top_left == b.top_left && a.top_right == b.top_right &&
           a.bottom_left == b.bottom_left && a.bottom_right == b.bottom_right;
}

bool operator!=(const Quad& a, const Quad& b) {
    return !(a == b);
}

std::array<cv::Point2f, 4> cornerPoints(const Quad& quad) {
    return {quad.top_left, quad.top_right, quad.bottom_right, quad.bottom_left};
}

Quad quadFromCornerPoints(const std::array<cv::Point2f, 4>& clockwise_from_top_left) {
    Quad q;
    q.top_left = clockwise_from_top_left[0];
    q.top_right = clockwise_from_top_left[1];
    q.bottom_right = clockwise_from_top_left[2];
    q.bottom_left = clockwise_from_top_left[3];
    return q;
}

Quad quadFromRect(const cv::Rect2f& rect) {
    Quad q;
    q.top_left = cv::Point2f(rect.x, rect.y);
    q.top_right = cv::Point2f(rect.x + rect.width, rect.y);
    q.bottom_left = cv::Point2f(rect.x, rect.y + rect.height);
    q.bottom_right = cv::Point2f(rect.x + rect.width, rect.y + rect.height);
    return q;
}

cv::Point2f scalePoint(const cv::Point2f& normalized, const cv::Size& size) {
    return cv::Point2f(normalized.x * static_cast<float>(size.width), normalized.y * static_cast<float>(size.height));
}

cv::Rect2f scaleRect(const cv::Rect2f& normalized, const cv::Size& size) {
    const float w = static_cast<float>(size.width);
    const float h = static_cast<float>(size.height);
    return cv::Rect2f(normalized.x * w, normalized.y * h, normalized.width * w, normalized.height * h);
}

Quad scaleQuad(const Quad& normalized, const cv::Size& size) {
    return transformQuad(normalized, scaleTransform(size.width, size.height));
}

Quad normalizeQuad(const Quad& pixels, const cv::Size& size) {
    if (size.width <= 0 || size.height <= 0) {
        return pixels;
    }
    return transformQuad(pixels, scaleTransform(1.0 / size.width, 1.0 / size.height));
}

cv::Point2f flipNormalizedY(const cv::Point2f& p) {
    return cv::Point2f(p.x, 1.0F - p.y);
}

Quad flipNormalizedY(const Quad& quad) {
    Quad q;
    q.top_left = flipNormalizedY(quad.bottom_left);
    q.top_right = flipNormalizedY(quad.bottom_right);
    q.bottom_left = flipNormalizedY(quad.top_left);
    q.bottom_right = flipNormalizedY(quad.top_right);
    return q;
}

cv::Matx23d identityTransform() {
    return cv::Matx23d(1.0, 0.0, 0.0, 0.0, 1.0, 0.0);
}

cv::Matx23d scaleTransform(double sx, double sy) {
    return cv::Matx23d(sx, 0.0, 0.0, 0.0, sy, 0.0);
}

cv::Point2f transformPoint(const cv::Point2f& p, const cv::Matx23d& t) {
    const double x = t(0, 0) * p.x + t(0, 1) * p.y + t(0, 2);
    const double y = t(1, 0) * p.x + t(1, 1) * p.y + t(1, 2);
    return cv::Point2f(static_cast<float>(x), static_cast<float>(y));
}

Quad transformQuad(const Quad& quad, const cv::Matx23d& transform) {
    Quad q;
    q.top_left = transformPoint(quad.top_left, transform);
    q.top_right = transformPoint(quad.top_right, transform);
    q.bottom_left = transformPoint(quad.bottom_left, transform);
    q.bottom_right = transformPoint(quad.bottom_right, transform);
    return q;
}

Quad translateQuad(const Quad& quad, const cv::Point2f& delta) {
    return transformQuad(quad, cv::Matx23d(1.0, 0.0, delta.x, 0.0, 1.0, delta.y));
}

cv::Rect2f unionOfCorners(const Quad& quad) {
    // Zero-size rectangles are not "empty" here, every corner extends the union.
    float x0 = quad.top_left.x;
    float y0 = quad.top_left.y;
    float x1 = x0;
    float y1 = y0;
    for (const auto& p : {quad.top_right, quad.bottom_left, quad.bottom_right}) {
        x0 = std::min(x0, p.x);
        y0 = std::min(y0, p.y);
        x1 = std::max(x1, p.x);
        y1 = std::max(y1, p.y);
    }
    return cv::Rect2f(x0, y0, x1 - x0, y1 - y0);
}

std::vector<cv::Point2f> quadrilateralPath(
    const cv::Point2f& top_left,
    const cv::Point2f& bottom_left,
    const cv::Point2f& bottom_right,
    const cv::Point2f& top_right,
    const cv::Matx23d& transform) {
    return {
        transformPoint(top_left, transform),
        transformPoint(bottom_left, transform),
        transformPoint(bottom_right, transform),
        transformPoint(top_right, transform),
        transformPoint(top_left, transform)};
}

std::vector<cv::Point2f> quadrilateralPath(const Quad& quad, const cv::Matx23d& transform) {
    return quadrilateralPath(quad.top_left, quad.bottom_left, quad.bottom_right, quad.top_right, transform);
}

cv::Mat quadMask(const cv::Size& size, const Quad& pixels) {
    cv::Mat mask = cv::Mat::zeros(size, CV_8UC1);
    const auto corners = cornerPoints(pixels);
    const std::vector<cv::Point> poly = toIntPoints(std::vector<cv::Point2f>(corners.begin(), corners.end()));
    cv::fillConvexPoly(mask, poly, cv::Scalar(255));
    return mask;
}

}  // namespace vdcam
