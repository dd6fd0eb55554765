#include "geometry/perspective.hpp"

#include <algorithm>
#include <cmath>

namespace vdcam {

namespace {

float edgeLength(const cv::Point2f& a, const cv::Point2f& b) {
    return static_cast<float>(cv::norm(b - a));
}

}  // namespace

cv::Size rectifiedSize(const Quad& pixels) {
    const float top = edgeLength(pixels.top_left, pixels.top_right);
    const float bottom = edgeLength(pixels.bottom_left, pixels.bottom_right);
    const float left = edgeLength(pixels.top_left, pixels.bottom_left);
    const float right = edgeLength(pixels.top_right, pixels.bottom_right);
    const int w = std::max(1, static_cast<int>(std::lround(std::max(top, bottom))));
    const int h = std::max(1, static_cast<int>(std::lround(std::max(left, right))));
    return cv::Size(w, h);
}

cv::Mat rectifyingHomography(const Quad& pixels, const cv::Size& out_size) {
    const auto corners = cornerPoints(pixels);
    const cv::Point2f src[4] = {corners[0], corners[1], corners[2], corners[3]};
    const float w = static_cast<float>(out_size.width - 1);
    const float h = static_cast<float>(out_size.height - 1);
    const cv::Point2f dst[4] = {
        cv::Point2f(0.0F, 0.0F),
        cv::Point2f(w, 0.0F),
        cv::Point2f(w, h),
        cv::Point2f(0.0F, h)};
    return cv::getPerspectiveTransform(src, dst);
}

bool perspectiveCorrect(
    const cv::Mat& src,
    const Quad& normalized,
    cv::Mat& dst,
    std::string& error,
    int interpolation) {
    if (src.empty()) {
        error = "empty source image";
        return false;
    }
    return perspectiveCorrectPixels(src, scaleQuad(normalized, src.size()), dst, error, interpolation);
}

bool perspectiveCorrectPixels(
    const cv::Mat& src,
    const Quad& pixels,
    cv::Mat& dst,
    std::string& error,
    int interpolation) {
    if (src.empty()) {
        error = "empty source image";
        return false;
    }

    const cv::Rect2f bounds = unionOfCorners(pixels);
    const cv::Rect2f extent(0.0F, 0.0F, static_cast<float>(src.cols), static_cast<float>(src.rows));
    if (bounds.x < extent.x || bounds.y < extent.y ||
        bounds.x + bounds.width > extent.width || bounds.y + bounds.height > extent.height) {
        error = "invalid detected rectangle";
        return false;
    }

    const cv::Size out_size = rectifiedSize(pixels);
    if (out_size.width < 2 || out_size.height < 2) {
        error = "detected rectangle is degenerate";
        return false;
    }

    const cv::Mat H = rectifyingHomography(pixels, out_size);
    cv::warpPerspective(src, dst, H, out_size, interpolation, cv::BORDER_REPLICATE);
    if (dst.empty()) {
        error = "perspective warp produced no image";
        return false;
    }
    error.clear();
    return true;
}

}  // namespace vdcam
