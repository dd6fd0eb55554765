#include "geometry/perspective.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

int main() {
    // White page with a black bar along its top edge, tilted inside a grey frame.
    cv::Mat frame(480, 640, CV_8UC3, cv::Scalar(90, 90, 90));
    vdcam::Quad page_px;
    page_px.top_left = cv::Point2f(200.0F, 100.0F);
    page_px.top_right = cv::Point2f(440.0F, 120.0F);
    page_px.bottom_right = cv::Point2f(420.0F, 400.0F);
    page_px.bottom_left = cv::Point2f(180.0F, 380.0F);

    const cv::Size page_size(240, 320);
    cv::Mat page(page_size, CV_8UC3, cv::Scalar(255, 255, 255));
    cv::rectangle(page, cv::Rect(0, 0, page_size.width, 40), cv::Scalar(0, 0, 0), cv::FILLED);
    const cv::Point2f src[4] = {
        cv::Point2f(0.0F, 0.0F),
        cv::Point2f(static_cast<float>(page_size.width - 1), 0.0F),
        cv::Point2f(static_cast<float>(page_size.width - 1), static_cast<float>(page_size.height - 1)),
        cv::Point2f(0.0F, static_cast<float>(page_size.height - 1))};
    const auto corners = vdcam::cornerPoints(page_px);
    const cv::Point2f dst[4] = {corners[0], corners[1], corners[2], corners[3]};
    const cv::Mat to_frame = cv::getPerspectiveTransform(src, dst);
    cv::Mat warped_page;
    cv::warpPerspective(page, warped_page, to_frame, frame.size());
    const cv::Mat mask = vdcam::quadMask(frame.size(), page_px);
    warped_page.copyTo(frame, mask);

    const vdcam::Quad normalized = vdcam::normalizeQuad(page_px, frame.size());
    cv::Mat out;
    std::string error;
    if (!vdcam::perspectiveCorrect(frame, normalized, out, error)) {
        std::cerr << "perspectiveCorrect failed: " << error << "\n";
        return 1;
    }

    const cv::Size expected = vdcam::rectifiedSize(page_px);
    if (out.size() != expected) {
        std::cerr << "rectified image size mismatch: " << out.cols << "x" << out.rows << "\n";
        return 1;
    }
    if (std::abs(out.cols - 241) > 2 || std::abs(out.rows - 281) > 2) {
        std::cerr << "rectified size should follow the longest opposite edges\n";
        return 1;
    }

    // Upright result: dark band at the top, white below.
    cv::Mat gray;
    cv::cvtColor(out, gray, cv::COLOR_BGR2GRAY);
    const double top = cv::mean(gray(cv::Rect(20, 5, out.cols - 40, 15)))[0];
    const double body = cv::mean(gray(cv::Rect(20, out.rows / 2, out.cols - 40, 30)))[0];
    if (top > 60.0 || body < 200.0) {
        std::cerr << "rectified page not upright (top=" << top << " body=" << body << ")\n";
        return 1;
    }

    // Corners outside the image are rejected.
    vdcam::Quad outside = normalized;
    outside.top_right.x = 1.2F;
    if (vdcam::perspectiveCorrect(frame, outside, out, error)) {
        std::cerr << "quad leaving the image should be rejected\n";
        return 1;
    }
    if (error != "invalid detected rectangle") {
        std::cerr << "unexpected error for out-of-image quad: " << error << "\n";
        return 1;
    }

    // Quad touching the image border is still inside.
    const vdcam::Quad whole = vdcam::quadFromRect(cv::Rect2f(0.0F, 0.0F, 1.0F, 1.0F));
    if (!vdcam::perspectiveCorrect(frame, whole, out, error) || out.cols != 640 || out.rows != 480) {
        std::cerr << "full-frame quad should rectify to the frame size: " << error << "\n";
        return 1;
    }

    if (vdcam::perspectiveCorrect(cv::Mat(), normalized, out, error) || error != "empty source image") {
        std::cerr << "empty source should be rejected\n";
        return 1;
    }

    vdcam::Quad collapsed;
    collapsed.top_left = collapsed.top_right = collapsed.bottom_left = collapsed.bottom_right =
        cv::Point2f(0.5F, 0.5F);
    if (vdcam::perspectiveCorrect(frame, collapsed, out, error)) {
        std::cerr << "collapsed quad should be rejected\n";
        return 1;
    }

    return 0;
}
