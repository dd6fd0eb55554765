#include "geometry/geometry_utils.hpp"

#include <cmath>
#include <iostream>

#include <opencv2/core.hpp>

namespace {

bool near(const cv::Point2f& a, const cv::Point2f& b, float tol = 1e-4F) {
    return std::abs(a.x - b.x) <= tol && std::abs(a.y - b.y) <= tol;
}

}  // namespace

int main() {
    const cv::Size frame(640, 480);

    // Normalized -> pixel scaling.
    const cv::Point2f center = vdcam::scalePoint(cv::Point2f(0.5F, 0.5F), frame);
    if (!near(center, cv::Point2f(320.0F, 240.0F))) {
        std::cerr << "scalePoint(0.5,0.5) should land on the frame center\n";
        return 1;
    }
    const cv::Rect2f r = vdcam::scaleRect(cv::Rect2f(0.25F, 0.5F, 0.5F, 0.25F), frame);
    if (std::abs(r.x - 160.0F) > 1e-3F || std::abs(r.y - 240.0F) > 1e-3F ||
        std::abs(r.width - 320.0F) > 1e-3F || std::abs(r.height - 120.0F) > 1e-3F) {
        std::cerr << "scaleRect mismatch\n";
        return 1;
    }

    const vdcam::Quad unit = vdcam::quadFromRect(cv::Rect2f(0.1F, 0.2F, 0.3F, 0.4F));
    const vdcam::Quad px = vdcam::scaleQuad(unit, frame);
    if (!near(px.top_left, cv::Point2f(64.0F, 96.0F), 1e-3F) ||
        !near(px.bottom_right, cv::Point2f(256.0F, 288.0F), 1e-3F)) {
        std::cerr << "scaleQuad mismatch\n";
        return 1;
    }
    const vdcam::Quad back = vdcam::normalizeQuad(px, frame);
    if (!near(back.top_right, unit.top_right) || !near(back.bottom_left, unit.bottom_left)) {
        std::cerr << "normalizeQuad should undo scaleQuad\n";
        return 1;
    }

    // Bounding box is the union of the corners, also for skewed quads.
    vdcam::Quad skewed;
    skewed.top_left = cv::Point2f(0.2F, 0.1F);
    skewed.top_right = cv::Point2f(0.8F, 0.15F);
    skewed.bottom_right = cv::Point2f(0.9F, 0.7F);
    skewed.bottom_left = cv::Point2f(0.1F, 0.6F);
    const cv::Rect2f box = vdcam::unionOfCorners(skewed);
    if (std::abs(box.x - 0.1F) > 1e-5F || std::abs(box.y - 0.1F) > 1e-5F ||
        std::abs(box.width - 0.8F) > 1e-5F || std::abs(box.height - 0.6F) > 1e-5F) {
        std::cerr << "unionOfCorners should span min/max of the corners\n";
        return 1;
    }

    // A degenerate quad still yields a (zero-size) box at its point.
    vdcam::Quad point_quad;
    point_quad.top_left = point_quad.top_right = point_quad.bottom_left = point_quad.bottom_right =
        cv::Point2f(0.3F, 0.3F);
    const cv::Rect2f point_box = vdcam::unionOfCorners(point_quad);
    if (point_box.width != 0.0F || point_box.height != 0.0F || !near(point_box.tl(), cv::Point2f(0.3F, 0.3F))) {
        std::cerr << "degenerate quad should give a zero-size box at its corner\n";
        return 1;
    }

    // Outline order is TL, BL, BR, TR and closes on TL.
    const auto path = vdcam::quadrilateralPath(skewed, vdcam::scaleTransform(100.0, 200.0));
    if (path.size() != 5U) {
        std::cerr << "quadrilateral path should have 5 vertices\n";
        return 1;
    }
    if (!near(path[0], cv::Point2f(20.0F, 20.0F), 1e-3F) || !near(path[1], cv::Point2f(10.0F, 120.0F), 1e-3F) ||
        !near(path[2], cv::Point2f(90.0F, 140.0F), 1e-3F) || !near(path[3], cv::Point2f(80.0F, 30.0F), 1e-3F) ||
        !near(path[4], path[0])) {
        std::cerr << "quadrilateral path vertex order mismatch\n";
        return 1;
    }
    const auto untouched = vdcam::quadrilateralPath(
        skewed.top_left, skewed.bottom_left, skewed.bottom_right, skewed.top_right, vdcam::identityTransform());
    if (!near(untouched[2], skewed.bottom_right)) {
        std::cerr << "identity transform should keep the vertices\n";
        return 1;
    }

    // Bottom-left origin <-> top-left origin.
    if (!near(vdcam::flipNormalizedY(cv::Point2f(0.25F, 0.1F)), cv::Point2f(0.25F, 0.9F))) {
        std::cerr << "flipNormalizedY(point) mismatch\n";
        return 1;
    }
    const vdcam::Quad flipped = vdcam::flipNormalizedY(unit);
    if (!near(flipped.top_left, cv::Point2f(0.1F, 0.4F)) || !near(flipped.bottom_right, cv::Point2f(0.4F, 0.8F))) {
        std::cerr << "flipNormalizedY(quad) should keep the top corners on top\n";
        return 1;
    }
    if (vdcam::flipNormalizedY(flipped) != unit) {
        std::cerr << "flipping twice should be the identity\n";
        return 1;
    }

    const vdcam::Quad moved = vdcam::translateQuad(px, cv::Point2f(10.0F, -6.0F));
    if (!near(moved.top_left, cv::Point2f(74.0F, 90.0F), 1e-3F)) {
        std::cerr << "translateQuad mismatch\n";
        return 1;
    }

    const auto corners = vdcam::cornerPoints(skewed);
    if (vdcam::quadFromCornerPoints(corners) != skewed || !near(corners[2], skewed.bottom_right)) {
        std::cerr << "cornerPoints should be clockwise from the top-left\n";
        return 1;
    }

    const cv::Mat mask = vdcam::quadMask(cv::Size(100, 80), vdcam::quadFromRect(cv::Rect2f(10.0F, 10.0F, 40.0F, 30.0F)));
    if (mask.type() != CV_8UC1 || mask.at<uint8_t>(25, 30) != 255 || mask.at<uint8_t>(70, 90) != 0) {
        std::cerr << "quadMask should fill only the quadrilateral\n";
        return 1;
    }

    return 0;
}
