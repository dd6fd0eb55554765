#include "tracking/template_tracker.hpp"

#include <cmath>
#include <iostream>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace {

cv::Mat crossPatch() {
    cv::Mat patch(16, 16, CV_8UC1, cv::Scalar(20));
    cv::line(patch, cv::Point(0, 0), cv::Point(15, 15), cv::Scalar(240), 1);
    cv::line(patch, cv::Point(0, 15), cv::Point(15, 0), cv::Scalar(180), 1);
    return patch;
}

}  // namespace

int main() {
    cv::Mat frame(120, 160, CV_8UC1, cv::Scalar(10));
    const cv::Rect target(70, 50, 16, 16);
    crossPatch().copyTo(frame(target));

    const cv::Mat templ = frame(target).clone();

    const cv::Rect coarse_window(40, 20, 80, 80);
    const auto coarse = vdcam::matchTemplateInWindow(frame, templ, coarse_window, 2);
    if (!coarse.valid) {
        std::cerr << "coarse match invalid\n";
        return 1;
    }

    const auto fine = vdcam::coarseFineMatch(frame, templ, coarse_window, 40, 2);
    if (!fine.valid) {
        std::cerr << "fine match invalid\n";
        return 1;
    }
    if (std::abs(fine.global_top_left.x - static_cast<float>(target.x)) > 1.0F ||
        std::abs(fine.global_top_left.y - static_cast<float>(target.y)) > 1.0F) {
        std::cerr << "fine match location mismatch\n";
        return 1;
    }

    // Window smaller than the template cannot match.
    const auto tiny = vdcam::matchTemplateInWindow(frame, templ, cv::Rect(0, 0, 8, 8), 1);
    if (tiny.valid) {
        std::cerr << "window smaller than the template should be invalid\n";
        return 1;
    }

    // Patch moved by (+9, -5) since it was last seen at `target`.
    cv::Mat next(120, 160, CV_8UC1, cv::Scalar(10));
    crossPatch().copyTo(next(cv::Rect(target.x + 9, target.y - 5, 16, 16)));
    cv::Point2f offset;
    float score = 0.0F;
    if (!vdcam::relocatePatch(next, templ, target, 16, 0.6F, offset, score)) {
        std::cerr << "relocatePatch should find the moved patch (score " << score << ")\n";
        return 1;
    }
    if (std::abs(offset.x - 9.0F) > 1.0F || std::abs(offset.y + 5.0F) > 1.0F) {
        std::cerr << "relocated offset mismatch: " << offset.x << "," << offset.y << "\n";
        return 1;
    }

    // Gone from the frame: the score stays below the threshold.
    cv::Mat blank(120, 160, CV_8UC1, cv::Scalar(10));
    cv::randu(blank, cv::Scalar(0), cv::Scalar(255));
    if (vdcam::relocatePatch(blank, templ, target, 16, 0.9F, offset, score)) {
        std::cerr << "relocatePatch should fail when the patch is gone\n";
        return 1;
    }

    // Patches are clamped to the frame and refused when too small.
    const cv::Mat edge = vdcam::extractPatch(frame, cv::Rect(150, 110, 20, 20));
    if (edge.cols != 10 || edge.rows != 10) {
        std::cerr << "extractPatch should clamp to the frame\n";
        return 1;
    }
    if (!vdcam::extractPatch(frame, cv::Rect(158, 118, 20, 20)).empty()) {
        std::cerr << "extractPatch should refuse patches below 4px\n";
        return 1;
    }

    const cv::Rect clamped = vdcam::clampRectToFrame(cv::Rect(-5, -5, 20, 20), frame.size());
    if (clamped != cv::Rect(0, 0, 15, 15)) {
        std::cerr << "clampRectToFrame mismatch\n";
        return 1;
    }

    return 0;
}
