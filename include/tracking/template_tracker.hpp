#pragma once

#include <opencv2/core.hpp>

namespace vdcam {

struct TemplateMatchResult {
    cv::Point2f global_top_left{0.0F, 0.0F};
    float score{-1.0F};
    bool valid{false};
};

cv::Rect clampRectToFrame(const cv::Rect& r, const cv::Size& frame_size);
cv::Point2f localToGlobal(const cv::Rect& search_window, const cv::Point2f& local_match);
TemplateMatchResult matchTemplateInWindow(
    const cv::Mat& frame_gray,
    const cv::Mat& template_gray,
    const cv::Rect& search_window,
    int stride = 1);
TemplateMatchResult coarseFineMatch(
    const cv::Mat& frame_gray,
    const cv::Mat& template_gray,
    const cv::Rect& coarse_window,
    int fine_window_size,
    int coarse_stride = 2);

// Looks for `patch` around the place it was last seen (`last_box`, pixels),
// searching `margin` pixels beyond it on every side. On success `offset` is
// the displacement of the patch since then.
bool relocatePatch(
    const cv::Mat& frame_gray,
    const cv::Mat& patch,
    const cv::Rect& last_box,
    int margin,
    float min_score,
    cv::Point2f& offset,
    float& score);

// Grey patch covering the quadrilateral's bounding box, clamped to the frame.
cv::Mat extractPatch(const cv::Mat& frame_gray, const cv::Rect& box);

}  // namespace vdcam
