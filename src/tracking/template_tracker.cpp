#include "tracking/template_tracker.hpp"

#include <algorithm>

#include <opencv2/imgproc.hpp>

namespace vdcam {

cv::Rect clampRectToFrame(const cv::Rect& r, const cv::Size& frame_size) {
    const int x0 = std::max(0, r.x);
    const int y0 = std::max(0, r.y);
    const int x1 = std::min(frame_size.width, r.x + r.width);
    const int y1 = std::min(frame_size.height, r.y + r.height);
    return cv::Rect(x0, y0, std::max(0, x1 - x0), std::max(0, y1 - y0));
}

cv::Point2f localToGlobal(const cv::Rect& search_window, const cv::Point2f& local_match) {
    return cv::Point2f(search_window.x + local_match.x, search_window.y + local_match.y);
}

TemplateMatchResult matchTemplateInWindow(
    const cv::Mat& frame_gray,
    const cv::Mat& template_gray,
    const cv::Rect& search_window,
    int stride) {
    TemplateMatchResult out;

    if (frame_gray.empty() || template_gray.empty() || frame_gray.type() != CV_8UC1 || template_gray.type() != CV_8UC1) {
        return out;
    }
    stride = std::max(1, stride);

    const cv::Rect window = clampRectToFrame(search_window, frame_gray.size());
    if (window.width < template_gray.cols || window.height < template_gray.rows) {
        return out;
    }

    const cv::Mat search_roi = frame_gray(window);
    cv::Mat search_for_match = search_roi;
    cv::Mat template_for_match = template_gray;

    if (stride > 1) {
        cv::resize(
            search_roi,
            search_for_match,
            cv::Size(std::max(1, search_roi.cols / stride), std::max(1, search_roi.rows / stride)),
            0, 0, cv::INTER_AREA);
        cv::resize(
            template_gray,
            template_for_match,
            cv::Size(std::max(1, template_gray.cols / stride), std::max(1, template_gray.rows / stride)),
            0, 0, cv::INTER_AREA);
    }

    if (search_for_match.cols < template_for_match.cols || search_for_match.rows < template_for_match.rows) {
        return out;
    }

    cv::Mat result;
    cv::matchTemplate(search_for_match, template_for_match, result, cv::TM_CCOEFF_NORMED);

    double max_val = 0.0;
    cv::Point max_loc;
    cv::minMaxLoc(result, nullptr, &max_val, nullptr, &max_loc);

    out.global_top_left = localToGlobal(
        window,
        cv::Point2f(static_cast<float>(max_loc.x * stride), static_cast<float>(max_loc.y * stride)));
    out.score = static_cast<float>(max_val);
    out.valid = true;
    return out;
}

TemplateMatchResult coarseFineMatch(
    const cv::Mat& frame_gray,
    const cv::Mat& template_gray,
    const cv::Rect& coarse_window,
    int fine_window_size,
    int coarse_stride) {
    const TemplateMatchResult coarse = matchTemplateInWindow(frame_gray, template_gray, coarse_window, coarse_stride);
    if (!coarse.valid) {
        return coarse;
    }

    const int fine_half = std::max(1, fine_window_size / 2);
    const cv::Rect fine_window(
        static_cast<int>(coarse.global_top_left.x) - fine_half,
        static_cast<int>(coarse.global_top_left.y) - fine_half,
        template_gray.cols + 2 * fine_half,
        template_gray.rows + 2 * fine_half);

    return matchTemplateInWindow(frame_gray, template_gray, fine_window, 1);
}

bool relocatePatch(
    const cv::Mat& frame_gray,
    const cv::Mat& patch,
    const cv::Rect& last_box,
    int margin,
    float min_score,
    cv::Point2f& offset,
    float& score) {
    score = -1.0F;
    if (patch.empty() || frame_gray.empty()) {
        return false;
    }
    margin = std::max(1, margin);

    const cv::Rect search(
        last_box.x - margin,
        last_box.y - margin,
        patch.cols + 2 * margin,
        patch.rows + 2 * margin);

    // Small patches do not survive downsampling, match them at full resolution.
    const int stride = (std::min(patch.cols, patch.rows) >= 32) ? 2 : 1;
    const TemplateMatchResult match = coarseFineMatch(frame_gray, patch, search, margin, stride);
    if (!match.valid) {
        return false;
    }
    score = match.score;
    if (match.score < min_score) {
        return false;
    }
    offset = match.global_top_left - cv::Point2f(static_cast<float>(last_box.x), static_cast<float>(last_box.y));
    return true;
}

cv::Mat extractPatch(const cv::Mat& frame_gray, const cv::Rect& box) {
    const cv::Rect clamped = clampRectToFrame(box, frame_gray.size());
    if (clamped.width < 4 || clamped.height < 4) {
        return cv::Mat();
    }
    return frame_gray(clamped).clone();
}

}  // namespace vdcam
