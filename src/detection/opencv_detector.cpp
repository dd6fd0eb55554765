#include "detection/opencv_detector.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

#include <opencv2/imgproc.hpp>

#include "tracking/template_tracker.hpp"

namespace vdcam {

namespace {

constexpr double kFaceMatchOverlap = 0.3;
constexpr int kDescriptorGrid = 20;

cv::Mat toGray(const cv::Mat& frame) {
    if (frame.channels() == 1) {
        return frame;
    }
    cv::Mat gray;
    if (frame.channels() == 4) {
        cv::cvtColor(frame, gray, cv::COLOR_BGRA2GRAY);
    } else {
        cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
    }
    return gray;
}

std::string codeDescriptor(const std::string& symbology, const Quad& normalized) {
    const cv::Rect2f box = unionOfCorners(normalized);
    const int cx = static_cast<int>((box.x + box.width * 0.5F) * kDescriptorGrid);
    const int cy = static_cast<int>((box.y + box.height * 0.5F) * kDescriptorGrid);
    std::ostringstream oss;
    oss << symbology << '@' << cx << ',' << cy;
    return oss.str();
}

}  // namespace

Quad orderCorners(const std::vector<cv::Point2f>& corners) {
    Quad q;
    if (corners.size() != 4U) {
        return q;
    }
    auto by_sum = [](const cv::Point2f& a, const cv::Point2f& b) { return a.x + a.y < b.x + b.y; };
    auto by_diff = [](const cv::Point2f& a, const cv::Point2f& b) { return a.y - a.x < b.y - b.x; };
    q.top_left = *std::min_element(corners.begin(), corners.end(), by_sum);
    q.bottom_right = *std::max_element(corners.begin(), corners.end(), by_sum);
    q.top_right = *std::min_element(corners.begin(), corners.end(), by_diff);
    q.bottom_left = *std::max_element(corners.begin(), corners.end(), by_diff);
    return q;
}

cv::Rect pixelBox(const Quad& pixels, const cv::Size& frame_size) {
    const cv::Rect2f box = unionOfCorners(pixels);
    const int x0 = static_cast<int>(std::floor(box.x));
    const int y0 = static_cast<int>(std::floor(box.y));
    const int x1 = static_cast<int>(std::ceil(box.x + box.width));
    const int y1 = static_cast<int>(std::ceil(box.y + box.height));
    return clampRectToFrame(cv::Rect(x0, y0, x1 - x0, y1 - y0), frame_size);
}

OpenCvDetector::OpenCvDetector(const DetectorConfig& config)
    : config_(config) {}

bool OpenCvDetector::initialize(std::string& error) {
    has_face_cascade_ = false;
    if (config_.face_cascade_path.empty()) {
        error.clear();
        return true;
    }
    try {
        if (!face_cascade_.load(config_.face_cascade_path)) {
            error = "failed to load face cascade: " + config_.face_cascade_path;
            return false;
        }
    } catch (const cv::Exception& e) {
        error = std::string("failed to load face cascade: ") + e.what();
        return false;
    }
    has_face_cascade_ = true;
    error.clear();
    return true;
}

void OpenCvDetector::reset() {
    last_faces_.clear();
}

bool OpenCvDetector::detect(
    const cv::Mat& frame_bgr,
    const DetectionKinds& kinds,
    Observations& out,
    std::string& error) {
    out.clear();
    if (frame_bgr.empty()) {
        error = "empty frame";
        return false;
    }

    try {
        const cv::Mat gray = toGray(frame_bgr);
        if (kinds.codes) {
            detectCodes(frame_bgr, gray, out);
        }
        if (kinds.faces) {
            detectFaces(gray, out);
        } else {
            last_faces_.clear();
        }
        if (kinds.documents) {
            detectDocuments(gray, out);
        }
    } catch (const cv::Exception& e) {
        out.clear();
        error = std::string("detection failed: ") + e.what();
        return false;
    }

    error.clear();
    return true;
}

void OpenCvDetector::detectCodes(const cv::Mat& frame_bgr, const cv::Mat& gray, Observations& out) {
    std::vector<std::string> decoded;
    cv::Mat points;
    const bool found = qr_.detectAndDecodeMulti(frame_bgr, decoded, points);
    if (!found || points.empty()) {
        return;
    }

    cv::Mat pts32;
    points.convertTo(pts32, CV_32F);
    const cv::Mat flat = pts32.reshape(2, 1);
    const std::size_t count = static_cast<std::size_t>(flat.cols / 4);
    const cv::Size size = frame_bgr.size();

    for (std::size_t i = 0; i < count; ++i) {
        std::array<cv::Point2f, 4> corners{};
        for (int k = 0; k < 4; ++k) {
            const cv::Vec2f v = flat.at<cv::Vec2f>(0, static_cast<int>(i) * 4 + k);
            corners[static_cast<std::size_t>(k)] = cv::Point2f(v[0], v[1]);
        }
        const Quad pixels = quadFromCornerPoints(corners);

        ObservedCode code;
        code.payload = (i < decoded.size()) ? decoded[i] : std::string();
        if (!code.payload.empty()) {
            code.raw_payload = std::vector<uint8_t>(code.payload.begin(), code.payload.end());
        }
        code.symbology = "qr";
        code.corners = normalizeQuad(pixels, size);
        code.descriptor = codeDescriptor(code.symbology, code.corners);

        TrackingSeed seed;
        seed.kind = EntityKind::Code;
        seed.source_index = out.codes.size();
        seed.pixels = pixels;
        seed.patch = extractPatch(gray, pixelBox(pixels, size));

        out.codes.push_back(std::move(code));
        out.seeds.push_back(std::move(seed));
    }
}

int OpenCvDetector::faceIdFor(const cv::Rect2f& normalized_bounds, std::vector<bool>& claimed) {
    double best = kFaceMatchOverlap;
    int best_index = -1;
    for (std::size_t i = 0; i < last_faces_.size(); ++i) {
        if (claimed[i]) {
            continue;
        }
        const double overlap = overlapRatio(normalized_bounds, last_faces_[i].bounds);
        if (overlap >= best) {
            best = overlap;
            best_index = static_cast<int>(i);
        }
    }
    if (best_index < 0) {
        return next_face_id_++;
    }
    claimed[static_cast<std::size_t>(best_index)] = true;
    return last_faces_[static_cast<std::size_t>(best_index)].face_id;
}

void OpenCvDetector::detectFaces(const cv::Mat& gray, Observations& out) {
    if (!has_face_cascade_) {
        return;
    }

    cv::Mat equalized;
    cv::equalizeHist(gray, equalized);
    std::vector<cv::Rect> rects;
    const int min_side = std::max(24, std::min(gray.cols, gray.rows) / 12);
    face_cascade_.detectMultiScale(equalized, rects, 1.1, 4, 0, cv::Size(min_side, min_side));

    const cv::Size size = gray.size();
    std::vector<bool> claimed(last_faces_.size(), false);
    std::vector<ObservedFace> faces;
    for (const auto& r : rects) {
        const Quad pixels = quadFromRect(cv::Rect2f(r));

        ObservedFace face;
        face.bounds = unionOfCorners(normalizeQuad(pixels, size));
        face.face_id = faceIdFor(face.bounds, claimed);

        TrackingSeed seed;
        seed.kind = EntityKind::Face;
        seed.source_index = out.faces.size();
        seed.pixels = pixels;
        seed.patch = extractPatch(gray, pixelBox(pixels, size));

        faces.push_back(face);
        out.faces.push_back(face);
        out.seeds.push_back(std::move(seed));
    }
    last_faces_ = std::move(faces);
}

std::vector<Quad> OpenCvDetector::findDocumentQuads(const cv::Mat& gray) const {
    cv::Mat blurred;
    cv::GaussianBlur(gray, blurred, cv::Size(5, 5), 0);
    cv::Mat edges;
    cv::Canny(blurred, edges, config_.canny_low, config_.canny_high);
    cv::dilate(edges, edges, cv::getStructuringElement(cv::MORPH_RECT, cv::Size(3, 3)));

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(edges, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

    const double min_area = config_.min_document_area_ratio * static_cast<double>(gray.total());
    std::vector<std::pair<double, Quad>> candidates;
    for (const auto& contour : contours) {
        const double area = cv::contourArea(contour);
        if (area < min_area) {
            continue;
        }
        std::vector<cv::Point> approx;
        cv::approxPolyDP(contour, approx, 0.02 * cv::arcLength(contour, true), true);
        if (approx.size() != 4U || !cv::isContourConvex(approx)) {
            continue;
        }
        std::vector<cv::Point2f> corners;
        for (const auto& p : approx) {
            corners.emplace_back(static_cast<float>(p.x), static_cast<float>(p.y));
        }
        candidates.emplace_back(area, orderCorners(corners));
    }

    std::sort(candidates.begin(), candidates.end(), [](const auto& a, const auto& b) { return a.first > b.first; });
    std::vector<Quad> quads;
    for (const auto& c : candidates) {
        if (static_cast<int>(quads.size()) >= config_.max_documents) {
            break;
        }
        quads.push_back(c.second);
    }
    return quads;
}

void OpenCvDetector::detectDocuments(const cv::Mat& gray, Observations& out) {
    const cv::Size size = gray.size();
    const double frame_area = static_cast<double>(gray.total());
    for (const auto& pixels : findDocumentQuads(gray)) {
        ObservedRegion region;
        region.corners = normalizeQuad(pixels, size);
        region.confidence = static_cast<float>(
            std::min(1.0, static_cast<double>(unionOfCorners(pixels).area()) / frame_area));

        TrackingSeed seed;
        seed.kind = EntityKind::Region;
        seed.source_index = out.regions.size();
        seed.pixels = pixels;
        seed.patch = extractPatch(gray, pixelBox(pixels, size));

        out.regions.push_back(region);
        out.seeds.push_back(std::move(seed));
    }
}

bool OpenCvDetector::track(
    const cv::Mat& frame_bgr,
    const std::vector<TrackingRequest>& requests,
    Observations& out,
    std::string& error) {
    out.clear();
    if (frame_bgr.empty()) {
        error = "empty frame";
        return false;
    }

    try {
        const cv::Mat gray = toGray(frame_bgr);
        const cv::Size size = gray.size();
        for (const auto& req : requests) {
            const cv::Rect last_box = pixelBox(req.pixels, size);
            cv::Point2f offset;
            float score = 0.0F;
            if (!relocatePatch(gray, req.patch, last_box, config_.track_search_margin_px,
                               config_.min_track_score, offset, score)) {
                continue;
            }

            const Quad pixels = translateQuad(req.pixels, offset);
            const Quad normalized = normalizeQuad(pixels, size);

            TrackingSeed seed;
            seed.kind = req.kind;
            seed.pixels = pixels;
            seed.patch = req.patch;

            if (req.kind == EntityKind::Face) {
                ObservedFace face = req.face;
                face.bounds = unionOfCorners(normalized);
                seed.source_index = out.faces.size();
                out.faces.push_back(face);
            } else if (req.kind == EntityKind::Code) {
                ObservedCode code = req.code;
                code.corners = normalized;
                seed.source_index = out.codes.size();
                out.codes.push_back(code);
            } else {
                ObservedRegion region = req.region;
                region.corners = normalized;
                region.confidence = score;
                seed.source_index = out.regions.size();
                out.regions.push_back(region);
            }
            out.seeds.push_back(std::move(seed));
        }
        if (!out.faces.empty()) {
            last_faces_ = out.faces;
        }
    } catch (const cv::Exception& e) {
        out.clear();
        error = std::string("tracking failed: ") + e.what();
        return false;
    }

    error.clear();
    return true;
}

}  // namespace vdcam
