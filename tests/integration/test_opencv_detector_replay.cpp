#include "detection/opencv_detector.hpp"

#include <cmath>
#include <iostream>

#include <opencv2/imgproc.hpp>
#include <opencv2/objdetect.hpp>

#include "tracking/entity_store.hpp"

namespace {

// Bright sheet with a few printed lines on a dark desk.
cv::Mat documentFrame(const cv::Point& offset) {
    cv::Mat frame(480, 640, CV_8UC3, cv::Scalar(35, 30, 30));
    const cv::Rect sheet(160 + offset.x, 100 + offset.y, 320, 280);
    cv::rectangle(frame, sheet, cv::Scalar(235, 235, 235), cv::FILLED);
    for (int i = 0; i < 6; ++i) {
        const int y = sheet.y + 40 + i * 35;
        cv::line(frame, cv::Point(sheet.x + 30, y), cv::Point(sheet.x + 30 + 200 - i * 20, y), cv::Scalar(20, 20, 20), 3);
    }
    return frame;
}

cv::Mat codeFrame(const std::string& payload) {
    cv::Mat modules;
    cv::Ptr<cv::QRCodeEncoder> encoder = cv::QRCodeEncoder::create();
    encoder->encode(payload, modules);
    cv::Mat big;
    cv::resize(modules, big, cv::Size(), 8.0, 8.0, cv::INTER_NEAREST);
    cv::Mat frame(480, 640, CV_8UC3, cv::Scalar(255, 255, 255));
    cv::Mat big_bgr;
    cv::cvtColor(big, big_bgr, cv::COLOR_GRAY2BGR);
    const int x = (frame.cols - big_bgr.cols) / 2;
    const int y = (frame.rows - big_bgr.rows) / 2;
    big_bgr.copyTo(frame(cv::Rect(x, y, big_bgr.cols, big_bgr.rows)));
    return frame;
}

}  // namespace

int main() {
    vdcam::DetectorConfig cfg;
    vdcam::OpenCvDetector detector(cfg);
    std::string error;
    if (!detector.initialize(error) || detector.faceDetectionAvailable()) {
        std::cerr << "detector without a cascade should initialize with faces disabled\n";
        return 1;
    }

    // Document detection.
    const cv::Mat doc = documentFrame(cv::Point(0, 0));
    vdcam::DetectionKinds kinds;
    kinds.codes = false;
    kinds.documents = true;
    vdcam::Observations obs;
    if (!detector.detect(doc, kinds, obs, error)) {
        std::cerr << "document detection failed: " << error << "\n";
        return 1;
    }
    if (obs.regions.size() != 1U || obs.seeds.size() != 1U || obs.seeds[0].patch.empty()) {
        std::cerr << "expected one document with a tracking seed, got " << obs.regions.size() << "\n";
        return 1;
    }
    const vdcam::Quad found = obs.regions[0].corners;
    if (std::abs(found.top_left.x - 0.25F) > 0.02F || std::abs(found.top_left.y - 0.208F) > 0.02F ||
        std::abs(found.bottom_right.x - 0.75F) > 0.02F || std::abs(found.bottom_right.y - 0.792F) > 0.02F) {
        std::cerr << "document corners off: " << vdcam::describe(obs.regions[0]) << "\n";
        return 1;
    }
    if (obs.regions[0].confidence <= 0.0F || obs.regions[0].confidence > 1.0F) {
        std::cerr << "document confidence should be in (0,1]\n";
        return 1;
    }

    // Track it into a frame where the sheet moved.
    vdcam::TrackedEntityStore store;
    if (!store.commit(vdcam::PassKind::Detection, obs, store.generation(), 0, doc)) {
        std::cerr << "commit failed\n";
        return 1;
    }
    const auto requests = store.trackingRequests();
    const vdcam::RegionId id = requests.at(0).region.id;
    const cv::Mat moved = documentFrame(cv::Point(12, 8));
    vdcam::Observations tracked;
    if (!detector.track(moved, requests, tracked, error) || tracked.regions.size() != 1U) {
        std::cerr << "tracking should relocate the sheet: " << error << "\n";
        return 1;
    }
    const float dx = (tracked.regions[0].corners.top_left.x - found.top_left.x) * 640.0F;
    const float dy = (tracked.regions[0].corners.top_left.y - found.top_left.y) * 480.0F;
    if (std::abs(dx - 12.0F) > 1.5F || std::abs(dy - 8.0F) > 1.5F) {
        std::cerr << "tracked displacement mismatch: " << dx << "," << dy << "\n";
        return 1;
    }
    if (tracked.regions[0].id != id || tracked.seeds.size() != 1U) {
        std::cerr << "tracking should carry the region id and re-seed it\n";
        return 1;
    }

    // A blank frame loses the track.
    const cv::Mat desk(480, 640, CV_8UC3, cv::Scalar(35, 30, 30));
    if (!detector.track(desk, requests, tracked, error) || !tracked.regions.empty()) {
        std::cerr << "sheet should not be found on an empty desk\n";
        return 1;
    }

    // QR codes.
    const std::string payload = "https://example.org/checkin?seat=14C";
    vdcam::DetectionKinds code_kinds;
    vdcam::Observations codes;
    if (!detector.detect(codeFrame(payload), code_kinds, codes, error)) {
        std::cerr << "code detection failed: " << error << "\n";
        return 1;
    }
    if (codes.codes.size() != 1U) {
        std::cerr << "expected one QR code, got " << codes.codes.size() << "\n";
        return 1;
    }
    const vdcam::ObservedCode& code = codes.codes[0];
    if (code.payload != payload || code.symbology != "qr" || !code.raw_payload.has_value() ||
        code.raw_payload->size() != payload.size()) {
        std::cerr << "decoded code mismatch: " << vdcam::describe(code) << "\n";
        return 1;
    }
    const cv::Rect2f box = vdcam::unionOfCorners(code.corners);
    if (box.x < 0.2F || box.x + box.width > 0.8F || box.width <= 0.05F) {
        std::cerr << "code corners should sit around the frame center\n";
        return 1;
    }

    // Nothing requested, nothing found.
    vdcam::DetectionKinds none;
    none.codes = false;
    vdcam::Observations empty;
    if (!detector.detect(doc, none, empty, error) || !empty.empty()) {
        std::cerr << "no kinds should produce no observations\n";
        return 1;
    }
    if (detector.detect(cv::Mat(), code_kinds, empty, error)) {
        std::cerr << "empty frame should be rejected\n";
        return 1;
    }

    const vdcam::Quad ordered = vdcam::orderCorners(
        {cv::Point2f(10.0F, 90.0F), cv::Point2f(90.0F, 10.0F), cv::Point2f(10.0F, 10.0F), cv::Point2f(90.0F, 90.0F)});
    if (ordered.top_left != cv::Point2f(10.0F, 10.0F) || ordered.top_right != cv::Point2f(90.0F, 10.0F) ||
        ordered.bottom_right != cv::Point2f(90.0F, 90.0F) || ordered.bottom_left != cv::Point2f(10.0F, 90.0F)) {
        std::cerr << "orderCorners mismatch\n";
        return 1;
    }

    return 0;
}
