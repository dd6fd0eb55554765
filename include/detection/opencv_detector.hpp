#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/objdetect.hpp>

#include "core/config.hpp"
#include "detection/vision_detector.hpp"

namespace vdcam {

// QR codes through cv::QRCodeDetector, faces through a Haar cascade and
// documents through an edge/contour quadrilateral search. Tracking passes
// relocate each seed's grey patch by template matching.
class OpenCvDetector : public VisionDetector {
public:
    explicit OpenCvDetector(const DetectorConfig& config);

    // Loads the face cascade when one is configured. Without it face
    // detection yields nothing.
    bool initialize(std::string& error);
    bool faceDetectionAvailable() const { return has_face_cascade_; }

    bool detect(
        const cv::Mat& frame_bgr,
        const DetectionKinds& kinds,
        Observations& out,
        std::string& error) override;
    bool track(
        const cv::Mat& frame_bgr,
        const std::vector<TrackingRequest>& requests,
        Observations& out,
        std::string& error) override;
    void reset() override;

    // Document corner search on its own, corners in pixels (TL, TR, BR, BL).
    std::vector<Quad> findDocumentQuads(const cv::Mat& gray) const;

private:
    void detectCodes(const cv::Mat& frame_bgr, const cv::Mat& gray, Observations& out);
    void detectFaces(const cv::Mat& gray, Observations& out);
    void detectDocuments(const cv::Mat& gray, Observations& out);
    int faceIdFor(const cv::Rect2f& normalized_bounds, std::vector<bool>& claimed);

    DetectorConfig config_;
    cv::QRCodeDetector qr_;
    cv::CascadeClassifier face_cascade_;
    bool has_face_cascade_{false};
    std::vector<ObservedFace> last_faces_;
    int next_face_id_{1};
};

// Orders four corners as TL, TR, BR, BL using coordinate sums and differences.
Quad orderCorners(const std::vector<cv::Point2f>& corners);

// Integer pixel box covering a quadrilateral, clamped to the frame.
cv::Rect pixelBox(const Quad& pixels, const cv::Size& frame_size);

}  // namespace vdcam
