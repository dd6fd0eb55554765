#include "detection/vision_detector.hpp"

namespace vdcam {

DetectionKinds detectionKindsFor(const CaptureFeatureFlags& flags) {
    DetectionKinds kinds;
    kinds.faces = flags.face_detection;
    kinds.codes = flags.code_detection;
    kinds.documents = flags.document_detection;
    return kinds;
}

}  // namespace vdcam
