#pragma once

#include <cstdint>
#include <string>

#include <opencv2/core.hpp>

namespace vdcam {

struct FramePacket {
    int64_t timestamp_ns{0};
    uint64_t sequence_id{0};
    cv::Mat bgr;
};

// Supplied by the hosting application. Treated as an immutable value: a change
// is a new value handed to CaptureSessionController::applyFeatureFlags.
struct CaptureFeatureFlags {
    bool face_detection{false};
    bool document_detection{false};
    bool native_document_detection{false};
    bool code_detection{true};
    bool reality{false};
    bool photo_capture{false};
    bool video_recording{false};

    bool wantsMetadataOutput() const { return face_detection || document_detection || code_detection; }
};

bool operator==(const CaptureFeatureFlags& a, const CaptureFeatureFlags& b);
bool operator!=(const CaptureFeatureFlags& a, const CaptureFeatureFlags& b);

enum class SessionState {
    Unconfigured,
    Configured,
    Active,
    Inactive,
};

enum class CameraMode {
    Standard,
    Reality,
    NativeDocument,
};

enum class LifecycleEvent {
    BecameActive,
    BecameInactive,
    EnteredBackground,
};

enum class OutputKind {
    Metadata,
    Photo,
    Video,
};

// reality wins over native document, which wins over the plain camera
CameraMode cameraModeFor(const CaptureFeatureFlags& flags);

const char* toString(SessionState state);
const char* toString(CameraMode mode);
const char* toString(LifecycleEvent event);
const char* toString(OutputKind kind);

}  // namespace vdcam
