#include "core/types.hpp"

namespace vdcam {

bool operator==(const CaptureFeatureFlags& a, const CaptureFeatureFlags& b) {
    return a.face_detection == b.face_detection &&
           a.document_detection == b.document_detection &&
           a.native_document_detection == b.native_document_detection &&
           a.code_detection == b.code_detection &&
           a.reality == b.reality &&
           a.photo_capture == b.photo_capture &&
           a.video_recording == b.video_recording;
}

bool operator!=(const CaptureFeatureFlags& a, const CaptureFeatureFlags& b) {
    return !(a == b);
}

CameraMode cameraModeFor(const CaptureFeatureFlags& flags) {
    if (flags.reality) {
        return CameraMode::Reality;
    }
    if (flags.native_document_detection) {
        return CameraMode::NativeDocument;
    }
    return CameraMode::Standard;
}

const char* toString(SessionState state) {
    switch (state) {
        case SessionState::Unconfigured: return "unconfigured";
        case SessionState::Configured: return "configured";
        case SessionState::Active: return "active";
        case SessionState::Inactive: return "inactive";
    }
    return "unknown";
}

const char* toString(CameraMode mode) {
    switch (mode) {
        case CameraMode::Standard: return "standard";
        case CameraMode::Reality: return "reality";
        case CameraMode::NativeDocument: return "native_document";
    }
    return "unknown";
}

const char* toString(LifecycleEvent event) {
    switch (event) {
        case LifecycleEvent::BecameActive: return "became_active";
        case LifecycleEvent::BecameInactive: return "became_inactive";
        case LifecycleEvent::EnteredBackground: return "entered_background";
    }
    return "unknown";
}

const char* toString(OutputKind kind) {
    switch (kind) {
        case OutputKind::Metadata: return "metadata";
        case OutputKind::Photo: return "photo";
        case OutputKind::Video: return "video";
    }
    return "unknown";
}

}  // namespace vdcam
