#include <iostream>

#include "support/session_rig.hpp"

using vdcam::CameraMode;
using vdcam::LifecycleEvent;
using vdcam::SessionEvent;
using vdcam::SessionState;

namespace {

bool expectMode(vdcam::testing::SessionRig& rig, CameraMode mode, SessionState state, const char* step) {
    rig.controller.waitUntilIdle();
    if (rig.controller.mode() != mode || rig.controller.state() != state) {
        std::cerr << step << ": expected " << vdcam::toString(mode) << "/" << vdcam::toString(state) << ", got "
                  << vdcam::toString(rig.controller.mode()) << "/" << vdcam::toString(rig.controller.state()) << "\n";
        return false;
    }
    return true;
}

}  // namespace

int main() {
    if (vdcam::cameraModeFor(vdcam::CaptureFeatureFlags{}) != CameraMode::Standard) {
        std::cerr << "default flags should select the standard mode\n";
        return 1;
    }
    vdcam::CaptureFeatureFlags both;
    both.reality = true;
    both.native_document_detection = true;
    if (vdcam::cameraModeFor(both) != CameraMode::Reality) {
        std::cerr << "reality should win over native document\n";
        return 1;
    }

    vdcam::testing::SessionRig rig;
    rig.detector.setDetectResult(vdcam::testing::sampleObservations());
    rig.controller.handleLifecycle(LifecycleEvent::BecameActive);
    if (!expectMode(rig, CameraMode::Standard, SessionState::Active, "start")) {
        return 1;
    }
    rig.deliverFrame();
    if (rig.controller.entities().codes.empty()) {
        std::cerr << "standard mode should analyse frames\n";
        return 1;
    }

    // Native document scanner takes over the camera.
    vdcam::CaptureFeatureFlags flags = rig.controller.featureFlags();
    flags.native_document_detection = true;
    rig.controller.applyFeatureFlags(flags);
    if (!expectMode(rig, CameraMode::NativeDocument, SessionState::Active, "native document")) {
        return 1;
    }
    if (rig.session.isRunning() || !rig.native_document.isRunning()) {
        std::cerr << "native document mode should run only its own session\n";
        return 1;
    }
    if (!rig.controller.entities().codes.empty()) {
        std::cerr << "mode switch should forget entities\n";
        return 1;
    }
    if (rig.countEvents(SessionEvent::Kind::ModeChanged) != 1) {
        std::cerr << "mode change should be published once\n";
        return 1;
    }

    // Reality wins when both are requested.
    flags.reality = true;
    rig.controller.applyFeatureFlags(flags);
    if (!expectMode(rig, CameraMode::Reality, SessionState::Active, "reality")) {
        return 1;
    }
    if (!rig.reality.isRunning() || rig.native_document.isRunning() || rig.session.isRunning()) {
        std::cerr << "reality mode should run only the reality session\n";
        return 1;
    }

    // Back to the plain camera.
    flags.reality = false;
    flags.native_document_detection = false;
    rig.controller.applyFeatureFlags(flags);
    if (!expectMode(rig, CameraMode::Standard, SessionState::Active, "back to standard")) {
        return 1;
    }
    if (!rig.session.isRunning() || rig.reality.isRunning()) {
        std::cerr << "standard mode should run the capture session again\n";
        return 1;
    }

    // A flag change that keeps the mode does not restart capture.
    const int starts = rig.session.count("start");
    flags.face_detection = true;
    flags.video_recording = true;
    rig.controller.applyFeatureFlags(flags);
    rig.controller.waitUntilIdle();
    if (rig.session.count("start") != starts || !rig.session.isRunning()) {
        std::cerr << "same-mode flag change must not restart the session\n";
        return 1;
    }
    if (!rig.session.hasOutput(vdcam::OutputKind::Video) || !rig.scheduler.detectionKinds().faces) {
        std::cerr << "flag change should reach outputs and detection kinds\n";
        return 1;
    }

    // Without any detection request the metadata output goes away and frames
    // are no longer analysed.
    flags.face_detection = false;
    flags.code_detection = false;
    flags.document_detection = false;
    rig.controller.applyFeatureFlags(flags);
    rig.controller.waitUntilIdle();
    if (rig.session.hasOutput(vdcam::OutputKind::Metadata)) {
        std::cerr << "metadata output should be removed without detection flags\n";
        return 1;
    }
    const auto seen = rig.scheduler.stats().frames_seen;
    rig.deliverFrame();
    if (rig.scheduler.stats().frames_seen != seen) {
        std::cerr << "frames should not reach the scheduler without metadata output\n";
        return 1;
    }

    // Mode change while inactive only takes effect on the next activation.
    rig.controller.handleLifecycle(LifecycleEvent::BecameInactive);
    flags.code_detection = true;
    flags.reality = true;
    rig.controller.applyFeatureFlags(flags);
    if (!expectMode(rig, CameraMode::Reality, SessionState::Inactive, "mode change while inactive")) {
        return 1;
    }
    if (rig.running.running() != 0) {
        std::cerr << "nothing should run while inactive\n";
        return 1;
    }
    rig.controller.handleLifecycle(LifecycleEvent::BecameActive);
    if (!expectMode(rig, CameraMode::Reality, SessionState::Active, "reactivate in reality")) {
        return 1;
    }

    // A mode whose session cannot start reports and stays inactive.
    rig.native_document.setFailStart(true);
    flags.reality = false;
    flags.native_document_detection = true;
    rig.controller.applyFeatureFlags(flags);
    if (!expectMode(rig, CameraMode::NativeDocument, SessionState::Inactive, "failing mode")) {
        return 1;
    }
    if (rig.countEvents(SessionEvent::Kind::StartFailed) != 1 || rig.running.running() != 0) {
        std::cerr << "failed mode start should be reported with nothing running\n";
        return 1;
    }

    if (rig.running.peak() > 1) {
        std::cerr << "two underlying sessions ran at the same time\n";
        return 1;
    }

    return 0;
}
