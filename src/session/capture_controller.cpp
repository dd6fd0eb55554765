#include "session/capture_controller.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

#include "camera/device_enumerator.hpp"
#include "core/time_utils.hpp"
#include "geometry/perspective.hpp"

namespace vdcam {

const char* toString(SessionEvent::Kind kind) {
    switch (kind) {
        case SessionEvent::Kind::StateChanged: return "state_changed";
        case SessionEvent::Kind::ModeChanged: return "mode_changed";
        case SessionEvent::Kind::OutputsChanged: return "outputs_changed";
        case SessionEvent::Kind::StartFailed: return "start_failed";
        case SessionEvent::Kind::DeviceSwitched: return "device_switched";
        case SessionEvent::Kind::DeviceSwitchFailed: return "device_switch_failed";
        case SessionEvent::Kind::PermissionChanged: return "permission_changed";
    }
    return "unknown";
}

CaptureSessionController::CaptureSessionController(const AppConfig& config, CaptureComponents components)
    : config_(config),
      components_(components),
      flags_(config.features) {
    mode_.store(cameraModeFor(flags_));
    components_.scheduler.setDetectionKinds(detectionKindsFor(flags_));
    components_.session.setFrameHandler([this](const FramePacket& frame) { onFrame(frame); });
    permission_token_ = components_.permission.addListener([this](PermissionState permission) {
        post("permission", [this, permission]() { permissionChangedOnContext(permission); });
    });
}

CaptureSessionController::~CaptureSessionController() {
    shutdown();
}

void CaptureSessionController::shutdown() {
    if (shut_down_.exchange(true)) {
        return;
    }
    components_.permission.removeListener(permission_token_);
    components_.session.setFrameHandler(FrameHandler());
    context_.post([this]() {
        stopAllOnContext();
        components_.scheduler.forget();
    });
    context_.stop();
}

void CaptureSessionController::post(const char* what, std::function<void()> task) {
    if (!context_.post(std::move(task))) {
        std::cerr << "controller: dropped '" << what << "' after shutdown\n";
    }
}

CaptureFeatureFlags CaptureSessionController::featureFlags() const {
    std::lock_guard<std::mutex> lock(flags_mutex_);
    return flags_;
}

void CaptureSessionController::handleLifecycle(LifecycleEvent event) {
    post("lifecycle", [this, event]() {
        if (event == LifecycleEvent::BecameActive) {
            foreground_.store(true);
            if (config_.session.auto_run && !paused_.load()) {
                activateOnContext(toString(event));
            }
            return;
        }
        foreground_.store(false);
        inactivateOnContext(toString(event));
    });
}

void CaptureSessionController::applyFeatureFlags(const CaptureFeatureFlags& flags) {
    post("flags", [this, flags]() { applyFlagsOnContext(flags); });
}

void CaptureSessionController::configure() {
    post("configure", [this]() { configureOnContext(); });
}

void CaptureSessionController::pause() {
    post("pause", [this]() {
        paused_.store(true);
        inactivateOnContext("pause");
    });
}

void CaptureSessionController::resume() {
    post("resume", [this]() {
        paused_.store(false);
        activateOnContext("resume");
    });
}

void CaptureSessionController::switchCamera() {
    if (state_.load() == SessionState::Unconfigured) {
        throw std::logic_error("switchCamera called before the capture session was configured");
    }
    post("switch", [this]() { switchDeviceOnContext(std::nullopt); });
}

void CaptureSessionController::switchToDevice(const std::string& unique_id) {
    if (state_.load() == SessionState::Unconfigured) {
        throw std::logic_error("switchToDevice called before the capture session was configured");
    }
    post("switch", [this, unique_id]() { switchDeviceOnContext(unique_id); });
}

void CaptureSessionController::requestPermission() {
    components_.permission.requestAuthorization([this](PermissionState permission) {
        post("permission", [this, permission]() { permissionChangedOnContext(permission); });
    });
}

void CaptureSessionController::openSettings() {
    components_.permission.openSettings();
}

void CaptureSessionController::waitUntilIdle() {
    context_.drain();
}

CaptureSessionController::ListenerToken CaptureSessionController::addListener(Listener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    const ListenerToken token = next_token_++;
    listeners_[token] = std::move(listener);
    return token;
}

void CaptureSessionController::removeListener(ListenerToken token) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(token);
}

void CaptureSessionController::publish(SessionEvent::Kind kind, const std::string& message) {
    SessionEvent event;
    event.kind = kind;
    event.state = state_.load();
    event.mode = mode_.load();
    event.message = message;

    std::vector<Listener> to_notify;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        for (const auto& kv : listeners_) {
            to_notify.push_back(kv.second);
        }
    }
    for (auto& listener : to_notify) {
        listener(event);
    }
}

void CaptureSessionController::setState(SessionState next, const char* reason) {
    const SessionState prev = state_.exchange(next);
    if (prev == next) {
        return;
    }
    std::cerr << "controller: " << toString(prev) << " -> " << toString(next) << " (" << reason << ")\n";
    publish(SessionEvent::Kind::StateChanged, reason);
}

void CaptureSessionController::applyOutputsOnContext() {
    const CaptureFeatureFlags flags = featureFlags();
    const std::pair<OutputKind, bool> wanted[] = {
        {OutputKind::Metadata, flags.wantsMetadataOutput()},
        {OutputKind::Photo, flags.photo_capture},
        {OutputKind::Video, flags.video_recording},
    };

    bool changed = false;
    for (const auto& w : wanted) {
        const bool attached = components_.session.hasOutput(w.first);
        if (w.second && !attached) {
            std::string error;
            if (!components_.session.addOutput(w.first, error)) {
                std::cerr << "controller: cannot attach " << toString(w.first) << " output: " << error << '\n';
                continue;
            }
            changed = true;
        } else if (!w.second && attached) {
            components_.session.removeOutput(w.first);
            changed = true;
        }
    }
    metadata_attached_.store(components_.session.hasOutput(OutputKind::Metadata));
    if (changed) {
        publish(SessionEvent::Kind::OutputsChanged, "");
    }
}

void CaptureSessionController::configureOnContext() {
    if (state_.load() != SessionState::Unconfigured) {
        return;
    }
    if (components_.permission.queryAuthorization() != PermissionState::Granted) {
        std::cerr << "controller: not configuring, camera permission is "
                  << toString(components_.permission.queryAuthorization()) << '\n';
        return;
    }

    components_.session.beginConfiguration();
    std::string error;
    if (!components_.switcher.configureInitialInput(preferredDeviceId(config_.camera), error)) {
        std::cerr << "controller: configured without an input: " << error << '\n';
    }
    applyOutputsOnContext();
    components_.session.commitConfiguration();
    setState(SessionState::Configured, "configure");
}

CameraModeSession* CaptureSessionController::modeSessionFor(CameraMode mode) const {
    switch (mode) {
        case CameraMode::Reality: return components_.reality;
        case CameraMode::NativeDocument: return components_.native_document;
        case CameraMode::Standard: break;
    }
    return nullptr;
}

void CaptureSessionController::stopAllOnContext() {
    if (components_.session.isRunning()) {
        components_.session.stopRunning();
    }
    for (CameraModeSession* s : {components_.reality, components_.native_document}) {
        if (s != nullptr && s->isRunning()) {
            s->stop();
        }
    }
}

bool CaptureSessionController::startModeOnContext(CameraMode mode, std::string& error) {
    stopAllOnContext();
    if (mode == CameraMode::Standard) {
        return components_.session.startRunning(error);
    }
    CameraModeSession* session = modeSessionFor(mode);
    if (session == nullptr) {
        error = std::string(toString(mode)) + " mode has no session";
        return false;
    }
    return session->start(error);
}

void CaptureSessionController::activateOnContext(const char* reason) {
    if (state_.load() == SessionState::Active) {
        return;
    }
    if (paused_.load()) {
        return;
    }

    const PermissionState permission = components_.permission.queryAuthorization();
    if (permission == PermissionState::Undetermined) {
        std::cerr << "controller: camera permission undetermined, requesting\n";
        requestPermission();
        return;
    }
    if (permission != PermissionState::Granted) {
        std::cerr << "controller: not activating (" << reason << "), camera permission denied\n";
        return;
    }

    if (state_.load() == SessionState::Unconfigured) {
        configureOnContext();
    }

    const CameraMode mode = mode_.load();
    components_.scheduler.prime(nowSteadyNs());
    std::string error;
    if (!startModeOnContext(mode, error)) {
        std::cerr << "controller: " << toString(mode) << " session failed to start: " << error << '\n';
        publish(SessionEvent::Kind::StartFailed, error);
        return;
    }
    setState(SessionState::Active, reason);
}

void CaptureSessionController::inactivateOnContext(const char* reason) {
    if (state_.load() != SessionState::Active) {
        return;
    }
    stopAllOnContext();
    components_.scheduler.forget();
    setState(SessionState::Inactive, reason);
}

void CaptureSessionController::applyFlagsOnContext(const CaptureFeatureFlags& flags) {
    CaptureFeatureFlags previous;
    {
        std::lock_guard<std::mutex> lock(flags_mutex_);
        previous = flags_;
        flags_ = flags;
    }
    if (previous == flags) {
        return;
    }
    components_.scheduler.setDetectionKinds(detectionKindsFor(flags));

    const CameraMode next_mode = cameraModeFor(flags);
    if (next_mode != mode_.load()) {
        const bool was_active = state_.load() == SessionState::Active;
        stopAllOnContext();
        components_.scheduler.forget();
        if (was_active) {
            setState(SessionState::Inactive, "mode switch");
        }
        const CameraMode prev_mode = mode_.exchange(next_mode);
        std::cerr << "controller: mode " << toString(prev_mode) << " -> " << toString(next_mode) << '\n';
        publish(SessionEvent::Kind::ModeChanged, toString(next_mode));
        if (was_active) {
            activateOnContext("mode switch");
        }
    }

    if (state_.load() != SessionState::Unconfigured) {
        components_.session.beginConfiguration();
        applyOutputsOnContext();
        components_.session.commitConfiguration();
    }
}

void CaptureSessionController::switchDeviceOnContext(const std::optional<std::string>& unique_id) {
    std::string error;
    bool ok = false;
    if (unique_id.has_value()) {
        const auto devices = components_.switcher.listDevices();
        const auto it = std::find_if(devices.begin(), devices.end(), [&](const DeviceDescriptor& d) {
            return d.unique_id == *unique_id;
        });
        if (it == devices.end()) {
            error = "unknown device: " + *unique_id;
        } else {
            ok = components_.switcher.switchTo(*it, error);
        }
    } else {
        ok = components_.switcher.switchToNext(error);
    }

    // Tracks refer to frames of the previous device.
    components_.scheduler.forget();

    if (!ok) {
        publish(SessionEvent::Kind::DeviceSwitchFailed, error);
        return;
    }
    const auto current = components_.switcher.currentDevice();
    publish(SessionEvent::Kind::DeviceSwitched, current.has_value() ? current->unique_id : std::string());
}

void CaptureSessionController::permissionChangedOnContext(PermissionState permission) {
    publish(SessionEvent::Kind::PermissionChanged, toString(permission));
    if (permission != PermissionState::Granted) {
        inactivateOnContext("permission revoked");
        return;
    }
    configureOnContext();
    if (foreground_.load() && config_.session.auto_run && !paused_.load()) {
        activateOnContext("permission granted");
    }
}

void CaptureSessionController::onFrame(const FramePacket& frame) {
    frames_delivered_.fetch_add(1);
    if (state_.load() != SessionState::Active || mode_.load() != CameraMode::Standard ||
        !metadata_attached_.load()) {
        return;
    }
    components_.scheduler.submitFrame(frame);
}

bool CaptureSessionController::rectifyRegion(RegionId id, cv::Mat& out, std::string& error) const {
    ObservedRegion region;
    cv::Mat frame;
    if (!components_.store.findRegion(id, region, frame)) {
        error = "unknown region id " + std::to_string(id);
        return false;
    }
    return perspectiveCorrect(frame, region.corners, out, error);
}

}  // namespace vdcam
