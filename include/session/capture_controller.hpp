#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "camera/capture_session.hpp"
#include "camera/device_switcher.hpp"
#include "core/config.hpp"
#include "core/serial_executor.hpp"
#include "core/types.hpp"
#include "detection/detection_scheduler.hpp"
#include "permission/permission_gate.hpp"
#include "session/mode_session.hpp"
#include "tracking/entity_store.hpp"

namespace vdcam {

struct SessionEvent {
    enum class Kind {
        StateChanged,
        ModeChanged,
        OutputsChanged,
        StartFailed,
        DeviceSwitched,
        DeviceSwitchFailed,
        PermissionChanged,
    };

    Kind kind{Kind::StateChanged};
    SessionState state{SessionState::Unconfigured};
    CameraMode mode{CameraMode::Standard};
    std::string message;
};

const char* toString(SessionEvent::Kind kind);

// Everything the controller drives. The controller is the only component that
// mutates the session, its inputs and outputs.
struct CaptureComponents {
    CaptureSession& session;
    CameraDeviceSwitcher& switcher;
    PermissionGate& permission;
    DetectionScheduler& scheduler;
    TrackedEntityStore& store;
    CameraModeSession* reality{nullptr};
    CameraModeSession* native_document{nullptr};
};

// Top-level state machine. Public methods may be called from any thread and
// return immediately; session mutation happens on a private serial context.
class CaptureSessionController {
public:
    using Listener = std::function<void(const SessionEvent&)>;
    using ListenerToken = uint64_t;

    CaptureSessionController(const AppConfig& config, CaptureComponents components);
    ~CaptureSessionController();

    CaptureSessionController(const CaptureSessionController&) = delete;
    CaptureSessionController& operator=(const CaptureSessionController&) = delete;

    void handleLifecycle(LifecycleEvent event);
    void applyFeatureFlags(const CaptureFeatureFlags& flags);
    void configure();
    void pause();
    void resume();

    // Both throw std::logic_error while the session is still unconfigured.
    void switchCamera();
    void switchToDevice(const std::string& unique_id);

    void requestPermission();
    void openSettings();

    SessionState state() const { return state_.load(); }
    CameraMode mode() const { return mode_.load(); }
    bool isPaused() const { return paused_.load(); }
    bool isForeground() const { return foreground_.load(); }
    CaptureFeatureFlags featureFlags() const;
    PermissionState permissionState() const { return components_.permission.queryAuthorization(); }
    PermissionAdvice permissionAdvice() const { return components_.permission.advice(); }
    std::vector<OutputKind> attachedOutputs() const { return components_.session.outputs(); }
    std::vector<DeviceDescriptor> listDevices() const { return components_.switcher.listDevices(); }
    std::optional<DeviceDescriptor> currentDevice() const { return components_.switcher.currentDevice(); }
    EntitySnapshot entities() const { return components_.store.snapshot(); }
    TelemetrySnapshot schedulerStats() const { return components_.scheduler.stats(); }
    uint64_t framesDelivered() const { return frames_delivered_.load(); }

    // Perspective-corrects a tracked region out of the frame it was observed in.
    bool rectifyRegion(RegionId id, cv::Mat& out, std::string& error) const;

    ListenerToken addListener(Listener listener);
    void removeListener(ListenerToken token);

    // Blocks until every command submitted so far has been applied.
    void waitUntilIdle();
    void shutdown();

private:
    void post(const char* what, std::function<void()> task);

    void configureOnContext();
    void activateOnContext(const char* reason);
    void inactivateOnContext(const char* reason);
    void applyFlagsOnContext(const CaptureFeatureFlags& flags);
    void applyOutputsOnContext();
    void switchDeviceOnContext(const std::optional<std::string>& unique_id);
    void permissionChangedOnContext(PermissionState permission);

    bool startModeOnContext(CameraMode mode, std::string& error);
    void stopAllOnContext();
    CameraModeSession* modeSessionFor(CameraMode mode) const;

    void setState(SessionState next, const char* reason);
    void publish(SessionEvent::Kind kind, const std::string& message);
    void onFrame(const FramePacket& frame);

    const AppConfig config_;
    CaptureComponents components_;

    std::atomic<SessionState> state_{SessionState::Unconfigured};
    std::atomic<CameraMode> mode_{CameraMode::Standard};
    std::atomic<bool> paused_{false};
    std::atomic<bool> foreground_{false};
    std::atomic<bool> metadata_attached_{false};
    std::atomic<uint64_t> frames_delivered_{0};
    std::atomic<bool> shut_down_{false};

    mutable std::mutex flags_mutex_;
    CaptureFeatureFlags flags_;

    std::mutex listeners_mutex_;
    std::map<ListenerToken, Listener> listeners_;
    ListenerToken next_token_{1};
    PermissionGate::ListenerToken permission_token_{0};

    SerialExecutor context_{"controller"};
};

}  // namespace vdcam
