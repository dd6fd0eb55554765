#include "camera/device_enumerator.hpp"
#include "camera/device_switcher.hpp"
#include "camera/opencv_capture_session.hpp"
#include "core/config.hpp"
#include "detection/detection_scheduler.hpp"
#include "detection/opencv_detector.hpp"
#include "ipc/command_handler.hpp"
#include "ipc/control_plane.hpp"
#include "permission/device_permission_host.hpp"
#include "permission/permission_gate.hpp"
#include "session/capture_controller.hpp"
#include "session/mode_session.hpp"
#include "tracking/entity_store.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

namespace {
std::atomic<bool> g_running{true};

void onSignal(int) {
    g_running.store(false);
}

void printStatus(const vdcam::CaptureSessionController& controller) {
    const auto stats = controller.schedulerStats();
    std::cout << "[vdcam] state=" << vdcam::toString(controller.state())
              << " mode=" << vdcam::toString(controller.mode())
              << " frames=" << controller.framesDelivered()
              << " detect=" << stats.detection_passes
              << " track=" << stats.tracking_passes
              << " dropped=" << stats.frames_dropped_busy
              << " failures=" << stats.detector_failures
              << '\n';
}
}

int main(int argc, char** argv) {
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    const std::string config_path = (argc > 1) ? argv[1] : "config/config.yaml";

    vdcam::AppConfig config;
    std::string error;
    if (!vdcam::loadConfig(config_path, config, error)) {
        std::cerr << "Config load failed: " << error << '\n';
        return 1;
    }

    vdcam::OpenCvDetector detector(config.detector);
    if (!detector.initialize(error)) {
        std::cerr << "Face detection disabled: " << error << '\n';
    }

    vdcam::TrackedEntityStore store;
    vdcam::DetectionScheduler scheduler(config.scheduler, detector, store);
    scheduler.setEntityListener([](const vdcam::EntitySnapshot& snap) {
        for (const auto& code : snap.codes) {
            if (code.is_new) {
                std::cout << "[vdcam] " << vdcam::describe(code) << '\n';
            }
        }
        for (const auto& face : snap.faces) {
            if (face.is_new) {
                std::cout << "[vdcam] " << vdcam::describe(face) << '\n';
            }
        }
    });

    vdcam::OpenCvCaptureSession session(config.camera);
    vdcam::V4l2DeviceEnumerator enumerator;
    if (config.camera.source_mode == "gstreamer") {
        enumerator.addStaticDevice(vdcam::gstreamerDevice(config.camera.gstreamer_pipeline));
    }
    vdcam::CameraDeviceSwitcher switcher(session, enumerator);

    vdcam::DevicePermissionHost permission_host;
    vdcam::PermissionGate permission(permission_host);

    vdcam::UnavailableModeSession reality("reality");
    vdcam::UnavailableModeSession native_document("native document");

    vdcam::CaptureSessionController controller(
        config,
        vdcam::CaptureComponents{session, switcher, permission, scheduler, store, &reality, &native_document});
    controller.addListener([](const vdcam::SessionEvent& event) {
        if (event.kind == vdcam::SessionEvent::Kind::StartFailed ||
            event.kind == vdcam::SessionEvent::Kind::DeviceSwitchFailed) {
            std::cerr << "Session event " << vdcam::toString(event.kind) << ": " << event.message << '\n';
        }
    });

    vdcam::ipc::ControlCommandHandler commands(controller);
    vdcam::ipc::UnixControlServer control;
    if (!control.start(config.control.socket_path, [&commands](const std::string& request) {
            return commands(request);
        }, error)) {
        std::cerr << "Control socket unavailable: " << error << '\n';
    }

    permission.startMonitoring(config.session.permission_poll_ms);
    controller.handleLifecycle(vdcam::LifecycleEvent::BecameActive);

    std::cout << "Camera devices: " << controller.listDevices().size() << '\n';
    std::cout << "Control socket: " << config.control.socket_path << '\n';
    std::cout << "Press Ctrl+C to stop.\n";

    auto last_status = std::chrono::steady_clock::now();
    while (g_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        const auto now = std::chrono::steady_clock::now();
        if (now - last_status >= std::chrono::seconds(5)) {
            printStatus(controller);
            last_status = now;
        }
    }

    control.stop();
    permission.stopMonitoring();
    controller.shutdown();
    scheduler.stop();
    printStatus(controller);
    return 0;
}
