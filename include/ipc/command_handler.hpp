#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "session/capture_controller.hpp"

namespace vdcam::ipc {

// Maps one control-plane line (e.g. "lifecycle background") onto the
// controller and formats an "OK ..." / "ERR ..." reply. Commands that mutate
// the session are queued and acknowledged without waiting for them; their
// outcome shows up in "status" as last_event.
class ControlCommandHandler {
public:
    explicit ControlCommandHandler(CaptureSessionController& controller);
    ~ControlCommandHandler();

    ControlCommandHandler(const ControlCommandHandler&) = delete;
    ControlCommandHandler& operator=(const ControlCommandHandler&) = delete;

    std::string operator()(const std::string& request);

    static std::vector<std::string> tokenize(const std::string& line);

private:
    std::string status() const;
    std::string devices() const;
    std::string switchDevice(const std::vector<std::string>& args);
    std::string lifecycle(const std::vector<std::string>& args);
    std::string flags(const std::vector<std::string>& args);
    std::string entities() const;
    std::string rectify(const std::vector<std::string>& args);

    struct LastEvent {
        std::mutex mutex;
        bool seen{false};
        SessionEvent event;
    };

    std::string lastEvent() const;

    CaptureSessionController& controller_;
    // Flags last queued from here; the controller applies them later.
    std::optional<CaptureFeatureFlags> requested_flags_;
    std::shared_ptr<LastEvent> last_event_;
    CaptureSessionController::ListenerToken listener_token_{0};
};

// Parses "key=0|1" pairs onto `flags`. Keys are the config names
// (face_detection, code_detection, ...) or their short forms (face, code, ...).
bool parseFlagAssignments(
    const std::vector<std::string>& assignments,
    CaptureFeatureFlags& flags,
    std::string& error);

std::string formatFlags(const CaptureFeatureFlags& flags);

}  // namespace vdcam::ipc
