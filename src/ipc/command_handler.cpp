#include "ipc/command_handler.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

#include <opencv2/imgcodecs.hpp>

namespace vdcam::ipc {

namespace {

bool* flagField(CaptureFeatureFlags& flags, const std::string& key) {
    if (key == "face" || key == "face_detection") return &flags.face_detection;
    if (key == "document" || key == "document_detection") return &flags.document_detection;
    if (key == "native_document" || key == "native_document_detection") return &flags.native_document_detection;
    if (key == "code" || key == "code_detection") return &flags.code_detection;
    if (key == "reality") return &flags.reality;
    if (key == "photo" || key == "photo_capture") return &flags.photo_capture;
    if (key == "video" || key == "video_recording") return &flags.video_recording;
    return nullptr;
}

std::string outputsList(const std::vector<OutputKind>& outputs) {
    if (outputs.empty()) {
        return "none";
    }
    std::string out;
    for (const auto kind : outputs) {
        if (!out.empty()) {
            out += ',';
        }
        out += toString(kind);
    }
    return out;
}

std::string deviceId(const std::optional<DeviceDescriptor>& device) {
    return device.has_value() ? device->unique_id : std::string("none");
}

}  // namespace

bool parseFlagAssignments(
    const std::vector<std::string>& assignments,
    CaptureFeatureFlags& flags,
    std::string& error) {
    CaptureFeatureFlags parsed = flags;
    for (const auto& a : assignments) {
        const auto eq = a.find('=');
        if (eq == std::string::npos) {
            error = "expected key=0|1, got '" + a + "'";
            return false;
        }
        const std::string key = a.substr(0, eq);
        const std::string value = a.substr(eq + 1);
        bool* field = flagField(parsed, key);
        if (field == nullptr) {
            error = "unknown flag '" + key + "'";
            return false;
        }
        if (value == "1" || value == "true" || value == "on") {
            *field = true;
        } else if (value == "0" || value == "false" || value == "off") {
            *field = false;
        } else {
            error = "bad value for " + key + ": '" + value + "'";
            return false;
        }
    }
    flags = parsed;
    error.clear();
    return true;
}

std::string formatFlags(const CaptureFeatureFlags& flags) {
    std::ostringstream oss;
    oss << "face=" << flags.face_detection
        << " document=" << flags.document_detection
        << " native_document=" << flags.native_document_detection
        << " code=" << flags.code_detection
        << " reality=" << flags.reality
        << " photo=" << flags.photo_capture
        << " video=" << flags.video_recording;
    return oss.str();
}

ControlCommandHandler::ControlCommandHandler(CaptureSessionController& controller)
    : controller_(controller), last_event_(std::make_shared<LastEvent>()) {
    // The listener may still run once after removal, so it holds the record itself.
    std::shared_ptr<LastEvent> record = last_event_;
    listener_token_ = controller_.addListener([record](const SessionEvent& event) {
        std::lock_guard<std::mutex> lock(record->mutex);
        record->seen = true;
        record->event = event;
    });
}

ControlCommandHandler::~ControlCommandHandler() {
    controller_.removeListener(listener_token_);
}

std::vector<std::string> ControlCommandHandler::tokenize(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> tokens;
    std::string t;
    while (iss >> t) {
        tokens.push_back(t);
    }
    return tokens;
}

std::string ControlCommandHandler::operator()(const std::string& request) {
    const auto tokens = tokenize(request);
    if (tokens.empty()) {
        return "ERR empty\n";
    }
    const std::string& cmd = tokens.front();
    const std::vector<std::string> args(tokens.begin() + 1, tokens.end());

    try {
        if (cmd == "status") {
            return status();
        }
        if (cmd == "devices") {
            return devices();
        }
        if (cmd == "switch") {
            return switchDevice(args);
        }
        if (cmd == "pause") {
            controller_.pause();
            return "OK queued pause\n";
        }
        if (cmd == "resume") {
            controller_.resume();
            return "OK queued resume\n";
        }
        if (cmd == "lifecycle") {
            return lifecycle(args);
        }
        if (cmd == "flags") {
            return flags(args);
        }
        if (cmd == "permission") {
            return std::string("OK permission=") + toString(controller_.permissionState()) +
                   " advice=" + toString(controller_.permissionAdvice()) + "\n";
        }
        if (cmd == "request-permission") {
            controller_.requestPermission();
            return std::string("OK permission=") + toString(controller_.permissionState()) + "\n";
        }
        if (cmd == "open-settings") {
            controller_.openSettings();
            return "OK\n";
        }
        if (cmd == "entities") {
            return entities();
        }
        if (cmd == "rectify") {
            return rectify(args);
        }
    } catch (const std::logic_error& e) {
        return std::string("ERR ") + e.what() + "\n";
    }
    return "ERR unknown command: " + cmd + "\n";
}

std::string ControlCommandHandler::status() const {
    const auto stats = controller_.schedulerStats();
    std::ostringstream oss;
    oss << "OK state=" << toString(controller_.state())
        << " mode=" << toString(controller_.mode())
        << " paused=" << (controller_.isPaused() ? 1 : 0)
        << " foreground=" << (controller_.isForeground() ? 1 : 0)
        << " permission=" << toString(controller_.permissionState())
        << " device=" << deviceId(controller_.currentDevice())
        << " outputs=" << outputsList(controller_.attachedOutputs())
        << " frames=" << controller_.framesDelivered()
        << " detect=" << stats.detection_passes
        << " track=" << stats.tracking_passes
        << " dropped=" << stats.frames_dropped_busy
        << " failures=" << stats.detector_failures
        << " discarded=" << stats.discarded_passes
        << " last_event=" << lastEvent()
        << "\n";
    return oss.str();
}

std::string ControlCommandHandler::lastEvent() const {
    std::lock_guard<std::mutex> lock(last_event_->mutex);
    if (!last_event_->seen) {
        return "none";
    }
    std::string out = toString(last_event_->event.kind);
    if (!last_event_->event.message.empty()) {
        out += ' ';
        out += last_event_->event.message;
    }
    return out;
}

std::string ControlCommandHandler::devices() const {
    const auto list = controller_.listDevices();
    const auto current = controller_.currentDevice();
    std::ostringstream oss;
    oss << "OK devices=" << list.size() << "\n";
    for (const auto& d : list) {
        oss << d.unique_id << '\t' << d.name;
        if (current.has_value() && *current == d) {
            oss << "\t*";
        }
        oss << "\n";
    }
    return oss.str();
}

std::string ControlCommandHandler::switchDevice(const std::vector<std::string>& args) {
    if (args.empty()) {
        controller_.switchCamera();
        return "OK queued switch\n";
    }
    const auto list = controller_.listDevices();
    const bool known = std::any_of(list.begin(), list.end(), [&](const DeviceDescriptor& d) {
        return d.unique_id == args.front();
    });
    if (!known) {
        return "ERR unknown device: " + args.front() + "\n";
    }
    controller_.switchToDevice(args.front());
    return "OK queued switch " + args.front() + "\n";
}

std::string ControlCommandHandler::lifecycle(const std::vector<std::string>& args) {
    if (args.size() != 1U) {
        return "ERR usage: lifecycle active|inactive|background\n";
    }
    LifecycleEvent event = LifecycleEvent::BecameActive;
    if (args[0] == "active") {
        event = LifecycleEvent::BecameActive;
    } else if (args[0] == "inactive") {
        event = LifecycleEvent::BecameInactive;
    } else if (args[0] == "background") {
        event = LifecycleEvent::EnteredBackground;
    } else {
        return "ERR unknown lifecycle event: " + args[0] + "\n";
    }
    controller_.handleLifecycle(event);
    return "OK queued lifecycle " + args[0] + "\n";
}

std::string ControlCommandHandler::flags(const std::vector<std::string>& args) {
    CaptureFeatureFlags flags = requested_flags_.value_or(controller_.featureFlags());
    std::string error;
    if (!parseFlagAssignments(args, flags, error)) {
        return "ERR " + error + "\n";
    }
    controller_.applyFeatureFlags(flags);
    requested_flags_ = flags;
    return "OK queued " + formatFlags(flags) + "\n";
}

std::string ControlCommandHandler::entities() const {
    const EntitySnapshot snap = controller_.entities();
    std::ostringstream oss;
    oss << "OK faces=" << snap.faces.size()
        << " codes=" << snap.codes.size()
        << " regions=" << snap.regions.size()
        << " pass=" << snap.pass_index << "\n";
    for (const auto& f : snap.faces) {
        oss << describe(f) << "\n";
    }
    for (const auto& c : snap.codes) {
        oss << describe(c) << "\n";
    }
    for (const auto& kv : snap.regions) {
        oss << describe(kv.second) << "\n";
    }
    return oss.str();
}

std::string ControlCommandHandler::rectify(const std::vector<std::string>& args) {
    if (args.size() != 2U) {
        return "ERR usage: rectify <region_id> <path>\n";
    }
    RegionId id = kUnassignedRegionId;
    try {
        id = static_cast<RegionId>(std::stoull(args[0]));
    } catch (const std::exception&) {
        return "ERR bad region id: " + args[0] + "\n";
    }

    cv::Mat rectified;
    std::string error;
    if (!controller_.rectifyRegion(id, rectified, error)) {
        return "ERR " + error + "\n";
    }
    try {
        if (!cv::imwrite(args[1], rectified)) {
            return "ERR failed to write " + args[1] + "\n";
        }
    } catch (const cv::Exception& e) {
        return std::string("ERR ") + e.what() + "\n";
    }
    std::ostringstream oss;
    oss << "OK wrote " << rectified.cols << 'x' << rectified.rows << " to " << args[1] << "\n";
    return oss.str();
}

}  // namespace vdcam::ipc
