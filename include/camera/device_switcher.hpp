#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "camera/capture_session.hpp"
#include "camera/device_enumerator.hpp"

namespace vdcam {

// Swaps the session's input device as one begin/remove/add/commit unit.
// Callers serialize it with session start/stop.
class CameraDeviceSwitcher {
public:
    CameraDeviceSwitcher(CaptureSession& session, DeviceEnumerator& enumerator);

    std::vector<DeviceDescriptor> listDevices() const;

    // Attaches the first input of a fresh session. Must run inside the
    // caller's begin/commitConfiguration block. Falls back to the first
    // enumerated device when `preferred_id` is not present.
    bool configureInitialInput(const std::string& preferred_id, std::string& error);
    bool isConfigured() const { return configured_.load(); }

    // Throws std::logic_error when the session was never configured. On
    // failure the session is left without any input.
    bool switchTo(const DeviceDescriptor& device, std::string& error);

    // Next enumerated device after the active one, wrapping around. A single
    // device makes this a successful no-op.
    bool switchToNext(std::string& error);

    std::optional<DeviceDescriptor> currentDevice() const { return session_.currentInput(); }
    uint64_t switchCount() const { return switch_count_.load(); }

private:
    void requireConfigured(const char* operation) const;

    CaptureSession& session_;
    DeviceEnumerator& enumerator_;
    std::atomic<bool> configured_{false};
    std::atomic<uint64_t> switch_count_{0};
    mutable std::mutex mutex_;
    std::optional<DeviceDescriptor> last_requested_;
};

}  // namespace vdcam
