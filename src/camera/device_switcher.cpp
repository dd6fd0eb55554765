#include "camera/device_switcher.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace vdcam {

CameraDeviceSwitcher::CameraDeviceSwitcher(CaptureSession& session, DeviceEnumerator& enumerator)
    : session_(session),
      enumerator_(enumerator) {}

std::vector<DeviceDescriptor> CameraDeviceSwitcher::listDevices() const {
    return enumerator_.listDevices();
}

void CameraDeviceSwitcher::requireConfigured(const char* operation) const {
    if (!configured_.load()) {
        throw std::logic_error(std::string(operation) + " called before the capture session was configured");
    }
}

bool CameraDeviceSwitcher::configureInitialInput(const std::string& preferred_id, std::string& error) {
    configured_.store(true);

    const auto devices = listDevices();
    if (devices.empty()) {
        error = "no capture devices available";
        return false;
    }

    DeviceDescriptor chosen = devices.front();
    for (const auto& d : devices) {
        if (d.unique_id == preferred_id) {
            chosen = d;
            break;
        }
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_requested_ = chosen;
    }

    session_.removeAllInputs();
    if (!session_.addInput(chosen, error)) {
        std::cerr << "switcher: initial input " << chosen.unique_id << " rejected: " << error << '\n';
        return false;
    }
    std::cerr << "switcher: using " << chosen.name << " (" << chosen.unique_id << ")\n";
    error.clear();
    return true;
}

bool CameraDeviceSwitcher::switchTo(const DeviceDescriptor& device, std::string& error) {
    requireConfigured("switchTo");
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_requested_ = device;
    }

    session_.beginConfiguration();
    session_.removeAllInputs();
    const bool added = session_.addInput(device, error);
    session_.commitConfiguration();
    switch_count_.fetch_add(1);

    if (!added) {
        std::cerr << "switcher: switch to " << device.unique_id << " failed: " << error << '\n';
        return false;
    }
    std::cerr << "switcher: switched to " << device.name << " (" << device.unique_id << ")\n";
    error.clear();
    return true;
}

bool CameraDeviceSwitcher::switchToNext(std::string& error) {
    requireConfigured("switchToNext");

    const auto devices = listDevices();
    if (devices.empty()) {
        error = "no capture devices available";
        return false;
    }
    if (devices.size() == 1U) {
        error.clear();
        return true;
    }

    std::optional<DeviceDescriptor> anchor = session_.currentInput();
    if (!anchor.has_value()) {
        std::lock_guard<std::mutex> lock(mutex_);
        anchor = last_requested_;
    }

    std::size_t next = 0;
    if (anchor.has_value()) {
        const auto it = std::find(devices.begin(), devices.end(), *anchor);
        if (it != devices.end()) {
            next = (static_cast<std::size_t>(it - devices.begin()) + 1U) % devices.size();
        }
    }
    return switchTo(devices[next], error);
}

}  // namespace vdcam
