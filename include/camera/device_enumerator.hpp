#pragma once

#include <string>
#include <vector>

#include "camera/capture_session.hpp"
#include "core/config.hpp"

namespace vdcam {

class DeviceEnumerator {
public:
    virtual ~DeviceEnumerator() = default;
    virtual std::vector<DeviceDescriptor> listDevices() const = 0;
};

// Lists /dev/video* nodes that can capture video, in node index order, then
// any static devices (e.g. a GStreamer pipeline).
class V4l2DeviceEnumerator : public DeviceEnumerator {
public:
    explicit V4l2DeviceEnumerator(std::string dev_dir = "/dev");

    void addStaticDevice(const DeviceDescriptor& device);
    std::vector<DeviceDescriptor> listDevices() const override;

private:
    std::string dev_dir_;
    std::vector<DeviceDescriptor> static_devices_;
};

constexpr const char* kGStreamerDevicePrefix = "gst:";

// "/dev/videoN" -> N, anything else -> -1.
int videoIndexFromPath(const std::string& path);

// Paths of the video nodes in `dev_dir`, sorted by node index.
std::vector<std::string> discoverVideoNodes(const std::string& dev_dir);

DeviceDescriptor gstreamerDevice(const std::string& pipeline);

// Unique id of the device the configuration asks for first.
std::string preferredDeviceId(const CameraConfig& config);

}  // namespace vdcam
