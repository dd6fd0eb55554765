#include "camera/device_enumerator.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

#ifdef __linux__
#include <dirent.h>
#include <fcntl.h>
#include <linux/videodev2.h>
#include <sys/ioctl.h>
#include <unistd.h>
#endif

namespace vdcam {

namespace {

int indexFromNodeName(const std::string& name) {
    if (name.rfind("video", 0) != 0 || name.size() == 5U) {
        return -1;
    }
    int index = 0;
    for (std::size_t i = 5; i < name.size(); ++i) {
        if (name[i] < '0' || name[i] > '9') {
            return -1;
        }
        index = index * 10 + (name[i] - '0');
    }
    return index;
}

#ifdef __linux__
int ioctlRetry(int fd, unsigned long request, void* arg) {
    int status = 0;
    do {
        status = ::ioctl(fd, request, arg);
    } while (status != 0 && errno == EINTR);
    return status;
}
#endif

}  // namespace

int videoIndexFromPath(const std::string& path) {
    const auto slash = path.find_last_of('/');
    const std::string name = (slash == std::string::npos) ? path : path.substr(slash + 1);
    return indexFromNodeName(name);
}

std::vector<std::string> discoverVideoNodes(const std::string& dev_dir) {
    std::vector<std::string> nodes;
#ifdef __linux__
    DIR* dir = ::opendir(dev_dir.c_str());
    if (dir == nullptr) {
        return nodes;
    }
    while (const dirent* entry = ::readdir(dir)) {
        const std::string name = entry->d_name;
        if (indexFromNodeName(name) >= 0) {
            nodes.push_back(dev_dir + "/" + name);
        }
    }
    ::closedir(dir);
    std::sort(nodes.begin(), nodes.end(), [](const std::string& a, const std::string& b) {
        return videoIndexFromPath(a) < videoIndexFromPath(b);
    });
#else
    (void)dev_dir;
#endif
    return nodes;
}

DeviceDescriptor gstreamerDevice(const std::string& pipeline) {
    return DeviceDescriptor{std::string(kGStreamerDevicePrefix) + pipeline, "GStreamer pipeline"};
}

std::string preferredDeviceId(const CameraConfig& config) {
    if (config.source_mode == "gstreamer") {
        return gstreamerDevice(config.gstreamer_pipeline).unique_id;
    }
    return "/dev/video" + std::to_string(config.device_index);
}

V4l2DeviceEnumerator::V4l2DeviceEnumerator(std::string dev_dir)
    : dev_dir_(std::move(dev_dir)) {}

void V4l2DeviceEnumerator::addStaticDevice(const DeviceDescriptor& device) {
    static_devices_.push_back(device);
}

std::vector<DeviceDescriptor> V4l2DeviceEnumerator::listDevices() const {
    std::vector<DeviceDescriptor> devices;
#ifdef __linux__
    for (const auto& node : discoverVideoNodes(dev_dir_)) {
        const int fd = ::open(node.c_str(), O_RDONLY | O_NONBLOCK);
        if (fd < 0) {
            continue;
        }
        v4l2_capability cap{};
        const bool ok = ioctlRetry(fd, VIDIOC_QUERYCAP, &cap) == 0;
        ::close(fd);
        if (!ok) {
            continue;
        }
        // Metadata nodes share the driver but lack the capture capability.
        const uint32_t caps = (cap.capabilities & V4L2_CAP_DEVICE_CAPS) != 0U ? cap.device_caps : cap.capabilities;
        if ((caps & V4L2_CAP_VIDEO_CAPTURE) == 0U) {
            continue;
        }
        const char* card = reinterpret_cast<const char*>(cap.card);
        std::string name(card, strnlen(card, sizeof(cap.card)));
        if (name.empty()) {
            name = node;
        }
        devices.push_back(DeviceDescriptor{node, name});
    }
#endif
    devices.insert(devices.end(), static_devices_.begin(), static_devices_.end());
    return devices;
}

}  // namespace vdcam
