#include "camera/device_enumerator.hpp"
#include "permission/device_permission_host.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#ifdef __linux__
#include <sys/stat.h>
#include <unistd.h>
#endif

int main() {
    if (vdcam::videoIndexFromPath("/dev/video12") != 12 || vdcam::videoIndexFromPath("video0") != 0 ||
        vdcam::videoIndexFromPath("/dev/video") != -1 || vdcam::videoIndexFromPath("/dev/videox1") != -1 ||
        vdcam::videoIndexFromPath("/dev/media0") != -1) {
        std::cerr << "videoIndexFromPath mismatch\n";
        return 1;
    }

    vdcam::CameraConfig cam;
    cam.device_index = 2;
    if (vdcam::preferredDeviceId(cam) != "/dev/video2") {
        std::cerr << "v4l2 mode should prefer the configured node\n";
        return 1;
    }
    cam.source_mode = "gstreamer";
    cam.gstreamer_pipeline = "videotestsrc ! appsink";
    if (vdcam::preferredDeviceId(cam) != "gst:videotestsrc ! appsink") {
        std::cerr << "gstreamer mode should prefer the pipeline device\n";
        return 1;
    }

#ifdef __linux__
    const std::string dir = "/tmp/vdcam_test_dev_" + std::to_string(static_cast<long long>(::getpid()));
    if (::mkdir(dir.c_str(), 0700) != 0) {
        std::cerr << "cannot create " << dir << "\n";
        return 1;
    }

    vdcam::DevicePermissionHost empty_host(dir);
    if (empty_host.authorizationStatus() != vdcam::AuthorizationStatus::NotDetermined) {
        std::cerr << "no video nodes should leave permission undetermined\n";
        return 1;
    }

    const std::vector<std::string> names = {"video10", "video2", "video0", "videofoo", "media0"};
    for (const auto& n : names) {
        std::ofstream ofs(dir + "/" + n);
    }

    const auto nodes = vdcam::discoverVideoNodes(dir);
    const std::vector<std::string> expected = {dir + "/video0", dir + "/video2", dir + "/video10"};
    if (nodes != expected) {
        std::cerr << "video nodes should be filtered and sorted by index\n";
        return 1;
    }

    // Plain files are not capture devices: only the static pipeline is listed.
    vdcam::V4l2DeviceEnumerator enumerator(dir);
    enumerator.addStaticDevice(vdcam::gstreamerDevice("videotestsrc ! appsink"));
    const auto devices = enumerator.listDevices();
    if (devices.size() != 1U || devices[0].unique_id != "gst:videotestsrc ! appsink" ||
        devices[0].name != "GStreamer pipeline") {
        std::cerr << "only the static device should be enumerated\n";
        return 1;
    }

    vdcam::DevicePermissionHost host(dir);
    if (host.authorizationStatus() != vdcam::AuthorizationStatus::Authorized) {
        std::cerr << "readable nodes should count as authorized\n";
        return 1;
    }
    bool answered = false;
    bool granted = false;
    host.requestAccess([&](bool g) {
        answered = true;
        granted = g;
    });
    if (!answered || !granted) {
        std::cerr << "requestAccess should answer at once\n";
        return 1;
    }

    for (const auto& n : names) {
        std::remove((dir + "/" + n).c_str());
    }
    ::rmdir(dir.c_str());
#endif

    return 0;
}
