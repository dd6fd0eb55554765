#include "permission/device_permission_host.hpp"

#include <iostream>

#ifdef __linux__
#include <unistd.h>
#endif

#include "camera/device_enumerator.hpp"

namespace vdcam {

DevicePermissionHost::DevicePermissionHost(std::string dev_dir)
    : dev_dir_(std::move(dev_dir)) {}

std::vector<std::string> DevicePermissionHost::videoNodes() const {
    return discoverVideoNodes(dev_dir_);
}

AuthorizationStatus DevicePermissionHost::authorizationStatus() const {
#ifdef __linux__
    const auto nodes = videoNodes();
    if (nodes.empty()) {
        return AuthorizationStatus::NotDetermined;
    }
    for (const auto& node : nodes) {
        if (::access(node.c_str(), R_OK | W_OK) == 0) {
            return AuthorizationStatus::Authorized;
        }
    }
    return AuthorizationStatus::Denied;
#else
    return AuthorizationStatus::NotDetermined;
#endif
}

void DevicePermissionHost::requestAccess(std::function<void(bool granted)> done) {
    const bool granted = authorizationStatus() == AuthorizationStatus::Authorized;
    if (done) {
        done(granted);
    }
}

void DevicePermissionHost::openSettings() {
    std::cerr << "permission: camera nodes under " << dev_dir_
              << " are not accessible; add the user to the 'video' group"
              << " (usermod -aG video <user>) and log in again\n";
}

}  // namespace vdcam
