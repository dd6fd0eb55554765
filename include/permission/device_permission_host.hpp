#pragma once

#include <string>
#include <vector>

#include "permission/permission_gate.hpp"

namespace vdcam {

// Linux has no camera prompt: access is whatever the /dev/video* nodes allow.
class DevicePermissionHost : public PermissionHost {
public:
    explicit DevicePermissionHost(std::string dev_dir = "/dev");

    AuthorizationStatus authorizationStatus() const override;
    void requestAccess(std::function<void(bool granted)> done) override;
    void openSettings() override;

    std::vector<std::string> videoNodes() const;

private:
    std::string dev_dir_;
};

}  // namespace vdcam
