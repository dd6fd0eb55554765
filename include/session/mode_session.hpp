#pragma once

#include <string>

namespace vdcam {

// Underlying session of an exclusive camera mode (augmented reality, platform
// document scanner). The plain camera mode runs on the CaptureSession instead.
class CameraModeSession {
public:
    virtual ~CameraModeSession() = default;

    virtual bool start(std::string& error) = 0;
    virtual void stop() = 0;
    virtual bool isRunning() const = 0;
};

class UnavailableModeSession : public CameraModeSession {
public:
    explicit UnavailableModeSession(std::string mode_name);

    bool start(std::string& error) override;
    void stop() override {}
    bool isRunning() const override { return false; }

private:
    std::string mode_name_;
};

}  // namespace vdcam
