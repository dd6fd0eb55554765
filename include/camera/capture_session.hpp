#pragma once

#include <algorithm>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace vdcam {

struct DeviceDescriptor {
    std::string unique_id;
    std::string name;
};

bool operator==(const DeviceDescriptor& a, const DeviceDescriptor& b);
bool operator!=(const DeviceDescriptor& a, const DeviceDescriptor& b);

using FrameHandler = std::function<void(const FramePacket&)>;

// Host capture session: one input device, a set of outputs, and a running
// flag. Input/output changes are grouped between begin/commitConfiguration.
class CaptureSession {
public:
    virtual ~CaptureSession() = default;

    virtual void beginConfiguration() = 0;
    virtual void commitConfiguration() = 0;

    virtual std::optional<DeviceDescriptor> currentInput() const = 0;
    virtual void removeAllInputs() = 0;
    virtual bool addInput(const DeviceDescriptor& device, std::string& error) = 0;

    virtual bool addOutput(OutputKind kind, std::string& error) = 0;
    virtual void removeOutput(OutputKind kind) = 0;
    virtual std::vector<OutputKind> outputs() const = 0;
    bool hasOutput(OutputKind kind) const {
        const auto attached = outputs();
        return std::find(attached.begin(), attached.end(), kind) != attached.end();
    }

    virtual bool startRunning(std::string& error) = 0;
    virtual void stopRunning() = 0;
    virtual bool isRunning() const = 0;

    // Invoked on the frame-delivery thread for every captured frame.
    virtual void setFrameHandler(FrameHandler handler) = 0;
};

}  // namespace vdcam
