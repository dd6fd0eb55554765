#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include "camera/capture_session.hpp"
#include "core/config.hpp"

namespace vdcam {

// cv::VideoCapture backed session. Device ids are V4L2 node paths
// ("/dev/video0") or GStreamer pipelines prefixed with "gst:".
class OpenCvCaptureSession : public CaptureSession {
public:
    explicit OpenCvCaptureSession(const CameraConfig& config);
    ~OpenCvCaptureSession() override;

    void beginConfiguration() override;
    void commitConfiguration() override;

    std::optional<DeviceDescriptor> currentInput() const override;
    void removeAllInputs() override;
    bool addInput(const DeviceDescriptor& device, std::string& error) override;

    bool addOutput(OutputKind kind, std::string& error) override;
    void removeOutput(OutputKind kind) override;
    std::vector<OutputKind> outputs() const override;

    bool startRunning(std::string& error) override;
    void stopRunning() override;
    bool isRunning() const override { return running_.load(); }

    void setFrameHandler(FrameHandler handler) override;

    uint64_t framesCaptured() const { return sequence_id_.load(); }
    uint64_t readFailures() const { return read_failures_.load(); }

private:
    bool openV4L2(const std::string& node, std::string& error);
    bool openGStreamer(const std::string& pipeline, std::string& error);
    void frameLoop();

    CameraConfig config_;

    mutable std::mutex capture_mutex_;
    cv::VideoCapture cap_;
    std::optional<DeviceDescriptor> input_;
    std::vector<OutputKind> outputs_;
    int configuration_depth_{0};

    std::mutex handler_mutex_;
    FrameHandler handler_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> sequence_id_{0};
    std::atomic<uint64_t> read_failures_{0};
    std::thread frame_thread_;
};

}  // namespace vdcam
