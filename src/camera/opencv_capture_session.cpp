#include "camera/opencv_capture_session.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>

#include "camera/device_enumerator.hpp"
#include "core/time_utils.hpp"

#ifdef __linux__
#include <unistd.h>
#endif

namespace vdcam {

OpenCvCaptureSession::OpenCvCaptureSession(const CameraConfig& config)
    : config_(config) {}

OpenCvCaptureSession::~OpenCvCaptureSession() {
    stopRunning();
    removeAllInputs();
}

void OpenCvCaptureSession::beginConfiguration() {
    std::lock_guard<std::mutex> lock(capture_mutex_);
    ++configuration_depth_;
}

void OpenCvCaptureSession::commitConfiguration() {
    std::lock_guard<std::mutex> lock(capture_mutex_);
    if (configuration_depth_ > 0) {
        --configuration_depth_;
    }
}

std::optional<DeviceDescriptor> OpenCvCaptureSession::currentInput() const {
    std::lock_guard<std::mutex> lock(capture_mutex_);
    return input_;
}

void OpenCvCaptureSession::removeAllInputs() {
    std::lock_guard<std::mutex> lock(capture_mutex_);
    if (cap_.isOpened()) {
        cap_.release();
    }
    input_.reset();
}

bool OpenCvCaptureSession::openV4L2(const std::string& node, std::string& error) {
    const int index = videoIndexFromPath(node);
    if (index < 0) {
        error = "not a V4L2 device node: " + node;
        return false;
    }
#ifdef __linux__
    if (::access(node.c_str(), F_OK) != 0) {
        error = "V4L2 device not found: " + node;
        return false;
    }
#endif
    if (!cap_.open(index, cv::CAP_V4L2)) {
        error = "failed to open V4L2 camera device " + node;
        return false;
    }
    return true;
}

bool OpenCvCaptureSession::openGStreamer(const std::string& pipeline, std::string& error) {
    if (!cap_.open(pipeline, cv::CAP_GSTREAMER)) {
        error = "failed to open GStreamer pipeline";
        return false;
    }
    return true;
}

bool OpenCvCaptureSession::addInput(const DeviceDescriptor& device, std::string& error) {
    std::lock_guard<std::mutex> lock(capture_mutex_);
    if (input_.has_value()) {
        error = "session already has an input: " + input_->unique_id;
        return false;
    }

    const std::string prefix = kGStreamerDevicePrefix;
    bool opened = false;
    try {
        if (device.unique_id.rfind(prefix, 0) == 0) {
            opened = openGStreamer(device.unique_id.substr(prefix.size()), error);
        } else {
            opened = openV4L2(device.unique_id, error);
        }
    } catch (const cv::Exception& e) {
        error = std::string("camera open failed: ") + e.what();
        opened = false;
    }
    if (!opened) {
        if (cap_.isOpened()) {
            cap_.release();
        }
        return false;
    }

    cap_.set(cv::CAP_PROP_FRAME_WIDTH, static_cast<double>(config_.width));
    cap_.set(cv::CAP_PROP_FRAME_HEIGHT, static_cast<double>(config_.height));
    cap_.set(cv::CAP_PROP_FPS, static_cast<double>(config_.fps));

    input_ = device;
    error.clear();
    return true;
}

bool OpenCvCaptureSession::addOutput(OutputKind kind, std::string& error) {
    std::lock_guard<std::mutex> lock(capture_mutex_);
    if (std::find(outputs_.begin(), outputs_.end(), kind) == outputs_.end()) {
        outputs_.push_back(kind);
    }
    error.clear();
    return true;
}

void OpenCvCaptureSession::removeOutput(OutputKind kind) {
    std::lock_guard<std::mutex> lock(capture_mutex_);
    outputs_.erase(std::remove(outputs_.begin(), outputs_.end(), kind), outputs_.end());
}

std::vector<OutputKind> OpenCvCaptureSession::outputs() const {
    std::lock_guard<std::mutex> lock(capture_mutex_);
    return outputs_;
}

void OpenCvCaptureSession::setFrameHandler(FrameHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    handler_ = std::move(handler);
}

bool OpenCvCaptureSession::startRunning(std::string& error) {
    if (running_.load()) {
        error.clear();
        return true;
    }
    {
        std::lock_guard<std::mutex> lock(capture_mutex_);
        if (!input_.has_value() || !cap_.isOpened()) {
            error = "no input device attached";
            return false;
        }
    }
    if (frame_thread_.joinable()) {
        frame_thread_.join();
    }
    running_.store(true);
    frame_thread_ = std::thread(&OpenCvCaptureSession::frameLoop, this);
    error.clear();
    return true;
}

void OpenCvCaptureSession::stopRunning() {
    running_.store(false);
    if (frame_thread_.joinable() && std::this_thread::get_id() != frame_thread_.get_id()) {
        frame_thread_.join();
    }
}

void OpenCvCaptureSession::frameLoop() {
    while (running_.load()) {
        cv::Mat frame;
        bool have_device = false;
        bool ok = false;
        {
            std::lock_guard<std::mutex> lock(capture_mutex_);
            have_device = cap_.isOpened() && configuration_depth_ == 0;
            if (have_device) {
                ok = cap_.read(frame) && !frame.empty();
            }
        }

        if (!have_device) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }
        if (!ok) {
            if (read_failures_.fetch_add(1) % 50U == 0U) {
                std::cerr << "camera: failed to capture frame\n";
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            continue;
        }

        FramePacket packet;
        packet.timestamp_ns = nowSteadyNs();
        packet.sequence_id = sequence_id_.fetch_add(1) + 1;
        packet.bgr = frame;

        FrameHandler handler;
        {
            std::lock_guard<std::mutex> lock(handler_mutex_);
            handler = handler_;
        }
        if (handler) {
            handler(packet);
        }
    }
}

}  // namespace vdcam
