#pragma once

#include <string>

#include "core/types.hpp"

namespace vdcam {

struct CameraConfig {
    int width{1280};
    int height{720};
    int fps{30};
    std::string source_mode{"v4l2"};  // v4l2 | gstreamer
    int device_index{0};              // preferred initial device, falls back to the first one found
    std::string gstreamer_pipeline{
        "v4l2src device=/dev/video0 ! videoconvert ! video/x-raw,format=BGR ! appsink drop=true max-buffers=1"};
};

struct SchedulerConfig {
    int detect_interval_ms{500};
    int track_interval_ms{100};  // must stay below detect_interval_ms
};

struct DetectorConfig {
    std::string face_cascade_path{};  // empty disables face detection
    double min_document_area_ratio{0.05};
    int canny_low{30};
    int canny_high{100};
    int max_documents{4};
    int track_search_margin_px{32};
    float min_track_score{0.6F};
};

struct SessionConfig {
    bool auto_run{true};
    int permission_poll_ms{2000};
};

struct ControlConfig {
    std::string socket_path{"/tmp/vdcam_control.sock"};
};

struct AppConfig {
    CameraConfig camera;
    CaptureFeatureFlags features;
    SchedulerConfig scheduler;
    DetectorConfig detector;
    SessionConfig session;
    ControlConfig control;
};

bool loadConfig(const std::string& path, AppConfig& out, std::string& error);
bool validateConfig(const AppConfig& cfg, std::string& error);

}  // namespace vdcam
