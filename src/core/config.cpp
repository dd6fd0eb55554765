#include "core/config.hpp"

#include <fstream>
#include <sstream>

#include <opencv2/core.hpp>

namespace vdcam {

namespace {

template <typename T>
void readOrDefault(const cv::FileNode& node, const char* key, T& out) {
    const cv::FileNode child = node[key];
    if (!child.empty()) {
        child >> out;
    }
}

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) {
        return {};
    }
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string unquote(std::string v) {
    v = trim(v);
    if (v.size() >= 2) {
        if ((v.front() == '"' && v.back() == '"') || (v.front() == '\'' && v.back() == '\'')) {
            v = v.substr(1, v.size() - 2);
        }
    }
    return v;
}

bool toBool(const std::string& v, bool& out) {
    const std::string t = trim(v);
    if (t == "true" || t == "True" || t == "yes" || t == "1") {
        out = true;
        return true;
    }
    if (t == "false" || t == "False" || t == "no" || t == "0") {
        out = false;
        return true;
    }
    return false;
}

// FileStorage keeps YAML `true`/`false` as strings, integer nodes are read as 0/1.
void readBoolOrDefault(const cv::FileNode& node, const char* key, bool& out) {
    const cv::FileNode child = node[key];
    if (child.empty()) {
        return;
    }
    if (child.isString()) {
        std::string text;
        child >> text;
        bool b = out;
        if (toBool(text, b)) {
            out = b;
        }
        return;
    }
    if (child.isInt()) {
        int v = out ? 1 : 0;
        child >> v;
        out = (v != 0);
    }
}

void assignBool(const std::string& value, bool& field) {
    bool b = field;
    if (toBool(value, b)) {
        field = b;
    }
}

bool loadConfigPlainYaml(const std::string& path, AppConfig& out, std::string& error) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        error = "failed to open config file: " + path;
        return false;
    }

    std::string section;
    std::string line;
    while (std::getline(ifs, line)) {
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') {
            continue;
        }

        // section header, e.g. "scheduler:"
        if (t.back() == ':' && t.find(' ') == std::string::npos) {
            section = t.substr(0, t.size() - 1);
            continue;
        }

        const auto colon = t.find(':');
        if (colon == std::string::npos || section.empty()) {
            continue;
        }

        const std::string key = trim(t.substr(0, colon));
        std::string value = trim(t.substr(colon + 1));
        const auto hash = value.find(" #");
        if (hash != std::string::npos) {
            value = trim(value.substr(0, hash));
        }
        value = unquote(value);

        try {
            if (section == "camera") {
                if (key == "width") out.camera.width = std::stoi(value);
                else if (key == "height") out.camera.height = std::stoi(value);
                else if (key == "fps") out.camera.fps = std::stoi(value);
                else if (key == "source_mode") out.camera.source_mode = value;
                else if (key == "device_index") out.camera.device_index = std::stoi(value);
                else if (key == "gstreamer_pipeline") out.camera.gstreamer_pipeline = value;
            } else if (section == "features") {
                if (key == "face_detection") assignBool(value, out.features.face_detection);
                else if (key == "document_detection") assignBool(value, out.features.document_detection);
                else if (key == "native_document_detection") assignBool(value, out.features.native_document_detection);
                else if (key == "code_detection") assignBool(value, out.features.code_detection);
                else if (key == "reality") assignBool(value, out.features.reality);
                else if (key == "photo_capture") assignBool(value, out.features.photo_capture);
                else if (key == "video_recording") assignBool(value, out.features.video_recording);
            } else if (section == "scheduler") {
                if (key == "detect_interval_ms") out.scheduler.detect_interval_ms = std::stoi(value);
                else if (key == "track_interval_ms") out.scheduler.track_interval_ms = std::stoi(value);
            } else if (section == "detector") {
                if (key == "face_cascade_path") out.detector.face_cascade_path = value;
                else if (key == "min_document_area_ratio") out.detector.min_document_area_ratio = std::stod(value);
                else if (key == "canny_low") out.detector.canny_low = std::stoi(value);
                else if (key == "canny_high") out.detector.canny_high = std::stoi(value);
                else if (key == "max_documents") out.detector.max_documents = std::stoi(value);
                else if (key == "track_search_margin_px") out.detector.track_search_margin_px = std::stoi(value);
                else if (key == "min_track_score") out.detector.min_track_score = std::stof(value);
            } else if (section == "session") {
                if (key == "auto_run") assignBool(value, out.session.auto_run);
                else if (key == "permission_poll_ms") out.session.permission_poll_ms = std::stoi(value);
            } else if (section == "control") {
                if (key == "socket_path") out.control.socket_path = value;
            }
        } catch (const std::exception&) {
            // keep defaults/previous values on parse failure
        }
    }

    return validateConfig(out, error);
}

}  // namespace

bool validateConfig(const AppConfig& cfg, std::string& error) {
    if (cfg.camera.width <= 0 || cfg.camera.height <= 0 || cfg.camera.fps <= 0) {
        error = "camera dimensions/fps must be > 0";
        return false;
    }
    if (cfg.camera.source_mode != "v4l2" && cfg.camera.source_mode != "gstreamer") {
        error = "camera.source_mode must be 'v4l2' or 'gstreamer'";
        return false;
    }
    if (cfg.camera.source_mode == "gstreamer" && cfg.camera.gstreamer_pipeline.empty()) {
        error = "camera.gstreamer_pipeline must not be empty when source_mode=gstreamer";
        return false;
    }
    if (cfg.camera.device_index < 0) {
        error = "camera.device_index must be >= 0";
        return false;
    }
    if (cfg.scheduler.detect_interval_ms <= 0 || cfg.scheduler.track_interval_ms <= 0) {
        error = "scheduler intervals must be > 0";
        return false;
    }
    if (cfg.scheduler.track_interval_ms >= cfg.scheduler.detect_interval_ms) {
        error = "scheduler.track_interval_ms must be shorter than scheduler.detect_interval_ms";
        return false;
    }
    if (cfg.detector.min_document_area_ratio <= 0.0 || cfg.detector.min_document_area_ratio >= 1.0) {
        error = "detector.min_document_area_ratio must be in (0,1)";
        return false;
    }
    if (cfg.detector.canny_low < 0 || cfg.detector.canny_high <= cfg.detector.canny_low) {
        error = "detector canny thresholds must satisfy 0 <= low < high";
        return false;
    }
    if (cfg.detector.max_documents <= 0) {
        error = "detector.max_documents must be > 0";
        return false;
    }
    if (cfg.detector.track_search_margin_px <= 0) {
        error = "detector.track_search_margin_px must be > 0";
        return false;
    }
    if (cfg.detector.min_track_score < 0.0F || cfg.detector.min_track_score > 1.0F) {
        error = "detector.min_track_score must be in [0,1]";
        return false;
    }
    if (cfg.session.permission_poll_ms <= 0) {
        error = "session.permission_poll_ms must be > 0";
        return false;
    }
    if (cfg.control.socket_path.empty()) {
        error = "control.socket_path must not be empty";
        return false;
    }
    error.clear();
    return true;
}

bool loadConfig(const std::string& path, AppConfig& out, std::string& error) {
    try {
        const cv::FileStorage fs(path, cv::FileStorage::READ);
        if (fs.isOpened()) {
            const cv::FileNode camera = fs["camera"];
            const cv::FileNode features = fs["features"];
            const cv::FileNode scheduler = fs["scheduler"];
            const cv::FileNode detector = fs["detector"];
            const cv::FileNode session = fs["session"];
            const cv::FileNode control = fs["control"];

            readOrDefault(camera, "width", out.camera.width);
            readOrDefault(camera, "height", out.camera.height);
            readOrDefault(camera, "fps", out.camera.fps);
            readOrDefault(camera, "source_mode", out.camera.source_mode);
            readOrDefault(camera, "device_index", out.camera.device_index);
            readOrDefault(camera, "gstreamer_pipeline", out.camera.gstreamer_pipeline);

            readBoolOrDefault(features, "face_detection", out.features.face_detection);
            readBoolOrDefault(features, "document_detection", out.features.document_detection);
            readBoolOrDefault(features, "native_document_detection", out.features.native_document_detection);
            readBoolOrDefault(features, "code_detection", out.features.code_detection);
            readBoolOrDefault(features, "reality", out.features.reality);
            readBoolOrDefault(features, "photo_capture", out.features.photo_capture);
            readBoolOrDefault(features, "video_recording", out.features.video_recording);

            readOrDefault(scheduler, "detect_interval_ms", out.scheduler.detect_interval_ms);
            readOrDefault(scheduler, "track_interval_ms", out.scheduler.track_interval_ms);

            readOrDefault(detector, "face_cascade_path", out.detector.face_cascade_path);
            readOrDefault(detector, "min_document_area_ratio", out.detector.min_document_area_ratio);
            readOrDefault(detector, "canny_low", out.detector.canny_low);
            readOrDefault(detector, "canny_high", out.detector.canny_high);
            readOrDefault(detector, "max_documents", out.detector.max_documents);
            readOrDefault(detector, "track_search_margin_px", out.detector.track_search_margin_px);
            readOrDefault(detector, "min_track_score", out.detector.min_track_score);

            readBoolOrDefault(session, "auto_run", out.session.auto_run);
            readOrDefault(session, "permission_poll_ms", out.session.permission_poll_ms);

            readOrDefault(control, "socket_path", out.control.socket_path);

            return validateConfig(out, error);
        }
    } catch (const cv::Exception&) {
        // fall through to plain YAML parser below
    }

    return loadConfigPlainYaml(path, out, error);
}

}  // namespace vdcam
