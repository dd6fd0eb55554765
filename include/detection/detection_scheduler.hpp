#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "core/config.hpp"
#include "core/telemetry.hpp"
#include "core/types.hpp"
#include "detection/vision_detector.hpp"
#include "tracking/entity_store.hpp"

namespace vdcam {

enum class FrameDecision {
    Dropped,    // a pass is still in flight
    Idle,       // nothing due on this frame
    Detection,
    Tracking,
};

const char* toString(FrameDecision decision);

// Decides, per delivered frame, whether a detection or tracking pass runs and
// executes it on a dedicated vision thread. At most one pass is in flight.
class DetectionScheduler {
public:
    using EntityListener = std::function<void(const EntitySnapshot&)>;

    DetectionScheduler(const SchedulerConfig& config, VisionDetector& detector, TrackedEntityStore& store);
    ~DetectionScheduler();

    DetectionScheduler(const DetectionScheduler&) = delete;
    DetectionScheduler& operator=(const DetectionScheduler&) = delete;

    // Both deadlines become `now_ns`: the next frame is eligible for detection.
    void prime(int64_t now_ns);

    // Called from the frame-delivery context. Never blocks on vision work.
    FrameDecision submitFrame(const FramePacket& frame);

    // Clears the store and makes the result of an in-flight pass void.
    void forget();

    bool busy() const { return busy_.load(); }
    bool waitIdle(int timeout_ms);
    void stop();

    void setDetectionKinds(const DetectionKinds& kinds);
    DetectionKinds detectionKinds() const;
    void setEntityListener(EntityListener listener);

    int64_t nextDetectNs() const { return next_detect_ns_.load(); }
    int64_t nextTrackNs() const { return next_track_ns_.load(); }
    TelemetrySnapshot stats() const { return telemetry_.snapshot(); }

private:
    struct Job {
        PassKind kind{PassKind::Detection};
        FramePacket frame;
        std::vector<TrackingRequest> requests;
        DetectionKinds kinds;
        uint64_t generation{0};
        uint64_t epoch{0};
    };

    void visionLoop();
    void runPass(Job& job);
    void finishPass();

    const int64_t detect_interval_ns_;
    const int64_t track_interval_ns_;
    VisionDetector& detector_;
    TrackedEntityStore& store_;
    Telemetry telemetry_;

    std::atomic<bool> busy_{false};
    std::atomic<int64_t> next_detect_ns_{0};
    std::atomic<int64_t> next_track_ns_{0};
    std::atomic<uint64_t> epoch_{0};
    std::atomic<bool> reset_requested_{false};

    mutable std::mutex config_mutex_;
    DetectionKinds kinds_{};
    EntityListener listener_{};

    std::mutex job_mutex_;
    std::condition_variable job_cv_;
    std::condition_variable idle_cv_;
    bool has_job_{false};
    bool stopping_{false};
    Job job_{};
    std::thread worker_;
};

}  // namespace vdcam
