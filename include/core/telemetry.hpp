#pragma once

#include <atomic>
#include <cstdint>

namespace vdcam {

struct TelemetrySnapshot {
    uint64_t frames_seen{0};
    uint64_t frames_dropped_busy{0};
    uint64_t frames_idle{0};
    uint64_t detection_passes{0};
    uint64_t tracking_passes{0};
    uint64_t detector_failures{0};
    uint64_t discarded_passes{0};
};

class Telemetry {
public:
    void countFrame() { frames_seen_.fetch_add(1); }
    void countDroppedBusy() { frames_dropped_busy_.fetch_add(1); }
    void countIdle() { frames_idle_.fetch_add(1); }
    void countDetectionPass() { detection_passes_.fetch_add(1); }
    void countTrackingPass() { tracking_passes_.fetch_add(1); }
    void countDetectorFailure() { detector_failures_.fetch_add(1); }
    void countDiscardedPass() { discarded_passes_.fetch_add(1); }

    TelemetrySnapshot snapshot() const;

private:
    std::atomic<uint64_t> frames_seen_{0};
    std::atomic<uint64_t> frames_dropped_busy_{0};
    std::atomic<uint64_t> frames_idle_{0};
    std::atomic<uint64_t> detection_passes_{0};
    std::atomic<uint64_t> tracking_passes_{0};
    std::atomic<uint64_t> detector_failures_{0};
    std::atomic<uint64_t> discarded_passes_{0};
};

}  // namespace vdcam
