#include "core/telemetry.hpp"

namespace vdcam {

TelemetrySnapshot Telemetry::snapshot() const {
    return TelemetrySnapshot{
        frames_seen_.load(),
        frames_dropped_busy_.load(),
        frames_idle_.load(),
        detection_passes_.load(),
        tracking_passes_.load(),
        detector_failures_.load(),
        discarded_passes_.load()};
}

}  // namespace vdcam
