#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "core/types.hpp"
#include "tracking/entity_store.hpp"

namespace vdcam {

struct DetectionKinds {
    bool faces{false};
    bool codes{true};
    bool documents{false};

    bool any() const { return faces || codes || documents; }
};

DetectionKinds detectionKindsFor(const CaptureFeatureFlags& flags);

// Opaque detector capability invoked by the scheduler. Implementations run on
// the scheduler's vision thread, one call at a time.
class VisionDetector {
public:
    virtual ~VisionDetector() = default;

    // Full, stateless pass over `frame_bgr`. Observations are normalized to the
    // frame, seeds are in pixels of the same frame.
    virtual bool detect(
        const cv::Mat& frame_bgr,
        const DetectionKinds& kinds,
        Observations& out,
        std::string& error) = 0;

    // Re-locates previously detected entities. Entities that cannot be found
    // are left out of `out`.
    virtual bool track(
        const cv::Mat& frame_bgr,
        const std::vector<TrackingRequest>& requests,
        Observations& out,
        std::string& error) = 0;

    // Drops any memory carried between passes (e.g. face identities).
    virtual void reset() {}
};

}  // namespace vdcam
