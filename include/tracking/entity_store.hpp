#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

#include <opencv2/core.hpp>

#include "tracking/observed_entities.hpp"

namespace vdcam {

enum class PassKind {
    Detection,
    Tracking,
};

const char* toString(PassKind kind);

// Emitted by a detector next to its observations: where the entity sits in the
// analysed frame (pixels) and a grey patch a later tracking pass can look for.
struct TrackingSeed {
    EntityKind kind{EntityKind::Region};
    std::size_t source_index{0};  // index into the matching Observations vector
    Quad pixels{};
    cv::Mat patch;
};

struct Observations {
    std::vector<ObservedFace> faces;
    std::vector<ObservedCode> codes;
    std::vector<ObservedRegion> regions;
    std::vector<TrackingSeed> seeds;

    void clear();
    bool empty() const { return faces.empty() && codes.empty() && regions.empty(); }
};

// Continuation request handed to a tracking pass. Only one of face/code/region
// is meaningful, selected by `kind`.
struct TrackingRequest {
    EntityKind kind{EntityKind::Region};
    ObservedFace face{};
    ObservedCode code{};
    ObservedRegion region{};
    Quad pixels{};
    cv::Mat patch;
    uint64_t generation{0};
};

struct EntitySnapshot {
    std::vector<ObservedFace> faces;
    std::vector<ObservedCode> codes;
    std::map<RegionId, ObservedRegion> regions;
    uint64_t generation{0};
    uint64_t pass_index{0};
    int64_t frame_timestamp_ns{0};
    cv::Mat frame;  // frame the current observations were taken from
};

// Holds the most recent pass's faces, codes and regions. Mutated only by the
// detection scheduler; readers take snapshots.
class TrackedEntityStore {
public:
    explicit TrackedEntityStore(double region_match_overlap = 0.5);

    // Replaces the current entity sets with the pass result. Rejected (returns
    // false) when `generation` predates the last forget().
    bool commit(
        PassKind pass,
        const Observations& observations,
        uint64_t generation,
        int64_t frame_timestamp_ns,
        const cv::Mat& frame);

    // Clears all collections and invalidates every outstanding tracking request.
    void forget();

    uint64_t generation() const;
    bool hasTrackingRequests() const;
    std::vector<TrackingRequest> trackingRequests() const;
    EntitySnapshot snapshot() const;
    bool findRegion(RegionId id, ObservedRegion& out, cv::Mat& frame) const;

private:
    std::vector<RegionId> assignRegionIds(const std::vector<ObservedRegion>& incoming, bool keep_carried_ids);

    const double region_match_overlap_;
    mutable std::mutex mutex_;
    std::vector<ObservedFace> faces_;
    std::vector<ObservedCode> codes_;
    std::map<RegionId, ObservedRegion> regions_;
    std::vector<TrackingRequest> requests_;
    uint64_t generation_{1};
    uint64_t pass_index_{0};
    int64_t frame_timestamp_ns_{0};
    cv::Mat frame_;
    RegionId next_region_id_{1};
};

}  // namespace vdcam
