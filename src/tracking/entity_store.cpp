#include "tracking/entity_store.hpp"

#include <algorithm>

namespace vdcam {

const char* toString(PassKind kind) {
    switch (kind) {
        case PassKind::Detection: return "detection";
        case PassKind::Tracking: return "tracking";
    }
    return "unknown";
}

void Observations::clear() {
    faces.clear();
    codes.clear();
    regions.clear();
    seeds.clear();
}

TrackedEntityStore::TrackedEntityStore(double region_match_overlap)
    : region_match_overlap_(region_match_overlap) {}

std::vector<RegionId> TrackedEntityStore::assignRegionIds(
    const std::vector<ObservedRegion>& incoming,
    bool keep_carried_ids) {
    std::vector<RegionId> ids(incoming.size(), kUnassignedRegionId);
    std::vector<RegionId> claimed;

    // Ids carried over by a tracking pass stay as long as the region is still known.
    for (std::size_t i = 0; keep_carried_ids && i < incoming.size(); ++i) {
        const RegionId id = incoming[i].id;
        if (id != kUnassignedRegionId && regions_.count(id) > 0U &&
            std::find(claimed.begin(), claimed.end(), id) == claimed.end()) {
            ids[i] = id;
            claimed.push_back(id);
        }
    }

    for (std::size_t i = 0; i < incoming.size(); ++i) {
        if (ids[i] != kUnassignedRegionId) {
            continue;
        }
        const cv::Rect2f box = incoming[i].boundingBox();
        RegionId best_id = kUnassignedRegionId;
        double best_overlap = region_match_overlap_;
        for (const auto& kv : regions_) {
            if (std::find(claimed.begin(), claimed.end(), kv.first) != claimed.end()) {
                continue;
            }
            const double overlap = overlapRatio(box, kv.second.boundingBox());
            if (overlap >= best_overlap) {
                best_overlap = overlap;
                best_id = kv.first;
            }
        }
        if (best_id == kUnassignedRegionId) {
            best_id = next_region_id_++;
        }
        ids[i] = best_id;
        claimed.push_back(best_id);
    }
    return ids;
}

bool TrackedEntityStore::commit(
    PassKind pass,
    const Observations& observations,
    uint64_t generation,
    int64_t frame_timestamp_ns,
    const cv::Mat& frame) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != generation_) {
        return false;
    }

    std::vector<ObservedFace> faces = observations.faces;
    for (auto& face : faces) {
        face.is_new = std::none_of(faces_.begin(), faces_.end(), [&](const ObservedFace& prev) {
            return sameEntity(prev, face);
        });
    }

    std::vector<ObservedCode> codes = observations.codes;
    for (auto& code : codes) {
        code.is_new = std::find(codes_.begin(), codes_.end(), code) == codes_.end();
    }

    std::vector<ObservedRegion> kept_regions;
    std::vector<std::size_t> kept_source;
    for (std::size_t i = 0; i < observations.regions.size(); ++i) {
        if (!isJunkRegion(observations.regions[i])) {
            kept_regions.push_back(observations.regions[i]);
            kept_source.push_back(i);
        }
    }
    const std::vector<RegionId> ids = assignRegionIds(kept_regions, pass == PassKind::Tracking);

    std::map<RegionId, ObservedRegion> regions;
    std::map<std::size_t, RegionId> id_by_source;
    for (std::size_t k = 0; k < kept_regions.size(); ++k) {
        ObservedRegion r = kept_regions[k];
        r.id = ids[k];
        regions[r.id] = r;
        id_by_source[kept_source[k]] = r.id;
    }

    std::vector<TrackingRequest> requests;
    for (const auto& seed : observations.seeds) {
        if (seed.patch.empty()) {
            continue;
        }
        TrackingRequest req;
        req.kind = seed.kind;
        req.pixels = seed.pixels;
        req.patch = seed.patch;
        req.generation = generation_;
        if (seed.kind == EntityKind::Face) {
            if (seed.source_index >= faces.size()) {
                continue;
            }
            req.face = faces[seed.source_index];
        } else if (seed.kind == EntityKind::Code) {
            if (seed.source_index >= codes.size()) {
                continue;
            }
            req.code = codes[seed.source_index];
        } else {
            const auto it = id_by_source.find(seed.source_index);
            if (it == id_by_source.end()) {
                continue;
            }
            req.region = regions[it->second];
        }
        requests.push_back(std::move(req));
    }

    faces_ = std::move(faces);
    codes_ = std::move(codes);
    regions_ = std::move(regions);
    requests_ = std::move(requests);
    frame_ = frame;
    frame_timestamp_ns_ = frame_timestamp_ns;
    ++pass_index_;
    return true;
}

void TrackedEntityStore::forget() {
    std::lock_guard<std::mutex> lock(mutex_);
    faces_.clear();
    codes_.clear();
    regions_.clear();
    requests_.clear();
    frame_.release();
    frame_timestamp_ns_ = 0;
    ++generation_;
}

uint64_t TrackedEntityStore::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

bool TrackedEntityStore::hasTrackingRequests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !requests_.empty();
}

std::vector<TrackingRequest> TrackedEntityStore::trackingRequests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
}

EntitySnapshot TrackedEntityStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    EntitySnapshot snap;
    snap.faces = faces_;
    snap.codes = codes_;
    snap.regions = regions_;
    snap.generation = generation_;
    snap.pass_index = pass_index_;
    snap.frame_timestamp_ns = frame_timestamp_ns_;
    snap.frame = frame_;
    return snap;
}

bool TrackedEntityStore::findRegion(RegionId id, ObservedRegion& out, cv::Mat& frame) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = regions_.find(id);
    if (it == regions_.end()) {
        return false;
    }
    out = it->second;
    frame = frame_;
    return true;
}

}  // namespace vdcam
