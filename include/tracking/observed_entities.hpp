#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "geometry/geometry_utils.hpp"

namespace vdcam {

enum class EntityKind {
    Face,
    Code,
    Region,
};

const char* toString(EntityKind kind);

struct ObservedFace {
    int face_id{0};  // identity tag assigned by the detector
    bool has_roll{false};
    double roll_deg{0.0};
    bool has_yaw{false};
    double yaw_deg{0.0};
    bool is_new{false};
    cv::Rect2f bounds{};  // normalized, y down
};

// Identity is the detector's tag, freshness and geometry are not compared.
bool sameEntity(const ObservedFace& a, const ObservedFace& b);

struct ObservedCode {
    std::optional<std::vector<uint8_t>> raw_payload{};
    std::string payload{};
    std::string symbology{};
    int symbol_version{0};
    std::string descriptor{};  // stable for symbologies that decode to an empty string
    bool is_new{false};
    Quad corners{};  // normalized, y down
};

// Equal non-empty payloads identify the same code. Otherwise the descriptors decide.
bool operator==(const ObservedCode& a, const ObservedCode& b);
bool operator!=(const ObservedCode& a, const ObservedCode& b);

using RegionId = uint64_t;
constexpr RegionId kUnassignedRegionId = 0;

struct ObservedRegion {
    RegionId id{kUnassignedRegionId};
    Quad corners{};  // normalized, y down
    float confidence{0.0F};

    cv::Rect2f boundingBox() const { return unionOfCorners(corners); }
    std::array<cv::Point2f, 4> points() const { return cornerPoints(corners); }
};

// Detectors sometimes report a region spanning the whole frame.
bool isJunkRegion(const ObservedRegion& region);

double overlapRatio(const cv::Rect2f& a, const cv::Rect2f& b);

std::string describe(const ObservedFace& face);
std::string describe(const ObservedCode& code);
std::string describe(const ObservedRegion& region);

}  // namespace vdcam
