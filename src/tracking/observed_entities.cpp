#include "tracking/observed_entities.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace vdcam {

namespace {

constexpr float kJunkTolerance = 1e-4F;

void appendQuad(std::ostringstream& oss, const Quad& q) {
    oss << std::fixed << std::setprecision(3);
    for (const auto& p : cornerPoints(q)) {
        oss << ' ' << p.x << ',' << p.y;
    }
}

}  // namespace

const char* toString(EntityKind kind) {
    switch (kind) {
        case EntityKind::Face: return "face";
        case EntityKind::Code: return "code";
        case EntityKind::Region: return "region";
    }
    return "unknown";
}

bool sameEntity(const ObservedFace& a, const ObservedFace& b) {
    return a.face_id == b.face_id;
}

bool operator==(const ObservedCode& a, const ObservedCode& b) {
    if (!a.payload.empty() && a.payload == b.payload) {
        return true;
    }
    return a.descriptor == b.descriptor;
}

bool operator!=(const ObservedCode& a, const ObservedCode& b) {
    return !(a == b);
}

bool isJunkRegion(const ObservedRegion& region) {
    const cv::Rect2f box = region.boundingBox();
    return std::abs(box.x) < kJunkTolerance && std::abs(box.y) < kJunkTolerance &&
           std::abs(box.width - 1.0F) < kJunkTolerance && std::abs(box.height - 1.0F) < kJunkTolerance;
}

double overlapRatio(const cv::Rect2f& a, const cv::Rect2f& b) {
    const float x0 = std::max(a.x, b.x);
    const float y0 = std::max(a.y, b.y);
    const float x1 = std::min(a.x + a.width, b.x + b.width);
    const float y1 = std::min(a.y + a.height, b.y + b.height);
    const double inter = static_cast<double>(std::max(0.0F, x1 - x0)) * std::max(0.0F, y1 - y0);
    const double uni = static_cast<double>(a.area()) + b.area() - inter;
    return (uni > 0.0) ? inter / uni : 0.0;
}

std::string describe(const ObservedFace& face) {
    std::ostringstream oss;
    oss << "face id=" << face.face_id << (face.is_new ? " new" : "");
    oss << std::fixed << std::setprecision(3)
        << " box=" << face.bounds.x << ',' << face.bounds.y << ',' << face.bounds.width << ',' << face.bounds.height;
    if (face.has_roll) {
        oss << " roll=" << face.roll_deg;
    }
    if (face.has_yaw) {
        oss << " yaw=" << face.yaw_deg;
    }
    return oss.str();
}

std::string describe(const ObservedCode& code) {
    std::ostringstream oss;
    oss << "code " << (code.symbology.empty() ? "unknown" : code.symbology);
    if (code.symbol_version > 0) {
        oss << " v" << code.symbol_version;
    }
    oss << (code.is_new ? " new" : "");
    if (!code.payload.empty()) {
        oss << " payload=\"" << code.payload << '"';
    } else {
        oss << " descriptor=" << code.descriptor;
    }
    appendQuad(oss, code.corners);
    return oss.str();
}

std::string describe(const ObservedRegion& region) {
    std::ostringstream oss;
    oss << "region id=" << region.id;
    appendQuad(oss, region.corners);
    return oss.str();
}

}  // namespace vdcam
