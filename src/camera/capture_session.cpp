#include "camera/capture_session.hpp"

namespace vdcam {

bool operator==(const DeviceDescriptor& a, const DeviceDescriptor& b) {
    return a.unique_id == b.unique_id;
}

bool operator!=(const DeviceDescriptor& a, const DeviceDescriptor& b) {
    return !(a == b);
}

}  // namespace vdcam
