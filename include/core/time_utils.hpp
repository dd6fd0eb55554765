#pragma once

#include <cstdint>

namespace vdcam {

int64_t nowSteadyNs();

inline int64_t msToNs(int64_t ms) {
    return ms * 1000000LL;
}

}  // namespace vdcam
