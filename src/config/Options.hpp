#pragma once

#include <string>

#include "io/TrrCodec.hpp"
#include "io/XtcCodec.hpp"

namespace xdrtraj {

struct TrajectoryOptions {
    // "xtc" or "trr"; empty selects the format from the file extension.
    std::string format;
    float precision{kDefaultXtcPrecision};
    TrrPrecision trrPrecision{TrrPrecision::Single};
};

}  // namespace xdrtraj
