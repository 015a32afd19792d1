#pragma once

#include <istream>
#include <string>

#include "config/Options.hpp"

namespace xdrtraj {

TrajectoryOptions parseConfigFile(const std::string& path);
TrajectoryOptions parseConfigStream(std::istream& input);

}  // namespace xdrtraj
