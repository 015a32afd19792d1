#include "io/Trajectory.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <string>
#include <utility>

#include "util/Logging.hpp"

namespace xdrtraj {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string extensionOf(const std::string& path) {
    auto slash = path.find_last_of("/\\");
    auto pos = path.find_last_of('.');
    if (pos == std::string::npos || (slash != std::string::npos && pos < slash)) {
        return "";
    }
    return toLower(path.substr(pos + 1));
}

std::string formatOf(const std::string& path, const TrajectoryOptions& options) {
    return options.format.empty() ? extensionOf(path) : toLower(options.format);
}

}  // namespace

std::unique_ptr<Trajectory> createTrajectory(const std::string& path, const TrajectoryOptions& options) {
    std::string fmt = formatOf(path, options);
    if (fmt == "xtc") {
        return createXtcTrajectory(options);
    }
    if (fmt == "trr") {
        return createTrrTrajectory(options);
    }
    logError("Unsupported trajectory format '" + fmt + "': " + path);
    return nullptr;
}

Status openTrajectory(const std::string& path, FileMode mode, const TrajectoryOptions& options,
                      std::unique_ptr<Trajectory>& out) {
    std::unique_ptr<Trajectory> trajectory = createTrajectory(path, options);
    if (!trajectory) {
        return Status::error(ErrorKind::InvalidFormat, "unsupported trajectory format '" + formatOf(path, options) + "'")
            .withPath(path);
    }
    Status status = trajectory->open(path, mode);
    if (!status.isOk()) {
        return status;
    }
    out = std::move(trajectory);
    return Status::success();
}

}  // namespace xdrtraj
