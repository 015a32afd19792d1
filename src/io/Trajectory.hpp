#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "config/Options.hpp"
#include "io/Frame.hpp"
#include "io/Status.hpp"
#include "io/XdrFile.hpp"

namespace xdrtraj {

// An open trajectory file bound to one format and one mode. Handles move
// Unopened -> Open -> Closed and never back; every operation except close
// fails with HandleClosed outside the Open state.
class Trajectory {
  public:
    virtual ~Trajectory() = default;

    virtual Status open(const std::string& path, FileMode mode) = 0;
    // Replaces `frame` with the next record. On any failure, including
    // EndOfFile, `frame` and the cursor are left untouched.
    virtual Status read(Frame& frame) = 0;
    virtual Status write(const Frame& frame) = 0;
    virtual Status flush() = 0;
    virtual Status close() = 0;

    virtual Status atomCount(std::size_t& natoms) const = 0;
    // False for a write handle before its first frame.
    virtual bool hasAtomCount() const = 0;
    virtual Status frameCount(std::size_t& count) = 0;
    virtual Status tell(std::int64_t& offset) const = 0;
    virtual Status seek(std::int64_t offset) = 0;

    virtual bool isOpen() const = 0;
    virtual FileMode mode() const = 0;
    virtual const std::string& path() const = 0;
    virtual const char* formatName() const = 0;
    virtual std::size_t framesRead() const = 0;
};

std::unique_ptr<Trajectory> createXtcTrajectory(const TrajectoryOptions& options);
std::unique_ptr<Trajectory> createTrrTrajectory(const TrajectoryOptions& options);

// Picks the format from options.format, or from the extension of `path`.
// Returns nullptr for an unsupported format.
std::unique_ptr<Trajectory> createTrajectory(const std::string& path, const TrajectoryOptions& options = {});

Status openTrajectory(const std::string& path, FileMode mode, const TrajectoryOptions& options,
                      std::unique_ptr<Trajectory>& out);

}  // namespace xdrtraj
