#include "io/XdrTrajectory.hpp"

#include <utility>

#include "util/Logging.hpp"

namespace xdrtraj {

XdrTrajectory::~XdrTrajectory() {
    if (state_ == State::Open) {
        Status status = close();
        if (!status.isOk()) {
            logWarn("Trajectory closed with errors on destruction: " + path_);
        }
    }
}

Status XdrTrajectory::checkOpen() const {
    switch (state_) {
        case State::Open:
            return Status::success();
        case State::Unopened:
            return Status::error(ErrorKind::HandleClosed, "trajectory has not been opened");
        case State::Closed:
            break;
    }
    return Status::error(ErrorKind::HandleClosed, "trajectory has been closed").withPath(path_);
}

Status XdrTrajectory::fail(Status status) const {
    if (status.path().empty() && !path_.empty()) {
        status.withPath(path_);
    }
    if (status.isEndOfFile()) {
        logDebug("End of trajectory: " + status.toString());
    } else {
        logError(status.toString());
    }
    return status;
}

Status XdrTrajectory::countFrames(XdrFile& file, std::size_t& count) {
    std::size_t frames = 0;
    while (true) {
        Status status = skipFrame(file);
        if (status.isEndOfFile()) {
            break;
        }
        if (!status.isOk()) {
            return status.withFrame(frames);
        }
        ++frames;
    }
    count = frames;
    return Status::success();
}

Status XdrTrajectory::open(const std::string& path, FileMode mode) {
    if (state_ == State::Closed) {
        return fail(Status::error(ErrorKind::HandleClosed, "a closed trajectory cannot be reopened").withPath(path));
    }
    if (state_ == State::Open) {
        return fail(Status::error(ErrorKind::PermissionDenied, "trajectory is already open on " + path_).withPath(path));
    }

    Status status = file_.open(path, mode);
    if (!status.isOk()) {
        return fail(status);
    }

    // Appending continues an existing file. The append stream is opened
    // first so the writer registry is held while the file is inspected
    // through a separate read stream.
    std::size_t existingAtoms = 0;
    bool existingKnown = false;
    std::size_t existingFrames = 0;
    if (mode == FileMode::Append && file_.size() > 0) {
        XdrFile existing;
        status = existing.open(path, FileMode::Read);
        int natoms = 0;
        if (status.isOk()) status = peekAtomCount(existing, natoms);
        if (status.isOk()) status = existing.seek(0);
        if (status.isOk()) status = countFrames(existing, existingFrames);
        if (!status.isOk()) {
            Status closed = file_.close();
            if (!closed.isOk()) {
                logWarn(closed.toString());
            }
            return fail(status);
        }
        existingAtoms = static_cast<std::size_t>(natoms);
        existingKnown = true;
    }
    path_ = path;

    if (mode == FileMode::Read) {
        if (file_.size() == 0) {
            natoms_ = 0;
            cachedFrameCount_ = 0;
        } else {
            int natoms = 0;
            status = peekAtomCount(file_, natoms);
            if (status.isOk()) {
                status = file_.seek(0);
            }
            if (!status.isOk()) {
                Status closed = file_.close();
                if (!closed.isOk()) {
                    logWarn(closed.toString());
                }
                return fail(status);
            }
            natoms_ = static_cast<std::size_t>(natoms);
        }
        hasAtomCount_ = true;
    } else if (mode == FileMode::Write) {
        validEnd_ = 0;
    } else {
        natoms_ = existingAtoms;
        hasAtomCount_ = existingKnown;
        framesWritten_ = existingFrames;
        validEnd_ = existingKnown ? file_.size() : 0;
    }

    state_ = State::Open;
    logDebug(std::string("Opened ") + formatName() + " trajectory in " + fileModeName(mode) + " mode: " + path);
    return Status::success();
}

Status XdrTrajectory::read(Frame& frame) {
    Status status = checkOpen();
    if (!status.isOk()) {
        return fail(status);
    }
    if (file_.mode() != FileMode::Read) {
        return fail(Status::error(ErrorKind::PermissionDenied, "trajectory is open for writing"));
    }

    const std::int64_t start = file_.tell();
    status = decodeFrame(file_, natoms_, scratch_);
    if (!status.isOk()) {
        Status rewind = file_.seek(start);
        if (!rewind.isOk()) {
            logError("Cannot restore cursor after a failed read: " + rewind.toString());
        }
        return fail(status.withFrame(framesRead_));
    }
    std::swap(frame, scratch_);
    ++framesRead_;
    return Status::success();
}

Status XdrTrajectory::write(const Frame& frame) {
    Status status = checkOpen();
    if (!status.isOk()) {
        return fail(status);
    }
    if (!file_.writable()) {
        return fail(Status::error(ErrorKind::PermissionDenied, "trajectory is open for reading"));
    }

    const std::size_t natoms = hasAtomCount_ ? natoms_ : frame.natoms();
    if (frame.natoms() != natoms) {
        return fail(Status::error(ErrorKind::AtomCountMismatch, "frame has " + std::to_string(frame.natoms()) +
                                                                    " atoms, trajectory has " + std::to_string(natoms))
                        .withFrame(framesWritten_));
    }
    if (frame.hasVelocities() && frame.velocities.size() != natoms) {
        return fail(Status::error(ErrorKind::AtomCountMismatch,
                                  "frame has " + std::to_string(frame.velocities.size()) + " velocities for " +
                                      std::to_string(natoms) + " atoms")
                        .withFrame(framesWritten_));
    }
    if (frame.hasForces() && frame.forces.size() != natoms) {
        return fail(Status::error(ErrorKind::AtomCountMismatch,
                                  "frame has " + std::to_string(frame.forces.size()) + " forces for " +
                                      std::to_string(natoms) + " atoms")
                        .withFrame(framesWritten_));
    }

    status = encodeFrame(file_, frame);
    if (!status.isOk()) {
        Status cut = file_.truncate(validEnd_);
        if (!cut.isOk()) {
            logError("Cannot remove partial record: " + cut.toString());
        }
        return fail(status.withFrame(framesWritten_));
    }
    if (!hasAtomCount_) {
        natoms_ = natoms;
        hasAtomCount_ = true;
    }
    validEnd_ = file_.tell();
    ++framesWritten_;
    return Status::success();
}

Status XdrTrajectory::flush() {
    Status status = checkOpen();
    if (!status.isOk()) {
        return fail(status);
    }
    if (!file_.writable()) {
        return Status::success();
    }
    status = file_.flush();
    if (!status.isOk()) {
        return fail(status);
    }
    return Status::success();
}

Status XdrTrajectory::close() {
    if (state_ != State::Open) {
        state_ = State::Closed;
        return Status::success();
    }
    Status flushed = Status::success();
    if (file_.writable()) {
        flushed = file_.flush();
    }
    Status closed = file_.close();
    state_ = State::Closed;
    if (!flushed.isOk()) {
        return fail(flushed);
    }
    if (!closed.isOk()) {
        return fail(closed);
    }
    logDebug("Closed trajectory: " + path_);
    return Status::success();
}

Status XdrTrajectory::atomCount(std::size_t& natoms) const {
    Status status = checkOpen();
    if (!status.isOk()) {
        return fail(status);
    }
    natoms = natoms_;
    return Status::success();
}

Status XdrTrajectory::frameCount(std::size_t& count) {
    Status status = checkOpen();
    if (!status.isOk()) {
        return fail(status);
    }
    if (file_.writable()) {
        count = framesWritten_;
        return Status::success();
    }
    if (cachedFrameCount_) {
        count = *cachedFrameCount_;
        return Status::success();
    }

    const std::int64_t start = file_.tell();
    std::size_t frames = 0;
    status = file_.seek(0);
    if (status.isOk()) {
        status = countFrames(file_, frames);
    }
    Status rewind = file_.seek(start);
    if (!status.isOk()) {
        return fail(status);
    }
    if (!rewind.isOk()) {
        return fail(rewind);
    }
    cachedFrameCount_ = frames;
    count = frames;
    return Status::success();
}

Status XdrTrajectory::tell(std::int64_t& offset) const {
    Status status = checkOpen();
    if (!status.isOk()) {
        return fail(status);
    }
    offset = file_.tell();
    return Status::success();
}

Status XdrTrajectory::seek(std::int64_t offset) {
    Status status = checkOpen();
    if (!status.isOk()) {
        return fail(status);
    }
    if (file_.writable()) {
        return fail(Status::error(ErrorKind::PermissionDenied, "seeking is only allowed on read handles"));
    }
    const std::int64_t total = file_.size();
    if (offset < 0 || (total >= 0 && offset > total)) {
        return fail(Status::error(ErrorKind::InvalidFormat, "offset " + std::to_string(offset) +
                                                                " lies outside the file"));
    }
    status = file_.seek(offset);
    if (!status.isOk()) {
        return fail(status);
    }
    return Status::success();
}

}  // namespace xdrtraj
