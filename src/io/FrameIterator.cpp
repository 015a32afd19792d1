#include "io/FrameIterator.hpp"

#include <utility>

#include "util/Logging.hpp"

namespace xdrtraj {

FrameIterator::FrameIterator(std::unique_ptr<Trajectory> trajectory)
    : owned_(std::move(trajectory)), trajectory_(owned_.get()) {
    if (!trajectory_) {
        finished_ = true;
    }
}

FrameIterator::FrameIterator(Trajectory& trajectory) : trajectory_(&trajectory) {
    std::int64_t offset = 0;
    if (trajectory.isOpen() && trajectory.mode() == FileMode::Read && trajectory.tell(offset).isOk()) {
        origin_ = offset;
    }
}

FrameIterator::~FrameIterator() {
    if (!finished_) {
        finish();
    }
}

void FrameIterator::finish() {
    finished_ = true;
    item_.reset();
    if (origin_ && trajectory_->isOpen()) {
        Status status = trajectory_->seek(*origin_);
        if (!status.isOk()) {
            logWarn("Could not restore trajectory position: " + status.toString());
        }
        origin_.reset();
    }
}

std::optional<FrameResult> FrameIterator::next() {
    if (finished_) {
        return std::nullopt;
    }
    std::size_t natoms = 0;
    Status status = trajectory_->atomCount(natoms);
    if (!status.isOk()) {
        finish();
        return FrameResult{status, nullptr};
    }
    bool fresh = false;
    if (!item_ || item_.use_count() != 1) {
        // Sized by the read itself; the declared count is not trusted here.
        item_ = std::make_shared<Frame>();
        fresh = true;
    }
    status = trajectory_->read(*item_);
    if (status.isEndOfFile()) {
        finish();
        return std::nullopt;
    }
    if (!status.isOk()) {
        finish();
        return FrameResult{status, nullptr};
    }
    if (fresh) {
        ++allocations_;
    }
    ++framesRead_;
    return FrameResult{Status::success(), item_};
}

void FrameIterator::iterator::advance() {
    // Drop our own reference first so an unretained frame can be reused.
    current_.reset();
    if (!owner_) {
        return;
    }
    current_ = owner_->next();
    if (!current_) {
        owner_ = nullptr;
    }
}

}  // namespace xdrtraj
