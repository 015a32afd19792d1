#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>

#include "io/Frame.hpp"
#include "io/Status.hpp"
#include "io/Trajectory.hpp"

namespace xdrtraj {

struct FrameResult {
    Status status;
    // Null when status is an error.
    std::shared_ptr<const Frame> frame;

    bool ok() const { return status.isOk(); }
};

// Walks a read handle front to back, once. A frame the consumer has let go
// of is decoded into again; a frame still held elsewhere is never touched
// and the next one gets a fresh allocation.
class FrameIterator {
  public:
    // Takes ownership; the handle is closed when the iterator is destroyed.
    explicit FrameIterator(std::unique_ptr<Trajectory> trajectory);
    // Borrows; the handle's cursor is put back where it was once iteration
    // ends or the iterator goes away.
    explicit FrameIterator(Trajectory& trajectory);
    ~FrameIterator();

    FrameIterator(const FrameIterator&) = delete;
    FrameIterator& operator=(const FrameIterator&) = delete;

    // std::nullopt at the end of the trajectory. An error is yielded once
    // and ends the sequence.
    std::optional<FrameResult> next();

    // Distinct Frame objects handed out so far.
    std::size_t allocations() const { return allocations_; }
    std::size_t framesRead() const { return framesRead_; }
    bool finished() const { return finished_; }

    class iterator {
      public:
        using iterator_category = std::input_iterator_tag;
        using value_type = FrameResult;
        using difference_type = std::ptrdiff_t;
        using pointer = const FrameResult*;
        using reference = const FrameResult&;

        iterator() = default;
        explicit iterator(FrameIterator* owner) : owner_(owner) { advance(); }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }
        iterator& operator++() {
            advance();
            return *this;
        }
        bool operator==(const iterator& other) const { return owner_ == other.owner_; }
        bool operator!=(const iterator& other) const { return owner_ != other.owner_; }

      private:
        void advance();

        FrameIterator* owner_{nullptr};
        std::optional<FrameResult> current_;
    };

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

  private:
    void finish();

    std::unique_ptr<Trajectory> owned_;
    Trajectory* trajectory_{nullptr};
    std::shared_ptr<Frame> item_;
    std::optional<std::int64_t> origin_;
    bool finished_{false};
    std::size_t allocations_{0};
    std::size_t framesRead_{0};
};

}  // namespace xdrtraj
