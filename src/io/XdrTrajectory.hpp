#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "io/Trajectory.hpp"

namespace xdrtraj {

// State machine, rollback and atom-count bookkeeping shared by the XDR
// formats. Subclasses supply the per-record codec.
class XdrTrajectory : public Trajectory {
  public:
    ~XdrTrajectory() override;

    Status open(const std::string& path, FileMode mode) override;
    Status read(Frame& frame) override;
    Status write(const Frame& frame) override;
    Status flush() override;
    Status close() override;

    Status atomCount(std::size_t& natoms) const override;
    bool hasAtomCount() const override { return hasAtomCount_; }
    Status frameCount(std::size_t& count) override;
    Status tell(std::int64_t& offset) const override;
    Status seek(std::int64_t offset) override;

    bool isOpen() const override { return state_ == State::Open; }
    FileMode mode() const override { return file_.mode(); }
    const std::string& path() const override { return path_; }
    std::size_t framesRead() const override { return framesRead_; }

  protected:
    // Reads the first record header at the cursor and reports its atom count.
    virtual Status peekAtomCount(XdrFile& file, int& natoms) = 0;
    virtual Status decodeFrame(XdrFile& file, std::size_t natoms, Frame& frame) = 0;
    virtual Status encodeFrame(XdrFile& file, const Frame& frame) = 0;
    virtual Status skipFrame(XdrFile& file) = 0;

  private:
    enum class State { Unopened, Open, Closed };

    Status checkOpen() const;
    Status countFrames(XdrFile& file, std::size_t& count);
    Status fail(Status status) const;

    State state_{State::Unopened};
    XdrFile file_;
    std::string path_;
    std::size_t natoms_{0};
    bool hasAtomCount_{false};
    std::size_t framesRead_{0};
    std::size_t framesWritten_{0};
    // End of the last complete record written by this handle.
    std::int64_t validEnd_{0};
    std::optional<std::size_t> cachedFrameCount_;
    Frame scratch_;
};

}  // namespace xdrtraj
