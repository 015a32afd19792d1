#include <memory>

#include "io/TrrCodec.hpp"
#include "io/XdrTrajectory.hpp"

namespace xdrtraj {

namespace {

class TrrTrajectory final : public XdrTrajectory {
  public:
    explicit TrrTrajectory(TrrPrecision precision) : precision_(precision) {}

    const char* formatName() const override { return "TRR"; }

  protected:
    Status peekAtomCount(XdrFile& file, int& natoms) override {
        TrrHeader header;
        Status status = readTrrHeader(file, header);
        if (status.isOk()) {
            natoms = header.natoms;
        }
        return status;
    }

    Status decodeFrame(XdrFile& file, std::size_t natoms, Frame& frame) override {
        return decodeTrrFrame(file, natoms, frame, scratch_);
    }

    Status encodeFrame(XdrFile& file, const Frame& frame) override {
        return encodeTrrFrame(file, frame, precision_, scratch_);
    }

    Status skipFrame(XdrFile& file) override {
        TrrHeader header;
        return skipTrrFrame(file, header);
    }

  private:
    TrrPrecision precision_{TrrPrecision::Single};
    TrrScratch scratch_;
};

}  // namespace

std::unique_ptr<Trajectory> createTrrTrajectory(const TrajectoryOptions& options) {
    return std::make_unique<TrrTrajectory>(options.trrPrecision);
}

}  // namespace xdrtraj
