#include <memory>
#include <vector>

#include "io/XdrTrajectory.hpp"
#include "io/XtcCodec.hpp"

namespace xdrtraj {

namespace {

class XtcTrajectory final : public XdrTrajectory {
  public:
    explicit XtcTrajectory(float precision) : precision_(precision) {}

    const char* formatName() const override { return "XTC"; }

  protected:
    Status peekAtomCount(XdrFile& file, int& natoms) override {
        XtcHeader header;
        Status status = readXtcHeader(file, header);
        if (status.isOk()) {
            natoms = header.natoms;
        }
        return status;
    }

    Status decodeFrame(XdrFile& file, std::size_t natoms, Frame& frame) override {
        return decodeXtcFrame(file, natoms, frame, buffer_);
    }

    Status encodeFrame(XdrFile& file, const Frame& frame) override {
        return encodeXtcFrame(file, frame, precision_, buffer_);
    }

    Status skipFrame(XdrFile& file) override {
        XtcHeader header;
        return skipXtcFrame(file, header);
    }

  private:
    float precision_{kDefaultXtcPrecision};
    std::vector<float> buffer_;
};

}  // namespace

std::unique_ptr<Trajectory> createXtcTrajectory(const TrajectoryOptions& options) {
    return std::make_unique<XtcTrajectory>(options.precision);
}

}  // namespace xdrtraj
