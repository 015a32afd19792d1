#pragma once

#include <cstddef>
#include <vector>

#include "io/Frame.hpp"
#include "io/Status.hpp"
#include "io/XdrFile.hpp"

namespace xdrtraj {

constexpr int kXtcMagic = 1995;
constexpr float kDefaultXtcPrecision = 1000.0f;
// Coordinate blocks of this many atoms or fewer are stored as raw floats.
constexpr int kXtcRawAtomLimit = 9;

struct XtcHeader {
    int natoms{0};
    int step{0};
    float time{0.0f};
};

// Reads magic, atom count, step and time. A clean end of stream before the
// magic word is EndOfFile; running out anywhere after the record began is
// Truncated.
Status readXtcHeader(XdrFile& file, XtcHeader& header);

// Decodes one complete record into `frame`, which is sized to `natoms`.
// `frame` is scratch: on failure its contents are unspecified.
Status decodeXtcFrame(XdrFile& file, std::size_t natoms, Frame& frame, std::vector<float>& scratch);

// Writes one record. Coordinates that cannot be represented at `precision`
// are rejected before anything is written.
Status encodeXtcFrame(XdrFile& file, const Frame& frame, float precision, std::vector<float>& scratch);

// Advances past one record without decompressing it.
Status skipXtcFrame(XdrFile& file, XtcHeader& header);

}  // namespace xdrtraj
