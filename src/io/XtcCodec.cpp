#include "io/XtcCodec.hpp"

#include <algorithm>
#include <climits>
#include <cmath>
#include <cstdint>
#include <new>
#include <string>

extern "C" {
#include <xdrfile.h>
}

namespace xdrtraj {

namespace {

// Largest scaled integer the compressor accepts in one dimension.
constexpr double kMaxScaled = static_cast<double>(INT_MAX - 2);

// Bytes between the block's atom count and its opaque byte count:
// precision, minint[3], maxint[3], smallidx.
constexpr std::int64_t kCompressedPreambleBytes = 4 + 12 + 12 + 4;

constexpr std::int64_t kBoxBytes = 9 * 4;

// The bit-packed stream spends at least one bit on every atom.
constexpr std::int64_t kMaxAtomsPerCompressedByte = 8;

// Per-frame codec state. Lives for a single encode or decode call.
struct CompressionContext {
    float precision{0.0f};
};

std::int64_t padded(std::int64_t nbytes) {
    return (nbytes + 3) & ~static_cast<std::int64_t>(3);
}

Status checkCompressible(const Frame& frame, float precision) {
    double lo[3] = {0.0, 0.0, 0.0};
    double hi[3] = {0.0, 0.0, 0.0};
    for (std::size_t i = 0; i < frame.coords.size(); ++i) {
        const Vec3& v = frame.coords[i];
        for (std::size_t d = 0; d < 3; ++d) {
            const double value = v[d];
            if (!std::isfinite(value)) {
                return statusFromXdrCode(exdr3DX, "atom " + std::to_string(i) + " has a non-finite coordinate");
            }
            const double scaled = value * static_cast<double>(precision);
            if (std::fabs(scaled) + 0.5 > kMaxScaled) {
                return statusFromXdrCode(exdr3DX, "atom " + std::to_string(i) +
                                                      " overflows the compressed range at precision " +
                                                      std::to_string(precision));
            }
            if (i == 0 || scaled < lo[d]) lo[d] = scaled;
            if (i == 0 || scaled > hi[d]) hi[d] = scaled;
        }
    }
    for (std::size_t d = 0; d < 3; ++d) {
        if (hi[d] - lo[d] + 1.0 >= kMaxScaled) {
            return statusFromXdrCode(exdr3DX, "coordinate span too large for precision " + std::to_string(precision));
        }
    }
    return Status::success();
}

Status blockTooShort(const XdrFile& file, const std::string& what) {
    return Status::error(ErrorKind::Truncated, "XTC coordinate block: " + what)
        .withPath(file.path())
        .withCode(exdr3DX);
}

// Reads the coordinate block's own atom count and byte count and checks them
// against the header and the bytes left in the file. The cursor is moved past
// the block; `bytes` is the block length including the atom count.
Status scanCoordinateBlock(XdrFile& file, int natoms, std::int64_t& bytes) {
    const std::int64_t blockStart = file.tell();
    int declared = 0;
    if (file.readInts(&declared, 1) != 1) {
        return file.readFailure(exdrINT, "XTC coordinate block");
    }
    if (declared != natoms) {
        return statusFromXdrCode(exdrHEADER, "XTC coordinate block declares " + std::to_string(declared) +
                                                 " atoms, header declares " + std::to_string(natoms))
            .withPath(file.path());
    }
    const std::int64_t total = file.size();
    if (declared <= kXtcRawAtomLimit) {
        bytes = 4 + static_cast<std::int64_t>(declared) * 3 * 4;
    } else {
        Status status = file.skip(kCompressedPreambleBytes);
        if (!status.isOk()) {
            return status;
        }
        int nbytes = 0;
        if (file.readInts(&nbytes, 1) != 1) {
            return file.readFailure(exdrINT, "XTC compressed block length");
        }
        if (nbytes < 0) {
            return statusFromXdrCode(exdrHEADER, "negative XTC compressed block length").withPath(file.path());
        }
        if (static_cast<std::int64_t>(declared) > kMaxAtomsPerCompressedByte * nbytes) {
            return statusFromXdrCode(exdrHEADER, "XTC compressed block of " + std::to_string(nbytes) +
                                                     " bytes cannot hold " + std::to_string(declared) + " atoms")
                .withPath(file.path());
        }
        bytes = 4 + kCompressedPreambleBytes + 4 + padded(nbytes);
    }
    if (total >= 0 && blockStart + bytes > total) {
        return blockTooShort(file, "record extends past the end of the file");
    }
    return file.seek(blockStart + bytes);
}

Status decodeXtcFrameImpl(XdrFile& file, std::size_t natoms, Frame& frame, std::vector<float>& scratch) {
    XtcHeader header;
    Status status = readXtcHeader(file, header);
    if (!status.isOk()) {
        return status;
    }
    if (static_cast<std::size_t>(header.natoms) != natoms) {
        return statusFromXdrCode(exdrHEADER, "XTC frame has " + std::to_string(header.natoms) + " atoms, trajectory has " +
                                                 std::to_string(natoms))
            .withPath(file.path());
    }
    float box[9];
    if (file.readFloats(box, 9) != 9) {
        return file.readFailure(exdrFLOAT, "XTC box");
    }
    const std::int64_t blockStart = file.tell();
    std::int64_t blockBytes = 0;
    status = scanCoordinateBlock(file, header.natoms, blockBytes);
    if (status.isOk()) {
        status = file.seek(blockStart);
    }
    if (!status.isOk()) {
        return status;
    }

    // libxdrfile refuses a null buffer even for an empty block.
    scratch.resize(std::max<std::size_t>(3 * natoms, 3));
    CompressionContext context;
    int ncoords = header.natoms;
    const int decoded = xdrfile_decompress_coord_float(scratch.data(), &ncoords, &context.precision, file.get());
    if (decoded != header.natoms) {
        return file.readFailure(exdr3DX, "XTC coordinate block could not be decompressed");
    }

    frame.step = header.step;
    frame.time = header.time;
    frame.lambda = 0.0f;
    frame.precision = header.natoms > kXtcRawAtomLimit ? context.precision : 0.0f;
    frame.box = Mat3{Vec3{box[0], box[1], box[2]}, Vec3{box[3], box[4], box[5]}, Vec3{box[6], box[7], box[8]}};
    frame.coords.resize(natoms);
    for (std::size_t i = 0; i < natoms; ++i) {
        frame.coords[i] = Vec3{scratch[3 * i], scratch[3 * i + 1], scratch[3 * i + 2]};
    }
    frame.velocities.clear();
    frame.forces.clear();
    return Status::success();
}

Status encodeXtcFrameImpl(XdrFile& file, const Frame& frame, float precision, std::vector<float>& scratch) {
    const std::size_t natoms = frame.natoms();
    if (natoms > static_cast<std::size_t>(INT_MAX / 3)) {
        return statusFromXdrCode(exdr3DX, "too many atoms for an XTC record").withPath(file.path());
    }
    if (!(precision > 0.0f)) {
        return statusFromXdrCode(exdr3DX, "XTC precision must be positive").withPath(file.path());
    }
    const int n = static_cast<int>(natoms);
    if (n > kXtcRawAtomLimit) {
        Status status = checkCompressible(frame, precision);
        if (!status.isOk()) {
            return status.withPath(file.path());
        }
    }

    const int header[3] = {kXtcMagic, n, frame.step};
    if (file.writeInts(header, 3) != 3) {
        return file.writeFailure(exdrINT, "XTC header");
    }
    if (file.writeFloats(&frame.time, 1) != 1) {
        return file.writeFailure(exdrFLOAT, "XTC time");
    }
    float box[9];
    for (std::size_t r = 0; r < 3; ++r) {
        box[3 * r] = frame.box[r].x;
        box[3 * r + 1] = frame.box[r].y;
        box[3 * r + 2] = frame.box[r].z;
    }
    if (file.writeFloats(box, 9) != 9) {
        return file.writeFailure(exdrFLOAT, "XTC box");
    }

    scratch.resize(std::max<std::size_t>(3 * natoms, 3));
    for (std::size_t i = 0; i < natoms; ++i) {
        scratch[3 * i] = frame.coords[i].x;
        scratch[3 * i + 1] = frame.coords[i].y;
        scratch[3 * i + 2] = frame.coords[i].z;
    }
    CompressionContext context{precision};
    const int encoded = xdrfile_compress_coord_float(scratch.data(), n, context.precision, file.get());
    if (encoded != n) {
        return file.writeFailure(exdr3DX, "XTC coordinate block");
    }
    return Status::success();
}

}  // namespace

Status readXtcHeader(XdrFile& file, XtcHeader& header) {
    const std::int64_t start = file.tell();
    int magic = 0;
    if (file.readInts(&magic, 1) != 1) {
        if (file.tell() == start && file.atEnd()) {
            return Status::endOfFile().withPath(file.path());
        }
        return file.readFailure(exdrINT, "XTC magic");
    }
    if (magic != kXtcMagic) {
        return statusFromXdrCode(exdrMAGIC, "bad XTC magic " + std::to_string(magic)).withPath(file.path());
    }
    int fields[2] = {0, 0};
    if (file.readInts(fields, 2) != 2) {
        return file.readFailure(exdrINT, "XTC header");
    }
    if (fields[0] < 0) {
        return statusFromXdrCode(exdrHEADER, "negative XTC atom count").withPath(file.path());
    }
    float time = 0.0f;
    if (file.readFloats(&time, 1) != 1) {
        return file.readFailure(exdrFLOAT, "XTC header");
    }
    header.natoms = fields[0];
    header.step = fields[1];
    header.time = time;
    return Status::success();
}

Status decodeXtcFrame(XdrFile& file, std::size_t natoms, Frame& frame, std::vector<float>& scratch) {
    try {
        return decodeXtcFrameImpl(file, natoms, frame, scratch);
    } catch (const std::bad_alloc&) {
        return statusFromXdrCode(exdrNOMEM, "XTC frame of " + std::to_string(natoms) + " atoms").withPath(file.path());
    }
}

Status encodeXtcFrame(XdrFile& file, const Frame& frame, float precision, std::vector<float>& scratch) {
    try {
        return encodeXtcFrameImpl(file, frame, precision, scratch);
    } catch (const std::bad_alloc&) {
        return statusFromXdrCode(exdrNOMEM, "XTC frame of " + std::to_string(frame.natoms()) + " atoms")
            .withPath(file.path());
    }
}

Status skipXtcFrame(XdrFile& file, XtcHeader& header) {
    Status status = readXtcHeader(file, header);
    if (!status.isOk()) {
        return status;
    }
    status = file.skip(kBoxBytes);
    if (!status.isOk()) {
        return status;
    }
    std::int64_t blockBytes = 0;
    return scanCoordinateBlock(file, header.natoms, blockBytes);
}

}  // namespace xdrtraj
