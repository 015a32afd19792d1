#include "io/TrrCodec.hpp"

#include <algorithm>
#include <climits>
#include <new>
#include <string>

extern "C" {
#include <xdrfile.h>
}

namespace xdrtraj {

namespace {

constexpr int kVersionLength = static_cast<int>(sizeof(kTrrVersion));

Status invalidHeader(const XdrFile& file, const std::string& message) {
    return statusFromXdrCode(exdrHEADER, "TRR header: " + message).withPath(file.path());
}

Status writeFailure(const XdrFile& file, const std::string& what, int code) {
    return file.writeFailure(code, "TRR " + what);
}

// Real-number width of the record, derived the way GROMACS does it.
int realWidth(const TrrHeader& header) {
    if (header.boxSize) {
        return header.boxSize / 9;
    }
    const std::int64_t natoms3 = static_cast<std::int64_t>(header.natoms) * 3;
    if (natoms3 > 0) {
        if (header.xSize) return static_cast<int>(header.xSize / natoms3);
        if (header.vSize) return static_cast<int>(header.vSize / natoms3);
        if (header.fSize) return static_cast<int>(header.fSize / natoms3);
    }
    return 0;
}

Status validateSizes(const XdrFile& file, const TrrHeader& header) {
    if (header.irSize || header.eSize || header.topSize || header.symSize) {
        return invalidHeader(file, "input-record, energy or topology blocks are not supported");
    }
    const int width = header.doublePrecision ? 8 : 4;
    const std::int64_t matrixBytes = 9 * width;
    const std::int64_t vectorBytes = static_cast<std::int64_t>(header.natoms) * 3 * width;
    auto matches = [](int size, std::int64_t expected) { return size == 0 || size == expected; };
    if (!matches(header.boxSize, matrixBytes) || !matches(header.virSize, matrixBytes) ||
        !matches(header.presSize, matrixBytes)) {
        return invalidHeader(file, "matrix block size does not match " + std::to_string(width) + "-byte reals");
    }
    if (!matches(header.xSize, vectorBytes) || !matches(header.vSize, vectorBytes) ||
        !matches(header.fSize, vectorBytes)) {
        return invalidHeader(file, "vector block size does not match " + std::to_string(header.natoms) + " atoms");
    }
    // Without a per-atom block nothing in the file bounds the atom count.
    if (header.natoms > 0 && !header.xSize && !header.vSize && !header.fSize) {
        return invalidHeader(file, "atoms declared without coordinate, velocity or force blocks");
    }
    return Status::success();
}

Status readReals(XdrFile& file, bool doublePrecision, std::size_t count, TrrScratch& scratch, const char* what) {
    const int n = static_cast<int>(count);
    if (doublePrecision) {
        scratch.doubles.resize(std::max<std::size_t>(count, 1));
        if (file.readDoubles(scratch.doubles.data(), n) != n) {
            return file.readFailure(exdrDOUBLE, std::string("TRR ") + what);
        }
    } else {
        scratch.singles.resize(std::max<std::size_t>(count, 1));
        if (file.readFloats(scratch.singles.data(), n) != n) {
            return file.readFailure(exdrFLOAT, std::string("TRR ") + what);
        }
    }
    return Status::success();
}

float realAt(const TrrScratch& scratch, bool doublePrecision, std::size_t idx) {
    return doublePrecision ? static_cast<float>(scratch.doubles[idx]) : scratch.singles[idx];
}

Status readVectors(XdrFile& file, const TrrHeader& header, std::size_t natoms, std::vector<Vec3>& out,
                   TrrScratch& scratch, const char* what) {
    Status status = readReals(file, header.doublePrecision, 3 * natoms, scratch, what);
    if (!status.isOk()) {
        return status;
    }
    out.resize(natoms);
    for (std::size_t i = 0; i < natoms; ++i) {
        out[i] = Vec3{realAt(scratch, header.doublePrecision, 3 * i), realAt(scratch, header.doublePrecision, 3 * i + 1),
                      realAt(scratch, header.doublePrecision, 3 * i + 2)};
    }
    return Status::success();
}

Status writeVectors(XdrFile& file, const Vec3* values, std::size_t nvalues, bool doublePrecision, TrrScratch& scratch,
                    const char* what) {
    const std::size_t count = 3 * nvalues;
    const int n = static_cast<int>(count);
    if (doublePrecision) {
        scratch.doubles.resize(std::max<std::size_t>(count, 1));
        for (std::size_t i = 0; i < nvalues; ++i) {
            scratch.doubles[3 * i] = values[i].x;
            scratch.doubles[3 * i + 1] = values[i].y;
            scratch.doubles[3 * i + 2] = values[i].z;
        }
        if (file.writeDoubles(scratch.doubles.data(), n) != n) {
            return writeFailure(file, what, exdrDOUBLE);
        }
    } else {
        scratch.singles.resize(std::max<std::size_t>(count, 1));
        for (std::size_t i = 0; i < nvalues; ++i) {
            scratch.singles[3 * i] = values[i].x;
            scratch.singles[3 * i + 1] = values[i].y;
            scratch.singles[3 * i + 2] = values[i].z;
        }
        if (file.writeFloats(scratch.singles.data(), n) != n) {
            return writeFailure(file, what, exdrFLOAT);
        }
    }
    return Status::success();
}

// Every block the header announces must be present before any of it is
// read; block sizes come from the file and bound every allocation below.
Status checkRecordFits(const XdrFile& file, const TrrHeader& header) {
    const std::int64_t total = file.size();
    const std::int64_t remaining = total - file.tell();
    if (total >= 0 && header.dataBytes() > remaining) {
        return statusFromXdrCode(header.doublePrecision ? exdrDOUBLE : exdrFLOAT,
                                 "TRR record needs " + std::to_string(header.dataBytes()) + " bytes, " +
                                     std::to_string(std::max<std::int64_t>(remaining, 0)) + " remain")
            .withPath(file.path());
    }
    return Status::success();
}

}  // namespace

Status readTrrHeader(XdrFile& file, TrrHeader& header) {
    const std::int64_t start = file.tell();
    int magic = 0;
    if (file.readInts(&magic, 1) != 1) {
        if (file.tell() == start && file.atEnd()) {
            return Status::endOfFile().withPath(file.path());
        }
        return file.readFailure(exdrINT, "TRR magic");
    }
    if (magic != kTrrMagic) {
        return statusFromXdrCode(exdrMAGIC, "bad TRR magic " + std::to_string(magic)).withPath(file.path());
    }
    int versionLength = 0;
    if (file.readInts(&versionLength, 1) != 1) {
        return file.readFailure(exdrINT, "TRR version length");
    }
    if (versionLength != kVersionLength) {
        return statusFromXdrCode(exdrSTRING, "unexpected TRR version length " + std::to_string(versionLength))
            .withPath(file.path());
    }
    char version[64] = {};
    if (file.readString(version, static_cast<int>(sizeof(version))) <= 0) {
        return file.readFailure(exdrSTRING, "TRR version string");
    }

    int fields[13];
    if (file.readInts(fields, 13) != 13) {
        return file.readFailure(exdrINT, "TRR header");
    }
    TrrHeader parsed;
    parsed.irSize = fields[0];
    parsed.eSize = fields[1];
    parsed.boxSize = fields[2];
    parsed.virSize = fields[3];
    parsed.presSize = fields[4];
    parsed.topSize = fields[5];
    parsed.symSize = fields[6];
    parsed.xSize = fields[7];
    parsed.vSize = fields[8];
    parsed.fSize = fields[9];
    parsed.natoms = fields[10];
    parsed.step = fields[11];
    parsed.nre = fields[12];
    for (int i = 0; i < 11; ++i) {
        if (fields[i] < 0) {
            return invalidHeader(file, "negative size field");
        }
    }

    const int width = realWidth(parsed);
    if (width != 4 && width != 8) {
        return invalidHeader(file, "cannot determine real width from block sizes");
    }
    parsed.doublePrecision = width == 8;
    Status status = validateSizes(file, parsed);
    if (!status.isOk()) {
        return status;
    }

    if (parsed.doublePrecision) {
        double values[2];
        if (file.readDoubles(values, 2) != 2) {
            return file.readFailure(exdrDOUBLE, "TRR time");
        }
        parsed.time = values[0];
        parsed.lambda = values[1];
    } else {
        float values[2];
        if (file.readFloats(values, 2) != 2) {
            return file.readFailure(exdrFLOAT, "TRR time");
        }
        parsed.time = values[0];
        parsed.lambda = values[1];
    }
    header = parsed;
    return Status::success();
}

namespace {

Status decodeTrrFrameImpl(XdrFile& file, std::size_t natoms, Frame& frame, TrrScratch& scratch) {
    TrrHeader header;
    Status status = readTrrHeader(file, header);
    if (!status.isOk()) {
        return status;
    }
    if (static_cast<std::size_t>(header.natoms) != natoms) {
        return statusFromXdrCode(exdrHEADER, "TRR frame has " + std::to_string(header.natoms) + " atoms, trajectory has " +
                                                 std::to_string(natoms))
            .withPath(file.path());
    }
    status = checkRecordFits(file, header);
    if (!status.isOk()) {
        return status;
    }

    Mat3 box;
    if (header.boxSize) {
        status = readReals(file, header.doublePrecision, 9, scratch, "box");
        if (!status.isOk()) {
            return status;
        }
        for (std::size_t r = 0; r < 3; ++r) {
            box[r] = Vec3{realAt(scratch, header.doublePrecision, 3 * r), realAt(scratch, header.doublePrecision, 3 * r + 1),
                          realAt(scratch, header.doublePrecision, 3 * r + 2)};
        }
    }
    // Virial and pressure are not part of a Frame.
    status = file.skip(static_cast<std::int64_t>(header.virSize) + header.presSize);
    if (!status.isOk()) {
        return status;
    }

    if (header.xSize) {
        status = readVectors(file, header, natoms, frame.coords, scratch, "coordinates");
        if (!status.isOk()) {
            return status;
        }
    } else {
        frame.coords.assign(natoms, Vec3{});
    }
    if (header.vSize) {
        status = readVectors(file, header, natoms, frame.velocities, scratch, "velocities");
        if (!status.isOk()) {
            return status;
        }
    } else {
        frame.velocities.clear();
    }
    if (header.fSize) {
        status = readVectors(file, header, natoms, frame.forces, scratch, "forces");
        if (!status.isOk()) {
            return status;
        }
    } else {
        frame.forces.clear();
    }

    frame.box = box;
    frame.step = header.step;
    frame.time = static_cast<float>(header.time);
    frame.lambda = static_cast<float>(header.lambda);
    frame.precision = 0.0f;
    return Status::success();
}

Status encodeTrrFrameImpl(XdrFile& file, const Frame& frame, TrrPrecision precision, TrrScratch& scratch) {
    const bool doublePrecision = precision == TrrPrecision::Double;
    const std::int64_t width = doublePrecision ? 8 : 4;
    const std::int64_t vectorBytes = static_cast<std::int64_t>(frame.natoms()) * 3 * width;
    if (vectorBytes > INT_MAX) {
        return statusFromXdrCode(exdr3DX, "too many atoms for a TRR record").withPath(file.path());
    }
    const int vec = static_cast<int>(vectorBytes);

    const int header[2] = {kTrrMagic, kVersionLength};
    if (file.writeInts(header, 2) != 2) {
        return writeFailure(file, "header", exdrINT);
    }
    if (file.writeString(kTrrVersion) <= 0) {
        return writeFailure(file, "version string", exdrSTRING);
    }
    const int fields[13] = {0,
                            0,
                            static_cast<int>(9 * width),
                            0,
                            0,
                            0,
                            0,
                            vec,
                            frame.hasVelocities() ? vec : 0,
                            frame.hasForces() ? vec : 0,
                            static_cast<int>(frame.natoms()),
                            frame.step,
                            0};
    if (file.writeInts(fields, 13) != 13) {
        return writeFailure(file, "header", exdrINT);
    }
    if (doublePrecision) {
        const double values[2] = {frame.time, frame.lambda};
        if (file.writeDoubles(values, 2) != 2) {
            return writeFailure(file, "time", exdrDOUBLE);
        }
    } else {
        const float values[2] = {frame.time, frame.lambda};
        if (file.writeFloats(values, 2) != 2) {
            return writeFailure(file, "time", exdrFLOAT);
        }
    }

    Status status = writeVectors(file, frame.box.rows.data(), 3, doublePrecision, scratch, "box");
    if (!status.isOk()) {
        return status;
    }
    status = writeVectors(file, frame.coords.data(), frame.coords.size(), doublePrecision, scratch, "coordinates");
    if (!status.isOk()) {
        return status;
    }
    if (frame.hasVelocities()) {
        status = writeVectors(file, frame.velocities.data(), frame.velocities.size(), doublePrecision, scratch, "velocities");
        if (!status.isOk()) {
            return status;
        }
    }
    if (frame.hasForces()) {
        status = writeVectors(file, frame.forces.data(), frame.forces.size(), doublePrecision, scratch, "forces");
    }
    return status;
}

}  // namespace

Status decodeTrrFrame(XdrFile& file, std::size_t natoms, Frame& frame, TrrScratch& scratch) {
    try {
        return decodeTrrFrameImpl(file, natoms, frame, scratch);
    } catch (const std::bad_alloc&) {
        return statusFromXdrCode(exdrNOMEM, "TRR frame of " + std::to_string(natoms) + " atoms").withPath(file.path());
    }
}

Status encodeTrrFrame(XdrFile& file, const Frame& frame, TrrPrecision precision, TrrScratch& scratch) {
    try {
        return encodeTrrFrameImpl(file, frame, precision, scratch);
    } catch (const std::bad_alloc&) {
        return statusFromXdrCode(exdrNOMEM, "TRR frame of " + std::to_string(frame.natoms()) + " atoms")
            .withPath(file.path());
    }
}

Status skipTrrFrame(XdrFile& file, TrrHeader& header) {
    Status status = readTrrHeader(file, header);
    if (!status.isOk()) {
        return status;
    }
    status = checkRecordFits(file, header);
    if (!status.isOk()) {
        return status;
    }
    return file.skip(header.dataBytes());
}

}  // namespace xdrtraj
