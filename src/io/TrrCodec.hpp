#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "io/Frame.hpp"
#include "io/Status.hpp"
#include "io/XdrFile.hpp"

namespace xdrtraj {

constexpr int kTrrMagic = 1993;
constexpr char kTrrVersion[] = "GMX_trn_file";

enum class TrrPrecision { Single, Double };

// Per-frame TRR header. Block sizes are in bytes, zero meaning absent.
struct TrrHeader {
    int irSize{0};
    int eSize{0};
    int boxSize{0};
    int virSize{0};
    int presSize{0};
    int topSize{0};
    int symSize{0};
    int xSize{0};
    int vSize{0};
    int fSize{0};
    int natoms{0};
    int step{0};
    int nre{0};
    double time{0.0};
    double lambda{0.0};
    bool doublePrecision{false};

    std::int64_t dataBytes() const {
        return static_cast<std::int64_t>(boxSize) + virSize + presSize + xSize + vSize + fSize;
    }
};

struct TrrScratch {
    std::vector<float> singles;
    std::vector<double> doubles;
};

Status readTrrHeader(XdrFile& file, TrrHeader& header);
Status decodeTrrFrame(XdrFile& file, std::size_t natoms, Frame& frame, TrrScratch& scratch);
Status encodeTrrFrame(XdrFile& file, const Frame& frame, TrrPrecision precision, TrrScratch& scratch);
Status skipTrrFrame(XdrFile& file, TrrHeader& header);

}  // namespace xdrtraj
