#pragma once

#include <cstddef>
#include <vector>

#include "util/Math.hpp"

namespace xdrtraj {

// One simulation snapshot. coords always holds one entry per atom;
// velocities and forces are either empty (absent) or the same length.
struct Frame {
    std::vector<Vec3> coords;
    std::vector<Vec3> velocities;
    std::vector<Vec3> forces;
    Mat3 box;
    int step{0};
    float time{0.0f};
    float lambda{0.0f};
    // Precision declared by the last decoded XTC block, 0 for raw blocks.
    float precision{0.0f};

    Frame() = default;
    explicit Frame(std::size_t natoms) : coords(natoms) {}

    std::size_t natoms() const { return coords.size(); }
    // An all-zero box means the system is not periodic.
    bool hasBox() const { return !box.isZero(); }
    bool hasVelocities() const { return !velocities.empty(); }
    bool hasForces() const { return !forces.empty(); }
};

}  // namespace xdrtraj
