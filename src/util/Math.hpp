#pragma once

#include <array>
#include <cstddef>
#include <ostream>

namespace xdrtraj {

// Single precision to match the XDR on-disk representation.
struct Vec3 {
    float x{0.0f};
    float y{0.0f};
    float z{0.0f};

    Vec3() = default;
    Vec3(float x_, float y_, float z_) : x(x_), y(y_), z(z_) {}

    float operator[](std::size_t idx) const { return idx == 0 ? x : (idx == 1 ? y : z); }
};

inline bool operator==(const Vec3& a, const Vec3& b) {
    return a.x == b.x && a.y == b.y && a.z == b.z;
}

inline bool operator!=(const Vec3& a, const Vec3& b) {
    return !(a == b);
}

inline std::ostream& operator<<(std::ostream& os, const Vec3& v) {
    os << "(" << v.x << ", " << v.y << ", " << v.z << ")";
    return os;
}

struct Mat3 {
    // row-major: each row is one box vector, as GROMACS stores it.
    std::array<Vec3, 3> rows{};

    Mat3() = default;
    Mat3(const Vec3& r0, const Vec3& r1, const Vec3& r2) {
        rows[0] = r0;
        rows[1] = r1;
        rows[2] = r2;
    }

    const Vec3& operator[](std::size_t idx) const { return rows[idx]; }
    Vec3& operator[](std::size_t idx) { return rows[idx]; }

    bool isZero() const {
        for (const auto& r : rows) {
            if (r.x != 0.0f || r.y != 0.0f || r.z != 0.0f) {
                return false;
            }
        }
        return true;
    }
};

inline bool operator==(const Mat3& a, const Mat3& b) {
    return a.rows[0] == b.rows[0] && a.rows[1] == b.rows[1] && a.rows[2] == b.rows[2];
}

inline bool operator!=(const Mat3& a, const Mat3& b) {
    return !(a == b);
}

}  // namespace xdrtraj
