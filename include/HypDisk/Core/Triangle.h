#pragma once

/**
 * @file Triangle.h
 * @brief Hyperbolic triangle measurement set
 *
 * Six slots: angles A, B, C (radians) and the opposite sides a, b, c
 * (hyperbolic length). An empty optional marks an unknown slot, so a
 * zero-length side is never confused with "unspecified". The external
 * 0-means-unknown convention is kept through FromSentinel() / ToSentinel().
 */

#include <HypDisk/Core/Export.h>

#include <array>
#include <optional>
#include <string>

namespace Hyp::Disk {

/**
 * @brief Triangle vertex; indexes an angle together with its opposite side
 */
enum class Vertex {
    A = 0,
    B = 1,
    C = 2
};

/// Slot index of a vertex
constexpr int Index(Vertex v) { return static_cast<int>(v); }

/**
 * @brief Which of the six slots are known
 */
struct HYPDISK_API KnownMask {
    std::array<bool, 3> angle{};
    std::array<bool, 3> side{};

    bool Angle(Vertex v) const { return angle[Index(v)]; }
    bool Side(Vertex v) const { return side[Index(v)]; }

    int AngleCount() const { return angle[0] + angle[1] + angle[2]; }
    int SideCount() const { return side[0] + side[1] + side[2]; }
    int Count() const { return AngleCount() + SideCount(); }

    bool operator==(const KnownMask& other) const {
        return angle == other.angle && side == other.side;
    }
    bool operator!=(const KnownMask& other) const { return !(*this == other); }
};

/**
 * @brief Triangle measurement set (value type)
 */
struct HYPDISK_API Triangle {
    std::array<std::optional<double>, 3> angle;  ///< A, B, C in radians
    std::array<std::optional<double>, 3> side;   ///< a, b, c opposite

    /// Build from six scalars where 0 means unknown
    static Triangle FromSentinel(double A, double a, double B, double b, double C, double c);

    /// Six scalars in order A, a, B, b, C, c with 0 for unknown slots
    std::array<double, 6> ToSentinel() const;

    std::optional<double>& Angle(Vertex v) { return angle[Index(v)]; }
    const std::optional<double>& Angle(Vertex v) const { return angle[Index(v)]; }

    std::optional<double>& Side(Vertex v) { return side[Index(v)]; }
    const std::optional<double>& Side(Vertex v) const { return side[Index(v)]; }

    /// Angle value, 0 if unknown
    double AngleOr0(Vertex v) const { return angle[Index(v)].value_or(0.0); }

    /// Side value, 0 if unknown
    double SideOr0(Vertex v) const { return side[Index(v)].value_or(0.0); }

    KnownMask Mask() const;

    int KnownCount() const { return Mask().Count(); }

    /// All six slots known
    bool IsComplete() const { return KnownCount() == 6; }

    /// Sum of the known angles
    double AngleSum() const;

    /**
     * @brief Area from the angle defect, k^2 * (PI - A - B - C)
     * @throws InsufficientDataException if an angle is unknown
     */
    double Area(double k = 1.0) const;

    /// Human readable form, unknown slots shown as '?'
    std::string ToString() const;
};

} // namespace Hyp::Disk
