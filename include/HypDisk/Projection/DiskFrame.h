#pragma once

/**
 * @file DiskFrame.h
 * @brief Screen placement of the Poincare disk
 */

#include <HypDisk/Core/Export.h>
#include <HypDisk/Core/Types.h>

#include <cstdint>

namespace Hyp::Disk::Projection {

/**
 * @brief Center and outer radius of the disk in screen coordinates
 *
 * Immutable per drawing; every projection is relative to it.
 */
struct HYPDISK_API DiskFrame {
    Point2d center;
    double radius = 0.0;

    DiskFrame() = default;
    DiskFrame(const Point2d& c, double r) : center(c), radius(r) {}
    DiskFrame(double cx, double cy, double r) : center(cx, cy), radius(r) {}

    /**
     * @brief Default frame for a canvas: center (w/2, w/2), radius 0.95 * w/2
     * @throws InvalidArgumentException if width or height is not positive
     */
    static DiskFrame ForCanvas(int32_t width, int32_t height);

    /**
     * @brief Point at a Poincare radius fraction along a rotation
     *
     * Rotation is measured from screen-down toward screen-right, the
     * convention used for the straight sides of triangles and polygons:
     * (x, y) = center + fraction * radius * (sin(rotation), cos(rotation)).
     */
    Point2d Radial(double rotation, double fraction) const;

    /**
     * @brief Point on the boundary at a mathematical angle (counter-clockwise
     *        from screen-right, screen y pointing down)
     */
    Point2d Boundary(double angle) const;

    bool IsValid() const {
        return center.IsValid() && std::isfinite(radius) && radius > 0.0;
    }
};

} // namespace Hyp::Disk::Projection
