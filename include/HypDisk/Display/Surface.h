#pragma once

/**
 * @file Surface.h
 * @brief Rendering surface consumed by the disk drawer
 *
 * Coordinates are screen pixels, y pointing down. Arcs follow the canvas
 * arc() convention (see Arc2d).
 */

#include <HypDisk/Core/Export.h>
#include <HypDisk/Core/Types.h>

#include <cstdint>

namespace Hyp::Disk::Display {

/**
 * @brief Abstract 2-D stroke surface
 */
class HYPDISK_API Surface {
public:
    virtual ~Surface() = default;

    virtual int32_t Width() const = 0;
    virtual int32_t Height() const = 0;

    /// Erase everything drawn so far
    virtual void Clear() = 0;

    /// Stroke a circular arc with the current style
    virtual void StrokeArc(const Arc2d& arc) = 0;

    /// Stroke a straight segment with the current style
    virtual void StrokeLine(const Segment2d& segment) = 0;

    /// Style for subsequent strokes
    virtual void SetStrokeStyle(const Color& color, double width) = 0;

    virtual StrokeStyle GetStrokeStyle() const = 0;
};

} // namespace Hyp::Disk::Display
