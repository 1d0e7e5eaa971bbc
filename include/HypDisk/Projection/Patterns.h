#pragma once

/**
 * @file Patterns.h
 * @brief Families of geodesic lines in the Poincare disk
 *
 * Every pattern is a sequence of BuildGeodesicLine calls. Emitters hand
 * each primitive to a sink as soon as it is built, so a caller can render
 * progressively; the Build* variants collect the same sequence into a list.
 *
 * All angles are radians.
 */

#include <HypDisk/Core/Export.h>
#include <HypDisk/Projection/DiskProjection.h>

#include <functional>

namespace Hyp::Disk::Projection {

/// Receives primitives in emission order
using PrimitiveSink = std::function<void(const DrawPrimitive&)>;

// =============================================================================
// Emitters
// =============================================================================

/**
 * @brief n geodesics perpendicular to the diameter through direction a
 *
 * Line i (1..n) joins a - i*o and a + i*o with o = PI / (n + 1).
 *
 * @throws InvalidArgumentException if n <= 0
 */
HYPDISK_API void EmitPerpendiculars(const DiskFrame& frame, int count, double direction,
                                    const PrimitiveSink& sink);

/**
 * @brief k geodesics through the boundary point at a1, spread evenly
 *
 * With g = 2*PI / (k + 1), lines go from a1 to a1 + i*g and a1 - i*g.
 * For odd k the middle line ends at a1 + 179 degrees.
 *
 * @throws InvalidArgumentException if k <= 0
 */
HYPDISK_API void EmitParallels(const DiskFrame& frame, int count, double a1,
                               const PrimitiveSink& sink);

/**
 * @brief Fixed 13-line decorative pattern of eighth-turn geodesics
 */
HYPDISK_API void EmitComplexPattern(const DiskFrame& frame, const PrimitiveSink& sink);

/**
 * @brief Perpendicular families around `pencils` evenly spaced directions
 *
 * @param pencils Number of directions (>= 1)
 * @param count Lines per direction (>= 1)
 */
HYPDISK_API void EmitPerpendicularRosette(const DiskFrame& frame, int pencils, int count,
                                          const PrimitiveSink& sink);

// =============================================================================
// Collected Variants
// =============================================================================

HYPDISK_API DrawList BuildPerpendiculars(const DiskFrame& frame, int count, double direction);

HYPDISK_API DrawList BuildParallels(const DiskFrame& frame, int count, double a1);

HYPDISK_API DrawList BuildComplexPattern(const DiskFrame& frame);

HYPDISK_API DrawList BuildPerpendicularRosette(const DiskFrame& frame, int pencils, int count);

} // namespace Hyp::Disk::Projection
