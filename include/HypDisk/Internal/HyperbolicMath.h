#pragma once

/**
 * @file HyperbolicMath.h
 * @brief Scalar hyperbolic arithmetic and radius/model conversions
 *
 * This module provides:
 * - Inverse hyperbolic functions in logarithmic form
 * - Degree/radian conversion
 * - Poincare radius <-> gyrovector radius conversion
 * - Poincare disk <-> half-plane circle parameter conversion
 * - Angle-defect area and angle of parallelism
 *
 * Used by:
 * - Internal/TriangleLaws: law solvers
 * - Solver/TriangleSolver: right angle detection
 * - Projection/DiskProjection: side length to disk radius mapping
 *
 * Design principles:
 * - All functions are pure (no global state)
 * - Zero marks an unknown slot in the conversion records
 */

#include <HypDisk/Core/Export.h>

namespace Hyp::Disk::Internal {

// =============================================================================
// Scalar Functions
// =============================================================================

/**
 * @brief Inverse hyperbolic sine, log(x + sqrt(x^2 + 1))
 */
HYPDISK_API double Asinh(double x);

/**
 * @brief Inverse hyperbolic cosine, log(x + sqrt(x^2 - 1))
 *
 * @note Defined for x >= 1 only; returns NaN otherwise. Callers must guard.
 */
HYPDISK_API double Acosh(double x);

/// Degrees to radians
HYPDISK_API double DegreesToRadians(double degrees);

/// Radians to degrees
HYPDISK_API double RadiansToDegrees(double radians);

/**
 * @brief Area of a hyperbolic triangle from its angle defect
 *
 * Area = k^2 * (PI - A - B - C)
 *
 * @param k Curvature scale (1 for the unit disk)
 */
HYPDISK_API double TriangleArea(double A, double B, double C, double k = 1.0);

/**
 * @brief Angle of parallelism for distance b, 2 * atan(exp(-b / k))
 *
 * @throws InvalidArgumentException if k == 0
 */
HYPDISK_API double AngleOfParallelism(double b, double k = 1.0);

// =============================================================================
// Radius Conversion
// =============================================================================

/**
 * @brief Poincare disk radius paired with its gyrovector radius
 *
 * r = tanh(rg / 2), rg = ln((1 + r) / (1 - r))
 */
struct RadiusPair {
    double r = 0.0;     ///< Poincare radius in [0, 1)
    double rg = 0.0;    ///< Gyrovector radius in [0, inf)
};

/**
 * @brief Fill whichever of r / rg is zero from the other
 *
 * If both or neither are nonzero the pair is returned unchanged.
 *
 * @throws OutOfDomainException if |r| >= 1 must be converted
 */
HYPDISK_API RadiusPair PoincareGyrovectorConvert(const RadiusPair& pair);

// =============================================================================
// Disk / Half-Plane Conversion
// =============================================================================

/**
 * @brief Circle described in the disk model and in the half-plane model
 *
 * (x, y, r, l): Euclidean center, radius and circumference.
 * (xg, yg, rg, lg): half-plane center, hyperbolic radius and circumference.
 */
struct CircleParameters {
    double x = 0.0;
    double y = 0.0;
    double r = 0.0;
    double l = 0.0;
    double xg = 0.0;
    double yg = 0.0;
    double rg = 0.0;
    double lg = 0.0;
};

/**
 * @brief Fill derivable slots from one known pairing
 *
 * Pairings are tried in this priority order and only the first match is
 * used: (y, r), (y, l), (yg, rg), (yg, lg), (y, yg), (l, lg), (rg, r).
 * x and xg are copied onto each other when one of them is nonzero.
 *
 * @throws OutOfDomainException if the pairing yields a non-finite value
 *         (e.g. r >= y)
 */
HYPDISK_API CircleParameters DiskHalfPlaneConvert(const CircleParameters& params);

} // namespace Hyp::Disk::Internal
