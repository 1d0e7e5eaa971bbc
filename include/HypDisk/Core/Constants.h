#pragma once

/**
 * @file Constants.h
 * @brief Mathematical and drawing constants for HypDisk
 */

namespace Hyp::Disk {

// =============================================================================
// Mathematical Constants
// =============================================================================

constexpr double PI = 3.14159265358979323846;
constexpr double TWO_PI = 2.0 * PI;
constexpr double HALF_PI = 0.5 * PI;

constexpr double DEG_TO_RAD = PI / 180.0;
constexpr double RAD_TO_DEG = 180.0 / PI;

/// Generic floating point tolerance
constexpr double EPSILON = 1e-12;

/// Tolerance for angle equality (right angle detection, opposite boundary points)
constexpr double ANGLE_TOLERANCE = 1e-9;

// =============================================================================
// Disk Model Constants
// =============================================================================

/// Disk radius as a fraction of half the canvas width
constexpr double DISK_MARGIN = 0.95;

/// Poincare radius used for the legs of a geodesic between two boundary angles
constexpr double NEAR_BOUNDARY_RADIUS = 0.999;

/// Largest gyrovector radius that still maps inside the disk in double precision
constexpr double MAX_GYROVECTOR_RADIUS = 35.0;

/// Offset (degrees) of the extra line that closes an odd parallel pencil
constexpr double PARALLEL_GAP_DEGREES = 179.0;

/// Largest boundary angle accepted by the line builders (degrees)
constexpr double MAX_BOUNDARY_ANGLE_DEGREES = 360.0;

} // namespace Hyp::Disk
