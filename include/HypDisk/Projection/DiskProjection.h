#pragma once

/**
 * @file DiskProjection.h
 * @brief Projection of solved hyperbolic measurements into the Poincare disk
 *
 * This module provides:
 * - The curved-side projection (hyperbolic arc -> Euclidean circular arc)
 * - Primitive builders: triangle, regular polygon, rectangle, geodesic line,
 *   oricycle family, circle and circle series
 *
 * All builders are pure: they return draw descriptors and never touch a
 * rendering surface. Angles are radians; screen y points down.
 *
 * Side lengths enter the disk through the gyrovector conversion
 * r = tanh(rg / 2), giving the Poincare radius fraction ("aung", "bung")
 * of the disk radius.
 */

#include <HypDisk/Core/Export.h>
#include <HypDisk/Core/Triangle.h>
#include <HypDisk/Core/Types.h>
#include <HypDisk/Projection/DiskFrame.h>

#include <vector>

namespace Hyp::Disk::Projection {

// =============================================================================
// Draw Descriptors
// =============================================================================

/**
 * @brief Kind of render-ready primitive
 */
enum class PrimitiveType {
    Arc,    ///< Circular arc (also full circles)
    Chord   ///< Straight segment
};

/**
 * @brief Render-ready primitive in screen space
 */
struct HYPDISK_API DrawPrimitive {
    PrimitiveType type = PrimitiveType::Arc;
    Arc2d arc;          ///< Valid when type == Arc
    Segment2d chord;    ///< Valid when type == Chord

    static DrawPrimitive FromArc(const Arc2d& arc) {
        DrawPrimitive p;
        p.type = PrimitiveType::Arc;
        p.arc = arc;
        return p;
    }

    static DrawPrimitive FromChord(const Segment2d& chord) {
        DrawPrimitive p;
        p.type = PrimitiveType::Chord;
        p.chord = chord;
        return p;
    }

    bool IsArc() const { return type == PrimitiveType::Arc; }
    bool IsChord() const { return type == PrimitiveType::Chord; }
};

using DrawList = std::vector<DrawPrimitive>;

// =============================================================================
// Curved Side Projection
// =============================================================================

/**
 * @brief Project the curved side of a triangle with one vertex at the center
 *
 * The triangle has angle C at the disk center, its straight sides leave the
 * center at `rotation` (length fraction aung, ending at the vertex with
 * angle B) and at `rotation + C` (length fraction bung). The returned arc
 * joins the two outer vertices.
 *
 * If the angle defect PI - (A + B + C) is zero the side is a straight
 * diameter chord through the disk at the given rotation.
 *
 * @param frame Disk frame
 * @param A, B, C Triangle angles (radians)
 * @param rotation Direction of the first straight side
 * @param aung Poincare radius fraction of the first side, [0, 1)
 * @param bung Poincare radius fraction of the second side, [0, 1)
 */
HYPDISK_API DrawPrimitive ProjectCurvature(const DiskFrame& frame,
                                           double A, double B, double C,
                                           double rotation,
                                           double aung, double bung);

// =============================================================================
// Primitive Builders
// =============================================================================

/**
 * @brief Full boundary circle of the disk
 */
HYPDISK_API DrawPrimitive BuildBoundary(const DiskFrame& frame);

/**
 * @brief Triangle with vertex C at the disk center
 *
 * Two straight chords from the center (sides a and b), then the curved side.
 *
 * @param triangle Completed triangle (see Solver::SolveTriangle)
 * @throws InsufficientDataException if the triangle is not complete
 */
HYPDISK_API DrawList BuildTriangle(const DiskFrame& frame, const Triangle& triangle,
                                   double rotation);

/**
 * @brief Regular polygon centered on the disk
 *
 * Central angle 2*PI/n, half interior angle at each vertex; the
 * circumradius comes from the second cosine rule.
 *
 * @param sides Number of sides n >= 3
 * @param interiorAngle Interior angle U (radians)
 * @throws InvalidSidesException if n < 3
 * @throws InvalidArgumentException if U <= 0
 * @throws ImpossibleGeometryException if n * U >= (n - 2) * PI
 * @return n arcs
 */
HYPDISK_API DrawList BuildPolygon(const DiskFrame& frame, int sides,
                                  double interiorAngle, double rotation);

/**
 * @brief Quadrilateral from an auxiliary triangle with sides a, b around angle A
 *
 * @param A Angle between the sides of length a and b (radians)
 * @param B Second angle; must differ from A
 * @throws InvalidAnglesException if A == B
 * @return Two chords followed by two arcs
 */
HYPDISK_API DrawList BuildRectangle(const DiskFrame& frame, double A, double B,
                                    double a, double b, double rotation);

/**
 * @brief Geodesic between two boundary angles
 *
 * Angles wrap so that the shorter way around is used. Diametrically
 * opposite angles give a straight chord.
 *
 * @throws InvalidAnglesException if a1 == a2
 */
HYPDISK_API DrawPrimitive BuildGeodesicLine(const DiskFrame& frame, double a1, double a2);

/**
 * @brief n nested circles touching the boundary at direction `direction`
 *
 * Circle i has radius i * R / (n + 1).
 *
 * @throws InvalidArgumentException if n < 1
 */
HYPDISK_API DrawList BuildOricycles(const DiskFrame& frame, int count, double direction);

/**
 * @brief Circle centered on the disk from exactly one of (r, rg)
 *
 * @param poincareRadius Poincare radius r in [0, 1), 0 if unknown
 * @param gyroRadius Gyrovector radius rg, 0 if unknown
 * @throws AmbiguousInputException if both or neither are nonzero
 * @throws OutOfDomainException if r >= 1, rg > 35, or either is negative
 */
HYPDISK_API DrawPrimitive BuildCircle(const DiskFrame& frame, double poincareRadius,
                                      double gyroRadius);

/**
 * @brief n concentric circles with gyrovector radii spread over [r1, r2]
 *
 * n == 0 yields nothing; n == 1 draws the midpoint radius. Unlike
 * BuildCircle, radii above MAX_GYROVECTOR_RADIUS are drawn.
 *
 * @throws InvalidArgumentException if n < 0, r1 < 0, a radius is not
 *         finite, or r2 <= r1
 */
HYPDISK_API DrawList BuildCircleSeries(const DiskFrame& frame, int count,
                                       double r1, double r2);

} // namespace Hyp::Disk::Projection
