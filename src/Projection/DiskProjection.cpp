/**
 * @file DiskProjection.cpp
 * @brief Implementation of the Poincare disk projection and primitive builders
 */

#include <HypDisk/Projection/DiskProjection.h>
#include <HypDisk/Internal/HyperbolicMath.h>
#include <HypDisk/Internal/TriangleLaws.h>
#include <HypDisk/Solver/TriangleSolver.h>
#include <HypDisk/Core/Constants.h>
#include <HypDisk/Core/Exception.h>
#include <HypDisk/Core/Log.h>
#include <HypDisk/Core/Validate.h>

#include <cmath>
#include <string>

namespace Hyp::Disk::Projection {

namespace {

// Poincare radius fraction of a hyperbolic length
double ToDiskFraction(double length) {
    return Internal::PoincareGyrovectorConvert({0.0, length}).r;
}

void RequireFrame(const DiskFrame& frame, const char* funcName) {
    if (!frame.IsValid()) {
        throw InvalidArgumentException(std::string(funcName) + ": disk frame must have a positive radius");
    }
}

} // namespace

// =============================================================================
// Curved Side Projection
// =============================================================================

DrawPrimitive ProjectCurvature(const DiskFrame& frame,
                               double A, double B, double C,
                               double rotation,
                               double aung, double bung) {
    const double R = frame.radius;
    const double defect = PI - (A + B + C);
    const double denom = 2.0 * (1.0 - std::cos(defect));

    if (denom > 0.0) {
        // Euclidean chord between the two outer vertices
        double dx = std::sin(C) * bung * R;
        double dy = bung * R * std::cos(C) - aung * R;
        double radius = std::sqrt((dx * dx + dy * dy) / denom);

        double sinRot = std::sin(rotation);
        double cosRot = std::cos(rotation);
        double offset = aung * R + radius * std::sin(B);
        Point2d center(frame.center.x + radius * std::cos(B) * cosRot + offset * sinRot,
                       frame.center.y + offset * cosRot - radius * std::cos(B) * sinRot);

        Point2d start = frame.Radial(rotation, aung);
        Point2d end = frame.Radial(rotation + C, bung);

        double startAngle = std::atan2(start.y - center.y, start.x - center.x);
        double endAngle = std::atan2(end.y - center.y, end.x - center.x);
        return DrawPrimitive::FromArc(Arc2d(center, radius, startAngle, endAngle));
    }

    // Zero defect: straight diameter
    Point2d start = frame.Boundary(rotation + HALF_PI);
    Point2d end = frame.Boundary(rotation + 1.5 * PI);
    return DrawPrimitive::FromChord(Segment2d(start, end));
}

// =============================================================================
// Primitive Builders
// =============================================================================

DrawPrimitive BuildBoundary(const DiskFrame& frame) {
    RequireFrame(frame, __func__);
    return DrawPrimitive::FromArc(Arc2d::Circle(frame.center, frame.radius));
}

DrawList BuildTriangle(const DiskFrame& frame, const Triangle& triangle, double rotation) {
    RequireFrame(frame, __func__);
    if (!triangle.IsComplete()) {
        throw InsufficientDataException("BuildTriangle: triangle must be completed first [" +
                                        triangle.ToString() + "]");
    }

    const double A = *triangle.Angle(Vertex::A);
    const double B = *triangle.Angle(Vertex::B);
    const double C = *triangle.Angle(Vertex::C);
    const double aung = ToDiskFraction(*triangle.Side(Vertex::A));
    const double bung = ToDiskFraction(*triangle.Side(Vertex::B));

    DrawList list;
    list.reserve(3);
    list.push_back(DrawPrimitive::FromChord(Segment2d(frame.center, frame.Radial(rotation, aung))));
    list.push_back(DrawPrimitive::FromChord(Segment2d(frame.center, frame.Radial(rotation + C, bung))));
    list.push_back(ProjectCurvature(frame, A, B, C, rotation, aung, bung));
    return list;
}

DrawList BuildPolygon(const DiskFrame& frame, int sides, double interiorAngle, double rotation) {
    RequireFrame(frame, __func__);
    if (sides < 3) {
        Log::Get()->warn("BuildPolygon: {} sides requested", sides);
        throw InvalidSidesException("BuildPolygon: number of sides must be at least three, got " +
                                    std::to_string(sides));
    }
    HYPDISK_REQUIRE_POSITIVE(interiorAngle);
    if (sides * interiorAngle >= (sides - 2) * PI) {
        Log::Get()->warn("BuildPolygon: {} sides with interior angle {} rad", sides, interiorAngle);
        throw ImpossibleGeometryException("BuildPolygon: interior angles of a " + std::to_string(sides) +
                                          "-gon must sum to less than " + std::to_string(sides - 2) + "*PI");
    }

    // Isosceles triangle: central angle C at the center, half interior angles at the vertices
    const double C = TWO_PI / sides;
    const double A = interiorAngle / 2.0;
    const double B = interiorAngle / 2.0;

    Internal::SecondCosineTerms terms;
    terms.A = A;
    terms.B = C;
    terms.C = B;
    const double circumradius = *Internal::SolveBySecondCosineRule(terms).a;
    const double aung = ToDiskFraction(circumradius);

    Log::Get()->debug("BuildPolygon: n={} circumradius={} (disk fraction {})", sides, circumradius, aung);

    DrawList list;
    list.reserve(static_cast<size_t>(sides));
    for (int i = 0; i < sides; ++i) {
        list.push_back(ProjectCurvature(frame, A, B, C, -(C / 2.0) + i * C + rotation, aung, aung));
    }
    return list;
}

DrawList BuildRectangle(const DiskFrame& frame, double A, double B,
                        double a, double b, double rotation) {
    RequireFrame(frame, __func__);
    if (A == B) {
        Log::Get()->warn("BuildRectangle: equal angles {}", A);
        throw InvalidAnglesException("BuildRectangle: starting and ending angles must be different");
    }

    // Auxiliary triangle: side a, angle A at vertex B, side b as c
    Triangle aux;
    aux.Side(Vertex::A) = a;
    aux.Angle(Vertex::B) = A;
    aux.Side(Vertex::C) = b;
    Triangle solved = Solver::SolveTriangle(aux);

    const double B1 = *solved.Angle(Vertex::A);
    const double l1 = *solved.Side(Vertex::B);
    const double C1 = *solved.Angle(Vertex::C);

    const double aung = ToDiskFraction(a);
    const double l1ung = ToDiskFraction(l1);
    const double bung = ToDiskFraction(b);

    DrawList list;
    list.reserve(4);
    list.push_back(DrawPrimitive::FromChord(Segment2d(frame.center, frame.Radial(rotation + C1 + B1, aung))));
    list.push_back(DrawPrimitive::FromChord(Segment2d(frame.center, frame.Radial(rotation, bung))));
    list.push_back(ProjectCurvature(frame, C1, A, B1, rotation, bung, l1ung));
    list.push_back(ProjectCurvature(frame, A, B1, C1, rotation + B1, l1ung, aung));
    return list;
}

DrawPrimitive BuildGeodesicLine(const DiskFrame& frame, double a1, double a2) {
    RequireFrame(frame, __func__);
    HYPDISK_REQUIRE_FINITE(a1);
    HYPDISK_REQUIRE_FINITE(a2);
    if (a1 == a2) {
        throw InvalidAnglesException("BuildGeodesicLine: boundary angles must differ");
    }

    // Go the short way around the 0 / 2*PI seam
    if (a2 - a1 > PI) a1 += TWO_PI;
    if (a1 - a2 > PI) a2 += TWO_PI;

    const double C = std::abs(a2 - a1);

    if (std::abs(C - PI) <= ANGLE_TOLERANCE) {
        return DrawPrimitive::FromChord(Segment2d(frame.Boundary(a1), frame.Boundary(a2)));
    }

    // Isosceles triangle with both legs just inside the boundary
    const double aung = NEAR_BOUNDARY_RADIUS;
    const double legLength = Internal::PoincareGyrovectorConvert({aung, 0.0}).rg;

    Triangle legs;
    legs.Side(Vertex::A) = aung;
    legs.Side(Vertex::B) = aung;
    legs.Angle(Vertex::C) = C;
    legs.Side(Vertex::C) = legLength;
    Triangle closed = Internal::SolveBySineRule(legs);

    const double A = closed.AngleOr0(Vertex::A);
    const double B = closed.AngleOr0(Vertex::B);
    return ProjectCurvature(frame, A, B, C, (a1 + a2) / 2.0 + HALF_PI - C / 2.0, aung, aung);
}

DrawList BuildOricycles(const DiskFrame& frame, int count, double direction) {
    RequireFrame(frame, __func__);
    if (count < 1) {
        throw InvalidArgumentException("BuildOricycles: number of circles must be >= 1, got " +
                                       std::to_string(count));
    }

    const double R = frame.radius;
    DrawList list;
    list.reserve(static_cast<size_t>(count));
    for (int i = 1; i <= count; ++i) {
        double r = i * R / (count + 1);
        Point2d center(frame.center.x + (R - r) * std::cos(direction),
                       frame.center.y - (R - r) * std::sin(direction));
        list.push_back(DrawPrimitive::FromArc(Arc2d::Circle(center, r)));
    }
    return list;
}

DrawPrimitive BuildCircle(const DiskFrame& frame, double poincareRadius, double gyroRadius) {
    RequireFrame(frame, __func__);
    if ((poincareRadius != 0.0 && gyroRadius != 0.0) ||
        (poincareRadius == 0.0 && gyroRadius == 0.0)) {
        Log::Get()->warn("BuildCircle: r={} rg={}", poincareRadius, gyroRadius);
        throw AmbiguousInputException("BuildCircle: give exactly one of the Poincare and gyrovector radii");
    }
    if (poincareRadius >= 1.0) {
        Log::Get()->warn("BuildCircle: Poincare radius {} outside the disk", poincareRadius);
        throw OutOfDomainException("BuildCircle: Poincare radius must be less than 1");
    }
    if (poincareRadius < 0.0 || gyroRadius < 0.0) {
        throw OutOfDomainException("BuildCircle: radius must not be negative");
    }

    Internal::RadiusPair pair = Internal::PoincareGyrovectorConvert({poincareRadius, gyroRadius});
    if (pair.rg > MAX_GYROVECTOR_RADIUS) {
        Log::Get()->warn("BuildCircle: gyrovector radius {} too large", pair.rg);
        throw OutOfDomainException("BuildCircle: radius is too large (gyrovector radius > " +
                                   std::to_string(static_cast<int>(MAX_GYROVECTOR_RADIUS)) + ")");
    }

    return DrawPrimitive::FromArc(Arc2d::Circle(frame.center, pair.r * frame.radius));
}

DrawList BuildCircleSeries(const DiskFrame& frame, int count, double r1, double r2) {
    RequireFrame(frame, __func__);
    HYPDISK_REQUIRE_NON_NEGATIVE(count);
    if (count == 0) {
        return {};
    }
    HYPDISK_REQUIRE_FINITE(r1);
    HYPDISK_REQUIRE_FINITE(r2);
    HYPDISK_REQUIRE_NON_NEGATIVE(r1);
    if (r2 <= r1) {
        throw InvalidArgumentException("BuildCircleSeries: outer radius should be greater than inner radius");
    }

    // Radii are not capped; a large rg lands on the boundary
    auto concentric = [&frame](double rg) {
        const double r = Internal::PoincareGyrovectorConvert({0.0, rg}).r;
        return DrawPrimitive::FromArc(Arc2d::Circle(frame.center, r * frame.radius));
    };

    if (count == 1) {
        return {concentric((r1 + r2) / 2.0)};
    }

    const double step = (r2 - r1) / (count - 1);
    DrawList list;
    list.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        list.push_back(concentric(r1 + i * step));
    }
    return list;
}

} // namespace Hyp::Disk::Projection
