#pragma once

/**
 * @file Types.h
 * @brief Core type definitions for HypDisk
 *
 * Screen convention: x grows to the right, y grows downward, angles are
 * radians measured from +x toward +y (the 2-D canvas convention).
 */

#include <HypDisk/Core/Export.h>

#include <cmath>
#include <cstdint>

namespace Hyp::Disk {

// =============================================================================
// 2D Point Type
// =============================================================================

/**
 * @brief 2D point in screen coordinates
 */
struct HYPDISK_API Point2d {
    double x = 0.0;
    double y = 0.0;

    Point2d() = default;
    Point2d(double x_, double y_) : x(x_), y(y_) {}

    bool IsValid() const { return std::isfinite(x) && std::isfinite(y); }

    /// Vector addition
    Point2d operator+(const Point2d& other) const {
        return {x + other.x, y + other.y};
    }

    /// Vector subtraction
    Point2d operator-(const Point2d& other) const {
        return {x - other.x, y - other.y};
    }

    /// Scalar multiplication
    Point2d operator*(double s) const {
        return {x * s, y * s};
    }

    /// Euclidean norm
    double Norm() const {
        return std::sqrt(x * x + y * y);
    }

    /// Distance to another point
    double DistanceTo(const Point2d& other) const {
        return (*this - other).Norm();
    }
};

// =============================================================================
// Segment2d
// =============================================================================

/**
 * @brief 2D line segment defined by two endpoints
 */
struct HYPDISK_API Segment2d {
    Point2d p1;
    Point2d p2;

    Segment2d() = default;
    Segment2d(const Point2d& start, const Point2d& end) : p1(start), p2(end) {}
    Segment2d(double x1, double y1, double x2, double y2) : p1(x1, y1), p2(x2, y2) {}

    /// Segment length
    double Length() const { return p1.DistanceTo(p2); }

    /// Midpoint
    Point2d Midpoint() const { return (p1 + p2) * 0.5; }

    /// Get point on segment at parameter t (0=p1, 1=p2)
    Point2d PointAt(double t) const {
        return p1 + (p2 - p1) * t;
    }

    bool IsValid() const { return p1.IsValid() && p2.IsValid(); }
};

// =============================================================================
// Arc2d
// =============================================================================

/**
 * @brief 2D circular arc in canvas form (start angle, end angle, direction)
 *
 * The arc runs from startAngle to endAngle in increasing angle order unless
 * anticlockwise is set, exactly like a canvas arc() call.
 */
struct HYPDISK_API Arc2d {
    Point2d center;
    double radius = 0.0;
    double startAngle = 0.0;     ///< Start angle (radians)
    double endAngle = 0.0;       ///< End angle (radians)
    bool anticlockwise = false;  ///< Decreasing angle direction

    Arc2d() = default;
    Arc2d(const Point2d& c, double r, double start, double end, bool ccw = false)
        : center(c), radius(r), startAngle(start), endAngle(end), anticlockwise(ccw) {}

    /// Full circle centered at c
    static Arc2d Circle(const Point2d& c, double r);

    /**
     * @brief Signed sweep actually traced by the arc
     *
     * Positive for increasing angles. A difference of a full turn or more
     * yields a full circle.
     */
    double SweepAngle() const;

    /// Arc length
    double Length() const { return std::abs(SweepAngle()) * radius; }

    /// Point on the circle at the given angle
    Point2d PointAtAngle(double angle) const {
        return {center.x + radius * std::cos(angle),
                center.y + radius * std::sin(angle)};
    }

    /// Start point
    Point2d StartPoint() const { return PointAtAngle(startAngle); }

    /// End point (after sweep)
    Point2d EndPoint() const { return PointAtAngle(startAngle + SweepAngle()); }

    /// Get point on arc at parameter t (0=start, 1=end)
    Point2d PointAt(double t) const { return PointAtAngle(startAngle + SweepAngle() * t); }

    bool IsValid() const {
        return center.IsValid() && std::isfinite(radius) &&
               std::isfinite(startAngle) && std::isfinite(endAngle) &&
               radius >= 0.0;
    }
};

// =============================================================================
// Stroke Style
// =============================================================================

/**
 * @brief 8-bit RGB color
 */
struct HYPDISK_API Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    Color() = default;
    Color(uint8_t r_, uint8_t g_, uint8_t b_) : r(r_), g(g_), b(b_) {}

    static Color Black() { return {0, 0, 0}; }
    static Color White() { return {255, 255, 255}; }
    static Color Red() { return {255, 0, 0}; }
    static Color Green() { return {0, 255, 0}; }
    static Color Blue() { return {0, 0, 255}; }

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }
};

/**
 * @brief Stroke color and line width applied to subsequent strokes
 */
struct HYPDISK_API StrokeStyle {
    Color color = Color::Black();
    double width = 1.0;

    StrokeStyle() = default;
    StrokeStyle(const Color& c, double w) : color(c), width(w) {}
};

} // namespace Hyp::Disk
