#pragma once

/**
 * @file DiskDrawer.h
 * @brief Draws Poincare disk primitives onto a Surface
 *
 * DiskDrawer is the adapter between the pure projection engine and a
 * rendering surface. Its public operations take angles in DEGREES; the
 * projection engine below works in radians.
 *
 * Primitives are issued one at a time as they are computed. When a
 * composite operation fails part way, earlier primitives stay on the
 * surface.
 *
 * Usage:
 * @code
 * Display::RasterSurface surface(800, 800);
 * Display::DiskDrawer drawer(&surface);
 * drawer.SetEmptyPoincareDisk();
 * drawer.CreatePolygon(5, 50.0, 20.0);
 * surface.SaveToFile("pentagon.png");
 * @endcode
 */

#include <HypDisk/Core/Export.h>
#include <HypDisk/Core/Triangle.h>
#include <HypDisk/Display/Surface.h>
#include <HypDisk/Projection/DiskFrame.h>
#include <HypDisk/Projection/DiskProjection.h>

namespace Hyp::Disk::Display {

class HYPDISK_API DiskDrawer {
public:
    /**
     * @brief Attach to a surface with the default frame for its size
     *
     * The surface is not owned and must outlive the drawer.
     *
     * @throws UninitializedSurfaceException if surface is null
     */
    explicit DiskDrawer(Surface* surface);

    /**
     * @brief Attach to a surface with an explicit disk frame
     * @throws UninitializedSurfaceException if surface is null
     */
    DiskDrawer(Surface* surface, const Projection::DiskFrame& frame);

    /// Replace the surface; nullptr detaches (later draws throw)
    void SetSurface(Surface* surface) { surface_ = surface; }
    Surface* GetSurface() const { return surface_; }

    const Projection::DiskFrame& Frame() const { return frame_; }
    void SetFrame(const Projection::DiskFrame& frame);

    // =========================================================================
    // Canvas
    // =========================================================================

    /// Erase the surface
    void ClearCanvas();

    /// Erase the surface and draw the disk boundary (blue, width 2)
    void SetEmptyPoincareDisk();

    // =========================================================================
    // Shapes
    // =========================================================================

    /**
     * @brief Complete a triangle from 2-3 known slots and draw it
     *
     * Angles in degrees, 0 means unknown. Vertex C sits at the disk center.
     *
     * @return The completed triangle (angles in radians)
     * @throws InsufficientDataException, TooManyInputsException,
     *         InvalidTriangleException as Solver::SolveTriangle
     */
    Triangle HandleTriangleDrawing(double A, double a, double B, double b,
                                   double C, double c, double rotation);

    /**
     * @brief Regular polygon with n sides and interior angle U (degrees)
     * @throws InvalidSidesException if n < 3
     * @throws ImpossibleGeometryException if n * U >= (n - 2) * 180
     */
    void CreatePolygon(int sides, double interiorAngle, double rotation);

    /**
     * @brief Quadrilateral around angle A (degrees) with sides a and b
     * @throws InvalidAnglesException if A == B
     */
    void CreateRectangle(double A, double B, double a, double b, double rotation);

    /**
     * @brief Geodesic between boundary angles a1 and a2 (degrees)
     * @throws InvalidAnglesException if an angle exceeds 360 or a1 == a2
     */
    void CreateHyperbolicLine(double a1, double a2);

    /**
     * @brief n oricycles touching the boundary at direction a (degrees)
     */
    void CreateOricycle(int count, double direction);

    // =========================================================================
    // Line Families
    // =========================================================================

    /**
     * @brief n geodesics perpendicular to the diameter through a (degrees)
     * @throws InvalidArgumentException if n <= 0
     * @throws InvalidAnglesException if a > 360
     */
    void CreatePerpendiculars(int count, double direction);

    /**
     * @brief k geodesics through the boundary point at a1 (degrees)
     * @throws InvalidArgumentException if k <= 0
     * @throws InvalidAnglesException if a1 > 360
     */
    void CreateParallels(int count, double a1);

    /// Fixed 13-line decorative pattern
    void DrawComplexPattern();

    /**
     * @brief Perpendicular families every 360/pencils degrees
     *
     * The defaults (12 x 21) fill the plane with a 30 degree rosette.
     */
    void DrawPerpendicularRosette(int pencils = 12, int count = 21);

    // =========================================================================
    // Circles
    // =========================================================================

    /**
     * @brief Circle centered on the disk from exactly one of (r, rg)
     * @return The stroked arc
     * @throws AmbiguousInputException, OutOfDomainException as
     *         Projection::BuildCircle
     */
    Arc2d HandleCircleDrawing(double poincareRadius, double gyroRadius);

    /**
     * @brief n concentric circles over gyrovector radii [r1, r2], width 2
     */
    void HandleCircleSeriesDrawing(int count, double r1, double r2);

private:
    Surface& RequireSurface(const char* funcName) const;
    void Issue(Surface& surface, const Projection::DrawPrimitive& primitive) const;
    void IssueAll(Surface& surface, const Projection::DrawList& list) const;

    Surface* surface_;
    Projection::DiskFrame frame_;
};

} // namespace Hyp::Disk::Display
