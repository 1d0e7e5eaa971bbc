/**
 * @file DiskDrawer.cpp
 * @brief Implementation of the disk drawer adapter
 */

#include <HypDisk/Display/DiskDrawer.h>
#include <HypDisk/Internal/HyperbolicMath.h>
#include <HypDisk/Projection/Patterns.h>
#include <HypDisk/Solver/TriangleSolver.h>
#include <HypDisk/Core/Constants.h>
#include <HypDisk/Core/Exception.h>
#include <HypDisk/Core/Log.h>

#include <string>

namespace Hyp::Disk::Display {

using Internal::DegreesToRadians;

namespace {

Surface* RequireAttached(Surface* surface) {
    if (surface == nullptr) {
        throw UninitializedSurfaceException("DiskDrawer: surface is null");
    }
    return surface;
}

void RequireBoundaryAngle(double degrees, const char* name, const char* funcName) {
    if (degrees > MAX_BOUNDARY_ANGLE_DEGREES) {
        Log::Get()->warn("{}: {} = {} degrees", funcName, name, degrees);
        throw InvalidAnglesException(std::string(funcName) + ": " + name +
                                     " must be less than or equal to 360 degrees");
    }
}

// Restores the stroke style on scope exit
class StyleGuard {
public:
    explicit StyleGuard(Surface& surface)
        : surface_(surface), saved_(surface.GetStrokeStyle()) {}
    ~StyleGuard() { surface_.SetStrokeStyle(saved_.color, saved_.width); }

    StyleGuard(const StyleGuard&) = delete;
    StyleGuard& operator=(const StyleGuard&) = delete;

private:
    Surface& surface_;
    StrokeStyle saved_;
};

} // namespace

// =============================================================================
// Construction
// =============================================================================

DiskDrawer::DiskDrawer(Surface* surface)
    : surface_(RequireAttached(surface)),
      frame_(Projection::DiskFrame::ForCanvas(surface->Width(), surface->Height())) {}

DiskDrawer::DiskDrawer(Surface* surface, const Projection::DiskFrame& frame)
    : surface_(RequireAttached(surface)), frame_(frame) {
    SetFrame(frame);
}

void DiskDrawer::SetFrame(const Projection::DiskFrame& frame) {
    if (!frame.IsValid()) {
        throw InvalidArgumentException("DiskDrawer::SetFrame: disk frame must have a positive radius");
    }
    frame_ = frame;
}

Surface& DiskDrawer::RequireSurface(const char* funcName) const {
    if (surface_ == nullptr) {
        throw UninitializedSurfaceException(std::string(funcName) + ": no surface attached");
    }
    return *surface_;
}

void DiskDrawer::Issue(Surface& surface, const Projection::DrawPrimitive& primitive) const {
    if (primitive.IsArc()) {
        surface.StrokeArc(primitive.arc);
    } else {
        surface.StrokeLine(primitive.chord);
    }
}

void DiskDrawer::IssueAll(Surface& surface, const Projection::DrawList& list) const {
    for (const auto& primitive : list) {
        Issue(surface, primitive);
    }
}

// =============================================================================
// Canvas
// =============================================================================

void DiskDrawer::ClearCanvas() {
    RequireSurface(__func__).Clear();
}

void DiskDrawer::SetEmptyPoincareDisk() {
    Surface& surface = RequireSurface(__func__);
    surface.Clear();

    StyleGuard guard(surface);
    surface.SetStrokeStyle(Color::Blue(), 2.0);
    Issue(surface, Projection::BuildBoundary(frame_));
}

// =============================================================================
// Shapes
// =============================================================================

Triangle DiskDrawer::HandleTriangleDrawing(double A, double a, double B, double b,
                                           double C, double c, double rotation) {
    Surface& surface = RequireSurface(__func__);

    Triangle input = Triangle::FromSentinel(DegreesToRadians(A), a,
                                            DegreesToRadians(B), b,
                                            DegreesToRadians(C), c);
    Triangle solved = Solver::SolveTriangle(input);

    Log::Get()->debug("HandleTriangleDrawing: {}", solved.ToString());
    IssueAll(surface, Projection::BuildTriangle(frame_, solved, DegreesToRadians(rotation) + HALF_PI));
    return solved;
}

void DiskDrawer::CreatePolygon(int sides, double interiorAngle, double rotation) {
    Surface& surface = RequireSurface(__func__);
    IssueAll(surface, Projection::BuildPolygon(frame_, sides, DegreesToRadians(interiorAngle),
                                               DegreesToRadians(rotation)));
}

void DiskDrawer::CreateRectangle(double A, double B, double a, double b, double rotation) {
    Surface& surface = RequireSurface(__func__);
    IssueAll(surface, Projection::BuildRectangle(frame_, DegreesToRadians(A), DegreesToRadians(B),
                                                 a, b, DegreesToRadians(rotation) + HALF_PI));
}

void DiskDrawer::CreateHyperbolicLine(double a1, double a2) {
    Surface& surface = RequireSurface(__func__);
    RequireBoundaryAngle(a1, "a1", __func__);
    RequireBoundaryAngle(a2, "a2", __func__);
    Issue(surface, Projection::BuildGeodesicLine(frame_, DegreesToRadians(a1), DegreesToRadians(a2)));
}

void DiskDrawer::CreateOricycle(int count, double direction) {
    Surface& surface = RequireSurface(__func__);
    IssueAll(surface, Projection::BuildOricycles(frame_, count, DegreesToRadians(direction)));
}

// =============================================================================
// Line Families
// =============================================================================

void DiskDrawer::CreatePerpendiculars(int count, double direction) {
    Surface& surface = RequireSurface(__func__);
    RequireBoundaryAngle(direction, "direction", __func__);
    Projection::EmitPerpendiculars(frame_, count, DegreesToRadians(direction),
        [&](const Projection::DrawPrimitive& p) { Issue(surface, p); });
}

void DiskDrawer::CreateParallels(int count, double a1) {
    Surface& surface = RequireSurface(__func__);
    RequireBoundaryAngle(a1, "a1", __func__);
    Projection::EmitParallels(frame_, count, DegreesToRadians(a1),
        [&](const Projection::DrawPrimitive& p) { Issue(surface, p); });
}

void DiskDrawer::DrawComplexPattern() {
    Surface& surface = RequireSurface(__func__);
    Projection::EmitComplexPattern(frame_,
        [&](const Projection::DrawPrimitive& p) { Issue(surface, p); });
}

void DiskDrawer::DrawPerpendicularRosette(int pencils, int count) {
    Surface& surface = RequireSurface(__func__);
    Projection::EmitPerpendicularRosette(frame_, pencils, count,
        [&](const Projection::DrawPrimitive& p) { Issue(surface, p); });
}

// =============================================================================
// Circles
// =============================================================================

Arc2d DiskDrawer::HandleCircleDrawing(double poincareRadius, double gyroRadius) {
    Surface& surface = RequireSurface(__func__);
    Projection::DrawPrimitive circle = Projection::BuildCircle(frame_, poincareRadius, gyroRadius);
    Issue(surface, circle);
    return circle.arc;
}

void DiskDrawer::HandleCircleSeriesDrawing(int count, double r1, double r2) {
    Surface& surface = RequireSurface(__func__);
    Projection::DrawList circles = Projection::BuildCircleSeries(frame_, count, r1, r2);
    if (circles.empty()) {
        return;
    }

    StyleGuard guard(surface);
    surface.SetStrokeStyle(surface.GetStrokeStyle().color, 2.0);
    IssueAll(surface, circles);
}

} // namespace Hyp::Disk::Display
