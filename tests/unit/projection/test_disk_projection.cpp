/**
 * @file test_disk_projection.cpp
 * @brief Unit tests for Projection/DiskFrame and Projection/DiskProjection
 *
 * Tests cover:
 * - Disk frame placement helpers
 * - Curved side projection (arc and degenerate chord)
 * - Triangle, polygon and rectangle builders (closure of the outline)
 * - Geodesic lines (orthogonality to the boundary, wrap-around, diameters)
 * - Oricycles, single circles and circle series
 */

#include <HypDisk/Projection/DiskProjection.h>
#include <HypDisk/Solver/TriangleSolver.h>
#include <HypDisk/Core/Constants.h>
#include <HypDisk/Core/Exception.h>
#include <gtest/gtest.h>

#include <cmath>

namespace Hyp::Disk::Projection {
namespace {

constexpr double kTol = 1e-6;

// =============================================================================
// Test Utilities
// =============================================================================

class DiskProjectionTest : public ::testing::Test {
protected:
    DiskFrame frame_{200.0, 200.0, 190.0};

    double R() const { return frame_.radius; }

    double DistanceFromCenter(const Point2d& p) const {
        return p.DistanceTo(frame_.center);
    }

    /// Euclidean circle orthogonal to the boundary circle
    bool IsOrthogonalToBoundary(const Arc2d& arc, double relTol) const {
        double d2 = std::pow(DistanceFromCenter(arc.center), 2);
        double expected = R() * R() + arc.radius * arc.radius;
        return std::abs(d2 - expected) <= relTol * expected;
    }
};

void ExpectPointNear(const Point2d& a, const Point2d& b, double tol = kTol) {
    EXPECT_NEAR(a.x, b.x, tol);
    EXPECT_NEAR(a.y, b.y, tol);
}

// =============================================================================
// DiskFrame
// =============================================================================

TEST_F(DiskProjectionTest, FrameForCanvas) {
    DiskFrame f = DiskFrame::ForCanvas(400, 300);
    EXPECT_DOUBLE_EQ(f.center.x, 200.0);
    EXPECT_DOUBLE_EQ(f.center.y, 200.0);
    EXPECT_DOUBLE_EQ(f.radius, 190.0);
    EXPECT_THROW(DiskFrame::ForCanvas(0, 300), InvalidArgumentException);
}

TEST_F(DiskProjectionTest, FramePlacement) {
    ExpectPointNear(frame_.Radial(0.0, 0.5), Point2d(200.0, 295.0));
    ExpectPointNear(frame_.Radial(HALF_PI, 1.0), Point2d(390.0, 200.0));
    ExpectPointNear(frame_.Boundary(0.0), Point2d(390.0, 200.0));
    ExpectPointNear(frame_.Boundary(HALF_PI), Point2d(200.0, 10.0));
}

TEST_F(DiskProjectionTest, Boundary) {
    DrawPrimitive p = BuildBoundary(frame_);
    ASSERT_TRUE(p.IsArc());
    EXPECT_DOUBLE_EQ(p.arc.radius, 190.0);
    EXPECT_DOUBLE_EQ(p.arc.SweepAngle(), TWO_PI);
    EXPECT_THROW(BuildBoundary(DiskFrame()), InvalidArgumentException);
}

// =============================================================================
// Curved Side
// =============================================================================

TEST_F(DiskProjectionTest, CurvatureEndpointsOnArc) {
    const double A = 0.5235987755982988;
    const double B = 0.17453292519943295;
    const double C = 2.0943951023931953;
    const double aung = std::tanh(1.559989333017077 / 2.0);
    const double bung = std::tanh(0.7247319739858736 / 2.0);

    DrawPrimitive p = ProjectCurvature(frame_, A, B, C, 0.3, aung, bung);
    ASSERT_TRUE(p.IsArc());
    ExpectPointNear(p.arc.StartPoint(), frame_.Radial(0.3, aung));
    ExpectPointNear(p.arc.EndPoint(), frame_.Radial(0.3 + C, bung));
}

TEST_F(DiskProjectionTest, ZeroDefectIsDiameter) {
    DrawPrimitive p = ProjectCurvature(frame_, 1.0, 1.0, PI - 2.0, 0.0, 0.5, 0.5);
    ASSERT_TRUE(p.IsChord());
    EXPECT_NEAR(p.chord.Length(), 2.0 * R(), kTol);
    ExpectPointNear(p.chord.Midpoint(), frame_.center);
}

// =============================================================================
// Triangle
// =============================================================================

TEST_F(DiskProjectionTest, TriangleOutlineCloses) {
    Triangle solved = Solver::SolveTriangle(
        Triangle::FromSentinel(30.0 * DEG_TO_RAD, 0.0, 10.0 * DEG_TO_RAD, 0.0, 120.0 * DEG_TO_RAD, 0.0));
    DrawList list = BuildTriangle(frame_, solved, HALF_PI);

    ASSERT_EQ(list.size(), 3u);
    ASSERT_TRUE(list[0].IsChord());
    ASSERT_TRUE(list[1].IsChord());
    ASSERT_TRUE(list[2].IsArc());

    ExpectPointNear(list[0].chord.p1, frame_.center);
    ExpectPointNear(list[1].chord.p1, frame_.center);
    ExpectPointNear(list[2].arc.StartPoint(), list[0].chord.p2);
    ExpectPointNear(list[2].arc.EndPoint(), list[1].chord.p2);

    // Straight sides have Poincare length tanh(side / 2)
    EXPECT_NEAR(list[0].chord.Length(), std::tanh(*solved.Side(Vertex::A) / 2.0) * R(), kTol);
    EXPECT_NEAR(list[1].chord.Length(), std::tanh(*solved.Side(Vertex::B) / 2.0) * R(), kTol);
}

TEST_F(DiskProjectionTest, TriangleMustBeComplete) {
    Triangle partial = Triangle::FromSentinel(0.5, 0.0, 0.5, 0.0, 0.5, 0.0);
    EXPECT_THROW(BuildTriangle(frame_, partial, 0.0), InsufficientDataException);
}

// =============================================================================
// Polygon
// =============================================================================

TEST_F(DiskProjectionTest, PentagonIsClosedRing) {
    DrawList list = BuildPolygon(frame_, 5, 50.0 * DEG_TO_RAD, 20.0 * DEG_TO_RAD);
    ASSERT_EQ(list.size(), 5u);

    const double vertexRadius = 0.70276856362521 * R();
    for (size_t i = 0; i < list.size(); ++i) {
        ASSERT_TRUE(list[i].IsArc());
        EXPECT_NEAR(list[i].arc.radius, list[0].arc.radius, kTol);
        EXPECT_NEAR(DistanceFromCenter(list[i].arc.StartPoint()), vertexRadius, 1e-4);
        ExpectPointNear(list[i].arc.EndPoint(), list[(i + 1) % list.size()].arc.StartPoint());
    }
}

TEST_F(DiskProjectionTest, PolygonRejections) {
    EXPECT_THROW(BuildPolygon(frame_, 2, 0.5, 0.0), InvalidSidesException);
    EXPECT_THROW(BuildPolygon(frame_, 5, 0.0, 0.0), InvalidArgumentException);
    // 3 * 70 >= 180
    EXPECT_THROW(BuildPolygon(frame_, 3, 70.0 * DEG_TO_RAD, 0.0), ImpossibleGeometryException);
    // 4 * 90 >= 360
    EXPECT_THROW(BuildPolygon(frame_, 4, HALF_PI, 0.0), ImpossibleGeometryException);
}

TEST_F(DiskProjectionTest, ManySidedPolygon) {
    DrawList list = BuildPolygon(frame_, 12, 20.0 * DEG_TO_RAD, 0.0);
    EXPECT_EQ(list.size(), 12u);
}

// =============================================================================
// Rectangle
// =============================================================================

TEST_F(DiskProjectionTest, RectangleOutlineCloses) {
    DrawList list = BuildRectangle(frame_, 30.0 * DEG_TO_RAD, 0.0, 5.0, 2.0, 10.0 * DEG_TO_RAD + HALF_PI);
    ASSERT_EQ(list.size(), 4u);
    ASSERT_TRUE(list[0].IsChord());
    ASSERT_TRUE(list[1].IsChord());
    ASSERT_TRUE(list[2].IsArc());
    ASSERT_TRUE(list[3].IsArc());

    ExpectPointNear(list[2].arc.StartPoint(), list[1].chord.p2);
    ExpectPointNear(list[3].arc.StartPoint(), list[2].arc.EndPoint());
    ExpectPointNear(list[3].arc.EndPoint(), list[0].chord.p2);
}

TEST_F(DiskProjectionTest, RectangleNeedsDistinctAngles) {
    EXPECT_THROW(BuildRectangle(frame_, 0.5, 0.5, 5.0, 2.0, 0.0), InvalidAnglesException);
}

// =============================================================================
// Geodesic Line
// =============================================================================

TEST_F(DiskProjectionTest, QuarterTurnGeodesic) {
    DrawPrimitive p = BuildGeodesicLine(frame_, 0.0, HALF_PI);
    ASSERT_TRUE(p.IsArc());
    EXPECT_NEAR(p.arc.radius, R(), 0.01 * R());
    EXPECT_TRUE(IsOrthogonalToBoundary(p.arc, 5e-3));

    // Ends just inside the boundary at 0 and 90 degrees
    ExpectPointNear(p.arc.StartPoint(), frame_.Boundary(0.0), 0.002 * R());
    ExpectPointNear(p.arc.EndPoint(), frame_.Boundary(HALF_PI), 0.002 * R());

    // Bends toward the center
    EXPECT_LT(DistanceFromCenter(p.arc.PointAt(0.5)), 0.5 * R());
}

TEST_F(DiskProjectionTest, GeodesicsAreOrthogonalToBoundary) {
    const double pairs[][2] = {{0.3, 1.1}, {-2.0, 0.5}, {1.0, 3.5}, {5.0, 0.2}, {2.0, 2.05}};
    for (const auto& pair : pairs) {
        DrawPrimitive p = BuildGeodesicLine(frame_, pair[0], pair[1]);
        ASSERT_TRUE(p.IsArc());
        EXPECT_TRUE(IsOrthogonalToBoundary(p.arc, 5e-3)) << pair[0] << " -> " << pair[1];
        EXPECT_NEAR(DistanceFromCenter(p.arc.StartPoint()), NEAR_BOUNDARY_RADIUS * R(), kTol);
        EXPECT_NEAR(DistanceFromCenter(p.arc.EndPoint()), NEAR_BOUNDARY_RADIUS * R(), kTol);
    }
}

TEST_F(DiskProjectionTest, GeodesicWrapsAroundZero) {
    DrawPrimitive p = BuildGeodesicLine(frame_, 350.0 * DEG_TO_RAD, 10.0 * DEG_TO_RAD);
    ASSERT_TRUE(p.IsArc());
    // Short way round: stays near the boundary at angle 0
    Point2d mid = p.arc.PointAt(0.5);
    EXPECT_GT(mid.x, frame_.center.x + 0.8 * R());
    EXPECT_NEAR(mid.y, frame_.center.y, 1e-4);
}

TEST_F(DiskProjectionTest, OppositeAnglesGiveDiameter) {
    DrawPrimitive p = BuildGeodesicLine(frame_, 0.0, PI);
    ASSERT_TRUE(p.IsChord());
    EXPECT_NEAR(p.chord.Length(), 2.0 * R(), kTol);
    ExpectPointNear(p.chord.p1, frame_.Boundary(0.0));

    DrawPrimitive q = BuildGeodesicLine(frame_, 1.5 * PI, HALF_PI);
    EXPECT_TRUE(q.IsChord());
}

TEST_F(DiskProjectionTest, EqualAnglesRejected) {
    EXPECT_THROW(BuildGeodesicLine(frame_, 1.0, 1.0), InvalidAnglesException);
}

// =============================================================================
// Oricycles
// =============================================================================

TEST_F(DiskProjectionTest, OricyclesTouchBoundary) {
    DrawList list = BuildOricycles(frame_, 3, 0.0);
    ASSERT_EQ(list.size(), 3u);
    for (size_t i = 0; i < list.size(); ++i) {
        const Arc2d& c = list[i].arc;
        EXPECT_NEAR(c.radius, (i + 1) * R() / 4.0, kTol);
        EXPECT_NEAR(DistanceFromCenter(c.center) + c.radius, R(), kTol);
        ExpectPointNear(c.PointAtAngle(0.0), frame_.Boundary(0.0));
    }
}

TEST_F(DiskProjectionTest, OricycleDirection) {
    DrawList list = BuildOricycles(frame_, 1, HALF_PI);
    ASSERT_EQ(list.size(), 1u);
    // Upward on screen
    EXPECT_LT(list[0].arc.center.y, frame_.center.y);
    EXPECT_THROW(BuildOricycles(frame_, 0, 0.0), InvalidArgumentException);
}

// =============================================================================
// Circles
// =============================================================================

TEST_F(DiskProjectionTest, CircleFromPoincareRadius) {
    DrawPrimitive p = BuildCircle(frame_, 0.5, 0.0);
    ASSERT_TRUE(p.IsArc());
    EXPECT_NEAR(p.arc.radius, 0.5 * R(), kTol);
    ExpectPointNear(p.arc.center, frame_.center);
}

TEST_F(DiskProjectionTest, CircleFromGyroRadius) {
    DrawPrimitive p = BuildCircle(frame_, 0.0, 2.0);
    EXPECT_NEAR(p.arc.radius, std::tanh(1.0) * R(), kTol);
}

TEST_F(DiskProjectionTest, CircleRejections) {
    EXPECT_THROW(BuildCircle(frame_, 0.5, 0.5), AmbiguousInputException);
    EXPECT_THROW(BuildCircle(frame_, 0.0, 0.0), AmbiguousInputException);
    EXPECT_THROW(BuildCircle(frame_, 1.0, 0.0), OutOfDomainException);
    EXPECT_THROW(BuildCircle(frame_, -0.5, 0.0), OutOfDomainException);
    EXPECT_THROW(BuildCircle(frame_, 0.0, 40.0), OutOfDomainException);
    EXPECT_NO_THROW(BuildCircle(frame_, 0.0, 35.0));
}

TEST_F(DiskProjectionTest, CircleSeries) {
    DrawList list = BuildCircleSeries(frame_, 4, 1.0, 4.0);
    ASSERT_EQ(list.size(), 4u);
    for (size_t i = 0; i < list.size(); ++i) {
        double rg = 1.0 + static_cast<double>(i);
        EXPECT_NEAR(list[i].arc.radius, std::tanh(rg / 2.0) * R(), kTol);
    }
}

TEST_F(DiskProjectionTest, CircleSeriesEdgeCases) {
    EXPECT_TRUE(BuildCircleSeries(frame_, 0, 1.0, 4.0).empty());

    DrawList single = BuildCircleSeries(frame_, 1, 1.0, 3.0);
    ASSERT_EQ(single.size(), 1u);
    EXPECT_NEAR(single[0].arc.radius, std::tanh(1.0) * R(), kTol);

    EXPECT_THROW(BuildCircleSeries(frame_, 3, 2.0, 2.0), InvalidArgumentException);
    EXPECT_THROW(BuildCircleSeries(frame_, -1, 1.0, 2.0), InvalidArgumentException);
    EXPECT_THROW(BuildCircleSeries(frame_, 3, -1.0, 2.0), InvalidArgumentException);
}

TEST_F(DiskProjectionTest, CircleSeriesBeyondSingleCircleLimit) {
    // A lone circle with rg 50 is rejected; inside a series it is drawn
    EXPECT_THROW(BuildCircle(frame_, 0.0, 50.0), OutOfDomainException);

    DrawList list = BuildCircleSeries(frame_, 3, 1.0, 50.0);
    ASSERT_EQ(list.size(), 3u);
    EXPECT_NEAR(list[0].arc.radius, std::tanh(0.5) * R(), kTol);
    EXPECT_GT(list[2].arc.radius, 0.999 * R());
    EXPECT_LE(list[2].arc.radius, R());
}

} // namespace
} // namespace Hyp::Disk::Projection
