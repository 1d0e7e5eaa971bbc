/**
 * @file test_disk_drawer.cpp
 * @brief Unit tests for Display/DiskDrawer against a recording surface
 *
 * Tests cover:
 * - Surface attachment and default frame
 * - Stroke sequences issued for each shape
 * - Degree inputs and boundary angle validation
 * - Stroke style handling (empty disk, circle series)
 */

#include <HypDisk/Display/DiskDrawer.h>
#include <HypDisk/Display/RecordingSurface.h>
#include <HypDisk/Core/Constants.h>
#include <HypDisk/Core/Exception.h>
#include <gtest/gtest.h>

#include <cmath>

namespace Hyp::Disk::Display {
namespace {

class DiskDrawerTest : public ::testing::Test {
protected:
    RecordingSurface surface_{400, 400};
    DiskDrawer drawer_{&surface_};

    double R() const { return drawer_.Frame().radius; }
};

// =============================================================================
// Attachment
// =============================================================================

TEST_F(DiskDrawerTest, DefaultFrameFollowsCanvasWidth) {
    EXPECT_DOUBLE_EQ(drawer_.Frame().center.x, 200.0);
    EXPECT_DOUBLE_EQ(drawer_.Frame().center.y, 200.0);
    EXPECT_DOUBLE_EQ(R(), 0.95 * 200.0);
}

TEST_F(DiskDrawerTest, NullSurfaceRejected) {
    EXPECT_THROW({ DiskDrawer detached(nullptr); }, UninitializedSurfaceException);
}

TEST_F(DiskDrawerTest, DetachedSurfaceThrows) {
    drawer_.SetSurface(nullptr);
    EXPECT_THROW(drawer_.ClearCanvas(), UninitializedSurfaceException);
    EXPECT_THROW(drawer_.CreatePolygon(5, 50.0, 0.0), UninitializedSurfaceException);
    EXPECT_THROW(drawer_.HandleCircleDrawing(0.5, 0.0), UninitializedSurfaceException);

    drawer_.SetSurface(&surface_);
    EXPECT_NO_THROW(drawer_.ClearCanvas());
}

TEST_F(DiskDrawerTest, InvalidFrameRejected) {
    EXPECT_THROW(drawer_.SetFrame(Projection::DiskFrame(0.0, 0.0, 0.0)), InvalidArgumentException);
}

// =============================================================================
// Canvas
// =============================================================================

TEST_F(DiskDrawerTest, EmptyDiskDrawsBlueBoundary) {
    drawer_.SetEmptyPoincareDisk();

    const auto& cmds = surface_.Commands();
    ASSERT_EQ(cmds.size(), 4u);
    EXPECT_EQ(cmds[0].type, CommandType::Clear);
    EXPECT_EQ(cmds[1].type, CommandType::SetStrokeStyle);
    ASSERT_EQ(cmds[2].type, CommandType::StrokeArc);
    EXPECT_EQ(cmds[2].style.color, Color::Blue());
    EXPECT_DOUBLE_EQ(cmds[2].style.width, 2.0);
    EXPECT_DOUBLE_EQ(cmds[2].arc.radius, R());

    // Previous style restored
    EXPECT_EQ(surface_.GetStrokeStyle().color, Color::Black());
    EXPECT_DOUBLE_EQ(surface_.GetStrokeStyle().width, 1.0);
}

// =============================================================================
// Shapes
// =============================================================================

TEST_F(DiskDrawerTest, TriangleFromAnglesInDegrees) {
    Triangle solved = drawer_.HandleTriangleDrawing(30.0, 0.0, 10.0, 0.0, 120.0, 0.0, 0.0);

    EXPECT_TRUE(solved.IsComplete());
    EXPECT_NEAR(*solved.Side(Vertex::A), 1.559989333017077, 1e-9);
    EXPECT_EQ(surface_.Count(CommandType::StrokeLine), 2u);
    EXPECT_EQ(surface_.Count(CommandType::StrokeArc), 1u);

    // Rotation 0 lays side a along screen-right
    auto lines = surface_.Lines();
    EXPECT_GT(lines[0].p2.x, 200.0);
    EXPECT_NEAR(lines[0].p2.y, 200.0, 1e-9);
}

TEST_F(DiskDrawerTest, TriangleErrorsDrawNothing) {
    EXPECT_THROW(drawer_.HandleTriangleDrawing(30.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0),
                 InsufficientDataException);
    EXPECT_EQ(surface_.StrokeCount(), 0u);
}

TEST_F(DiskDrawerTest, Polygon) {
    drawer_.CreatePolygon(5, 50.0, 20.0);
    EXPECT_EQ(surface_.Count(CommandType::StrokeArc), 5u);
    EXPECT_EQ(surface_.Count(CommandType::StrokeLine), 0u);

    EXPECT_THROW(drawer_.CreatePolygon(3, 70.0, 0.0), ImpossibleGeometryException);
    EXPECT_THROW(drawer_.CreatePolygon(2, 10.0, 0.0), InvalidSidesException);
}

TEST_F(DiskDrawerTest, Rectangle) {
    drawer_.CreateRectangle(30.0, 0.0, 5.0, 2.0, 10.0);
    EXPECT_EQ(surface_.Count(CommandType::StrokeLine), 2u);
    EXPECT_EQ(surface_.Count(CommandType::StrokeArc), 2u);

    EXPECT_THROW(drawer_.CreateRectangle(30.0, 30.0, 5.0, 2.0, 0.0), InvalidAnglesException);
}

TEST_F(DiskDrawerTest, HyperbolicLine) {
    drawer_.CreateHyperbolicLine(0.0, 90.0);
    ASSERT_EQ(surface_.Count(CommandType::StrokeArc), 1u);

    drawer_.CreateHyperbolicLine(0.0, 180.0);
    EXPECT_EQ(surface_.Count(CommandType::StrokeLine), 1u);

    EXPECT_THROW(drawer_.CreateHyperbolicLine(0.0, 361.0), InvalidAnglesException);
    EXPECT_THROW(drawer_.CreateHyperbolicLine(45.0, 45.0), InvalidAnglesException);
    EXPECT_NO_THROW(drawer_.CreateHyperbolicLine(360.0, 90.0));
}

TEST_F(DiskDrawerTest, Oricycles) {
    drawer_.CreateOricycle(4, 45.0);
    EXPECT_EQ(surface_.Count(CommandType::StrokeArc), 4u);
    EXPECT_THROW(drawer_.CreateOricycle(0, 0.0), InvalidArgumentException);
}

// =============================================================================
// Line Families
// =============================================================================

TEST_F(DiskDrawerTest, Perpendiculars) {
    drawer_.CreatePerpendiculars(5, 0.0);
    EXPECT_EQ(surface_.StrokeCount(), 5u);
    EXPECT_EQ(surface_.Count(CommandType::StrokeLine), 1u);
    EXPECT_THROW(drawer_.CreatePerpendiculars(5, 400.0), InvalidAnglesException);
}

TEST_F(DiskDrawerTest, Parallels) {
    drawer_.CreateParallels(4, 0.0);
    EXPECT_EQ(surface_.StrokeCount(), 4u);
    EXPECT_THROW(drawer_.CreateParallels(4, 361.0), InvalidAnglesException);
    EXPECT_THROW(drawer_.CreateParallels(0, 0.0), InvalidArgumentException);
}

TEST_F(DiskDrawerTest, FixedPatterns) {
    drawer_.DrawComplexPattern();
    EXPECT_EQ(surface_.StrokeCount(), 13u);

    surface_.Reset();
    drawer_.DrawPerpendicularRosette();
    EXPECT_EQ(surface_.StrokeCount(), 12u * 21u);
}

// =============================================================================
// Circles
// =============================================================================

TEST_F(DiskDrawerTest, CircleFromPoincareRadius) {
    Arc2d circle = drawer_.HandleCircleDrawing(0.5, 0.0);
    EXPECT_NEAR(circle.radius, 0.5 * R(), 1e-9);
    EXPECT_EQ(surface_.Count(CommandType::StrokeArc), 1u);
}

TEST_F(DiskDrawerTest, CircleRejections) {
    EXPECT_THROW(drawer_.HandleCircleDrawing(0.5, 0.5), AmbiguousInputException);
    EXPECT_THROW(drawer_.HandleCircleDrawing(1.0, 0.0), OutOfDomainException);
    EXPECT_THROW(drawer_.HandleCircleDrawing(0.0, 36.0), OutOfDomainException);
    EXPECT_EQ(surface_.StrokeCount(), 0u);
}

TEST_F(DiskDrawerTest, CircleSeriesUsesWideStroke) {
    surface_.SetStrokeStyle(Color::Red(), 1.0);
    drawer_.HandleCircleSeriesDrawing(3, 1.0, 3.0);

    auto arcs = surface_.Arcs();
    ASSERT_EQ(arcs.size(), 3u);
    for (const auto& cmd : surface_.Commands()) {
        if (cmd.type == CommandType::StrokeArc) {
            EXPECT_DOUBLE_EQ(cmd.style.width, 2.0);
            EXPECT_EQ(cmd.style.color, Color::Red());
        }
    }
    EXPECT_NEAR(arcs[1].radius, std::tanh(1.0) * R(), 1e-9);

    EXPECT_DOUBLE_EQ(surface_.GetStrokeStyle().width, 1.0);
}

TEST_F(DiskDrawerTest, CircleSeriesWithLargeOuterRadius) {
    drawer_.HandleCircleSeriesDrawing(4, 10.0, 40.0);
    EXPECT_EQ(surface_.Count(CommandType::StrokeArc), 4u);
}

TEST_F(DiskDrawerTest, EmptyCircleSeriesDoesNothing) {
    drawer_.HandleCircleSeriesDrawing(0, 1.0, 3.0);
    EXPECT_TRUE(surface_.Commands().empty());
}

} // namespace
} // namespace Hyp::Disk::Display
