/**
 * @file RasterSurface.cpp
 * @brief Implementation of the raster surface
 */

#include <HypDisk/Display/RasterSurface.h>
#include <HypDisk/Core/Log.h>
#include <HypDisk/Core/Validate.h>

#include <algorithm>
#include <cmath>

namespace Hyp::Disk::Display {

namespace {

// Sample spacing along a stroke, in pixels
constexpr double SAMPLE_STEP = 0.5;

// Upper bound on samples per stroke (huge near-straight geodesic arcs)
constexpr int64_t MAX_SAMPLES = 1 << 20;

int64_t SampleCount(double length) {
    if (!std::isfinite(length)) {
        return MAX_SAMPLES;
    }
    int64_t n = static_cast<int64_t>(std::ceil(length / SAMPLE_STEP));
    return std::clamp<int64_t>(n, 1, MAX_SAMPLES);
}

// Parameter range [t0, t1] of a segment clipped to an axis-aligned box
bool ClipToBox(const Segment2d& seg, double xmin, double ymin, double xmax, double ymax,
               double& t0, double& t1) {
    t0 = 0.0;
    t1 = 1.0;
    const double dx = seg.p2.x - seg.p1.x;
    const double dy = seg.p2.y - seg.p1.y;
    const double p[4] = {-dx, dx, -dy, dy};
    const double q[4] = {seg.p1.x - xmin, xmax - seg.p1.x, seg.p1.y - ymin, ymax - seg.p1.y};
    for (int i = 0; i < 4; ++i) {
        if (p[i] == 0.0) {
            if (q[i] < 0.0) return false;
            continue;
        }
        double t = q[i] / p[i];
        if (p[i] < 0.0) {
            t0 = std::max(t0, t);
        } else {
            t1 = std::min(t1, t);
        }
        if (t0 > t1) return false;
    }
    return true;
}

} // namespace

RasterSurface::RasterSurface(int32_t width, int32_t height, const Color& background)
    : image_(width, height, background), background_(background) {}

void RasterSurface::Clear() {
    image_.Fill(background_);
}

void RasterSurface::SetStrokeStyle(const Color& color, double width) {
    HYPDISK_REQUIRE_POSITIVE(width);
    style_ = StrokeStyle(color, width);
}

void RasterSurface::Stamp(const Point2d& p) {
    const double half = style_.width / 2.0;
    if (half <= 0.5) {
        image_.SetAt(static_cast<int32_t>(std::floor(p.x)),
                     static_cast<int32_t>(std::floor(p.y)), style_.color);
        return;
    }

    const int32_t x0 = static_cast<int32_t>(std::floor(p.x - half));
    const int32_t x1 = static_cast<int32_t>(std::ceil(p.x + half));
    const int32_t y0 = static_cast<int32_t>(std::floor(p.y - half));
    const int32_t y1 = static_cast<int32_t>(std::ceil(p.y + half));
    const double half2 = half * half;

    for (int32_t y = y0; y <= y1; ++y) {
        for (int32_t x = x0; x <= x1; ++x) {
            double dx = x + 0.5 - p.x;
            double dy = y + 0.5 - p.y;
            if (dx * dx + dy * dy <= half2) {
                image_.SetAt(x, y, style_.color);
            }
        }
    }
}

void RasterSurface::StrokeLine(const Segment2d& segment) {
    if (!segment.IsValid()) {
        Log::Get()->warn("RasterSurface::StrokeLine: non-finite segment skipped");
        return;
    }

    // Only the visible part is sampled
    const double pad = style_.width + 1.0;
    double t0 = 0.0;
    double t1 = 1.0;
    if (!ClipToBox(segment, -pad, -pad, Width() + pad, Height() + pad, t0, t1)) {
        return;
    }

    Segment2d visible(segment.PointAt(t0), segment.PointAt(t1));
    const int64_t n = SampleCount(visible.Length());
    for (int64_t i = 0; i <= n; ++i) {
        Stamp(visible.PointAt(static_cast<double>(i) / n));
    }
}

void RasterSurface::StrokeArc(const Arc2d& arc) {
    if (!arc.IsValid()) {
        Log::Get()->warn("RasterSurface::StrokeArc: invalid arc skipped");
        return;
    }

    const int64_t n = SampleCount(arc.Length());
    const double pad = style_.width + 1.0;
    for (int64_t i = 0; i <= n; ++i) {
        Point2d p = arc.PointAt(static_cast<double>(i) / n);
        if (p.x < -pad || p.y < -pad || p.x > Width() + pad || p.y > Height() + pad) {
            continue;
        }
        Stamp(p);
    }
}

bool RasterSurface::SaveToFile(const std::string& path) const {
    return image_.SaveToFile(path);
}

} // namespace Hyp::Disk::Display
