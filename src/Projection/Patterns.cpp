/**
 * @file Patterns.cpp
 * @brief Implementation of geodesic line families
 */

#include <HypDisk/Projection/Patterns.h>
#include <HypDisk/Internal/HyperbolicMath.h>
#include <HypDisk/Core/Constants.h>
#include <HypDisk/Core/Exception.h>
#include <HypDisk/Core/Log.h>

#include <string>

namespace Hyp::Disk::Projection {

namespace {

void RequireLineCount(int count, const char* funcName) {
    if (count <= 0) {
        throw InvalidArgumentException(std::string(funcName) +
                                       ": number of lines must be > 0, got " + std::to_string(count));
    }
}

DrawList Collect(const std::function<void(const PrimitiveSink&)>& emit) {
    DrawList list;
    emit([&list](const DrawPrimitive& p) { list.push_back(p); });
    return list;
}

} // namespace

// =============================================================================
// Emitters
// =============================================================================

void EmitPerpendiculars(const DiskFrame& frame, int count, double direction,
                        const PrimitiveSink& sink) {
    RequireLineCount(count, __func__);

    const double step = PI / (count + 1);
    for (int i = 1; i <= count; ++i) {
        sink(BuildGeodesicLine(frame, direction - step * i, direction + step * i));
    }
}

void EmitParallels(const DiskFrame& frame, int count, double a1, const PrimitiveSink& sink) {
    RequireLineCount(count, __func__);

    const double gap = TWO_PI / (count + 1);
    const int half = count / 2;

    for (int i = 1; i <= half; ++i) {
        sink(BuildGeodesicLine(frame, a1, a1 + i * gap));
    }
    if (count % 2 == 1) {
        // Nearly opposite: a straight diameter would not be a parallel
        sink(BuildGeodesicLine(frame, a1, a1 + Internal::DegreesToRadians(PARALLEL_GAP_DEGREES)));
    }
    for (int i = 1; i <= half; ++i) {
        sink(BuildGeodesicLine(frame, a1, a1 - i * gap));
    }
}

void EmitComplexPattern(const DiskFrame& frame, const PrimitiveSink& sink) {
    const double a = TWO_PI / 8.0;
    auto line = [&](double a1, double a2) { sink(BuildGeodesicLine(frame, a1, a2)); };

    // Main pattern (first line repeats)
    line(-1.5 * a, 1.5 * a);
    line(-2.5 * a, 2.5 * a);
    line(-1.5 * a, 1.5 * a);
    line(-2.5 * a + HALF_PI, 2.5 * a + HALF_PI);
    line(-2.5 * a - HALF_PI, 2.5 * a - HALF_PI);

    // Short chords offset by quarter and half turns
    const double from = -1.5 * a - 0.66 * a;
    const double to = -1.5 * a + 0.33 * a;
    const double shift = 0.66 * a;
    for (double base : {HALF_PI, PI}) {
        line(from + base, to + base);
        line(from + base - shift, to + base - shift);
        line(from + base + PI, to + base + PI);
        line(from + base - shift + PI, to + base - shift + PI);
    }
}

void EmitPerpendicularRosette(const DiskFrame& frame, int pencils, int count,
                              const PrimitiveSink& sink) {
    if (pencils < 1) {
        throw InvalidArgumentException("EmitPerpendicularRosette: number of directions must be >= 1, got " +
                                       std::to_string(pencils));
    }
    const double step = TWO_PI / pencils;
    for (int i = 0; i < pencils; ++i) {
        EmitPerpendiculars(frame, count, step * i, sink);
    }
    Log::Get()->debug("EmitPerpendicularRosette: {} directions x {} lines", pencils, count);
}

// =============================================================================
// Collected Variants
// =============================================================================

DrawList BuildPerpendiculars(const DiskFrame& frame, int count, double direction) {
    return Collect([&](const PrimitiveSink& sink) { EmitPerpendiculars(frame, count, direction, sink); });
}

DrawList BuildParallels(const DiskFrame& frame, int count, double a1) {
    return Collect([&](const PrimitiveSink& sink) { EmitParallels(frame, count, a1, sink); });
}

DrawList BuildComplexPattern(const DiskFrame& frame) {
    return Collect([&](const PrimitiveSink& sink) { EmitComplexPattern(frame, sink); });
}

DrawList BuildPerpendicularRosette(const DiskFrame& frame, int pencils, int count) {
    return Collect([&](const PrimitiveSink& sink) {
        EmitPerpendicularRosette(frame, pencils, count, sink);
    });
}

} // namespace Hyp::Disk::Projection
