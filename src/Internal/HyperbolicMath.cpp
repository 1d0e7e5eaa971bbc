/**
 * @file HyperbolicMath.cpp
 * @brief Implementation of hyperbolic arithmetic utilities
 */

#include <HypDisk/Internal/HyperbolicMath.h>
#include <HypDisk/Core/Constants.h>
#include <HypDisk/Core/Exception.h>
#include <HypDisk/Core/Log.h>

#include <cmath>
#include <string>

namespace Hyp::Disk::Internal {

// =============================================================================
// Scalar Functions
// =============================================================================

double Asinh(double x) {
    return std::log(x + std::sqrt(x * x + 1.0));
}

double Acosh(double x) {
    return std::log(x + std::sqrt(x * x - 1.0));
}

double DegreesToRadians(double degrees) {
    return degrees * PI / 180.0;
}

double RadiansToDegrees(double radians) {
    return 180.0 * radians / PI;
}

double TriangleArea(double A, double B, double C, double k) {
    return k * k * (PI - A - B - C);
}

double AngleOfParallelism(double b, double k) {
    if (k == 0.0) {
        throw InvalidArgumentException("AngleOfParallelism: k must be nonzero");
    }
    return 2.0 * std::atan(std::exp(-b / k));
}

// =============================================================================
// Radius Conversion
// =============================================================================

RadiusPair PoincareGyrovectorConvert(const RadiusPair& pair) {
    RadiusPair out = pair;
    if (pair.r != 0.0 && pair.rg == 0.0) {
        if (std::abs(pair.r) >= 1.0) {
            throw OutOfDomainException("PoincareGyrovectorConvert: Poincare radius must be < 1, got " +
                                       std::to_string(pair.r));
        }
        out.rg = std::log((1.0 + pair.r) / (1.0 - pair.r));
    } else if (pair.rg != 0.0 && pair.r == 0.0) {
        out.r = std::tanh(pair.rg / 2.0);
    }
    return out;
}

// =============================================================================
// Disk / Half-Plane Conversion
// =============================================================================

namespace {

double SinhFromCosh(double rg) {
    double ch = std::cosh(rg);
    return std::sqrt(ch * ch - 1.0);
}

bool AllFinite(const CircleParameters& p) {
    return std::isfinite(p.x) && std::isfinite(p.y) && std::isfinite(p.r) &&
           std::isfinite(p.l) && std::isfinite(p.xg) && std::isfinite(p.yg) &&
           std::isfinite(p.rg) && std::isfinite(p.lg);
}

} // namespace

CircleParameters DiskHalfPlaneConvert(const CircleParameters& params) {
    CircleParameters p = params;

    if (p.x != 0.0) p.xg = p.x;
    if (p.xg != 0.0) p.x = p.xg;

    if (p.y != 0.0 && p.r != 0.0) {
        p.yg = std::sqrt(p.y * p.y - p.r * p.r);
        p.rg = Acosh(p.y / p.yg);
        p.l = TWO_PI * p.r;
        p.lg = TWO_PI * std::sinh(p.rg);
    } else if (p.y != 0.0 && p.l != 0.0) {
        p.r = p.l / TWO_PI;
        p.yg = std::sqrt(p.y * p.y - p.r * p.r);
        p.rg = Acosh(p.y / p.yg);
        p.lg = TWO_PI * std::sinh(p.rg);
    } else if (p.yg != 0.0 && p.rg != 0.0) {
        p.r = p.yg * SinhFromCosh(p.rg);
        p.y = p.yg * std::cosh(p.rg);
        p.l = TWO_PI * p.r;
        p.lg = TWO_PI * std::sinh(p.rg);
    } else if (p.yg != 0.0 && p.lg != 0.0) {
        p.rg = Asinh(p.lg / TWO_PI);
        p.r = p.yg * SinhFromCosh(p.rg);
        p.y = p.yg * std::cosh(p.rg);
        p.l = TWO_PI * p.r;
    } else if (p.y != 0.0 && p.yg != 0.0) {
        p.rg = Acosh(p.y / p.yg);
        p.r = p.yg * SinhFromCosh(p.rg);
        p.l = TWO_PI * p.r;
        p.lg = TWO_PI * std::sinh(p.rg);
    } else if (p.lg != 0.0 && p.l != 0.0) {
        p.r = p.l / TWO_PI;
        p.rg = Asinh(p.lg / TWO_PI);
        p.yg = p.r / SinhFromCosh(p.rg);
        p.y = p.yg * std::cosh(p.rg);
    } else if (p.rg != 0.0 && p.r != 0.0) {
        p.yg = p.r / SinhFromCosh(p.rg);
        p.y = p.yg * std::cosh(p.rg);
        p.l = TWO_PI * p.r;
        p.lg = TWO_PI * std::sinh(p.rg);
    }

    if (!AllFinite(p)) {
        Log::Get()->warn("DiskHalfPlaneConvert: inconsistent input y={} r={} yg={} rg={}",
                         params.y, params.r, params.yg, params.rg);
        throw OutOfDomainException("DiskHalfPlaneConvert: inputs do not describe a circle inside the half-plane");
    }
    return p;
}

} // namespace Hyp::Disk::Internal
