/**
 * @file TriangleLaws.cpp
 * @brief Implementation of the hyperbolic triangle law solvers
 */

#include <HypDisk/Internal/TriangleLaws.h>
#include <HypDisk/Internal/HyperbolicMath.h>
#include <HypDisk/Core/Exception.h>
#include <HypDisk/Core/Log.h>

#include <cmath>
#include <string>

namespace Hyp::Disk::Internal {

namespace {

bool InOpenUnitInterval(double v) {
    return v > -1.0 && v < 1.0;
}

[[noreturn]] void DomainError(const char* funcName, const char* what, double value) {
    Log::Get()->warn("{}: {} out of domain ({})", funcName, what, value);
    throw InvalidTriangleException(std::string(funcName) + ": " + what +
                                   " out of domain (" + std::to_string(value) + ")");
}

} // namespace

// =============================================================================
// Pythagorean
// =============================================================================

RightTriangleSides SolvePythagorean(const RightTriangleSides& sides) {
    RightTriangleSides out = sides;

    if (sides.legX && sides.legY) {
        out.hypotenuse = Acosh(std::cosh(*sides.legY) * std::cosh(*sides.legX));
    } else if (sides.legX && sides.hypotenuse) {
        double ratio = std::cosh(*sides.hypotenuse) / std::cosh(*sides.legX);
        if (ratio < 1.0) DomainError(__func__, "cosh(legY)", ratio);
        out.legY = Acosh(ratio);
    } else if (sides.legY && sides.hypotenuse) {
        double ratio = std::cosh(*sides.hypotenuse) / std::cosh(*sides.legY);
        if (ratio < 1.0) DomainError(__func__, "cosh(legX)", ratio);
        out.legX = Acosh(ratio);
    }
    return out;
}

// =============================================================================
// Sine Rule
// =============================================================================

Triangle SolveBySineRule(const Triangle& triangle) {
    Triangle out = triangle;

    double G = 0.0;
    double g = 0.0;
    for (int i = 0; i < 3; ++i) {
        if (triangle.angle[i] && triangle.side[i]) {
            G = std::sin(*triangle.angle[i]);
            g = std::sinh(*triangle.side[i]);
            break;
        }
    }
    if (G == 0.0 || g == 0.0) {
        return out;
    }

    // Fill order B, C, A
    for (Vertex v : {Vertex::B, Vertex::C, Vertex::A}) {
        auto& angle = out.Angle(v);
        auto& side = out.Side(v);
        if (angle && !side) {
            side = Asinh(std::sin(*angle) * g / G);
        } else if (side && !angle) {
            double ratio = std::sinh(*side) * G / g;
            if (!InOpenUnitInterval(ratio)) DomainError(__func__, "sin(angle)", ratio);
            angle = std::asin(ratio);
        }
    }
    return out;
}

// =============================================================================
// Cosine Rules
// =============================================================================

FirstCosineTerms SolveByFirstCosineRule(const FirstCosineTerms& terms) {
    FirstCosineTerms out = terms;
    if (!terms.b || !terms.c) {
        return out;
    }

    const double b = *terms.b;
    const double c = *terms.c;

    if (terms.a && !terms.A) {
        double cosA = (std::cosh(b) * std::cosh(c) - std::cosh(*terms.a)) /
                      (std::sinh(b) * std::sinh(c));
        if (!InOpenUnitInterval(cosA)) DomainError(__func__, "cos(A)", cosA);
        out.A = std::acos(cosA);
    } else if (!terms.a && terms.A) {
        double coshA = std::cosh(b) * std::cosh(c) - std::sinh(b) * std::sinh(c) * std::cos(*terms.A);
        if (coshA < 1.0) DomainError(__func__, "cosh(a)", coshA);
        out.a = Acosh(coshA);
    }
    return out;
}

SecondCosineTerms SolveBySecondCosineRule(const SecondCosineTerms& terms) {
    SecondCosineTerms out = terms;
    if (!terms.B || !terms.C) {
        return out;
    }

    const double B = *terms.B;
    const double C = *terms.C;

    if (terms.a && !terms.A) {
        double cosA = -std::cos(B) * std::cos(C) + std::sin(B) * std::sin(C) * std::cosh(*terms.a);
        if (!InOpenUnitInterval(cosA)) DomainError(__func__, "cos(A)", cosA);
        out.A = std::acos(cosA);
    } else if (!terms.a && terms.A) {
        double denom = std::sin(B) * std::sin(C);
        if (denom == 0.0) DomainError(__func__, "sin(B) * sin(C)", denom);
        double coshA = (std::cos(B) * std::cos(C) + std::cos(*terms.A)) / denom;
        if (coshA <= 1.0) DomainError(__func__, "cosh(a)", coshA);
        out.a = Acosh(coshA);
    }
    return out;
}

// =============================================================================
// Maximum Angle And Side
// =============================================================================

FirstCosineTerms SolveMaximumAngleAndSide(const FirstCosineTerms& terms) {
    if (!terms.b || !terms.c) {
        throw InvalidTriangleException("SolveMaximumAngleAndSide: sides b and c must be known");
    }

    const double b = *terms.b;
    const double c = *terms.c;

    double tanhProduct = std::tanh(b / 2.0) * std::tanh(c / 2.0);
    if (!InOpenUnitInterval(tanhProduct)) DomainError(__func__, "tanh(b/2) * tanh(c/2)", tanhProduct);

    double sb = std::sinh(b / 2.0);
    double sc = std::sinh(c / 2.0);

    FirstCosineTerms out = terms;
    out.A = std::acos(tanhProduct);
    out.a = 2.0 * Asinh(std::sqrt(sb * sb + sc * sc));
    return out;
}

} // namespace Hyp::Disk::Internal
