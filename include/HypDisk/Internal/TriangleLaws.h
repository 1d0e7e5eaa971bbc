#pragma once

/**
 * @file TriangleLaws.h
 * @brief Hyperbolic triangle law solvers
 *
 * Each solver takes a fixed tuple of slots, some unknown, and returns the
 * same tuple with the derivable blanks filled. Inputs are never modified.
 *
 * Laws (curvature -1):
 * - Pythagorean:      cosh(c) = cosh(a) * cosh(b)             (right angle at C)
 * - Sine rule:        sinh(a)/sin(A) = sinh(b)/sin(B) = sinh(c)/sin(C)
 * - First cosine:     cosh(a) = cosh(b)cosh(c) - sinh(b)sinh(c)cos(A)
 * - Second cosine:    cos(A) = -cos(B)cos(C) + sin(B)sin(C)cosh(a)
 *
 * Any domain guard violation throws InvalidTriangleException.
 */

#include <HypDisk/Core/Export.h>
#include <HypDisk/Core/Triangle.h>

#include <optional>

namespace Hyp::Disk::Internal {

// =============================================================================
// Tuples
// =============================================================================

/**
 * @brief Legs and hypotenuse of a right triangle
 */
struct RightTriangleSides {
    std::optional<double> legX;
    std::optional<double> legY;
    std::optional<double> hypotenuse;
};

/**
 * @brief Angle A, its opposite side a, and the two sides enclosing A
 */
struct FirstCosineTerms {
    std::optional<double> A;
    std::optional<double> a;
    std::optional<double> b;
    std::optional<double> c;
};

/**
 * @brief Side a, its opposite angle A, and the two angles adjacent to a
 */
struct SecondCosineTerms {
    std::optional<double> a;
    std::optional<double> A;
    std::optional<double> B;
    std::optional<double> C;
};

// =============================================================================
// Solvers
// =============================================================================

/**
 * @brief Hyperbolic Pythagorean theorem
 *
 * Given two of (legX, legY, hypotenuse) returns the third. When both legs
 * are known the hypotenuse is (re)computed from them.
 *
 * @throws InvalidTriangleException if the hypotenuse is not longer than a leg
 */
HYPDISK_API RightTriangleSides SolvePythagorean(const RightTriangleSides& sides);

/**
 * @brief Sine rule propagation
 *
 * The ratio basis is the first complete angle/side pair in order A, B, C.
 * Every pair with exactly one known member is then completed.
 *
 * @throws InvalidTriangleException if a derived sine falls outside (-1, 1)
 */
HYPDISK_API Triangle SolveBySineRule(const Triangle& triangle);

/**
 * @brief First cosine rule: A from (a, b, c) or a from (A, b, c)
 *
 * b and c must be known; otherwise the terms are returned unchanged.
 *
 * @throws InvalidTriangleException if cos(A) falls outside (-1, 1) or
 *         cosh(a) below 1
 */
HYPDISK_API FirstCosineTerms SolveByFirstCosineRule(const FirstCosineTerms& terms);

/**
 * @brief Second cosine rule: A from (a, B, C) or a from (A, B, C)
 *
 * B and C must be known; otherwise the terms are returned unchanged.
 *
 * @throws InvalidTriangleException if cos(A) falls outside (-1, 1), if
 *         sin(B) * sin(C) == 0, or if cosh(a) would not exceed 1
 */
HYPDISK_API SecondCosineTerms SolveBySecondCosineRule(const SecondCosineTerms& terms);

/**
 * @brief Angle A and side a from the two sides b, c alone
 *
 * cos(A) = tanh(b/2) * tanh(c/2)
 * a      = 2 * asinh(sqrt(sinh^2(b/2) + sinh^2(c/2)))
 *
 * Used to close the ambiguous two-sides-only case.
 *
 * @throws InvalidTriangleException if b or c is unknown, or the tanh product
 *         falls outside (-1, 1)
 */
HYPDISK_API FirstCosineTerms SolveMaximumAngleAndSide(const FirstCosineTerms& terms);

} // namespace Hyp::Disk::Internal
