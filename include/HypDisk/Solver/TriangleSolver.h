#pragma once

/**
 * @file TriangleSolver.h
 * @brief Completion of a partially specified hyperbolic triangle
 *
 * A triangle with 2-3 known slots is driven to all six slots by a fixed
 * sequence of transition rules. Each rule is a pure function that returns
 * the updated triangle, or nullopt when its precondition does not hold:
 *
 *   1. ApplySineRule          propagate from a complete angle/side pair
 *   2. ApplyRightAngleRule    Pythagorean theorem around a right angle
 *   3. ApplyCosinePattern     first matching two-angle-one-side or
 *                             one-angle-two-side pattern
 *   4. ApplyAllSidesRule      all angles from three sides
 *   5. ApplySineRule
 *   6. ApplyAnglesOnlyRule    all sides from three angles
 *   7. ApplyMaximumAngleRule  close the two-sides-only case
 *   8. ApplySineRule
 *
 * Law solver domain violations propagate as InvalidTriangleException.
 */

#include <HypDisk/Core/Export.h>
#include <HypDisk/Core/Triangle.h>

#include <optional>

namespace Hyp::Disk::Solver {

/// Transition rule signature
using TriangleRule = std::optional<Triangle> (*)(const Triangle&);

// =============================================================================
// Transition Rules
// =============================================================================

/**
 * @brief Sine rule; fires when it fills at least one slot
 */
HYPDISK_API std::optional<Triangle> ApplySineRule(const Triangle& triangle);

/**
 * @brief Pythagorean theorem for every right angle (within ANGLE_TOLERANCE)
 *
 * A right angle at A uses legs (c, b) and hypotenuse a, and so on.
 */
HYPDISK_API std::optional<Triangle> ApplyRightAngleRule(const Triangle& triangle);

/**
 * @brief Cosine rule for the first matching known-slot pattern
 *
 * Priority: (A,c,B) second rule for C, (A,b,C) second rule for B,
 * (B,a,C) second rule for A, (C,a,b) first rule for c, (A,b,c) first rule
 * for a, (B,a,c) first rule for b.
 */
HYPDISK_API std::optional<Triangle> ApplyCosinePattern(const Triangle& triangle);

/**
 * @brief All three angles by the first cosine rule once every side is known
 */
HYPDISK_API std::optional<Triangle> ApplyAllSidesRule(const Triangle& triangle);

/**
 * @brief All three sides by the second cosine rule when only angles are known
 */
HYPDISK_API std::optional<Triangle> ApplyAnglesOnlyRule(const Triangle& triangle);

/**
 * @brief Maximum angle/side solver when two sides and no angle are known
 */
HYPDISK_API std::optional<Triangle> ApplyMaximumAngleRule(const Triangle& triangle);

// =============================================================================
// Completion
// =============================================================================

/**
 * @brief Run the transition rules in their fixed order
 *
 * No validation is performed; the result may still contain unknown slots.
 *
 * @throws InvalidTriangleException on a law solver domain violation
 */
HYPDISK_API Triangle CompleteTriangle(const Triangle& triangle);

/**
 * @brief Caller-side validation of a triangle before completion
 *
 * @throws InsufficientDataException if fewer than 2 slots are known
 * @throws TooManyInputsException if more than 3 slots are known
 * @throws InvalidTriangleException if an angle is negative or >= PI, the
 *         known angles sum to >= PI, a side is negative, or three known
 *         sides violate the strict triangle inequality
 * @throws InvalidArgumentException if a known slot is not finite
 */
HYPDISK_API void ValidateTriangleInput(const Triangle& triangle);

/**
 * @brief Validate, complete and check the completed triangle
 *
 * @throws InsufficientDataException if completion leaves unknown slots
 *         (e.g. two angles with their opposite sides)
 * @throws InvalidTriangleException if the completed triangle is degenerate
 * @return Triangle with all six slots known and angle sum < PI
 */
HYPDISK_API Triangle SolveTriangle(const Triangle& triangle);

} // namespace Hyp::Disk::Solver
