/**
 * @file TriangleSolver.cpp
 * @brief Implementation of the triangle completion rules
 */

#include <HypDisk/Solver/TriangleSolver.h>
#include <HypDisk/Internal/TriangleLaws.h>
#include <HypDisk/Core/Constants.h>
#include <HypDisk/Core/Exception.h>
#include <HypDisk/Core/Log.h>

#include <cmath>
#include <string>

namespace Hyp::Disk::Solver {

namespace {

// Vertices other than v, in (next, previous) order
void Others(Vertex v, Vertex& u, Vertex& w) {
    switch (v) {
        case Vertex::A: u = Vertex::B; w = Vertex::C; break;
        case Vertex::B: u = Vertex::A; w = Vertex::C; break;
        case Vertex::C: u = Vertex::A; w = Vertex::B; break;
    }
}

Internal::FirstCosineTerms FirstTerms(const Triangle& t, Vertex v) {
    Vertex u, w;
    Others(v, u, w);
    return {t.Angle(v), t.Side(v), t.Side(u), t.Side(w)};
}

Internal::SecondCosineTerms SecondTerms(const Triangle& t, Vertex v) {
    Vertex u, w;
    Others(v, u, w);
    return {t.Side(v), t.Angle(v), t.Angle(u), t.Angle(w)};
}

void Merge(Triangle& t, Vertex v, const Internal::FirstCosineTerms& terms) {
    Vertex u, w;
    Others(v, u, w);
    t.Angle(v) = terms.A;
    t.Side(v) = terms.a;
    t.Side(u) = terms.b;
    t.Side(w) = terms.c;
}

void Merge(Triangle& t, Vertex v, const Internal::SecondCosineTerms& terms) {
    Vertex u, w;
    Others(v, u, w);
    t.Side(v) = terms.a;
    t.Angle(v) = terms.A;
    t.Angle(u) = terms.B;
    t.Angle(w) = terms.C;
}

Triangle FirstCosineAt(const Triangle& t, Vertex v) {
    Triangle out = t;
    Merge(out, v, Internal::SolveByFirstCosineRule(FirstTerms(t, v)));
    return out;
}

Triangle SecondCosineAt(const Triangle& t, Vertex v) {
    Triangle out = t;
    Merge(out, v, Internal::SolveBySecondCosineRule(SecondTerms(t, v)));
    return out;
}

char VertexName(Vertex v) {
    return static_cast<char>('A' + Index(v));
}

// Strict triangle inequality, only meaningful when all sides are known
bool ViolatesTriangleInequality(const Triangle& t) {
    double a = *t.side[0];
    double b = *t.side[1];
    double c = *t.side[2];
    return c >= a + b || a >= b + c || b >= a + c;
}

[[noreturn]] void Reject(const std::string& message, const Triangle& t) {
    Log::Get()->warn("{} [{}]", message, t.ToString());
    throw InvalidTriangleException(message);
}

} // namespace

// =============================================================================
// Transition Rules
// =============================================================================

std::optional<Triangle> ApplySineRule(const Triangle& triangle) {
    Triangle out = Internal::SolveBySineRule(triangle);
    if (out.Mask() == triangle.Mask()) {
        return std::nullopt;
    }
    return out;
}

std::optional<Triangle> ApplyRightAngleRule(const Triangle& triangle) {
    Triangle out = triangle;
    bool fired = false;

    for (Vertex v : {Vertex::A, Vertex::B, Vertex::C}) {
        const auto& angle = triangle.Angle(v);
        if (!angle || std::abs(*angle - HALF_PI) > ANGLE_TOLERANCE) {
            continue;
        }
        Vertex u, w;
        Others(v, u, w);
        // Legs are the sides adjacent to the right angle; the hypotenuse is opposite it
        Internal::RightTriangleSides sides{out.Side(w), out.Side(u), out.Side(v)};
        sides = Internal::SolvePythagorean(sides);
        out.Side(w) = sides.legX;
        out.Side(u) = sides.legY;
        out.Side(v) = sides.hypotenuse;
        fired = true;
    }

    if (!fired) {
        return std::nullopt;
    }
    return out;
}

std::optional<Triangle> ApplyCosinePattern(const Triangle& triangle) {
    const KnownMask m = triangle.Mask();
    using V = Vertex;

    if (m.Angle(V::A) && m.Side(V::C) && m.Angle(V::B)) {
        return SecondCosineAt(triangle, V::C);
    }
    if (m.Angle(V::A) && m.Side(V::B) && m.Angle(V::C)) {
        return SecondCosineAt(triangle, V::B);
    }
    if (m.Angle(V::B) && m.Side(V::A) && m.Angle(V::C)) {
        return SecondCosineAt(triangle, V::A);
    }
    if (m.Angle(V::C) && m.Side(V::A) && m.Side(V::B)) {
        return FirstCosineAt(triangle, V::C);
    }
    if (m.Angle(V::A) && m.Side(V::B) && m.Side(V::C)) {
        return FirstCosineAt(triangle, V::A);
    }
    if (m.Angle(V::B) && m.Side(V::A) && m.Side(V::C)) {
        return FirstCosineAt(triangle, V::B);
    }
    return std::nullopt;
}

std::optional<Triangle> ApplyAllSidesRule(const Triangle& triangle) {
    if (triangle.Mask().SideCount() != 3) {
        return std::nullopt;
    }
    Triangle out = FirstCosineAt(triangle, Vertex::B);
    out = FirstCosineAt(out, Vertex::A);
    out = FirstCosineAt(out, Vertex::C);
    return out;
}

std::optional<Triangle> ApplyAnglesOnlyRule(const Triangle& triangle) {
    const KnownMask m = triangle.Mask();
    if (m.AngleCount() != 3 || m.SideCount() != 0) {
        return std::nullopt;
    }
    Triangle out = SecondCosineAt(triangle, Vertex::A);
    out = SecondCosineAt(out, Vertex::C);
    out = SecondCosineAt(out, Vertex::B);
    return out;
}

std::optional<Triangle> ApplyMaximumAngleRule(const Triangle& triangle) {
    // Mask is taken once; a pair filled here does not trigger another pair
    const KnownMask m = triangle.Mask();
    if (m.AngleCount() != 0 || m.SideCount() < 2) {
        return std::nullopt;
    }

    Triangle out = triangle;
    auto solveAt = [&out](Vertex v) {
        Merge(out, v, Internal::SolveMaximumAngleAndSide(FirstTerms(out, v)));
    };

    if (m.Side(Vertex::A) && m.Side(Vertex::B)) solveAt(Vertex::C);
    if (m.Side(Vertex::A) && m.Side(Vertex::C)) solveAt(Vertex::B);
    if (m.Side(Vertex::C) && m.Side(Vertex::B)) solveAt(Vertex::A);
    return out;
}

// =============================================================================
// Completion
// =============================================================================

Triangle CompleteTriangle(const Triangle& triangle) {
    struct Step {
        const char* name;
        TriangleRule rule;
    };
    static const Step kSteps[] = {
        {"sine rule", &ApplySineRule},
        {"right angle", &ApplyRightAngleRule},
        {"cosine pattern", &ApplyCosinePattern},
        {"all sides", &ApplyAllSidesRule},
        {"sine rule", &ApplySineRule},
        {"angles only", &ApplyAnglesOnlyRule},
        {"maximum angle", &ApplyMaximumAngleRule},
        {"sine rule", &ApplySineRule},
    };

    auto logger = Log::Get();
    Triangle state = triangle;
    for (const Step& step : kSteps) {
        if (auto next = step.rule(state)) {
            state = *next;
            logger->debug("CompleteTriangle: {} -> {}", step.name, state.ToString());
        }
    }
    return state;
}

void ValidateTriangleInput(const Triangle& triangle) {
    const KnownMask m = triangle.Mask();
    const int known = m.Count();

    if (known < 2) {
        Log::Get()->warn("ValidateTriangleInput: {} known slot(s)", known);
        throw InsufficientDataException("at least 2 of the 6 measurements must be given, got " +
                                        std::to_string(known));
    }
    if (known > 3) {
        Log::Get()->warn("ValidateTriangleInput: {} known slots", known);
        throw TooManyInputsException("at most 3 of the 6 measurements may be given, got " +
                                     std::to_string(known));
    }

    for (int i = 0; i < 3; ++i) {
        if ((triangle.angle[i] && !std::isfinite(*triangle.angle[i])) ||
            (triangle.side[i] && !std::isfinite(*triangle.side[i]))) {
            throw InvalidArgumentException("ValidateTriangleInput: measurements must be finite");
        }
    }

    if (m.SideCount() == 3 && ViolatesTriangleInequality(triangle)) {
        Reject("sides violate the triangle inequality", triangle);
    }

    for (Vertex v : {Vertex::A, Vertex::B, Vertex::C}) {
        const auto& angle = triangle.Angle(v);
        if (angle && *angle >= PI) {
            Reject(std::string("angle ") + VertexName(v) + " must be less than PI", triangle);
        }
        if (angle && *angle < 0.0) {
            Reject(std::string("angle ") + VertexName(v) + " must not be negative", triangle);
        }
        const auto& side = triangle.Side(v);
        if (side && *side < 0.0) {
            Reject(std::string("side ") + static_cast<char>('a' + Index(v)) +
                   " must not be negative", triangle);
        }
    }

    if (m.AngleCount() >= 2 && triangle.AngleSum() >= PI) {
        Reject("angle sum must be less than PI in hyperbolic geometry", triangle);
    }
}

Triangle SolveTriangle(const Triangle& triangle) {
    ValidateTriangleInput(triangle);

    Triangle solved = CompleteTriangle(triangle);
    const KnownMask m = solved.Mask();
    using V = Vertex;

    // Two angles with their opposite sides: the third pair cannot be closed
    for (V v : {V::A, V::B, V::C}) {
        if (!m.Angle(v) && !m.Side(v) && m.AngleCount() == 2 && m.SideCount() == 2) {
            Log::Get()->warn("SolveTriangle: third angle/side pair undetermined [{}]", solved.ToString());
            throw InsufficientDataException(std::string("angle ") + VertexName(v) +
                                            " and its opposite side cannot be determined");
        }
    }
    if (!solved.IsComplete()) {
        Log::Get()->warn("SolveTriangle: incomplete after all rules [{}]", solved.ToString());
        throw InsufficientDataException("measurements do not determine the triangle");
    }

    for (int i = 0; i < 3; ++i) {
        if (!std::isfinite(*solved.angle[i]) || !std::isfinite(*solved.side[i])) {
            Reject("completion produced a non-finite measurement", solved);
        }
    }
    if (ViolatesTriangleInequality(solved)) {
        Reject("completed sides violate the triangle inequality", solved);
    }
    if (solved.AngleSum() >= PI) {
        Reject("completed angle sum is not below PI", solved);
    }

    Log::Get()->debug("SolveTriangle: {}", solved.ToString());
    return solved;
}

} // namespace Hyp::Disk::Solver
