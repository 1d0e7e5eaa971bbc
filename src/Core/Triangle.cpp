#include <HypDisk/Core/Triangle.h>
#include <HypDisk/Core/Exception.h>
#include <HypDisk/Internal/HyperbolicMath.h>

#include <cstdio>

namespace Hyp::Disk {

namespace {

std::optional<double> FromScalar(double value) {
    if (value == 0.0) return std::nullopt;
    return value;
}

std::string FormatSlot(const std::optional<double>& slot) {
    if (!slot) return "?";
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.6g", *slot);
    return buf;
}

} // namespace

Triangle Triangle::FromSentinel(double A, double a, double B, double b, double C, double c) {
    Triangle t;
    t.angle = {FromScalar(A), FromScalar(B), FromScalar(C)};
    t.side = {FromScalar(a), FromScalar(b), FromScalar(c)};
    return t;
}

std::array<double, 6> Triangle::ToSentinel() const {
    return {AngleOr0(Vertex::A), SideOr0(Vertex::A),
            AngleOr0(Vertex::B), SideOr0(Vertex::B),
            AngleOr0(Vertex::C), SideOr0(Vertex::C)};
}

KnownMask Triangle::Mask() const {
    KnownMask mask;
    for (int i = 0; i < 3; ++i) {
        mask.angle[i] = angle[i].has_value();
        mask.side[i] = side[i].has_value();
    }
    return mask;
}

double Triangle::AngleSum() const {
    return AngleOr0(Vertex::A) + AngleOr0(Vertex::B) + AngleOr0(Vertex::C);
}

double Triangle::Area(double k) const {
    if (Mask().AngleCount() != 3) {
        throw InsufficientDataException("Triangle::Area: all three angles must be known");
    }
    return Internal::TriangleArea(*angle[0], *angle[1], *angle[2], k);
}

std::string Triangle::ToString() const {
    return "A=" + FormatSlot(angle[0]) + " a=" + FormatSlot(side[0]) +
           " B=" + FormatSlot(angle[1]) + " b=" + FormatSlot(side[1]) +
           " C=" + FormatSlot(angle[2]) + " c=" + FormatSlot(side[2]);
}

} // namespace Hyp::Disk
