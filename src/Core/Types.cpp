#include <HypDisk/Core/Types.h>
#include <HypDisk/Core/Constants.h>

namespace Hyp::Disk {

// =============================================================================
// Arc2d Implementation
// =============================================================================

Arc2d Arc2d::Circle(const Point2d& c, double r) {
    return Arc2d(c, r, 0.0, TWO_PI);
}

double Arc2d::SweepAngle() const {
    double diff = endAngle - startAngle;
    if (!anticlockwise) {
        if (diff >= TWO_PI) return TWO_PI;
        double sweep = std::fmod(diff, TWO_PI);
        if (sweep < 0.0) sweep += TWO_PI;
        return sweep;
    }
    if (-diff >= TWO_PI) return -TWO_PI;
    double sweep = std::fmod(-diff, TWO_PI);
    if (sweep < 0.0) sweep += TWO_PI;
    return -sweep;
}

} // namespace Hyp::Disk
