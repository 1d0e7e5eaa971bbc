#include <HypDisk/Projection/DiskFrame.h>
#include <HypDisk/Core/Constants.h>
#include <HypDisk/Core/Validate.h>

#include <cmath>

namespace Hyp::Disk::Projection {

DiskFrame DiskFrame::ForCanvas(int32_t width, int32_t height) {
    HYPDISK_REQUIRE_POSITIVE(width);
    HYPDISK_REQUIRE_POSITIVE(height);
    double half = width / 2.0;
    return DiskFrame(half, half, half * DISK_MARGIN);
}

Point2d DiskFrame::Radial(double rotation, double fraction) const {
    return {center.x + fraction * radius * std::sin(rotation),
            center.y + fraction * radius * std::cos(rotation)};
}

Point2d DiskFrame::Boundary(double angle) const {
    return {center.x + radius * std::cos(angle),
            center.y - radius * std::sin(angle)};
}

} // namespace Hyp::Disk::Projection
