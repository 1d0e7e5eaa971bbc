/**
 * @file RecordingSurface.cpp
 * @brief Implementation of the recording surface
 */

#include <HypDisk/Display/RecordingSurface.h>
#include <HypDisk/Core/Validate.h>

#include <algorithm>

namespace Hyp::Disk::Display {

RecordingSurface::RecordingSurface(int32_t width, int32_t height)
    : width_(width), height_(height) {
    HYPDISK_REQUIRE_POSITIVE(width);
    HYPDISK_REQUIRE_POSITIVE(height);
}

void RecordingSurface::Clear() {
    SurfaceCommand cmd;
    cmd.type = CommandType::Clear;
    cmd.style = style_;
    commands_.push_back(cmd);
}

void RecordingSurface::StrokeArc(const Arc2d& arc) {
    SurfaceCommand cmd;
    cmd.type = CommandType::StrokeArc;
    cmd.arc = arc;
    cmd.style = style_;
    commands_.push_back(cmd);
}

void RecordingSurface::StrokeLine(const Segment2d& segment) {
    SurfaceCommand cmd;
    cmd.type = CommandType::StrokeLine;
    cmd.segment = segment;
    cmd.style = style_;
    commands_.push_back(cmd);
}

void RecordingSurface::SetStrokeStyle(const Color& color, double width) {
    style_ = StrokeStyle(color, width);
    SurfaceCommand cmd;
    cmd.type = CommandType::SetStrokeStyle;
    cmd.style = style_;
    commands_.push_back(cmd);
}

size_t RecordingSurface::Count(CommandType type) const {
    return static_cast<size_t>(std::count_if(commands_.begin(), commands_.end(),
        [type](const SurfaceCommand& cmd) { return cmd.type == type; }));
}

size_t RecordingSurface::StrokeCount() const {
    return Count(CommandType::StrokeArc) + Count(CommandType::StrokeLine);
}

std::vector<Arc2d> RecordingSurface::Arcs() const {
    std::vector<Arc2d> arcs;
    for (const auto& cmd : commands_) {
        if (cmd.type == CommandType::StrokeArc) {
            arcs.push_back(cmd.arc);
        }
    }
    return arcs;
}

std::vector<Segment2d> RecordingSurface::Lines() const {
    std::vector<Segment2d> lines;
    for (const auto& cmd : commands_) {
        if (cmd.type == CommandType::StrokeLine) {
            lines.push_back(cmd.segment);
        }
    }
    return lines;
}

void RecordingSurface::Reset() {
    commands_.clear();
}

} // namespace Hyp::Disk::Display
