#pragma once

/**
 * @file RecordingSurface.h
 * @brief Surface that records every call instead of rasterizing
 *
 * Used to inspect exactly which primitives a drawing operation issued.
 */

#include <HypDisk/Display/Surface.h>

#include <cstddef>
#include <vector>

namespace Hyp::Disk::Display {

/**
 * @brief Kind of recorded surface call
 */
enum class CommandType {
    Clear,
    StrokeArc,
    StrokeLine,
    SetStrokeStyle
};

/**
 * @brief One recorded surface call
 */
struct HYPDISK_API SurfaceCommand {
    CommandType type = CommandType::Clear;
    Arc2d arc;              ///< StrokeArc
    Segment2d segment;      ///< StrokeLine
    StrokeStyle style;      ///< Style in effect (or set, for SetStrokeStyle)
};

class HYPDISK_API RecordingSurface : public Surface {
public:
    RecordingSurface(int32_t width, int32_t height);

    int32_t Width() const override { return width_; }
    int32_t Height() const override { return height_; }

    void Clear() override;
    void StrokeArc(const Arc2d& arc) override;
    void StrokeLine(const Segment2d& segment) override;
    void SetStrokeStyle(const Color& color, double width) override;
    StrokeStyle GetStrokeStyle() const override { return style_; }

    const std::vector<SurfaceCommand>& Commands() const { return commands_; }

    /// Number of recorded calls of one kind
    size_t Count(CommandType type) const;

    /// Number of strokes (arcs + lines)
    size_t StrokeCount() const;

    /// Recorded arcs in call order
    std::vector<Arc2d> Arcs() const;

    /// Recorded lines in call order
    std::vector<Segment2d> Lines() const;

    /// Forget all recorded calls (does not record a Clear)
    void Reset();

private:
    int32_t width_;
    int32_t height_;
    StrokeStyle style_;
    std::vector<SurfaceCommand> commands_;
};

} // namespace Hyp::Disk::Display
