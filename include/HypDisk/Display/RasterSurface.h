#pragma once

/**
 * @file RasterSurface.h
 * @brief Surface that rasterizes strokes into an RGB image
 *
 * Strokes are sampled at sub-pixel spacing and each sample stamps a filled
 * disc of the stroke width. No anti-aliasing.
 */

#include <HypDisk/Display/Surface.h>
#include <HypDisk/Core/Image.h>

#include <string>

namespace Hyp::Disk::Display {

class HYPDISK_API RasterSurface : public Surface {
public:
    /**
     * @brief Create a surface with a background-filled image
     * @throws InvalidArgumentException if width or height is not positive
     */
    RasterSurface(int32_t width, int32_t height, const Color& background = Color::White());

    int32_t Width() const override { return image_.Width(); }
    int32_t Height() const override { return image_.Height(); }

    void Clear() override;
    void StrokeArc(const Arc2d& arc) override;
    void StrokeLine(const Segment2d& segment) override;
    void SetStrokeStyle(const Color& color, double width) override;
    StrokeStyle GetStrokeStyle() const override { return style_; }

    const Image& GetImage() const { return image_; }

    /// Write the image (png, bmp or jpg by extension)
    bool SaveToFile(const std::string& path) const;

private:
    void Stamp(const Point2d& p);

    Image image_;
    Color background_;
    StrokeStyle style_;
};

} // namespace Hyp::Disk::Display
