#pragma once

/**
 * @file Image.h
 * @brief 8-bit RGB raster image used as a drawing target
 *
 * Shallow copy by default, Clone() for deep copy.
 */

#include <HypDisk/Core/Export.h>
#include <HypDisk/Core/Types.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace Hyp::Disk {

class HYPDISK_API Image {
public:
    // =========================================================================
    // Constructors
    // =========================================================================

    /// Default constructor (empty image)
    Image();

    /// Create image with specified dimensions, filled with background
    Image(int32_t width, int32_t height, const Color& background = Color::White());

    Image(const Image& other);
    Image(Image&& other) noexcept;
    ~Image();

    Image& operator=(const Image& other);
    Image& operator=(Image&& other) noexcept;

    // =========================================================================
    // Basic Properties
    // =========================================================================

    int32_t Width() const;
    int32_t Height() const;

    /// Always 3 (RGB)
    int Channels() const { return 3; }

    /// Row stride in bytes
    size_t Stride() const;

    bool Empty() const;

    // =========================================================================
    // Data Access
    // =========================================================================

    uint8_t* Data();
    const uint8_t* Data() const;

    uint8_t* RowPtr(int32_t row);
    const uint8_t* RowPtr(int32_t row) const;

    /// Pixel color at (x, y); no bounds check
    Color At(int32_t x, int32_t y) const;

    /// Set pixel at (x, y); ignored outside the image
    void SetAt(int32_t x, int32_t y, const Color& color);

    /// Fill the whole image
    void Fill(const Color& color);

    // =========================================================================
    // Image Operations
    // =========================================================================

    /// Deep copy
    Image Clone() const;

    /**
     * @brief Save image to file, format chosen by extension (.png, .bmp, .jpg)
     * @return false if the image is empty or writing failed
     */
    bool SaveToFile(const std::string& path) const;

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace Hyp::Disk
