#include <HypDisk/Core/Image.h>
#include <HypDisk/Core/Exception.h>
#include <HypDisk/Core/Log.h>

#include <algorithm>
#include <cctype>
#include <vector>

// stb_image_write for file output
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb/stb_image_write.h>

namespace Hyp::Disk {

// =============================================================================
// Implementation class
// =============================================================================

class Image::Impl {
public:
    int32_t width_ = 0;
    int32_t height_ = 0;
    size_t stride_ = 0;
    std::vector<uint8_t> data_;

    void Allocate(int32_t w, int32_t h) {
        width_ = w;
        height_ = h;
        stride_ = static_cast<size_t>(w) * 3;
        data_.assign(stride_ * static_cast<size_t>(h), 0);
    }
};

// =============================================================================
// Constructors
// =============================================================================

Image::Image() : impl_(std::make_shared<Impl>()) {}

Image::Image(int32_t width, int32_t height, const Color& background)
    : impl_(std::make_shared<Impl>()) {
    if (width <= 0 || height <= 0) {
        throw InvalidArgumentException("Image: dimensions must be positive, got " +
                                       std::to_string(width) + "x" + std::to_string(height));
    }
    impl_->Allocate(width, height);
    Fill(background);
}

Image::Image(const Image& other) = default;
Image::Image(Image&& other) noexcept = default;
Image::~Image() = default;
Image& Image::operator=(const Image& other) = default;
Image& Image::operator=(Image&& other) noexcept = default;

// =============================================================================
// Properties
// =============================================================================

int32_t Image::Width() const { return impl_ ? impl_->width_ : 0; }
int32_t Image::Height() const { return impl_ ? impl_->height_ : 0; }
size_t Image::Stride() const { return impl_ ? impl_->stride_ : 0; }
bool Image::Empty() const { return !impl_ || impl_->data_.empty(); }

uint8_t* Image::Data() { return Empty() ? nullptr : impl_->data_.data(); }
const uint8_t* Image::Data() const { return Empty() ? nullptr : impl_->data_.data(); }

uint8_t* Image::RowPtr(int32_t row) {
    return Data() + static_cast<size_t>(row) * impl_->stride_;
}

const uint8_t* Image::RowPtr(int32_t row) const {
    return Data() + static_cast<size_t>(row) * impl_->stride_;
}

Color Image::At(int32_t x, int32_t y) const {
    const uint8_t* p = RowPtr(y) + static_cast<size_t>(x) * 3;
    return Color(p[0], p[1], p[2]);
}

void Image::SetAt(int32_t x, int32_t y, const Color& color) {
    if (Empty() || x < 0 || y < 0 || x >= impl_->width_ || y >= impl_->height_) {
        return;
    }
    uint8_t* p = RowPtr(y) + static_cast<size_t>(x) * 3;
    p[0] = color.r;
    p[1] = color.g;
    p[2] = color.b;
}

void Image::Fill(const Color& color) {
    if (Empty()) return;
    for (int32_t y = 0; y < impl_->height_; ++y) {
        uint8_t* row = RowPtr(y);
        for (int32_t x = 0; x < impl_->width_; ++x) {
            row[x * 3 + 0] = color.r;
            row[x * 3 + 1] = color.g;
            row[x * 3 + 2] = color.b;
        }
    }
}

// =============================================================================
// Operations
// =============================================================================

Image Image::Clone() const {
    Image copy;
    if (!Empty()) {
        copy.impl_ = std::make_shared<Impl>(*impl_);
    }
    return copy;
}

bool Image::SaveToFile(const std::string& path) const {
    if (Empty()) {
        Log::Get()->warn("Image::SaveToFile: refusing to write empty image to {}", path);
        return false;
    }

    std::string ext;
    size_t dot = path.find_last_of('.');
    if (dot != std::string::npos) {
        ext = path.substr(dot + 1);
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    }

    const int w = impl_->width_;
    const int h = impl_->height_;
    const int stride = static_cast<int>(impl_->stride_);
    int ok = 0;

    if (ext == "bmp") {
        ok = stbi_write_bmp(path.c_str(), w, h, 3, impl_->data_.data());
    } else if (ext == "jpg" || ext == "jpeg") {
        ok = stbi_write_jpg(path.c_str(), w, h, 3, impl_->data_.data(), 95);
    } else {
        ok = stbi_write_png(path.c_str(), w, h, 3, impl_->data_.data(), stride);
    }

    if (!ok) {
        Log::Get()->warn("Image::SaveToFile: failed to write {}", path);
    }
    return ok != 0;
}

} // namespace Hyp::Disk
