#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

namespace fragpipe {

enum class PixelFormat {
    RGBA8,
    RGBA32F
};

/**
 * Immutable RGBA image.
 *
 * Pixels are either 8-bit or float components, width * height * 4 of them.
 * Rows follow the graphics API convention: row 0 is the bottom row.
 * Construction validates the size and throws InvalidImageError.
 */
class Image {
public:
    Image(int width, int height, std::vector<uint8_t> pixels);
    Image(int width, int height, std::vector<float> pixels);

    int width() const { return width_; }
    int height() const { return height_; }
    PixelFormat format() const;
    bool is_float() const { return format() == PixelFormat::RGBA32F; }

    // Number of components (width * height * 4)
    size_t component_count() const;

    // Throws InvalidImageError when the image holds the other format
    const std::vector<uint8_t>& bytes() const;
    const std::vector<float>& floats() const;

    // Raw pointer for texture upload
    const void* data() const;

    // RGBA components of pixel (x, y); float images are scaled to 0..255 and clamped, NaN reads as 0
    std::array<uint8_t, 4> pixel_rgba8(int x, int y) const;

    bool operator==(const Image& other) const;
    bool operator!=(const Image& other) const { return !(*this == other); }

private:
    void validate(size_t actual_components) const;

    int width_;
    int height_;
    std::variant<std::vector<uint8_t>, std::vector<float>> pixels_;
};

} // namespace fragpipe
