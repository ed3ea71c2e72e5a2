#include "image.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace fragpipe {

Image::Image(int width, int height, std::vector<uint8_t> pixels)
    : width_(width), height_(height), pixels_(std::move(pixels)) {
    validate(std::get<std::vector<uint8_t>>(pixels_).size());
}

Image::Image(int width, int height, std::vector<float> pixels)
    : width_(width), height_(height), pixels_(std::move(pixels)) {
    validate(std::get<std::vector<float>>(pixels_).size());
}

void Image::validate(size_t actual_components) const {
    if (width_ <= 0 || height_ <= 0) {
        throw InvalidImageError(
            "image dimensions must be positive, got " +
            std::to_string(width_) + "x" + std::to_string(height_));
    }
    if (actual_components != component_count()) {
        throw InvalidImageError(
            "image " + std::to_string(width_) + "x" + std::to_string(height_) +
            " needs " + std::to_string(component_count()) + " RGBA components, got " +
            std::to_string(actual_components));
    }
}

PixelFormat Image::format() const {
    return std::holds_alternative<std::vector<float>>(pixels_)
        ? PixelFormat::RGBA32F
        : PixelFormat::RGBA8;
}

size_t Image::component_count() const {
    return static_cast<size_t>(width_) * static_cast<size_t>(height_) * 4;
}

const std::vector<uint8_t>& Image::bytes() const {
    if (auto* p = std::get_if<std::vector<uint8_t>>(&pixels_)) {
        return *p;
    }
    throw InvalidImageError("image holds float pixels, not bytes");
}

const std::vector<float>& Image::floats() const {
    if (auto* p = std::get_if<std::vector<float>>(&pixels_)) {
        return *p;
    }
    throw InvalidImageError("image holds byte pixels, not floats");
}

const void* Image::data() const {
    return std::visit([](const auto& v) -> const void* { return v.data(); }, pixels_);
}

std::array<uint8_t, 4> Image::pixel_rgba8(int x, int y) const {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) {
        throw InvalidImageError(
            "pixel (" + std::to_string(x) + ", " + std::to_string(y) + ") is outside the image");
    }
    size_t offset = (static_cast<size_t>(y) * width_ + x) * 4;

    std::array<uint8_t, 4> rgba{};
    if (auto* b = std::get_if<std::vector<uint8_t>>(&pixels_)) {
        std::copy(b->begin() + offset, b->begin() + offset + 4, rgba.begin());
    } else {
        const auto& f = std::get<std::vector<float>>(pixels_);
        for (size_t i = 0; i < 4; ++i) {
            float c = std::isnan(f[offset + i]) ? 0.0f : std::clamp(f[offset + i], 0.0f, 1.0f);
            rgba[i] = static_cast<uint8_t>(std::lround(c * 255.0f));
        }
    }
    return rgba;
}

bool Image::operator==(const Image& other) const {
    return width_ == other.width_ && height_ == other.height_ && pixels_ == other.pixels_;
}

} // namespace fragpipe
