#pragma once

#include <optional>
#include <string>

namespace fragpipe {

/**
 * Texture sampling filter, applied to both minification and magnification.
 */
enum class TextureFilter {
    NEAREST,
    LINEAR
};

/**
 * Texture wrap mode, applied to both S and T axes.
 */
enum class TextureWrap {
    CLAMP,
    REPEAT,
    MIRROR
};

inline const char* texture_filter_name(TextureFilter filter) {
    switch (filter) {
        case TextureFilter::NEAREST: return "nearest";
        case TextureFilter::LINEAR: return "linear";
    }
    return "unknown";
}

inline const char* texture_wrap_name(TextureWrap wrap) {
    switch (wrap) {
        case TextureWrap::CLAMP: return "clamp";
        case TextureWrap::REPEAT: return "repeat";
        case TextureWrap::MIRROR: return "mirror";
    }
    return "unknown";
}

inline std::optional<TextureFilter> texture_filter_from_name(const std::string& name) {
    if (name == "nearest") return TextureFilter::NEAREST;
    if (name == "linear") return TextureFilter::LINEAR;
    return std::nullopt;
}

inline std::optional<TextureWrap> texture_wrap_from_name(const std::string& name) {
    if (name == "clamp") return TextureWrap::CLAMP;
    if (name == "repeat") return TextureWrap::REPEAT;
    if (name == "mirror") return TextureWrap::MIRROR;
    return std::nullopt;
}

struct Size2i {
    int width = 0;
    int height = 0;

    Size2i() = default;
    Size2i(int w, int h) : width(w), height(h) {}

    bool operator==(const Size2i& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const Size2i& other) const { return !(*this == other); }
};

} // namespace fragpipe
