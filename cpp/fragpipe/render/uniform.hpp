#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "fragpipe/render/image.hpp"
#include "fragpipe/render/types.hpp"

namespace fragpipe {

struct Vec2f { float x = 0, y = 0; };
struct Vec3f { float x = 0, y = 0, z = 0; };
struct Vec4f { float x = 0, y = 0, z = 0, w = 0; };

struct Vec2i { int32_t x = 0, y = 0; };
struct Vec3i { int32_t x = 0, y = 0, z = 0; };
struct Vec4i { int32_t x = 0, y = 0, z = 0, w = 0; };

// Column-major matrices
struct Mat2f { std::array<float, 4> data{}; };
struct Mat3f { std::array<float, 9> data{}; };
struct Mat4f { std::array<float, 16> data{}; };

struct FloatArray { std::vector<float> values; };
struct IntArray { std::vector<int32_t> values; };

/**
 * Texture with inline pixels supplied by the caller.
 */
struct TextureInput {
    std::shared_ptr<const Image> image;
    TextureFilter filter = TextureFilter::LINEAR;
    TextureWrap wrap = TextureWrap::CLAMP;
};

/**
 * Texture whose pixels are the output of an earlier pass.
 */
struct PassInput {
    std::string pass;
    TextureFilter filter = TextureFilter::LINEAR;
    TextureWrap wrap = TextureWrap::CLAMP;
};

/**
 * Closed set of bindable uniform values.
 *
 * Order matches UniformType.
 */
using UniformValue = std::variant<
    float,
    int32_t,
    Vec2f,
    Vec3f,
    Vec4f,
    Vec2i,
    Vec3i,
    Vec4i,
    Mat2f,
    Mat3f,
    Mat4f,
    FloatArray,
    IntArray,
    TextureInput,
    PassInput
>;

enum class UniformType {
    Float,
    Int,
    Vec2,
    Vec3,
    Vec4,
    IVec2,
    IVec3,
    IVec4,
    Mat2,
    Mat3,
    Mat4,
    FloatArray,
    IntArray,
    Texture,
    Pass
};

static_assert(std::variant_size_v<UniformValue> == static_cast<size_t>(UniformType::Pass) + 1,
              "UniformValue and UniformType must list the same kinds");

// Helper for exhaustive visitors: static_assert(always_false_v<T>) in the last branch
template<typename T>
inline constexpr bool always_false_v = false;

// Type tag used in descriptions and diagnostics ("vec3", "float[]", "pass", ...)
const char* uniform_type_name(UniformType type);

// Throws InvalidUniformTypeError on an unknown tag
UniformType uniform_type_from_name(const std::string& tag);

UniformType uniform_type_of(const UniformValue& value);

inline bool is_texture_type(UniformType type) {
    return type == UniformType::Texture || type == UniformType::Pass;
}

/**
 * Named, typed shader input.
 */
struct Uniform {
    std::string name;
    UniformValue value;

    Uniform() = default;
    Uniform(std::string name_, UniformValue value_)
        : name(std::move(name_)), value(std::move(value_)) {}

    UniformType type() const { return uniform_type_of(value); }
    const char* type_name() const { return uniform_type_name(type()); }
    bool is_texture() const { return is_texture_type(type()); }

    // Convenience constructors
    static Uniform texture(
        std::string name,
        Image image,
        TextureFilter filter = TextureFilter::LINEAR,
        TextureWrap wrap = TextureWrap::CLAMP
    ) {
        return Uniform(std::move(name), TextureInput{
            std::make_shared<const Image>(std::move(image)), filter, wrap});
    }

    static Uniform pass(
        std::string name,
        std::string pass_name,
        TextureFilter filter = TextureFilter::LINEAR,
        TextureWrap wrap = TextureWrap::CLAMP
    ) {
        return Uniform(std::move(name), PassInput{std::move(pass_name), filter, wrap});
    }
};

} // namespace fragpipe
