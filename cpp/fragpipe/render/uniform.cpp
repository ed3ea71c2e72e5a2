#include "uniform.hpp"
#include "errors.hpp"

namespace fragpipe {

namespace {

struct TypeName {
    UniformType type;
    const char* name;
};

const TypeName g_type_names[] = {
    {UniformType::Float, "float"},
    {UniformType::Int, "int"},
    {UniformType::Vec2, "vec2"},
    {UniformType::Vec3, "vec3"},
    {UniformType::Vec4, "vec4"},
    {UniformType::IVec2, "ivec2"},
    {UniformType::IVec3, "ivec3"},
    {UniformType::IVec4, "ivec4"},
    {UniformType::Mat2, "mat2"},
    {UniformType::Mat3, "mat3"},
    {UniformType::Mat4, "mat4"},
    {UniformType::FloatArray, "float[]"},
    {UniformType::IntArray, "int[]"},
    {UniformType::Texture, "texture"},
    {UniformType::Pass, "pass"},
};

} // namespace

const char* uniform_type_name(UniformType type) {
    for (const auto& entry : g_type_names) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "unknown";
}

UniformType uniform_type_from_name(const std::string& tag) {
    for (const auto& entry : g_type_names) {
        if (tag == entry.name) {
            return entry.type;
        }
    }
    throw InvalidUniformTypeError(tag);
}

UniformType uniform_type_of(const UniformValue& value) {
    return std::visit([](const auto& v) -> UniformType {
        using T = std::decay_t<decltype(v)>;

        if constexpr (std::is_same_v<T, float>) {
            return UniformType::Float;
        } else if constexpr (std::is_same_v<T, int32_t>) {
            return UniformType::Int;
        } else if constexpr (std::is_same_v<T, Vec2f>) {
            return UniformType::Vec2;
        } else if constexpr (std::is_same_v<T, Vec3f>) {
            return UniformType::Vec3;
        } else if constexpr (std::is_same_v<T, Vec4f>) {
            return UniformType::Vec4;
        } else if constexpr (std::is_same_v<T, Vec2i>) {
            return UniformType::IVec2;
        } else if constexpr (std::is_same_v<T, Vec3i>) {
            return UniformType::IVec3;
        } else if constexpr (std::is_same_v<T, Vec4i>) {
            return UniformType::IVec4;
        } else if constexpr (std::is_same_v<T, Mat2f>) {
            return UniformType::Mat2;
        } else if constexpr (std::is_same_v<T, Mat3f>) {
            return UniformType::Mat3;
        } else if constexpr (std::is_same_v<T, Mat4f>) {
            return UniformType::Mat4;
        } else if constexpr (std::is_same_v<T, FloatArray>) {
            return UniformType::FloatArray;
        } else if constexpr (std::is_same_v<T, IntArray>) {
            return UniformType::IntArray;
        } else if constexpr (std::is_same_v<T, TextureInput>) {
            return UniformType::Texture;
        } else if constexpr (std::is_same_v<T, PassInput>) {
            return UniformType::Pass;
        } else {
            static_assert(always_false_v<T>, "unhandled uniform value kind");
        }
    }, value);
}

} // namespace fragpipe
